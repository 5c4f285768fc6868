// ActivityAggregateModel.h
#ifndef ACTIVITYAGGREGATEMODEL_H
#define ACTIVITYAGGREGATEMODEL_H

#include <QObject>
#include <QString>
#include <QDate>
#include <QJsonObject>

// One roll-up row of user_daily_activity, user_weekly_activity or user_monthly_activity
class ActivityAggregateModel : public QObject
{
    Q_OBJECT
public:
    enum Granularity {
        Daily = 0,
        Weekly = 1,
        Monthly = 2
    };
    Q_ENUM(Granularity)

private:
    Q_PROPERTY(QString userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(QString guildId READ guildId WRITE setGuildId NOTIFY guildIdChanged)
    Q_PROPERTY(Granularity granularity READ granularity WRITE setGranularity NOTIFY granularityChanged)
    Q_PROPERTY(QDate periodStart READ periodStart WRITE setPeriodStart NOTIFY periodStartChanged)
    Q_PROPERTY(QDate periodEnd READ periodEnd WRITE setPeriodEnd NOTIFY periodEndChanged)
    Q_PROPERTY(qint64 totalTimeMs READ totalTimeMs WRITE setTotalTimeMs NOTIFY totalTimeMsChanged)
    Q_PROPERTY(int sessionCount READ sessionCount WRITE setSessionCount NOTIFY sessionCountChanged)
    Q_PROPERTY(int activeDays READ activeDays WRITE setActiveDays NOTIFY activeDaysChanged)
    Q_PROPERTY(qint64 firstActivityMs READ firstActivityMs WRITE setFirstActivityMs NOTIFY firstActivityMsChanged)
    Q_PROPERTY(qint64 lastActivityMs READ lastActivityMs WRITE setLastActivityMs NOTIFY lastActivityMsChanged)
    Q_PROPERTY(int channelsVisited READ channelsVisited WRITE setChannelsVisited NOTIFY channelsVisitedChanged)

public:
    explicit ActivityAggregateModel(QObject *parent = nullptr);

    QString userId() const;
    void setUserId(const QString &userId);

    QString guildId() const;
    void setGuildId(const QString &guildId);

    Granularity granularity() const;
    void setGranularity(Granularity granularity);

    QDate periodStart() const;
    void setPeriodStart(const QDate &periodStart);

    QDate periodEnd() const;
    void setPeriodEnd(const QDate &periodEnd);

    qint64 totalTimeMs() const;
    void setTotalTimeMs(qint64 totalTimeMs);

    int sessionCount() const;
    void setSessionCount(int sessionCount);

    int activeDays() const;
    void setActiveDays(int activeDays);

    qint64 firstActivityMs() const;
    void setFirstActivityMs(qint64 firstActivityMs);

    qint64 lastActivityMs() const;
    void setLastActivityMs(qint64 lastActivityMs);

    int channelsVisited() const;
    void setChannelsVisited(int channelsVisited);

    QJsonObject toJson() const;

    // Monday of the ISO week containing date
    static QDate weekStartFor(const QDate &date);
    static QDate monthStartFor(const QDate &date);

signals:
    void userIdChanged(const QString &userId);
    void guildIdChanged(const QString &guildId);
    void granularityChanged(Granularity granularity);
    void periodStartChanged(const QDate &periodStart);
    void periodEndChanged(const QDate &periodEnd);
    void totalTimeMsChanged(qint64 totalTimeMs);
    void sessionCountChanged(int sessionCount);
    void activeDaysChanged(int activeDays);
    void firstActivityMsChanged(qint64 firstActivityMs);
    void lastActivityMsChanged(qint64 lastActivityMs);
    void channelsVisitedChanged(int channelsVisited);

private:
    QString m_userId;
    QString m_guildId;
    Granularity m_granularity;
    QDate m_periodStart;
    QDate m_periodEnd;
    qint64 m_totalTimeMs;
    int m_sessionCount;
    int m_activeDays;
    qint64 m_firstActivityMs;
    qint64 m_lastActivityMs;
    int m_channelsVisited;
};

#endif // ACTIVITYAGGREGATEMODEL_H
