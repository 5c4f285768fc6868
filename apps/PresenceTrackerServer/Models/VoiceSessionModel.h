// VoiceSessionModel.h
#ifndef VOICESESSIONMODEL_H
#define VOICESESSIONMODEL_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QJsonObject>

// Completed presence session, immutable once persisted
class VoiceSessionModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(qint64 id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(QString userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(QString guildId READ guildId WRITE setGuildId NOTIFY guildIdChanged)
    Q_PROPERTY(QString channelId READ channelId WRITE setChannelId NOTIFY channelIdChanged)
    Q_PROPERTY(QString userName READ userName WRITE setUserName NOTIFY userNameChanged)
    Q_PROPERTY(qint64 startTimeMs READ startTimeMs WRITE setStartTimeMs NOTIFY startTimeMsChanged)
    Q_PROPERTY(qint64 endTimeMs READ endTimeMs WRITE setEndTimeMs NOTIFY endTimeMsChanged)
    Q_PROPERTY(QDateTime createdAt READ createdAt WRITE setCreatedAt NOTIFY createdAtChanged)

public:
    explicit VoiceSessionModel(QObject *parent = nullptr);

    qint64 id() const;
    void setId(qint64 id);

    QString userId() const;
    void setUserId(const QString &userId);

    QString guildId() const;
    void setGuildId(const QString &guildId);

    QString channelId() const;
    void setChannelId(const QString &channelId);

    QString userName() const;
    void setUserName(const QString &userName);

    qint64 startTimeMs() const;
    void setStartTimeMs(qint64 startTimeMs);

    qint64 endTimeMs() const;
    void setEndTimeMs(qint64 endTimeMs);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

    // Never negative
    qint64 durationMs() const;

    // UTC calendar day that owns the session for aggregation
    QDate activityDate() const;

    QJsonObject toJson() const;
    QString debugInfo() const;

signals:
    void idChanged(qint64 id);
    void userIdChanged(const QString &userId);
    void guildIdChanged(const QString &guildId);
    void channelIdChanged(const QString &channelId);
    void userNameChanged(const QString &userName);
    void startTimeMsChanged(qint64 startTimeMs);
    void endTimeMsChanged(qint64 endTimeMs);
    void createdAtChanged(const QDateTime &createdAt);

private:
    qint64 m_id;
    QString m_userId;
    QString m_guildId;
    QString m_channelId;
    QString m_userName;
    qint64 m_startTimeMs;
    qint64 m_endTimeMs;
    QDateTime m_createdAt;
};

#endif // VOICESESSIONMODEL_H
