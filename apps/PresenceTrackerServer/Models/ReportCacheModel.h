// ReportCacheModel.h
#ifndef REPORTCACHEMODEL_H
#define REPORTCACHEMODEL_H

#include <QObject>
#include <QString>
#include <QJsonObject>

class ReportCacheModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString cacheKey READ cacheKey WRITE setCacheKey NOTIFY cacheKeyChanged)
    Q_PROPERTY(QString guildId READ guildId WRITE setGuildId NOTIFY guildIdChanged)
    Q_PROPERTY(QJsonObject payload READ payload WRITE setPayload NOTIFY payloadChanged)
    Q_PROPERTY(qint64 generatedAtMs READ generatedAtMs WRITE setGeneratedAtMs NOTIFY generatedAtMsChanged)
    Q_PROPERTY(qint64 expiresAtMs READ expiresAtMs WRITE setExpiresAtMs NOTIFY expiresAtMsChanged)
    Q_PROPERTY(int userCount READ userCount WRITE setUserCount NOTIFY userCountChanged)
    Q_PROPERTY(qint64 generationTimeMs READ generationTimeMs WRITE setGenerationTimeMs NOTIFY generationTimeMsChanged)

public:
    explicit ReportCacheModel(QObject *parent = nullptr);

    QString cacheKey() const;
    void setCacheKey(const QString &cacheKey);

    QString guildId() const;
    void setGuildId(const QString &guildId);

    QJsonObject payload() const;
    void setPayload(const QJsonObject &payload);

    qint64 generatedAtMs() const;
    void setGeneratedAtMs(qint64 generatedAtMs);

    qint64 expiresAtMs() const;
    void setExpiresAtMs(qint64 expiresAtMs);

    int userCount() const;
    void setUserCount(int userCount);

    qint64 generationTimeMs() const;
    void setGenerationTimeMs(qint64 generationTimeMs);

    bool isValidAt(qint64 nowMs) const { return m_expiresAtMs > nowMs; }

signals:
    void cacheKeyChanged(const QString &cacheKey);
    void guildIdChanged(const QString &guildId);
    void payloadChanged(const QJsonObject &payload);
    void generatedAtMsChanged(qint64 generatedAtMs);
    void expiresAtMsChanged(qint64 expiresAtMs);
    void userCountChanged(int userCount);
    void generationTimeMsChanged(qint64 generationTimeMs);

private:
    QString m_cacheKey;
    QString m_guildId;
    QJsonObject m_payload;
    qint64 m_generatedAtMs;
    qint64 m_expiresAtMs;
    int m_userCount;
    qint64 m_generationTimeMs;
};

#endif // REPORTCACHEMODEL_H
