#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QSettings>
#include <QMutex>

#include "dbservice/dbconfig.h"
#include "cache/redisclient.h"
#include "Services/SessionTracker.h"
#include "Services/ReportTypes.h"

/**
 * @brief Server configuration backed by an INI file
 *
 * Values start from built-in defaults and are overridden by the file given to
 * loadFromFile(). Out-of-range values are clamped and logged. Without a file the
 * database settings come from the DB_* environment variables.
 */
class ConfigManager : public QObject
{
    Q_OBJECT
public:
    explicit ConfigManager(QObject *parent = nullptr);
    ~ConfigManager();

    bool loadFromFile(const QString &path);
    bool saveToFile(const QString &path) const;
    QString configFilePath() const;

    // [Server]
    QString host() const;
    int port() const;
    void setHost(const QString &host);
    void setPort(int port);

    // [Database]
    DbConfig databaseConfig() const;

    // [Cache]
    bool cacheEnabled() const;
    Cache::RedisConfig redisConfig() const;
    int cacheRetryIntervalMs() const;
    int localCacheMaxEntries() const;
    void setCacheEnabled(bool enabled);

    // [Tracking]
    TrackingConfig trackingConfig() const;
    void setTrackingConfig(const TrackingConfig &config);

    // [Reports]
    ReportTypes::ReportConfig reportConfig() const;
    int reportCleanupIntervalMinutes() const;
    void setReportConfig(const ReportTypes::ReportConfig &config);

    // [Logging]
    QString logLevel() const;
    QString logFilePath() const;
    int logMaxFileSizeKB() const;
    int logBackupCount() const;
    void setLogLevel(const QString &level);
    void setLogFilePath(const QString &path);

    // Pushes the [Logging] values into the process logger
    void applyLoggingSettings() const;

signals:
    void configChanged();

private:
    void loadDefaults();
    int readBounded(QSettings &settings, const QString &key, int fallback, int minimum, int maximum) const;

    mutable QMutex m_mutex;
    QString m_configFilePath;

    QString m_host;
    int m_port;

    DbConfig m_dbConfig;

    bool m_cacheEnabled;
    Cache::RedisConfig m_redisConfig;
    int m_cacheRetryIntervalMs;
    int m_localCacheMaxEntries;

    TrackingConfig m_trackingConfig;

    ReportTypes::ReportConfig m_reportConfig;
    int m_reportCleanupIntervalMinutes;

    QString m_logLevel;
    QString m_logFilePath;
    int m_logMaxFileSizeKB;
    int m_logBackupCount;
};

#endif // CONFIGMANAGER_H
