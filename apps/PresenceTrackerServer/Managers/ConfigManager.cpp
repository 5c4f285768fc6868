#include "ConfigManager.h"
#include "logger/logger.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    loadDefaults();
}

ConfigManager::~ConfigManager()
{
}

void ConfigManager::loadDefaults()
{
    m_host = "0.0.0.0";
    m_port = 8080;

    m_dbConfig = DbConfig::fromEnvironment();

    m_cacheEnabled = true;
    m_redisConfig = Cache::RedisConfig();
    m_cacheRetryIntervalMs = 30000;
    m_localCacheMaxEntries = 10000;

    m_trackingConfig = TrackingConfig();

    m_reportConfig = ReportTypes::ReportConfig();
    m_reportCleanupIntervalMinutes = 60;

    m_logLevel = "info";
    m_logFilePath = "";
    m_logMaxFileSizeKB = 10240;
    m_logBackupCount = 5;
}

int ConfigManager::readBounded(QSettings &settings, const QString &key, int fallback, int minimum, int maximum) const
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    if (!ok) {
        LOG_WARNING(QString("Config %1/%2 is not a number, using %3").arg(settings.group(), key).arg(fallback));
        return fallback;
    }
    const int bounded = qBound(minimum, value, maximum);
    if (bounded != value) {
        LOG_WARNING(QString("Config %1/%2 corrected from %3 to %4").arg(settings.group(), key).arg(value).arg(bounded));
    }
    return bounded;
}

bool ConfigManager::loadFromFile(const QString &path)
{
    if (path.isEmpty() || !QFile::exists(path)) {
        LOG_WARNING(QString("Configuration file '%1' not found, using defaults").arg(path));
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        LOG_ERROR(QString("Configuration file '%1' could not be read, status %2").arg(path).arg(settings.status()));
        return false;
    }

    LOG_INFO("Loading configuration from: " + path);

    {
        QMutexLocker locker(&m_mutex);
        m_configFilePath = path;

        settings.beginGroup("Server");
        m_host = settings.value("host", m_host).toString();
        m_port = readBounded(settings, "port", m_port, 1, 65535);
        settings.endGroup();

        if (settings.childGroups().contains("Database")) {
            m_dbConfig = DbConfig::fromFile(path);
        }

        settings.beginGroup("Cache");
        m_cacheEnabled = settings.value("enabled", m_cacheEnabled).toBool();
        m_redisConfig.host = settings.value("host", m_redisConfig.host).toString();
        m_redisConfig.port = static_cast<quint16>(readBounded(settings, "port", m_redisConfig.port, 1, 65535));
        m_redisConfig.password = settings.value("password", m_redisConfig.password).toString();
        m_redisConfig.database = readBounded(settings, "database", m_redisConfig.database, 0, 15);
        m_redisConfig.connectTimeoutMs = readBounded(settings, "connectTimeoutMs", m_redisConfig.connectTimeoutMs, 50, 60000);
        m_redisConfig.commandTimeoutMs = readBounded(settings, "commandTimeoutMs", m_redisConfig.commandTimeoutMs, 50, 60000);
        m_cacheRetryIntervalMs = readBounded(settings, "retryIntervalMs", m_cacheRetryIntervalMs, 0, 3600000);
        m_localCacheMaxEntries = readBounded(settings, "localMaxEntries", m_localCacheMaxEntries, 100, 10000000);
        settings.endGroup();

        settings.beginGroup("Tracking");
        m_trackingConfig.sessionTtlSeconds = readBounded(settings, "sessionTtlSeconds", m_trackingConfig.sessionTtlSeconds, 60, 7 * 86400);
        m_trackingConfig.staleSessionHours = readBounded(settings, "staleSessionHours", m_trackingConfig.staleSessionHours, 1, 168);
        if (settings.contains("skipNameMarkers")) {
            m_trackingConfig.skipNameMarkers = settings.value("skipNameMarkers").toStringList();
        }
        settings.endGroup();

        settings.beginGroup("Reports");
        ReportTypes::ReportConfig reports = m_reportConfig;
        reports.batchSize = readBounded(settings, "batchSize", reports.batchSize, 1, 1000);
        reports.maxConcurrentBatches = readBounded(settings, "maxConcurrentBatches", reports.maxConcurrentBatches, 1, 32);
        reports.maxRetries = readBounded(settings, "maxRetries", reports.maxRetries, 0, 10);
        reports.retryBaseDelayMs = readBounded(settings, "retryBaseDelayMs", reports.retryBaseDelayMs, 0, 60000);
        reports.partialEveryBatches = readBounded(settings, "partialEveryBatches", reports.partialEveryBatches, 1, 1000);
        reports.progressIntervalMs = readBounded(settings, "progressIntervalMs", reports.progressIntervalMs, 0, 600000);
        reports.memoryThresholdMB = readBounded(settings, "memoryThresholdMB", reports.memoryThresholdMB, 16, 65536);
        reports.maxMemoryMB = readBounded(settings, "maxMemoryMB", reports.maxMemoryMB, 16, 65536);
        reports.enableErrorRecovery = settings.value("enableErrorRecovery", reports.enableErrorRecovery).toBool();
        reports.maxErrors = readBounded(settings, "maxErrors", reports.maxErrors, 0, 1000);
        reports.reportCacheTtlHours = readBounded(settings, "reportCacheTtlHours", reports.reportCacheTtlHours, 2, 6);
        reports.previewActive = readBounded(settings, "previewActive", reports.previewActive, 0, 1000);
        reports.previewOthers = readBounded(settings, "previewOthers", reports.previewOthers, 0, 1000);
        m_reportConfig = reports.normalized();
        m_reportCleanupIntervalMinutes = readBounded(settings, "cleanupIntervalMinutes", m_reportCleanupIntervalMinutes, 1, 1440);
        settings.endGroup();

        settings.beginGroup("Logging");
        m_logLevel = settings.value("level", m_logLevel).toString().toLower();
        m_logFilePath = settings.value("file", m_logFilePath).toString();
        m_logMaxFileSizeKB = readBounded(settings, "maxFileSizeKB", m_logMaxFileSizeKB, 0, 1024 * 1024);
        m_logBackupCount = readBounded(settings, "backupCount", m_logBackupCount, 0, 100);
        settings.endGroup();
    }

    LOG_INFO(QString("Configuration loaded: server %1:%2, database %3, cache %4")
            .arg(host()).arg(port()).arg(databaseConfig().describe(),
                 cacheEnabled() ? QString("%1:%2").arg(redisConfig().host).arg(redisConfig().port) : QString("disabled")));
    return true;
}

bool ConfigManager::saveToFile(const QString &path) const
{
    QFileInfo fileInfo(path);
    if (!fileInfo.dir().exists() && !QDir().mkpath(fileInfo.absolutePath())) {
        LOG_ERROR("Failed to create config directory: " + fileInfo.absolutePath());
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);

    {
        QMutexLocker locker(&m_mutex);

        settings.beginGroup("Server");
        settings.setValue("host", m_host);
        settings.setValue("port", m_port);
        settings.endGroup();

        settings.beginGroup("Database");
        settings.setValue("driver", m_dbConfig.driver());
        settings.setValue("host", m_dbConfig.host());
        settings.setValue("port", m_dbConfig.port());
        settings.setValue("database", m_dbConfig.database());
        settings.setValue("username", m_dbConfig.username());
        settings.endGroup();

        settings.beginGroup("Cache");
        settings.setValue("enabled", m_cacheEnabled);
        settings.setValue("host", m_redisConfig.host);
        settings.setValue("port", m_redisConfig.port);
        settings.setValue("database", m_redisConfig.database);
        settings.setValue("connectTimeoutMs", m_redisConfig.connectTimeoutMs);
        settings.setValue("commandTimeoutMs", m_redisConfig.commandTimeoutMs);
        settings.setValue("retryIntervalMs", m_cacheRetryIntervalMs);
        settings.setValue("localMaxEntries", m_localCacheMaxEntries);
        settings.endGroup();

        settings.beginGroup("Tracking");
        settings.setValue("sessionTtlSeconds", m_trackingConfig.sessionTtlSeconds);
        settings.setValue("staleSessionHours", m_trackingConfig.staleSessionHours);
        settings.setValue("skipNameMarkers", m_trackingConfig.skipNameMarkers);
        settings.endGroup();

        settings.beginGroup("Reports");
        settings.setValue("batchSize", m_reportConfig.batchSize);
        settings.setValue("maxConcurrentBatches", m_reportConfig.maxConcurrentBatches);
        settings.setValue("maxRetries", m_reportConfig.maxRetries);
        settings.setValue("retryBaseDelayMs", m_reportConfig.retryBaseDelayMs);
        settings.setValue("partialEveryBatches", m_reportConfig.partialEveryBatches);
        settings.setValue("progressIntervalMs", m_reportConfig.progressIntervalMs);
        settings.setValue("memoryThresholdMB", m_reportConfig.memoryThresholdMB);
        settings.setValue("maxMemoryMB", m_reportConfig.maxMemoryMB);
        settings.setValue("enableErrorRecovery", m_reportConfig.enableErrorRecovery);
        settings.setValue("maxErrors", m_reportConfig.maxErrors);
        settings.setValue("reportCacheTtlHours", m_reportConfig.reportCacheTtlHours);
        settings.setValue("previewActive", m_reportConfig.previewActive);
        settings.setValue("previewOthers", m_reportConfig.previewOthers);
        settings.setValue("cleanupIntervalMinutes", m_reportCleanupIntervalMinutes);
        settings.endGroup();

        settings.beginGroup("Logging");
        settings.setValue("level", m_logLevel);
        settings.setValue("file", m_logFilePath);
        settings.setValue("maxFileSizeKB", m_logMaxFileSizeKB);
        settings.setValue("backupCount", m_logBackupCount);
        settings.endGroup();
    }

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        LOG_ERROR(QString("Failed to save configuration to %1, status %2").arg(path).arg(settings.status()));
        return false;
    }

    LOG_INFO("Configuration saved to: " + path);
    return true;
}

QString ConfigManager::configFilePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_configFilePath;
}

QString ConfigManager::host() const
{
    QMutexLocker locker(&m_mutex);
    return m_host;
}

int ConfigManager::port() const
{
    QMutexLocker locker(&m_mutex);
    return m_port;
}

void ConfigManager::setHost(const QString &host)
{
    {
        QMutexLocker locker(&m_mutex);
        if (host.isEmpty() || m_host == host) {
            return;
        }
        m_host = host;
    }
    emit configChanged();
}

void ConfigManager::setPort(int port)
{
    {
        QMutexLocker locker(&m_mutex);
        if (port < 1 || port > 65535) {
            LOG_WARNING(QString("Rejected invalid server port %1").arg(port));
            return;
        }
        if (m_port == port) {
            return;
        }
        m_port = port;
    }
    emit configChanged();
}

DbConfig ConfigManager::databaseConfig() const
{
    QMutexLocker locker(&m_mutex);
    return m_dbConfig;
}

bool ConfigManager::cacheEnabled() const
{
    QMutexLocker locker(&m_mutex);
    return m_cacheEnabled;
}

Cache::RedisConfig ConfigManager::redisConfig() const
{
    QMutexLocker locker(&m_mutex);
    return m_redisConfig;
}

int ConfigManager::cacheRetryIntervalMs() const
{
    QMutexLocker locker(&m_mutex);
    return m_cacheRetryIntervalMs;
}

int ConfigManager::localCacheMaxEntries() const
{
    QMutexLocker locker(&m_mutex);
    return m_localCacheMaxEntries;
}

void ConfigManager::setCacheEnabled(bool enabled)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_cacheEnabled == enabled) {
            return;
        }
        m_cacheEnabled = enabled;
    }
    emit configChanged();
}

TrackingConfig ConfigManager::trackingConfig() const
{
    QMutexLocker locker(&m_mutex);
    return m_trackingConfig;
}

void ConfigManager::setTrackingConfig(const TrackingConfig &config)
{
    {
        QMutexLocker locker(&m_mutex);
        TrackingConfig bounded = config;
        bounded.sessionTtlSeconds = qBound(60, config.sessionTtlSeconds, 7 * 86400);
        bounded.staleSessionHours = qBound(1, config.staleSessionHours, 168);
        if (bounded.sessionTtlSeconds == m_trackingConfig.sessionTtlSeconds
            && bounded.staleSessionHours == m_trackingConfig.staleSessionHours
            && bounded.skipNameMarkers == m_trackingConfig.skipNameMarkers) {
            return;
        }
        m_trackingConfig = bounded;
    }
    emit configChanged();
}

ReportTypes::ReportConfig ConfigManager::reportConfig() const
{
    QMutexLocker locker(&m_mutex);
    return m_reportConfig;
}

int ConfigManager::reportCleanupIntervalMinutes() const
{
    QMutexLocker locker(&m_mutex);
    return m_reportCleanupIntervalMinutes;
}

void ConfigManager::setReportConfig(const ReportTypes::ReportConfig &config)
{
    {
        QMutexLocker locker(&m_mutex);
        const ReportTypes::ReportConfig normalized = config.normalized();
        if (normalized.toJson() == m_reportConfig.toJson()) {
            return;
        }
        m_reportConfig = normalized;
    }
    emit configChanged();
}

QString ConfigManager::logLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

QString ConfigManager::logFilePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_logFilePath;
}

int ConfigManager::logMaxFileSizeKB() const
{
    QMutexLocker locker(&m_mutex);
    return m_logMaxFileSizeKB;
}

int ConfigManager::logBackupCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_logBackupCount;
}

void ConfigManager::setLogLevel(const QString &level)
{
    const QString lowered = level.trimmed().toLower();
    static const QStringList known{"debug", "info", "warning", "error", "fatal"};
    if (!known.contains(lowered)) {
        LOG_WARNING("Rejected unknown log level: " + level);
        return;
    }

    {
        QMutexLocker locker(&m_mutex);
        if (m_logLevel == lowered) {
            return;
        }
        m_logLevel = lowered;
    }
    emit configChanged();
}

void ConfigManager::setLogFilePath(const QString &path)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_logFilePath == path) {
            return;
        }
        m_logFilePath = path;
    }
    emit configChanged();
}

void ConfigManager::applyLoggingSettings() const
{
    Logger* logger = Logger::instance();
    logger->setLogLevel(Logger::levelFromString(logLevel()));
    logger->setRotation(static_cast<qint64>(logMaxFileSizeKB()) * 1024, logBackupCount());

    const QString path = logFilePath();
    if (!path.isEmpty()) {
        logger->setLogFile(path);
    }
}
