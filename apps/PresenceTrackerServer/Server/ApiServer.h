#ifndef APISERVER_H
#define APISERVER_H

#include <QObject>
#include <QString>
#include <QHostAddress>
#include <QTimer>
#include <memory>
#include "httpserver/server.h"
#include "cache/fallbackcache.h"
#include "logger/logger.h"

class ConfigManager;

class PresenceController;
class ReportController;
class StatusController;

class ActivityStore;
class GuildSettingsService;
class InMemoryMemberDirectory;
class UserClassificationService;
class SessionTracker;
class ReportEngine;

class VoiceSessionRepository;
class AggregateRepository;
class GuildSettingsRepository;
class ReportCacheRepository;

/**
 * @brief Owns the service graph and the HTTP surface
 *
 * initialize() connects the database, applies the schema, builds the shared
 * cache, every repository and service, and restores active sessions that
 * survived a restart. shutdown() closes the remaining sessions before the
 * database goes away.
 */
class ApiServer : public QObject
{
    Q_OBJECT
public:
    explicit ApiServer(ConfigManager* config, QObject *parent = nullptr);
    ~ApiServer();

    bool initialize();

    bool start(quint16 port, const QHostAddress& address = QHostAddress::Any);
    bool stop();
    void shutdown();

    bool isRunning() const;
    quint16 port() const;
    QHostAddress hostAddress() const;

signals:
    void serverStarted(quint16 port);
    void serverStopped();
    void errorOccurred(const QString &errorMessage);

private slots:
    void cleanupReportCache();

private:
    bool applySchema();
    void setupServices();
    void setupControllers();

    ConfigManager* m_config;
    Http::Server m_server;
    quint16 m_port;
    QHostAddress m_hostAddress;
    bool m_initialized;
    bool m_shutdown;

    std::shared_ptr<Cache::FallbackCache> m_cache;

    // Repositories
    VoiceSessionRepository* m_voiceSessionRepository;
    AggregateRepository* m_aggregateRepository;
    GuildSettingsRepository* m_guildSettingsRepository;
    ReportCacheRepository* m_reportCacheRepository;

    // Services
    ActivityStore* m_activityStore;
    GuildSettingsService* m_guildSettings;
    InMemoryMemberDirectory* m_memberDirectory;
    std::unique_ptr<UserClassificationService> m_classifier;
    SessionTracker* m_tracker;
    ReportEngine* m_reportEngine;

    // Controllers
    std::shared_ptr<PresenceController> m_presenceController;
    std::shared_ptr<ReportController> m_reportController;
    std::shared_ptr<StatusController> m_statusController;

    QTimer m_cleanupTimer;
};

#endif // APISERVER_H
