#include "ApiServer.h"
#include "dbservice/dbmanager.h"
#include "cache/redisclient.h"
#include "Managers/ConfigManager.h"
#include "Controllers/PresenceController.h"
#include "Controllers/ReportController.h"
#include "Controllers/StatusController.h"
#include "Repositories/VoiceSessionRepository.h"
#include "Repositories/AggregateRepository.h"
#include "Repositories/GuildSettingsRepository.h"
#include "Repositories/ReportCacheRepository.h"
#include "Services/ActivityStore.h"
#include "Services/GuildSettingsService.h"
#include "Services/MemberDirectory.h"
#include "Services/UserClassificationService.h"
#include "Services/SessionTracker.h"
#include "Services/ReportEngine.h"

#include <QDateTime>

ApiServer::ApiServer(ConfigManager* config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_port(0)
    , m_hostAddress(QHostAddress::Any)
    , m_initialized(false)
    , m_shutdown(false)
    , m_voiceSessionRepository(nullptr)
    , m_aggregateRepository(nullptr)
    , m_guildSettingsRepository(nullptr)
    , m_reportCacheRepository(nullptr)
    , m_activityStore(nullptr)
    , m_guildSettings(nullptr)
    , m_memberDirectory(nullptr)
    , m_tracker(nullptr)
    , m_reportEngine(nullptr)
{
    connect(&m_cleanupTimer, &QTimer::timeout, this, &ApiServer::cleanupReportCache);
    LOG_INFO("ApiServer created");
}

ApiServer::~ApiServer()
{
    LOG_INFO("ApiServer destructor called");
    shutdown();
}

bool ApiServer::initialize()
{
    LOG_INFO("Initializing ApiServer");

    if (m_initialized) {
        LOG_INFO("ApiServer already initialized");
        return true;
    }

    const DbConfig dbConfig = m_config->databaseConfig();
    if (!DbManager::instance().initialize(dbConfig)) {
        LOG_FATAL("Failed to initialize database manager");
        emit errorOccurred("Failed to initialize database connection");
        return false;
    }
    LOG_INFO("Database connection initialized to " + dbConfig.describe());

    if (!applySchema()) {
        emit errorOccurred("Failed to apply the database schema");
        return false;
    }

    try {
        setupServices();
        setupControllers();
    } catch (const std::exception& ex) {
        LOG_FATAL(QString("Exception during service setup: %1").arg(QString::fromUtf8(ex.what())));
        emit errorOccurred(QString("Failed to initialize server: %1").arg(QString::fromUtf8(ex.what())));
        return false;
    }

    const int restored = m_tracker->restoreSessions();
    LOG_INFO(QString("%1 active sessions carried over from the previous run").arg(restored));

    cleanupReportCache();
    m_cleanupTimer.start(m_config->reportCleanupIntervalMinutes() * 60 * 1000);

    m_initialized = true;
    LOG_INFO("ApiServer initialized successfully");
    return true;
}

bool ApiServer::applySchema()
{
    const QString script = DbManager::instance().config().isSqlite()
        ? QStringLiteral(":/schema/sqlite.sql")
        : QStringLiteral(":/schema/postgresql.sql");

    if (!DbManager::instance().applySchema(script)) {
        LOG_FATAL("Failed to apply schema " + script);
        return false;
    }
    return true;
}

void ApiServer::setupServices()
{
    LOG_DEBUG("Creating shared cache");
    std::shared_ptr<Cache::KeyValueStore> primary;
    if (m_config->cacheEnabled()) {
        auto redis = std::make_shared<Cache::RedisClient>(m_config->redisConfig());
        // A failed first connect is not fatal, the fallback cache keeps probing
        if (!redis->connectToServer()) {
            LOG_WARNING("Redis unreachable at startup, serving from local memory");
        }
        primary = redis;
    } else {
        LOG_INFO("Distributed cache disabled, using local memory only");
    }
    m_cache = std::make_shared<Cache::FallbackCache>(primary, m_config->localCacheMaxEntries(),
                                                     m_config->cacheRetryIntervalMs());
    connect(m_cache.get(), &Cache::FallbackCache::primaryAvailabilityChanged, this, [](bool available) {
        if (available) {
            LOG_INFO("Distributed cache is reachable again");
        } else {
            LOG_WARNING("Distributed cache unreachable, degraded to local memory");
        }
    });

    LOG_DEBUG("Creating repositories");
    m_voiceSessionRepository = new VoiceSessionRepository(this);
    m_aggregateRepository = new AggregateRepository(this);
    m_guildSettingsRepository = new GuildSettingsRepository(this);
    m_reportCacheRepository = new ReportCacheRepository(this);

    m_voiceSessionRepository->initialize(&DbManager::instance().getService<VoiceSessionModel>());
    m_aggregateRepository->initialize(&DbManager::instance().getService<ActivityAggregateModel>());
    m_guildSettingsRepository->initialize(&DbManager::instance().getService<GuildSettingModel>());
    m_reportCacheRepository->initialize(&DbManager::instance().getService<ReportCacheModel>());

    LOG_DEBUG("Creating services");
    m_activityStore = new ActivityStore(m_voiceSessionRepository, m_aggregateRepository, m_cache, this);
    m_guildSettings = new GuildSettingsService(m_guildSettingsRepository, m_cache, this);
    m_memberDirectory = new InMemoryMemberDirectory(this);
    m_classifier = std::make_unique<UserClassificationService>(m_guildSettings);

    m_tracker = new SessionTracker(m_activityStore, m_guildSettings, m_cache, m_config->trackingConfig(), this);
    connect(m_tracker, &SessionTracker::sessionStarted, this, [this](const PresenceTypes::ActiveSession& session) {
        if (!session.displayName.isEmpty()) {
            m_memberDirectory->rememberName(session.guildId, session.userId, session.displayName);
        }
    });

    m_reportEngine = new ReportEngine(m_activityStore, m_memberDirectory, m_classifier.get(), m_cache,
                                      m_reportCacheRepository, m_config->reportConfig(), this);
    connect(m_reportEngine, &ReportEngine::memoryWarning, this,
            [](const QString& operationId, qint64 currentBytes, qint64 thresholdBytes) {
        LOG_WARNING(QString("Report %1 raised memory warning: %2 of %3 bytes")
                   .arg(operationId).arg(currentBytes).arg(thresholdBytes));
    });

    connect(m_config, &ConfigManager::configChanged, this, [this]() {
        if (m_reportEngine) {
            m_reportEngine->setDefaultConfig(m_config->reportConfig());
        }
        m_config->applyLoggingSettings();
    });
}

void ApiServer::setupControllers()
{
    LOG_INFO("Setting up controllers");

    m_presenceController = std::make_shared<PresenceController>(m_tracker, m_activityStore, m_memberDirectory);
    m_reportController = std::make_shared<ReportController>(m_reportEngine, m_memberDirectory);
    m_statusController = std::make_shared<StatusController>(m_tracker, m_reportEngine, m_cache);

    m_server.registerController(m_presenceController);
    m_server.registerController(m_reportController);
    m_server.registerController(m_statusController);

    LOG_INFO("All controllers registered");
}

void ApiServer::cleanupReportCache()
{
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    const int removed = m_reportCacheRepository->cleanupExpired(nowMs);
    if (removed < 0) {
        LOG_WARNING("Scheduled report cache cleanup failed: " + m_reportCacheRepository->lastError());
    } else {
        LOG_INFO(QString("Scheduled report cache cleanup removed %1 expired reports").arg(removed));
    }
    m_reportEngine->cleanupStaleOperations(nowMs);
}

bool ApiServer::start(quint16 port, const QHostAddress& address)
{
    LOG_INFO(QString("Starting ApiServer on %1:%2").arg(address.toString()).arg(port));

    if (!m_initialized) {
        LOG_ERROR("Cannot start server: not initialized");
        emit errorOccurred("Server not initialized");
        return false;
    }

    if (isRunning()) {
        LOG_INFO(QString("Server already running on %1:%2").arg(m_hostAddress.toString()).arg(m_port));
        return true;
    }

    if (!m_server.start(port, address)) {
        LOG_FATAL(QString("Failed to start server on %1:%2").arg(address.toString()).arg(port));
        emit errorOccurred(QString("Failed to start server on %1:%2").arg(address.toString()).arg(port));
        return false;
    }

    m_port = m_server.port();
    m_hostAddress = address;
    LOG_INFO(QString("ApiServer started successfully on %1:%2").arg(m_hostAddress.toString()).arg(m_port));
    emit serverStarted(m_port);
    return true;
}

bool ApiServer::stop()
{
    if (!isRunning()) {
        return true;
    }

    LOG_INFO(QString("Stopping ApiServer on %1:%2").arg(m_hostAddress.toString()).arg(m_port));
    m_server.stop();
    m_port = 0;
    m_hostAddress = QHostAddress::Any;

    emit serverStopped();
    return true;
}

void ApiServer::shutdown()
{
    if (m_shutdown) {
        return;
    }
    m_shutdown = true;

    stop();
    m_cleanupTimer.stop();

    if (!m_initialized) {
        return;
    }

    LOG_INFO("Closing active sessions before shutdown");
    m_tracker->closeAllSessions();

    // Cancels running reports and waits for their threads
    delete m_reportEngine;
    m_reportEngine = nullptr;

    DbManager::instance().shutdown();
    LOG_INFO("ApiServer shut down");
}

bool ApiServer::isRunning() const
{
    return m_server.isRunning();
}

quint16 ApiServer::port() const
{
    return m_port;
}

QHostAddress ApiServer::hostAddress() const
{
    return m_hostAddress;
}
