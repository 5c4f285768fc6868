#include "StatusController.h"
#include "Services/SessionTracker.h"
#include "Services/ReportEngine.h"
#include "dbservice/dbmanager.h"
#include "httpserver/response.h"
#include "logger/logger.h"

#include <QCoreApplication>

StatusController::StatusController(SessionTracker* tracker, ReportEngine* engine,
                                   std::shared_ptr<Cache::FallbackCache> cache, QObject* parent)
    : Http::Controller(parent)
    , m_tracker(tracker)
    , m_engine(engine)
    , m_cache(std::move(cache))
    , m_startTime(QDateTime::currentDateTimeUtc())
{
    m_initialized = m_tracker && m_engine && m_cache;
    LOG_INFO("StatusController created");
}

StatusController::~StatusController()
{
    LOG_INFO("StatusController destroyed");
}

void StatusController::setupRoutes(QHttpServer& server)
{
    if (!m_initialized) {
        LOG_ERROR("Cannot set up routes - StatusController is missing its services");
        return;
    }

    server.route("/api/status/ping", QHttpServerRequest::Method::Get,
        [this](const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handlePing(request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/status", QHttpServerRequest::Method::Get,
        [this](const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleStatus(request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    LOG_INFO("StatusController routes configured");
}

QHttpServerResponse StatusController::handlePing(const QHttpServerRequest& request)
{
    Q_UNUSED(request);

    QJsonObject response;
    response["status"] = "ok";
    response["message"] = "pong";
    response["timestamp"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
    return Http::Response::json(response);
}

QHttpServerResponse StatusController::handleStatus(const QHttpServerRequest& request)
{
    Q_UNUSED(request);

    const QDateTime now = QDateTime::currentDateTimeUtc();
    const bool databaseUp = DbManager::instance().isInitialized() && DbManager::instance().testConnection();

    QJsonObject database;
    database["connected"] = databaseUp;
    database["target"] = DbManager::instance().config().describe();

    const Cache::LocalCache::Stats localStats = m_cache->local().stats();
    QJsonObject local;
    local["entries"] = localStats.entries;
    local["maxEntries"] = m_cache->local().maxEntries();
    local["hits"] = localStats.hits;
    local["misses"] = localStats.misses;
    local["evictions"] = localStats.evictions;

    QJsonObject cache;
    cache["backend"] = m_cache->backendName();
    cache["primaryConfigured"] = m_cache->hasPrimary();
    cache["primaryAvailable"] = m_cache->isPrimaryAvailable();
    cache["local"] = local;

    QJsonObject reports = m_engine->memoryStats();
    reports["activeOperations"] = m_engine->activeOperations();

    QJsonObject response;
    // Cache outages are served from memory and do not degrade the service
    response["status"] = databaseUp ? "ok" : "degraded";
    response["serverTime"] = now.toString(Qt::ISODate);
    response["uptimeSeconds"] = m_startTime.secsTo(now);
    response["version"] = QCoreApplication::applicationVersion();
    response["qtVersion"] = qVersion();
    response["database"] = database;
    response["cache"] = cache;
    response["tracker"] = m_tracker->statistics().toJson();
    response["reports"] = reports;
    return Http::Response::json(response);
}
