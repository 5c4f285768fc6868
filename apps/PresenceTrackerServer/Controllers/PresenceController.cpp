#include "PresenceController.h"
#include "Services/SessionTracker.h"
#include "Services/ActivityStore.h"
#include "Services/MemberDirectory.h"
#include "httpserver/response.h"
#include "logger/logger.h"

#include <QJsonArray>

using PresenceTypes::TransitionEvent;

namespace {

// Default reporting window when a query gives no range
constexpr qint64 DefaultRangeMs = 7LL * 24 * 60 * 60 * 1000;

}

PresenceController::PresenceController(SessionTracker* tracker, ActivityStore* store,
                                       InMemoryMemberDirectory* directory, QObject* parent)
    : Http::Controller(parent)
    , m_tracker(tracker)
    , m_store(store)
    , m_directory(directory)
{
    m_initialized = m_tracker && m_store && m_directory;
    LOG_INFO("PresenceController created");
}

PresenceController::~PresenceController()
{
    LOG_INFO("PresenceController destroyed");
}

void PresenceController::setupRoutes(QHttpServer& server)
{
    if (!m_initialized) {
        LOG_ERROR("Cannot set up routes - PresenceController is missing its services");
        return;
    }

    server.route("/api/guilds/<arg>/transitions", QHttpServerRequest::Method::Post,
        [this](const QString& guildId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handlePostTransitions(guildId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/guilds/<arg>/users/<arg>/activity", QHttpServerRequest::Method::Get,
        [this](const QString& guildId, const QString& userId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleGetUserActivity(guildId, userId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/guilds/<arg>/activity/batch", QHttpServerRequest::Method::Post,
        [this](const QString& guildId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleBatchActivity(guildId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/guilds/<arg>/stats/daily", QHttpServerRequest::Method::Get,
        [this](const QString& guildId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleDailyStats(guildId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/guilds/<arg>/sessions/active", QHttpServerRequest::Method::Get,
        [this](const QString& guildId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleActiveSessions(guildId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    LOG_INFO("PresenceController routes configured");
}

QHttpServerResponse PresenceController::handlePostTransitions(const QString& guildId, const QHttpServerRequest& request)
{
    bool ok = false;
    const QJsonObject body = extractJsonFromRequest(request, ok);
    if (!ok) {
        return Http::Response::badRequest("Invalid JSON body");
    }

    QJsonArray entries;
    if (body.contains("events")) {
        entries = body["events"].toArray();
    } else {
        entries.append(body);
    }

    QList<TransitionEvent> events;
    QStringList errors;
    for (int i = 0; i < entries.size(); ++i) {
        const TransitionEvent event = TransitionEvent::fromJson(entries.at(i).toObject(), guildId);
        if (event.userId.isEmpty()) {
            errors.append(QString("events[%1]: userId is required").arg(i));
            continue;
        }
        events.append(event);
    }

    if (!errors.isEmpty()) {
        return Http::Response::validationError("Invalid transition events", errors);
    }

    for (const TransitionEvent& event : events) {
        if (!event.displayName.isEmpty()) {
            m_directory->rememberName(guildId, event.userId, event.displayName);
        }
        m_tracker->recordTransition(event);
    }

    QJsonObject response;
    response["guildId"] = guildId;
    response["queued"] = static_cast<int>(events.size());
    response["pending"] = m_tracker->pendingTransitions();
    return Http::Response::accepted(response);
}

QHttpServerResponse PresenceController::handleGetUserActivity(const QString& guildId, const QString& userId,
                                                              const QHttpServerRequest& request)
{
    const QMap<QString, QString> params = getQueryParams(request);
    const QDateTime end = getDateTimeParam(params, "end", QDateTime::currentDateTimeUtc());
    const QDateTime start = getDateTimeParam(params, "start", end.addMSecs(-DefaultRangeMs));
    if (start > end) {
        return Http::Response::badRequest("start must not be after end");
    }

    bool ok = false;
    const qint64 totalTimeMs = m_store->getUserActivity(userId, guildId, start.toMSecsSinceEpoch(),
                                                        end.toMSecsSinceEpoch(), &ok);
    if (!ok) {
        return Http::Response::internalError("Activity could not be read");
    }

    QJsonObject response;
    response["guildId"] = guildId;
    response["userId"] = userId;
    response["displayName"] = m_directory->displayName(guildId, userId);
    response["startTime"] = start.toMSecsSinceEpoch();
    response["endTime"] = end.toMSecsSinceEpoch();
    response["totalTimeMs"] = totalTimeMs;
    response["totalHours"] = totalTimeMs / 3600000.0;

    const std::optional<PresenceTypes::ActiveSession> active = m_tracker->activeSession(guildId, userId);
    response["activeSession"] = active ? QJsonValue(active->toJson()) : QJsonValue(QJsonValue::Null);
    return Http::Response::json(response);
}

QHttpServerResponse PresenceController::handleBatchActivity(const QString& guildId, const QHttpServerRequest& request)
{
    bool ok = false;
    const QJsonObject body = extractJsonFromRequest(request, ok);
    if (!ok) {
        return Http::Response::badRequest("Invalid JSON body");
    }

    QStringList missing;
    if (!validateRequiredFields(body, {"userIds", "start", "end"}, missing)) {
        return Http::Response::validationError("Missing required fields", missing);
    }

    QStringList userIds;
    for (const QJsonValue& value : body["userIds"].toArray()) {
        if (!value.toString().isEmpty()) {
            userIds.append(value.toString());
        }
    }

    const QDateTime start = parseDateTime(body["start"]);
    const QDateTime end = parseDateTime(body["end"]);
    if (!start.isValid() || !end.isValid() || start > end) {
        return Http::Response::badRequest("start and end must form a valid range");
    }

    bool queryOk = false;
    const QHash<QString, qint64> totals = m_store->queryBatch(userIds, guildId, start.toMSecsSinceEpoch(),
                                                              end.toMSecsSinceEpoch(), &queryOk);
    if (!queryOk) {
        return Http::Response::internalError("Activity could not be read");
    }

    QJsonObject totalsJson;
    for (auto it = totals.constBegin(); it != totals.constEnd(); ++it) {
        totalsJson[it.key()] = it.value();
    }

    QJsonObject response;
    response["guildId"] = guildId;
    response["startTime"] = start.toMSecsSinceEpoch();
    response["endTime"] = end.toMSecsSinceEpoch();
    response["totals"] = totalsJson;
    return Http::Response::json(response);
}

QHttpServerResponse PresenceController::handleDailyStats(const QString& guildId, const QHttpServerRequest& request)
{
    const QMap<QString, QString> params = getQueryParams(request);
    const int days = getIntParam(params, "days", 7);
    if (days < 1 || days > 366) {
        return Http::Response::badRequest("days must be between 1 and 366");
    }

    bool ok = false;
    const QList<DailyGuildStats> stats = m_store->dailyStats(guildId, days, &ok);
    if (!ok) {
        return Http::Response::internalError("Daily statistics could not be read");
    }

    QJsonArray rows;
    for (const DailyGuildStats& row : stats) {
        rows.append(row.toJson());
    }

    QJsonObject response;
    response["guildId"] = guildId;
    response["days"] = days;
    response["stats"] = rows;
    return Http::Response::json(response);
}

QHttpServerResponse PresenceController::handleActiveSessions(const QString& guildId, const QHttpServerRequest& request)
{
    Q_UNUSED(request);

    QJsonArray sessions;
    for (const PresenceTypes::ActiveSession& session : m_tracker->activeSessions(guildId)) {
        sessions.append(session.toJson());
    }

    QJsonObject response;
    response["guildId"] = guildId;
    response["count"] = sessions.size();
    response["sessions"] = sessions;
    return Http::Response::json(response);
}
