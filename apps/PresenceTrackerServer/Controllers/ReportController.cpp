#include "ReportController.h"
#include "Services/ReportEngine.h"
#include "Services/MemberDirectory.h"
#include "httpserver/response.h"
#include "logger/logger.h"

using ReportTypes::ReportConfig;
using ReportTypes::ReportRequest;

ReportController::ReportController(ReportEngine* engine, InMemoryMemberDirectory* directory, QObject* parent)
    : Http::Controller(parent)
    , m_engine(engine)
    , m_directory(directory)
{
    m_initialized = m_engine && m_directory;
    if (m_engine) {
        connect(m_engine, &ReportEngine::partialResult, this, &ReportController::rememberPartial);
        connect(m_engine, &ReportEngine::completed, this, &ReportController::forgetOperation);
        connect(m_engine, &ReportEngine::cancelled, this, &ReportController::forgetOperation);
        connect(m_engine, &ReportEngine::failed, this, &ReportController::forgetOperation);
    }
    LOG_INFO("ReportController created");
}

ReportController::~ReportController()
{
    LOG_INFO("ReportController destroyed");
}

void ReportController::rememberPartial(const QString& operationId, const QJsonObject& partial)
{
    m_latestPartials.insert(operationId, partial);
}

void ReportController::forgetOperation(const QString& operationId)
{
    m_latestPartials.remove(operationId);
}

void ReportController::setupRoutes(QHttpServer& server)
{
    if (!m_initialized) {
        LOG_ERROR("Cannot set up routes - ReportController is missing its services");
        return;
    }

    server.route("/api/guilds/<arg>/reports", QHttpServerRequest::Method::Post,
        [this](const QString& guildId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleCreateReport(guildId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/reports/<arg>", QHttpServerRequest::Method::Get,
        [this](const QString& operationId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleGetReport(operationId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    server.route("/api/reports/<arg>", QHttpServerRequest::Method::Delete,
        [this](const QString& operationId, const QHttpServerRequest& request) {
            logRequestReceived(request);
            auto response = handleCancelReport(operationId, request);
            logRequestCompleted(request, response.statusCode());
            return response;
        });

    LOG_INFO("ReportController routes configured");
}

QHttpServerResponse ReportController::handleCreateReport(const QString& guildId, const QHttpServerRequest& request)
{
    bool ok = false;
    const QJsonObject body = extractJsonFromRequest(request, ok);
    if (!ok) {
        return Http::Response::badRequest("Invalid JSON body");
    }

    QStringList missing;
    if (!validateRequiredFields(body, {"start", "end"}, missing)) {
        return Http::Response::validationError("Missing required fields", missing);
    }

    const QDateTime start = parseDateTime(body["start"]);
    const QDateTime end = parseDateTime(body["end"]);
    if (!start.isValid() || !end.isValid() || start > end) {
        return Http::Response::badRequest("start and end must form a valid range");
    }

    // Callers may ship the member list with the request
    int membersAdded = 0;
    for (const QJsonValue& value : body["members"].toArray()) {
        const MemberInfo member = MemberInfo::fromJson(value.toObject());
        if (!member.userId.isEmpty()) {
            m_directory->upsertMember(guildId, member);
            ++membersAdded;
        }
    }

    ReportRequest reportRequest;
    reportRequest.guildId = guildId;
    reportRequest.filter = body["filter"].toString(body["role"].toString());
    reportRequest.startMs = start.toMSecsSinceEpoch();
    reportRequest.endMs = end.toMSecsSinceEpoch();
    reportRequest.config = ReportConfig::fromJson(body["config"].toObject(), m_engine->defaultConfig());

    const QString operationId = m_engine->generateReport(reportRequest);
    if (operationId.isEmpty()) {
        return Http::Response::badRequest("Report request rejected");
    }

    QJsonObject response;
    response["operationId"] = operationId;
    response["guildId"] = guildId;
    response["filter"] = reportRequest.filter;
    response["membersAdded"] = membersAdded;
    response["statusUrl"] = QString("/api/reports/%1").arg(operationId);
    return Http::Response::accepted(response);
}

QHttpServerResponse ReportController::handleGetReport(const QString& operationId, const QHttpServerRequest& request)
{
    Q_UNUSED(request);

    std::optional<QJsonObject> status = m_engine->operationStatus(operationId);
    if (!status) {
        return Http::Response::notFound("Report operation not found");
    }

    if (m_latestPartials.contains(operationId)) {
        status->insert("partial", m_latestPartials.value(operationId));
    }
    return Http::Response::json(*status);
}

QHttpServerResponse ReportController::handleCancelReport(const QString& operationId, const QHttpServerRequest& request)
{
    Q_UNUSED(request);

    if (m_engine->cancelReport(operationId)) {
        QJsonObject response;
        response["operationId"] = operationId;
        response["cancelRequested"] = true;
        return Http::Response::accepted(response);
    }

    if (!m_engine->operationStatus(operationId)) {
        return Http::Response::notFound("Report operation not found");
    }
    return Http::Response::conflict("Report operation is already finishing", "REPORT_FINISHED");
}
