#include "httpserver/response.h"
#include "logger/logger.h"

namespace Http {

    QHttpServerResponse Response::json(const QJsonObject& data, QHttpServerResponder::StatusCode statusCode) {
        return QHttpServerResponse(data, statusCode);
    }

    QHttpServerResponse Response::json(const QJsonArray& data) {
        return QHttpServerResponse(data, QHttpServerResponder::StatusCode::Ok);
    }

    QHttpServerResponse Response::accepted(const QJsonObject& data) {
        return QHttpServerResponse(data, QHttpServerResponder::StatusCode::Accepted);
    }

    QHttpServerResponse Response::badRequest(const QString& message, const QString& errorCode) {
        return error(QHttpServerResponder::StatusCode::BadRequest, errorCode, message);
    }

    QHttpServerResponse Response::notFound(const QString& message, const QString& errorCode) {
        return error(QHttpServerResponder::StatusCode::NotFound, errorCode, message);
    }

    QHttpServerResponse Response::conflict(const QString& message, const QString& errorCode) {
        return error(QHttpServerResponder::StatusCode::Conflict, errorCode, message);
    }

    QHttpServerResponse Response::internalError(const QString& message, const QString& errorCode) {
        return error(QHttpServerResponder::StatusCode::InternalServerError, errorCode, message);
    }

    QHttpServerResponse Response::validationError(const QString& message, const QStringList& errors) {
        QJsonObject extra;
        extra["errors"] = QJsonArray::fromStringList(errors);
        return error(QHttpServerResponder::StatusCode::BadRequest, "VALIDATION_ERROR", message, extra);
    }

    QHttpServerResponse Response::error(QHttpServerResponder::StatusCode statusCode, const QString& errorCode,
                                        const QString& message, const QJsonObject& extra) {
        const int status = static_cast<int>(statusCode);
        const QString line = QString("HTTP %1 %2: %3").arg(status).arg(errorCode, message);
        if (status >= 500) {
            LOG_ERROR(line);
        } else {
            LOG_WARNING(line);
        }

        QJsonObject body = extra;
        body["error"] = true;
        body["code"] = errorCode;
        body["message"] = message;
        return QHttpServerResponse(body, statusCode);
    }

} // namespace Http
