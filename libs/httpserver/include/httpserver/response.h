#ifndef HTTP_RESPONSE_H
#define HTTP_RESPONSE_H

#include <QHttpServerResponse>
#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonArray>

namespace Http {

    /**
     * @brief JSON response builders
     *
     * Error bodies share one shape: {"error": true, "code": ..., "message": ...}
     * plus "errors" for validation failures. 4xx answers are logged as warnings,
     * 5xx answers as errors.
     */
    class Response {
    public:
        static QHttpServerResponse json(const QJsonObject& data,
                                        QHttpServerResponder::StatusCode statusCode = QHttpServerResponder::StatusCode::Ok);
        static QHttpServerResponse json(const QJsonArray& data);
        static QHttpServerResponse accepted(const QJsonObject& data);

        static QHttpServerResponse badRequest(const QString& message, const QString& errorCode = "BAD_REQUEST");
        static QHttpServerResponse notFound(const QString& message = "Resource not found", const QString& errorCode = "NOT_FOUND");
        static QHttpServerResponse conflict(const QString& message, const QString& errorCode = "CONFLICT");
        static QHttpServerResponse internalError(const QString& message = "Internal server error", const QString& errorCode = "INTERNAL_ERROR");
        static QHttpServerResponse validationError(const QString& message, const QStringList& errors);

        static QHttpServerResponse error(QHttpServerResponder::StatusCode statusCode, const QString& errorCode,
                                         const QString& message, const QJsonObject& extra = QJsonObject());
    };

} // namespace Http

#endif // HTTP_RESPONSE_H
