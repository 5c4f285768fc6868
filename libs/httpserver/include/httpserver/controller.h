#ifndef HTTP_CONTROLLER_H
#define HTTP_CONTROLLER_H

#include <QObject>
#include <QJsonArray>
#include <QJsonObject>
#include <QHttpServer>
#include <QHttpServerRequest>
#include <QHttpServerResponse>
#include <QDateTime>
#include <QMap>
#include <QJsonValue>

namespace Http {

    class Controller : public QObject {
        Q_OBJECT
    public:
        explicit Controller(QObject* parent = nullptr);
        virtual ~Controller();

        virtual void setupRoutes(QHttpServer& server) = 0;

        bool isInitialized() const { return m_initialized; }

        virtual QString getControllerName() const = 0;

    protected:
        // Body must be a JSON object; ok is false for an empty or malformed body
        QJsonObject extractJsonFromRequest(const QHttpServerRequest& request, bool& ok) const;
        QMap<QString, QString> getQueryParams(const QHttpServerRequest& request) const;

        int getIntParam(const QMap<QString, QString>& params, const QString& name, int defaultValue = 0) const;

        // Accepts ISO dates (yyyy-MM-dd), ISO date-times and epoch milliseconds
        QDateTime getDateTimeParam(const QMap<QString, QString>& params, const QString& name,
                                   const QDateTime& defaultValue = QDateTime()) const;
        static QDateTime parseDateTime(const QJsonValue& value);

        // Null and empty-string values count as missing
        bool validateRequiredFields(const QJsonObject& data, const QStringList& fields, QStringList& missingFields) const;

        void logRequestReceived(const QHttpServerRequest& request) const;
        void logRequestCompleted(const QHttpServerRequest& request, QHttpServerResponder::StatusCode status) const;

        bool m_initialized = false;
    };

} // namespace Http

#endif // HTTP_CONTROLLER_H
