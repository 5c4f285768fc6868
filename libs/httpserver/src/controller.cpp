#include "httpserver/controller.h"
#include "logger/logger.h"
#include <QJsonDocument>
#include <QUrlQuery>
#include <QTimeZone>

namespace Http {

    namespace {

        QString describe(const QHttpServerRequest& request) {
            QString method;
            switch (request.method()) {
                case QHttpServerRequest::Method::Get: method = "GET"; break;
                case QHttpServerRequest::Method::Post: method = "POST"; break;
                case QHttpServerRequest::Method::Put: method = "PUT"; break;
                case QHttpServerRequest::Method::Delete: method = "DELETE"; break;
                default: method = QString::number(static_cast<int>(request.method())); break;
            }
            return QString("%1 %2").arg(method, request.url().path());
        }

    } // namespace

    Controller::Controller(QObject* parent)
        : QObject(parent)
    {
    }

    Controller::~Controller() {
    }

    QJsonObject Controller::extractJsonFromRequest(const QHttpServerRequest& request, bool& ok) const {
        ok = false;
        const QByteArray body = request.body();
        if (body.trimmed().isEmpty()) {
            LOG_DEBUG(QString("[%1] %2 has no body").arg(getControllerName(), describe(request)));
            return QJsonObject();
        }

        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            LOG_WARNING(QString("[%1] %2 body rejected: %3")
                       .arg(getControllerName(), describe(request),
                            doc.isNull() ? parseError.errorString() : QString("not a JSON object")));
            return QJsonObject();
        }

        ok = true;
        return doc.object();
    }

    QMap<QString, QString> Controller::getQueryParams(const QHttpServerRequest& request) const {
        QMap<QString, QString> params;
        const QUrlQuery query(request.url());
        for (const auto& item : query.queryItems(QUrl::FullyDecoded)) {
            params.insert(item.first, item.second);
        }
        return params;
    }

    int Controller::getIntParam(const QMap<QString, QString>& params, const QString& name, int defaultValue) const {
        bool ok = false;
        const int value = params.value(name).toInt(&ok);
        return ok ? value : defaultValue;
    }

    QDateTime Controller::getDateTimeParam(const QMap<QString, QString>& params, const QString& name, const QDateTime& defaultValue) const {
        const QDateTime value = parseDateTime(QJsonValue(params.value(name)));
        return value.isValid() ? value : defaultValue;
    }

    QDateTime Controller::parseDateTime(const QJsonValue& value) {
        if (value.isDouble()) {
            return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble()), QTimeZone::UTC);
        }

        const QString text = value.toString().trimmed();
        if (text.isEmpty()) {
            return QDateTime();
        }

        bool numeric = false;
        const qint64 epochMs = text.toLongLong(&numeric);
        if (numeric) {
            return QDateTime::fromMSecsSinceEpoch(epochMs, QTimeZone::UTC);
        }

        const QDateTime dateTime = QDateTime::fromString(text, Qt::ISODateWithMs);
        if (dateTime.isValid()) {
            return dateTime.toUTC();
        }

        // A bare date is midnight UTC
        const QDate date = QDate::fromString(text, Qt::ISODate);
        return date.isValid() ? QDateTime(date, QTime(0, 0), QTimeZone::UTC) : QDateTime();
    }

    bool Controller::validateRequiredFields(const QJsonObject& data, const QStringList& fields, QStringList& missingFields) const {
        missingFields.clear();
        for (const QString& field : fields) {
            const QJsonValue value = data.value(field);
            if (value.isUndefined() || value.isNull() || (value.isString() && value.toString().isEmpty())) {
                missingFields.append(field);
            }
        }
        return missingFields.isEmpty();
    }

    void Controller::logRequestReceived(const QHttpServerRequest& request) const {
        LOG_DEBUG(QString("[%1] <- %2").arg(getControllerName(), describe(request)));
    }

    void Controller::logRequestCompleted(const QHttpServerRequest& request, QHttpServerResponder::StatusCode status) const {
        LOG_DEBUG(QString("[%1] -> %2 %3").arg(getControllerName(), describe(request)).arg(static_cast<int>(status)));
    }

} // namespace Http
