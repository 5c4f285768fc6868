#ifndef MODELFACTORY_H
#define MODELFACTORY_H

#include <QSqlQuery>
#include <QDateTime>
#include <QDate>
#include <QMap>
#include <QVariant>
#include <QJsonObject>
#include <QJsonArray>
#include <QStringList>
#include <QSharedPointer>

#include "Models/ActivityAggregateModel.h"
#include "Models/PresenceTypes.h"

class VoiceSessionModel;
class GuildSettingModel;
class ReportCacheModel;

/**
 * @brief Factory class for creating model instances
 *
 * Centralizes row-to-model mapping so every repository reads the same column
 * names the same way, and builds models for sessions closed by the tracker.
 */
class ModelFactory {
public:
    // Create models from query results
    static VoiceSessionModel* createVoiceSessionFromQuery(const QSqlQuery& query);
    static ActivityAggregateModel* createDailyActivityFromQuery(const QSqlQuery& query);
    static ActivityAggregateModel* createWeeklyActivityFromQuery(const QSqlQuery& query);
    static ActivityAggregateModel* createMonthlyActivityFromQuery(const QSqlQuery& query);
    static GuildSettingModel* createGuildSettingFromQuery(const QSqlQuery& query);
    static ReportCacheModel* createReportCacheFromQuery(const QSqlQuery& query);

    // Grouped "user_id, total_time_ms" rows
    static ActivityAggregateModel* createUserTotalFromQuery(const QSqlQuery& query);

    // Completed session for an active session closed at endTimeMs
    static VoiceSessionModel* createCompletedSession(const PresenceTypes::ActiveSession& session, qint64 endTimeMs);

    // Model validation functions
    static bool validateVoiceSessionModel(const VoiceSessionModel* model, QStringList& errors);
    static bool validateGuildSettingModel(const GuildSettingModel* model, QStringList& errors);

    // JSON conversion utilities
    static QJsonArray modelsToJsonArray(const QList<QSharedPointer<ActivityAggregateModel>>& models);
    static QJsonArray modelsToJsonArray(const QList<QSharedPointer<VoiceSessionModel>>& models);

private:
    static void setAggregateFields(ActivityAggregateModel* model, const QSqlQuery& query,
                                   const QString& periodColumn);

    // Helpers for query value extraction with default values
    static QString getStringOrDefault(const QSqlQuery& query, const QString& fieldName, const QString& defaultValue = QString());
    static int getIntOrDefault(const QSqlQuery& query, const QString& fieldName, int defaultValue = 0);
    static qint64 getInt64OrDefault(const QSqlQuery& query, const QString& fieldName, qint64 defaultValue = 0);
    static QDate getDateOrDefault(const QSqlQuery& query, const QString& fieldName, const QDate& defaultValue = QDate());
    static QDateTime getDateTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QDateTime& defaultValue = QDateTime());
    static QJsonObject getJsonObjectOrDefault(const QSqlQuery& query, const QString& fieldName, const QJsonObject& defaultValue = QJsonObject());
};

#endif // MODELFACTORY_H
