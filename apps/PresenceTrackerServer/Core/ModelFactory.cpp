#include "ModelFactory.h"

#include "Models/VoiceSessionModel.h"
#include "Models/GuildSettingModel.h"
#include "Models/ReportCacheModel.h"

#include <QJsonDocument>
#include <QSqlRecord>
#include <QTimeZone>
#include "logger/logger.h"

//------------------------------------------------------------------------------
// Model creation from database query results
//------------------------------------------------------------------------------

VoiceSessionModel* ModelFactory::createVoiceSessionFromQuery(const QSqlQuery& query) {
    VoiceSessionModel* session = new VoiceSessionModel();

    session->setId(getInt64OrDefault(query, "id"));
    session->setUserId(getStringOrDefault(query, "user_id"));
    session->setGuildId(getStringOrDefault(query, "guild_id"));
    session->setChannelId(getStringOrDefault(query, "channel_id"));
    session->setUserName(getStringOrDefault(query, "user_name"));
    session->setStartTimeMs(getInt64OrDefault(query, "start_time_ms"));
    session->setEndTimeMs(getInt64OrDefault(query, "end_time_ms"));
    session->setCreatedAt(getDateTimeOrDefault(query, "created_at"));

    return session;
}

ActivityAggregateModel* ModelFactory::createDailyActivityFromQuery(const QSqlQuery& query) {
    ActivityAggregateModel* daily = new ActivityAggregateModel();
    daily->setGranularity(ActivityAggregateModel::Daily);
    setAggregateFields(daily, query, "activity_date");

    daily->setPeriodEnd(daily->periodStart());
    daily->setActiveDays(daily->totalTimeMs() > 0 ? 1 : 0);
    daily->setFirstActivityMs(getInt64OrDefault(query, "first_activity_ms"));
    daily->setLastActivityMs(getInt64OrDefault(query, "last_activity_ms"));
    daily->setChannelsVisited(getIntOrDefault(query, "channels_visited"));

    return daily;
}

ActivityAggregateModel* ModelFactory::createWeeklyActivityFromQuery(const QSqlQuery& query) {
    ActivityAggregateModel* weekly = new ActivityAggregateModel();
    weekly->setGranularity(ActivityAggregateModel::Weekly);
    setAggregateFields(weekly, query, "week_start_date");

    weekly->setPeriodEnd(weekly->periodStart().addDays(6));
    weekly->setActiveDays(getIntOrDefault(query, "active_days"));

    return weekly;
}

ActivityAggregateModel* ModelFactory::createMonthlyActivityFromQuery(const QSqlQuery& query) {
    ActivityAggregateModel* monthly = new ActivityAggregateModel();
    monthly->setGranularity(ActivityAggregateModel::Monthly);
    setAggregateFields(monthly, query, "activity_month");

    monthly->setPeriodEnd(monthly->periodStart().addMonths(1).addDays(-1));
    monthly->setActiveDays(getIntOrDefault(query, "active_days"));

    return monthly;
}

ActivityAggregateModel* ModelFactory::createUserTotalFromQuery(const QSqlQuery& query) {
    ActivityAggregateModel* total = new ActivityAggregateModel();
    total->setUserId(getStringOrDefault(query, "user_id"));
    total->setTotalTimeMs(getInt64OrDefault(query, "total_time_ms"));
    return total;
}

GuildSettingModel* ModelFactory::createGuildSettingFromQuery(const QSqlQuery& query) {
    GuildSettingModel* setting = new GuildSettingModel();

    setting->setId(getInt64OrDefault(query, "id"));
    setting->setGuildId(getStringOrDefault(query, "guild_id"));
    setting->setSettingType(getStringOrDefault(query, "setting_type"));
    setting->setSettingKey(getStringOrDefault(query, "setting_key"));
    setting->setSettingValue(getJsonObjectOrDefault(query, "setting_value"));
    setting->setUpdatedAt(getDateTimeOrDefault(query, "updated_at", QDateTime::currentDateTimeUtc()));

    return setting;
}

ReportCacheModel* ModelFactory::createReportCacheFromQuery(const QSqlQuery& query) {
    ReportCacheModel* entry = new ReportCacheModel();

    entry->setCacheKey(getStringOrDefault(query, "cache_key"));
    entry->setGuildId(getStringOrDefault(query, "guild_id"));
    entry->setPayload(getJsonObjectOrDefault(query, "payload"));
    entry->setGeneratedAtMs(getInt64OrDefault(query, "generated_at_ms"));
    entry->setExpiresAtMs(getInt64OrDefault(query, "expires_at_ms"));
    entry->setUserCount(getIntOrDefault(query, "user_count"));
    entry->setGenerationTimeMs(getInt64OrDefault(query, "generation_time_ms"));

    return entry;
}

VoiceSessionModel* ModelFactory::createCompletedSession(const PresenceTypes::ActiveSession& session, qint64 endTimeMs) {
    VoiceSessionModel* completed = new VoiceSessionModel();

    completed->setUserId(session.userId);
    completed->setGuildId(session.guildId);
    completed->setChannelId(session.channelId);
    completed->setUserName(session.displayName);
    completed->setStartTimeMs(session.startTimeMs);
    // A clock step backwards must not produce a negative duration
    completed->setEndTimeMs(qMax(endTimeMs, session.startTimeMs));
    completed->setCreatedAt(QDateTime::currentDateTimeUtc());

    return completed;
}

//------------------------------------------------------------------------------
// Validation
//------------------------------------------------------------------------------

bool ModelFactory::validateVoiceSessionModel(const VoiceSessionModel* model, QStringList& errors) {
    if (!model) {
        errors << "Session is null";
        return false;
    }

    if (model->userId().isEmpty()) {
        errors << "User ID is required";
    }
    if (model->guildId().isEmpty()) {
        errors << "Guild ID is required";
    }
    if (model->channelId().isEmpty()) {
        errors << "Channel ID is required";
    }
    if (model->startTimeMs() <= 0) {
        errors << "Start time must be positive";
    }
    if (model->endTimeMs() < model->startTimeMs()) {
        errors << "End time must not precede start time";
    }

    return errors.isEmpty();
}

bool ModelFactory::validateGuildSettingModel(const GuildSettingModel* model, QStringList& errors) {
    if (!model) {
        errors << "Setting is null";
        return false;
    }

    if (model->guildId().isEmpty()) {
        errors << "Guild ID is required";
    }
    if (model->settingType().isEmpty()) {
        errors << "Setting type is required";
    }
    if (model->settingKey().isEmpty()) {
        errors << "Setting key is required";
    }

    return errors.isEmpty();
}

//------------------------------------------------------------------------------
// JSON conversion
//------------------------------------------------------------------------------

QJsonArray ModelFactory::modelsToJsonArray(const QList<QSharedPointer<ActivityAggregateModel>>& models) {
    QJsonArray array;
    for (const auto& model : models) {
        array.append(model->toJson());
    }
    return array;
}

QJsonArray ModelFactory::modelsToJsonArray(const QList<QSharedPointer<VoiceSessionModel>>& models) {
    QJsonArray array;
    for (const auto& model : models) {
        array.append(model->toJson());
    }
    return array;
}

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

void ModelFactory::setAggregateFields(ActivityAggregateModel* model, const QSqlQuery& query,
                                      const QString& periodColumn) {
    model->setUserId(getStringOrDefault(query, "user_id"));
    model->setGuildId(getStringOrDefault(query, "guild_id"));
    model->setPeriodStart(getDateOrDefault(query, periodColumn));
    model->setTotalTimeMs(getInt64OrDefault(query, "total_time_ms"));
    model->setSessionCount(getIntOrDefault(query, "session_count"));
}

QString ModelFactory::getStringOrDefault(const QSqlQuery& query, const QString& fieldName, const QString& defaultValue) {
    QVariant value = query.value(fieldName);
    return value.isNull() ? defaultValue : value.toString();
}

int ModelFactory::getIntOrDefault(const QSqlQuery& query, const QString& fieldName, int defaultValue) {
    QVariant value = query.value(fieldName);
    return value.isNull() ? defaultValue : value.toInt();
}

qint64 ModelFactory::getInt64OrDefault(const QSqlQuery& query, const QString& fieldName, qint64 defaultValue) {
    QVariant value = query.value(fieldName);
    if (value.isNull()) {
        return defaultValue;
    }
    // SUM() over BIGINT comes back as NUMERIC from PostgreSQL
    bool ok = false;
    qint64 result = value.toLongLong(&ok);
    if (!ok) {
        result = static_cast<qint64>(value.toDouble(&ok));
    }
    return ok ? result : defaultValue;
}

QDate ModelFactory::getDateOrDefault(const QSqlQuery& query, const QString& fieldName, const QDate& defaultValue) {
    QVariant value = query.value(fieldName);
    if (value.isNull()) {
        return defaultValue;
    }
    QDate date = value.toDate();
    if (!date.isValid()) {
        date = QDate::fromString(value.toString().left(10), Qt::ISODate);
    }
    return date.isValid() ? date : defaultValue;
}

QDateTime ModelFactory::getDateTimeOrDefault(const QSqlQuery& query, const QString& fieldName, const QDateTime& defaultValue) {
    QVariant value = query.value(fieldName);
    if (value.isNull()) {
        return defaultValue;
    }
    QDateTime dateTime = value.toDateTime();
    if (!dateTime.isValid()) {
        dateTime = QDateTime::fromString(value.toString(), Qt::ISODate);
    }
    if (!dateTime.isValid()) {
        return defaultValue;
    }
    dateTime.setTimeZone(QTimeZone::UTC);
    return dateTime;
}

QJsonObject ModelFactory::getJsonObjectOrDefault(const QSqlQuery& query, const QString& fieldName, const QJsonObject& defaultValue) {
    QVariant value = query.value(fieldName);
    if (value.isNull()) {
        return defaultValue;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(value.toByteArray(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARNING(QString("Malformed JSON in column %1: %2").arg(fieldName, parseError.errorString()));
        return defaultValue;
    }
    return doc.object();
}
