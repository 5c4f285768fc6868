#include "VoiceSessionRepository.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

VoiceSessionRepository::VoiceSessionRepository(QObject *parent)
    : BaseRepository<VoiceSessionModel>(parent)
{
    LOG_DEBUG("VoiceSessionRepository created");
}

VoiceSessionModel* VoiceSessionRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createVoiceSessionFromQuery(query);
}

bool VoiceSessionRepository::insertIfAbsent(VoiceSessionModel* session, bool* inserted)
{
    if (inserted) {
        *inserted = false;
    }

    QStringList validationErrors;
    if (!ModelFactory::validateVoiceSessionModel(session, validationErrors)) {
        LOG_ERROR(QString("Cannot save voice session: validation failed - %1").arg(validationErrors.join(", ")));
        return false;
    }

    QMap<QString, QVariant> params;
    params["user_id"] = session->userId();
    params["guild_id"] = session->guildId();
    params["channel_id"] = session->channelId();
    params["user_name"] = session->userName();
    params["start_time_ms"] = session->startTimeMs();
    params["end_time_ms"] = session->endTimeMs();
    params["duration_ms"] = session->durationMs();
    params["activity_date"] = dateValue(session->activityDate());

    const QString query = QString(
        "INSERT INTO voice_sessions "
        "(user_id, guild_id, channel_id, user_name, start_time_ms, end_time_ms, duration_ms, activity_date) "
        "VALUES (:user_id, :guild_id, :channel_id, :user_name, :start_time_ms, :end_time_ms, :duration_ms, %1) "
        "ON CONFLICT (user_id, guild_id, channel_id, start_time_ms, end_time_ms) DO NOTHING")
        .arg(dateParam("activity_date"));

    int rows = 0;
    if (!modify(query, params, &rows)) {
        return false;
    }

    if (rows == 0) {
        LOG_INFO(QString("Voice session already recorded, skipping: %1").arg(session->debugInfo()));
    } else {
        LOG_DEBUG(QString("Voice session recorded: %1").arg(session->debugInfo()));
    }

    if (inserted) {
        *inserted = rows > 0;
    }
    return true;
}

QList<QSharedPointer<VoiceSessionModel>> VoiceSessionRepository::getByUser(const QString &guildId, const QString &userId,
                                                                           qint64 fromMs, qint64 toMs)
{
    QMap<QString, QVariant> params;
    params["guild_id"] = guildId;
    params["user_id"] = userId;
    params["from_ms"] = fromMs;
    params["to_ms"] = toMs;

    auto sessions = selectMany(
        "SELECT * FROM voice_sessions "
        "WHERE guild_id = :guild_id AND user_id = :user_id "
        "AND start_time_ms >= :from_ms AND start_time_ms <= :to_ms "
        "ORDER BY start_time_ms",
        params);

    LOG_DEBUG(QString("Retrieved %1 voice sessions for user %2 in guild %3")
             .arg(sessions.size()).arg(userId, guildId));
    return sessions;
}
