#include "ReportCacheRepository.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

ReportCacheRepository::ReportCacheRepository(QObject *parent)
    : BaseRepository<ReportCacheModel>(parent)
{
    LOG_DEBUG("ReportCacheRepository created");
}

ReportCacheModel* ReportCacheRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createReportCacheFromQuery(query);
}

bool ReportCacheRepository::save(ReportCacheModel *entry)
{
    if (!entry || entry->cacheKey().isEmpty()) {
        LOG_ERROR("Cannot save report cache entry without a cache key");
        return false;
    }

    QMap<QString, QVariant> params;
    params["cache_key"] = entry->cacheKey();
    params["guild_id"] = entry->guildId();
    params["payload"] = jsonToString(entry->payload());
    params["generated_at_ms"] = entry->generatedAtMs();
    params["expires_at_ms"] = entry->expiresAtMs();
    params["user_count"] = entry->userCount();
    params["generation_time_ms"] = entry->generationTimeMs();

    bool success = modify(
        "INSERT INTO report_cache "
        "(cache_key, guild_id, payload, generated_at_ms, expires_at_ms, user_count, generation_time_ms) "
        "VALUES (:cache_key, :guild_id, :payload, :generated_at_ms, :expires_at_ms, :user_count, :generation_time_ms) "
        "ON CONFLICT (cache_key) DO UPDATE SET "
        "payload = excluded.payload, "
        "generated_at_ms = excluded.generated_at_ms, "
        "expires_at_ms = excluded.expires_at_ms, "
        "user_count = excluded.user_count, "
        "generation_time_ms = excluded.generation_time_ms",
        params);

    if (success) {
        LOG_DEBUG(QString("Report cached under %1 until %2").arg(entry->cacheKey()).arg(entry->expiresAtMs()));
    }
    return success;
}

QSharedPointer<ReportCacheModel> ReportCacheRepository::getValid(const QString &cacheKey, qint64 nowMs)
{
    QMap<QString, QVariant> params;
    params["cache_key"] = cacheKey;
    params["now_ms"] = nowMs;

    return selectOne(
        "SELECT * FROM report_cache WHERE cache_key = :cache_key AND expires_at_ms > :now_ms",
        params);
}

bool ReportCacheRepository::removeKey(const QString &cacheKey)
{
    QMap<QString, QVariant> params;
    params["cache_key"] = cacheKey;
    return modify("DELETE FROM report_cache WHERE cache_key = :cache_key", params);
}

int ReportCacheRepository::cleanupExpired(qint64 nowMs)
{
    QMap<QString, QVariant> params;
    params["now_ms"] = nowMs;

    int removed = 0;
    if (!modify("DELETE FROM report_cache WHERE expires_at_ms <= :now_ms", params, &removed)) {
        return -1;
    }

    if (removed > 0) {
        LOG_INFO(QString("Removed %1 expired report cache entries").arg(removed));
    }
    return removed;
}
