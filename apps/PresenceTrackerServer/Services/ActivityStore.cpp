#include "ActivityStore.h"
#include "Models/VoiceSessionModel.h"
#include "Repositories/VoiceSessionRepository.h"
#include "logger/logger.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTimeZone>

ActivityStore::ActivityStore(VoiceSessionRepository* sessions, AggregateRepository* aggregates,
                             std::shared_ptr<Cache::FallbackCache> cache, QObject* parent)
    : QObject(parent)
    , m_sessions(sessions)
    , m_aggregates(aggregates)
    , m_cache(std::move(cache))
{
    m_postWriteHooks.append([this](const VoiceSessionModel& session) {
        return m_aggregates->applyRollup(session);
    });
    LOG_DEBUG("ActivityStore created");
}

ActivityStore::~ActivityStore()
{
    LOG_DEBUG("ActivityStore destroyed");
}

void ActivityStore::addPostWriteHook(const PostWriteHook& hook)
{
    m_postWriteHooks.append(hook);
}

QDate ActivityStore::dayOf(qint64 epochMs)
{
    return QDateTime::fromMSecsSinceEpoch(epochMs, QTimeZone::UTC).date();
}

QString ActivityStore::activityKey(const QString& guildId, const QString& userId, qint64 startMs, qint64 endMs)
{
    return QString("activity:%1:%2:%3:%4").arg(guildId, userId).arg(startMs).arg(endMs);
}

QString ActivityStore::activityKeySet(const QString& guildId, const QString& userId)
{
    return QString("activity_keys:%1:%2").arg(guildId, userId);
}

bool ActivityStore::recordCompletedSession(VoiceSessionModel* session, bool* inserted)
{
    if (inserted) {
        *inserted = false;
    }
    if (!session) {
        LOG_ERROR("Cannot record a null session");
        return false;
    }

    bool wasInserted = false;
    const bool success = m_sessions->executeInTransaction([this, session, &wasInserted]() {
        if (!m_sessions->insertIfAbsent(session, &wasInserted)) {
            return false;
        }
        if (!wasInserted) {
            return true;
        }
        for (const PostWriteHook& hook : m_postWriteHooks) {
            if (!hook(*session)) {
                LOG_ERROR(QString("Post-write hook failed for %1").arg(session->debugInfo()));
                return false;
            }
        }
        return true;
    });

    if (!success) {
        LOG_ERROR(QString("Failed to record completed session: %1").arg(session->debugInfo()));
        return false;
    }

    if (wasInserted) {
        invalidateUserActivity(session->guildId(), session->userId());
        emit sessionRecorded(session->guildId(), session->userId(), session->durationMs());
    }

    if (inserted) {
        *inserted = wasInserted;
    }
    return true;
}

qint64 ActivityStore::sequentialDailyTotal(const QString& userId, const QString& guildId,
                                           const QDate& from, const QDate& to, bool* ok)
{
    return m_aggregates->sumForUser(ActivityAggregateModel::Daily, userId, guildId, from, to, ok);
}

qint64 ActivityStore::queryRange(const QString& userId, const QString& guildId, qint64 startMs, qint64 endMs,
                                 bool* ok)
{
    if (ok) {
        *ok = false;
    }
    if (endMs < startMs) {
        LOG_WARNING(QString("Empty range requested for user %1: %2 > %3").arg(userId).arg(startMs).arg(endMs));
        if (ok) {
            *ok = true;
        }
        return 0;
    }

    const QDate from = dayOf(startMs);
    const QDate to = dayOf(endMs);
    const QList<QuerySegment> segments = TieredQueryRouter::plan(from, to);

    qint64 total = 0;
    bool routedOk = true;
    for (const QuerySegment& segment : segments) {
        bool segmentOk = false;
        total += m_aggregates->sumForUser(segment.granularity, userId, guildId, segment.from, segment.to, &segmentOk);
        if (!segmentOk) {
            LOG_WARNING(QString("Routed query %1 failed for user %2, falling back to daily rows")
                        .arg(segment.describe(), userId));
            routedOk = false;
            break;
        }
    }

    if (routedOk) {
        if (ok) {
            *ok = true;
        }
        return total;
    }

    emit queryFallbackUsed(guildId, 1);
    return sequentialDailyTotal(userId, guildId, from, to, ok);
}

QHash<QString, qint64> ActivityStore::queryBatch(const QStringList& userIds, const QString& guildId,
                                                 qint64 startMs, qint64 endMs, bool* ok)
{
    QHash<QString, qint64> totals;
    for (const QString& userId : userIds) {
        totals.insert(userId, 0);
    }
    if (ok) {
        *ok = true;
    }
    if (userIds.isEmpty() || endMs < startMs) {
        return totals;
    }

    const QDate from = dayOf(startMs);
    const QDate to = dayOf(endMs);
    const QList<QuerySegment> segments = TieredQueryRouter::plan(from, to);

    bool routedOk = true;
    for (const QuerySegment& segment : segments) {
        bool segmentOk = false;
        const QHash<QString, qint64> partial =
            m_aggregates->sumForUsers(segment.granularity, userIds, guildId, segment.from, segment.to, &segmentOk);
        if (!segmentOk) {
            LOG_WARNING(QString("Grouped query %1 failed for %2 users, falling back to sequential daily queries")
                        .arg(segment.describe()).arg(userIds.size()));
            routedOk = false;
            break;
        }
        for (auto it = partial.constBegin(); it != partial.constEnd(); ++it) {
            totals[it.key()] += it.value();
        }
    }

    if (routedOk) {
        return totals;
    }

    emit queryFallbackUsed(guildId, userIds.size());

    bool allOk = true;
    for (const QString& userId : userIds) {
        bool userOk = false;
        totals[userId] = sequentialDailyTotal(userId, guildId, from, to, &userOk);
        if (!userOk) {
            LOG_ERROR(QString("Sequential daily query failed for user %1 in guild %2").arg(userId, guildId));
            allOk = false;
        }
    }
    if (ok) {
        *ok = allOk;
    }
    return totals;
}

qint64 ActivityStore::getUserActivity(const QString& userId, const QString& guildId, qint64 startMs, qint64 endMs,
                                      bool* ok)
{
    if (ok) {
        *ok = false;
    }

    const QString key = activityKey(guildId, userId, startMs, endMs);

    std::optional<QByteArray> cached = m_cache->get(key);
    if (cached) {
        const QJsonDocument doc = QJsonDocument::fromJson(*cached);
        if (doc.isObject() && doc.object().contains("totalTimeMs")) {
            if (ok) {
                *ok = true;
            }
            return static_cast<qint64>(doc.object()["totalTimeMs"].toDouble());
        }
        LOG_WARNING(QString("Malformed activity snapshot under %1, reloading").arg(key));
        m_cache->remove(key);
    }

    bool loaded = false;
    const qint64 total = queryRange(userId, guildId, startMs, endMs, &loaded);
    if (!loaded) {
        return 0;
    }

    QJsonObject snapshot;
    snapshot["totalTimeMs"] = total;
    snapshot["cachedAt"] = QDateTime::currentMSecsSinceEpoch();
    m_cache->set(key, QJsonDocument(snapshot).toJson(QJsonDocument::Compact), ActivitySnapshotTtlSeconds);
    // The key list lives no longer than the newest snapshot it names
    const QString setKey = activityKeySet(guildId, userId);
    m_cache->addToSet(setKey, key);
    m_cache->expire(setKey, ActivitySnapshotTtlSeconds);

    if (ok) {
        *ok = true;
    }
    return total;
}

void ActivityStore::invalidateUserActivity(const QString& guildId, const QString& userId)
{
    const QString setKey = activityKeySet(guildId, userId);
    const QStringList keys = m_cache->setMembers(setKey);
    if (keys.isEmpty()) {
        return;
    }

    m_cache->invalidate(keys);
    for (const QString& key : keys) {
        m_cache->removeFromSet(setKey, key);
    }
    LOG_DEBUG(QString("Invalidated %1 activity snapshots for user %2 in guild %3").arg(keys.size()).arg(userId, guildId));
}

QList<DailyGuildStats> ActivityStore::dailyStats(const QString& guildId, int days, bool* ok)
{
    const int window = qBound(1, days, 366);
    const QDate since = QDateTime::currentDateTimeUtc().date().addDays(1 - window);
    return m_aggregates->dailyStats(guildId, since, ok);
}

bool ActivityStore::batchActivity(const QStringList& userIds, const QString& guildId,
                                  qint64 startMs, qint64 endMs, QHash<QString, qint64>& totals)
{
    bool ok = false;
    totals = queryBatch(userIds, guildId, startMs, endMs, &ok);
    return ok;
}
