#ifndef ACTIVITYSTORE_H
#define ACTIVITYSTORE_H

#include <QObject>
#include <QHash>
#include <QList>
#include <functional>
#include <memory>

#include "ActivitySource.h"
#include "TieredQueryRouter.h"
#include "Repositories/AggregateRepository.h"
#include "cache/fallbackcache.h"

class VoiceSessionModel;
class VoiceSessionRepository;

/**
 * @brief Durable session storage with tiered aggregate reads
 *
 * Completed sessions are inserted once per natural key and every new insert
 * runs the registered post-write hooks inside the same transaction. The default
 * hook is the daily/weekly/monthly rollup. Range reads are routed through
 * TieredQueryRouter and fall back to sequential per-user daily reads when a
 * routed query fails.
 */
class ActivityStore : public QObject, public ActivitySource
{
    Q_OBJECT
public:
    using PostWriteHook = std::function<bool(const VoiceSessionModel&)>;

    static constexpr int ActivitySnapshotTtlSeconds = 300;

    ActivityStore(VoiceSessionRepository* sessions, AggregateRepository* aggregates,
                  std::shared_ptr<Cache::FallbackCache> cache, QObject* parent = nullptr);
    ~ActivityStore() override;

    void addPostWriteHook(const PostWriteHook& hook);

    /**
     * @brief Persist a completed session and roll it up
     * @param inserted Set to false when the session was a replay and nothing changed
     * @return False when the write failed and was rolled back
     */
    bool recordCompletedSession(VoiceSessionModel* session, bool* inserted = nullptr);

    qint64 queryRange(const QString& userId, const QString& guildId, qint64 startMs, qint64 endMs,
                      bool* ok = nullptr);

    QHash<QString, qint64> queryBatch(const QStringList& userIds, const QString& guildId,
                                      qint64 startMs, qint64 endMs, bool* ok = nullptr);

    // queryRange behind the 5 minute activity snapshot cache
    qint64 getUserActivity(const QString& userId, const QString& guildId, qint64 startMs, qint64 endMs,
                           bool* ok = nullptr);

    QList<DailyGuildStats> dailyStats(const QString& guildId, int days, bool* ok = nullptr);

    bool batchActivity(const QStringList& userIds, const QString& guildId,
                       qint64 startMs, qint64 endMs, QHash<QString, qint64>& totals) override;

    void invalidateUserActivity(const QString& guildId, const QString& userId);

    static QDate dayOf(qint64 epochMs);
    static QString activityKey(const QString& guildId, const QString& userId, qint64 startMs, qint64 endMs);
    static QString activityKeySet(const QString& guildId, const QString& userId);

signals:
    void sessionRecorded(const QString& guildId, const QString& userId, qint64 durationMs);
    void queryFallbackUsed(const QString& guildId, int userCount);

private:
    qint64 sequentialDailyTotal(const QString& userId, const QString& guildId,
                                const QDate& from, const QDate& to, bool* ok);

    VoiceSessionRepository* m_sessions;
    AggregateRepository* m_aggregates;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    QList<PostWriteHook> m_postWriteHooks;
};

#endif // ACTIVITYSTORE_H
