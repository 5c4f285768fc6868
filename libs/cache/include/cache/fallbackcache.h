#pragma once

#include <QObject>
#include <QHash>
#include <QMutex>
#include <memory>
#include "cache/keyvaluestore.h"
#include "cache/localcache.h"

namespace Cache {

    /**
     * @brief Remote store decorated with an in-process mirror
     *
     * Writes go to the primary first and are always mirrored into the local
     * cache. Reads prefer the primary and fall through to the local cache on a
     * miss or on failure. Primary failures never reach the caller: after one,
     * the primary is skipped for the retry interval and then tried again.
     *
     * Writes, deletes and set changes that could not reach the primary are kept
     * per key, latest change wins, and replayed before the primary serves
     * anything again. Until the replay has finished every read is answered from
     * local memory.
     */
    class FallbackCache : public QObject, public KeyValueStore {
        Q_OBJECT
    public:
        using Loader = std::function<std::optional<QByteArray>()>;

        FallbackCache(std::shared_ptr<KeyValueStore> primary, int localMaxEntries = 10000,
                      int retryIntervalMs = 30000, QObject* parent = nullptr);
        ~FallbackCache() override;

        std::optional<QByteArray> get(const QString& key) override;
        void set(const QString& key, const QByteArray& value, int ttlSeconds) override;
        bool remove(const QString& key) override;
        bool expire(const QString& key, int ttlSeconds) override;
        void addToSet(const QString& setKey, const QString& member) override;
        void removeFromSet(const QString& setKey, const QString& member) override;
        QStringList setMembers(const QString& setKey) override;
        QString backendName() const override;

        /**
         * @brief Read-through helper
         *
         * Returns the cached value when present. Otherwise calls loader and, when
         * it yields a value, stores it with ttlSeconds before returning it.
         */
        std::optional<QByteArray> getOrLoad(const QString& key, int ttlSeconds, const Loader& loader);

        // Removes every key, logging failures, returns the number of keys that existed
        int invalidate(const QStringList& keys);

        // Local entries under this prefix are never evicted to make room
        void pinKeyPrefix(const QString& prefix);

        // Changes waiting to be replayed into the primary
        int pendingChanges() const;

        bool isPrimaryAvailable() const;
        bool hasPrimary() const { return static_cast<bool>(m_primary); }
        LocalCache& local() { return m_local; }

        void setClock(LocalCache::Clock clock);

    signals:
        void primaryAvailabilityChanged(bool available);

    private:
        bool primaryUsable();
        void markPrimaryFailed(const char* operation, const std::exception& ex);
        void markPrimaryHealthy();
        bool replayPending(QHash<QString, PendingValue> values, QHash<QString, QHash<QString, bool>> members,
                           QHash<QString, qint64> expiries);

        struct PendingValue {
            bool removed = false;
            QByteArray value;
            qint64 expiresAtMs = 0;
        };

        void queueValue(const QString& key, const PendingValue& change);
        void queueMember(const QString& setKey, const QString& member, bool present);
        void queueExpiry(const QString& key, qint64 expiresAtMs);

        std::shared_ptr<KeyValueStore> m_primary;
        LocalCache m_local;
        int m_retryIntervalMs;
        qint64 m_primaryRetryAtMs;
        bool m_primaryAvailable;
        LocalCache::Clock m_clock;
        mutable QMutex m_stateMutex;
        bool m_replaying;
        QHash<QString, PendingValue> m_pendingValues;
        QHash<QString, QHash<QString, bool>> m_pendingMembers;
        QHash<QString, qint64> m_pendingExpiry;
    };

} // namespace Cache
