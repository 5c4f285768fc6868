#pragma once

#include <QHash>
#include <QSet>
#include <QStringList>
#include <QMutex>
#include <functional>
#include "cache/keyvaluestore.h"

namespace Cache {

    /**
     * @brief Bounded in-process store with the same TTL semantics as the remote cache
     *
     * Expired entries are dropped lazily on access and eagerly when the store is
     * full. When no expired entry can be reclaimed the oldest insertion is evicted,
     * except for keys under a pinned prefix, which only leave by removal or expiry.
     * Sets may carry a lifetime of their own.
     */
    class LocalCache : public KeyValueStore {
    public:
        using Clock = std::function<qint64()>;

        struct Stats {
            qint64 hits = 0;
            qint64 misses = 0;
            qint64 evictions = 0;
            int entries = 0;
        };

        explicit LocalCache(int maxEntries = 10000);

        std::optional<QByteArray> get(const QString& key) override;
        void set(const QString& key, const QByteArray& value, int ttlSeconds) override;
        bool remove(const QString& key) override;
        bool expire(const QString& key, int ttlSeconds) override;
        void addToSet(const QString& setKey, const QString& member) override;
        void removeFromSet(const QString& setKey, const QString& member) override;
        QStringList setMembers(const QString& setKey) override;
        QString backendName() const override { return "local"; }

        // Remaining lifetime in ms, -1 for no expiry, nullopt when absent
        std::optional<qint64> remainingTtlMs(const QString& key);

        int purgeExpired();

        void pinKeyPrefix(const QString& prefix);
        bool isPinned(const QString& key) const;

        // Evicts oldest entries until at most targetEntries remain
        int shrinkTo(int targetEntries);

        void clear();
        int size() const;
        int setCount() const;
        int maxEntries() const { return m_maxEntries; }
        Stats stats() const;

        // Milliseconds since epoch, replaceable for tests
        void setClock(Clock clock);

    private:
        struct Entry {
            QByteArray value;
            qint64 insertedAtMs = 0;
            qint64 expiresAtMs = 0;
        };

        bool isExpired(const Entry& entry, qint64 nowMs) const;
        bool isPinnedLocked(const QString& key) const;
        bool setExpiredLocked(const QString& setKey, qint64 nowMs);
        int purgeExpiredLocked(qint64 nowMs);
        bool evictOldestLocked();

        int m_maxEntries;
        QHash<QString, Entry> m_entries;
        QHash<QString, QSet<QString>> m_sets;
        QHash<QString, qint64> m_setExpiry;
        QStringList m_pinnedPrefixes;
        mutable QMutex m_mutex;
        Clock m_clock;
        Stats m_stats;
    };

} // namespace Cache
