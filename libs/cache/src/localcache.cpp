#include "cache/localcache.h"
#include "logger/logger.h"
#include <QDateTime>

namespace Cache {

    LocalCache::LocalCache(int maxEntries)
        : m_maxEntries(qMax(1, maxEntries))
        , m_clock([]() { return QDateTime::currentMSecsSinceEpoch(); })
    {
    }

    void LocalCache::setClock(Clock clock) {
        QMutexLocker locker(&m_mutex);
        m_clock = std::move(clock);
    }

    void LocalCache::pinKeyPrefix(const QString& prefix) {
        QMutexLocker locker(&m_mutex);
        if (!prefix.isEmpty() && !m_pinnedPrefixes.contains(prefix)) {
            m_pinnedPrefixes.append(prefix);
        }
    }

    bool LocalCache::isPinned(const QString& key) const {
        QMutexLocker locker(&m_mutex);
        return isPinnedLocked(key);
    }

    bool LocalCache::isPinnedLocked(const QString& key) const {
        for (const QString& prefix : m_pinnedPrefixes) {
            if (key.startsWith(prefix)) {
                return true;
            }
        }
        return false;
    }

    bool LocalCache::isExpired(const Entry& entry, qint64 nowMs) const {
        return entry.expiresAtMs > 0 && entry.expiresAtMs <= nowMs;
    }

    bool LocalCache::setExpiredLocked(const QString& setKey, qint64 nowMs) {
        auto it = m_setExpiry.find(setKey);
        if (it == m_setExpiry.end() || it.value() > nowMs) {
            return false;
        }
        m_setExpiry.erase(it);
        m_sets.remove(setKey);
        return true;
    }

    std::optional<QByteArray> LocalCache::get(const QString& key) {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            ++m_stats.misses;
            return std::nullopt;
        }
        if (isExpired(it.value(), m_clock())) {
            m_entries.erase(it);
            ++m_stats.misses;
            return std::nullopt;
        }
        ++m_stats.hits;
        return it.value().value;
    }

    void LocalCache::set(const QString& key, const QByteArray& value, int ttlSeconds) {
        QMutexLocker locker(&m_mutex);
        const qint64 now = m_clock();

        if (!m_entries.contains(key) && m_entries.size() >= m_maxEntries) {
            if (purgeExpiredLocked(now) == 0 && !evictOldestLocked()) {
                LOG_WARNING(QString("Local cache over capacity (%1 entries), every entry is pinned").arg(m_entries.size()));
            }
        }

        Entry entry;
        entry.value = value;
        entry.insertedAtMs = now;
        entry.expiresAtMs = ttlSeconds > 0 ? now + static_cast<qint64>(ttlSeconds) * 1000 : 0;
        m_entries.insert(key, entry);
    }

    bool LocalCache::remove(const QString& key) {
        QMutexLocker locker(&m_mutex);
        m_setExpiry.remove(key);
        const bool hadSet = m_sets.remove(key) > 0;
        return m_entries.remove(key) > 0 || hadSet;
    }

    bool LocalCache::expire(const QString& key, int ttlSeconds) {
        QMutexLocker locker(&m_mutex);
        const qint64 now = m_clock();
        const qint64 expiresAtMs = now + static_cast<qint64>(qMax(0, ttlSeconds)) * 1000;

        bool found = false;
        auto it = m_entries.find(key);
        if (it != m_entries.end() && !isExpired(it.value(), now)) {
            it.value().expiresAtMs = expiresAtMs;
            found = true;
        }
        if (m_sets.contains(key) && !setExpiredLocked(key, now)) {
            m_setExpiry.insert(key, expiresAtMs);
            found = true;
        }
        return found;
    }

    void LocalCache::addToSet(const QString& setKey, const QString& member) {
        QMutexLocker locker(&m_mutex);
        setExpiredLocked(setKey, m_clock());
        m_sets[setKey].insert(member);
    }

    void LocalCache::removeFromSet(const QString& setKey, const QString& member) {
        QMutexLocker locker(&m_mutex);
        auto it = m_sets.find(setKey);
        if (it == m_sets.end()) {
            return;
        }
        it.value().remove(member);
        if (it.value().isEmpty()) {
            m_sets.erase(it);
            m_setExpiry.remove(setKey);
        }
    }

    QStringList LocalCache::setMembers(const QString& setKey) {
        QMutexLocker locker(&m_mutex);
        if (setExpiredLocked(setKey, m_clock())) {
            return QStringList();
        }
        QStringList members = m_sets.value(setKey).values();
        members.sort();
        return members;
    }

    std::optional<qint64> LocalCache::remainingTtlMs(const QString& key) {
        QMutexLocker locker(&m_mutex);
        auto it = m_entries.constFind(key);
        if (it == m_entries.constEnd()) {
            return std::nullopt;
        }
        const qint64 now = m_clock();
        if (isExpired(it.value(), now)) {
            return std::nullopt;
        }
        if (it.value().expiresAtMs == 0) {
            return -1;
        }
        return it.value().expiresAtMs - now;
    }

    int LocalCache::purgeExpired() {
        QMutexLocker locker(&m_mutex);
        return purgeExpiredLocked(m_clock());
    }

    int LocalCache::purgeExpiredLocked(qint64 nowMs) {
        int removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (isExpired(it.value(), nowMs)) {
                it = m_entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        for (auto it = m_setExpiry.begin(); it != m_setExpiry.end();) {
            if (it.value() <= nowMs) {
                m_sets.remove(it.key());
                it = m_setExpiry.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

    bool LocalCache::evictOldestLocked() {
        auto oldest = m_entries.end();
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            if (isPinnedLocked(it.key())) {
                continue;
            }
            if (oldest == m_entries.end() || it.value().insertedAtMs < oldest.value().insertedAtMs) {
                oldest = it;
            }
        }
        if (oldest == m_entries.end()) {
            return false;
        }
        LOG_DEBUG(QString("Local cache full, evicting %1").arg(oldest.key()));
        m_entries.erase(oldest);
        ++m_stats.evictions;
        return true;
    }

    int LocalCache::shrinkTo(int targetEntries) {
        QMutexLocker locker(&m_mutex);
        int removed = purgeExpiredLocked(m_clock());
        while (m_entries.size() > qMax(0, targetEntries) && evictOldestLocked()) {
            ++removed;
        }
        return removed;
    }

    void LocalCache::clear() {
        QMutexLocker locker(&m_mutex);
        m_entries.clear();
        m_sets.clear();
        m_setExpiry.clear();
    }

    int LocalCache::size() const {
        QMutexLocker locker(&m_mutex);
        return m_entries.size();
    }

    int LocalCache::setCount() const {
        QMutexLocker locker(&m_mutex);
        return m_sets.size();
    }

    LocalCache::Stats LocalCache::stats() const {
        QMutexLocker locker(&m_mutex);
        Stats snapshot = m_stats;
        snapshot.entries = m_entries.size();
        return snapshot;
    }

} // namespace Cache
