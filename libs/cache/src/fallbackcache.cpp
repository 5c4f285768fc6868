#include "cache/fallbackcache.h"
#include "logger/logger.h"
#include <QDateTime>
#include <QSet>
#include <functional>

namespace Cache {

    namespace {

        int secondsUntil(qint64 expiresAtMs, qint64 nowMs) {
            return static_cast<int>(qMax<qint64>(1, (expiresAtMs - nowMs + 999) / 1000));
        }

    } // namespace

    FallbackCache::FallbackCache(std::shared_ptr<KeyValueStore> primary, int localMaxEntries,
                                 int retryIntervalMs, QObject* parent)
        : QObject(parent)
        , m_primary(std::move(primary))
        , m_local(localMaxEntries)
        , m_retryIntervalMs(qMax(0, retryIntervalMs))
        , m_primaryRetryAtMs(0)
        , m_primaryAvailable(static_cast<bool>(m_primary))
        , m_clock([]() { return QDateTime::currentMSecsSinceEpoch(); })
        , m_replaying(false)
    {
        LOG_INFO(QString("FallbackCache created (primary: %1, local capacity: %2)")
                 .arg(m_primary ? m_primary->backendName() : QString("none"))
                 .arg(localMaxEntries));
    }

    FallbackCache::~FallbackCache() {
        const int pending = pendingChanges();
        if (pending > 0) {
            LOG_WARNING(QString("FallbackCache destroyed with %1 changes never replayed to the primary").arg(pending));
        }
        LOG_DEBUG("FallbackCache destroyed");
    }

    void FallbackCache::setClock(LocalCache::Clock clock) {
        {
            QMutexLocker locker(&m_stateMutex);
            m_clock = clock;
        }
        m_local.setClock(std::move(clock));
    }

    void FallbackCache::pinKeyPrefix(const QString& prefix) {
        m_local.pinKeyPrefix(prefix);
    }

    int FallbackCache::pendingChanges() const {
        QMutexLocker locker(&m_stateMutex);
        int count = m_pendingValues.size() + m_pendingExpiry.size();
        for (const auto& members : m_pendingMembers) {
            count += members.size();
        }
        return count;
    }

    QString FallbackCache::backendName() const {
        if (isPrimaryAvailable()) {
            return QString("%1+local").arg(m_primary->backendName());
        }
        return "local";
    }

    bool FallbackCache::isPrimaryAvailable() const {
        QMutexLocker locker(&m_stateMutex);
        return m_primary && m_primaryAvailable;
    }

    bool FallbackCache::primaryUsable() {
        if (!m_primary) {
            return false;
        }

        QHash<QString, PendingValue> values;
        QHash<QString, QHash<QString, bool>> members;
        QHash<QString, qint64> expiries;
        {
            QMutexLocker locker(&m_stateMutex);
            // While another caller replays, the primary may still hold state that was changed locally
            if (m_replaying) {
                return false;
            }
            if (!m_primaryAvailable && m_clock() < m_primaryRetryAtMs) {
                return false;
            }
            if (m_pendingValues.isEmpty() && m_pendingMembers.isEmpty() && m_pendingExpiry.isEmpty()) {
                return true;
            }
            m_replaying = true;
            values.swap(m_pendingValues);
            members.swap(m_pendingMembers);
            expiries.swap(m_pendingExpiry);
        }

        const bool replayed = replayPending(std::move(values), std::move(members), std::move(expiries));

        QMutexLocker locker(&m_stateMutex);
        m_replaying = false;
        return replayed;
    }

    bool FallbackCache::replayPending(QHash<QString, PendingValue> values,
                                      QHash<QString, QHash<QString, bool>> members,
                                      QHash<QString, qint64> expiries) {
        qint64 now = 0;
        {
            QMutexLocker locker(&m_stateMutex);
            now = m_clock();
        }

        // Protocol errors drop the single change, transport errors stop the replay
        auto apply = [](const QString& key, const std::function<void()>& change) {
            try {
                change();
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected replayed change to %1, dropping it: %2")
                            .arg(key, QString::fromUtf8(ex.what())));
            }
        };

        int replayed = 0;
        try {
            for (auto it = values.begin(); it != values.end();) {
                const QString key = it.key();
                const PendingValue change = it.value();
                if (change.removed || (change.expiresAtMs > 0 && change.expiresAtMs <= now)) {
                    apply(key, [this, &key]() { m_primary->remove(key); });
                } else {
                    const int ttlSeconds = change.expiresAtMs > 0 ? secondsUntil(change.expiresAtMs, now) : 0;
                    apply(key, [this, &key, &change, ttlSeconds]() { m_primary->set(key, change.value, ttlSeconds); });
                }
                it = values.erase(it);
                ++replayed;
            }

            for (auto setIt = members.begin(); setIt != members.end();) {
                const QString setKey = setIt.key();
                QHash<QString, bool>& changes = setIt.value();
                for (auto it = changes.begin(); it != changes.end();) {
                    const QString member = it.key();
                    if (it.value()) {
                        apply(setKey, [this, &setKey, &member]() { m_primary->addToSet(setKey, member); });
                    } else {
                        apply(setKey, [this, &setKey, &member]() { m_primary->removeFromSet(setKey, member); });
                    }
                    it = changes.erase(it);
                    ++replayed;
                }
                setIt = members.erase(setIt);
            }

            for (auto it = expiries.begin(); it != expiries.end();) {
                const QString key = it.key();
                const qint64 expiresAtMs = it.value();
                if (expiresAtMs > now) {
                    apply(key, [this, &key, expiresAtMs, now]() { m_primary->expire(key, secondsUntil(expiresAtMs, now)); });
                } else {
                    apply(key, [this, &key]() { m_primary->remove(key); });
                }
                it = expiries.erase(it);
                ++replayed;
            }
        }
        catch (const CacheUnavailableError& ex) {
            {
                // Anything changed again while replaying is newer than what is put back
                QMutexLocker locker(&m_stateMutex);
                for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
                    if (!m_pendingValues.contains(it.key())) {
                        m_pendingValues.insert(it.key(), it.value());
                    }
                }
                for (auto setIt = members.constBegin(); setIt != members.constEnd(); ++setIt) {
                    QHash<QString, bool>& pending = m_pendingMembers[setIt.key()];
                    for (auto it = setIt.value().constBegin(); it != setIt.value().constEnd(); ++it) {
                        if (!pending.contains(it.key())) {
                            pending.insert(it.key(), it.value());
                        }
                    }
                }
                for (auto it = expiries.constBegin(); it != expiries.constEnd(); ++it) {
                    if (!m_pendingExpiry.contains(it.key())) {
                        m_pendingExpiry.insert(it.key(), it.value());
                    }
                }
            }
            LOG_WARNING(QString("Replay to primary cache interrupted after %1 changes").arg(replayed));
            markPrimaryFailed("replay", ex);
            return false;
        }

        LOG_INFO(QString("Replayed %1 changes made while the primary cache was unavailable").arg(replayed));
        markPrimaryHealthy();
        return true;
    }

    void FallbackCache::queueValue(const QString& key, const PendingValue& change) {
        if (!m_primary) {
            return;
        }
        QMutexLocker locker(&m_stateMutex);
        m_pendingValues.insert(key, change);
        // A newer value carries its own lifetime
        m_pendingExpiry.remove(key);
    }

    void FallbackCache::queueMember(const QString& setKey, const QString& member, bool present) {
        if (!m_primary) {
            return;
        }
        QMutexLocker locker(&m_stateMutex);
        m_pendingMembers[setKey].insert(member, present);
    }

    void FallbackCache::queueExpiry(const QString& key, qint64 expiresAtMs) {
        if (!m_primary) {
            return;
        }
        QMutexLocker locker(&m_stateMutex);
        m_pendingExpiry.insert(key, expiresAtMs);
    }

    void FallbackCache::markPrimaryFailed(const char* operation, const std::exception& ex) {
        bool changed = false;
        {
            QMutexLocker locker(&m_stateMutex);
            m_primaryRetryAtMs = m_clock() + m_retryIntervalMs;
            changed = m_primaryAvailable;
            m_primaryAvailable = false;
        }
        if (changed) {
            LOG_WARNING(QString("Primary cache unavailable during %1, using local memory: %2")
                        .arg(QString::fromLatin1(operation), QString::fromUtf8(ex.what())));
            emit primaryAvailabilityChanged(false);
        } else {
            LOG_DEBUG(QString("Primary cache still unavailable during %1: %2").arg(QString::fromLatin1(operation), QString::fromUtf8(ex.what())));
        }
    }

    void FallbackCache::markPrimaryHealthy() {
        bool changed = false;
        {
            QMutexLocker locker(&m_stateMutex);
            changed = !m_primaryAvailable;
            m_primaryAvailable = true;
        }
        if (changed) {
            LOG_INFO("Primary cache available again");
            emit primaryAvailabilityChanged(true);
        }
    }

    std::optional<QByteArray> FallbackCache::get(const QString& key) {
        if (primaryUsable()) {
            try {
                std::optional<QByteArray> value = m_primary->get(key);
                markPrimaryHealthy();
                if (value) {
                    return value;
                }
            }
            catch (const CacheUnavailableError& ex) {
                markPrimaryFailed("get", ex);
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected get %1: %2").arg(key, QString::fromUtf8(ex.what())));
            }
        }
        return m_local.get(key);
    }

    void FallbackCache::set(const QString& key, const QByteArray& value, int ttlSeconds) {
        bool reached = false;
        if (primaryUsable()) {
            try {
                m_primary->set(key, value, ttlSeconds);
                markPrimaryHealthy();
                reached = true;
            }
            catch (const CacheUnavailableError& ex) {
                markPrimaryFailed("set", ex);
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected set %1: %2").arg(key, QString::fromUtf8(ex.what())));
                reached = true;
            }
        }
        if (!reached) {
            PendingValue change;
            change.value = value;
            if (ttlSeconds > 0) {
                QMutexLocker locker(&m_stateMutex);
                change.expiresAtMs = m_clock() + static_cast<qint64>(ttlSeconds) * 1000;
            }
            queueValue(key, change);
        }
        m_local.set(key, value, ttlSeconds);
    }

    bool FallbackCache::remove(const QString& key) {
        bool existed = false;
        bool reached = false;
        if (primaryUsable()) {
            try {
                existed = m_primary->remove(key);
                markPrimaryHealthy();
                reached = true;
            }
            catch (const CacheUnavailableError& ex) {
                markPrimaryFailed("remove", ex);
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected remove %1: %2").arg(key, QString::fromUtf8(ex.what())));
                reached = true;
            }
        }
        if (!reached) {
            PendingValue tombstone;
            tombstone.removed = true;
            queueValue(key, tombstone);
        }
        return m_local.remove(key) || existed;
    }

    bool FallbackCache::expire(const QString& key, int ttlSeconds) {
        bool existed = false;
        bool reached = false;
        if (primaryUsable()) {
            try {
                existed = m_primary->expire(key, ttlSeconds);
                markPrimaryHealthy();
                reached = true;
            }
            catch (const CacheUnavailableError& ex) {
                markPrimaryFailed("expire", ex);
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected expire %1: %2").arg(key, QString::fromUtf8(ex.what())));
                reached = true;
            }
        }
        if (!reached) {
            qint64 expiresAtMs = 0;
            {
                QMutexLocker locker(&m_stateMutex);
                expiresAtMs = m_clock() + static_cast<qint64>(qMax(0, ttlSeconds)) * 1000;
            }
            queueExpiry(key, expiresAtMs);
        }
        return m_local.expire(key, ttlSeconds) || existed;
    }

    void FallbackCache::addToSet(const QString& setKey, const QString& member) {
        bool reached = false;
        if (primaryUsable()) {
            try {
                m_primary->addToSet(setKey, member);
                markPrimaryHealthy();
                reached = true;
            }
            catch (const CacheUnavailableError& ex) {
                markPrimaryFailed("addToSet", ex);
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected addToSet %1: %2").arg(setKey, QString::fromUtf8(ex.what())));
                reached = true;
            }
        }
        if (!reached) {
            queueMember(setKey, member, true);
        }
        m_local.addToSet(setKey, member);
    }

    void FallbackCache::removeFromSet(const QString& setKey, const QString& member) {
        bool reached = false;
        if (primaryUsable()) {
            try {
                m_primary->removeFromSet(setKey, member);
                markPrimaryHealthy();
                reached = true;
            }
            catch (const CacheUnavailableError& ex) {
                markPrimaryFailed("removeFromSet", ex);
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected removeFromSet %1: %2").arg(setKey, QString::fromUtf8(ex.what())));
                reached = true;
            }
        }
        if (!reached) {
            queueMember(setKey, member, false);
        }
        m_local.removeFromSet(setKey, member);
    }

    QStringList FallbackCache::setMembers(const QString& setKey) {
        QSet<QString> members;
        if (primaryUsable()) {
            try {
                const QStringList remote = m_primary->setMembers(setKey);
                markPrimaryHealthy();
                for (const QString& member : remote) {
                    members.insert(member);
                }
            }
            catch (const CacheUnavailableError& ex) {
                markPrimaryFailed("setMembers", ex);
            }
            catch (const CacheProtocolError& ex) {
                LOG_WARNING(QString("Primary cache rejected setMembers %1: %2").arg(setKey, QString::fromUtf8(ex.what())));
            }
        }
        // Members written while the primary was down only exist locally
        for (const QString& member : m_local.setMembers(setKey)) {
            members.insert(member);
        }
        QStringList result = members.values();
        result.sort();
        return result;
    }

    std::optional<QByteArray> FallbackCache::getOrLoad(const QString& key, int ttlSeconds, const Loader& loader) {
        std::optional<QByteArray> cached = get(key);
        if (cached) {
            return cached;
        }

        std::optional<QByteArray> loaded = loader();
        if (loaded) {
            set(key, *loaded, ttlSeconds);
        }
        return loaded;
    }

    int FallbackCache::invalidate(const QStringList& keys) {
        int removed = 0;
        for (const QString& key : keys) {
            if (remove(key)) {
                ++removed;
            }
        }
        LOG_DEBUG(QString("Invalidated %1 of %2 cache keys").arg(removed).arg(keys.size()));
        return removed;
    }

} // namespace Cache
