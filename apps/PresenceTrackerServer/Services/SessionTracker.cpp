#include "SessionTracker.h"
#include "ActivityStore.h"
#include "GuildSettingsService.h"
#include "Core/ModelFactory.h"
#include "Models/VoiceSessionModel.h"
#include "logger/logger.h"

#include <QDateTime>
#include <QJsonDocument>
#include <QScopedPointer>
#include <QTimer>

using PresenceTypes::ActiveSession;
using PresenceTypes::TransitionEvent;
using PresenceTypes::TransitionType;

QJsonObject SessionTracker::Statistics::toJson() const
{
    QJsonObject json;
    json["totalJoins"] = totalJoins;
    json["totalLeaves"] = totalLeaves;
    json["totalMoves"] = totalMoves;
    json["activeSessions"] = activeSessions;
    json["peakConcurrentUsers"] = peakConcurrentUsers;
    json["averageSessionTimeMs"] = averageSessionTimeMs;
    json["completedSessions"] = completedSessions;
    json["uptimeMs"] = uptimeMs;
    return json;
}

SessionTracker::SessionTracker(ActivityStore* store, GuildSettingsService* settings,
                               std::shared_ptr<Cache::FallbackCache> cache,
                               const TrackingConfig& config, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_settings(settings)
    , m_cache(std::move(cache))
    , m_config(config)
    , m_clock([]() { return QDateTime::currentMSecsSinceEpoch(); })
    , m_drainScheduled(false)
    , m_startedAtMs(QDateTime::currentMSecsSinceEpoch())
    , m_totalJoins(0)
    , m_totalLeaves(0)
    , m_totalMoves(0)
    , m_activeCount(0)
    , m_peakConcurrent(0)
    , m_completedSessions(0)
    , m_totalSessionTimeMs(0)
{
    // The local mirror is the only copy of a session while the shared cache is down
    m_cache->pinKeyPrefix(QStringLiteral("voice_session:"));

    LOG_INFO(QString("SessionTracker created (session TTL %1 s, stale after %2 h)")
            .arg(m_config.sessionTtlSeconds).arg(m_config.staleSessionHours));
}

SessionTracker::~SessionTracker()
{
    if (!m_pending.isEmpty()) {
        LOG_WARNING(QString("SessionTracker destroyed with %1 unprocessed transitions").arg(m_pending.size()));
    }
}

void SessionTracker::setClock(Clock clock)
{
    m_clock = std::move(clock);
    m_startedAtMs = m_clock();
}

qint64 SessionTracker::now() const
{
    return m_clock();
}

QString SessionTracker::sessionKey(const QString& guildId, const QString& userId)
{
    return QString("voice_session:%1:%2").arg(guildId, userId);
}

QString SessionTracker::sessionMember(const QString& guildId, const QString& userId)
{
    return QString("%1:%2").arg(guildId, userId);
}

bool SessionTracker::hasSkipMarker(const QString& displayName) const
{
    for (const QString& marker : m_config.skipNameMarkers) {
        if (!marker.isEmpty() && displayName.contains(marker)) {
            return true;
        }
    }
    return false;
}

TransitionType SessionTracker::onTransition(const TransitionEvent& event)
{
    const TransitionType type = event.type();

    if (event.userId.isEmpty() || event.guildId.isEmpty()) {
        LOG_WARNING("Ignoring transition without user or guild id");
        return TransitionType::Update;
    }

    if (type == TransitionType::Update) {
        LOG_DEBUG(QString("No channel change for user %1 in guild %2").arg(event.userId, event.guildId));
        return type;
    }

    TransitionEvent stamped = event;
    if (stamped.timestampMs <= 0) {
        stamped.timestampMs = now();
    }

    // Policy is read per transition so mid-session changes take effect immediately
    const ExclusionPolicy policy = m_settings->exclusionPolicy(stamped.guildId);
    const bool oldSilent = stamped.oldChannelId.isEmpty() || policy.isFullyExcluded(stamped.oldChannelId);
    const bool newSilent = stamped.newChannelId.isEmpty() || policy.isFullyExcluded(stamped.newChannelId);
    const bool newTracked = !stamped.newChannelId.isEmpty() && !policy.isExcluded(stamped.newChannelId);

    if (!(oldSilent && newSilent)) {
        emit activityLogged(stamped, type);
    }

    switch (type) {
        case TransitionType::Join:
            ++m_totalJoins;
            if (newTracked) {
                startSession(stamped);
            } else if (activeSession(stamped.guildId, stamped.userId)) {
                dropSession(stamped.guildId, stamped.userId, "joined an excluded channel with a stale session");
            }
            break;

        case TransitionType::Leave:
            ++m_totalLeaves;
            // Honored even when the session's channel became excluded after it started
            endSession(stamped.guildId, stamped.userId, stamped.timestampMs);
            break;

        case TransitionType::Move: {
            ++m_totalMoves;
            if (!newTracked) {
                endSession(stamped.guildId, stamped.userId, stamped.timestampMs);
                break;
            }

            const std::optional<ActiveSession> current = activeSession(stamped.guildId, stamped.userId);
            if (!current) {
                startSession(stamped);
            } else if (policy.isExcluded(current->channelId)) {
                endSession(stamped.guildId, stamped.userId, stamped.timestampMs);
                startSession(stamped);
            } else {
                // The clock keeps running; only the channel follows the user
                ActiveSession moved = *current;
                moved.channelId = stamped.newChannelId;
                storeSession(moved, remainingTtlSeconds(moved, stamped.timestampMs));
                LOG_DEBUG(QString("Session of user %1 continues in channel %2")
                         .arg(stamped.userId, stamped.newChannelId));
            }
            break;
        }

        case TransitionType::Update:
            break;
    }

    return type;
}

void SessionTracker::recordTransition(const TransitionEvent& event)
{
    m_pending.enqueue(event);
    if (!m_drainScheduled) {
        m_drainScheduled = true;
        QTimer::singleShot(0, this, &SessionTracker::drainPending);
    }
}

void SessionTracker::drainPending()
{
    m_drainScheduled = false;

    int processed = 0;
    while (!m_pending.isEmpty()) {
        const TransitionEvent event = m_pending.dequeue();
        onTransition(event);
        ++processed;
    }

    if (processed > 0) {
        emit transitionsProcessed(processed);
    }
}

bool SessionTracker::startSession(const TransitionEvent& event)
{
    if (hasSkipMarker(event.displayName)) {
        LOG_DEBUG(QString("Not tracking %1 (%2): display name carries a skip marker")
                 .arg(event.userId, event.displayName));
        return false;
    }

    ActiveSession session;
    const std::optional<ActiveSession> existing = activeSession(event.guildId, event.userId);
    if (existing) {
        // A leave was missed; restart the clock rather than accrue the gap
        session = *existing;
        LOG_INFO(QString("Reusing stale session of user %1 in guild %2 started at %3")
                .arg(event.userId, event.guildId).arg(existing->startTimeMs));
    } else {
        session.userId = event.userId;
        session.guildId = event.guildId;
    }
    session.channelId = event.newChannelId;
    session.startTimeMs = event.timestampMs;
    if (!event.displayName.isEmpty()) {
        session.displayName = event.displayName;
    }

    storeSession(session, m_config.sessionTtlSeconds);

    if (!existing) {
        ++m_activeCount;
        m_peakConcurrent = qMax(m_peakConcurrent, m_activeCount);
    }

    LOG_DEBUG(QString("Session started for user %1 in guild %2, channel %3")
             .arg(session.userId, session.guildId, session.channelId));
    emit sessionStarted(session);
    return true;
}

bool SessionTracker::endSession(const QString& guildId, const QString& userId, qint64 nowMs)
{
    const std::optional<ActiveSession> session = activeSession(guildId, userId);
    if (!session) {
        LOG_DEBUG(QString("No active session to close for user %1 in guild %2").arg(userId, guildId));
        return false;
    }

    QScopedPointer<VoiceSessionModel> completed(ModelFactory::createCompletedSession(*session, nowMs));
    const qint64 durationMs = completed->durationMs();

    if (!m_store->recordCompletedSession(completed.data())) {
        LOG_ERROR(QString("Completed session could not be stored, it is lost: %1").arg(completed->debugInfo()));
    }

    m_cache->remove(sessionKey(guildId, userId));
    m_cache->removeFromSet(ActiveSessionSetKey, sessionMember(guildId, userId));
    m_activeCount = qMax(0, m_activeCount - 1);

    ++m_completedSessions;
    m_totalSessionTimeMs += durationMs;

    LOG_INFO(QString("Session closed for user %1 in guild %2 after %3 ms").arg(userId, guildId).arg(durationMs));
    emit sessionCompleted(guildId, userId, durationMs);
    return true;
}

void SessionTracker::dropSession(const QString& guildId, const QString& userId, const QString& reason)
{
    m_cache->remove(sessionKey(guildId, userId));
    m_cache->removeFromSet(ActiveSessionSetKey, sessionMember(guildId, userId));
    m_activeCount = qMax(0, m_activeCount - 1);
    LOG_INFO(QString("Dropped session of user %1 in guild %2: %3").arg(userId, guildId, reason));
}

int SessionTracker::remainingTtlSeconds(const ActiveSession& session, qint64 nowMs) const
{
    const qint64 ageSeconds = qMax<qint64>(0, nowMs - session.startTimeMs) / 1000;
    return static_cast<int>(qMax<qint64>(1, m_config.sessionTtlSeconds - ageSeconds));
}

bool SessionTracker::storeSession(const ActiveSession& session, int ttlSeconds)
{
    const QByteArray payload = QJsonDocument(session.toJson()).toJson(QJsonDocument::Compact);
    m_cache->set(sessionKey(session.guildId, session.userId), payload, ttlSeconds);
    m_cache->addToSet(ActiveSessionSetKey, sessionMember(session.guildId, session.userId));
    return true;
}

std::optional<ActiveSession> SessionTracker::loadSession(const QString& key)
{
    const std::optional<QByteArray> raw = m_cache->get(key);
    if (!raw) {
        return std::nullopt;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(*raw);
    ActiveSession session;
    if (!doc.isObject() || !ActiveSession::fromJson(doc.object(), session)) {
        LOG_WARNING(QString("Malformed active session record under %1, discarding").arg(key));
        m_cache->remove(key);
        return std::nullopt;
    }
    return session;
}

std::optional<ActiveSession> SessionTracker::activeSession(const QString& guildId, const QString& userId)
{
    return loadSession(sessionKey(guildId, userId));
}

QList<ActiveSession> SessionTracker::activeSessions(const QString& guildId)
{
    QList<ActiveSession> sessions;
    const QStringList members = m_cache->setMembers(ActiveSessionSetKey);
    for (const QString& member : members) {
        const int separator = member.indexOf(':');
        if (separator <= 0) {
            continue;
        }
        const QString memberGuild = member.left(separator);
        if (!guildId.isEmpty() && memberGuild != guildId) {
            continue;
        }
        const std::optional<ActiveSession> session = activeSession(memberGuild, member.mid(separator + 1));
        if (session) {
            sessions.append(*session);
        }
    }
    return sessions;
}

int SessionTracker::restoreSessions(qint64 nowMs)
{
    const qint64 current = nowMs >= 0 ? nowMs : now();
    const qint64 staleAfterMs = static_cast<qint64>(m_config.staleSessionHours) * 60 * 60 * 1000;

    const QStringList members = m_cache->setMembers(ActiveSessionSetKey);
    int kept = 0;
    int discarded = 0;

    for (const QString& member : members) {
        const int separator = member.indexOf(':');
        if (separator <= 0) {
            LOG_WARNING(QString("Malformed active session member '%1', removing").arg(member));
            m_cache->removeFromSet(ActiveSessionSetKey, member);
            ++discarded;
            continue;
        }

        const QString guildId = member.left(separator);
        const QString userId = member.mid(separator + 1);
        const std::optional<ActiveSession> session = activeSession(guildId, userId);
        if (!session) {
            m_cache->removeFromSet(ActiveSessionSetKey, member);
            ++discarded;
            continue;
        }

        const qint64 ageMs = current - session->startTimeMs;
        if (ageMs > staleAfterMs) {
            dropSession(guildId, userId, QString("abandoned %1 h ago").arg(ageMs / 3600000));
            ++discarded;
            continue;
        }

        // Rewriting mirrors the session into local memory with its remaining lifetime
        storeSession(*session, remainingTtlSeconds(*session, current));
        ++kept;
    }

    m_activeCount = kept;
    m_peakConcurrent = qMax(m_peakConcurrent, kept);
    LOG_INFO(QString("Restored %1 active sessions, discarded %2").arg(kept).arg(discarded));
    return kept;
}

int SessionTracker::closeAllSessions(qint64 nowMs)
{
    const qint64 current = nowMs >= 0 ? nowMs : now();

    int closed = 0;
    const QList<ActiveSession> sessions = activeSessions();
    for (const ActiveSession& session : sessions) {
        if (endSession(session.guildId, session.userId, current)) {
            ++closed;
        }
    }

    LOG_INFO(QString("Closed %1 active sessions").arg(closed));
    return closed;
}

SessionTracker::Statistics SessionTracker::statistics()
{
    Statistics stats;
    stats.totalJoins = m_totalJoins;
    stats.totalLeaves = m_totalLeaves;
    stats.totalMoves = m_totalMoves;
    stats.activeSessions = m_activeCount;
    stats.peakConcurrentUsers = m_peakConcurrent;
    stats.completedSessions = m_completedSessions;
    stats.averageSessionTimeMs = m_completedSessions > 0 ? m_totalSessionTimeMs / m_completedSessions : 0;
    stats.uptimeMs = now() - m_startedAtMs;
    return stats;
}
