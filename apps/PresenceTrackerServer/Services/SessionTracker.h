#ifndef SESSIONTRACKER_H
#define SESSIONTRACKER_H

#include <QObject>
#include <QQueue>
#include <QStringList>
#include <QJsonObject>
#include <functional>
#include <memory>
#include <optional>

#include "Models/PresenceTypes.h"
#include "cache/fallbackcache.h"

class ActivityStore;
class GuildSettingsService;

struct TrackingConfig {
    int sessionTtlSeconds = 86400;
    int staleSessionHours = 24;
    QStringList skipNameMarkers{QStringLiteral("[관전]"), QStringLiteral("[대기]")};
};

/**
 * @brief Maintains one active voice session per user and guild
 *
 * Transitions are classified from the old and new channel and applied against
 * the exclusion policy that is current when the transition arrives. Active
 * sessions live in the shared cache, which mirrors every write into process
 * memory, so a cache outage never interrupts tracking. Closing a session writes
 * it through ActivityStore.
 */
class SessionTracker : public QObject
{
    Q_OBJECT
public:
    using Clock = std::function<qint64()>;

    struct Statistics {
        qint64 totalJoins = 0;
        qint64 totalLeaves = 0;
        qint64 totalMoves = 0;
        int activeSessions = 0;
        int peakConcurrentUsers = 0;
        qint64 averageSessionTimeMs = 0;
        qint64 completedSessions = 0;
        qint64 uptimeMs = 0;

        QJsonObject toJson() const;
    };

    static constexpr const char* ActiveSessionSetKey = "active_voice_sessions";

    SessionTracker(ActivityStore* store, GuildSettingsService* settings,
                   std::shared_ptr<Cache::FallbackCache> cache,
                   const TrackingConfig& config = TrackingConfig(), QObject* parent = nullptr);
    ~SessionTracker() override;

    /**
     * @brief Apply one transition synchronously
     * @return The classified transition type
     */
    PresenceTypes::TransitionType onTransition(const PresenceTypes::TransitionEvent& event);

    // Queue a transition; queued events are applied in arrival order from the event loop
    void recordTransition(const PresenceTypes::TransitionEvent& event);

    /**
     * @brief Reload active sessions after a restart
     *
     * Sessions older than the staleness bound are discarded as abandoned.
     * @return Number of sessions kept
     */
    int restoreSessions(qint64 nowMs = -1);

    // Close every active session at nowMs, used on shutdown
    int closeAllSessions(qint64 nowMs = -1);

    std::optional<PresenceTypes::ActiveSession> activeSession(const QString& guildId, const QString& userId);
    QList<PresenceTypes::ActiveSession> activeSessions(const QString& guildId = QString());

    Statistics statistics();
    int pendingTransitions() const { return m_pending.size(); }

    void setClock(Clock clock);

    static QString sessionKey(const QString& guildId, const QString& userId);
    static QString sessionMember(const QString& guildId, const QString& userId);

signals:
    void sessionStarted(const PresenceTypes::ActiveSession& session);
    void sessionCompleted(const QString& guildId, const QString& userId, qint64 durationMs);
    void activityLogged(const PresenceTypes::TransitionEvent& event, PresenceTypes::TransitionType type);
    void transitionsProcessed(int count);

private slots:
    void drainPending();

private:
    bool startSession(const PresenceTypes::TransitionEvent& event);
    bool endSession(const QString& guildId, const QString& userId, qint64 nowMs);
    void dropSession(const QString& guildId, const QString& userId, const QString& reason);

    bool hasSkipMarker(const QString& displayName) const;
    bool storeSession(const PresenceTypes::ActiveSession& session, int ttlSeconds);
    int remainingTtlSeconds(const PresenceTypes::ActiveSession& session, qint64 nowMs) const;
    std::optional<PresenceTypes::ActiveSession> loadSession(const QString& key);
    qint64 now() const;

    ActivityStore* m_store;
    GuildSettingsService* m_settings;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    TrackingConfig m_config;
    Clock m_clock;

    QQueue<PresenceTypes::TransitionEvent> m_pending;
    bool m_drainScheduled;

    qint64 m_startedAtMs;
    qint64 m_totalJoins;
    qint64 m_totalLeaves;
    qint64 m_totalMoves;
    int m_activeCount;
    int m_peakConcurrent;
    qint64 m_completedSessions;
    qint64 m_totalSessionTimeMs;
};

#endif // SESSIONTRACKER_H
