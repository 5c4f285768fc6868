#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTimeZone>

#include "Services/SessionTracker.h"
#include "Services/ActivityStore.h"
#include "Services/GuildSettingsService.h"
#include "Repositories/VoiceSessionRepository.h"
#include "Repositories/AggregateRepository.h"
#include "Repositories/GuildSettingsRepository.h"
#include "Models/VoiceSessionModel.h"
#include "Models/GuildSettingModel.h"
#include "TestSupport.h"

using PresenceTypes::TransitionEvent;
using PresenceTypes::TransitionType;

namespace {

const qint64 Minute = 60LL * 1000;
const qint64 Hour = 60 * Minute;

TransitionEvent transition(const QString& userId, const QString& oldChannel, const QString& newChannel,
                           qint64 timestampMs, const QString& displayName = QString())
{
    TransitionEvent event;
    event.userId = userId;
    event.guildId = "g1";
    event.oldChannelId = oldChannel;
    event.newChannelId = newChannel;
    event.timestampMs = timestampMs;
    event.displayName = displayName;
    return event;
}

}

class SessionTrackerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        quietTestLogging();
        qRegisterMetaType<PresenceTypes::TransitionEvent>();
        qRegisterMetaType<PresenceTypes::ActiveSession>();
        qRegisterMetaType<PresenceTypes::TransitionType>();
    }

    void init() {
        m_db.reset(new SqliteTestDatabase());
        QVERIFY(m_db->open());

        m_sessions = new VoiceSessionRepository();
        m_aggregates = new AggregateRepository();
        m_settingsRepository = new GuildSettingsRepository();
        QVERIFY(m_sessions->initialize(&DbManager::instance().getService<VoiceSessionModel>()));
        QVERIFY(m_aggregates->initialize(&DbManager::instance().getService<ActivityAggregateModel>()));
        QVERIFY(m_settingsRepository->initialize(&DbManager::instance().getService<GuildSettingModel>()));

        m_primary = std::make_shared<FakeKeyValueStore>();
        m_cache = std::make_shared<Cache::FallbackCache>(m_primary, 1000, 30000);
        m_store = new ActivityStore(m_sessions, m_aggregates, m_cache);
        m_settings = new GuildSettingsService(m_settingsRepository, m_cache);

        m_now = QDateTime(QDate(2024, 6, 3), QTime(12, 0), QTimeZone::UTC).toMSecsSinceEpoch();
        m_tracker = createTracker(m_cache);
    }

    void cleanup() {
        delete m_tracker;
        delete m_settings;
        delete m_store;
        delete m_settingsRepository;
        delete m_aggregates;
        delete m_sessions;
        m_cache.reset();
        m_primary.reset();
        m_db.reset();
    }

    void testJoinThenLeaveRecordsSession() {
        QSignalSpy startedSpy(m_tracker, &SessionTracker::sessionStarted);
        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);

        QCOMPARE(m_tracker->onTransition(transition("u1", "", "c1", m_now)), TransitionType::Join);
        QCOMPARE(startedSpy.count(), 1);
        QVERIFY(m_tracker->activeSession("g1", "u1").has_value());

        QCOMPARE(m_tracker->onTransition(transition("u1", "c1", "", m_now + Hour)), TransitionType::Leave);
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(completedSpy.at(0).at(2).toLongLong(), Hour);
        QVERIFY(!m_tracker->activeSession("g1", "u1").has_value());
        QCOMPARE(totalFor("u1"), Hour);
    }

    void testMoveBetweenTrackedChannelsContinuesSession() {
        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);

        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        QCOMPARE(m_tracker->onTransition(transition("u1", "c1", "c2", m_now + 20 * Minute)), TransitionType::Move);
        QCOMPARE(completedSpy.count(), 0);

        const auto moved = m_tracker->activeSession("g1", "u1");
        QVERIFY(moved.has_value());
        QCOMPARE(moved->startTimeMs, m_now);
        QCOMPARE(moved->channelId, QString("c2"));

        m_tracker->onTransition(transition("u1", "c2", "", m_now + Hour));
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(totalFor("u1"), Hour);

        const auto rows = m_sessions->getByUser("g1", "u1", m_now - Hour, m_now + 2 * Hour);
        QCOMPARE(rows.size(), 1);
        QCOMPARE(rows.first()->channelId(), QString("c2"));
    }

    void testExcludingLeftChannelKeepsSession() {
        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);
        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        m_tracker->onTransition(transition("u1", "c1", "c2", m_now + 10 * Minute));

        // c1 is behind the user, so excluding it does not split the session
        ExclusionPolicy policy;
        policy.activityLimited.insert("c1");
        QVERIFY(m_settings->setExclusionPolicy("g1", policy));

        m_tracker->onTransition(transition("u1", "c2", "c3", m_now + 20 * Minute));
        QCOMPARE(completedSpy.count(), 0);
        QCOMPARE(m_tracker->activeSession("g1", "u1")->startTimeMs, m_now);
        QCOMPARE(m_tracker->activeSession("g1", "u1")->channelId, QString("c3"));
    }

    void testUpdateWithoutChannelChangeIsIgnored() {
        QSignalSpy loggedSpy(m_tracker, &SessionTracker::activityLogged);
        QCOMPARE(m_tracker->onTransition(transition("u1", "c1", "c1", m_now)), TransitionType::Update);
        QCOMPARE(loggedSpy.count(), 0);
        QVERIFY(!m_tracker->activeSession("g1", "u1").has_value());
    }

    void testExcludedChannelsAreNotTracked() {
        ExclusionPolicy policy;
        policy.fullyExcluded.insert("afk");
        policy.activityLimited.insert("music");
        QVERIFY(m_settings->setExclusionPolicy("g1", policy));

        QSignalSpy loggedSpy(m_tracker, &SessionTracker::activityLogged);

        m_tracker->onTransition(transition("u1", "", "afk", m_now));
        QVERIFY(!m_tracker->activeSession("g1", "u1").has_value());
        QCOMPARE(loggedSpy.count(), 0);

        m_tracker->onTransition(transition("u2", "", "music", m_now));
        QVERIFY(!m_tracker->activeSession("g1", "u2").has_value());
        QCOMPARE(loggedSpy.count(), 1);
    }

    void testMoveIntoExcludedChannelEndsSession() {
        ExclusionPolicy policy;
        policy.fullyExcluded.insert("afk");
        QVERIFY(m_settings->setExclusionPolicy("g1", policy));

        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);
        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        m_tracker->onTransition(transition("u1", "c1", "afk", m_now + 30 * Minute));

        QCOMPARE(completedSpy.count(), 1);
        QVERIFY(!m_tracker->activeSession("g1", "u1").has_value());
        QCOMPARE(totalFor("u1"), 30 * Minute);
    }

    void testExclusionChangedMidSession() {
        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);
        m_tracker->onTransition(transition("u1", "", "c1", m_now));

        ExclusionPolicy policy;
        policy.activityLimited.insert("c1");
        QVERIFY(m_settings->setExclusionPolicy("g1", policy));

        // The session in a now-excluded channel closes and a fresh one opens in c2
        m_tracker->onTransition(transition("u1", "c1", "c2", m_now + 10 * Minute));
        QCOMPARE(completedSpy.count(), 1);
        const auto current = m_tracker->activeSession("g1", "u1");
        QVERIFY(current.has_value());
        QCOMPARE(current->channelId, QString("c2"));
        QCOMPARE(current->startTimeMs, m_now + 10 * Minute);

        // A leave from an excluded channel still closes the session
        m_tracker->onTransition(transition("u2", "", "c3", m_now));
        policy.activityLimited.insert("c3");
        QVERIFY(m_settings->setExclusionPolicy("g1", policy));
        m_tracker->onTransition(transition("u2", "c3", "", m_now + 5 * Minute));
        QCOMPARE(completedSpy.count(), 2);
        QCOMPARE(totalFor("u2"), 5 * Minute);
    }

    void testJoinIntoExcludedChannelDropsStaleSession() {
        m_tracker->onTransition(transition("u1", "", "c1", m_now));

        ExclusionPolicy policy;
        policy.fullyExcluded.insert("afk");
        QVERIFY(m_settings->setExclusionPolicy("g1", policy));

        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);
        m_tracker->onTransition(transition("u1", "", "afk", m_now + Hour));

        QCOMPARE(completedSpy.count(), 0);
        QVERIFY(!m_tracker->activeSession("g1", "u1").has_value());
        QCOMPARE(totalFor("u1"), qint64(0));
    }

    void testRepeatedJoinRestartsClock() {
        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        m_tracker->onTransition(transition("u1", "", "c2", m_now + Hour));

        const auto current = m_tracker->activeSession("g1", "u1");
        QVERIFY(current.has_value());
        QCOMPARE(current->startTimeMs, m_now + Hour);
        QCOMPARE(current->channelId, QString("c2"));
        QCOMPARE(m_tracker->activeSessions("g1").size(), 1);
    }

    void testSkipMarkerBlocksStartOnly() {
        QSignalSpy startedSpy(m_tracker, &SessionTracker::sessionStarted);

        m_tracker->onTransition(transition("u1", "", "c1", m_now, QStringLiteral("[관전] Spectator")));
        QCOMPARE(startedSpy.count(), 0);
        QVERIFY(!m_tracker->activeSession("g1", "u1").has_value());

        // A marker picked up mid-session does not interrupt the running session
        m_tracker->onTransition(transition("u2", "", "c1", m_now, "Player"));
        m_tracker->onTransition(transition("u2", "c1", "c2", m_now + Minute, QStringLiteral("[대기] Player")));
        QVERIFY(m_tracker->activeSession("g1", "u2").has_value());
        QCOMPARE(startedSpy.count(), 1);
    }

    void testTrackingSurvivesCacheOutage() {
        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        m_primary->setAvailable(false);

        m_tracker->onTransition(transition("u2", "", "c1", m_now + Minute));
        QCOMPARE(m_tracker->activeSessions("g1").size(), 2);
        QVERIFY(!m_cache->isPrimaryAvailable());

        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);
        m_tracker->onTransition(transition("u1", "c1", "", m_now + Hour));
        m_tracker->onTransition(transition("u2", "c1", "", m_now + Hour));

        QCOMPARE(completedSpy.count(), 2);
        QCOMPARE(totalFor("u1"), Hour);
        QCOMPARE(totalFor("u2"), Hour - Minute);
        QVERIFY(m_tracker->activeSessions().isEmpty());
    }

    void testSessionClosedDuringOutageStaysClosed() {
        m_cache->setClock([this]() { return m_now; });

        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        QVERIFY(m_primary->contains(SessionTracker::sessionKey("g1", "u1")));

        m_primary->setAvailable(false);
        m_tracker->onTransition(transition("u1", "c1", "", m_now + Hour));
        QVERIFY(m_cache->pendingChanges() > 0);

        m_now += 2 * Hour;
        m_primary->setAvailable(true);

        QVERIFY(!m_tracker->activeSession("g1", "u1").has_value());
        QVERIFY(!m_primary->contains(SessionTracker::sessionKey("g1", "u1")));
        QVERIFY(m_primary->setMembers(SessionTracker::ActiveSessionSetKey).isEmpty());
        QCOMPARE(m_cache->pendingChanges(), 0);

        // Neither shutdown nor a restart finds the session again
        QCOMPARE(m_tracker->closeAllSessions(), 0);
        auto restartedCache = std::make_shared<Cache::FallbackCache>(m_primary, 1000, 30000);
        std::unique_ptr<SessionTracker> restarted(createTracker(restartedCache));
        QCOMPARE(restarted->restoreSessions(m_now), 0);

        QCOMPARE(totalFor("u1"), Hour);
        QCOMPARE(m_sessions->getByUser("g1", "u1", m_now - 4 * Hour, m_now).size(), 1);
    }

    void testPeakCountsConcurrentSessions() {
        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        m_tracker->onTransition(transition("u2", "", "c1", m_now));
        m_tracker->onTransition(transition("u1", "c1", "", m_now + Minute));
        m_tracker->onTransition(transition("u3", "", "c2", m_now + Minute));
        // A repeated join reuses the session and is not a new concurrent user
        m_tracker->onTransition(transition("u3", "", "c1", m_now + 2 * Minute));

        const SessionTracker::Statistics stats = m_tracker->statistics();
        QCOMPARE(stats.activeSessions, 2);
        QCOMPARE(stats.peakConcurrentUsers, 2);
    }

    void testRestoreDiscardsStaleSessions() {
        m_tracker->onTransition(transition("old", "", "c1", m_now - 25 * Hour));
        m_tracker->onTransition(transition("recent", "", "c1", m_now - Hour));
        m_primary->set(SessionTracker::sessionKey("g1", "broken"), "not json", 0);
        m_primary->addToSet(SessionTracker::ActiveSessionSetKey, "g1:broken");
        m_primary->addToSet(SessionTracker::ActiveSessionSetKey, "g1:missing");

        // Restart: a new process has an empty local mirror over the same shared cache
        auto restartedCache = std::make_shared<Cache::FallbackCache>(m_primary, 1000, 30000);
        std::unique_ptr<SessionTracker> restarted(createTracker(restartedCache));

        QCOMPARE(restarted->restoreSessions(m_now), 1);

        const QList<PresenceTypes::ActiveSession> sessions = restarted->activeSessions("g1");
        QCOMPARE(sessions.size(), 1);
        QCOMPARE(sessions.first().userId, QString("recent"));
        QCOMPARE(m_primary->setMembers(SessionTracker::ActiveSessionSetKey), QStringList({"g1:recent"}));

        // Restored sessions live in the local mirror too
        m_primary->setAvailable(false);
        QVERIFY(restarted->activeSession("g1", "recent").has_value());
    }

    void testQueuedTransitionsApplyInOrder() {
        QSignalSpy processedSpy(m_tracker, &SessionTracker::transitionsProcessed);
        QSignalSpy completedSpy(m_tracker, &SessionTracker::sessionCompleted);

        m_tracker->recordTransition(transition("u1", "", "c1", m_now));
        m_tracker->recordTransition(transition("u1", "c1", "c2", m_now + Minute));
        m_tracker->recordTransition(transition("u1", "c2", "", m_now + 2 * Minute));
        QCOMPARE(m_tracker->pendingTransitions(), 3);
        QCOMPARE(completedSpy.count(), 0);

        QVERIFY(processedSpy.wait(2000));
        QCOMPARE(processedSpy.count(), 1);
        QCOMPARE(processedSpy.at(0).at(0).toInt(), 3);
        QCOMPARE(m_tracker->pendingTransitions(), 0);
        QCOMPARE(completedSpy.count(), 1);
        QCOMPARE(totalFor("u1"), 2 * Minute);
    }

    void testMissingTimestampUsesClock() {
        m_tracker->onTransition(transition("u1", "", "c1", 0));
        QCOMPARE(m_tracker->activeSession("g1", "u1")->startTimeMs, m_now);
    }

    void testCloseAllSessionsAndStatistics() {
        m_tracker->onTransition(transition("u1", "", "c1", m_now));
        m_tracker->onTransition(transition("u2", "", "c1", m_now));
        m_tracker->onTransition(transition("u3", "", "c2", m_now));
        m_tracker->onTransition(transition("u3", "c2", "c1", m_now + Minute));
        m_tracker->onTransition(transition("u3", "c1", "", m_now + 10 * Minute));

        m_now += 20 * Minute;
        QCOMPARE(m_tracker->closeAllSessions(), 2);

        const SessionTracker::Statistics stats = m_tracker->statistics();
        QCOMPARE(stats.totalJoins, qint64(3));
        QCOMPARE(stats.totalMoves, qint64(1));
        QCOMPARE(stats.totalLeaves, qint64(1));
        QCOMPARE(stats.activeSessions, 0);
        QCOMPARE(stats.peakConcurrentUsers, 3);
        QCOMPARE(stats.completedSessions, qint64(3));
        QCOMPARE(stats.averageSessionTimeMs, (10 * Minute + 20 * Minute + 20 * Minute) / 3);
    }

private:
    SessionTracker* createTracker(std::shared_ptr<Cache::FallbackCache> cache) {
        auto* tracker = new SessionTracker(m_store, m_settings, std::move(cache));
        tracker->setClock([this]() { return m_now; });
        return tracker;
    }

    qint64 totalFor(const QString& userId) {
        bool ok = false;
        const qint64 total = m_store->queryRange(userId, "g1", m_now - 2 * 24 * Hour, m_now + 24 * Hour, &ok);
        return ok ? total : -1;
    }

    std::unique_ptr<SqliteTestDatabase> m_db;
    VoiceSessionRepository* m_sessions = nullptr;
    AggregateRepository* m_aggregates = nullptr;
    GuildSettingsRepository* m_settingsRepository = nullptr;
    std::shared_ptr<FakeKeyValueStore> m_primary;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    ActivityStore* m_store = nullptr;
    GuildSettingsService* m_settings = nullptr;
    SessionTracker* m_tracker = nullptr;
    qint64 m_now = 0;
};

QTEST_MAIN(SessionTrackerTest)
#include "SessionTrackerTest.moc"
