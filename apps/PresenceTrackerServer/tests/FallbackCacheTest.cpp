#include <QtTest/QtTest>
#include <QSignalSpy>

#include "cache/fallbackcache.h"
#include "TestSupport.h"

class FallbackCacheTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        quietTestLogging();
    }

    void init() {
        m_now = 5000000;
        m_primary = std::make_shared<FakeKeyValueStore>();
        m_cache.reset(new Cache::FallbackCache(m_primary, 100, 30000));
        m_cache->setClock([this]() { return m_now; });
    }

    void cleanup() {
        m_cache.reset();
        m_primary.reset();
    }

    void testWritesReachBothStores() {
        m_cache->set("k", "v", 60);

        QVERIFY(m_primary->contains("k"));
        QCOMPARE(m_primary->ttlOf("k"), 60);
        QCOMPARE(m_cache->local().get("k").value_or(QByteArray()), QByteArray("v"));
        QCOMPARE(m_cache->backendName(), QString("fake+local"));
    }

    void testReadFallsBackWhenPrimaryDown() {
        QSignalSpy availabilitySpy(m_cache.get(), &Cache::FallbackCache::primaryAvailabilityChanged);

        m_cache->set("k", "v", 60);
        m_primary->setAvailable(false);

        QCOMPARE(m_cache->get("k").value_or(QByteArray()), QByteArray("v"));
        QVERIFY(!m_cache->isPrimaryAvailable());
        QCOMPARE(m_cache->backendName(), QString("local"));
        QCOMPARE(availabilitySpy.count(), 1);
        QCOMPARE(availabilitySpy.at(0).at(0).toBool(), false);
    }

    void testPrimarySkippedUntilRetryInterval() {
        m_primary->setAvailable(false);
        m_cache->set("a", "1", 60);
        const int callsAfterFailure = m_primary->callCount();

        m_cache->set("b", "2", 60);
        m_cache->get("a");
        QCOMPARE(m_primary->callCount(), callsAfterFailure);

        m_now += 30000;
        m_cache->get("a");
        QCOMPARE(m_primary->callCount(), callsAfterFailure + 1);
    }

    void testRecoveryAfterRetryInterval() {
        QSignalSpy availabilitySpy(m_cache.get(), &Cache::FallbackCache::primaryAvailabilityChanged);

        m_primary->setAvailable(false);
        m_cache->set("a", "1", 60);
        QVERIFY(!m_cache->isPrimaryAvailable());

        m_primary->setAvailable(true);
        m_now += 30001;
        m_cache->set("b", "2", 60);

        QVERIFY(m_cache->isPrimaryAvailable());
        QVERIFY(m_primary->contains("b"));
        QCOMPARE(availabilitySpy.count(), 2);
        QCOMPARE(availabilitySpy.at(1).at(0).toBool(), true);
    }

    void testLocalOnlyMembersSurviveRecovery() {
        m_primary->setAvailable(false);
        m_cache->addToSet("active", "g1:u1");

        m_primary->setAvailable(true);
        m_now += 30001;
        m_cache->addToSet("active", "g1:u2");

        QCOMPARE(m_cache->setMembers("active"), QStringList({"g1:u1", "g1:u2"}));
    }

    void testRemovalsDuringOutageReachPrimaryOnRecovery() {
        m_cache->set("voice_session:g1:u1", "s1", 86400);
        m_cache->addToSet("active", "g1:u1");
        m_cache->addToSet("active", "g1:u2");

        m_primary->setAvailable(false);
        m_cache->remove("voice_session:g1:u1");
        m_cache->removeFromSet("active", "g1:u1");
        QCOMPARE(m_cache->pendingChanges(), 2);

        m_now += 30001;
        m_primary->setAvailable(true);

        QVERIFY(!m_cache->get("voice_session:g1:u1").has_value());
        QCOMPARE(m_cache->setMembers("active"), QStringList{"g1:u2"});
        QVERIFY(!m_primary->contains("voice_session:g1:u1"));
        QCOMPARE(m_primary->setMembers("active"), QStringList{"g1:u2"});
        QCOMPARE(m_cache->pendingChanges(), 0);
        QVERIFY(m_cache->isPrimaryAvailable());
    }

    void testFailedReplayKeepsChangesPending() {
        m_cache->set("k", "v", 0);

        m_primary->setAvailable(false);
        m_cache->remove("k");

        // The retry interval passed but the primary is still down
        m_now += 30001;
        QVERIFY(!m_cache->get("k").has_value());
        QCOMPARE(m_cache->pendingChanges(), 1);
        QVERIFY(m_primary->contains("k"));

        m_now += 30001;
        m_primary->setAvailable(true);
        QVERIFY(!m_cache->get("k").has_value());
        QVERIFY(!m_primary->contains("k"));
        QCOMPARE(m_cache->pendingChanges(), 0);
    }

    void testLatestChangePerKeyIsReplayed() {
        m_primary->setAvailable(false);
        m_cache->set("k", "first", 0);
        m_cache->remove("k");
        m_cache->set("k", "second", 0);
        m_cache->addToSet("active", "g1:u1");
        m_cache->removeFromSet("active", "g1:u1");
        QCOMPARE(m_cache->pendingChanges(), 2);

        m_now += 30001;
        m_primary->setAvailable(true);
        QCOMPARE(m_cache->get("k").value_or(QByteArray()), QByteArray("second"));
        QCOMPARE(m_primary->value("k"), QByteArray("second"));
        QVERIFY(!m_primary->containsSet("active"));
    }

    void testReplayedWritesKeepRemainingLifetime() {
        m_primary->setAvailable(false);
        m_cache->set("short", "1", 10);
        m_cache->set("long", "2", 120);
        m_cache->addToSet("keys", "activity:1");
        m_cache->expire("keys", 300);

        m_now += 30001;
        m_primary->setAvailable(true);
        m_cache->get("long");

        // Expired while the primary was down, so it never reappears there
        QVERIFY(!m_primary->contains("short"));
        QCOMPARE(m_primary->value("long"), QByteArray("2"));
        QCOMPARE(m_primary->ttlOf("long"), 90);
        QVERIFY(m_primary->containsSet("keys"));
        QCOMPARE(m_primary->ttlOf("keys"), 270);
    }

    void testGetOrLoadStoresLoadedValue() {
        int loads = 0;
        auto loader = [&loads]() -> std::optional<QByteArray> {
            ++loads;
            return QByteArray("loaded");
        };

        QCOMPARE(m_cache->getOrLoad("k", 600, loader).value_or(QByteArray()), QByteArray("loaded"));
        QCOMPARE(m_cache->getOrLoad("k", 600, loader).value_or(QByteArray()), QByteArray("loaded"));
        QCOMPARE(loads, 1);
        QCOMPARE(m_primary->ttlOf("k"), 600);
    }

    void testGetOrLoadDoesNotCacheFailures() {
        int loads = 0;
        auto loader = [&loads]() -> std::optional<QByteArray> {
            ++loads;
            return std::nullopt;
        };

        QVERIFY(!m_cache->getOrLoad("k", 600, loader).has_value());
        QVERIFY(!m_cache->getOrLoad("k", 600, loader).has_value());
        QCOMPARE(loads, 2);
        QVERIFY(!m_primary->contains("k"));
    }

    void testInvalidateCountsExistingKeys() {
        m_cache->set("a", "1", 0);
        m_cache->set("b", "2", 0);

        QCOMPARE(m_cache->invalidate({"a", "b", "c"}), 2);
        QVERIFY(!m_cache->get("a").has_value());
        QVERIFY(!m_primary->contains("b"));
    }

    void testWithoutPrimary() {
        Cache::FallbackCache localOnly(nullptr, 10);
        QVERIFY(!localOnly.hasPrimary());
        QVERIFY(!localOnly.isPrimaryAvailable());

        localOnly.set("k", "v", 0);
        QCOMPARE(localOnly.get("k").value_or(QByteArray()), QByteArray("v"));
        QCOMPARE(localOnly.backendName(), QString("local"));
    }

private:
    qint64 m_now = 0;
    std::shared_ptr<FakeKeyValueStore> m_primary;
    std::unique_ptr<Cache::FallbackCache> m_cache;
};

QTEST_MAIN(FallbackCacheTest)
#include "FallbackCacheTest.moc"
