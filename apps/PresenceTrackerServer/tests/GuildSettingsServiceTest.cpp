#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QJsonArray>

#include "Services/GuildSettingsService.h"
#include "Repositories/GuildSettingsRepository.h"
#include "Models/GuildSettingModel.h"
#include "TestSupport.h"

class GuildSettingsServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        quietTestLogging();
    }

    void init() {
        m_db.reset(new SqliteTestDatabase());
        QVERIFY(m_db->open());

        m_repository = new GuildSettingsRepository();
        QVERIFY(m_repository->initialize(&DbManager::instance().getService<GuildSettingModel>()));

        m_primary = std::make_shared<FakeKeyValueStore>();
        m_cache = std::make_shared<Cache::FallbackCache>(m_primary, 1000, 30000);
        m_service = new GuildSettingsService(m_repository, m_cache);
    }

    void cleanup() {
        delete m_service;
        delete m_repository;
        m_cache.reset();
        m_primary.reset();
        m_db.reset();
    }

    void testUnsetGuildTracksEverything() {
        const ExclusionPolicy policy = m_service->exclusionPolicy("g1");
        QVERIFY(policy.fullyExcluded.isEmpty());
        QVERIFY(policy.activityLimited.isEmpty());
        QVERIFY(!policy.isExcluded("c1"));

        // The default is cached like any stored value
        QVERIFY(m_primary->contains(GuildSettingsService::exclusionKey("g1")));
        QCOMPARE(m_primary->ttlOf(GuildSettingsService::exclusionKey("g1")), GuildSettingsService::SettingsTtlSeconds);
    }

    void testExclusionPolicyUpdate() {
        // Warm the cache with the empty policy first
        QVERIFY(!m_service->exclusionPolicy("g1").isExcluded("afk"));

        QSignalSpy changedSpy(m_service, &GuildSettingsService::settingsChanged);

        ExclusionPolicy policy;
        policy.fullyExcluded = {"afk"};
        policy.activityLimited = {"music"};
        QVERIFY(m_service->setExclusionPolicy("g1", policy));

        QCOMPARE(changedSpy.count(), 1);
        QCOMPARE(changedSpy.at(0).at(0).toString(), QString("g1"));
        QCOMPARE(changedSpy.at(0).at(1).toString(), QString(GuildSettingModel::TypeExcludeChannels));
        QVERIFY(!m_primary->contains(GuildSettingsService::exclusionKey("g1")));

        const ExclusionPolicy loaded = m_service->exclusionPolicy("g1");
        QVERIFY(loaded.isFullyExcluded("afk"));
        QVERIFY(loaded.isActivityLimited("music"));
        QVERIFY(!loaded.isFullyExcluded("music"));
        QVERIFY(loaded.isExcluded("music"));

        // Other guilds are unaffected
        QVERIFY(!m_service->exclusionPolicy("g2").isExcluded("afk"));
    }

    void testLegacyChannelListIsFullyExcluded() {
        GuildSettingModel setting;
        setting.setGuildId("g1");
        setting.setSettingType(GuildSettingModel::TypeExcludeChannels);
        setting.setSettingKey("channels");
        QJsonObject value;
        value["channels"] = QJsonArray{"c7", " c8 ", ""};
        setting.setSettingValue(value);
        QVERIFY(m_repository->upsert(&setting));

        const ExclusionPolicy policy = m_service->exclusionPolicy("g1");
        QCOMPARE(policy.fullyExcluded, QSet<QString>({"c7", "c8"}));
        QVERIFY(policy.activityLimited.isEmpty());
    }

    void testActivityThreshold() {
        QCOMPARE(m_service->activityThresholdHours("g1"), GuildSettingsService::DefaultActivityThresholdHours);

        QVERIFY(m_service->setActivityThresholdHours("g1", 12.5));
        QCOMPARE(m_service->activityThresholdHours("g1"), 12.5);

        QSignalSpy changedSpy(m_service, &GuildSettingsService::settingsChanged);
        QVERIFY(!m_service->setActivityThresholdHours("g1", -1));
        QCOMPARE(changedSpy.count(), 0);
        QCOMPARE(m_service->activityThresholdHours("g1"), 12.5);
    }

    void testRoleRules() {
        QVERIFY(!m_service->roleMinHours("g1", "member").has_value());
        QVERIFY(m_service->allRoleRules("g1").isEmpty());

        QVERIFY(m_service->setRoleMinHours("g1", "member", 10));
        QVERIFY(m_service->setRoleMinHours("g1", "staff", 4));

        const std::optional<double> member = m_service->roleMinHours("g1", "member");
        QVERIFY(member.has_value());
        QCOMPARE(*member, 10.0);

        // Writing a role rule drops the guild's cached rule map
        const QMap<QString, double> rules = m_service->allRoleRules("g1");
        QCOMPARE(rules.size(), 2);
        QCOMPARE(rules.value("staff"), 4.0);

        QVERIFY(m_service->removeRoleRule("g1", "staff"));
        QVERIFY(!m_service->roleMinHours("g1", "staff").has_value());
        QCOMPARE(m_service->allRoleRules("g1").keys(), QStringList{"member"});
    }

    void testInvalidRoleRulesRejected() {
        QVERIFY(!m_service->setRoleMinHours("g1", "  ", 5));
        QVERIFY(!m_service->setRoleMinHours("g1", "member", -2));
        QVERIFY(m_service->allRoleRules("g1").isEmpty());
    }

    void testReadsSurviveCacheOutage() {
        ExclusionPolicy policy;
        policy.fullyExcluded = {"afk"};
        QVERIFY(m_service->setExclusionPolicy("g1", policy));

        m_primary->setAvailable(false);
        QVERIFY(m_service->exclusionPolicy("g1").isFullyExcluded("afk"));
        QVERIFY(m_service->setRoleMinHours("g1", "member", 3));
        QCOMPARE(m_service->roleMinHours("g1", "member").value_or(0), 3.0);
    }

private:
    std::unique_ptr<SqliteTestDatabase> m_db;
    GuildSettingsRepository* m_repository = nullptr;
    std::shared_ptr<FakeKeyValueStore> m_primary;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    GuildSettingsService* m_service = nullptr;
};

QTEST_MAIN(GuildSettingsServiceTest)
#include "GuildSettingsServiceTest.moc"
