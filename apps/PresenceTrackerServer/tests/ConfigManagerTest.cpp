#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include <QTextStream>

#include "Managers/ConfigManager.h"
#include "TestSupport.h"

class ConfigManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        quietTestLogging();
        m_tempDir.reset(new QTemporaryDir());
        QVERIFY(m_tempDir->isValid());
    }

    void cleanupTestCase() {
        m_tempDir.reset();
    }

    void init() {
        m_configManager = new ConfigManager();
    }

    void cleanup() {
        delete m_configManager;
    }

    void testDefaultValues() {
        QCOMPARE(m_configManager->host(), QString("0.0.0.0"));
        QCOMPARE(m_configManager->port(), 8080);
        QCOMPARE(m_configManager->cacheEnabled(), true);
        QCOMPARE(m_configManager->redisConfig().port, quint16(6379));
        QCOMPARE(m_configManager->cacheRetryIntervalMs(), 30000);
        QCOMPARE(m_configManager->localCacheMaxEntries(), 10000);
        QCOMPARE(m_configManager->trackingConfig().sessionTtlSeconds, 86400);
        QCOMPARE(m_configManager->trackingConfig().staleSessionHours, 24);
        QCOMPARE(m_configManager->reportConfig().batchSize, 50);
        QCOMPARE(m_configManager->reportConfig().maxConcurrentBatches, 3);
        QCOMPARE(m_configManager->reportConfig().reportCacheTtlHours, 6);
        QCOMPARE(m_configManager->reportCleanupIntervalMinutes(), 60);
        QCOMPARE(m_configManager->logLevel(), QString("info"));
        QCOMPARE(m_configManager->logMaxFileSizeKB(), 10240);
        QCOMPARE(m_configManager->logBackupCount(), 5);
    }

    void testMissingFileKeepsDefaults() {
        QVERIFY(!m_configManager->loadFromFile(m_tempDir->filePath("does_not_exist.ini")));
        QCOMPARE(m_configManager->port(), 8080);
    }

    void testLoadFromFile() {
        const QString path = writeConfig("load.ini",
            "[Server]\n"
            "host=127.0.0.1\n"
            "port=9090\n"
            "[Database]\n"
            "driver=QSQLITE\n"
            "database=/tmp/presence.db\n"
            "[Cache]\n"
            "enabled=false\n"
            "host=cache.internal\n"
            "port=6380\n"
            "[Tracking]\n"
            "sessionTtlSeconds=3600\n"
            "staleSessionHours=12\n"
            "[Reports]\n"
            "batchSize=25\n"
            "maxConcurrentBatches=5\n"
            "enableErrorRecovery=false\n"
            "[Logging]\n"
            "level=DEBUG\n");

        QVERIFY(m_configManager->loadFromFile(path));
        QCOMPARE(m_configManager->configFilePath(), path);
        QCOMPARE(m_configManager->host(), QString("127.0.0.1"));
        QCOMPARE(m_configManager->port(), 9090);
        QVERIFY(m_configManager->databaseConfig().isSqlite());
        QCOMPARE(m_configManager->databaseConfig().database(), QString("/tmp/presence.db"));
        QCOMPARE(m_configManager->cacheEnabled(), false);
        QCOMPARE(m_configManager->redisConfig().host, QString("cache.internal"));
        QCOMPARE(m_configManager->redisConfig().port, quint16(6380));
        QCOMPARE(m_configManager->trackingConfig().sessionTtlSeconds, 3600);
        QCOMPARE(m_configManager->trackingConfig().staleSessionHours, 12);
        QCOMPARE(m_configManager->reportConfig().batchSize, 25);
        QCOMPARE(m_configManager->reportConfig().maxConcurrentBatches, 5);
        QCOMPARE(m_configManager->reportConfig().enableErrorRecovery, false);
        QCOMPARE(m_configManager->logLevel(), QString("debug"));

        // Keys absent from the file keep their defaults
        QCOMPARE(m_configManager->reportConfig().maxRetries, 3);
    }

    void testOutOfRangeValuesAreClamped() {
        const QString path = writeConfig("clamp.ini",
            "[Server]\n"
            "port=70000\n"
            "[Tracking]\n"
            "staleSessionHours=0\n"
            "[Reports]\n"
            "batchSize=5000\n"
            "reportCacheTtlHours=48\n"
            "maxRetries=abc\n");

        QVERIFY(m_configManager->loadFromFile(path));
        QCOMPARE(m_configManager->port(), 65535);
        QCOMPARE(m_configManager->trackingConfig().staleSessionHours, 1);
        QCOMPARE(m_configManager->reportConfig().batchSize, 1000);
        QCOMPARE(m_configManager->reportConfig().reportCacheTtlHours, 6);
        QCOMPARE(m_configManager->reportConfig().maxRetries, 3);
    }

    void testSaveAndLoad() {
        m_configManager->setHost("10.0.0.5");
        m_configManager->setPort(8181);
        m_configManager->setCacheEnabled(false);
        m_configManager->setLogLevel("warning");

        ReportTypes::ReportConfig reports = m_configManager->reportConfig();
        reports.batchSize = 40;
        reports.partialEveryBatches = 4;
        m_configManager->setReportConfig(reports);

        TrackingConfig tracking = m_configManager->trackingConfig();
        tracking.skipNameMarkers = QStringList{"[away]"};
        m_configManager->setTrackingConfig(tracking);

        const QString path = m_tempDir->filePath("saved/presence_tracker.ini");
        QVERIFY(m_configManager->saveToFile(path));

        ConfigManager loaded;
        QVERIFY(loaded.loadFromFile(path));
        QCOMPARE(loaded.host(), QString("10.0.0.5"));
        QCOMPARE(loaded.port(), 8181);
        QCOMPARE(loaded.cacheEnabled(), false);
        QCOMPARE(loaded.logLevel(), QString("warning"));
        QCOMPARE(loaded.reportConfig().batchSize, 40);
        QCOMPARE(loaded.reportConfig().partialEveryBatches, 4);
        QCOMPARE(loaded.trackingConfig().skipNameMarkers, QStringList{"[away]"});
    }

    void testSignalsEmitted() {
        QSignalSpy configChangedSpy(m_configManager, &ConfigManager::configChanged);

        m_configManager->setPort(9000);
        QCOMPARE(configChangedSpy.count(), 1);

        // Unchanged values do not notify
        m_configManager->setPort(9000);
        QCOMPARE(configChangedSpy.count(), 1);

        m_configManager->setLogLevel("debug");
        QCOMPARE(configChangedSpy.count(), 2);

        ReportTypes::ReportConfig reports = m_configManager->reportConfig();
        reports.maxErrors = 7;
        m_configManager->setReportConfig(reports);
        QCOMPARE(configChangedSpy.count(), 3);
    }

    void testInvalidValuesRejected() {
        QSignalSpy configChangedSpy(m_configManager, &ConfigManager::configChanged);

        m_configManager->setPort(0);
        m_configManager->setPort(70000);
        m_configManager->setLogLevel("verbose");
        m_configManager->setHost("");

        QCOMPARE(configChangedSpy.count(), 0);
        QCOMPARE(m_configManager->port(), 8080);
        QCOMPARE(m_configManager->logLevel(), QString("info"));
        QCOMPARE(m_configManager->host(), QString("0.0.0.0"));
    }

    void testReportConfigIsNormalized() {
        ReportTypes::ReportConfig reports;
        reports.maxConcurrentBatches = 0;
        reports.reportCacheTtlHours = 1;
        m_configManager->setReportConfig(reports);

        QCOMPARE(m_configManager->reportConfig().maxConcurrentBatches, 1);
        QCOMPARE(m_configManager->reportConfig().reportCacheTtlHours, 2);
    }

private:
    QString writeConfig(const QString& name, const QString& content) {
        const QString path = m_tempDir->filePath(name);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
            QTextStream out(&file);
            out << content;
        }
        return path;
    }

    QScopedPointer<QTemporaryDir> m_tempDir;
    ConfigManager* m_configManager = nullptr;
};

QTEST_MAIN(ConfigManagerTest)
#include "ConfigManagerTest.moc"
