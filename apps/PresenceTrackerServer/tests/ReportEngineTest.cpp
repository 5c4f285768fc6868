#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QAtomicInt>
#include <QJsonArray>
#include <QSet>
#include <QThread>
#include <stdexcept>

#include "Services/ReportEngine.h"
#include "Services/ActivitySource.h"
#include "TestSupport.h"

using namespace ReportTypes;

namespace {

const qint64 Hour = 60LL * 60 * 1000;

}

// Activity totals served from memory, with hooks for failures, blocking and concurrency tracking
class FakeActivitySource : public ActivitySource
{
public:
    void setTotal(const QString& userId, qint64 totalMs) { m_totals.insert(userId, totalMs); }
    void setDelayMs(int delayMs) { m_delayMs = delayMs; }
    void setFailingCalls(const QSet<int>& calls) { m_failingCalls = calls; }

    // Call number `call` blocks until release()
    void holdCall(int call) { m_holdCall.storeRelaxed(call); }
    void release() { m_released.storeRelease(1); }
    bool heldCallStarted() const { return m_heldStarted.loadAcquire() != 0; }

    int calls() const { return m_calls.loadAcquire(); }
    int peakConcurrency() const { return m_peak.loadAcquire(); }

    bool batchActivity(const QStringList& userIds, const QString& guildId,
                       qint64 startMs, qint64 endMs, QHash<QString, qint64>& totals) override {
        Q_UNUSED(guildId);
        Q_UNUSED(startMs);
        Q_UNUSED(endMs);

        const int call = m_calls.fetchAndAddOrdered(1) + 1;
        const int running = m_running.fetchAndAddOrdered(1) + 1;
        int peak = m_peak.loadAcquire();
        while (running > peak && !m_peak.testAndSetOrdered(peak, running)) {
            peak = m_peak.loadAcquire();
        }

        if (call == m_holdCall.loadRelaxed()) {
            m_heldStarted.storeRelease(1);
            while (!m_released.loadAcquire()) {
                QThread::msleep(5);
            }
        }
        if (m_delayMs > 0) {
            QThread::msleep(static_cast<unsigned long>(m_delayMs));
        }
        m_running.fetchAndSubOrdered(1);

        if (m_failingCalls.contains(call)) {
            throw std::runtime_error("statement timeout");
        }

        totals.clear();
        for (const QString& userId : userIds) {
            totals.insert(userId, m_totals.value(userId, 0));
        }
        return true;
    }

private:
    QHash<QString, qint64> m_totals;
    QSet<int> m_failingCalls;
    int m_delayMs = 0;
    QAtomicInt m_calls;
    QAtomicInt m_running;
    QAtomicInt m_peak;
    QAtomicInt m_holdCall;
    QAtomicInt m_released;
    QAtomicInt m_heldStarted;
};

class UnreachableDirectory : public MemberDirectory
{
public:
    QList<MemberInfo> membersWithRole(const QString&, const QString&) override {
        throw std::runtime_error("member list request timed out");
    }
    QString displayName(const QString&, const QString& userId) override { return userId; }
};

class ReportEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        quietTestLogging();
    }

    void init() {
        m_source.reset(new FakeActivitySource());
        m_directory.reset(new InMemoryMemberDirectory());
        m_classifier.reset(new UserClassificationService(nullptr));
        m_cache = std::make_shared<Cache::FallbackCache>(nullptr, 1000);
        m_engine.reset(new ReportEngine(m_source.get(), m_directory.get(), m_classifier.get(), m_cache, nullptr));
        m_engine->setMemorySampler([]() { return qint64(0); });
    }

    void cleanup() {
        m_source->release();
        m_engine.reset();
        m_cache.reset();
        m_classifier.reset();
        m_directory.reset();
        m_source.reset();
    }

    void testClassifiesEveryMember() {
        seedMembers(30);
        for (int i = 0; i < 30; ++i) {
            const QString userId = memberId(i);
            if (i < 10) {
                m_source->setTotal(userId, 5 * Hour + i);
            } else if (i < 20) {
                m_source->setTotal(userId, Hour);
            } else if (i < 25) {
                m_source->setTotal(userId, 10 * Hour);
                m_directory->upsertMember("g1", MemberInfo{userId, userId, {"AFK"}});
            }
        }

        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        const QString id = m_engine->generateReport(request(baseConfig()));
        QVERIFY(!id.isEmpty());

        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);
        QCOMPARE(completedSpy.at(0).at(0).toString(), id);

        const QJsonObject result = completedSpy.at(0).at(1).toJsonObject();
        QCOMPARE(result["success"].toBool(), true);
        QCOMPARE(result["fromCache"].toBool(), false);
        QCOMPARE(result["minHours"].toDouble(), UserClassificationService::DefaultMinHours);

        const QJsonObject statistics = result["statistics"].toObject();
        QCOMPARE(statistics["totalMembers"].toInt(), 30);
        QCOMPARE(statistics["activeMembers"].toInt(), 10);
        QCOMPARE(statistics["inactiveMembers"].toInt(), 15);
        QCOMPARE(statistics["afkMembers"].toInt(), 5);
        QCOMPARE(statistics["batchesProcessed"].toInt(), 3);

        // Longest first across batches
        const QJsonArray active = result["classification"].toObject()["active"].toArray();
        QCOMPARE(active.size(), 10);
        QCOMPARE(active.first().toObject()["userId"].toString(), memberId(9));

        const std::optional<QJsonObject> status = m_engine->operationStatus(id);
        QVERIFY(status.has_value());
        QCOMPARE((*status)["stage"].toString(), QString("completed"));
        QCOMPARE(m_engine->activeOperations(), 0);
    }

    void testConcurrentBatchesStayWithinLimit() {
        seedMembers(100);
        m_source->setDelayMs(40);

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 3;

        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        QCOMPARE(m_source->calls(), 10);
        QVERIFY(m_source->peakConcurrency() <= 3);
        QVERIFY(m_source->peakConcurrency() >= 2);
    }

    void testSingleBatchAtATime() {
        seedMembers(50);
        m_source->setDelayMs(10);

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 1;

        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        QCOMPARE(m_source->peakConcurrency(), 1);
    }

    void testCancelDuringSecondBatch() {
        seedMembers(100);
        m_source->holdCall(2);

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 1;

        QSignalSpy cancelledSpy(m_engine.get(), &ReportEngine::cancelled);
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        const QString id = m_engine->generateReport(request(config));

        QTRY_VERIFY_WITH_TIMEOUT(m_source->heldCallStarted(), 5000);
        QVERIFY(m_engine->cancelReport(id));
        m_source->release();

        QTRY_COMPARE_WITH_TIMEOUT(cancelledSpy.count(), 1, 5000);
        QCOMPARE(completedSpy.count(), 0);
        QCOMPARE(m_source->calls(), 2);

        const QJsonObject partial = cancelledSpy.at(0).at(1).toJsonObject();
        QCOMPARE(partial["success"].toBool(), false);
        QCOMPARE(partial["statistics"].toObject()["batchesProcessed"].toInt(), 1);

        QCOMPARE((*m_engine->operationStatus(id))["stage"].toString(), QString("cancelled"));
        QVERIFY(!m_engine->cancelReport(id));
        QVERIFY(!m_engine->cancelReport("no-such-operation"));
    }

    void testRetriesRecoverTransientFailures() {
        seedMembers(20);
        m_source->setFailingCalls({1, 2});

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 1;
        config.maxRetries = 3;
        config.retryBaseDelayMs = 10;

        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        QCOMPARE(m_source->calls(), 4);
        const QJsonObject result = completedSpy.at(0).at(1).toJsonObject();
        QVERIFY(result["errors"].toArray().isEmpty());
        QCOMPARE(result["statistics"].toObject()["totalMembers"].toInt(), 20);
    }

    void testExhaustedBatchIsRecordedAndSkipped() {
        seedMembers(50);
        m_source->setFailingCalls({2, 3, 4});

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 1;
        config.maxRetries = 2;
        config.retryBaseDelayMs = 5;
        config.maxErrors = 3;

        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        const QJsonObject result = completedSpy.at(0).at(1).toJsonObject();
        const QJsonArray errors = result["errors"].toArray();
        QCOMPARE(errors.size(), 1);
        QCOMPARE(errors.first().toObject()["code"].toString(), QString("BATCH_FAILED"));
        QCOMPARE(errors.first().toObject()["retryCount"].toInt(), 2);
        QCOMPARE(errors.first().toObject()["recoverable"].toBool(), true);

        const QJsonObject statistics = result["statistics"].toObject();
        QCOMPARE(statistics["errorsRecovered"].toInt(), 1);
        QCOMPARE(statistics["batchesProcessed"].toInt(), 5);
        QCOMPARE(statistics["activeMembers"].toInt() + statistics["inactiveMembers"].toInt()
                 + statistics["afkMembers"].toInt(), 40);
    }

    void testErrorBudgetExceededFailsReport() {
        seedMembers(50);
        m_source->setFailingCalls({2, 4});

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 1;
        config.maxErrors = 1;

        QSignalSpy failedSpy(m_engine.get(), &ReportEngine::failed);
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        const QString id = m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(failedSpy.count(), 1, 10000);

        QCOMPARE(completedSpy.count(), 0);
        QCOMPARE(m_source->calls(), 4);

        const QJsonObject error = failedSpy.at(0).at(1).toJsonObject();
        QCOMPARE(error["code"].toString(), QString("ERROR_BUDGET_EXCEEDED"));
        QCOMPARE(error["recoverable"].toBool(), false);

        const QJsonObject partial = failedSpy.at(0).at(2).toJsonObject();
        QCOMPARE(partial["errors"].toArray().size(), 2);
        QCOMPARE((*m_engine->operationStatus(id))["stage"].toString(), QString("error"));
    }

    void testFailureWithoutRecoveryAborts() {
        seedMembers(30);
        m_source->setFailingCalls({1});

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 1;
        config.enableErrorRecovery = false;

        QSignalSpy failedSpy(m_engine.get(), &ReportEngine::failed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(failedSpy.count(), 1, 10000);

        QCOMPARE(failedSpy.at(0).at(1).toJsonObject()["code"].toString(), QString("BATCH_FAILED"));
        QCOMPARE(m_source->calls(), 1);
    }

    void testPartialResultsEveryThreeBatches() {
        seedMembers(100);

        ReportConfig config = baseConfig();
        config.maxConcurrentBatches = 1;
        config.partialEveryBatches = 3;
        config.previewActive = 2;
        for (int i = 0; i < 100; ++i) {
            m_source->setTotal(memberId(i), 5 * Hour);
        }

        QSignalSpy partialSpy(m_engine.get(), &ReportEngine::partialResult);
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        QCOMPARE(partialSpy.count(), 3);
        const QList<int> expectedBatches = {3, 6, 9};
        for (int i = 0; i < partialSpy.count(); ++i) {
            const QJsonObject partial = partialSpy.at(i).at(1).toJsonObject();
            QCOMPARE(partial["batchNumber"].toInt(), expectedBatches.at(i));
            QCOMPARE(partial["isFinal"].toBool(), false);
            QVERIFY(partial["preview"].toObject()["active"].toArray().size() <= 2);
        }
        QCOMPARE(partialSpy.last().at(1).toJsonObject()["preview"].toObject()["activeCount"].toInt(), 90);
    }

    void testPartialResultsDisabled() {
        seedMembers(100);

        ReportConfig config = baseConfig();
        config.partialEveryBatches = 1;
        config.enablePartialResults = false;

        QSignalSpy partialSpy(m_engine.get(), &ReportEngine::partialResult);
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        QCOMPARE(partialSpy.count(), 0);
    }

    void testProgressIsRateLimited_data() {
        QTest::addColumn<int>("intervalMs");
        QTest::addColumn<int>("expectedProcessingEvents");

        QTest::newRow("throttled") << 60000 << 1;
        QTest::newRow("every batch") << 0 << 11;
    }

    void testProgressIsRateLimited() {
        QFETCH(int, intervalMs);
        QFETCH(int, expectedProcessingEvents);

        seedMembers(100);
        ReportConfig config = baseConfig();
        config.progressIntervalMs = intervalMs;

        QSignalSpy progressSpy(m_engine.get(), &ReportEngine::progress);
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        int processing = 0;
        QStringList stages;
        for (const QList<QVariant>& args : progressSpy) {
            const QString stage = args.at(1).toJsonObject()["stage"].toString();
            stages << stage;
            if (stage == "processing_data") {
                ++processing;
            }
        }
        QCOMPARE(processing, expectedProcessingEvents);
        QCOMPARE(stages.first(), QString("initializing"));
        QCOMPARE(stages.last(), QString("completed"));
        QCOMPARE(progressSpy.last().at(1).toJsonObject()["percentage"].toInt(), 100);
    }

    void testFinishedReportServedFromCache() {
        seedMembers(20);
        ReportConfig config = baseConfig();
        config.useCache = true;

        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        const QString first = m_engine->generateReport(request(config));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);
        const int callsAfterFirst = m_source->calls();

        QVERIFY(m_cache->get(request(config).cacheKey()).has_value());

        const QString second = m_engine->generateReport(request(config));
        QVERIFY(second != first);
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 2, 5000);

        const QJsonObject cached = completedSpy.at(1).at(1).toJsonObject();
        QCOMPARE(cached["fromCache"].toBool(), true);
        QCOMPARE(cached["operationId"].toString(), second);
        QCOMPARE(m_source->calls(), callsAfterFirst);
        QCOMPARE((*m_engine->operationStatus(second))["fromCache"].toBool(), true);
    }

    void testMemoryWarningTriggersCleanup() {
        const qint64 MB = 1024 * 1024;
        m_engine->setMemorySampler([MB]() { return 300 * MB; });
        seedMembers(30);

        QSignalSpy warningSpy(m_engine.get(), &ReportEngine::memoryWarning);
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        const QString id = m_engine->generateReport(request(baseConfig()));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        QCOMPARE(warningSpy.count(), 3);
        QCOMPARE(warningSpy.at(0).at(0).toString(), id);
        QCOMPARE(warningSpy.at(0).at(1).toLongLong(), 300 * MB);
        QCOMPARE(warningSpy.at(0).at(2).toLongLong(), 200 * MB);

        const QJsonObject stats = m_engine->memoryStats();
        QCOMPARE(stats["peakBytes"].toInteger(), 300 * MB);
        QVERIFY(stats["cleanupCount"].toInt() >= 3);
    }

    void testStaleOperationsAreDropped() {
        seedMembers(10);
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        const QString id = m_engine->generateReport(request(baseConfig()));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 10000);

        QCOMPARE(m_engine->cleanupStaleOperations(), 0);
        QVERIFY(m_engine->operationStatus(id).has_value());

        const qint64 later = QDateTime::currentMSecsSinceEpoch() + ReportEngine::StaleContextAgeMs + 1000;
        QCOMPARE(m_engine->cleanupStaleOperations(later), 1);
        QVERIFY(!m_engine->operationStatus(id).has_value());
    }

    void testMemberLookupFailure() {
        UnreachableDirectory directory;
        ReportEngine engine(m_source.get(), &directory, m_classifier.get(), m_cache, nullptr);
        engine.setMemorySampler([]() { return qint64(0); });

        QSignalSpy failedSpy(&engine, &ReportEngine::failed);
        engine.generateReport(request(baseConfig()));
        QTRY_COMPARE_WITH_TIMEOUT(failedSpy.count(), 1, 5000);

        const QJsonObject error = failedSpy.at(0).at(1).toJsonObject();
        QCOMPARE(error["code"].toString(), QString("MEMBER_LOOKUP_FAILED"));
        QCOMPARE(error["stage"].toString(), QString("initializing"));
        QCOMPARE(m_source->calls(), 0);
    }

    void testEmptyGuildCompletes() {
        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        m_engine->generateReport(request(baseConfig()));
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 5000);

        QCOMPARE(completedSpy.at(0).at(1).toJsonObject()["statistics"].toObject()["totalMembers"].toInt(), 0);
        QCOMPARE(m_source->calls(), 0);
    }

    void testInvalidRequestRejected() {
        ReportRequest invalid = request(baseConfig());
        invalid.guildId.clear();
        QVERIFY(m_engine->generateReport(invalid).isEmpty());

        ReportRequest reversed = request(baseConfig());
        reversed.endMs = reversed.startMs - 1;
        QVERIFY(m_engine->generateReport(reversed).isEmpty());
    }

private:
    static QString memberId(int index) {
        return QString("u%1").arg(index, 3, 10, QChar('0'));
    }

    void seedMembers(int count) {
        for (int i = 0; i < count; ++i) {
            m_directory->upsertMember("g1", MemberInfo{memberId(i), QString("Member %1").arg(i), {"Member"}});
        }
    }

    static ReportConfig baseConfig() {
        ReportConfig config;
        config.batchSize = 10;
        config.maxConcurrentBatches = 3;
        config.maxRetries = 0;
        config.retryBaseDelayMs = 10;
        config.partialEveryBatches = 100;
        config.progressIntervalMs = 0;
        config.useCache = false;
        return config;
    }

    static ReportRequest request(const ReportConfig& config) {
        ReportRequest request;
        request.guildId = "g1";
        request.startMs = 1704067200000LL;
        request.endMs = request.startMs + 7 * 24 * Hour;
        request.config = config;
        return request;
    }

    std::unique_ptr<FakeActivitySource> m_source;
    std::unique_ptr<InMemoryMemberDirectory> m_directory;
    std::unique_ptr<UserClassificationService> m_classifier;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    std::unique_ptr<ReportEngine> m_engine;
};

QTEST_MAIN(ReportEngineTest)
#include "ReportEngineTest.moc"
