#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QJsonArray>
#include <QRegularExpression>
#include <QSqlDatabase>
#include <QThread>
#include <QTimeZone>

#include "Services/ReportEngine.h"
#include "Services/ActivityStore.h"
#include "Repositories/VoiceSessionRepository.h"
#include "Repositories/AggregateRepository.h"
#include "Models/VoiceSessionModel.h"
#include "Core/ModelFactory.h"
#include "TestSupport.h"

using namespace ReportTypes;

namespace {

const qint64 Hour = 60LL * 60 * 1000;

qint64 at(const QDate& date, int hour)
{
    return QDateTime(date, QTime(hour, 0), QTimeZone::UTC).toMSecsSinceEpoch();
}

// Connections opened for worker threads, as opposed to the application thread's
QStringList workerConnections()
{
    const QString prefix = DbManager::instance().config().connectionPrefix();
    static const QRegularExpression workerSuffix("_t\\d+$");
    QStringList names;
    for (const QString& name : QSqlDatabase::connectionNames()) {
        if (name.startsWith(prefix) && workerSuffix.match(name).hasMatch()) {
            names.append(name);
        }
    }
    return names;
}

}

// Reports computed from sessions stored in SQLite, with batches running on pool threads
class ReportEngineStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        quietTestLogging();
    }

    void init() {
        m_db.reset(new SqliteTestDatabase());
        QVERIFY(m_db->open());

        m_sessions = new VoiceSessionRepository();
        m_aggregates = new AggregateRepository();
        QVERIFY(m_sessions->initialize(&DbManager::instance().getService<VoiceSessionModel>()));
        QVERIFY(m_aggregates->initialize(&DbManager::instance().getService<ActivityAggregateModel>()));

        m_cache = std::make_shared<Cache::FallbackCache>(nullptr, 1000);
        m_store = new ActivityStore(m_sessions, m_aggregates, m_cache);
        m_directory.reset(new InMemoryMemberDirectory());
        m_classifier.reset(new UserClassificationService(nullptr));
        m_engine.reset(new ReportEngine(m_store, m_directory.get(), m_classifier.get(), m_cache, nullptr));
        m_engine->setMemorySampler([]() { return qint64(0); });
    }

    void cleanup() {
        m_engine.reset();
        m_classifier.reset();
        m_directory.reset();
        delete m_store;
        delete m_aggregates;
        delete m_sessions;
        m_cache.reset();
        m_db.reset();
    }

    void testReportOverStoredSessions() {
        const QDate day(2024, 1, 2);
        for (int i = 0; i < 60; ++i) {
            const QString userId = memberId(i);
            m_directory->upsertMember("g1", MemberInfo{userId, userId, {"Member"}});
            if (i < 20) {
                // Split over two days so the totals come from more than one row
                QVERIFY(record(userId, at(day, 10), at(day, 13)));
                QVERIFY(record(userId, at(day.addDays(1), 9), at(day.addDays(1), 11) + i * 60000));
            } else if (i < 40) {
                QVERIFY(record(userId, at(day, 18), at(day, 19)));
            }
        }

        QSignalSpy completedSpy(m_engine.get(), &ReportEngine::completed);
        QSignalSpy failedSpy(m_engine.get(), &ReportEngine::failed);
        m_engine->generateReport(request());
        QTRY_COMPARE_WITH_TIMEOUT(completedSpy.count(), 1, 20000);
        QCOMPARE(failedSpy.count(), 0);

        const QJsonObject result = completedSpy.at(0).at(1).toJsonObject();
        const QJsonObject statistics = result["statistics"].toObject();
        QCOMPARE(statistics["totalMembers"].toInt(), 60);
        QCOMPARE(statistics["activeMembers"].toInt(), 20);
        QCOMPARE(statistics["inactiveMembers"].toInt(), 40);
        QCOMPARE(statistics["batchesProcessed"].toInt(), 6);
        QCOMPARE(statistics["errorsRecovered"].toInt(), 0);

        const QJsonArray active = result["classification"].toObject()["active"].toArray();
        QCOMPARE(active.size(), 20);
        QCOMPARE(active.first().toObject()["userId"].toString(), memberId(19));

        // Pool threads retire with the engine and take their connections along
        m_engine.reset();
        QVERIFY(workerConnections().isEmpty());
    }

    void testRetiredThreadsReleaseConnections() {
        const QDate day(2024, 1, 2);
        QVERIFY(record("u000", at(day, 10), at(day, 12)));

        QString firstName;
        QString secondName;
        qint64 firstTotal = -1;
        qint64 secondTotal = -1;

        auto queryOnNewThread = [this](QString* name, qint64* total) {
            std::unique_ptr<QThread> thread(QThread::create([this, name, total]() {
                QHash<QString, qint64> totals;
                if (m_store->batchActivity({"u000"}, "g1", request().startMs, request().endMs, totals)) {
                    *total = totals.value("u000", -1);
                }
                *name = DbManager::instance().getService<VoiceSessionModel>().database().connectionName();
            }));
            thread->start();
            return thread->wait(10000);
        };

        QVERIFY(queryOnNewThread(&firstName, &firstTotal));
        QCOMPARE(firstTotal, 2 * Hour);
        QVERIFY(!firstName.isEmpty());
        QVERIFY(!QSqlDatabase::connectionNames().contains(firstName));

        QVERIFY(queryOnNewThread(&secondName, &secondTotal));
        QCOMPARE(secondTotal, 2 * Hour);
        QVERIFY(secondName != firstName);
        QVERIFY(!QSqlDatabase::connectionNames().contains(secondName));

        // The application thread keeps its own connection
        const QString mainName = DbManager::instance().getService<VoiceSessionModel>().database().connectionName();
        QVERIFY(mainName != firstName);
        QVERIFY(QSqlDatabase::connectionNames().contains(mainName));
    }

    void testLastErrorReadableFromOtherThreads() {
        DbService<VoiceSessionModel>& service = DbManager::instance().getService<VoiceSessionModel>();

        std::unique_ptr<QThread> writer(QThread::create([&service]() {
            for (int i = 0; i < 50; ++i) {
                service.executeModificationQuery("UPDATE missing_table SET x = 1", {});
            }
        }));
        writer->start();
        for (int i = 0; i < 50; ++i) {
            service.executeModificationQuery("DELETE FROM another_missing_table", {});
            QVERIFY(!service.lastError().isEmpty());
        }
        QVERIFY(writer->wait(10000));
        QVERIFY(service.lastError().contains("missing_table"));
    }

private:
    static QString memberId(int index) {
        return QString("u%1").arg(index, 3, 10, QChar('0'));
    }

    static ReportRequest request() {
        ReportConfig config;
        config.batchSize = 10;
        config.maxConcurrentBatches = 3;
        config.maxRetries = 0;
        config.progressIntervalMs = 0;
        config.useCache = false;

        ReportRequest request;
        request.guildId = "g1";
        request.startMs = 1704067200000LL;
        request.endMs = request.startMs + 7 * 24 * Hour;
        request.config = config;
        return request;
    }

    bool record(const QString& userId, qint64 startMs, qint64 endMs) {
        PresenceTypes::ActiveSession active;
        active.userId = userId;
        active.guildId = "g1";
        active.channelId = "c1";
        active.startTimeMs = startMs;
        QScopedPointer<VoiceSessionModel> session(ModelFactory::createCompletedSession(active, endMs));
        return m_store->recordCompletedSession(session.data());
    }

    std::unique_ptr<SqliteTestDatabase> m_db;
    VoiceSessionRepository* m_sessions = nullptr;
    AggregateRepository* m_aggregates = nullptr;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    ActivityStore* m_store = nullptr;
    std::unique_ptr<InMemoryMemberDirectory> m_directory;
    std::unique_ptr<UserClassificationService> m_classifier;
    std::unique_ptr<ReportEngine> m_engine;
};

QTEST_MAIN(ReportEngineStoreTest)
#include "ReportEngineStoreTest.moc"
