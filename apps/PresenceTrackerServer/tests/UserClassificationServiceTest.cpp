#include <QtTest/QtTest>

#include "Services/UserClassificationService.h"
#include "TestSupport.h"

namespace {

const qint64 Hour = 60LL * 60 * 1000;

MemberActivity member(const QString& userId, qint64 totalTimeMs, const QStringList& roles = {})
{
    MemberActivity m;
    m.userId = userId;
    m.displayName = userId.toUpper();
    m.roles = roles;
    m.totalTimeMs = totalTimeMs;
    return m;
}

QStringList ids(const QList<MemberActivity>& members)
{
    QStringList result;
    for (const MemberActivity& m : members) {
        result.append(m.userId);
    }
    return result;
}

}

class UserClassificationServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        quietTestLogging();
    }

    void testAfkRoles_data() {
        QTest::addColumn<QString>("role");
        QTest::addColumn<bool>("afk");

        QTest::newRow("korean marker") << QString::fromUtf8("장기 잠수") << true;
        QTest::newRow("rest marker") << QString::fromUtf8("휴식중") << true;
        QTest::newRow("lowercase afk") << QString("afk-members") << true;
        QTest::newRow("plain role") << QString("member") << false;
        QTest::newRow("empty") << QString() << false;
    }

    void testAfkRoles() {
        QFETCH(QString, role);
        QFETCH(bool, afk);
        QCOMPARE(UserClassificationService::isAfkRole(role), afk);
    }

    void testWithoutSettingsUsesDefaultThreshold() {
        UserClassificationService service(nullptr);
        QCOMPARE(service.minHoursForRole("g1", "member"), UserClassificationService::DefaultMinHours);
    }

    void testBucketsAreSortedByTime() {
        UserClassificationService service(nullptr);
        const QList<MemberActivity> members = {
            member("a", 2 * Hour),
            member("b", 9 * Hour),
            member("c", 4 * Hour),
            member("d", 0),
            member("e", 12 * Hour, {"AFK"}),
            member("f", 1 * Hour, {"member", QString::fromUtf8("잠수")}),
        };

        const ClassificationResult result = service.classify(members, 4.0);

        // Exactly at the threshold counts as active
        QCOMPARE(ids(result.active), QStringList({"b", "c"}));
        QCOMPARE(ids(result.inactive), QStringList({"a", "d"}));
        QCOMPARE(ids(result.afk), QStringList({"e", "f"}));
        QCOMPARE(result.total(), 6);
    }

    void testMergeKeepsOrdering() {
        UserClassificationService service(nullptr);
        ClassificationResult first = service.classify({member("a", 5 * Hour), member("b", 1 * Hour)}, 4.0);
        const ClassificationResult second = service.classify({member("c", 8 * Hour), member("d", 3 * Hour)}, 4.0);

        first.merge(second);

        QCOMPARE(ids(first.active), QStringList({"c", "a"}));
        QCOMPARE(ids(first.inactive), QStringList({"d", "b"}));
    }

    void testPreviewIsBounded() {
        UserClassificationService service(nullptr);
        QList<MemberActivity> members;
        for (int i = 0; i < 30; ++i) {
            members.append(member(QString("u%1").arg(i), (i + 5) * Hour));
        }
        const ClassificationResult result = service.classify(members, 4.0);
        QCOMPARE(result.active.size(), 30);

        const QJsonObject preview = result.toJson(20, 10);
        QCOMPARE(preview["active"].toArray().size(), 20);
        QCOMPARE(preview["active"].toArray().first().toObject()["userId"].toString(), QString("u29"));
    }
};

QTEST_MAIN(UserClassificationServiceTest)
#include "UserClassificationServiceTest.moc"
