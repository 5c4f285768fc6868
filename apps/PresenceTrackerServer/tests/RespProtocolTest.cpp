#include <QtTest/QtTest>

#include "cache/respprotocol.h"

using Cache::RespProtocol;
using Cache::RespValue;

class RespProtocolTest : public QObject
{
    Q_OBJECT

private slots:
    void testEncodeCommand() {
        const QByteArray encoded = RespProtocol::encodeCommand({"SET", "voice_session:g:u", "{}"});
        QCOMPARE(encoded, QByteArray("*3\r\n$3\r\nSET\r\n$17\r\nvoice_session:g:u\r\n$2\r\n{}\r\n"));
    }

    void testEncodeBinarySafe() {
        QByteArray value("a\r\nb");
        const QByteArray encoded = RespProtocol::encodeCommand({"SET", "k", value});
        QVERIFY(encoded.endsWith("$4\r\na\r\nb\r\n"));
    }

    void testParseScalars_data() {
        QTest::addColumn<QByteArray>("wire");
        QTest::addColumn<int>("type");
        QTest::addColumn<QByteArray>("text");
        QTest::addColumn<qint64>("integer");

        QTest::newRow("simple") << QByteArray("+OK\r\n") << int(RespValue::SimpleString) << QByteArray("OK") << qint64(0);
        QTest::newRow("error") << QByteArray("-ERR wrong type\r\n") << int(RespValue::Error) << QByteArray("ERR wrong type") << qint64(0);
        QTest::newRow("integer") << QByteArray(":-42\r\n") << int(RespValue::Integer) << QByteArray() << qint64(-42);
        QTest::newRow("bulk") << QByteArray("$5\r\nhello\r\n") << int(RespValue::BulkString) << QByteArray("hello") << qint64(0);
        QTest::newRow("empty bulk") << QByteArray("$0\r\n\r\n") << int(RespValue::BulkString) << QByteArray("") << qint64(0);
        QTest::newRow("null bulk") << QByteArray("$-1\r\n") << int(RespValue::Null) << QByteArray() << qint64(0);
    }

    void testParseScalars() {
        QFETCH(QByteArray, wire);
        QFETCH(int, type);
        QFETCH(QByteArray, text);
        QFETCH(qint64, integer);

        int consumed = 0;
        RespValue value;
        QCOMPARE(RespProtocol::parse(wire, consumed, value), RespProtocol::Complete);
        QCOMPARE(consumed, wire.size());
        QCOMPARE(int(value.type), type);
        QCOMPARE(value.text, text);
        QCOMPARE(value.integer, integer);
    }

    void testParseArray() {
        const QByteArray wire("*2\r\n$7\r\ng1:u100\r\n$7\r\ng1:u200\r\n+trailing\r\n");
        int consumed = 0;
        RespValue value;

        QCOMPARE(RespProtocol::parse(wire, consumed, value), RespProtocol::Complete);
        QCOMPARE(value.type, RespValue::Array);
        QCOMPARE(value.elements.size(), 2);
        QCOMPARE(value.elements.at(1).text, QByteArray("g1:u200"));
        QCOMPARE(wire.mid(consumed), QByteArray("+trailing\r\n"));
    }

    void testIncompleteFrames_data() {
        QTest::addColumn<QByteArray>("wire");

        QTest::newRow("empty") << QByteArray();
        QTest::newRow("no line end") << QByteArray("+OK");
        QTest::newRow("short bulk") << QByteArray("$5\r\nhel");
        QTest::newRow("bulk without crlf") << QByteArray("$5\r\nhello");
        QTest::newRow("short array") << QByteArray("*2\r\n:1\r\n");
    }

    void testIncompleteFrames() {
        QFETCH(QByteArray, wire);

        int consumed = -1;
        RespValue value;
        QCOMPARE(RespProtocol::parse(wire, consumed, value), RespProtocol::Incomplete);
        QCOMPARE(consumed, 0);
    }

    void testMalformedFrames_data() {
        QTest::addColumn<QByteArray>("wire");

        QTest::newRow("unknown prefix") << QByteArray("?what\r\n");
        QTest::newRow("bad integer") << QByteArray(":12x\r\n");
        QTest::newRow("negative length") << QByteArray("$-5\r\n");
        QTest::newRow("bulk terminator") << QByteArray("$2\r\nabXY");
    }

    void testMalformedFrames() {
        QFETCH(QByteArray, wire);

        int consumed = 0;
        RespValue value;
        QCOMPARE(RespProtocol::parse(wire, consumed, value), RespProtocol::Malformed);
    }
};

QTEST_MAIN(RespProtocolTest)
#include "RespProtocolTest.moc"
