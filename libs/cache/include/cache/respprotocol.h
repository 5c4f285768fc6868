#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

namespace Cache {

    // One decoded RESP2 reply
    struct RespValue {
        enum Type {
            SimpleString,
            Error,
            Integer,
            BulkString,
            Array,
            Null
        };

        Type type = Null;
        QByteArray text;
        qint64 integer = 0;
        QList<RespValue> elements;

        bool isNull() const { return type == Null; }
        bool isError() const { return type == Error; }
    };

    class RespProtocol {
    public:
        enum ParseStatus {
            Complete,
            Incomplete,
            Malformed
        };

        // Encodes a command as an array of bulk strings
        static QByteArray encodeCommand(const QList<QByteArray>& arguments);

        /**
         * @brief Decodes one reply from the front of buffer
         * @param buffer Bytes received so far
         * @param consumed Set to the number of bytes the reply occupied when Complete
         * @param value Receives the decoded reply when Complete
         */
        static ParseStatus parse(const QByteArray& buffer, int& consumed, RespValue& value);

    private:
        static ParseStatus parseAt(const QByteArray& buffer, int& pos, RespValue& value, int depth);
        static int findLineEnd(const QByteArray& buffer, int from);
    };

} // namespace Cache
