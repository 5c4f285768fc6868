#include "cache/respprotocol.h"

namespace Cache {

    namespace {
        const int kMaxNestingDepth = 8;
        const qint64 kMaxBulkLength = 512LL * 1024 * 1024;
    }

    QByteArray RespProtocol::encodeCommand(const QList<QByteArray>& arguments) {
        QByteArray out;
        out.reserve(16 + arguments.size() * 16);
        out += '*';
        out += QByteArray::number(arguments.size());
        out += "\r\n";
        for (const QByteArray& argument : arguments) {
            out += '$';
            out += QByteArray::number(argument.size());
            out += "\r\n";
            out += argument;
            out += "\r\n";
        }
        return out;
    }

    RespProtocol::ParseStatus RespProtocol::parse(const QByteArray& buffer, int& consumed, RespValue& value) {
        int pos = 0;
        ParseStatus status = parseAt(buffer, pos, value, 0);
        consumed = status == Complete ? pos : 0;
        return status;
    }

    int RespProtocol::findLineEnd(const QByteArray& buffer, int from) {
        int index = buffer.indexOf("\r\n", from);
        return index;
    }

    RespProtocol::ParseStatus RespProtocol::parseAt(const QByteArray& buffer, int& pos, RespValue& value, int depth) {
        if (depth > kMaxNestingDepth) {
            return Malformed;
        }
        if (pos >= buffer.size()) {
            return Incomplete;
        }

        const char prefix = buffer.at(pos);
        const int lineEnd = findLineEnd(buffer, pos + 1);
        if (lineEnd < 0) {
            return Incomplete;
        }
        const QByteArray line = buffer.mid(pos + 1, lineEnd - pos - 1);

        switch (prefix) {
        case '+':
            value = RespValue();
            value.type = RespValue::SimpleString;
            value.text = line;
            pos = lineEnd + 2;
            return Complete;

        case '-':
            value = RespValue();
            value.type = RespValue::Error;
            value.text = line;
            pos = lineEnd + 2;
            return Complete;

        case ':': {
            bool ok = false;
            qint64 number = line.toLongLong(&ok);
            if (!ok) {
                return Malformed;
            }
            value = RespValue();
            value.type = RespValue::Integer;
            value.integer = number;
            pos = lineEnd + 2;
            return Complete;
        }

        case '$': {
            bool ok = false;
            qint64 length = line.toLongLong(&ok);
            if (!ok || length < -1 || length > kMaxBulkLength) {
                return Malformed;
            }
            value = RespValue();
            if (length == -1) {
                value.type = RespValue::Null;
                pos = lineEnd + 2;
                return Complete;
            }
            const int dataStart = lineEnd + 2;
            if (buffer.size() < dataStart + length + 2) {
                return Incomplete;
            }
            if (buffer.at(dataStart + length) != '\r' || buffer.at(dataStart + length + 1) != '\n') {
                return Malformed;
            }
            value.type = RespValue::BulkString;
            value.text = buffer.mid(dataStart, static_cast<int>(length));
            pos = dataStart + static_cast<int>(length) + 2;
            return Complete;
        }

        case '*': {
            bool ok = false;
            qint64 count = line.toLongLong(&ok);
            if (!ok || count < -1) {
                return Malformed;
            }
            value = RespValue();
            if (count == -1) {
                value.type = RespValue::Null;
                pos = lineEnd + 2;
                return Complete;
            }
            value.type = RespValue::Array;
            int cursor = lineEnd + 2;
            for (qint64 i = 0; i < count; ++i) {
                RespValue element;
                ParseStatus status = parseAt(buffer, cursor, element, depth + 1);
                if (status != Complete) {
                    return status;
                }
                value.elements.append(element);
            }
            pos = cursor;
            return Complete;
        }

        default:
            return Malformed;
        }
    }

} // namespace Cache
