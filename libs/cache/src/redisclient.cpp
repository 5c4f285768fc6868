#include "cache/redisclient.h"
#include "logger/logger.h"
#include <QElapsedTimer>

namespace Cache {

    RedisClient::RedisClient(const RedisConfig& config, QObject* parent)
        : QObject(parent)
        , m_config(config)
        , m_wasConnected(false)
    {
        LOG_DEBUG(QString("RedisClient created for %1:%2").arg(config.host).arg(config.port));
    }

    RedisClient::~RedisClient() {
        disconnectFromServer();
    }

    bool RedisClient::connectToServer() {
        QMutexLocker locker(&m_mutex);
        try {
            ensureConnected();
            return true;
        }
        catch (const CacheUnavailableError& ex) {
            LOG_WARNING(QString("Redis connection failed: %1").arg(ex.what()));
            return false;
        }
        catch (const CacheProtocolError& ex) {
            LOG_ERROR(QString("Redis sent a malformed handshake reply: %1").arg(ex.what()));
            return false;
        }
    }

    void RedisClient::disconnectFromServer() {
        if (m_socket.state() != QAbstractSocket::UnconnectedState) {
            m_socket.disconnectFromHost();
            if (m_socket.state() != QAbstractSocket::UnconnectedState) {
                m_socket.waitForDisconnected(m_config.connectTimeoutMs);
            }
        }
        m_readBuffer.clear();
    }

    bool RedisClient::isConnected() const {
        return m_socket.state() == QAbstractSocket::ConnectedState;
    }

    bool RedisClient::ping() {
        try {
            RespValue reply = command({"PING"});
            return reply.type == RespValue::SimpleString && reply.text == "PONG";
        }
        catch (const std::runtime_error& ex) {
            LOG_DEBUG(QString("Redis ping failed: %1").arg(ex.what()));
            return false;
        }
    }

    void RedisClient::failConnection(const QString& reason) {
        m_socket.abort();
        m_readBuffer.clear();
        if (m_wasConnected) {
            m_wasConnected = false;
            LOG_WARNING(QString("Redis connection lost: %1").arg(reason));
            emit connectionStateChanged(false);
        }
        throw CacheUnavailableError(reason);
    }

    void RedisClient::ensureConnected() {
        if (isConnected()) {
            return;
        }

        m_socket.abort();
        m_readBuffer.clear();
        m_socket.connectToHost(m_config.host, m_config.port);
        if (!m_socket.waitForConnected(m_config.connectTimeoutMs)) {
            QString reason = QString("connect to %1:%2 failed: %3")
                .arg(m_config.host)
                .arg(m_config.port)
                .arg(m_socket.errorString());
            m_socket.abort();
            throw CacheUnavailableError(reason);
        }

        // A rejected handshake leaves the server unusable until the configuration changes
        if (!m_config.password.isEmpty()) {
            RespValue reply = roundTrip({"AUTH", m_config.password.toUtf8()});
            if (reply.isError()) {
                m_socket.abort();
                m_readBuffer.clear();
                throw CacheUnavailableError(QString("AUTH rejected: %1").arg(QString::fromUtf8(reply.text)));
            }
        }
        if (m_config.database > 0) {
            RespValue reply = roundTrip({"SELECT", QByteArray::number(m_config.database)});
            if (reply.isError()) {
                m_socket.abort();
                m_readBuffer.clear();
                throw CacheUnavailableError(QString("SELECT rejected: %1").arg(QString::fromUtf8(reply.text)));
            }
        }

        m_wasConnected = true;
        LOG_INFO(QString("Connected to Redis at %1:%2").arg(m_config.host).arg(m_config.port));
        emit connectionStateChanged(true);
    }

    RespValue RedisClient::roundTrip(const QList<QByteArray>& arguments) {
        const QByteArray frame = RespProtocol::encodeCommand(arguments);
        if (m_socket.write(frame) != frame.size()) {
            failConnection(QString("write failed: %1").arg(m_socket.errorString()));
        }
        while (m_socket.bytesToWrite() > 0) {
            if (!m_socket.waitForBytesWritten(m_config.commandTimeoutMs)) {
                failConnection(QString("write timed out: %1").arg(m_socket.errorString()));
            }
        }

        QElapsedTimer timer;
        timer.start();
        for (;;) {
            RespValue reply;
            int consumed = 0;
            RespProtocol::ParseStatus status = RespProtocol::parse(m_readBuffer, consumed, reply);
            if (status == RespProtocol::Complete) {
                m_readBuffer.remove(0, consumed);
                return reply;
            }
            if (status == RespProtocol::Malformed) {
                m_socket.abort();
                m_readBuffer.clear();
                throw CacheProtocolError("malformed reply from server");
            }

            const int remaining = m_config.commandTimeoutMs - static_cast<int>(timer.elapsed());
            if (remaining <= 0 || !m_socket.waitForReadyRead(remaining)) {
                failConnection(QString("read timed out for %1").arg(QString::fromUtf8(arguments.value(0))));
            }
            m_readBuffer += m_socket.readAll();
        }
    }

    RespValue RedisClient::command(const QList<QByteArray>& arguments) {
        QMutexLocker locker(&m_mutex);
        ensureConnected();
        RespValue reply = roundTrip(arguments);
        if (reply.isError()) {
            throw CacheProtocolError(QString("%1: %2")
                .arg(QString::fromUtf8(arguments.value(0)), QString::fromUtf8(reply.text)));
        }
        return reply;
    }

    std::optional<QByteArray> RedisClient::get(const QString& key) {
        RespValue reply = command({"GET", key.toUtf8()});
        if (reply.isNull()) {
            return std::nullopt;
        }
        return reply.text;
    }

    void RedisClient::set(const QString& key, const QByteArray& value, int ttlSeconds) {
        if (ttlSeconds > 0) {
            command({"SET", key.toUtf8(), value, "EX", QByteArray::number(ttlSeconds)});
        } else {
            command({"SET", key.toUtf8(), value});
        }
    }

    bool RedisClient::remove(const QString& key) {
        return command({"DEL", key.toUtf8()}).integer > 0;
    }

    bool RedisClient::expire(const QString& key, int ttlSeconds) {
        return command({"EXPIRE", key.toUtf8(), QByteArray::number(ttlSeconds)}).integer == 1;
    }

    void RedisClient::addToSet(const QString& setKey, const QString& member) {
        command({"SADD", setKey.toUtf8(), member.toUtf8()});
    }

    void RedisClient::removeFromSet(const QString& setKey, const QString& member) {
        command({"SREM", setKey.toUtf8(), member.toUtf8()});
    }

    QStringList RedisClient::setMembers(const QString& setKey) {
        RespValue reply = command({"SMEMBERS", setKey.toUtf8()});
        QStringList members;
        for (const RespValue& element : reply.elements) {
            members.append(QString::fromUtf8(element.text));
        }
        return members;
    }

} // namespace Cache
