#pragma once

#include <QObject>
#include <QTcpSocket>
#include <QMutex>
#include "cache/keyvaluestore.h"
#include "cache/respprotocol.h"

namespace Cache {

    struct RedisConfig {
        QString host = "127.0.0.1";
        quint16 port = 6379;
        QString password;
        int database = 0;
        int connectTimeoutMs = 1000;
        int commandTimeoutMs = 1000;
    };

    /**
     * @brief Blocking RESP client over QTcpSocket
     *
     * Commands are serialized by an internal mutex. The socket belongs to the
     * thread that created the client, so the client must only be used from that
     * thread. Transport failures abort the socket and throw CacheUnavailableError;
     * the next command reconnects.
     */
    class RedisClient : public QObject, public KeyValueStore {
        Q_OBJECT
    public:
        explicit RedisClient(const RedisConfig& config, QObject* parent = nullptr);
        ~RedisClient() override;

        bool connectToServer();
        void disconnectFromServer();
        bool isConnected() const;
        bool ping();

        RespValue command(const QList<QByteArray>& arguments);

        std::optional<QByteArray> get(const QString& key) override;
        void set(const QString& key, const QByteArray& value, int ttlSeconds) override;
        bool remove(const QString& key) override;
        bool expire(const QString& key, int ttlSeconds) override;
        void addToSet(const QString& setKey, const QString& member) override;
        void removeFromSet(const QString& setKey, const QString& member) override;
        QStringList setMembers(const QString& setKey) override;
        QString backendName() const override { return "redis"; }

    signals:
        void connectionStateChanged(bool connected);

    private:
        void ensureConnected();
        RespValue roundTrip(const QList<QByteArray>& arguments);
        void failConnection(const QString& reason);

        RedisConfig m_config;
        QTcpSocket m_socket;
        QByteArray m_readBuffer;
        QMutex m_mutex;
        bool m_wasConnected;
    };

} // namespace Cache
