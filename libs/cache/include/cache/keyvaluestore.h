#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <optional>
#include <stdexcept>

namespace Cache {

    // The backend could not be reached or the connection broke mid-command
    class CacheUnavailableError : public std::runtime_error {
    public:
        explicit CacheUnavailableError(const QString& message)
            : std::runtime_error(message.toStdString()) {}
    };

    // The backend answered with an error reply or an unparseable frame
    class CacheProtocolError : public std::runtime_error {
    public:
        explicit CacheProtocolError(const QString& message)
            : std::runtime_error(message.toStdString()) {}
    };

    /**
     * @brief Key/value store with per-key TTL and string sets
     *
     * Remote implementations throw CacheUnavailableError or CacheProtocolError.
     * In-process implementations never throw.
     */
    class KeyValueStore {
    public:
        virtual ~KeyValueStore() = default;

        virtual std::optional<QByteArray> get(const QString& key) = 0;

        // ttlSeconds <= 0 stores without expiry
        virtual void set(const QString& key, const QByteArray& value, int ttlSeconds) = 0;

        // Returns true when the key existed
        virtual bool remove(const QString& key) = 0;

        // Sets the lifetime of an existing value or set, false when the key is absent
        virtual bool expire(const QString& key, int ttlSeconds) = 0;

        virtual void addToSet(const QString& setKey, const QString& member) = 0;
        virtual void removeFromSet(const QString& setKey, const QString& member) = 0;
        virtual QStringList setMembers(const QString& setKey) = 0;

        virtual QString backendName() const = 0;
    };

} // namespace Cache
