#ifndef TESTSUPPORT_H
#define TESTSUPPORT_H

#include <QHash>
#include <QSet>
#include <QString>
#include <QTemporaryDir>
#include <QUuid>
#include <memory>

#include "cache/keyvaluestore.h"
#include "dbservice/dbmanager.h"
#include "logger/logger.h"

// Stand-in for the remote cache; flips into a failing state on demand
class FakeKeyValueStore : public Cache::KeyValueStore
{
public:
    void setAvailable(bool available) { m_available = available; }
    bool isAvailable() const { return m_available; }

    int callCount() const { return m_calls; }
    bool contains(const QString& key) const { return m_values.contains(key); }
    bool containsSet(const QString& setKey) const { return m_sets.contains(setKey); }
    QByteArray value(const QString& key) const { return m_values.value(key); }
    int ttlOf(const QString& key) const { return m_ttls.value(key, -1); }

    std::optional<QByteArray> get(const QString& key) override {
        touch();
        if (!m_values.contains(key)) {
            return std::nullopt;
        }
        return m_values.value(key);
    }

    void set(const QString& key, const QByteArray& value, int ttlSeconds) override {
        touch();
        m_values.insert(key, value);
        m_ttls.insert(key, ttlSeconds);
    }

    bool remove(const QString& key) override {
        touch();
        m_ttls.remove(key);
        const bool hadSet = m_sets.remove(key) > 0;
        return m_values.remove(key) > 0 || hadSet;
    }

    bool expire(const QString& key, int ttlSeconds) override {
        touch();
        if (!m_values.contains(key) && !m_sets.contains(key)) {
            return false;
        }
        m_ttls.insert(key, ttlSeconds);
        return true;
    }

    void addToSet(const QString& setKey, const QString& member) override {
        touch();
        m_sets[setKey].insert(member);
    }

    void removeFromSet(const QString& setKey, const QString& member) override {
        touch();
        auto it = m_sets.find(setKey);
        if (it == m_sets.end()) {
            return;
        }
        it.value().remove(member);
        if (it.value().isEmpty()) {
            m_sets.erase(it);
            m_ttls.remove(setKey);
        }
    }

    QStringList setMembers(const QString& setKey) override {
        touch();
        QStringList members = m_sets.value(setKey).values();
        members.sort();
        return members;
    }

    QString backendName() const override { return "fake"; }

private:
    void touch() {
        ++m_calls;
        if (!m_available) {
            throw Cache::CacheUnavailableError("connection refused");
        }
    }

    bool m_available = true;
    int m_calls = 0;
    QHash<QString, QByteArray> m_values;
    QHash<QString, int> m_ttls;
    QHash<QString, QSet<QString>> m_sets;
};

// Fresh SQLite database with the application schema applied
class SqliteTestDatabase
{
public:
    SqliteTestDatabase() = default;
    ~SqliteTestDatabase() { close(); }

    bool open() {
        if (!m_dir.isValid()) {
            return false;
        }
        m_path = m_dir.filePath(QString("presence_%1.db").arg(QUuid::createUuid().toString(QUuid::Id128)));
        if (!DbManager::instance().initialize(DbConfig::sqlite(m_path))) {
            return false;
        }
        return DbManager::instance().applySchema(QStringLiteral(PRESENCE_SCHEMA_DIR "/sqlite.sql"));
    }

    void close() {
        if (DbManager::instance().isInitialized()) {
            DbManager::instance().shutdown();
        }
    }

    QString path() const { return m_path; }

private:
    QTemporaryDir m_dir;
    QString m_path;
};

inline void quietTestLogging()
{
    Logger::instance()->enableConsoleOutput(false);
    Logger::instance()->setLogLevel(Logger::Warning);
}

#endif // TESTSUPPORT_H
