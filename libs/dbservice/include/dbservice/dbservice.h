#pragma once
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QMap>
#include <QMutex>
#include <QVariant>
#include <functional>
#include <optional>
#include <exception>
#include "dbconfig.h"
#include "logger/logger.h"

/**
 * @brief Typed query executor over a named Qt SQL connection
 *
 * Every service built from the same DbConfig shares one connection per thread,
 * so transactions opened through one service cover statements issued through
 * another service on the same thread. A thread that has no connection yet gets
 * its own on first use.
 */
template<typename T>
class DbService {
public:
    using QueryProcessor = std::function<T*(const QSqlQuery&)>;

    explicit DbService(const DbConfig& config);
    ~DbService();

    // Execute a SELECT query and return multiple results, ok reports execution success
    QList<T*> executeSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor& processor,
        bool* ok = nullptr);

    // Execute a SELECT query and return the first row
    std::optional<T*> executeSingleSelectQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        const QueryProcessor& processor);

    // Execute an INSERT, UPDATE, or DELETE query
    bool executeModificationQuery(
        const QString& queryStr,
        const QMap<QString, QVariant>& params,
        int* rowsAffected = nullptr);

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    bool isConnectionValid() const;
    QString lastError() const;
    QString driverName() const { return m_config.driver(); }
    const DbConfig& config() const { return m_config; }

    // Connection bound to the calling thread
    QSqlDatabase database() const;

    static QString connectionNameForCurrentThread(const DbConfig& config);

private:
    bool ensureConnected(QSqlDatabase& db) const;
    bool connectedForQuery(QSqlDatabase& db, const QString& queryStr) const;
    void recordException(const std::exception& ex, const QString& queryStr) const;
    bool transactionResult(const QSqlDatabase& db, bool success, const char* statement) const;
    bool execute(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params) const;
    void setLastError(const QString& error) const;

    DbConfig m_config;
    // Services are shared across threads, so the last error is the latest from any of them
    mutable QMutex m_errorMutex;
    mutable QString m_lastError;
};
