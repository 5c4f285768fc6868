#pragma once
#include "dbservice/dbservice.h"
#include "dbservice/threadconnections.h"
#include "logger/logger.h"
#include <QSqlDriver>
#include <QElapsedTimer>
#include <QMutexLocker>

template<typename T>
DbService<T>::DbService(const DbConfig& config)
    : m_config(config)
{
    LOG_DEBUG(QString("DbService created for %1").arg(config.describe()));
}

template<typename T>
DbService<T>::~DbService() {
    // Connections are shared between services and closed by DbManager::shutdown()
}

template<typename T>
QString DbService<T>::connectionNameForCurrentThread(const DbConfig& config) {
    return DbThreadConnections::connectionName(config.connectionPrefix());
}

template<typename T>
QSqlDatabase DbService<T>::database() const {
    const QString name = connectionNameForCurrentThread(m_config);
    if (QSqlDatabase::contains(name)) {
        return QSqlDatabase::database(name, false);
    }

    LOG_DEBUG(QString("Opening database connection %1 for thread").arg(name));
    QSqlDatabase db = QSqlDatabase::addDatabase(m_config.driver(), name);
    db.setDatabaseName(m_config.database());
    if (!m_config.isSqlite()) {
        db.setHostName(m_config.host());
        db.setUserName(m_config.username());
        db.setPassword(m_config.password());
        db.setPort(m_config.port());
    }
    if (!m_config.connectOptions().isEmpty()) {
        db.setConnectOptions(m_config.connectOptions());
    }
    return db;
}

template<typename T>
bool DbService<T>::ensureConnected(QSqlDatabase& db) const {
    if (db.isOpen()) {
        return true;
    }

    if (db.open()) {
        LOG_INFO(QString("Database connection opened: %1 (%2)").arg(db.connectionName(), m_config.describe()));
        return true;
    }

    const QString error = db.lastError().text();
    setLastError(error);
    LOG_ERROR(QString("Failed to open database connection %1: %2").arg(db.connectionName(), error));
    return false;
}

template<typename T>
bool DbService<T>::execute(QSqlQuery& query, const QString& queryStr, const QMap<QString, QVariant>& params) const {
    bool success = false;
    if (params.isEmpty()) {
        // exec(QString) avoids a server-side prepared statement
        success = query.exec(queryStr);
    } else if (query.prepare(queryStr)) {
        for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
            query.bindValue(":" + it.key(), it.value());
        }
        success = query.exec();
    }

    if (!success) {
        const QString error = query.lastError().text();
        setLastError(error);
        LOG_ERROR(QString("SQL error: %1\nStatement: %2").arg(error, queryStr.simplified()));
        if (!params.isEmpty()) {
            LOG_DATA(Logger::Error, params);
        }
    }
    return success;
}

template<typename T>
bool DbService<T>::connectedForQuery(QSqlDatabase& db, const QString& queryStr) const {
    db = database();
    if (ensureConnected(db)) {
        return true;
    }
    LOG_ERROR(QString("Statement skipped, no connection: %1").arg(queryStr.simplified().left(120)));
    return false;
}

template<typename T>
void DbService<T>::recordException(const std::exception& ex, const QString& queryStr) const {
    const QString error = QString::fromUtf8(ex.what());
    setLastError(error);
    LOG_ERROR(QString("Row mapping threw '%1' for: %2").arg(error, queryStr.simplified().left(120)));
}

template<typename T>
QList<T*> DbService<T>::executeSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor& processor,
    bool* ok)
{
    if (ok) {
        *ok = false;
    }

    QSqlDatabase db;
    if (!connectedForQuery(db, queryStr)) {
        return QList<T*>();
    }

    QElapsedTimer timer;
    timer.start();

    QList<T*> rows;
    try {
        QSqlQuery query(db);
        query.setForwardOnly(true);
        if (!execute(query, queryStr, params)) {
            return QList<T*>();
        }
        while (query.next()) {
            if (T* row = processor(query)) {
                rows.append(row);
            }
        }
    } catch (const std::exception& ex) {
        qDeleteAll(rows);
        recordException(ex, queryStr);
        return QList<T*>();
    }

    LOG_DEBUG(QString("%1 rows in %2 ms").arg(rows.size()).arg(timer.elapsed()));
    if (ok) {
        *ok = true;
    }
    return rows;
}

template<typename T>
std::optional<T*> DbService<T>::executeSingleSelectQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    const QueryProcessor& processor)
{
    QSqlDatabase db;
    if (!connectedForQuery(db, queryStr)) {
        return std::nullopt;
    }

    try {
        QSqlQuery query(db);
        query.setForwardOnly(true);
        if (!execute(query, queryStr, params) || !query.next()) {
            return std::nullopt;
        }
        T* row = processor(query);
        return row ? std::optional<T*>(row) : std::nullopt;
    } catch (const std::exception& ex) {
        recordException(ex, queryStr);
        return std::nullopt;
    }
}

template<typename T>
bool DbService<T>::executeModificationQuery(
    const QString& queryStr,
    const QMap<QString, QVariant>& params,
    int* rowsAffected)
{
    if (rowsAffected) {
        *rowsAffected = 0;
    }

    QSqlDatabase db;
    if (!connectedForQuery(db, queryStr)) {
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    QSqlQuery query(db);
    if (!execute(query, queryStr, params)) {
        return false;
    }

    const int affected = query.numRowsAffected();
    LOG_DEBUG(QString("%1 rows changed in %2 ms").arg(affected).arg(timer.elapsed()));
    if (rowsAffected) {
        *rowsAffected = affected;
    }
    return true;
}

template<typename T>
bool DbService<T>::beginTransaction() {
    QSqlDatabase db = database();
    if (!ensureConnected(db)) {
        return false;
    }
    if (!db.driver()->hasFeature(QSqlDriver::Transactions)) {
        const QString error = QString("driver %1 has no transaction support").arg(m_config.driver());
        setLastError(error);
        LOG_WARNING(error);
        return false;
    }
    return transactionResult(db, db.transaction(), "BEGIN");
}

template<typename T>
bool DbService<T>::commitTransaction() {
    QSqlDatabase db = database();
    return db.isOpen() && transactionResult(db, db.commit(), "COMMIT");
}

template<typename T>
bool DbService<T>::rollbackTransaction() {
    QSqlDatabase db = database();
    return db.isOpen() && transactionResult(db, db.rollback(), "ROLLBACK");
}

template<typename T>
bool DbService<T>::transactionResult(const QSqlDatabase& db, bool success, const char* statement) const {
    if (success) {
        LOG_DEBUG(QString("%1 on %2").arg(QString::fromLatin1(statement), db.connectionName()));
        return true;
    }
    const QString error = db.lastError().text();
    setLastError(error);
    LOG_ERROR(QString("%1 failed on %2: %3").arg(QString::fromLatin1(statement), db.connectionName(), error));
    return false;
}

template<typename T>
bool DbService<T>::isConnectionValid() const {
    const QSqlDatabase db = database();
    return db.isValid() && db.isOpen();
}

template<typename T>
QString DbService<T>::lastError() const {
    QMutexLocker locker(&m_errorMutex);
    return m_lastError;
}

template<typename T>
void DbService<T>::setLastError(const QString& error) const {
    QMutexLocker locker(&m_errorMutex);
    m_lastError = error;
}
