#ifndef BASEREPOSITORY_H
#define BASEREPOSITORY_H

#include <QObject>
#include <QSharedPointer>
#include <QList>
#include <QDate>
#include <QSqlQuery>
#include <QSqlError>
#include <QJsonObject>
#include <QJsonDocument>
#include <functional>

#include "dbservice/dbservice.hpp"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

/**
 * @brief Common plumbing for the table repositories
 *
 * Holds the DbService of the model type and maps result rows through
 * createModelFromQuery(). Rows come back as QSharedPointer.
 */
template <typename T>
class BaseRepository : public QObject {
public:
    explicit BaseRepository(QObject* parent = nullptr)
        : QObject(parent), m_dbService(nullptr), m_initialized(false)
    {
    }

    virtual ~BaseRepository() = default;

    // dbService is not owned; a second call keeps the first service
    bool initialize(DbService<T>* dbService) {
        if (m_initialized) {
            return true;
        }
        if (!dbService) {
            LOG_ERROR(QString("%1: no database service supplied").arg(getEntityName()));
            return false;
        }

        m_dbService = dbService;
        m_initialized = true;
        LOG_DEBUG(QString("%1 repository ready on table %2").arg(getEntityName(), getTableName()));
        return true;
    }

    bool isInitialized() const {
        return m_initialized;
    }

    QString lastError() const {
        return m_dbService ? m_dbService->lastError() : QStringLiteral("repository has no database service");
    }

    /**
     * @brief Runs operation inside one transaction of the calling thread's connection
     *
     * Commits when operation returns true. A false return or a thrown
     * std::exception rolls the transaction back and yields false.
     */
    bool executeInTransaction(const std::function<bool()>& operation) {
        if (!ensureInitialized() || !transactionStep("begin", m_dbService->beginTransaction())) {
            return false;
        }

        bool committed = false;
        try {
            committed = operation() && transactionStep("commit", m_dbService->commitTransaction());
        } catch (const std::exception& e) {
            LOG_ERROR(QString("%1 transaction aborted by exception: %2").arg(getEntityName(), QString::fromUtf8(e.what())));
        }

        if (!committed) {
            transactionStep("rollback", m_dbService->rollbackTransaction());
        }
        return committed;
    }

protected:
    virtual T* createModelFromQuery(const QSqlQuery& query) = 0;
    virtual QString getEntityName() const = 0;
    virtual QString getTableName() const = 0;

    bool ensureInitialized() const {
        if (m_initialized) {
            return true;
        }
        LOG_ERROR(QString("%1 repository used before initialize()").arg(getEntityName()));
        return false;
    }

    bool transactionStep(const char* step, bool success) const {
        if (!success) {
            LOG_ERROR(QString("%1 transaction %2 failed: %3").arg(getEntityName(), QString::fromLatin1(step), m_dbService->lastError()));
        }
        return success;
    }

    QSharedPointer<T> selectOne(const QString& query, const QMap<QString, QVariant>& params) {
        if (!ensureInitialized()) {
            return nullptr;
        }

        auto result = m_dbService->executeSingleSelectQuery(
            query,
            params,
            [this](const QSqlQuery& row) -> T* {
                return createModelFromQuery(row);
            }
        );

        if (result) {
            return QSharedPointer<T>(*result);
        }
        return nullptr;
    }

    QList<QSharedPointer<T>> selectMany(const QString& query, const QMap<QString, QVariant>& params,
                                        bool* ok = nullptr,
                                        const typename DbService<T>::QueryProcessor& processor = nullptr) {
        if (ok) {
            *ok = false;
        }
        if (!ensureInitialized()) {
            return QList<QSharedPointer<T>>();
        }

        typename DbService<T>::QueryProcessor mapper = processor;
        if (!mapper) {
            mapper = [this](const QSqlQuery& row) -> T* {
                return createModelFromQuery(row);
            };
        }

        bool queryOk = false;
        auto models = m_dbService->executeSelectQuery(query, params, mapper, &queryOk);

        QList<QSharedPointer<T>> result;
        for (auto model : models) {
            result.append(QSharedPointer<T>(model));
        }

        if (ok) {
            *ok = queryOk;
        }
        return result;
    }

    bool modify(const QString& query, const QMap<QString, QVariant>& params, int* rowsAffected = nullptr) {
        if (!ensureInitialized()) {
            return false;
        }

        bool success = m_dbService->executeModificationQuery(query, params, rowsAffected);
        if (!success) {
            LOG_ERROR(QString("%1 modification failed: %2").arg(getEntityName(), m_dbService->lastError()));
        }
        return success;
    }

    bool isPostgres() const {
        return m_dbService && m_dbService->driverName() == "QPSQL";
    }

    // Dates travel as ISO text; PostgreSQL needs an explicit cast where no column type is implied
    static QVariant dateValue(const QDate& date) {
        return date.toString(Qt::ISODate);
    }

    QString dateParam(const QString& name) const {
        return isPostgres() ? QString("CAST(:%1 AS DATE)").arg(name) : QString(":%1").arg(name);
    }

    static QString jsonToString(const QJsonObject& json) {
        return QString::fromUtf8(QJsonDocument(json).toJson(QJsonDocument::Compact));
    }

    DbService<T>* m_dbService;
    bool m_initialized;
};

#endif // BASEREPOSITORY_H
