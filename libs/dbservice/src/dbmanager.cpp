#include "dbservice/dbmanager.h"
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlDriver>
#include <QFile>
#include <QUuid>

namespace {

// Marker type for the schema connection
struct SchemaStatement {};

} // namespace

DbManager& DbManager::instance() {
    static DbManager instance;
    return instance;
}

DbManager::DbManager() {
}

DbManager::~DbManager() {
    shutdown();
}

bool DbManager::initialize(const DbConfig& config) {
    if (m_initialized) {
        LOG_DEBUG(QString("DbManager already serving %1").arg(m_config.describe()));
        return true;
    }

    m_config = config;

    if (!checkDrivers() || !testConnection()) {
        return false;
    }

    m_initialized = true;
    LOG_INFO(QString("DbManager initialized for %1").arg(config.describe()));
    return true;
}

void DbManager::shutdown() {
    {
        QMutexLocker locker(&m_servicesMutex);
        m_services.clear();
    }

    if (!m_initialized) {
        return;
    }

    const QString prefix = m_config.connectionPrefix();
    for (const QString& connectionName : QSqlDatabase::connectionNames()) {
        if (!connectionName.startsWith(prefix)) {
            continue;
        }
        {
            QSqlDatabase db = QSqlDatabase::database(connectionName, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(connectionName);
    }

    m_initialized = false;
    LOG_INFO("DbManager shut down");
}

bool DbManager::testConnection() const {
    // Check on a throwaway connection so a failure leaves no registered name behind
    const QString checkName = QString("%1_check_%2").arg(m_config.connectionPrefix(),
                                                         QUuid::createUuid().toString(QUuid::Id128));
    QString failure;
    {
        QSqlDatabase check = QSqlDatabase::addDatabase(m_config.driver(), checkName);
        check.setDatabaseName(m_config.database());
        if (!m_config.isSqlite()) {
            check.setHostName(m_config.host());
            check.setPort(m_config.port());
            check.setUserName(m_config.username());
            check.setPassword(m_config.password());
        }
        check.setConnectOptions(m_config.connectOptions());

        if (!check.open()) {
            failure = check.lastError().text();
        } else {
            QSqlQuery ping(check);
            if (!ping.exec("SELECT 1")) {
                failure = ping.lastError().text();
            }
            check.close();
        }
    }
    QSqlDatabase::removeDatabase(checkName);

    if (!failure.isEmpty()) {
        LOG_FATAL(QString("Database %1 unreachable: %2").arg(m_config.describe(), failure));
        return false;
    }
    LOG_INFO(QString("Database %1 reachable").arg(m_config.describe()));
    return true;
}

QStringList DbManager::splitStatements(const QString& script) {
    QStringList statements;
    QString current;
    const QStringList lines = script.split('\n');
    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith("--")) {
            continue;
        }
        current += line + '\n';
        if (line.endsWith(';')) {
            current.chop(2);
            if (!current.trimmed().isEmpty()) {
                statements.append(current.trimmed());
            }
            current.clear();
        }
    }
    if (!current.trimmed().isEmpty()) {
        statements.append(current.trimmed());
    }
    return statements;
}

bool DbManager::applySchema(const QString& scriptPath) {
    if (!m_initialized) {
        LOG_ERROR("Cannot apply schema, DbManager not initialized");
        return false;
    }

    QFile file(scriptPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_ERROR(QString("Cannot open schema script: %1").arg(scriptPath));
        return false;
    }
    const QStringList statements = splitStatements(QString::fromUtf8(file.readAll()));

    DbService<SchemaStatement>& service = getService<SchemaStatement>();
    if (!service.beginTransaction()) {
        return false;
    }

    for (const QString& statement : statements) {
        if (!service.executeModificationQuery(statement, QMap<QString, QVariant>())) {
            LOG_ERROR(QString("Schema statement failed: %1").arg(service.lastError()));
            service.rollbackTransaction();
            return false;
        }
    }

    if (!service.commitTransaction()) {
        return false;
    }

    LOG_INFO(QString("Applied %1 schema statements from %2").arg(statements.size()).arg(scriptPath));
    return true;
}

bool DbManager::checkDrivers() const {
    const QStringList drivers = QSqlDatabase::drivers();
    if (drivers.contains(m_config.driver())) {
        return true;
    }
    LOG_FATAL(QString("Qt SQL plugin %1 is not installed (have: %2)").arg(m_config.driver(), drivers.join(", ")));
    return false;
}
