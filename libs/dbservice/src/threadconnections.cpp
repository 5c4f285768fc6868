#include "dbservice/threadconnections.h"
#include "logger/logger.h"
#include <QAtomicInteger>
#include <QCoreApplication>
#include <QSqlDatabase>
#include <QThread>
#include <QThreadStorage>

namespace {

QThreadStorage<DbThreadConnections*> threadConnections;
QAtomicInteger<quint64> lastConnectionId(0);

bool onApplicationThread() {
    const QCoreApplication* app = QCoreApplication::instance();
    return app && QThread::currentThread() == app->thread();
}

} // namespace

DbThreadConnections::~DbThreadConnections() {
    for (auto it = m_names.constBegin(); it != m_names.constEnd(); ++it) {
        const QString& name = it.value();
        if (!QSqlDatabase::contains(name)) {
            continue;
        }
        {
            QSqlDatabase db = QSqlDatabase::database(name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(name);
        LOG_DEBUG(QString("Database connection %1 removed with its thread").arg(name));
    }
}

QString DbThreadConnections::connectionName(const QString& prefix) {
    if (onApplicationThread()) {
        return QString("%1_main").arg(prefix);
    }

    if (!threadConnections.hasLocalData()) {
        threadConnections.setLocalData(new DbThreadConnections());
    }
    DbThreadConnections* owned = threadConnections.localData();

    auto it = owned->m_names.constFind(prefix);
    if (it != owned->m_names.constEnd()) {
        return it.value();
    }
    const QString name = QString("%1_t%2").arg(prefix).arg(lastConnectionId.fetchAndAddRelaxed(1) + 1);
    owned->m_names.insert(prefix, name);
    return name;
}
