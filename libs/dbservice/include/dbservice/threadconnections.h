#pragma once
#include <QHash>
#include <QString>

/**
 * @brief Connection names owned by the calling thread
 *
 * Worker threads get a name that is never handed out again, and the
 * connections behind those names are closed and removed when the thread
 * exits. A pool thread that retires therefore takes its connections with it,
 * and a later thread that happens to reuse its native id starts fresh.
 * The application thread keeps one fixed name per prefix until
 * DbManager::shutdown().
 */
class DbThreadConnections {
public:
    ~DbThreadConnections();

    static QString connectionName(const QString& prefix);

private:
    DbThreadConnections() = default;

    QHash<QString, QString> m_names;
};
