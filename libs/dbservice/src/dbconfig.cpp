#include "dbservice/dbconfig.h"
#include <QSettings>
#include <QProcessEnvironment>
#include <QCryptographicHash>

namespace {

QString defaultOptionsFor(const QString& driver) {
    if (driver == "QSQLITE") {
        return "QSQLITE_BUSY_TIMEOUT=5000";
    }
    return "application_name=PresenceTracker";
}

} // namespace

DbConfig DbConfig::fromEnvironment() {
    DbConfig config;
    auto env = QProcessEnvironment::systemEnvironment();

    config.m_driver = env.value("DB_DRIVER", "QPSQL").toUpper();
    config.m_host = env.value("DB_HOST", "localhost");
    config.m_database = env.value("DB_NAME", "presence_tracker");
    config.m_username = env.value("DB_USER", "postgres");
    config.m_password = env.value("DB_PASSWORD", "");
    config.m_port = env.value("DB_PORT", "5432").toInt();
    config.m_connectOptions = env.value("DB_OPTIONS", defaultOptionsFor(config.m_driver));

    return config;
}

DbConfig DbConfig::fromFile(const QString& configPath) {
    DbConfig config;
    QSettings settings(configPath, QSettings::IniFormat);

    settings.beginGroup("Database");
    config.m_driver = settings.value("driver", "QPSQL").toString().toUpper();
    config.m_host = settings.value("host", "localhost").toString();
    config.m_database = settings.value("database", "presence_tracker").toString();
    config.m_username = settings.value("username", "postgres").toString();
    config.m_password = settings.value("password", "").toString();
    config.m_port = settings.value("port", 5432).toInt();
    config.m_connectOptions = settings.value("options", defaultOptionsFor(config.m_driver)).toString();
    settings.endGroup();

    return config;
}

DbConfig DbConfig::sqlite(const QString& databasePath) {
    DbConfig config;
    config.m_driver = "QSQLITE";
    config.m_database = databasePath;
    config.m_port = 0;
    config.m_connectOptions = defaultOptionsFor(config.m_driver);
    return config;
}

QString DbConfig::connectionPrefix() const {
    const QByteArray identity = QString("%1|%2|%3|%4|%5")
        .arg(m_driver, m_host, m_database, m_username)
        .arg(m_port)
        .toUtf8();
    return QString("presence_%1")
        .arg(QString::fromLatin1(QCryptographicHash::hash(identity, QCryptographicHash::Md5).toHex().left(12)));
}

QString DbConfig::describe() const {
    if (isSqlite()) {
        return QString("%1:%2").arg(m_driver, m_database);
    }
    return QString("%1:%2@%3:%4/%5").arg(m_driver, m_username, m_host).arg(m_port).arg(m_database);
}
