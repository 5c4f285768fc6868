#pragma once
#include <QString>

class DbConfig {
public:
    static DbConfig fromEnvironment();
    static DbConfig fromFile(const QString& configPath);
    static DbConfig sqlite(const QString& databasePath);

    QString driver() const { return m_driver; }
    QString host() const { return m_host; }
    QString database() const { return m_database; }
    QString username() const { return m_username; }
    QString password() const { return m_password; }
    int port() const { return m_port; }
    QString connectOptions() const { return m_connectOptions; }

    bool isSqlite() const { return m_driver == "QSQLITE"; }

    // Stable per-database prefix for named connections
    QString connectionPrefix() const;

    // Human readable target without the password
    QString describe() const;

private:
    QString m_driver = "QPSQL";
    QString m_host;
    QString m_database;
    QString m_username;
    QString m_password;
    int m_port = 5432;
    QString m_connectOptions;
};
