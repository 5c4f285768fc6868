#pragma once
#include "dbservice.hpp"
#include "dbconfig.h"
#include "logger/logger.h"
#include <QMutex>
#include <memory>
#include <stdexcept>
#include <typeindex>

class DbManager {
public:
    static DbManager& instance();

    // Verifies the driver and a round trip; returns true at once when already initialized
    bool initialize(const DbConfig& config);

    // Close every connection and drop cached services, allowing a new initialize()
    void shutdown();

    bool isInitialized() const { return m_initialized; }
    const DbConfig& config() const { return m_config; }

    bool testConnection() const;

    // Execute a ';'-separated schema script, statements run in one transaction
    bool applySchema(const QString& scriptPath);

    template<typename T>
    DbService<T>& getService() {
        if (!m_initialized) {
            LOG_FATAL(QString("DbService<%1> requested before DbManager::initialize()").arg(typeid(T).name()));
            throw std::runtime_error("DbManager not initialized");
        }

        QMutexLocker locker(&m_servicesMutex);
        std::shared_ptr<void>& slot = m_services[std::type_index(typeid(T))];
        if (!slot) {
            slot = std::make_shared<DbService<T>>(m_config);
        }
        return *std::static_pointer_cast<DbService<T>>(slot);
    }

    static QStringList splitStatements(const QString& script);

private:
    DbManager();
    ~DbManager();

    DbManager(const DbManager&) = delete;
    DbManager& operator=(const DbManager&) = delete;

    bool checkDrivers() const;

    bool m_initialized = false;
    DbConfig m_config;
    QMutex m_servicesMutex;
    QMap<std::type_index, std::shared_ptr<void>> m_services;
};
