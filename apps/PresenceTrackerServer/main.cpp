#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QNetworkInterface>
#include "Server/ApiServer.h"
#include "Managers/ConfigManager.h"
#include "logger/logger.h"

// IPv4 addresses the server can be reached on
QStringList getHostAddresses() {
    QStringList addresses;
    const QList<QHostAddress> hostAddresses = QNetworkInterface::allAddresses();

    for (const QHostAddress &address : hostAddresses) {
        if (!address.isLoopback() && address.protocol() == QAbstractSocket::IPv4Protocol) {
            addresses.append(address.toString());
        }
    }

    if (!addresses.contains("127.0.0.1")) {
        addresses.prepend("127.0.0.1");
    }

    return addresses;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("PresenceTrackerServer");
    QCoreApplication::setApplicationVersion("1.0.0");

    Logger::instance()->enableConsoleOutput(true);

    QCommandLineParser parser;
    parser.setApplicationDescription("Voice presence tracking and activity report server");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList() << "c" << "config",
                                    QCoreApplication::translate("main", "Path to the INI configuration file"),
                                    QCoreApplication::translate("main", "config"),
                                    "config/presence_tracker.ini");
    parser.addOption(configOption);

    QCommandLineOption portOption(QStringList() << "p" << "port",
                                  QCoreApplication::translate("main", "Port to listen on, overrides [Server]/port"),
                                  QCoreApplication::translate("main", "port"));
    parser.addOption(portOption);

    QCommandLineOption hostOption(QStringList() << "host",
                                  QCoreApplication::translate("main", "Host interface to bind to (IP or 'all')"),
                                  QCoreApplication::translate("main", "host"));
    parser.addOption(hostOption);

    QCommandLineOption logLevelOption(QStringList() << "l" << "log-level",
                                      QCoreApplication::translate("main", "Log level (debug, info, warning, error, fatal)"),
                                      QCoreApplication::translate("main", "level"));
    parser.addOption(logLevelOption);

    parser.process(app);

    ConfigManager config;
    config.loadFromFile(parser.value(configOption));

    if (parser.isSet(portOption)) {
        config.setPort(parser.value(portOption).toInt());
    }
    if (parser.isSet(hostOption)) {
        config.setHost(parser.value(hostOption));
    }
    if (parser.isSet(logLevelOption)) {
        config.setLogLevel(parser.value(logLevelOption));
    }

    if (config.logFilePath().isEmpty()) {
        QDir().mkpath("logs");
        config.setLogFilePath("logs/presence_tracker.log");
    }
    config.applyLoggingSettings();

    LOG_INFO("Starting Presence Tracker server");
    LOG_INFO(QString("Application version: %1").arg(QCoreApplication::applicationVersion()));

    ApiServer server(&config);

    QObject::connect(&server, &ApiServer::serverStarted, [&config](quint16 actualPort) {
        LOG_INFO(QString("Server started on port %1").arg(actualPort));
        LOG_INFO("Server is accessible at:");
        for (const QString &address : getHostAddresses()) {
            LOG_INFO(QString("  http://%1:%2/").arg(address).arg(actualPort));
        }
        if (config.host() != "all" && config.host() != "0.0.0.0") {
            LOG_INFO(QString("Server is bound to the interface: %1").arg(config.host()));
        }
    });

    QObject::connect(&server, &ApiServer::errorOccurred, [](const QString &error) {
        LOG_ERROR(QString("Server error: %1").arg(error));
    });

    if (!server.initialize()) {
        LOG_FATAL("Failed to initialize API server");
        return 1;
    }

    const QString host = config.host();
    QHostAddress bindAddress = QHostAddress::Any;
    if (host.toLower() != "all") {
        bindAddress = QHostAddress(host);
        if (bindAddress.isNull()) {
            LOG_WARNING(QString("Invalid host address: %1, using Any").arg(host));
            bindAddress = QHostAddress::Any;
        }
    }

    if (!server.start(static_cast<quint16>(config.port()), bindAddress)) {
        LOG_FATAL(QString("Failed to start API server on %1:%2").arg(host).arg(config.port()));
        return 1;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&server]() {
        LOG_INFO("Application shutting down");
        server.shutdown();
    });

    return app.exec();
}
