#include "httpserver/server.h"
#include "logger/logger.h"

namespace Http {

    Server::Server(QObject* parent)
        : QObject(parent)
        , m_tcpServer(nullptr)
    {
    }

    Server::~Server() {
        stop();
    }

    void Server::registerController(std::shared_ptr<Controller> controller) {
        if (!controller) {
            return;
        }
        LOG_DEBUG(QString("Registering routes of %1").arg(controller->getControllerName()));
        controller->setupRoutes(m_server);
        m_controllers.push_back(controller);
    }

    bool Server::start(quint16 port, const QHostAddress& address) {
        if (isRunning()) {
            return true;
        }

        // QHttpServer takes ownership of bound servers
        auto* tcpServer = new QTcpServer();
        if (!tcpServer->listen(address, port)) {
            LOG_ERROR(QString("TCP server failed to listen on %1:%2: %3")
                     .arg(address.toString())
                     .arg(port)
                     .arg(tcpServer->errorString()));
            delete tcpServer;
            return false;
        }

        if (!m_server.bind(tcpServer)) {
            LOG_ERROR("Failed to bind HTTP server to TCP server");
            delete tcpServer;
            return false;
        }

        m_tcpServer = tcpServer;
        LOG_INFO(QString("HTTP server listening on %1:%2").arg(address.toString()).arg(m_tcpServer->serverPort()));
        return true;
    }

    void Server::stop() {
        if (m_tcpServer && m_tcpServer->isListening()) {
            m_tcpServer->close();
            LOG_INFO("HTTP server stopped");
        }
    }

    bool Server::isRunning() const {
        return m_tcpServer && m_tcpServer->isListening();
    }

    quint16 Server::port() const {
        return isRunning() ? m_tcpServer->serverPort() : 0;
    }

    QHostAddress Server::address() const {
        return isRunning() ? m_tcpServer->serverAddress() : QHostAddress::Any;
    }

} // namespace Http
