#ifndef REPORTCONTROLLER_H
#define REPORTCONTROLLER_H

#include "httpserver/controller.h"
#include <QHash>

class ReportEngine;
class InMemoryMemberDirectory;

/**
 * @brief Asynchronous report generation
 *
 * A POST starts an operation and returns its id; clients poll
 * GET /api/reports/<id> for progress, the latest partial preview and the final
 * result, and may cancel with DELETE.
 */
class ReportController : public Http::Controller
{
    Q_OBJECT
public:
    ReportController(ReportEngine* engine, InMemoryMemberDirectory* directory, QObject* parent = nullptr);
    ~ReportController() override;

    void setupRoutes(QHttpServer& server) override;
    QString getControllerName() const override { return "ReportController"; }

private slots:
    void rememberPartial(const QString& operationId, const QJsonObject& partial);
    void forgetOperation(const QString& operationId);

private:
    QHttpServerResponse handleCreateReport(const QString& guildId, const QHttpServerRequest& request);
    QHttpServerResponse handleGetReport(const QString& operationId, const QHttpServerRequest& request);
    QHttpServerResponse handleCancelReport(const QString& operationId, const QHttpServerRequest& request);

    ReportEngine* m_engine;
    InMemoryMemberDirectory* m_directory;
    // Latest partial preview per running operation
    QHash<QString, QJsonObject> m_latestPartials;
};

#endif // REPORTCONTROLLER_H
