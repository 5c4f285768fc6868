#ifndef STATUSCONTROLLER_H
#define STATUSCONTROLLER_H

#include "httpserver/controller.h"
#include "cache/fallbackcache.h"
#include <QDateTime>
#include <memory>

class SessionTracker;
class ReportEngine;

// Health and runtime statistics of the service
class StatusController : public Http::Controller
{
    Q_OBJECT
public:
    StatusController(SessionTracker* tracker, ReportEngine* engine, std::shared_ptr<Cache::FallbackCache> cache,
                     QObject* parent = nullptr);
    ~StatusController() override;

    void setupRoutes(QHttpServer& server) override;
    QString getControllerName() const override { return "StatusController"; }

private:
    QHttpServerResponse handlePing(const QHttpServerRequest& request);
    QHttpServerResponse handleStatus(const QHttpServerRequest& request);

    SessionTracker* m_tracker;
    ReportEngine* m_engine;
    std::shared_ptr<Cache::FallbackCache> m_cache;
    QDateTime m_startTime;
};

#endif // STATUSCONTROLLER_H
