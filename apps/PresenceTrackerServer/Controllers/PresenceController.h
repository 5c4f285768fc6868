#ifndef PRESENCECONTROLLER_H
#define PRESENCECONTROLLER_H

#include "httpserver/controller.h"

class SessionTracker;
class ActivityStore;
class InMemoryMemberDirectory;

/**
 * @brief Transition ingestion and activity queries for one guild
 *
 * POST /api/guilds/<guild>/transitions queues one event, or every entry of an
 * "events" array, for the session tracker and answers 202 immediately.
 */
class PresenceController : public Http::Controller
{
    Q_OBJECT
public:
    PresenceController(SessionTracker* tracker, ActivityStore* store, InMemoryMemberDirectory* directory,
                       QObject* parent = nullptr);
    ~PresenceController() override;

    void setupRoutes(QHttpServer& server) override;
    QString getControllerName() const override { return "PresenceController"; }

private:
    QHttpServerResponse handlePostTransitions(const QString& guildId, const QHttpServerRequest& request);
    QHttpServerResponse handleGetUserActivity(const QString& guildId, const QString& userId,
                                              const QHttpServerRequest& request);
    QHttpServerResponse handleBatchActivity(const QString& guildId, const QHttpServerRequest& request);
    QHttpServerResponse handleDailyStats(const QString& guildId, const QHttpServerRequest& request);
    QHttpServerResponse handleActiveSessions(const QString& guildId, const QHttpServerRequest& request);

    SessionTracker* m_tracker;
    ActivityStore* m_store;
    InMemoryMemberDirectory* m_directory;
};

#endif // PRESENCECONTROLLER_H
