#ifndef AGGREGATEREPOSITORY_H
#define AGGREGATEREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/ActivityAggregateModel.h"
#include <QHash>
#include <memory>

class VoiceSessionModel;

// One row of the per-guild daily statistics view
struct DailyGuildStats {
    QDate date;
    int activeUsers = 0;
    qint64 totalTimeMs = 0;
    int sessionCount = 0;

    QJsonObject toJson() const;
};

/**
 * @brief Access to the daily, weekly and monthly roll-up tables
 *
 * Daily rows are upserted additively per completed session. Weekly and
 * monthly rows are always rebuilt from the daily rows of their period, so
 * replays and out-of-order writes converge.
 */
class AggregateRepository : public BaseRepository<ActivityAggregateModel>
{
    Q_OBJECT
public:
    explicit AggregateRepository(QObject *parent = nullptr);
    ~AggregateRepository() override;

    // Post-write hook for a newly inserted session; the caller owns the transaction
    bool applyRollup(const VoiceSessionModel &session);

    bool recomputeWeek(const QString &userId, const QString &guildId, const QDate &weekStart);
    bool recomputeMonth(const QString &userId, const QString &guildId, const QDate &monthStart);

    QList<QSharedPointer<ActivityAggregateModel>> getDaily(const QString &userId, const QString &guildId,
                                                          const QDate &from, const QDate &to, bool *ok = nullptr);
    QList<QSharedPointer<ActivityAggregateModel>> getWeekly(const QString &userId, const QString &guildId,
                                                           const QDate &fromWeek, const QDate &toWeek, bool *ok = nullptr);
    QList<QSharedPointer<ActivityAggregateModel>> getMonthly(const QString &userId, const QString &guildId,
                                                            const QDate &fromMonth, const QDate &toMonth, bool *ok = nullptr);

    /**
     * @brief Sum total_time_ms of one user over period starts in [from, to]
     * @param granularity Table to read
     * @param ok Set to false when the query fails
     */
    qint64 sumForUser(ActivityAggregateModel::Granularity granularity, const QString &userId,
                      const QString &guildId, const QDate &from, const QDate &to, bool *ok);

    /**
     * @brief Grouped totals for several users in one query
     *
     * Users without rows are absent from the result.
     */
    QHash<QString, qint64> sumForUsers(ActivityAggregateModel::Granularity granularity, const QStringList &userIds,
                                       const QString &guildId, const QDate &from, const QDate &to, bool *ok);

    QList<DailyGuildStats> dailyStats(const QString &guildId, const QDate &since, bool *ok = nullptr);

    static QString tableFor(ActivityAggregateModel::Granularity granularity);
    static QString periodColumnFor(ActivityAggregateModel::Granularity granularity);

protected:
    QString getEntityName() const override { return "ActivityAggregate"; }
    QString getTableName() const override { return "user_daily_activity"; }
    ActivityAggregateModel* createModelFromQuery(const QSqlQuery &query) override;

private:
    bool upsertDaily(const VoiceSessionModel &session);
    bool refreshChannelsVisited(const QString &userId, const QString &guildId, const QDate &day);
    bool recomputePeriod(ActivityAggregateModel::Granularity granularity, const QString &userId,
                         const QString &guildId, const QDate &periodStart, const QDate &periodEnd);

    std::unique_ptr<DbService<DailyGuildStats>> m_statsService;
};

#endif // AGGREGATEREPOSITORY_H
