#include "AggregateRepository.h"
#include "Models/VoiceSessionModel.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

QJsonObject DailyGuildStats::toJson() const
{
    QJsonObject json;
    json["date"] = date.toString(Qt::ISODate);
    json["activeUsers"] = activeUsers;
    json["totalTimeMs"] = totalTimeMs;
    json["sessionCount"] = sessionCount;
    return json;
}

AggregateRepository::AggregateRepository(QObject *parent)
    : BaseRepository<ActivityAggregateModel>(parent)
{
    LOG_DEBUG("AggregateRepository created");
}

AggregateRepository::~AggregateRepository() = default;

QString AggregateRepository::tableFor(ActivityAggregateModel::Granularity granularity)
{
    switch (granularity) {
        case ActivityAggregateModel::Weekly:  return "user_weekly_activity";
        case ActivityAggregateModel::Monthly: return "user_monthly_activity";
        case ActivityAggregateModel::Daily:
        default:                              return "user_daily_activity";
    }
}

QString AggregateRepository::periodColumnFor(ActivityAggregateModel::Granularity granularity)
{
    switch (granularity) {
        case ActivityAggregateModel::Weekly:  return "week_start_date";
        case ActivityAggregateModel::Monthly: return "activity_month";
        case ActivityAggregateModel::Daily:
        default:                              return "activity_date";
    }
}

ActivityAggregateModel* AggregateRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createDailyActivityFromQuery(query);
}

bool AggregateRepository::applyRollup(const VoiceSessionModel &session)
{
    const QDate day = session.activityDate();

    if (!upsertDaily(session)) {
        return false;
    }
    if (!refreshChannelsVisited(session.userId(), session.guildId(), day)) {
        return false;
    }
    if (!recomputeWeek(session.userId(), session.guildId(), ActivityAggregateModel::weekStartFor(day))) {
        return false;
    }
    if (!recomputeMonth(session.userId(), session.guildId(), ActivityAggregateModel::monthStartFor(day))) {
        return false;
    }

    LOG_DEBUG(QString("Rollup applied for user %1 in guild %2 on %3 (+%4 ms)")
             .arg(session.userId(), session.guildId(), day.toString(Qt::ISODate))
             .arg(session.durationMs()));
    return true;
}

bool AggregateRepository::upsertDaily(const VoiceSessionModel &session)
{
    QMap<QString, QVariant> params;
    params["user_id"] = session.userId();
    params["guild_id"] = session.guildId();
    params["activity_date"] = dateValue(session.activityDate());
    params["duration_ms"] = session.durationMs();
    params["start_time_ms"] = session.startTimeMs();
    params["end_time_ms"] = session.endTimeMs();

    // CASE instead of LEAST/GREATEST keeps the statement portable to SQLite
    const QString query = QString(
        "INSERT INTO user_daily_activity "
        "(user_id, guild_id, activity_date, total_time_ms, session_count, first_activity_ms, last_activity_ms, channels_visited) "
        "VALUES (:user_id, :guild_id, %1, :duration_ms, 1, :start_time_ms, :end_time_ms, 1) "
        "ON CONFLICT (user_id, guild_id, activity_date) DO UPDATE SET "
        "total_time_ms = user_daily_activity.total_time_ms + excluded.total_time_ms, "
        "session_count = user_daily_activity.session_count + 1, "
        "first_activity_ms = CASE WHEN user_daily_activity.first_activity_ms IS NULL "
        "OR excluded.first_activity_ms < user_daily_activity.first_activity_ms "
        "THEN excluded.first_activity_ms ELSE user_daily_activity.first_activity_ms END, "
        "last_activity_ms = CASE WHEN user_daily_activity.last_activity_ms IS NULL "
        "OR excluded.last_activity_ms > user_daily_activity.last_activity_ms "
        "THEN excluded.last_activity_ms ELSE user_daily_activity.last_activity_ms END, "
        "updated_at = CURRENT_TIMESTAMP")
        .arg(dateParam("activity_date"));

    return modify(query, params);
}

bool AggregateRepository::refreshChannelsVisited(const QString &userId, const QString &guildId, const QDate &day)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;
    params["guild_id"] = guildId;
    params["activity_date"] = dateValue(day);

    return modify(
        "UPDATE user_daily_activity SET channels_visited = ("
        "SELECT COUNT(DISTINCT channel_id) FROM voice_sessions "
        "WHERE voice_sessions.user_id = :user_id AND voice_sessions.guild_id = :guild_id "
        "AND voice_sessions.activity_date = :activity_date) "
        "WHERE user_id = :user_id AND guild_id = :guild_id AND activity_date = :activity_date",
        params);
}

bool AggregateRepository::recomputeWeek(const QString &userId, const QString &guildId, const QDate &weekStart)
{
    return recomputePeriod(ActivityAggregateModel::Weekly, userId, guildId, weekStart, weekStart.addDays(6));
}

bool AggregateRepository::recomputeMonth(const QString &userId, const QString &guildId, const QDate &monthStart)
{
    return recomputePeriod(ActivityAggregateModel::Monthly, userId, guildId, monthStart,
                           monthStart.addMonths(1).addDays(-1));
}

bool AggregateRepository::recomputePeriod(ActivityAggregateModel::Granularity granularity, const QString &userId,
                                          const QString &guildId, const QDate &periodStart, const QDate &periodEnd)
{
    const QString table = tableFor(granularity);
    const QString column = periodColumnFor(granularity);

    QMap<QString, QVariant> params;
    params["user_id"] = userId;
    params["guild_id"] = guildId;
    params["period_start"] = dateValue(periodStart);
    params["period_end"] = dateValue(periodEnd);

    // Full recompute from the daily rows; the period row converges under replay
    const QString query = QString(
        "INSERT INTO %1 (user_id, guild_id, %2, total_time_ms, session_count, active_days) "
        "SELECT user_id, guild_id, %3, SUM(total_time_ms), SUM(session_count), COUNT(*) "
        "FROM user_daily_activity "
        "WHERE user_id = :user_id AND guild_id = :guild_id "
        "AND activity_date >= :period_start AND activity_date <= :period_end "
        "GROUP BY user_id, guild_id "
        "ON CONFLICT (user_id, guild_id, %2) DO UPDATE SET "
        "total_time_ms = excluded.total_time_ms, "
        "session_count = excluded.session_count, "
        "active_days = excluded.active_days, "
        "updated_at = CURRENT_TIMESTAMP")
        .arg(table, column, dateParam("period_start"));

    if (!modify(query, params)) {
        LOG_ERROR(QString("Failed to recompute %1 row for user %2 in guild %3 starting %4")
                 .arg(table, userId, guildId, periodStart.toString(Qt::ISODate)));
        return false;
    }
    return true;
}

QList<QSharedPointer<ActivityAggregateModel>> AggregateRepository::getDaily(const QString &userId, const QString &guildId,
                                                                           const QDate &from, const QDate &to, bool *ok)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;
    params["guild_id"] = guildId;
    params["from_date"] = dateValue(from);
    params["to_date"] = dateValue(to);

    return selectMany(
        "SELECT * FROM user_daily_activity "
        "WHERE user_id = :user_id AND guild_id = :guild_id "
        "AND activity_date >= :from_date AND activity_date <= :to_date "
        "ORDER BY activity_date",
        params, ok);
}

QList<QSharedPointer<ActivityAggregateModel>> AggregateRepository::getWeekly(const QString &userId, const QString &guildId,
                                                                            const QDate &fromWeek, const QDate &toWeek, bool *ok)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;
    params["guild_id"] = guildId;
    params["from_date"] = dateValue(fromWeek);
    params["to_date"] = dateValue(toWeek);

    return selectMany(
        "SELECT * FROM user_weekly_activity "
        "WHERE user_id = :user_id AND guild_id = :guild_id "
        "AND week_start_date >= :from_date AND week_start_date <= :to_date "
        "ORDER BY week_start_date",
        params, ok,
        [](const QSqlQuery &row) -> ActivityAggregateModel* {
            return ModelFactory::createWeeklyActivityFromQuery(row);
        });
}

QList<QSharedPointer<ActivityAggregateModel>> AggregateRepository::getMonthly(const QString &userId, const QString &guildId,
                                                                             const QDate &fromMonth, const QDate &toMonth, bool *ok)
{
    QMap<QString, QVariant> params;
    params["user_id"] = userId;
    params["guild_id"] = guildId;
    params["from_date"] = dateValue(fromMonth);
    params["to_date"] = dateValue(toMonth);

    return selectMany(
        "SELECT * FROM user_monthly_activity "
        "WHERE user_id = :user_id AND guild_id = :guild_id "
        "AND activity_month >= :from_date AND activity_month <= :to_date "
        "ORDER BY activity_month",
        params, ok,
        [](const QSqlQuery &row) -> ActivityAggregateModel* {
            return ModelFactory::createMonthlyActivityFromQuery(row);
        });
}

qint64 AggregateRepository::sumForUser(ActivityAggregateModel::Granularity granularity, const QString &userId,
                                       const QString &guildId, const QDate &from, const QDate &to, bool *ok)
{
    const QHash<QString, qint64> totals = sumForUsers(granularity, QStringList{userId}, guildId, from, to, ok);
    return totals.value(userId, 0);
}

QHash<QString, qint64> AggregateRepository::sumForUsers(ActivityAggregateModel::Granularity granularity,
                                                        const QStringList &userIds, const QString &guildId,
                                                        const QDate &from, const QDate &to, bool *ok)
{
    QHash<QString, qint64> totals;
    if (ok) {
        *ok = true;
    }
    if (userIds.isEmpty()) {
        return totals;
    }

    QMap<QString, QVariant> params;
    params["guild_id"] = guildId;
    params["from_date"] = dateValue(from);
    params["to_date"] = dateValue(to);

    QStringList placeholders;
    for (int i = 0; i < userIds.size(); ++i) {
        const QString name = QString("u%1").arg(i);
        placeholders << ":" + name;
        params[name] = userIds.at(i);
    }

    const QString column = periodColumnFor(granularity);
    const QString query = QString(
        "SELECT user_id, SUM(total_time_ms) AS total_time_ms FROM %1 "
        "WHERE guild_id = :guild_id AND %2 >= :from_date AND %2 <= :to_date "
        "AND user_id IN (%3) "
        "GROUP BY user_id")
        .arg(tableFor(granularity), column, placeholders.join(", "));

    bool queryOk = false;
    const auto rows = selectMany(query, params, &queryOk,
        [](const QSqlQuery &row) -> ActivityAggregateModel* {
            return ModelFactory::createUserTotalFromQuery(row);
        });

    if (!queryOk) {
        if (ok) {
            *ok = false;
        }
        return QHash<QString, qint64>();
    }

    for (const auto &row : rows) {
        totals[row->userId()] += row->totalTimeMs();
    }
    return totals;
}

QList<DailyGuildStats> AggregateRepository::dailyStats(const QString &guildId, const QDate &since, bool *ok)
{
    if (ok) {
        *ok = false;
    }
    if (!ensureInitialized()) {
        return QList<DailyGuildStats>();
    }

    if (!m_statsService) {
        m_statsService = std::make_unique<DbService<DailyGuildStats>>(m_dbService->config());
    }

    QMap<QString, QVariant> params;
    params["guild_id"] = guildId;
    params["since"] = dateValue(since);

    bool queryOk = false;
    const QList<DailyGuildStats*> rows = m_statsService->executeSelectQuery(
        "SELECT activity_date, COUNT(DISTINCT user_id) AS active_users, "
        "SUM(total_time_ms) AS total_time_ms, SUM(session_count) AS session_count "
        "FROM user_daily_activity "
        "WHERE guild_id = :guild_id AND activity_date >= :since "
        "GROUP BY activity_date ORDER BY activity_date DESC",
        params,
        [](const QSqlQuery &row) -> DailyGuildStats* {
            auto *stats = new DailyGuildStats();
            stats->date = row.value("activity_date").toDate();
            if (!stats->date.isValid()) {
                stats->date = QDate::fromString(row.value("activity_date").toString().left(10), Qt::ISODate);
            }
            stats->activeUsers = row.value("active_users").toInt();
            stats->totalTimeMs = static_cast<qint64>(row.value("total_time_ms").toDouble());
            stats->sessionCount = row.value("session_count").toInt();
            return stats;
        },
        &queryOk);

    QList<DailyGuildStats> result;
    for (DailyGuildStats *row : rows) {
        result.append(*row);
    }
    qDeleteAll(rows);

    if (ok) {
        *ok = queryOk;
    }
    return result;
}
