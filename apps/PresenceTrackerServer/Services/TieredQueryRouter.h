#ifndef TIEREDQUERYROUTER_H
#define TIEREDQUERYROUTER_H

#include <QDate>
#include <QList>
#include <QString>
#include "Models/ActivityAggregateModel.h"

// One table read of a routed range; from/to are period starts for weekly and monthly segments
struct QuerySegment {
    ActivityAggregateModel::Granularity granularity = ActivityAggregateModel::Daily;
    QDate from;
    QDate to;

    QString describe() const;
    bool operator==(const QuerySegment& other) const {
        return granularity == other.granularity && from == other.from && to == other.to;
    }
};

/**
 * @brief Picks the cheapest aggregate tables that answer a day-inclusive range exactly
 *
 * Spans of up to 7 days read daily rows. Spans of up to 30 days read weekly rows
 * for every Monday-Sunday week fully inside the range and daily rows for the
 * partial weeks at either edge. Longer spans read monthly rows for every whole
 * calendar month inside the range and resolve the edges with the weekly plan.
 */
class TieredQueryRouter
{
public:
    static constexpr int DailyMaxSpanDays = 7;
    static constexpr int WeeklyMaxSpanDays = 30;

    static QList<QuerySegment> plan(const QDate& from, const QDate& to);

    // Granularity chosen by span alone
    static ActivityAggregateModel::Granularity granularityForSpan(int spanDays);

    static int spanDays(const QDate& from, const QDate& to);

private:
    static void appendDaily(QList<QuerySegment>& segments, const QDate& from, const QDate& to);
    static void appendWeeklyPlan(QList<QuerySegment>& segments, const QDate& from, const QDate& to);
    static void appendMonthlyPlan(QList<QuerySegment>& segments, const QDate& from, const QDate& to);
};

#endif // TIEREDQUERYROUTER_H
