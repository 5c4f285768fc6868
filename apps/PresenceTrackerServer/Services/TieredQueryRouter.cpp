#include "TieredQueryRouter.h"

QString QuerySegment::describe() const
{
    static const char* names[] = {"daily", "weekly", "monthly"};
    return QString("%1[%2..%3]").arg(QString::fromLatin1(names[granularity]),
                                     from.toString(Qt::ISODate), to.toString(Qt::ISODate));
}

int TieredQueryRouter::spanDays(const QDate& from, const QDate& to)
{
    return static_cast<int>(from.daysTo(to)) + 1;
}

ActivityAggregateModel::Granularity TieredQueryRouter::granularityForSpan(int spanDays)
{
    if (spanDays <= DailyMaxSpanDays) {
        return ActivityAggregateModel::Daily;
    }
    if (spanDays <= WeeklyMaxSpanDays) {
        return ActivityAggregateModel::Weekly;
    }
    return ActivityAggregateModel::Monthly;
}

QList<QuerySegment> TieredQueryRouter::plan(const QDate& from, const QDate& to)
{
    QList<QuerySegment> segments;
    if (!from.isValid() || !to.isValid() || from > to) {
        return segments;
    }

    switch (granularityForSpan(spanDays(from, to))) {
        case ActivityAggregateModel::Daily:
            appendDaily(segments, from, to);
            break;
        case ActivityAggregateModel::Weekly:
            appendWeeklyPlan(segments, from, to);
            break;
        case ActivityAggregateModel::Monthly:
            appendMonthlyPlan(segments, from, to);
            break;
    }
    return segments;
}

void TieredQueryRouter::appendDaily(QList<QuerySegment>& segments, const QDate& from, const QDate& to)
{
    if (from > to) {
        return;
    }
    segments.append({ActivityAggregateModel::Daily, from, to});
}

void TieredQueryRouter::appendWeeklyPlan(QList<QuerySegment>& segments, const QDate& from, const QDate& to)
{
    if (from > to) {
        return;
    }

    QDate firstWeek = ActivityAggregateModel::weekStartFor(from);
    if (firstWeek < from) {
        firstWeek = firstWeek.addDays(7);
    }

    QDate lastWeek = ActivityAggregateModel::weekStartFor(to);
    if (lastWeek.addDays(6) > to) {
        lastWeek = lastWeek.addDays(-7);
    }

    if (firstWeek > lastWeek) {
        appendDaily(segments, from, to);
        return;
    }

    appendDaily(segments, from, firstWeek.addDays(-1));
    segments.append({ActivityAggregateModel::Weekly, firstWeek, lastWeek});
    appendDaily(segments, lastWeek.addDays(7), to);
}

void TieredQueryRouter::appendMonthlyPlan(QList<QuerySegment>& segments, const QDate& from, const QDate& to)
{
    QDate firstMonth = ActivityAggregateModel::monthStartFor(from);
    if (firstMonth < from) {
        firstMonth = firstMonth.addMonths(1);
    }

    QDate lastMonth = ActivityAggregateModel::monthStartFor(to);
    if (lastMonth.addMonths(1).addDays(-1) > to) {
        lastMonth = lastMonth.addMonths(-1);
    }

    if (firstMonth > lastMonth) {
        appendWeeklyPlan(segments, from, to);
        return;
    }

    appendWeeklyPlan(segments, from, firstMonth.addDays(-1));
    segments.append({ActivityAggregateModel::Monthly, firstMonth, lastMonth});
    appendWeeklyPlan(segments, lastMonth.addMonths(1), to);
}
