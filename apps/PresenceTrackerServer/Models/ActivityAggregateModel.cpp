// ActivityAggregateModel.cpp
#include "ActivityAggregateModel.h"
#include <QMetaEnum>

ActivityAggregateModel::ActivityAggregateModel(QObject *parent)
    : QObject(parent),
      m_granularity(Daily),
      m_totalTimeMs(0),
      m_sessionCount(0),
      m_activeDays(0),
      m_firstActivityMs(0),
      m_lastActivityMs(0),
      m_channelsVisited(0)
{
}

QString ActivityAggregateModel::userId() const
{
    return m_userId;
}

void ActivityAggregateModel::setUserId(const QString &userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

QString ActivityAggregateModel::guildId() const
{
    return m_guildId;
}

void ActivityAggregateModel::setGuildId(const QString &guildId)
{
    if (m_guildId != guildId) {
        m_guildId = guildId;
        emit guildIdChanged(m_guildId);
    }
}

ActivityAggregateModel::Granularity ActivityAggregateModel::granularity() const
{
    return m_granularity;
}

void ActivityAggregateModel::setGranularity(Granularity granularity)
{
    if (m_granularity != granularity) {
        m_granularity = granularity;
        emit granularityChanged(m_granularity);
    }
}

QDate ActivityAggregateModel::periodStart() const
{
    return m_periodStart;
}

void ActivityAggregateModel::setPeriodStart(const QDate &periodStart)
{
    if (m_periodStart != periodStart) {
        m_periodStart = periodStart;
        emit periodStartChanged(m_periodStart);
    }
}

QDate ActivityAggregateModel::periodEnd() const
{
    return m_periodEnd;
}

void ActivityAggregateModel::setPeriodEnd(const QDate &periodEnd)
{
    if (m_periodEnd != periodEnd) {
        m_periodEnd = periodEnd;
        emit periodEndChanged(m_periodEnd);
    }
}

qint64 ActivityAggregateModel::totalTimeMs() const
{
    return m_totalTimeMs;
}

void ActivityAggregateModel::setTotalTimeMs(qint64 totalTimeMs)
{
    if (m_totalTimeMs != totalTimeMs) {
        m_totalTimeMs = totalTimeMs;
        emit totalTimeMsChanged(m_totalTimeMs);
    }
}

int ActivityAggregateModel::sessionCount() const
{
    return m_sessionCount;
}

void ActivityAggregateModel::setSessionCount(int sessionCount)
{
    if (m_sessionCount != sessionCount) {
        m_sessionCount = sessionCount;
        emit sessionCountChanged(m_sessionCount);
    }
}

int ActivityAggregateModel::activeDays() const
{
    return m_activeDays;
}

void ActivityAggregateModel::setActiveDays(int activeDays)
{
    if (m_activeDays != activeDays) {
        m_activeDays = activeDays;
        emit activeDaysChanged(m_activeDays);
    }
}

qint64 ActivityAggregateModel::firstActivityMs() const
{
    return m_firstActivityMs;
}

void ActivityAggregateModel::setFirstActivityMs(qint64 firstActivityMs)
{
    if (m_firstActivityMs != firstActivityMs) {
        m_firstActivityMs = firstActivityMs;
        emit firstActivityMsChanged(m_firstActivityMs);
    }
}

qint64 ActivityAggregateModel::lastActivityMs() const
{
    return m_lastActivityMs;
}

void ActivityAggregateModel::setLastActivityMs(qint64 lastActivityMs)
{
    if (m_lastActivityMs != lastActivityMs) {
        m_lastActivityMs = lastActivityMs;
        emit lastActivityMsChanged(m_lastActivityMs);
    }
}

int ActivityAggregateModel::channelsVisited() const
{
    return m_channelsVisited;
}

void ActivityAggregateModel::setChannelsVisited(int channelsVisited)
{
    if (m_channelsVisited != channelsVisited) {
        m_channelsVisited = channelsVisited;
        emit channelsVisitedChanged(m_channelsVisited);
    }
}

QJsonObject ActivityAggregateModel::toJson() const
{
    QJsonObject json;
    json["userId"] = m_userId;
    json["guildId"] = m_guildId;
    json["granularity"] = QString::fromLatin1(QMetaEnum::fromType<Granularity>().valueToKey(m_granularity)).toLower();
    json["periodStart"] = m_periodStart.toString(Qt::ISODate);
    json["periodEnd"] = m_periodEnd.toString(Qt::ISODate);
    json["totalTimeMs"] = m_totalTimeMs;
    json["sessionCount"] = m_sessionCount;
    json["activeDays"] = m_activeDays;
    if (m_granularity == Daily) {
        json["firstActivityTime"] = m_firstActivityMs;
        json["lastActivityTime"] = m_lastActivityMs;
        json["channelsVisited"] = m_channelsVisited;
    }
    return json;
}

QDate ActivityAggregateModel::weekStartFor(const QDate &date)
{
    return date.addDays(1 - date.dayOfWeek());
}

QDate ActivityAggregateModel::monthStartFor(const QDate &date)
{
    return QDate(date.year(), date.month(), 1);
}
