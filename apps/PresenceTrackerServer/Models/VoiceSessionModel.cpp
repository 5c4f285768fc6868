// VoiceSessionModel.cpp
#include "VoiceSessionModel.h"
#include <QTimeZone>

VoiceSessionModel::VoiceSessionModel(QObject *parent)
    : QObject(parent),
      m_id(0),
      m_startTimeMs(0),
      m_endTimeMs(0)
{
    m_createdAt = QDateTime::currentDateTimeUtc();
}

qint64 VoiceSessionModel::id() const
{
    return m_id;
}

void VoiceSessionModel::setId(qint64 id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

QString VoiceSessionModel::userId() const
{
    return m_userId;
}

void VoiceSessionModel::setUserId(const QString &userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

QString VoiceSessionModel::guildId() const
{
    return m_guildId;
}

void VoiceSessionModel::setGuildId(const QString &guildId)
{
    if (m_guildId != guildId) {
        m_guildId = guildId;
        emit guildIdChanged(m_guildId);
    }
}

QString VoiceSessionModel::channelId() const
{
    return m_channelId;
}

void VoiceSessionModel::setChannelId(const QString &channelId)
{
    if (m_channelId != channelId) {
        m_channelId = channelId;
        emit channelIdChanged(m_channelId);
    }
}

QString VoiceSessionModel::userName() const
{
    return m_userName;
}

void VoiceSessionModel::setUserName(const QString &userName)
{
    if (m_userName != userName) {
        m_userName = userName;
        emit userNameChanged(m_userName);
    }
}

qint64 VoiceSessionModel::startTimeMs() const
{
    return m_startTimeMs;
}

void VoiceSessionModel::setStartTimeMs(qint64 startTimeMs)
{
    if (m_startTimeMs != startTimeMs) {
        m_startTimeMs = startTimeMs;
        emit startTimeMsChanged(m_startTimeMs);
    }
}

qint64 VoiceSessionModel::endTimeMs() const
{
    return m_endTimeMs;
}

void VoiceSessionModel::setEndTimeMs(qint64 endTimeMs)
{
    if (m_endTimeMs != endTimeMs) {
        m_endTimeMs = endTimeMs;
        emit endTimeMsChanged(m_endTimeMs);
    }
}

QDateTime VoiceSessionModel::createdAt() const
{
    return m_createdAt;
}

void VoiceSessionModel::setCreatedAt(const QDateTime &createdAt)
{
    if (m_createdAt != createdAt) {
        m_createdAt = createdAt;
        emit createdAtChanged(m_createdAt);
    }
}

qint64 VoiceSessionModel::durationMs() const
{
    return qMax<qint64>(0, m_endTimeMs - m_startTimeMs);
}

QDate VoiceSessionModel::activityDate() const
{
    return QDateTime::fromMSecsSinceEpoch(m_startTimeMs, QTimeZone::UTC).date();
}

QJsonObject VoiceSessionModel::toJson() const
{
    QJsonObject json;
    json["id"] = QString::number(m_id);
    json["userId"] = m_userId;
    json["guildId"] = m_guildId;
    json["channelId"] = m_channelId;
    json["userName"] = m_userName;
    json["startTime"] = m_startTimeMs;
    json["endTime"] = m_endTimeMs;
    json["durationMs"] = durationMs();
    json["activityDate"] = activityDate().toString(Qt::ISODate);
    return json;
}

QString VoiceSessionModel::debugInfo() const
{
    return QString("VoiceSession[user=%1 guild=%2 channel=%3 start=%4 end=%5 duration=%6ms]")
        .arg(m_userId, m_guildId, m_channelId)
        .arg(m_startTimeMs)
        .arg(m_endTimeMs)
        .arg(durationMs());
}
