// ReportCacheModel.cpp
#include "ReportCacheModel.h"

ReportCacheModel::ReportCacheModel(QObject *parent)
    : QObject(parent),
      m_generatedAtMs(0),
      m_expiresAtMs(0),
      m_userCount(0),
      m_generationTimeMs(0)
{
}

QString ReportCacheModel::cacheKey() const
{
    return m_cacheKey;
}

void ReportCacheModel::setCacheKey(const QString &cacheKey)
{
    if (m_cacheKey != cacheKey) {
        m_cacheKey = cacheKey;
        emit cacheKeyChanged(m_cacheKey);
    }
}

QString ReportCacheModel::guildId() const
{
    return m_guildId;
}

void ReportCacheModel::setGuildId(const QString &guildId)
{
    if (m_guildId != guildId) {
        m_guildId = guildId;
        emit guildIdChanged(m_guildId);
    }
}

QJsonObject ReportCacheModel::payload() const
{
    return m_payload;
}

void ReportCacheModel::setPayload(const QJsonObject &payload)
{
    if (m_payload != payload) {
        m_payload = payload;
        emit payloadChanged(m_payload);
    }
}

qint64 ReportCacheModel::generatedAtMs() const
{
    return m_generatedAtMs;
}

void ReportCacheModel::setGeneratedAtMs(qint64 generatedAtMs)
{
    if (m_generatedAtMs != generatedAtMs) {
        m_generatedAtMs = generatedAtMs;
        emit generatedAtMsChanged(m_generatedAtMs);
    }
}

qint64 ReportCacheModel::expiresAtMs() const
{
    return m_expiresAtMs;
}

void ReportCacheModel::setExpiresAtMs(qint64 expiresAtMs)
{
    if (m_expiresAtMs != expiresAtMs) {
        m_expiresAtMs = expiresAtMs;
        emit expiresAtMsChanged(m_expiresAtMs);
    }
}

int ReportCacheModel::userCount() const
{
    return m_userCount;
}

void ReportCacheModel::setUserCount(int userCount)
{
    if (m_userCount != userCount) {
        m_userCount = userCount;
        emit userCountChanged(m_userCount);
    }
}

qint64 ReportCacheModel::generationTimeMs() const
{
    return m_generationTimeMs;
}

void ReportCacheModel::setGenerationTimeMs(qint64 generationTimeMs)
{
    if (m_generationTimeMs != generationTimeMs) {
        m_generationTimeMs = generationTimeMs;
        emit generationTimeMsChanged(m_generationTimeMs);
    }
}
