// GuildSettingModel.cpp
#include "GuildSettingModel.h"

GuildSettingModel::GuildSettingModel(QObject *parent)
    : QObject(parent),
      m_id(0),
      m_updatedAt(QDateTime::currentDateTimeUtc())
{
}

qint64 GuildSettingModel::id() const
{
    return m_id;
}

void GuildSettingModel::setId(qint64 id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

QString GuildSettingModel::guildId() const
{
    return m_guildId;
}

void GuildSettingModel::setGuildId(const QString &guildId)
{
    if (m_guildId != guildId) {
        m_guildId = guildId;
        emit guildIdChanged(m_guildId);
    }
}

QString GuildSettingModel::settingType() const
{
    return m_settingType;
}

void GuildSettingModel::setSettingType(const QString &settingType)
{
    if (m_settingType != settingType) {
        m_settingType = settingType;
        emit settingTypeChanged(m_settingType);
    }
}

QString GuildSettingModel::settingKey() const
{
    return m_settingKey;
}

void GuildSettingModel::setSettingKey(const QString &settingKey)
{
    if (m_settingKey != settingKey) {
        m_settingKey = settingKey;
        emit settingKeyChanged(m_settingKey);
    }
}

QJsonObject GuildSettingModel::settingValue() const
{
    return m_settingValue;
}

void GuildSettingModel::setSettingValue(const QJsonObject &settingValue)
{
    if (m_settingValue != settingValue) {
        m_settingValue = settingValue;
        emit settingValueChanged(m_settingValue);
    }
}

QDateTime GuildSettingModel::updatedAt() const
{
    return m_updatedAt;
}

void GuildSettingModel::setUpdatedAt(const QDateTime &updatedAt)
{
    if (m_updatedAt != updatedAt) {
        m_updatedAt = updatedAt;
        emit updatedAtChanged(m_updatedAt);
    }
}

QJsonObject GuildSettingModel::toJson() const
{
    QJsonObject json;
    json["guildId"] = m_guildId;
    json["settingType"] = m_settingType;
    json["settingKey"] = m_settingKey;
    json["settingValue"] = m_settingValue;
    json["updatedAt"] = m_updatedAt.toString(Qt::ISODateWithMs);
    return json;
}
