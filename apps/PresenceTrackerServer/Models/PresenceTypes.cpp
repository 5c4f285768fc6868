#include "PresenceTypes.h"
#include <QMetaEnum>

namespace PresenceTypes {

QString transitionTypeName(TransitionType type)
{
    return QString::fromLatin1(QMetaEnum::fromType<TransitionType>().valueToKey(static_cast<int>(type))).toLower();
}

TransitionType TransitionEvent::type() const
{
    if (oldChannelId.isEmpty() && !newChannelId.isEmpty()) {
        return TransitionType::Join;
    }
    if (!oldChannelId.isEmpty() && newChannelId.isEmpty()) {
        return TransitionType::Leave;
    }
    if (!oldChannelId.isEmpty() && !newChannelId.isEmpty() && oldChannelId != newChannelId) {
        return TransitionType::Move;
    }
    return TransitionType::Update;
}

QJsonObject TransitionEvent::toJson() const
{
    QJsonObject json;
    json["userId"] = userId;
    json["guildId"] = guildId;
    json["oldChannelId"] = oldChannelId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(oldChannelId);
    json["newChannelId"] = newChannelId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(newChannelId);
    json["timestamp"] = timestampMs;
    json["displayName"] = displayName;
    json["type"] = transitionTypeName(type());
    return json;
}

TransitionEvent TransitionEvent::fromJson(const QJsonObject& json, const QString& guildId)
{
    TransitionEvent event;
    event.userId = json["userId"].toString();
    event.guildId = guildId.isEmpty() ? json["guildId"].toString() : guildId;
    event.oldChannelId = json["oldChannelId"].toString();
    event.newChannelId = json["newChannelId"].toString();
    event.timestampMs = static_cast<qint64>(json["timestamp"].toDouble(0));
    event.displayName = json["displayName"].toString();
    return event;
}

QJsonObject ActiveSession::toJson() const
{
    QJsonObject json;
    json["userId"] = userId;
    json["guildId"] = guildId;
    json["channelId"] = channelId;
    json["startTime"] = startTimeMs;
    json["displayName"] = displayName;
    return json;
}

bool ActiveSession::fromJson(const QJsonObject& json, ActiveSession& session)
{
    ActiveSession parsed;
    parsed.userId = json["userId"].toString();
    parsed.guildId = json["guildId"].toString();
    parsed.channelId = json["channelId"].toString();
    parsed.startTimeMs = static_cast<qint64>(json["startTime"].toDouble(0));
    parsed.displayName = json["displayName"].toString();
    if (!parsed.isValid()) {
        return false;
    }
    session = parsed;
    return true;
}

}
