#ifndef PRESENCETYPES_H
#define PRESENCETYPES_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QMetaType>

namespace PresenceTypes {

    Q_NAMESPACE

    // Classification of one voice state change
    enum class TransitionType {
        Join,
        Leave,
        Move,
        Update
    };
    Q_ENUM_NS(TransitionType)

    QString transitionTypeName(TransitionType type);

    // Voice state change as delivered by the platform; empty channel ids mean "not in a channel"
    struct TransitionEvent {
        QString userId;
        QString guildId;
        QString oldChannelId;
        QString newChannelId;
        qint64 timestampMs = 0;
        QString displayName;

        TransitionType type() const;
        QJsonObject toJson() const;
        static TransitionEvent fromJson(const QJsonObject& json, const QString& guildId);
    };

    struct ActiveSession {
        QString userId;
        QString guildId;
        QString channelId;
        qint64 startTimeMs = 0;
        QString displayName;

        bool isValid() const { return !userId.isEmpty() && !guildId.isEmpty() && startTimeMs > 0; }

        QJsonObject toJson() const;

        // Returns false for records missing userId, guildId or a positive startTime
        static bool fromJson(const QJsonObject& json, ActiveSession& session);
    };

}

Q_DECLARE_METATYPE(PresenceTypes::TransitionEvent)
Q_DECLARE_METATYPE(PresenceTypes::ActiveSession)

#endif // PRESENCETYPES_H
