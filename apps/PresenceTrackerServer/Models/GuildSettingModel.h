// GuildSettingModel.h
#ifndef GUILDSETTINGMODEL_H
#define GUILDSETTINGMODEL_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QJsonObject>

// Row of guild_settings; the value column holds a JSON document whose shape depends on settingType
class GuildSettingModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(qint64 id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(QString guildId READ guildId WRITE setGuildId NOTIFY guildIdChanged)
    Q_PROPERTY(QString settingType READ settingType WRITE setSettingType NOTIFY settingTypeChanged)
    Q_PROPERTY(QString settingKey READ settingKey WRITE setSettingKey NOTIFY settingKeyChanged)
    Q_PROPERTY(QJsonObject settingValue READ settingValue WRITE setSettingValue NOTIFY settingValueChanged)
    Q_PROPERTY(QDateTime updatedAt READ updatedAt WRITE setUpdatedAt NOTIFY updatedAtChanged)

public:
    static constexpr const char* TypeRoleActivity = "role_activity";
    static constexpr const char* TypeExcludeChannels = "exclude_channels";
    static constexpr const char* TypeActivityThreshold = "guild_activity_threshold";

    explicit GuildSettingModel(QObject *parent = nullptr);

    qint64 id() const;
    void setId(qint64 id);

    QString guildId() const;
    void setGuildId(const QString &guildId);

    QString settingType() const;
    void setSettingType(const QString &settingType);

    QString settingKey() const;
    void setSettingKey(const QString &settingKey);

    QJsonObject settingValue() const;
    void setSettingValue(const QJsonObject &settingValue);

    QDateTime updatedAt() const;
    void setUpdatedAt(const QDateTime &updatedAt);

    QJsonObject toJson() const;

signals:
    void idChanged(qint64 id);
    void guildIdChanged(const QString &guildId);
    void settingTypeChanged(const QString &settingType);
    void settingKeyChanged(const QString &settingKey);
    void settingValueChanged(const QJsonObject &settingValue);
    void updatedAtChanged(const QDateTime &updatedAt);

private:
    qint64 m_id;
    QString m_guildId;
    QString m_settingType;
    QString m_settingKey;
    QJsonObject m_settingValue;
    QDateTime m_updatedAt;
};

#endif // GUILDSETTINGMODEL_H
