#include "GuildSettingsService.h"
#include "Repositories/GuildSettingsRepository.h"
#include "Models/GuildSettingModel.h"
#include "logger/logger.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace {

const char* const ExcludeChannelsKey = "channels";
const char* const ThresholdKey = "threshold";

QJsonArray toSortedArray(const QSet<QString>& values)
{
    QStringList sorted = values.values();
    sorted.sort();
    return QJsonArray::fromStringList(sorted);
}

QSet<QString> toSet(const QJsonValue& value)
{
    QSet<QString> result;
    for (const QJsonValue& item : value.toArray()) {
        const QString id = item.toString().trimmed();
        if (!id.isEmpty()) {
            result.insert(id);
        }
    }
    return result;
}

}

QJsonObject ExclusionPolicy::toJson() const
{
    QJsonObject json;
    json["excludedChannels"] = toSortedArray(fullyExcluded);
    json["activityLimitedChannels"] = toSortedArray(activityLimited);
    return json;
}

ExclusionPolicy ExclusionPolicy::fromJson(const QJsonObject& json)
{
    ExclusionPolicy policy;
    policy.fullyExcluded = toSet(json["excludedChannels"]);
    policy.activityLimited = toSet(json["activityLimitedChannels"]);
    // Older records kept a single "channels" list, all fully excluded
    if (json.contains("channels") && !json.contains("excludedChannels")) {
        policy.fullyExcluded = toSet(json["channels"]);
    }
    return policy;
}

GuildSettingsService::GuildSettingsService(GuildSettingsRepository* repository,
                                           std::shared_ptr<Cache::FallbackCache> cache, QObject* parent)
    : QObject(parent)
    , m_repository(repository)
    , m_cache(std::move(cache))
{
    LOG_DEBUG("GuildSettingsService created");
}

GuildSettingsService::~GuildSettingsService()
{
    LOG_DEBUG("GuildSettingsService destroyed");
}

QString GuildSettingsService::exclusionKey(const QString& guildId)
{
    return QString("guild_settings:%1:exclude_channels").arg(guildId);
}

QString GuildSettingsService::thresholdKey(const QString& guildId)
{
    return QString("guild_settings:%1:activity_threshold").arg(guildId);
}

QString GuildSettingsService::roleRuleKey(const QString& guildId, const QString& roleName)
{
    return QString("role_activity:%1:%2").arg(guildId, roleName);
}

QString GuildSettingsService::allRoleRulesKey(const QString& guildId)
{
    return QString("role_activity_all:%1").arg(guildId);
}

std::optional<QJsonObject> GuildSettingsService::cachedObject(const QString& key,
                                                              const std::function<std::optional<QJsonObject>()>& loader)
{
    std::optional<QByteArray> raw = m_cache->getOrLoad(key, SettingsTtlSeconds, [&loader]() -> std::optional<QByteArray> {
        std::optional<QJsonObject> loaded = loader();
        if (!loaded) {
            return std::nullopt;
        }
        return QJsonDocument(*loaded).toJson(QJsonDocument::Compact);
    });

    if (!raw) {
        return std::nullopt;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(*raw);
    if (!doc.isObject()) {
        LOG_WARNING(QString("Malformed cached settings under %1, dropping").arg(key));
        m_cache->remove(key);
        std::optional<QJsonObject> fresh = loader();
        return fresh;
    }
    return doc.object();
}

ExclusionPolicy GuildSettingsService::exclusionPolicy(const QString& guildId)
{
    std::optional<QJsonObject> json = cachedObject(exclusionKey(guildId), [this, &guildId]() -> std::optional<QJsonObject> {
        bool ok = false;
        auto setting = m_repository->get(guildId, GuildSettingModel::TypeExcludeChannels, ExcludeChannelsKey, &ok);
        if (!ok) {
            return std::nullopt;
        }
        return setting ? setting->settingValue() : ExclusionPolicy().toJson();
    });

    if (!json) {
        LOG_WARNING(QString("Exclusion policy unavailable for guild %1, tracking all channels").arg(guildId));
        return ExclusionPolicy();
    }
    return ExclusionPolicy::fromJson(*json);
}

bool GuildSettingsService::setExclusionPolicy(const QString& guildId, const ExclusionPolicy& policy)
{
    GuildSettingModel setting;
    setting.setGuildId(guildId);
    setting.setSettingType(GuildSettingModel::TypeExcludeChannels);
    setting.setSettingKey(ExcludeChannelsKey);
    setting.setSettingValue(policy.toJson());

    if (!m_repository->upsert(&setting)) {
        return false;
    }

    m_cache->invalidate(QStringList{exclusionKey(guildId)});
    LOG_INFO(QString("Exclusion policy updated for guild %1: %2 excluded, %3 activity-limited")
            .arg(guildId).arg(policy.fullyExcluded.size()).arg(policy.activityLimited.size()));
    emit settingsChanged(guildId, GuildSettingModel::TypeExcludeChannels);
    return true;
}

double GuildSettingsService::activityThresholdHours(const QString& guildId)
{
    std::optional<QJsonObject> json = cachedObject(thresholdKey(guildId), [this, &guildId]() -> std::optional<QJsonObject> {
        bool ok = false;
        auto setting = m_repository->get(guildId, GuildSettingModel::TypeActivityThreshold, ThresholdKey, &ok);
        if (!ok) {
            return std::nullopt;
        }
        QJsonObject value;
        value["thresholdHours"] = setting ? setting->settingValue()["thresholdHours"].toDouble(DefaultActivityThresholdHours)
                                          : DefaultActivityThresholdHours;
        return value;
    });

    if (!json) {
        return DefaultActivityThresholdHours;
    }
    return (*json)["thresholdHours"].toDouble(DefaultActivityThresholdHours);
}

bool GuildSettingsService::setActivityThresholdHours(const QString& guildId, double hours)
{
    if (hours < 0 || hours > 24 * 31) {
        LOG_WARNING(QString("Rejected activity threshold %1 for guild %2").arg(hours).arg(guildId));
        return false;
    }

    GuildSettingModel setting;
    setting.setGuildId(guildId);
    setting.setSettingType(GuildSettingModel::TypeActivityThreshold);
    setting.setSettingKey(ThresholdKey);
    QJsonObject value;
    value["thresholdHours"] = hours;
    setting.setSettingValue(value);

    if (!m_repository->upsert(&setting)) {
        return false;
    }

    m_cache->invalidate(QStringList{thresholdKey(guildId)});
    emit settingsChanged(guildId, GuildSettingModel::TypeActivityThreshold);
    return true;
}

std::optional<double> GuildSettingsService::roleMinHours(const QString& guildId, const QString& roleName)
{
    std::optional<QJsonObject> json = cachedObject(roleRuleKey(guildId, roleName),
                                                   [this, &guildId, &roleName]() -> std::optional<QJsonObject> {
        bool ok = false;
        auto setting = m_repository->get(guildId, GuildSettingModel::TypeRoleActivity, roleName, &ok);
        if (!ok) {
            return std::nullopt;
        }
        QJsonObject value;
        value["exists"] = static_cast<bool>(setting);
        if (setting) {
            value["minHours"] = setting->settingValue()["minHours"].toDouble();
        }
        return value;
    });

    if (!json || !(*json)["exists"].toBool()) {
        return std::nullopt;
    }
    return (*json)["minHours"].toDouble();
}

QMap<QString, double> GuildSettingsService::allRoleRules(const QString& guildId)
{
    std::optional<QJsonObject> json = cachedObject(allRoleRulesKey(guildId), [this, &guildId]() -> std::optional<QJsonObject> {
        bool ok = false;
        const auto settings = m_repository->getByType(guildId, GuildSettingModel::TypeRoleActivity, &ok);
        if (!ok) {
            return std::nullopt;
        }
        QJsonObject rules;
        for (const auto& setting : settings) {
            rules[setting->settingKey()] = setting->settingValue()["minHours"].toDouble();
        }
        return rules;
    });

    QMap<QString, double> rules;
    if (!json) {
        return rules;
    }
    for (auto it = json->constBegin(); it != json->constEnd(); ++it) {
        rules.insert(it.key(), it.value().toDouble());
    }
    return rules;
}

bool GuildSettingsService::setRoleMinHours(const QString& guildId, const QString& roleName, double minHours)
{
    if (roleName.trimmed().isEmpty() || minHours < 0) {
        LOG_WARNING(QString("Rejected role rule '%1' = %2 for guild %3").arg(roleName).arg(minHours).arg(guildId));
        return false;
    }

    GuildSettingModel setting;
    setting.setGuildId(guildId);
    setting.setSettingType(GuildSettingModel::TypeRoleActivity);
    setting.setSettingKey(roleName);
    QJsonObject value;
    value["minHours"] = minHours;
    value["warningThreshold"] = static_cast<int>(minHours * 0.8);
    setting.setSettingValue(value);

    if (!m_repository->upsert(&setting)) {
        return false;
    }

    m_cache->invalidate(QStringList{roleRuleKey(guildId, roleName), allRoleRulesKey(guildId)});
    emit settingsChanged(guildId, GuildSettingModel::TypeRoleActivity);
    return true;
}

bool GuildSettingsService::removeRoleRule(const QString& guildId, const QString& roleName)
{
    if (!m_repository->remove(guildId, GuildSettingModel::TypeRoleActivity, roleName)) {
        return false;
    }

    m_cache->invalidate(QStringList{roleRuleKey(guildId, roleName), allRoleRulesKey(guildId)});
    emit settingsChanged(guildId, GuildSettingModel::TypeRoleActivity);
    return true;
}
