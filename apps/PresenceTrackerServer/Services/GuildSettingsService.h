#ifndef GUILDSETTINGSSERVICE_H
#define GUILDSETTINGSSERVICE_H

#include <QObject>
#include <QSet>
#include <QMap>
#include <QJsonObject>
#include <memory>
#include <optional>
#include <functional>

#include "cache/fallbackcache.h"

class GuildSettingsRepository;

// Per-guild channel exclusion lists
struct ExclusionPolicy {
    // No session tracking and no activity log
    QSet<QString> fullyExcluded;
    // Activity log only, no duration accrual
    QSet<QString> activityLimited;

    bool isFullyExcluded(const QString& channelId) const { return fullyExcluded.contains(channelId); }
    bool isActivityLimited(const QString& channelId) const { return activityLimited.contains(channelId); }
    bool isExcluded(const QString& channelId) const {
        return isFullyExcluded(channelId) || isActivityLimited(channelId);
    }

    QJsonObject toJson() const;
    static ExclusionPolicy fromJson(const QJsonObject& json);
};

/**
 * @brief Read-through cached access to per-guild settings
 *
 * Every read goes through the shared cache with a 10 minute TTL. Updates write
 * the store first and then invalidate the affected keys, including the guild's
 * all-rules key when a role rule changes. Store failures degrade to defaults
 * and are not cached.
 */
class GuildSettingsService : public QObject
{
    Q_OBJECT
public:
    static constexpr int SettingsTtlSeconds = 600;
    static constexpr double DefaultActivityThresholdHours = 30.0;

    GuildSettingsService(GuildSettingsRepository* repository, std::shared_ptr<Cache::FallbackCache> cache,
                         QObject* parent = nullptr);
    ~GuildSettingsService() override;

    ExclusionPolicy exclusionPolicy(const QString& guildId);
    bool setExclusionPolicy(const QString& guildId, const ExclusionPolicy& policy);

    double activityThresholdHours(const QString& guildId);
    bool setActivityThresholdHours(const QString& guildId, double hours);

    std::optional<double> roleMinHours(const QString& guildId, const QString& roleName);
    QMap<QString, double> allRoleRules(const QString& guildId);
    bool setRoleMinHours(const QString& guildId, const QString& roleName, double minHours);
    bool removeRoleRule(const QString& guildId, const QString& roleName);

    static QString exclusionKey(const QString& guildId);
    static QString thresholdKey(const QString& guildId);
    static QString roleRuleKey(const QString& guildId, const QString& roleName);
    static QString allRoleRulesKey(const QString& guildId);

signals:
    void settingsChanged(const QString& guildId, const QString& settingType);

private:
    std::optional<QJsonObject> cachedObject(const QString& key, const std::function<std::optional<QJsonObject>()>& loader);

    GuildSettingsRepository* m_repository;
    std::shared_ptr<Cache::FallbackCache> m_cache;
};

#endif // GUILDSETTINGSSERVICE_H
