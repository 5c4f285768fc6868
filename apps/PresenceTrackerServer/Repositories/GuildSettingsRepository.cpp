#include "GuildSettingsRepository.h"
#include "logger/logger.h"
#include "Core/ModelFactory.h"

GuildSettingsRepository::GuildSettingsRepository(QObject *parent)
    : BaseRepository<GuildSettingModel>(parent)
{
    LOG_DEBUG("GuildSettingsRepository created");
}

GuildSettingModel* GuildSettingsRepository::createModelFromQuery(const QSqlQuery &query)
{
    return ModelFactory::createGuildSettingFromQuery(query);
}

bool GuildSettingsRepository::upsert(GuildSettingModel *setting)
{
    QStringList validationErrors;
    if (!ModelFactory::validateGuildSettingModel(setting, validationErrors)) {
        LOG_ERROR(QString("Cannot save guild setting: validation failed - %1").arg(validationErrors.join(", ")));
        return false;
    }

    QMap<QString, QVariant> params;
    params["guild_id"] = setting->guildId();
    params["setting_type"] = setting->settingType();
    params["setting_key"] = setting->settingKey();
    params["setting_value"] = jsonToString(setting->settingValue());

    bool success = modify(
        "INSERT INTO guild_settings (guild_id, setting_type, setting_key, setting_value) "
        "VALUES (:guild_id, :setting_type, :setting_key, :setting_value) "
        "ON CONFLICT (guild_id, setting_type, setting_key) DO UPDATE SET "
        "setting_value = excluded.setting_value, updated_at = CURRENT_TIMESTAMP",
        params);

    if (success) {
        LOG_INFO(QString("Guild setting saved: %1/%2/%3")
                .arg(setting->guildId(), setting->settingType(), setting->settingKey()));
    }
    return success;
}

QSharedPointer<GuildSettingModel> GuildSettingsRepository::get(const QString &guildId, const QString &settingType,
                                                               const QString &settingKey, bool *ok)
{
    QMap<QString, QVariant> params;
    params["guild_id"] = guildId;
    params["setting_type"] = settingType;
    params["setting_key"] = settingKey;

    bool queryOk = false;
    auto rows = selectMany(
        "SELECT * FROM guild_settings "
        "WHERE guild_id = :guild_id AND setting_type = :setting_type AND setting_key = :setting_key",
        params, &queryOk);

    if (ok) {
        *ok = queryOk;
    }
    return rows.isEmpty() ? nullptr : rows.first();
}

QList<QSharedPointer<GuildSettingModel>> GuildSettingsRepository::getByType(const QString &guildId,
                                                                           const QString &settingType, bool *ok)
{
    QMap<QString, QVariant> params;
    params["guild_id"] = guildId;
    params["setting_type"] = settingType;

    return selectMany(
        "SELECT * FROM guild_settings WHERE guild_id = :guild_id AND setting_type = :setting_type "
        "ORDER BY setting_key",
        params, ok);
}

bool GuildSettingsRepository::remove(const QString &guildId, const QString &settingType, const QString &settingKey)
{
    QMap<QString, QVariant> params;
    params["guild_id"] = guildId;
    params["setting_type"] = settingType;
    params["setting_key"] = settingKey;

    return modify(
        "DELETE FROM guild_settings "
        "WHERE guild_id = :guild_id AND setting_type = :setting_type AND setting_key = :setting_key",
        params);
}
