#ifndef GUILDSETTINGSREPOSITORY_H
#define GUILDSETTINGSREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/GuildSettingModel.h"

class GuildSettingsRepository : public BaseRepository<GuildSettingModel>
{
    Q_OBJECT
public:
    explicit GuildSettingsRepository(QObject *parent = nullptr);

    // Insert or replace by (guild, type, key)
    bool upsert(GuildSettingModel *setting);

    QSharedPointer<GuildSettingModel> get(const QString &guildId, const QString &settingType,
                                          const QString &settingKey, bool *ok = nullptr);
    QList<QSharedPointer<GuildSettingModel>> getByType(const QString &guildId, const QString &settingType,
                                                      bool *ok = nullptr);

    bool remove(const QString &guildId, const QString &settingType, const QString &settingKey);

protected:
    QString getEntityName() const override { return "GuildSetting"; }
    QString getTableName() const override { return "guild_settings"; }
    GuildSettingModel* createModelFromQuery(const QSqlQuery &query) override;
};

#endif // GUILDSETTINGSREPOSITORY_H
