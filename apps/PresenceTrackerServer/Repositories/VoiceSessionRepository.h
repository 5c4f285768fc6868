#ifndef VOICESESSIONREPOSITORY_H
#define VOICESESSIONREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/VoiceSessionModel.h"

class VoiceSessionRepository : public BaseRepository<VoiceSessionModel>
{
    Q_OBJECT
public:
    explicit VoiceSessionRepository(QObject *parent = nullptr);

    /**
     * @brief Insert a completed session unless the same session was already stored
     * @param session Session to insert
     * @param inserted Set to false when the natural key already existed
     * @return False on validation or database failure
     */
    bool insertIfAbsent(VoiceSessionModel* session, bool* inserted);

    QList<QSharedPointer<VoiceSessionModel>> getByUser(const QString &guildId, const QString &userId,
                                                       qint64 fromMs, qint64 toMs);

protected:
    QString getEntityName() const override { return "VoiceSession"; }
    QString getTableName() const override { return "voice_sessions"; }
    VoiceSessionModel* createModelFromQuery(const QSqlQuery &query) override;
};

#endif // VOICESESSIONREPOSITORY_H
