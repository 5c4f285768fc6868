#ifndef REPORTCACHEREPOSITORY_H
#define REPORTCACHEREPOSITORY_H

#include "BaseRepository.h"
#include "../Models/ReportCacheModel.h"

class ReportCacheRepository : public BaseRepository<ReportCacheModel>
{
    Q_OBJECT
public:
    explicit ReportCacheRepository(QObject *parent = nullptr);

    // Insert or replace the entry with the same cache key
    bool save(ReportCacheModel *entry);

    // Entry for key when it has not expired at nowMs
    QSharedPointer<ReportCacheModel> getValid(const QString &cacheKey, qint64 nowMs);

    bool removeKey(const QString &cacheKey);

    // Deletes expired rows, returns the number removed or -1 on failure
    int cleanupExpired(qint64 nowMs);

protected:
    QString getEntityName() const override { return "ReportCache"; }
    QString getTableName() const override { return "report_cache"; }
    ReportCacheModel* createModelFromQuery(const QSqlQuery &query) override;
};

#endif // REPORTCACHEREPOSITORY_H
