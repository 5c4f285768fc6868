#ifndef ACTIVITYSOURCE_H
#define ACTIVITYSOURCE_H

#include <QHash>
#include <QString>
#include <QStringList>

// Read side used by report generation; implementations must be callable from worker threads
class ActivitySource
{
public:
    virtual ~ActivitySource() = default;

    /**
     * @brief Total tracked time per user in [startMs, endMs]
     * @param totals Receives one entry per requested user, 0 for users without activity
     * @return False when the totals could not be read; may also throw std::exception
     */
    virtual bool batchActivity(const QStringList& userIds, const QString& guildId,
                               qint64 startMs, qint64 endMs, QHash<QString, qint64>& totals) = 0;
};

#endif // ACTIVITYSOURCE_H
