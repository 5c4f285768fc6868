#ifndef USERCLASSIFICATIONSERVICE_H
#define USERCLASSIFICATIONSERVICE_H

#include <QList>
#include <QStringList>
#include <QJsonArray>
#include <QJsonObject>

#include "MemberDirectory.h"

class GuildSettingsService;

struct MemberActivity {
    QString userId;
    QString displayName;
    QStringList roles;
    qint64 totalTimeMs = 0;

    QJsonObject toJson() const;
};

struct ClassificationResult {
    QList<MemberActivity> active;
    QList<MemberActivity> inactive;
    QList<MemberActivity> afk;

    int total() const { return active.size() + inactive.size() + afk.size(); }

    // Appends other's members and restores the ordering of every bucket
    void merge(const ClassificationResult& other);

    // Bounded preview of each bucket
    QJsonObject toJson(int activeLimit = -1, int othersLimit = -1) const;
};

/**
 * @brief Splits members into active, inactive and afk buckets
 *
 * A member holding a role whose name carries an AFK marker is afk regardless of
 * time. Otherwise the member is active when its tracked time reaches the
 * threshold. Every bucket is ordered by time, longest first.
 */
class UserClassificationService
{
public:
    static constexpr double DefaultMinHours = 4.0;

    explicit UserClassificationService(GuildSettingsService* settings);

    // Threshold for the role, DefaultMinHours when the guild has no rule for it
    double minHoursForRole(const QString& guildId, const QString& roleName) const;

    ClassificationResult classify(const QList<MemberActivity>& members, double minHours) const;

    static bool isAfkRole(const QString& roleName);
    static QStringList afkMarkers();

private:
    GuildSettingsService* m_settings;
};

#endif // USERCLASSIFICATIONSERVICE_H
