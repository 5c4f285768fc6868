#include "UserClassificationService.h"
#include "GuildSettingsService.h"

#include <algorithm>

QJsonObject MemberActivity::toJson() const
{
    QJsonObject json;
    json["userId"] = userId;
    json["displayName"] = displayName.isEmpty() ? userId : displayName;
    json["totalTimeMs"] = totalTimeMs;
    return json;
}

namespace {

QJsonArray bucketToJson(const QList<MemberActivity>& bucket, int limit)
{
    QJsonArray array;
    const int count = limit < 0 ? bucket.size() : qMin(limit, static_cast<int>(bucket.size()));
    for (int i = 0; i < count; ++i) {
        array.append(bucket.at(i).toJson());
    }
    return array;
}

void sortByTime(QList<MemberActivity>& bucket)
{
    std::stable_sort(bucket.begin(), bucket.end(), [](const MemberActivity& a, const MemberActivity& b) {
        return a.totalTimeMs > b.totalTimeMs;
    });
}

}

QJsonObject ClassificationResult::toJson(int activeLimit, int othersLimit) const
{
    QJsonObject json;
    json["active"] = bucketToJson(active, activeLimit);
    json["inactive"] = bucketToJson(inactive, othersLimit);
    json["afk"] = bucketToJson(afk, othersLimit);
    json["activeCount"] = static_cast<int>(active.size());
    json["inactiveCount"] = static_cast<int>(inactive.size());
    json["afkCount"] = static_cast<int>(afk.size());
    return json;
}

void ClassificationResult::merge(const ClassificationResult& other)
{
    active.append(other.active);
    inactive.append(other.inactive);
    afk.append(other.afk);
    sortByTime(active);
    sortByTime(inactive);
    sortByTime(afk);
}

UserClassificationService::UserClassificationService(GuildSettingsService* settings)
    : m_settings(settings)
{
}

QStringList UserClassificationService::afkMarkers()
{
    return QStringList{QStringLiteral("잠수"), QStringLiteral("AFK"), QStringLiteral("휴식")};
}

bool UserClassificationService::isAfkRole(const QString& roleName)
{
    for (const QString& marker : afkMarkers()) {
        if (roleName.contains(marker, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

double UserClassificationService::minHoursForRole(const QString& guildId, const QString& roleName) const
{
    if (!m_settings || roleName.isEmpty()) {
        return DefaultMinHours;
    }
    return m_settings->roleMinHours(guildId, roleName).value_or(DefaultMinHours);
}

ClassificationResult UserClassificationService::classify(const QList<MemberActivity>& members, double minHours) const
{
    const qint64 thresholdMs = static_cast<qint64>(minHours * 60.0 * 60.0 * 1000.0);

    ClassificationResult result;
    for (const MemberActivity& member : members) {
        const bool afk = std::any_of(member.roles.cbegin(), member.roles.cend(), &UserClassificationService::isAfkRole);
        if (afk) {
            result.afk.append(member);
        } else if (member.totalTimeMs >= thresholdMs) {
            result.active.append(member);
        } else {
            result.inactive.append(member);
        }
    }

    sortByTime(result.active);
    sortByTime(result.inactive);
    sortByTime(result.afk);
    return result;
}
