#include "MemberDirectory.h"
#include "logger/logger.h"

#include <QJsonArray>
#include <algorithm>

QJsonObject MemberInfo::toJson() const
{
    QJsonObject json;
    json["userId"] = userId;
    json["displayName"] = displayName;
    json["roles"] = QJsonArray::fromStringList(roles);
    return json;
}

MemberInfo MemberInfo::fromJson(const QJsonObject& json)
{
    MemberInfo member;
    member.userId = json["userId"].toString();
    member.displayName = json["displayName"].toString();
    for (const QJsonValue& role : json["roles"].toArray()) {
        member.roles.append(role.toString());
    }
    return member;
}

InMemoryMemberDirectory::InMemoryMemberDirectory(QObject* parent)
    : QObject(parent)
{
}

void InMemoryMemberDirectory::upsertMember(const QString& guildId, const MemberInfo& member)
{
    if (member.userId.isEmpty()) {
        return;
    }
    QWriteLocker locker(&m_lock);
    m_members[guildId][member.userId] = member;
}

void InMemoryMemberDirectory::rememberName(const QString& guildId, const QString& userId, const QString& displayName)
{
    if (userId.isEmpty() || displayName.isEmpty()) {
        return;
    }
    QWriteLocker locker(&m_lock);
    MemberInfo& member = m_members[guildId][userId];
    member.userId = userId;
    member.displayName = displayName;
}

QList<MemberInfo> InMemoryMemberDirectory::membersWithRole(const QString& guildId, const QString& roleName)
{
    QList<MemberInfo> result;
    {
        QReadLocker locker(&m_lock);
        const QHash<QString, MemberInfo> members = m_members.value(guildId);
        for (const MemberInfo& member : members) {
            if (roleName.isEmpty() || member.roles.contains(roleName)) {
                result.append(member);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const MemberInfo& a, const MemberInfo& b) {
        return a.userId < b.userId;
    });
    return result;
}

QString InMemoryMemberDirectory::displayName(const QString& guildId, const QString& userId)
{
    QReadLocker locker(&m_lock);
    const QString name = m_members.value(guildId).value(userId).displayName;
    return name.isEmpty() ? userId : name;
}

int InMemoryMemberDirectory::memberCount(const QString& guildId) const
{
    QReadLocker locker(&m_lock);
    return m_members.value(guildId).size();
}
