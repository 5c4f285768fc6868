#ifndef MEMBERDIRECTORY_H
#define MEMBERDIRECTORY_H

#include <QObject>
#include <QHash>
#include <QList>
#include <QReadWriteLock>
#include <QStringList>
#include <QJsonObject>

struct MemberInfo {
    QString userId;
    QString displayName;
    QStringList roles;

    QJsonObject toJson() const;
    static MemberInfo fromJson(const QJsonObject& json);
};

/**
 * @brief Guild membership lookups
 *
 * Implementations may throw std::exception when the platform cannot be reached.
 */
class MemberDirectory
{
public:
    virtual ~MemberDirectory() = default;

    // Members holding roleName, or every known member when roleName is empty
    virtual QList<MemberInfo> membersWithRole(const QString& guildId, const QString& roleName) = 0;

    virtual QString displayName(const QString& guildId, const QString& userId) = 0;
};

// Directory fed by transition events and report requests
class InMemoryMemberDirectory : public QObject, public MemberDirectory
{
    Q_OBJECT
public:
    explicit InMemoryMemberDirectory(QObject* parent = nullptr);

    void upsertMember(const QString& guildId, const MemberInfo& member);

    // Updates the display name, keeping known roles
    void rememberName(const QString& guildId, const QString& userId, const QString& displayName);

    QList<MemberInfo> membersWithRole(const QString& guildId, const QString& roleName) override;
    QString displayName(const QString& guildId, const QString& userId) override;

    int memberCount(const QString& guildId) const;

private:
    QHash<QString, QHash<QString, MemberInfo>> m_members;
    mutable QReadWriteLock m_lock;
};

#endif // MEMBERDIRECTORY_H
