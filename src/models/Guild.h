#pragma once
#include <QString>
#include <QList>
#include <QPair>
#include "Snowflake.h"
#include "Role.h"
#include "Member.h"
#include "Channel.h"
#include "store/EntityStore.h"

struct Guild
{
    // A matched member and the name (username or nickname) that matched
    using MemberMatch = QPair<const Member *, QString>;

    Snowflake id = 0;
    QString name;
    Snowflake ownerId = 0;

    EntityStore<Role> roles;       // roleId -> Role
    EntityStore<Member> members;   // userId -> Member
    EntityStore<Channel> channels; // channelId -> Channel

    // The implicit @everyone role shares the guild's ID. It is expected to
    // exist but may be missing from a partial snapshot.
    Snowflake everyoneRoleId() const { return id; }
    const Role *everyoneRole() const { return roles.get(everyoneRoleId()); }

    bool isOwner(Snowflake userId) const { return userId != 0 && userId == ownerId; }

    void addRole(const Role &role) { roles.insert(role.id, role); }
    void addMember(const Member &member) { members.insert(member.user.id, member); }
    void addChannel(const Channel &channel) { channels.insert(channel.id, channel); }

    const Role *roleByName(const QString &roleName) const;

    /**
     * @brief Find a member by "username", "username#discriminator" or nickname
     *
     * Usernames are matched first; the whole input is then tried against
     * nicknames. Returns nullptr if nobody matches.
     */
    const Member *memberNamed(const QString &name) const;

    /**
     * Member searches. Each member is tried on the username first, then on
     * the nickname where the function says so; a member appears at most
     * once. Results come in ascending user ID order unless `sorted`, in which
     * case names where the match starts earlier and that are shorter come
     * first (ties keep ID order).
     */
    QList<MemberMatch> membersStartingWith(const QString &prefix, bool caseSensitive, bool sorted) const;
    QList<MemberMatch> membersContaining(const QString &substring, bool caseSensitive, bool sorted) const;
    QList<MemberMatch> membersUsernameContaining(const QString &substring, bool caseSensitive, bool sorted) const;
    // Members without a nickname are matched on their username
    QList<MemberMatch> membersNickContaining(const QString &substring, bool caseSensitive, bool sorted) const;
};
