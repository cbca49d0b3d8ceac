#include "RoleHierarchy.h"
#include "utils/Logging.h"

namespace
{
    // Stand-in for members without any resolvable role. Position 0 with
    // ID 1 sorts below every real role.
    constexpr Snowflake UNRANKED_ROLE_ID = 1;
    constexpr int UNRANKED_POSITION = 0;
}

const Role *RoleHierarchy::memberHighestRole(const Member &member, const EntityStore<Role> &roles)
{
    const Role *highest = nullptr;

    for (Snowflake roleId : member.roles)
    {
        const Role *role = roles.get(roleId);
        if (!role)
        {
            qCDebug(lcResolve) << "Member" << member.id() << "has unknown role" << roleId;
            continue;
        }

        if (!highest || role->position > highest->position ||
            (role->position == highest->position && role->id < highest->id))
        {
            highest = role;
        }
    }

    return highest;
}

RoleHierarchy::Rank RoleHierarchy::rankOf(const Member &member, const EntityStore<Role> &roles)
{
    const Role *highest = memberHighestRole(member, roles);
    if (!highest)
        return Rank{UNRANKED_ROLE_ID, UNRANKED_POSITION};
    return Rank{highest->id, highest->position};
}

std::optional<Snowflake> RoleHierarchy::compareHierarchy(const Guild &guild, Snowflake userA, Snowflake userB)
{
    const Member *a = guild.members.get(userA);
    const Member *b = guild.members.get(userB);
    if (!a || !b)
        return std::nullopt;

    if (userA == userB)
        return std::nullopt;

    if (guild.isOwner(userA))
        return userA;
    if (guild.isOwner(userB))
        return userB;

    Rank rankA = rankOf(*a, guild.roles);
    Rank rankB = rankOf(*b, guild.roles);

    // Both unranked, or both topped by the same role: nobody wins
    if ((rankA.position == 0 && rankB.position == 0) || rankA.roleId == rankB.roleId)
        return std::nullopt;

    if (rankA.position > rankB.position)
        return userA;
    if (rankB.position > rankA.position)
        return userB;

    // Same position, different roles: the older role wins
    return rankA.roleId < rankB.roleId ? userA : userB;
}

bool RoleHierarchy::outranks(const Guild &guild, Snowflake actor, Snowflake target)
{
    std::optional<Snowflake> winner = compareHierarchy(guild, actor, target);
    return winner && *winner == actor;
}
