#pragma once
#include <optional>
#include "models/Guild.h"

/**
 * @brief Role ranking between guild members
 *
 * Used to gate moderation actions (kick, ban, role edits): a member may only
 * act on members they outrank.
 */
class RoleHierarchy
{
public:
    /**
     * @brief Highest-ranked role the member holds
     *
     * Higher position wins; on equal positions the lower (older) role ID wins.
     * Role IDs missing from the store are skipped.
     * @return Pointer into the store, or nullptr if none of the roles resolve
     */
    static const Role *memberHighestRole(const Member &member, const EntityStore<Role> &roles);

    /**
     * @brief Which of two users ranks higher in the guild
     *
     * The owner always wins. Otherwise the holder of the higher highest role
     * wins, with ties on position going to the lower role ID.
     * @return The winning user ID, or nullopt if either user is not a member,
     * both IDs are the same, or neither outranks the other
     */
    static std::optional<Snowflake> compareHierarchy(const Guild &guild, Snowflake userA, Snowflake userB);

    // True if `actor` strictly outranks `target`
    static bool outranks(const Guild &guild, Snowflake actor, Snowflake target);

private:
    struct Rank
    {
        Snowflake roleId;
        int position;
    };

    static Rank rankOf(const Member &member, const EntityStore<Role> &roles);
};
