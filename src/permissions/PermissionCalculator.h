#pragma once
#include <QList>
#include "models/Guild.h"
#include "models/Permissions.h"

/**
 * @brief Computes a member's effective permissions in a guild or channel
 *
 * Follows Discord's documented overwrite order:
 * https://discord.com/developers/docs/topics/permissions#permission-overwrites
 *
 * All functions are pure reads over the snapshot they are given and are safe
 * to call from several threads at once.
 */
class PermissionCalculator
{
public:
    /**
     * @brief Effective permissions of `member`
     * @param channel Channel to apply overwrites from, or nullptr for the
     * guild-level result
     */
    static PermissionSet resolvePermissions(const Member &member, const Guild &guild, const Channel *channel = nullptr);

    static PermissionSet memberPermissions(const Guild &guild, const Member &member);
    static PermissionSet permissionsIn(const Guild &guild, const Channel &channel, const Member &member);

    // Same as permissionsIn() for callers that only hold a user ID and role
    // list (e.g. a partial member attached to an interaction)
    static PermissionSet partialMemberPermissionsIn(const Guild &guild, const Channel &channel, Snowflake userId,
                                                    const QList<Snowflake> &roleIds);

    static bool canViewChannel(const Guild &guild, const Channel &channel, const Member &member);
    static bool canSendMessages(const Guild &guild, const Channel &channel, const Member &member);

    // First non-category channel the user can see, nullptr if none or if the
    // user is not a member
    static const Channel *defaultChannel(const Guild &guild, Snowflake userId);

    // First non-category channel every member can see.
    // Note: costs channels x members resolutions.
    static const Channel *defaultChannelGuaranteed(const Guild &guild);

private:
    static PermissionSet resolve(Snowflake userId, const QList<Snowflake> &roleIds, const Guild &guild,
                                 const Channel *channel);
    static PermissionSet basePermissions(Snowflake userId, const QList<Snowflake> &roleIds, const Guild &guild);
    static PermissionSet applyOverwrites(PermissionSet permissions, Snowflake userId, const QList<Snowflake> &roleIds,
                                         const Guild &guild, const Channel &channel);
    static QList<const Channel *> channelsInDisplayOrder(const Guild &guild);
};
