#include "PermissionCalculator.h"
#include "utils/Logging.h"
#include <algorithm>

PermissionSet PermissionCalculator::resolvePermissions(const Member &member, const Guild &guild, const Channel *channel)
{
    return resolve(member.user.id, member.roles, guild, channel);
}

PermissionSet PermissionCalculator::resolve(Snowflake userId, const QList<Snowflake> &roleIds, const Guild &guild,
                                            const Channel *channel)
{
    // Guild owner has every permission, everywhere
    if (guild.isOwner(userId))
        return PermissionSet::all();

    PermissionSet permissions = basePermissions(userId, roleIds, guild);

    // Administrators bypass all channel overwrites
    if (permissions.contains(Permissions::ADMINISTRATOR))
        return PermissionSet::all();

    if (!channel)
        return permissions;

    return applyOverwrites(permissions, userId, roleIds, guild, *channel);
}

PermissionSet PermissionCalculator::basePermissions(Snowflake userId, const QList<Snowflake> &roleIds, const Guild &guild)
{
    PermissionSet permissions;

    // @everyone role first
    if (const Role *everyone = guild.everyoneRole())
    {
        permissions = everyone->permissions;
    }
    else
    {
        qCWarning(lcIntegrity) << "@everyone role missing in guild" << guild.id;
    }

    // Then every role the member holds
    for (Snowflake roleId : roleIds)
    {
        const Role *role = guild.roles.get(roleId);
        if (!role)
        {
            qCDebug(lcResolve) << "User" << userId << "in guild" << guild.id << "has non-existent role" << roleId;
            continue;
        }
        permissions |= role->permissions;
    }

    return permissions;
}

PermissionSet PermissionCalculator::applyOverwrites(PermissionSet permissions, Snowflake userId,
                                                    const QList<Snowflake> &roleIds, const Guild &guild,
                                                    const Channel &channel)
{
    const Snowflake everyoneId = guild.everyoneRoleId();

    // Sort overwrites into their three levels. If a target appears twice the
    // later entry replaces the earlier one.
    const PermissionOverwrite *everyoneOverwrite = nullptr;
    const PermissionOverwrite *memberOverwrite = nullptr;
    PermissionSet roleAllow;
    PermissionSet roleDeny;

    for (const PermissionOverwrite &overwrite : channel.permissionOverwrites)
    {
        if (overwrite.isMember())
        {
            if (overwrite.id == userId)
                memberOverwrite = &overwrite;
        }
        else if (overwrite.id == everyoneId)
        {
            everyoneOverwrite = &overwrite;
        }
        else if (roleIds.contains(overwrite.id))
        {
            roleAllow |= overwrite.allow;
            roleDeny |= overwrite.deny;
        }
    }

    // Within each level deny goes first, so an overlapping allow wins.
    // Each level overrides the ones before it.
    if (everyoneOverwrite)
    {
        permissions.remove(everyoneOverwrite->deny);
        permissions |= everyoneOverwrite->allow;
    }

    permissions.remove(roleDeny);
    permissions |= roleAllow;

    if (memberOverwrite)
    {
        permissions.remove(memberOverwrite->deny);
        permissions |= memberOverwrite->allow;
    }

    return permissions;
}

PermissionSet PermissionCalculator::memberPermissions(const Guild &guild, const Member &member)
{
    return resolvePermissions(member, guild, nullptr);
}

PermissionSet PermissionCalculator::permissionsIn(const Guild &guild, const Channel &channel, const Member &member)
{
    return resolvePermissions(member, guild, &channel);
}

PermissionSet PermissionCalculator::partialMemberPermissionsIn(const Guild &guild, const Channel &channel,
                                                               Snowflake userId, const QList<Snowflake> &roleIds)
{
    return resolve(userId, roleIds, guild, &channel);
}

bool PermissionCalculator::canViewChannel(const Guild &guild, const Channel &channel, const Member &member)
{
    // DM channels are always viewable
    if (channel.isDm())
        return true;

    return permissionsIn(guild, channel, member).contains(Permissions::VIEW_CHANNEL);
}

bool PermissionCalculator::canSendMessages(const Guild &guild, const Channel &channel, const Member &member)
{
    // DM channels - always can send
    if (channel.isDm())
        return true;

    // Voice channels and categories - can't send text messages
    if (channel.isVoice() || channel.isCategory())
        return false;

    return permissionsIn(guild, channel, member).contains(Permissions::SEND_MESSAGES);
}

QList<const Channel *> PermissionCalculator::channelsInDisplayOrder(const Guild &guild)
{
    QList<const Channel *> channels = guild.channels.values();
    std::stable_sort(channels.begin(), channels.end(), [](const Channel *a, const Channel *b)
                     { return a->position < b->position; });
    return channels;
}

const Channel *PermissionCalculator::defaultChannel(const Guild &guild, Snowflake userId)
{
    const Member *member = guild.members.get(userId);
    if (!member)
        return nullptr;

    for (const Channel *channel : channelsInDisplayOrder(guild))
    {
        if (!channel->isCategory() && canViewChannel(guild, *channel, *member))
            return channel;
    }
    return nullptr;
}

const Channel *PermissionCalculator::defaultChannelGuaranteed(const Guild &guild)
{
    const QList<const Member *> members = guild.members.values();

    for (const Channel *channel : channelsInDisplayOrder(guild))
    {
        if (channel->isCategory())
            continue;

        bool everyoneCanView = std::all_of(members.begin(), members.end(), [&](const Member *member)
                                           { return canViewChannel(guild, *channel, *member); });
        if (everyoneCanView)
            return channel;
    }
    return nullptr;
}
