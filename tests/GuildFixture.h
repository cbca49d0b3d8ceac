#pragma once
#include "models/Guild.h"

// Builders shared by the test executables

inline Role makeRole(Snowflake id, int position, quint64 permissions, const QString &name = QString())
{
    Role role;
    role.id = id;
    role.name = name.isEmpty() ? QString("role-%1").arg(id) : name;
    role.position = position;
    role.permissions = PermissionSet(permissions);
    return role;
}

inline Member makeMember(Snowflake userId, const QList<Snowflake> &roles = {}, const QString &username = QString(),
                         const QString &nick = QString())
{
    Member member;
    member.user.id = userId;
    member.user.username = username.isEmpty() ? QString("user%1").arg(userId) : username;
    member.user.discriminator = "0";
    member.roles = roles;
    member.nick = nick;
    return member;
}

inline PermissionOverwrite roleOverwrite(Snowflake roleId, quint64 allow, quint64 deny)
{
    PermissionOverwrite overwrite;
    overwrite.type = OverwriteType::ROLE;
    overwrite.id = roleId;
    overwrite.allow = PermissionSet(allow);
    overwrite.deny = PermissionSet(deny);
    return overwrite;
}

inline PermissionOverwrite memberOverwrite(Snowflake userId, quint64 allow, quint64 deny)
{
    PermissionOverwrite overwrite = roleOverwrite(userId, allow, deny);
    overwrite.type = OverwriteType::MEMBER;
    return overwrite;
}

inline Channel makeChannel(Snowflake id, Snowflake guildId, int position = 0, ChannelType type = ChannelType::GUILD_TEXT)
{
    Channel channel;
    channel.id = id;
    channel.guildId = guildId;
    channel.position = position;
    channel.type = (int)type;
    channel.name = QString("channel-%1").arg(id);
    return channel;
}

// Guild with its @everyone role already in place
inline Guild makeGuild(Snowflake id, Snowflake ownerId, quint64 everyonePermissions)
{
    Guild guild;
    guild.id = id;
    guild.name = QString("guild-%1").arg(id);
    guild.ownerId = ownerId;
    guild.addRole(makeRole(id, 0, everyonePermissions, "@everyone"));
    return guild;
}
