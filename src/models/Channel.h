#pragma once
#include <QString>
#include <QList>
#include "Snowflake.h"
#include "Permissions.h"

enum class ChannelType
{
    GUILD_TEXT = 0,
    DM = 1,
    GUILD_VOICE = 2,
    GROUP_DM = 3,
    GUILD_CATEGORY = 4,
    GUILD_ANNOUNCEMENT = 5,
    GUILD_STAGE_VOICE = 13,
    GUILD_FORUM = 15,
    // Add others as needed
    UNKNOWN = -1
};

// Matches the wire "type" field of a permission overwrite
enum class OverwriteType
{
    ROLE = 0,
    MEMBER = 1
};

struct PermissionOverwrite
{
    OverwriteType type = OverwriteType::ROLE;
    Snowflake id = 0; // Role ID or user ID, depending on type
    PermissionSet allow;
    PermissionSet deny;

    bool isRole() const { return type == OverwriteType::ROLE; }
    bool isMember() const { return type == OverwriteType::MEMBER; }
};

struct Channel
{
    Snowflake id = 0;
    int type = (int)ChannelType::GUILD_TEXT;
    Snowflake guildId = 0; // 0 if DM
    int position = 0;
    QString name;

    // Applied in list order
    QList<PermissionOverwrite> permissionOverwrites;

    bool isVoice() const
    {
        return type == (int)ChannelType::GUILD_VOICE || type == (int)ChannelType::GUILD_STAGE_VOICE;
    }

    bool isCategory() const
    {
        return type == (int)ChannelType::GUILD_CATEGORY;
    }

    bool isDm() const
    {
        return type == (int)ChannelType::DM || type == (int)ChannelType::GROUP_DM;
    }
};
