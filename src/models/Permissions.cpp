#include "Permissions.h"
#include <QDebug>

namespace
{
    struct FlagName
    {
        quint64 flag;
        const char *name;
    };

    const FlagName FLAG_NAMES[] = {
        {Permissions::CREATE_INSTANT_INVITE, "CREATE_INSTANT_INVITE"},
        {Permissions::KICK_MEMBERS, "KICK_MEMBERS"},
        {Permissions::BAN_MEMBERS, "BAN_MEMBERS"},
        {Permissions::ADMINISTRATOR, "ADMINISTRATOR"},
        {Permissions::MANAGE_CHANNELS, "MANAGE_CHANNELS"},
        {Permissions::MANAGE_GUILD, "MANAGE_GUILD"},
        {Permissions::ADD_REACTIONS, "ADD_REACTIONS"},
        {Permissions::VIEW_AUDIT_LOG, "VIEW_AUDIT_LOG"},
        {Permissions::PRIORITY_SPEAKER, "PRIORITY_SPEAKER"},
        {Permissions::STREAM, "STREAM"},
        {Permissions::VIEW_CHANNEL, "VIEW_CHANNEL"},
        {Permissions::SEND_MESSAGES, "SEND_MESSAGES"},
        {Permissions::SEND_TTS_MESSAGES, "SEND_TTS_MESSAGES"},
        {Permissions::MANAGE_MESSAGES, "MANAGE_MESSAGES"},
        {Permissions::EMBED_LINKS, "EMBED_LINKS"},
        {Permissions::ATTACH_FILES, "ATTACH_FILES"},
        {Permissions::READ_MESSAGE_HISTORY, "READ_MESSAGE_HISTORY"},
        {Permissions::MENTION_EVERYONE, "MENTION_EVERYONE"},
        {Permissions::USE_EXTERNAL_EMOJIS, "USE_EXTERNAL_EMOJIS"},
        {Permissions::VIEW_GUILD_INSIGHTS, "VIEW_GUILD_INSIGHTS"},
        {Permissions::CONNECT, "CONNECT"},
        {Permissions::SPEAK, "SPEAK"},
        {Permissions::MUTE_MEMBERS, "MUTE_MEMBERS"},
        {Permissions::DEAFEN_MEMBERS, "DEAFEN_MEMBERS"},
        {Permissions::MOVE_MEMBERS, "MOVE_MEMBERS"},
        {Permissions::USE_VAD, "USE_VAD"},
        {Permissions::CHANGE_NICKNAME, "CHANGE_NICKNAME"},
        {Permissions::MANAGE_NICKNAMES, "MANAGE_NICKNAMES"},
        {Permissions::MANAGE_ROLES, "MANAGE_ROLES"},
        {Permissions::MANAGE_WEBHOOKS, "MANAGE_WEBHOOKS"},
        {Permissions::MANAGE_GUILD_EXPRESSIONS, "MANAGE_GUILD_EXPRESSIONS"},
        {Permissions::USE_APPLICATION_COMMANDS, "USE_APPLICATION_COMMANDS"},
        {Permissions::REQUEST_TO_SPEAK, "REQUEST_TO_SPEAK"},
        {Permissions::MANAGE_EVENTS, "MANAGE_EVENTS"},
        {Permissions::MANAGE_THREADS, "MANAGE_THREADS"},
        {Permissions::CREATE_PUBLIC_THREADS, "CREATE_PUBLIC_THREADS"},
        {Permissions::CREATE_PRIVATE_THREADS, "CREATE_PRIVATE_THREADS"},
        {Permissions::USE_EXTERNAL_STICKERS, "USE_EXTERNAL_STICKERS"},
        {Permissions::SEND_MESSAGES_IN_THREADS, "SEND_MESSAGES_IN_THREADS"},
        {Permissions::USE_EMBEDDED_ACTIVITIES, "USE_EMBEDDED_ACTIVITIES"},
        {Permissions::MODERATE_MEMBERS, "MODERATE_MEMBERS"},
        {Permissions::VIEW_CREATOR_MONETIZATION_ANALYTICS, "VIEW_CREATOR_MONETIZATION_ANALYTICS"},
        {Permissions::USE_SOUNDBOARD, "USE_SOUNDBOARD"},
        {Permissions::CREATE_GUILD_EXPRESSIONS, "CREATE_GUILD_EXPRESSIONS"},
        {Permissions::CREATE_EVENTS, "CREATE_EVENTS"},
        {Permissions::USE_EXTERNAL_SOUNDS, "USE_EXTERNAL_SOUNDS"},
        {Permissions::SEND_VOICE_MESSAGES, "SEND_VOICE_MESSAGES"},
        {Permissions::SET_VOICE_CHANNEL_STATUS, "SET_VOICE_CHANNEL_STATUS"},
        {Permissions::SEND_POLLS, "SEND_POLLS"},
        {Permissions::USE_EXTERNAL_APPS, "USE_EXTERNAL_APPS"},
    };
}

QString Permissions::flagName(quint64 flag)
{
    for (const FlagName &entry : FLAG_NAMES)
    {
        if (entry.flag == flag)
            return QString::fromLatin1(entry.name);
    }
    return QString();
}

QStringList PermissionSet::names() const
{
    QStringList result;
    for (const FlagName &entry : FLAG_NAMES)
    {
        if (m_bits & entry.flag)
            result.append(QString::fromLatin1(entry.name));
    }
    return result;
}

QDebug operator<<(QDebug debug, PermissionSet permissions)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "PermissionSet(" << permissions.names().join(QLatin1Char('|')) << ")";
    return debug;
}
