#pragma once
#include <QtGlobal>
#include <QStringList>

class QDebug;

// Discord permission bits
// https://discord.com/developers/docs/topics/permissions#permissions-bitwise-permission-flags
namespace Permissions
{
    constexpr quint64 CREATE_INSTANT_INVITE = 1ULL << 0;
    constexpr quint64 KICK_MEMBERS = 1ULL << 1;
    constexpr quint64 BAN_MEMBERS = 1ULL << 2;
    constexpr quint64 ADMINISTRATOR = 1ULL << 3;
    constexpr quint64 MANAGE_CHANNELS = 1ULL << 4;
    constexpr quint64 MANAGE_GUILD = 1ULL << 5;
    constexpr quint64 ADD_REACTIONS = 1ULL << 6;
    constexpr quint64 VIEW_AUDIT_LOG = 1ULL << 7;
    constexpr quint64 PRIORITY_SPEAKER = 1ULL << 8;
    constexpr quint64 STREAM = 1ULL << 9;
    constexpr quint64 VIEW_CHANNEL = 1ULL << 10;
    constexpr quint64 SEND_MESSAGES = 1ULL << 11;
    constexpr quint64 SEND_TTS_MESSAGES = 1ULL << 12;
    constexpr quint64 MANAGE_MESSAGES = 1ULL << 13;
    constexpr quint64 EMBED_LINKS = 1ULL << 14;
    constexpr quint64 ATTACH_FILES = 1ULL << 15;
    constexpr quint64 READ_MESSAGE_HISTORY = 1ULL << 16;
    constexpr quint64 MENTION_EVERYONE = 1ULL << 17;
    constexpr quint64 USE_EXTERNAL_EMOJIS = 1ULL << 18;
    constexpr quint64 VIEW_GUILD_INSIGHTS = 1ULL << 19;
    constexpr quint64 CONNECT = 1ULL << 20;
    constexpr quint64 SPEAK = 1ULL << 21;
    constexpr quint64 MUTE_MEMBERS = 1ULL << 22;
    constexpr quint64 DEAFEN_MEMBERS = 1ULL << 23;
    constexpr quint64 MOVE_MEMBERS = 1ULL << 24;
    constexpr quint64 USE_VAD = 1ULL << 25;
    constexpr quint64 CHANGE_NICKNAME = 1ULL << 26;
    constexpr quint64 MANAGE_NICKNAMES = 1ULL << 27;
    constexpr quint64 MANAGE_ROLES = 1ULL << 28;
    constexpr quint64 MANAGE_WEBHOOKS = 1ULL << 29;
    constexpr quint64 MANAGE_GUILD_EXPRESSIONS = 1ULL << 30;
    constexpr quint64 USE_APPLICATION_COMMANDS = 1ULL << 31;
    constexpr quint64 REQUEST_TO_SPEAK = 1ULL << 32;
    constexpr quint64 MANAGE_EVENTS = 1ULL << 33;
    constexpr quint64 MANAGE_THREADS = 1ULL << 34;
    constexpr quint64 CREATE_PUBLIC_THREADS = 1ULL << 35;
    constexpr quint64 CREATE_PRIVATE_THREADS = 1ULL << 36;
    constexpr quint64 USE_EXTERNAL_STICKERS = 1ULL << 37;
    constexpr quint64 SEND_MESSAGES_IN_THREADS = 1ULL << 38;
    constexpr quint64 USE_EMBEDDED_ACTIVITIES = 1ULL << 39;
    constexpr quint64 MODERATE_MEMBERS = 1ULL << 40;
    constexpr quint64 VIEW_CREATOR_MONETIZATION_ANALYTICS = 1ULL << 41;
    constexpr quint64 USE_SOUNDBOARD = 1ULL << 42;
    constexpr quint64 CREATE_GUILD_EXPRESSIONS = 1ULL << 43;
    constexpr quint64 CREATE_EVENTS = 1ULL << 44;
    constexpr quint64 USE_EXTERNAL_SOUNDS = 1ULL << 45;
    constexpr quint64 SEND_VOICE_MESSAGES = 1ULL << 46;
    constexpr quint64 SET_VOICE_CHANNEL_STATUS = 1ULL << 48;
    constexpr quint64 SEND_POLLS = 1ULL << 49;
    constexpr quint64 USE_EXTERNAL_APPS = 1ULL << 50;

    // Every named flag above
    constexpr quint64 ALL = ((1ULL << 47) - 1) | SET_VOICE_CHANNEL_STATUS | SEND_POLLS | USE_EXTERNAL_APPS;

    // Name of a single flag, or an empty string for an unknown bit
    QString flagName(quint64 flag);
}

/**
 * @brief Fixed-width set of Discord permission flags
 *
 * Thin value wrapper around the 64-bit permission integer. Never allocates.
 * Bits outside the catalogue are dropped on construction, so all() contains
 * every set that can be built.
 */
class PermissionSet
{
public:
    constexpr PermissionSet() = default;
    constexpr explicit PermissionSet(quint64 bits) : m_bits(bits & Permissions::ALL) {}

    static constexpr PermissionSet none() { return PermissionSet(); }
    static constexpr PermissionSet all() { return PermissionSet(Permissions::ALL); }

    constexpr quint64 bits() const { return m_bits; }
    constexpr bool isEmpty() const { return m_bits == 0; }

    // True if every flag in `other` is also set here
    constexpr bool contains(PermissionSet other) const { return (m_bits & other.m_bits) == other.m_bits; }
    constexpr bool contains(quint64 flags) const { return contains(PermissionSet(flags)); }

    // Set difference (AND-NOT)
    constexpr PermissionSet removed(PermissionSet other) const { return PermissionSet(m_bits & ~other.m_bits); }

    PermissionSet &insert(PermissionSet other)
    {
        m_bits |= other.m_bits;
        return *this;
    }

    PermissionSet &remove(PermissionSet other)
    {
        m_bits &= ~other.m_bits;
        return *this;
    }

    constexpr PermissionSet operator|(PermissionSet other) const { return PermissionSet(m_bits | other.m_bits); }
    constexpr PermissionSet operator&(PermissionSet other) const { return PermissionSet(m_bits & other.m_bits); }
    constexpr PermissionSet operator~() const { return PermissionSet(~m_bits); }

    PermissionSet &operator|=(PermissionSet other) { return insert(other); }
    PermissionSet &operator&=(PermissionSet other)
    {
        m_bits &= other.m_bits;
        return *this;
    }

    constexpr bool operator==(PermissionSet other) const { return m_bits == other.m_bits; }
    constexpr bool operator!=(PermissionSet other) const { return m_bits != other.m_bits; }

    // Names of the set flags, lowest bit first
    QStringList names() const;

private:
    quint64 m_bits = 0;
};

QDebug operator<<(QDebug debug, PermissionSet permissions);
