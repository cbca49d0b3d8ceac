#include "SnapshotRegistry.h"
#include "utils/Logging.h"
#include <QReadLocker>
#include <QWriteLocker>
#include <algorithm>

void SnapshotRegistry::publish(const GuildSnapshot &snapshot)
{
    if (!snapshot)
    {
        qCWarning(lcIntegrity) << "Ignoring null guild snapshot";
        return;
    }

    QWriteLocker locker(&m_lock);
    m_guilds.insert(snapshot->id, snapshot);
}

void SnapshotRegistry::publish(const Guild &guild)
{
    publish(GuildSnapshot::create(guild));
}

SnapshotRegistry::GuildSnapshot SnapshotRegistry::snapshot(Snowflake guildId) const
{
    QReadLocker locker(&m_lock);
    return m_guilds.value(guildId);
}

bool SnapshotRegistry::remove(Snowflake guildId)
{
    QWriteLocker locker(&m_lock);
    return m_guilds.remove(guildId) > 0;
}

void SnapshotRegistry::clear()
{
    QWriteLocker locker(&m_lock);
    m_guilds.clear();
}

QList<Snowflake> SnapshotRegistry::guildIds() const
{
    QReadLocker locker(&m_lock);
    QList<Snowflake> ids = m_guilds.keys();
    std::sort(ids.begin(), ids.end());
    return ids;
}

int SnapshotRegistry::size() const
{
    QReadLocker locker(&m_lock);
    return m_guilds.size();
}
