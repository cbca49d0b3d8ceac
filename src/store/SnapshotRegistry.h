#pragma once
#include <QHash>
#include <QList>
#include <QReadWriteLock>
#include <QSharedPointer>
#include "models/Guild.h"

/**
 * @brief Current immutable snapshot of every known guild
 *
 * The sync layer builds a complete new Guild and publishes it; readers take a
 * shared pointer and keep using it for the whole permission check even if a
 * newer snapshot is published meanwhile. Snapshots are never edited in place.
 */
class SnapshotRegistry
{
public:
    using GuildSnapshot = QSharedPointer<const Guild>;

    // Replace (or add) the snapshot for snapshot->id
    void publish(const GuildSnapshot &snapshot);
    void publish(const Guild &guild);

    // Null pointer if the guild is unknown
    GuildSnapshot snapshot(Snowflake guildId) const;

    bool remove(Snowflake guildId);
    void clear();

    QList<Snowflake> guildIds() const;
    int size() const;

private:
    mutable QReadWriteLock m_lock;
    QHash<Snowflake, GuildSnapshot> m_guilds;
};
