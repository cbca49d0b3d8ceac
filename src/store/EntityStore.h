#pragma once
#include <QHash>
#include <QList>
#include <algorithm>
#include "models/Snowflake.h"

/**
 * @brief Owning ID -> entity map for one kind of guild entity
 *
 * Lookups return nullptr when the ID is unknown. Entities referenced by ID
 * elsewhere (member roles, overwrite targets) may have been deleted since the
 * snapshot was taken, so absence is normal and never reported as an error.
 */
template <typename T>
class EntityStore
{
public:
    const T *get(Snowflake id) const
    {
        auto it = m_entities.constFind(id);
        return it == m_entities.constEnd() ? nullptr : &it.value();
    }

    bool contains(Snowflake id) const { return m_entities.contains(id); }
    int size() const { return m_entities.size(); }
    bool isEmpty() const { return m_entities.isEmpty(); }

    // Replaces any entity already stored under the same ID
    void insert(Snowflake id, const T &entity) { m_entities.insert(id, entity); }
    bool remove(Snowflake id) { return m_entities.remove(id) > 0; }
    void clear() { m_entities.clear(); }

    QList<Snowflake> ids() const
    {
        QList<Snowflake> keys = m_entities.keys();
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    // Stable order for scans: ascending ID
    QList<const T *> values() const
    {
        QList<const T *> result;
        result.reserve(m_entities.size());
        for (Snowflake id : ids())
            result.append(get(id));
        return result;
    }

private:
    QHash<Snowflake, T> m_entities;
};
