#include "Guild.h"
#include <algorithm>
#include <limits>

namespace
{
    // Splits "name#1234" into its parts. Returns false if there is no
    // discriminator suffix.
    bool parseUserTag(const QString &tag, QString &username, QString &discriminator)
    {
        int hash = tag.lastIndexOf('#');
        if (hash < 0)
            return false;

        QString suffix = tag.mid(hash + 1);
        if (suffix.isEmpty() || suffix.size() > 4)
            return false;

        for (QChar c : suffix)
        {
            if (!c.isDigit())
                return false;
        }

        username = tag.left(hash);
        discriminator = suffix;
        return true;
    }

    Qt::CaseSensitivity sensitivity(bool caseSensitive)
    {
        return caseSensitive ? Qt::CaseSensitive : Qt::CaseInsensitive;
    }

    // Lower is closer: where `origin` starts in `word`, plus the word length
    int closenessToOrigin(const QString &origin, const QString &word, Qt::CaseSensitivity cs)
    {
        int index = word.indexOf(origin, 0, cs);
        if (index < 0)
            return std::numeric_limits<int>::max();
        return index + word.size();
    }

    void sortByCloseness(QList<Guild::MemberMatch> &matches, const QString &origin, Qt::CaseSensitivity cs)
    {
        std::stable_sort(matches.begin(), matches.end(), [&](const Guild::MemberMatch &a, const Guild::MemberMatch &b)
                         { return closenessToOrigin(origin, a.second, cs) < closenessToOrigin(origin, b.second, cs); });
    }
}

const Role *Guild::roleByName(const QString &roleName) const
{
    for (const Role *role : roles.values())
    {
        if (role->name == roleName)
            return role;
    }
    return nullptr;
}

const Member *Guild::memberNamed(const QString &name) const
{
    QString username = name;
    QString discriminator;
    bool hasDiscriminator = parseUserTag(name, username, discriminator);

    const QList<const Member *> all = members.values();
    for (const Member *member : all)
    {
        if (member->user.username != username)
            continue;
        // Legacy tags are zero padded ("0042"), compare numerically
        if (hasDiscriminator && member->user.discriminator.toInt() != discriminator.toInt())
            continue;
        return member;
    }

    for (const Member *member : all)
    {
        if (!member->nick.isEmpty() && member->nick == name)
            return member;
    }
    return nullptr;
}

QList<Guild::MemberMatch> Guild::membersStartingWith(const QString &prefix, bool caseSensitive, bool sorted) const
{
    const Qt::CaseSensitivity cs = sensitivity(caseSensitive);
    QList<MemberMatch> matches;

    for (const Member *member : members.values())
    {
        if (member->user.username.startsWith(prefix, cs))
            matches.append(MemberMatch(member, member->user.username));
        else if (!member->nick.isEmpty() && member->nick.startsWith(prefix, cs))
            matches.append(MemberMatch(member, member->nick));
    }

    if (sorted)
        sortByCloseness(matches, prefix, cs);
    return matches;
}

QList<Guild::MemberMatch> Guild::membersContaining(const QString &substring, bool caseSensitive, bool sorted) const
{
    const Qt::CaseSensitivity cs = sensitivity(caseSensitive);
    QList<MemberMatch> matches;

    for (const Member *member : members.values())
    {
        if (member->user.username.contains(substring, cs))
            matches.append(MemberMatch(member, member->user.username));
        else if (!member->nick.isEmpty() && member->nick.contains(substring, cs))
            matches.append(MemberMatch(member, member->nick));
    }

    if (sorted)
        sortByCloseness(matches, substring, cs);
    return matches;
}

QList<Guild::MemberMatch> Guild::membersUsernameContaining(const QString &substring, bool caseSensitive,
                                                           bool sorted) const
{
    const Qt::CaseSensitivity cs = sensitivity(caseSensitive);
    QList<MemberMatch> matches;

    for (const Member *member : members.values())
    {
        if (member->user.username.contains(substring, cs))
            matches.append(MemberMatch(member, member->user.username));
    }

    if (sorted)
        sortByCloseness(matches, substring, cs);
    return matches;
}

QList<Guild::MemberMatch> Guild::membersNickContaining(const QString &substring, bool caseSensitive, bool sorted) const
{
    const Qt::CaseSensitivity cs = sensitivity(caseSensitive);
    QList<MemberMatch> matches;

    for (const Member *member : members.values())
    {
        const QString name = member->displayName();
        if (name.contains(substring, cs))
            matches.append(MemberMatch(member, name));
    }

    if (sorted)
        sortByCloseness(matches, substring, cs);
    return matches;
}
