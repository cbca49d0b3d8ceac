#pragma once
#include <QString>
#include <QList>
#include "Snowflake.h"
#include "User.h"

// A user's membership in one guild
struct Member
{
    User user;
    QList<Snowflake> roles; // May reference roles that no longer exist
    QString nick;           // Empty if no guild nickname

    Snowflake id() const { return user.id; }

    QString displayName() const
    {
        return nick.isEmpty() ? user.username : nick;
    }
};
