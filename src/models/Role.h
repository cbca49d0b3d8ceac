#pragma once
#include <QString>
#include "Snowflake.h"
#include "Permissions.h"

struct Role
{
    Snowflake id = 0;
    QString name;
    PermissionSet permissions;
    int position = 0; // Not unique within a guild
};
