#pragma once
#include <QString>
#include "Snowflake.h"

struct User {
    Snowflake id = 0;
    QString username;
    QString discriminator; // "0" under the new username system
};
