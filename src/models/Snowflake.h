#pragma once
#include <QtGlobal>

// Discord IDs are unsigned 64-bit snowflakes. 0 means "no ID".
using Snowflake = quint64;
