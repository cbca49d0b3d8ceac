#pragma once
#include <QLoggingCategory>

// Per-call resolution detail (skipped roles and the like). Off unless enabled.
Q_DECLARE_LOGGING_CATEGORY(lcResolve)
// Snapshot integrity problems such as a missing @everyone role
Q_DECLARE_LOGGING_CATEGORY(lcIntegrity)

namespace Logging
{
    // Turns cordperms.resolve debug output on or off. Until this is first
    // called the category follows QT_LOGGING_RULES and the host's filter
    // rules; afterwards it overrides them for that one category only. Other
    // categories and the host's rules are left alone.
    void setVerbose(bool verbose);
}
