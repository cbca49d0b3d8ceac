#include "Logging.h"
#include <atomic>

Q_LOGGING_CATEGORY(lcResolve, "cordperms.resolve", QtWarningMsg)
Q_LOGGING_CATEGORY(lcIntegrity, "cordperms.integrity")

namespace
{
    enum Verbosity
    {
        FOLLOW_RULES,
        QUIET,
        VERBOSE
    };

    std::atomic<int> verbosity(FOLLOW_RULES);
    QLoggingCategory::CategoryFilter previousFilter = nullptr;

    // Runs after Qt's own rule evaluation whenever categories are
    // (re)configured, e.g. by a later setFilterRules() from the host.
    // Compares by name: lcResolve() may be the category being registered.
    void resolveCategoryFilter(QLoggingCategory *category)
    {
        if (previousFilter)
            previousFilter(category);

        int mode = verbosity.load();
        if (mode != FOLLOW_RULES && qstrcmp(category->categoryName(), "cordperms.resolve") == 0)
            category->setEnabled(QtDebugMsg, mode == VERBOSE);
    }
}

void Logging::setVerbose(bool verbose)
{
    static const bool filterInstalled = []()
    {
        previousFilter = QLoggingCategory::installFilter(resolveCategoryFilter);
        return true;
    }();
    Q_UNUSED(filterInstalled);

    verbosity.store(verbose ? VERBOSE : QUIET);
    lcResolve().setEnabled(QtDebugMsg, verbose);
}
