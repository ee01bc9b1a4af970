#pragma once

#include <QLoggingCategory>

// Logging categories shared across tally. Enable debug output per area with
// QT_LOGGING_RULES, e.g. "tally.sync.debug=true".
Q_DECLARE_LOGGING_CATEGORY(tallyStorageLog)
Q_DECLARE_LOGGING_CATEGORY(tallyImportLog)
Q_DECLARE_LOGGING_CATEGORY(tallySyncLog)
Q_DECLARE_LOGGING_CATEGORY(tallyInitLog)
