#include "core/log.hpp"

Q_LOGGING_CATEGORY(tallyStorageLog, "tally.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(tallyImportLog, "tally.import", QtInfoMsg)
Q_LOGGING_CATEGORY(tallySyncLog, "tally.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(tallyInitLog, "tally.init", QtInfoMsg)
