#pragma once

#include <QString>
#include <QtGlobal>

namespace tally::app {

struct LogOptions {
    QString path;                               // empty: default_log_file_path()
    QtMsgType console_threshold = QtWarningMsg; // echoed to stderr from this level up
    qint64 max_bytes = 1024 * 1024;             // rotate to <path>.1 beyond this size
};

/**
 * Route Qt logging to a file, one "time level category message" line per
 * record. Calling again reopens the file with the new options. Returns
 * false when no log file could be opened; console output still works.
 */
bool install_file_logging(const LogOptions& options = {});

/**
 * Restore the previous message handler and close the file.
 */
void uninstall_file_logging();

// logs/tally.log under the app-local data location (may be empty if unavailable).
QString default_log_file_path();

QString active_log_file_path();

} // namespace tally::app
