#pragma once

#include <QProcessEnvironment>
#include <QSettings>
#include <QString>
#include <optional>

namespace tally::app {

/**
 * AppConfig - Resolved runtime configuration.
 *
 * Sources, lowest priority first: built-in defaults, QSettings
 * (organization "Tally"), TALLY_* environment variables, command line.
 */
struct AppConfig {
    QString db_path;
    QString sync_directory;
    QString sync_url;
    QString client_id;
    QString sync_token;
    QString log_path;

    [[nodiscard]] bool sync_configured() const {
        return !sync_directory.isEmpty() || !sync_url.isEmpty();
    }
};

/**
 * Values given on the command line; unset fields leave lower layers alone.
 */
struct ConfigOverrides {
    std::optional<QString> db_path;
    std::optional<QString> sync_directory;
    std::optional<QString> sync_url;
    std::optional<QString> client_id;
};

[[nodiscard]] QString default_database_path();

/**
 * Resolve every layer. settings and env are parameters so tests can pass
 * their own.
 */
[[nodiscard]] AppConfig resolve_config(QSettings& settings,
                                       const QProcessEnvironment& env,
                                       const ConfigOverrides& overrides = {});

/**
 * Resolve with the application's QSettings and the process environment.
 */
[[nodiscard]] AppConfig load_config(const ConfigOverrides& overrides = {});

} // namespace tally::app
