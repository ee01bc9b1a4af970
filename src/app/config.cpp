#include "app/config.hpp"

#include <QDir>
#include <QStandardPaths>

namespace tally::app {

namespace {

constexpr auto kSettingsDbPath = "storage/db_path";
constexpr auto kSettingsSyncDirectory = "sync/directory";
constexpr auto kSettingsSyncUrl = "sync/url";
constexpr auto kSettingsClientId = "sync/client_id";
constexpr auto kSettingsSyncToken = "sync/token";
constexpr auto kSettingsLogPath = "logging/path";

void apply_setting(QString& field, QSettings& settings, const char* key) {
    const auto value = settings.value(QString::fromLatin1(key)).toString();
    if (!value.isEmpty()) {
        field = value;
    }
}

void apply_env(QString& field, const QProcessEnvironment& env, const char* name) {
    const auto value = env.value(QString::fromLatin1(name));
    if (!value.isEmpty()) {
        field = value;
    }
}

void apply_override(QString& field, const std::optional<QString>& value) {
    if (value) {
        field = *value;
    }
}

} // namespace

QString default_database_path() {
    const auto data_path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (data_path.isEmpty()) {
        return QStringLiteral("tally.db");
    }
    return QDir(data_path).filePath(QStringLiteral("tally.db"));
}

AppConfig resolve_config(QSettings& settings,
                         const QProcessEnvironment& env,
                         const ConfigOverrides& overrides) {
    AppConfig config;
    config.db_path = default_database_path();

    apply_setting(config.db_path, settings, kSettingsDbPath);
    apply_setting(config.sync_directory, settings, kSettingsSyncDirectory);
    apply_setting(config.sync_url, settings, kSettingsSyncUrl);
    apply_setting(config.client_id, settings, kSettingsClientId);
    apply_setting(config.sync_token, settings, kSettingsSyncToken);
    apply_setting(config.log_path, settings, kSettingsLogPath);

    apply_env(config.db_path, env, "TALLY_DB_PATH");
    apply_env(config.sync_directory, env, "TALLY_SYNC_DIR");
    apply_env(config.sync_url, env, "TALLY_SYNC_URL");
    apply_env(config.client_id, env, "TALLY_CLIENT_ID");
    apply_env(config.sync_token, env, "TALLY_SYNC_TOKEN");
    apply_env(config.log_path, env, "TALLY_LOG_PATH");

    apply_override(config.db_path, overrides.db_path);
    apply_override(config.sync_directory, overrides.sync_directory);
    apply_override(config.sync_url, overrides.sync_url);
    apply_override(config.client_id, overrides.client_id);

    return config;
}

AppConfig load_config(const ConfigOverrides& overrides) {
    QSettings settings;
    return resolve_config(settings, QProcessEnvironment::systemEnvironment(), overrides);
}

} // namespace tally::app
