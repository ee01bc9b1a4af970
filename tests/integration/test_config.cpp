#include <catch2/catch_test_macros.hpp>
#include "app/config.hpp"

#include <QSettings>
#include <QTemporaryDir>
#include <initializer_list>
#include <utility>

using namespace tally::app;

namespace {

QProcessEnvironment environment(std::initializer_list<std::pair<QString, QString>> values) {
    QProcessEnvironment env;
    for (const auto& [name, value] : values) {
        env.insert(name, value);
    }
    return env;
}

} // namespace

TEST_CASE("Config: defaults", "[integration][config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath("tally.ini"), QSettings::IniFormat);

    const auto config = resolve_config(settings, QProcessEnvironment{});

    REQUIRE(config.db_path == default_database_path());
    REQUIRE(config.db_path.endsWith(QStringLiteral("tally.db")));
    REQUIRE(config.sync_directory.isEmpty());
    REQUIRE(config.sync_url.isEmpty());
    REQUIRE(config.log_path.isEmpty());
    REQUIRE_FALSE(config.sync_configured());
}

TEST_CASE("Config: layers override each other", "[integration][config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath("tally.ini"), QSettings::IniFormat);
    settings.setValue("storage/db_path", "/settings/tally.db");
    settings.setValue("sync/directory", "/settings/sync");
    settings.setValue("sync/client_id", "settings-client");
    settings.setValue("sync/token", "settings-token");
    settings.setValue("logging/path", "/settings/tally.log");

    SECTION("Settings replace defaults") {
        const auto config = resolve_config(settings, QProcessEnvironment{});
        REQUIRE(config.db_path == "/settings/tally.db");
        REQUIRE(config.sync_directory == "/settings/sync");
        REQUIRE(config.client_id == "settings-client");
        REQUIRE(config.sync_token == "settings-token");
        REQUIRE(config.log_path == "/settings/tally.log");
        REQUIRE(config.sync_configured());
    }

    SECTION("Environment replaces settings") {
        const auto env = environment({
            {"TALLY_DB_PATH", "/env/tally.db"},
            {"TALLY_SYNC_URL", "https://sync.example/tally"},
            {"TALLY_SYNC_TOKEN", "env-token"},
            {"TALLY_LOG_PATH", ""},
        });
        const auto config = resolve_config(settings, env);
        REQUIRE(config.db_path == "/env/tally.db");
        REQUIRE(config.sync_url == "https://sync.example/tally");
        REQUIRE(config.sync_token == "env-token");
        REQUIRE(config.sync_directory == "/settings/sync");
        REQUIRE(config.log_path == "/settings/tally.log");
    }

    SECTION("Command line replaces environment") {
        const auto env = environment({
            {"TALLY_DB_PATH", "/env/tally.db"},
            {"TALLY_CLIENT_ID", "env-client"},
        });
        ConfigOverrides overrides;
        overrides.db_path = QStringLiteral("/cli/tally.db");
        overrides.sync_directory = QStringLiteral("/cli/sync");

        const auto config = resolve_config(settings, env, overrides);
        REQUIRE(config.db_path == "/cli/tally.db");
        REQUIRE(config.sync_directory == "/cli/sync");
        REQUIRE(config.client_id == "env-client");
    }
}
