#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QTextStream>

#include "app/app_context.hpp"
#include "app/cli_format.hpp"
#include "app/config.hpp"
#include "app/logging.hpp"
#include "import/cashew_import.hpp"
#include "import/csv_directory_source.hpp"
#include "import/csv_export.hpp"
#include "import/json_backup_source.hpp"
#include "sync/snapshot.hpp"

namespace {

int report_error(const tally::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

int usage(const QCommandLineParser& parser) {
    QTextStream(stderr) << parser.helpText();
    return 2;
}

tally::app::StoreSummary summarize(tally::app::AppContext& context) {
    tally::app::StoreSummary summary;
    summary.db_path = context.config().db_path;
    summary.schema_version = context.engine().schema_version().value_or(0);
    summary.categories = context.categories().count().value_or(0);
    summary.transactions = context.transactions().count().value_or(0);
    summary.budgets = context.budgets().count().value_or(0);
    summary.pending_changes = context.sync_state().has_pending_changes().value_or(false);
    if (auto state = context.sync_state().load(); state.is_ok() && state.unwrap()) {
        summary.last_revision = state.unwrap()->last_revision;
    }
    summary.sync_state = QString::fromLatin1(tally::sync::to_string(context.sync_adapter().state()).data());
    summary.warnings = context.controller().warnings();
    return summary;
}

int run_import(tally::app::AppContext& context, const QString& path, bool json) {
    tally::importer::ImportResult result;
    if (QFileInfo(path).isDir()) {
        tally::importer::CsvDirectorySource source(path);
        result = context.importer().import_from(source);
    } else {
        auto source = tally::importer::JsonBackupSource::from_file(path);
        if (source.is_err()) {
            return report_error(source.unwrap_err());
        }
        result = context.importer().import_from(source.unwrap());
    }

    QTextStream(stdout) << (json ? tally::app::format_import_result_json(result)
                                 : tally::app::format_import_result(result));
    return result.ok() ? 0 : 1;
}

int run_export(tally::app::AppContext& context, const QString& path) {
    auto snapshot = tally::sync::collect_snapshot(context.engine(), context.categories(),
                                                  context.transactions(), context.budgets());
    if (snapshot.is_err()) {
        return report_error(snapshot.unwrap_err());
    }

    const auto bytes = tally::sync::encode_snapshot(snapshot.unwrap());
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size() || !file.commit()) {
        return report_error(tally::Error{tally::ErrorKind::Storage,
            "cannot write " + path.toStdString() + ": " + file.errorString().toStdString()});
    }
    QTextStream(stdout) << QStringLiteral("Exported %1 rows to %2\n")
                               .arg(static_cast<qulonglong>(snapshot.unwrap().row_count()))
                               .arg(path);
    return 0;
}

int run_export_csv(tally::app::AppContext& context, const QString& directory) {
    auto snapshot = tally::sync::collect_snapshot(context.engine(), context.categories(),
                                                  context.transactions(), context.budgets());
    if (snapshot.is_err()) {
        return report_error(snapshot.unwrap_err());
    }

    auto& rows = snapshot.unwrap();
    auto result = tally::importer::export_csv_directory(directory, std::move(rows.categories),
                                                        std::move(rows.transactions),
                                                        std::move(rows.budgets));
    if (result.is_err()) {
        return report_error(result.unwrap_err());
    }
    QTextStream(stdout) << QStringLiteral("Exported %1 rows to %2\n")
                               .arg(static_cast<qulonglong>(result.unwrap().row_count()))
                               .arg(result.unwrap().directory);
    return 0;
}

int run_import_cashew(tally::app::AppContext& context, const QString& path,
                      const tally::importer::CashewOptions& options, bool json) {
    tally::importer::CashewImporter importer(context.engine(), context.categories(),
                                             context.transactions());
    auto result = importer.import_file(path, options);
    if (result.is_err()) {
        return report_error(result.unwrap_err());
    }
    QTextStream(stdout) << (json ? tally::app::format_cashew_result_json(result.unwrap())
                                 : tally::app::format_cashew_result(result.unwrap()));
    return 0;
}

int run_sync(tally::app::AppContext& context) {
    if (!context.sync_adapter().is_attached()) {
        const auto error = context.sync_adapter().last_error();
        return report_error(error.value_or(tally::Error{tally::ErrorKind::SyncUnavailable,
            "sync is not configured (use --sync-dir or --sync-url)"}));
    }
    auto report = context.sync_adapter().sync();
    if (report.is_err()) {
        return report_error(report.unwrap_err());
    }
    QTextStream(stdout) << tally::app::format_sync_report(report.unwrap());
    return 0;
}

int run_list(tally::app::AppContext& context, const QString& what, bool json) {
    QTextStream out(stdout);
    if (what == QStringLiteral("categories")) {
        auto rows = context.categories().list();
        if (rows.is_err()) return report_error(rows.unwrap_err());
        out << (json ? tally::app::format_categories_json(rows.unwrap())
                     : tally::app::format_categories(rows.unwrap()));
        return 0;
    }
    if (what == QStringLiteral("transactions")) {
        auto rows = context.transactions().list();
        if (rows.is_err()) return report_error(rows.unwrap_err());
        out << (json ? tally::app::format_transactions_json(rows.unwrap())
                     : tally::app::format_transactions(rows.unwrap()));
        return 0;
    }
    if (what == QStringLiteral("budgets")) {
        auto rows = context.budgets().list();
        if (rows.is_err()) return report_error(rows.unwrap_err());
        out << (json ? tally::app::format_budgets_json(rows.unwrap())
                     : tally::app::format_budgets(rows.unwrap()));
        return 0;
    }
    QTextStream(stderr) << "Unknown list target '" << what
                        << "' (expected categories, transactions or budgets)\n";
    return 2;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Tally");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Tally");
    app.setOrganizationDomain("tally.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Tally personal finance store"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Database path (overrides TALLY_DB_PATH)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption syncDirOption(
        QStringList{QStringLiteral("sync-dir")},
        QStringLiteral("Sync through a snapshot file in this directory."),
        QStringLiteral("dir"));
    parser.addOption(syncDirOption);

    const QCommandLineOption syncUrlOption(
        QStringList{QStringLiteral("sync-url")},
        QStringLiteral("Sync through an HTTP resource (token from TALLY_SYNC_TOKEN)."),
        QStringLiteral("url"));
    parser.addOption(syncUrlOption);

    const QCommandLineOption clientIdOption(
        QStringList{QStringLiteral("client-id")},
        QStringLiteral("Client id used to sign in to the sync store."),
        QStringLiteral("id"));
    parser.addOption(clientIdOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging."));
    parser.addOption(debugSyncOption);

    const QCommandLineOption dryRunOption(
        QStringList{QStringLiteral("dry-run")},
        QStringLiteral("import-cashew: report what would be imported without writing."));
    parser.addOption(dryRunOption);

    const QCommandLineOption skipDuplicatesOption(
        QStringList{QStringLiteral("skip-duplicates")},
        QStringLiteral("import-cashew: skip rows matching an existing transaction."));
    parser.addOption(skipDuplicatesOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("status | import <path> | import-cashew <file> | "
                                                "export <file> | export-csv <dir> | sync | "
                                                "list categories|transactions|budgets"));
    parser.process(app);

    tally::app::ConfigOverrides overrides;
    if (parser.isSet(dbPathOption)) overrides.db_path = parser.value(dbPathOption);
    if (parser.isSet(syncDirOption)) overrides.sync_directory = parser.value(syncDirOption);
    if (parser.isSet(syncUrlOption)) overrides.sync_url = parser.value(syncUrlOption);
    if (parser.isSet(clientIdOption)) overrides.client_id = parser.value(clientIdOption);
    const auto config = tally::app::load_config(overrides);

    tally::app::LogOptions logOptions;
    logOptions.path = config.log_path;
    if (!tally::app::install_file_logging(logOptions)) {
        QTextStream(stderr) << "Logging to stderr only\n";
    }
    if (parser.isSet(debugSyncOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("tally.sync.debug=true\n"));
        qInfo() << "Tally: sync debug enabled";
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage(parser);
    }
    const auto command = positional.first();
    const bool json = parser.isSet(jsonOption);

    tally::app::AppContext context(config);
    const auto status = context.initialize();
    if (!status.is_ready) {
        return report_error(status.error.value_or(
            tally::Error{tally::ErrorKind::StorageUnavailable, "store failed to start"}));
    }

    if (command == QStringLiteral("status")) {
        const auto summary = summarize(context);
        QTextStream(stdout) << (json ? tally::app::format_status_json(summary)
                                     : tally::app::format_status(summary));
        return 0;
    }
    if (command == QStringLiteral("import") && positional.size() == 2) {
        return run_import(context, positional.at(1), json);
    }
    if (command == QStringLiteral("export") && positional.size() == 2) {
        return run_export(context, positional.at(1));
    }
    if (command == QStringLiteral("import-cashew") && positional.size() == 2) {
        tally::importer::CashewOptions options;
        options.commit = !parser.isSet(dryRunOption);
        options.skip_duplicates = parser.isSet(skipDuplicatesOption);
        return run_import_cashew(context, positional.at(1), options, json);
    }
    if (command == QStringLiteral("export-csv") && positional.size() == 2) {
        return run_export_csv(context, positional.at(1));
    }
    if (command == QStringLiteral("sync")) {
        return run_sync(context);
    }
    if (command == QStringLiteral("list") && positional.size() == 2) {
        return run_list(context, positional.at(1), json);
    }
    return usage(parser);
}
