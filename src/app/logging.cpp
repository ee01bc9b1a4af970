#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <cstdio>

namespace tally::app {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

// QtMsgType values are not ordered by severity (QtInfoMsg comes last).
int severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 0;
        case QtInfoMsg: return 1;
        case QtWarningMsg: return 2;
        case QtCriticalMsg: return 3;
        case QtFatalMsg: return 4;
    }
    return 4;
}

struct LogSink {
    QMutex mu;
    QFile file;
    QtMsgType console_threshold = QtWarningMsg;
    QtMessageHandler previous = nullptr;
    bool installed = false;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

// One previous generation is kept: tally.log -> tally.log.1
void rotate_if_large(const QString& path, qint64 max_bytes) {
    const QFileInfo info(path);
    if (max_bytes <= 0 || !info.exists() || info.size() < max_bytes) {
        return;
    }
    const auto backup = path + QStringLiteral(".1");
    QFile::remove(backup);
    if (!QFile::rename(path, backup)) {
        std::fprintf(stderr, "tally: cannot rotate log file %s\n", qPrintable(path));
    }
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    QMutexLocker lock(&s.mu);

    const auto category = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    if (s.file.isOpen()) {
        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                                   QString::fromLatin1(level_tag(type)), category, msg);
        s.file.write(line.toUtf8());
        s.file.flush();
    }

    if (severity(type) >= severity(s.console_threshold)) {
        std::fprintf(stderr, "%s %s\n", qPrintable(category), qPrintable(msg));
    }
}

} // namespace

bool install_file_logging(const LogOptions& options) {
    auto& s = sink();
    bool opened = false;
    {
        QMutexLocker lock(&s.mu);
        s.console_threshold = options.console_threshold;
        if (s.file.isOpen()) {
            s.file.close();
        }

        const auto path = options.path.isEmpty() ? default_log_file_path() : options.path;
        if (!path.isEmpty()) {
            QDir().mkpath(QFileInfo(path).absolutePath());
            rotate_if_large(path, options.max_bytes);
            s.file.setFileName(path);
            opened = s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
            if (!opened) {
                std::fprintf(stderr, "tally: cannot open log file %s: %s\n",
                             qPrintable(path), qPrintable(s.file.errorString()));
            }
        }
    }

    if (!s.installed) {
        s.previous = qInstallMessageHandler(message_handler);
        s.installed = true;
    }
    return opened;
}

void uninstall_file_logging() {
    auto& s = sink();
    if (s.installed) {
        qInstallMessageHandler(s.previous);
        s.previous = nullptr;
        s.installed = false;
    }
    QMutexLocker lock(&s.mu);
    s.file.close();
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/tally.log"));
}

QString active_log_file_path() {
    auto& s = sink();
    QMutexLocker lock(&s.mu);
    return s.file.isOpen() ? s.file.fileName() : QString{};
}

} // namespace tally::app
