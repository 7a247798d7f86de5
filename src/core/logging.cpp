#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>
#include <cstdio>

namespace caretsync {
namespace {

// A log larger than this is moved to caretsync.log.1 when the sink opens.
constexpr qint64 kRotateBytes = 1024 * 1024;

char level_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

/**
 * LogSink - Process-wide destination for Qt log messages.
 *
 * Every line goes to stderr; the file copy is best effort. The file is opened
 * lazily by the first message so an unwritable data directory never blocks
 * startup.
 */
class LogSink {
public:
    static LogSink& instance() {
        static LogSink sink;
        return sink;
    }

    void write(QtMsgType type, const char* category, const QString& message) {
        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
                              .arg(QChar::fromLatin1(level_letter(type)))
                              .arg(category ? QString::fromLatin1(category) : QString{})
                              .arg(message)
                              .toUtf8();

        QMutexLocker lock(&mu_);
        if (!opened_) {
            open();
        }
        if (file_.isOpen()) {
            file_.write(line);
            file_.flush();
        }
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    }

private:
    void open() {
        opened_ = true;
        const auto path = default_log_file_path();
        if (path.isEmpty()) {
            return;
        }

        const QFileInfo info(path);
        QDir().mkpath(info.absolutePath());
        if (info.exists() && info.size() > kRotateBytes) {
            const auto previous = path + QStringLiteral(".1");
            QFile::remove(previous);
            QFile::rename(path, previous);
        }

        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "caretsync: cannot open log file %s: %s\n",
                         qPrintable(path), qPrintable(file_.errorString()));
        }
    }

    QMutex mu_;
    QFile file_;
    bool opened_ = false;
};

void route_to_sink(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    LogSink::instance().write(type, context.category, message);
}

} // namespace

void install_file_logging() {
    qInstallMessageHandler(route_to_sink);
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/caretsync.log"));
}

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("CARETSYNC_DEBUG_SYNC");
}

} // namespace caretsync
