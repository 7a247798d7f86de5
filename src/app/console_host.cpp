#include "app/console_host.hpp"
#include <QDebug>
#include <QFileInfo>
#include <cstdio>

namespace caretsync::app {

namespace {

Error usage(const QString& message) {
    return Error{ErrorKind::InvalidCommand, message.toStdString()};
}

} // namespace

ConsoleHost::ConsoleHost(QObject* parent)
    : QObject(parent)
    , out_(stdout)
{
}

ConsoleHost::~ConsoleHost() = default;

void ConsoleHost::attachStdin() {
    // Unbuffered: lines left in the pipe keep the notifier firing.
    if (!stdin_.open(fileno(stdin), QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        qWarning() << "HOST: cannot read stdin:" << stdin_.errorString();
        return;
    }
    notifier_ = std::make_unique<QSocketNotifier>(fileno(stdin), QSocketNotifier::Read, this);
    connect(notifier_.get(), &QSocketNotifier::activated,
            this, &ConsoleHost::onStdinReadable);
}

void ConsoleHost::onStdinReadable() {
    const QByteArray raw = stdin_.readLine();
    if (raw.isEmpty()) {
        // Readable with nothing to read: end of input.
        notifier_->setEnabled(false);
        emit quitRequested();
        return;
    }

    const auto line = QString::fromUtf8(raw).trimmed();
    if (line.isEmpty()) {
        return;
    }
    auto handled = handleLine(line);
    if (handled.is_err()) {
        print(QStringLiteral("error %1").arg(QString::fromStdString(handled.unwrap_err().message)));
    }
}

Result<void, Error> ConsoleHost::handleLine(const QString& line) {
    const auto parts = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        return Result<void, Error>::ok();
    }

    const auto command = parts.front().toLower();

    if (command == QLatin1String("move")) {
        if (parts.size() < 4) {
            return Result<void, Error>::err(usage(QStringLiteral("usage: move <line> <character> <file>")));
        }
        bool line_ok = false;
        bool char_ok = false;
        const int caret_line = parts.at(1).toInt(&line_ok);
        const int caret_char = parts.at(2).toInt(&char_ok);
        if (!line_ok || !char_ok || caret_line < 0 || caret_char < 0) {
            return Result<void, Error>::err(usage(QStringLiteral("line and character must be non-negative integers")));
        }
        const auto file = parts.mid(3).join(QLatin1Char(' '));
        if (on_caret_moved) {
            on_caret_moved(file, caret_line, caret_char);
        }
        return Result<void, Error>::ok();
    }

    if (command == QLatin1String("focus")) {
        if (parts.size() != 2 ||
            (parts.at(1) != QLatin1String("on") && parts.at(1) != QLatin1String("off"))) {
            return Result<void, Error>::err(usage(QStringLiteral("usage: focus on|off")));
        }
        focused_ = parts.at(1) == QLatin1String("on");
        if (on_focus_changed) {
            on_focus_changed(focused_);
        }
        return Result<void, Error>::ok();
    }

    if (command == QLatin1String("connect")) {
        emit connectRequested();
    } else if (command == QLatin1String("disconnect")) {
        emit disconnectRequested();
    } else if (command == QLatin1String("restart")) {
        emit restartRequested();
    } else if (command == QLatin1String("status")) {
        emit statusRequested();
    } else if (command == QLatin1String("quit")) {
        emit quitRequested();
    } else {
        return Result<void, Error>::err(usage(QStringLiteral("unknown command: %1").arg(command)));
    }
    return Result<void, Error>::ok();
}

bool ConsoleHost::isSyncableDocument(const QString& path) const {
    return sync::is_default_syncable_path(path);
}

Result<sync::DocumentHandle, Error> ConsoleHost::findOrOpenDocument(const QString& path) {
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return Result<sync::DocumentHandle, Error>::err(
            Error{ErrorKind::HostOperationFailed,
                  QStringLiteral("no such file: %1").arg(path).toStdString()});
    }
    return Result<sync::DocumentHandle, Error>::ok(sync::DocumentHandle{path, 0});
}

Result<void, Error> ConsoleHost::moveCaret(const sync::DocumentHandle& document, int line, int character) {
    print(QStringLiteral("apply %1 %2 %3").arg(line).arg(character).arg(document.path));
    // An editor reports its own programmatic caret moves like user moves.
    if (on_caret_moved) {
        on_caret_moved(document.path, line, character);
    }
    return Result<void, Error>::ok();
}

void ConsoleHost::print(const QString& text) {
    out_ << text << Qt::endl;
}

} // namespace caretsync::app
