#pragma once

#include "sync/host_adapter.hpp"
#include <QFile>
#include <QObject>
#include <QSocketNotifier>
#include <QTextStream>
#include <memory>

namespace caretsync::app {

/**
 * ConsoleHost - Line-oriented host adapter for the caretsync CLI.
 *
 * Input (one command per line):
 *   move <line> <character> <file...>   local caret move
 *   focus on|off
 *   connect | disconnect | restart | status | quit
 *
 * Output: `apply <line> <character> <file>` for every remote position applied.
 * A file "opens" when it exists on disk.
 */
class ConsoleHost : public QObject, public sync::HostAdapter {
    Q_OBJECT

public:
    explicit ConsoleHost(QObject* parent = nullptr);
    ~ConsoleHost() override;

    // Start reading commands from stdin.
    void attachStdin();

    Result<void, Error> handleLine(const QString& line);

    [[nodiscard]] bool isFocused() const override { return focused_; }
    [[nodiscard]] bool isSyncableDocument(const QString& path) const override;
    Result<sync::DocumentHandle, Error> findOrOpenDocument(const QString& path) override;
    Result<void, Error> moveCaret(const sync::DocumentHandle& document, int line, int character) override;

    void print(const QString& text);

signals:
    void connectRequested();
    void disconnectRequested();
    void restartRequested();
    void statusRequested();
    void quitRequested();

private slots:
    void onStdinReadable();

private:
    bool focused_ = true;
    QFile stdin_;
    QTextStream out_;
    std::unique_ptr<QSocketNotifier> notifier_;
};

} // namespace caretsync::app
