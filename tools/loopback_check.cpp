#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>

#include "network/tcp_transport.hpp"
#include "sync/sync_engine.hpp"

namespace {

// Accepts every document and records applied positions.
class RecordingHost : public caretsync::sync::HostAdapter {
public:
    bool isFocused() const override { return true; }
    bool isSyncableDocument(const QString&) const override { return true; }

    caretsync::Result<caretsync::sync::DocumentHandle, caretsync::Error>
    findOrOpenDocument(const QString& path) override {
        return caretsync::Result<caretsync::sync::DocumentHandle, caretsync::Error>::ok(
            caretsync::sync::DocumentHandle{path, 0});
    }

    caretsync::Result<void, caretsync::Error>
    moveCaret(const caretsync::sync::DocumentHandle& document, int line, int character) override {
        applied_file = document.path;
        applied_line = line;
        applied_character = character;
        if (on_caret_moved) {
            on_caret_moved(document.path, line, character);
        }
        return caretsync::Result<void, caretsync::Error>::ok();
    }

    QString applied_file;
    int applied_line = -1;
    int applied_character = -1;
};

caretsync::sync::EngineOptions options_for(const char* local, const char* peer) {
    caretsync::sync::EngineOptions options;
    options.labels = caretsync::SourceLabels{QString::fromLatin1(local), QString::fromLatin1(peer)};
    options.backoff.base_delay = std::chrono::milliseconds(50);
    options.backoff.max_delay = std::chrono::milliseconds(200);
    return options;
}

// Spins the event loop until `done` holds or `timeout_ms` passes.
template <typename Pred>
bool wait_for(Pred done, int timeout_ms) {
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeout_ms);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();
    return done();
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("CARETSYNC_DEBUG_SYNC", "1");

    RecordingHost hostA;
    RecordingHost hostB;

    auto listener = std::make_unique<caretsync::network::TcpListenerTransport>(0);
    auto* listenerRaw = listener.get();
    caretsync::sync::SyncEngine a(hostA, std::move(listener),
                                  options_for(caretsync::kHostALabel, caretsync::kHostBLabel));

    QObject::connect(&a, &caretsync::sync::SyncEngine::error, &app, [](const caretsync::Error &err) {
        qCritical().noquote() << "A error:" << QString::fromStdString(err.message);
    });

    a.connect();
    const auto port = listenerRaw->listeningPort();
    if (port == 0) {
        qCritical() << "A could not bind a loopback port";
        return 1;
    }

    caretsync::sync::SyncEngine b(
        hostB,
        std::make_unique<caretsync::network::TcpDialerTransport>(QStringLiteral("localhost"), port, 2000),
        options_for(caretsync::kHostBLabel, caretsync::kHostALabel));

    QObject::connect(&b, &caretsync::sync::SyncEngine::error, &app, [](const caretsync::Error &err) {
        qCritical().noquote() << "B error:" << QString::fromStdString(err.message);
    });

    int bSent = 0;
    QObject::connect(&b, &caretsync::sync::SyncEngine::positionSent, &app,
                     [&bSent](const caretsync::CursorPosition &) { ++bSent; });

    b.connect();

    const auto connected = [&]() {
        return a.lifecycle().isOpen() && b.lifecycle().isOpen();
    };
    if (!wait_for(connected, 3000)) {
        qCritical() << "link did not open";
        return 2;
    }

    // A -> B
    const auto fileA = QStringLiteral("/tmp/caretsync-loopback/a.cpp");
    a.onLocalPositionChanged(caretsync::CursorPosition(fileA, 12, 4, caretsync::Origin::Local));
    if (!wait_for([&]() { return hostB.applied_line == 12; }, 3000)) {
        qCritical() << "B never applied A's position";
        return 2;
    }

    // B -> A, after B's guard has settled
    QTimer::singleShot(b.options().apply_grace_ms + 50, &app, [&]() {
        const auto fileB = QStringLiteral("/tmp/caretsync-loopback/b.cpp");
        b.onLocalPositionChanged(caretsync::CursorPosition(fileB, 3, 9, caretsync::Origin::Local));
    });
    if (!wait_for([&]() { return hostA.applied_line == 3 && hostA.applied_character == 9; }, 3000)) {
        qCritical() << "A never applied B's position";
        return 2;
    }

    // B applied A's move without sending it back.
    if (bSent != 1) {
        qCritical() << "B sent" << bSent << "updates, expected 1";
        return 2;
    }

    qInfo() << "loopback ok on port" << port;
    return 0;
}
