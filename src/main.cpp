#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include "app/console_host.hpp"
#include "app/sync_config.hpp"
#include "core/logging.hpp"
#include "sync/sync_engine.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("caretsync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("caretsync");
    app.setOrganizationDomain("caretsync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Caret position sync between two editors"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption roleOption(
        QStringList{QStringLiteral("role")},
        QStringLiteral("Link role: 'listen' binds the port, 'dial' connects to it."),
        QStringLiteral("role"));
    parser.addOption(roleOption);

    const QCommandLineOption hostOption(
        QStringList{QStringLiteral("host")},
        QStringLiteral("Host to dial (dial role only)."),
        QStringLiteral("host"));
    parser.addOption(hostOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Rendezvous port (default 3000)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets CARETSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    const QCommandLineOption noFileLogOption(
        QStringList{QStringLiteral("no-file-log")},
        QStringLiteral("Log to stderr only."));
    parser.addOption(noFileLogOption);

    const QCommandLineOption noAutoConnectOption(
        QStringList{QStringLiteral("no-auto-connect")},
        QStringLiteral("Stay disconnected until a 'connect' command."));
    parser.addOption(noAutoConnectOption);

    parser.process(app);

    // Command line beats environment, which beats the settings file.
    if (parser.isSet(roleOption)) {
        qputenv("CARETSYNC_ROLE", parser.value(roleOption).toUtf8());
    }
    if (parser.isSet(hostOption)) {
        qputenv("CARETSYNC_HOST", parser.value(hostOption).toUtf8());
    }
    if (parser.isSet(portOption)) {
        qputenv("CARETSYNC_PORT", parser.value(portOption).toUtf8());
    }

    const bool debugSync = parser.isSet(debugSyncOption);
    if (debugSync) {
        qputenv("CARETSYNC_DEBUG_SYNC", "1");
    }

    if (!parser.isSet(noFileLogOption)) {
        caretsync::install_file_logging();
        qInfo() << "caretsync: logging to" << caretsync::default_log_file_path();
    }
    if (debugSync) {
        qInfo() << "caretsync: sync debug enabled";
    }

    QSettings settings;
    auto loaded = caretsync::app::load_sync_config(settings);
    if (loaded.is_err()) {
        QTextStream(stderr) << QString::fromStdString(loaded.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    auto config = loaded.unwrap();
    config.auto_connect = !parser.isSet(noAutoConnectOption);

    qInfo().noquote() << "caretsync:" << caretsync::app::to_string(config.role)
                      << config.host << config.port
                      << "as" << config.local_source << "peer" << config.peer_source;

    caretsync::app::ConsoleHost host;
    caretsync::sync::SyncEngine engine(host, caretsync::app::make_transport(config), config.engine);

    QObject::connect(&engine, &caretsync::sync::SyncEngine::statusChanged, &app,
                     [&host](const caretsync::sync::SyncStatus &status) {
        host.print(QStringLiteral("status %1").arg(caretsync::sync::to_string(status)));
    });
    QObject::connect(&engine, &caretsync::sync::SyncEngine::positionSent, &app,
                     [&host](const caretsync::CursorPosition &position) {
        host.print(QStringLiteral("sent %1 %2 %3")
                       .arg(position.line())
                       .arg(position.character())
                       .arg(position.file()));
    });
    QObject::connect(&engine, &caretsync::sync::SyncEngine::error, &app,
                     [](const caretsync::Error &err) {
        qWarning().noquote() << "caretsync:" << caretsync::to_string(err.kind)
                             << QString::fromStdString(err.message);
    });

    QObject::connect(&host, &caretsync::app::ConsoleHost::connectRequested, &app, [&engine]() {
        engine.connect();
    });
    QObject::connect(&host, &caretsync::app::ConsoleHost::disconnectRequested, &app, [&engine]() {
        engine.disconnect();
    });
    QObject::connect(&host, &caretsync::app::ConsoleHost::restartRequested, &app, [&engine]() {
        engine.restart();
    });
    QObject::connect(&host, &caretsync::app::ConsoleHost::statusRequested, &app, [&host, &engine]() {
        host.print(QStringLiteral("status %1").arg(caretsync::sync::to_string(engine.status())));
    });
    QObject::connect(&host, &caretsync::app::ConsoleHost::quitRequested, &app, [&engine, &app]() {
        engine.disconnect();
        app.quit();
    });

    host.attachStdin();
    if (config.auto_connect) {
        engine.connect();
    }

    return app.exec();
}
