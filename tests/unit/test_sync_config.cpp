#include <catch2/catch_test_macros.hpp>
#include "app/sync_config.hpp"
#include <QSettings>
#include <QTemporaryDir>

using namespace caretsync;
using namespace caretsync::app;

namespace {

// Restores an environment variable on scope exit; overrides would leak
// between cases otherwise.
class EnvVarGuard {
public:
    explicit EnvVarGuard(const char* name)
        : name_(name)
        , old_(qgetenv(name))
        , had_(qEnvironmentVariableIsSet(name))
    {
        qunsetenv(name);
    }

    ~EnvVarGuard() {
        if (had_) {
            qputenv(name_.constData(), old_);
        } else {
            qunsetenv(name_.constData());
        }
    }

private:
    QByteArray name_;
    QByteArray old_;
    bool had_ = false;
};

struct CleanEnv {
    EnvVarGuard role{"CARETSYNC_ROLE"};
    EnvVarGuard host{"CARETSYNC_HOST"};
    EnvVarGuard port{"CARETSYNC_PORT"};
};

} // namespace

TEST_CASE("SyncConfig: defaults", "[config]") {
    CleanEnv env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("caretsync.ini")), QSettings::IniFormat);

    auto loaded = load_sync_config(settings);
    REQUIRE(loaded.is_ok());
    const auto& config = loaded.unwrap();

    REQUIRE(config.role == Role::Listen);
    REQUIRE(config.host == QStringLiteral("localhost"));
    REQUIRE(config.port == 3000);
    REQUIRE(config.connect_timeout_ms == 5000);
    REQUIRE(config.engine.backoff.base_delay == std::chrono::milliseconds(1000));
    REQUIRE(config.engine.backoff.max_delay == std::chrono::milliseconds(30000));
    REQUIRE(config.engine.backoff.max_exponent == 5);
    REQUIRE(config.engine.backoff.max_attempts == 0);
    REQUIRE(config.engine.inbound_threshold == std::chrono::milliseconds(250));
    REQUIRE(config.engine.apply_grace_ms == 100);
    REQUIRE(config.engine.path_policy == sync::PathPolicy::Exact);

    // Listener speaks as host-a
    REQUIRE(config.engine.labels.local == QStringLiteral("host-a"));
    REQUIRE(config.engine.labels.peer == QStringLiteral("host-b"));
}

TEST_CASE("SyncConfig: settings file values", "[config]") {
    CleanEnv env;
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("caretsync.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("sync/role"), QStringLiteral("dial"));
    settings.setValue(QStringLiteral("sync/port"), 4100);
    settings.setValue(QStringLiteral("sync/reconnect_base_ms"), 200);
    settings.setValue(QStringLiteral("sync/max_reconnect_attempts"), 7);
    settings.setValue(QStringLiteral("sync/path_policy"), QStringLiteral("clean"));

    auto loaded = load_sync_config(settings);
    REQUIRE(loaded.is_ok());
    const auto& config = loaded.unwrap();

    REQUIRE(config.role == Role::Dial);
    REQUIRE(config.port == 4100);
    REQUIRE(config.engine.backoff.base_delay == std::chrono::milliseconds(200));
    REQUIRE(config.engine.backoff.max_attempts == 7);
    REQUIRE(config.engine.path_policy == sync::PathPolicy::Clean);
    REQUIRE(config.engine.labels.local == QStringLiteral("host-b"));
    REQUIRE(config.engine.labels.peer == QStringLiteral("host-a"));
}

TEST_CASE("SyncConfig: environment overrides the settings file", "[config]") {
    CleanEnv env;
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("caretsync.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("sync/role"), QStringLiteral("listen"));
    settings.setValue(QStringLiteral("sync/port"), 4100);

    qputenv("CARETSYNC_ROLE", "dial");
    qputenv("CARETSYNC_HOST", "127.0.0.1");
    qputenv("CARETSYNC_PORT", "4200");

    auto loaded = load_sync_config(settings);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.unwrap().role == Role::Dial);
    REQUIRE(loaded.unwrap().host == QStringLiteral("127.0.0.1"));
    REQUIRE(loaded.unwrap().port == 4200);
}

TEST_CASE("SyncConfig: explicit legacy labels", "[config]") {
    CleanEnv env;
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("caretsync.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("sync/local_source"), QStringLiteral("vscode"));
    settings.setValue(QStringLiteral("sync/peer_source"), QStringLiteral("jetbrains"));

    auto loaded = load_sync_config(settings);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.unwrap().engine.labels.local == QStringLiteral("vscode"));
    REQUIRE(loaded.unwrap().engine.labels.peer == QStringLiteral("jetbrains"));
}

TEST_CASE("SyncConfig: invalid values are rejected", "[config]") {
    CleanEnv env;
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("caretsync.ini")), QSettings::IniFormat);

    const auto expect_invalid = [&settings]() {
        auto loaded = load_sync_config(settings);
        REQUIRE(loaded.is_err());
        REQUIRE(loaded.unwrap_err().kind == ErrorKind::InvalidConfig);
    };

    SECTION("Unknown role") {
        settings.setValue(QStringLiteral("sync/role"), QStringLiteral("both"));
        expect_invalid();
    }

    SECTION("Port out of range") {
        settings.setValue(QStringLiteral("sync/port"), 70000);
        expect_invalid();
    }

    SECTION("Port from the environment is validated too") {
        qputenv("CARETSYNC_PORT", "zero");
        expect_invalid();
    }

    SECTION("Non-integer numeric key") {
        settings.setValue(QStringLiteral("sync/inbound_threshold_ms"), QStringLiteral("soon"));
        expect_invalid();
    }

    SECTION("Max delay below base") {
        settings.setValue(QStringLiteral("sync/reconnect_base_ms"), 5000);
        settings.setValue(QStringLiteral("sync/reconnect_max_ms"), 1000);
        expect_invalid();
    }

    SECTION("Max hold not above grace") {
        settings.setValue(QStringLiteral("sync/apply_grace_ms"), 500);
        settings.setValue(QStringLiteral("sync/apply_max_hold_ms"), 500);
        expect_invalid();
    }

    SECTION("Identical source labels") {
        settings.setValue(QStringLiteral("sync/local_source"), QStringLiteral("host-b"));
        expect_invalid();
    }

    SECTION("Unknown path policy") {
        settings.setValue(QStringLiteral("sync/path_policy"), QStringLiteral("fuzzy"));
        expect_invalid();
    }
}

TEST_CASE("SyncConfig: role parsing", "[config]") {
    REQUIRE(parse_role(QStringLiteral("listen")).unwrap() == Role::Listen);
    REQUIRE(parse_role(QStringLiteral(" DIAL ")).unwrap() == Role::Dial);
    REQUIRE(parse_role(QStringLiteral("")).is_err());
    REQUIRE(to_string(Role::Dial) == QStringLiteral("dial"));
}
