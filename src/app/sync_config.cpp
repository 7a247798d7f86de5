#include "app/sync_config.hpp"
#include "network/tcp_transport.hpp"
#include <initializer_list>
#include <utility>

namespace caretsync::app {

namespace {

constexpr const char* kSettingsRole = "sync/role";
constexpr const char* kSettingsHost = "sync/host";
constexpr const char* kSettingsPort = "sync/port";
constexpr const char* kSettingsConnectTimeout = "sync/connect_timeout_ms";
constexpr const char* kSettingsReconnectBase = "sync/reconnect_base_ms";
constexpr const char* kSettingsReconnectMax = "sync/reconnect_max_ms";
constexpr const char* kSettingsReconnectMaxExponent = "sync/reconnect_max_exponent";
constexpr const char* kSettingsMaxReconnectAttempts = "sync/max_reconnect_attempts";
constexpr const char* kSettingsInboundThreshold = "sync/inbound_threshold_ms";
constexpr const char* kSettingsApplyGrace = "sync/apply_grace_ms";
constexpr const char* kSettingsApplyMaxHold = "sync/apply_max_hold_ms";
constexpr const char* kSettingsLocalSource = "sync/local_source";
constexpr const char* kSettingsPeerSource = "sync/peer_source";
constexpr const char* kSettingsPathPolicy = "sync/path_policy";

Error invalid(const QString& message) {
    return Error{ErrorKind::InvalidConfig, message.toStdString()};
}

// Reads an integer key, leaving `out` untouched when the key is absent.
Result<void, Error> read_int(QSettings& settings, const char* key, int& out) {
    const auto name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return Result<void, Error>::ok();
    }
    bool ok = false;
    const int value = settings.value(name).toInt(&ok);
    if (!ok) {
        return Result<void, Error>::err(
            invalid(QStringLiteral("%1 is not an integer: %2").arg(name, settings.value(name).toString())));
    }
    out = value;
    return Result<void, Error>::ok();
}

Result<uint16_t, Error> parse_port(const QString& text) {
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok || value < 1 || value > 65535) {
        return Result<uint16_t, Error>::err(invalid(QStringLiteral("invalid port: %1").arg(text)));
    }
    return Result<uint16_t, Error>::ok(static_cast<uint16_t>(value));
}

Result<sync::PathPolicy, Error> parse_path_policy(const QString& text) {
    const auto value = text.trimmed().toLower();
    if (value == QLatin1String("exact")) {
        return Result<sync::PathPolicy, Error>::ok(sync::PathPolicy::Exact);
    }
    if (value == QLatin1String("clean")) {
        return Result<sync::PathPolicy, Error>::ok(sync::PathPolicy::Clean);
    }
    return Result<sync::PathPolicy, Error>::err(invalid(QStringLiteral("unknown path policy: %1").arg(text)));
}

} // namespace

QString to_string(Role role) {
    return role == Role::Listen ? QStringLiteral("listen") : QStringLiteral("dial");
}

Result<Role, Error> parse_role(const QString& text) {
    const auto value = text.trimmed().toLower();
    if (value == QLatin1String("listen")) {
        return Result<Role, Error>::ok(Role::Listen);
    }
    if (value == QLatin1String("dial")) {
        return Result<Role, Error>::ok(Role::Dial);
    }
    return Result<Role, Error>::err(invalid(QStringLiteral("unknown role: %1").arg(text)));
}

Result<SyncConfig, Error> load_sync_config(QSettings& settings) {
    SyncConfig config;

    QString role_text = settings.value(QString::fromLatin1(kSettingsRole), to_string(config.role)).toString();
    if (qEnvironmentVariableIsSet("CARETSYNC_ROLE")) {
        role_text = qEnvironmentVariable("CARETSYNC_ROLE");
    }
    auto role = parse_role(role_text);
    if (role.is_err()) {
        return Result<SyncConfig, Error>::err(role.unwrap_err());
    }
    config.role = role.unwrap();

    config.host = settings.value(QString::fromLatin1(kSettingsHost), config.host).toString();
    if (qEnvironmentVariableIsSet("CARETSYNC_HOST")) {
        config.host = qEnvironmentVariable("CARETSYNC_HOST");
    }

    QString port_text = settings.value(QString::fromLatin1(kSettingsPort), static_cast<int>(config.port)).toString();
    if (qEnvironmentVariableIsSet("CARETSYNC_PORT")) {
        port_text = qEnvironmentVariable("CARETSYNC_PORT");
    }
    auto port = parse_port(port_text);
    if (port.is_err()) {
        return Result<SyncConfig, Error>::err(port.unwrap_err());
    }
    config.port = port.unwrap();

    int base_ms = static_cast<int>(config.engine.backoff.base_delay.count());
    int max_ms = static_cast<int>(config.engine.backoff.max_delay.count());
    int threshold_ms = static_cast<int>(config.engine.inbound_threshold.count());

    for (const auto& [key, target] : {
             std::pair<const char*, int*>{kSettingsConnectTimeout, &config.connect_timeout_ms},
             std::pair<const char*, int*>{kSettingsReconnectBase, &base_ms},
             std::pair<const char*, int*>{kSettingsReconnectMax, &max_ms},
             std::pair<const char*, int*>{kSettingsReconnectMaxExponent, &config.engine.backoff.max_exponent},
             std::pair<const char*, int*>{kSettingsMaxReconnectAttempts, &config.engine.backoff.max_attempts},
             std::pair<const char*, int*>{kSettingsInboundThreshold, &threshold_ms},
             std::pair<const char*, int*>{kSettingsApplyGrace, &config.engine.apply_grace_ms},
             std::pair<const char*, int*>{kSettingsApplyMaxHold, &config.engine.apply_max_hold_ms},
         }) {
        auto read = read_int(settings, key, *target);
        if (read.is_err()) {
            return Result<SyncConfig, Error>::err(read.unwrap_err());
        }
    }
    config.engine.backoff.base_delay = std::chrono::milliseconds(base_ms);
    config.engine.backoff.max_delay = std::chrono::milliseconds(max_ms);
    config.engine.inbound_threshold = std::chrono::milliseconds(threshold_ms);

    config.local_source = settings.value(QString::fromLatin1(kSettingsLocalSource)).toString();
    config.peer_source = settings.value(QString::fromLatin1(kSettingsPeerSource)).toString();

    if (settings.contains(QString::fromLatin1(kSettingsPathPolicy))) {
        auto policy = parse_path_policy(settings.value(QString::fromLatin1(kSettingsPathPolicy)).toString());
        if (policy.is_err()) {
            return Result<SyncConfig, Error>::err(policy.unwrap_err());
        }
        config.engine.path_policy = policy.unwrap();
    }

    return finalize_sync_config(std::move(config));
}

Result<SyncConfig, Error> finalize_sync_config(SyncConfig config) {
    if (config.port == 0) {
        return Result<SyncConfig, Error>::err(invalid(QStringLiteral("port must be 1-65535")));
    }
    if (config.role == Role::Dial && config.host.trimmed().isEmpty()) {
        return Result<SyncConfig, Error>::err(invalid(QStringLiteral("dial role needs a host")));
    }
    if (config.connect_timeout_ms <= 0) {
        return Result<SyncConfig, Error>::err(invalid(QStringLiteral("connect timeout must be positive")));
    }

    const auto& backoff = config.engine.backoff;
    if (backoff.base_delay.count() <= 0 || backoff.max_delay < backoff.base_delay) {
        return Result<SyncConfig, Error>::err(
            invalid(QStringLiteral("reconnect delays must satisfy 0 < base <= max")));
    }
    if (backoff.max_exponent < 0 || backoff.max_exponent > 30) {
        return Result<SyncConfig, Error>::err(invalid(QStringLiteral("reconnect exponent must be 0-30")));
    }
    if (backoff.max_attempts < 0) {
        return Result<SyncConfig, Error>::err(invalid(QStringLiteral("max reconnect attempts must be >= 0")));
    }
    if (config.engine.inbound_threshold.count() < 0 || config.engine.apply_grace_ms < 0) {
        return Result<SyncConfig, Error>::err(invalid(QStringLiteral("threshold and grace must be >= 0")));
    }
    if (config.engine.apply_max_hold_ms <= config.engine.apply_grace_ms) {
        return Result<SyncConfig, Error>::err(
            invalid(QStringLiteral("apply max hold must exceed the apply grace period")));
    }

    const auto host_a = QString::fromLatin1(kHostALabel);
    const auto host_b = QString::fromLatin1(kHostBLabel);
    if (config.local_source.isEmpty()) {
        config.local_source = config.role == Role::Listen ? host_a : host_b;
    }
    if (config.peer_source.isEmpty()) {
        config.peer_source = config.role == Role::Listen ? host_b : host_a;
    }
    if (config.local_source == config.peer_source) {
        return Result<SyncConfig, Error>::err(
            invalid(QStringLiteral("local and peer source labels must differ (%1)").arg(config.local_source)));
    }
    config.engine.labels = SourceLabels{config.local_source, config.peer_source};

    return Result<SyncConfig, Error>::ok(std::move(config));
}

std::unique_ptr<network::TransportBackend> make_transport(const SyncConfig& config) {
    if (config.role == Role::Listen) {
        return std::make_unique<network::TcpListenerTransport>(config.port);
    }
    return std::make_unique<network::TcpDialerTransport>(config.host, config.port,
                                                         config.connect_timeout_ms);
}

} // namespace caretsync::app
