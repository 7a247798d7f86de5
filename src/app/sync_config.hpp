#pragma once

#include "core/result.hpp"
#include "network/transport_backend.hpp"
#include "sync/sync_engine.hpp"
#include <QSettings>
#include <QString>
#include <memory>

namespace caretsync::app {

enum class Role {
    Listen,  // binds the rendezvous port
    Dial     // connects to it, reconnecting with backoff
};

/**
 * SyncConfig - Everything needed to build one side of the link.
 */
struct SyncConfig {
    static constexpr uint16_t DEFAULT_PORT = 3000;

    Role role = Role::Listen;
    QString host = QStringLiteral("localhost");
    uint16_t port = DEFAULT_PORT;
    int connect_timeout_ms = 5000;
    bool auto_connect = true;
    // Empty means derived from the role.
    QString local_source;
    QString peer_source;
    sync::EngineOptions engine;
};

[[nodiscard]] QString to_string(Role role);
[[nodiscard]] Result<Role, Error> parse_role(const QString& text);

/**
 * Read the `sync/` group, apply CARETSYNC_* environment overrides and
 * validate. Unset keys keep their defaults.
 */
[[nodiscard]] Result<SyncConfig, Error> load_sync_config(QSettings& settings);

/**
 * Check ranges and fill role-derived source labels.
 */
[[nodiscard]] Result<SyncConfig, Error> finalize_sync_config(SyncConfig config);

/**
 * Build the TCP backend matching the configured role.
 */
[[nodiscard]] std::unique_ptr<network::TransportBackend> make_transport(const SyncConfig& config);

} // namespace caretsync::app
