#pragma once

#include "network/connection_lifecycle.hpp"
#include <QString>

namespace caretsync::sync {

/**
 * SyncStatus - What the host shows the user about the peer link.
 */
struct SyncStatus {
    enum class Kind {
        Disconnected,
        Connecting,
        Connected,
        Failed
    };

    Kind kind = Kind::Disconnected;
    int attempt = 0;   // Connecting only
    QString message;   // Failed only

    bool operator==(const SyncStatus&) const = default;
};

// Closed (waiting to reconnect) reports Disconnected.
[[nodiscard]] SyncStatus status_from_state(const network::ConnectionState& state);

[[nodiscard]] QString to_string(const SyncStatus& status);

} // namespace caretsync::sync
