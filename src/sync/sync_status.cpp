#include "sync/sync_status.hpp"

namespace caretsync::sync {

SyncStatus status_from_state(const network::ConnectionState& state) {
    using Kind = network::ConnectionState::Kind;
    switch (state.kind) {
        case Kind::Connecting: return {SyncStatus::Kind::Connecting, state.attempt, QString{}};
        case Kind::Open: return {SyncStatus::Kind::Connected, 0, QString{}};
        case Kind::Idle:
        case Kind::Closed:
            break;
    }
    return {SyncStatus::Kind::Disconnected, 0, QString{}};
}

QString to_string(const SyncStatus& status) {
    switch (status.kind) {
        case SyncStatus::Kind::Disconnected: return QStringLiteral("Disconnected");
        case SyncStatus::Kind::Connecting:
            return QStringLiteral("Connecting(%1)").arg(status.attempt);
        case SyncStatus::Kind::Connected: return QStringLiteral("Connected");
        case SyncStatus::Kind::Failed: return QStringLiteral("Failed: %1").arg(status.message);
    }
    return QStringLiteral("?");
}

} // namespace caretsync::sync
