#pragma once

#include "core/backoff.hpp"
#include "core/cursor_position.hpp"
#include "core/result.hpp"
#include "core/suppression_policy.hpp"
#include "network/connection_lifecycle.hpp"
#include "network/transport_backend.hpp"
#include "sync/host_adapter.hpp"
#include "sync/path_policy.hpp"
#include "sync/remote_apply_guard.hpp"
#include "sync/sync_status.hpp"
#include <QByteArray>
#include <QObject>
#include <chrono>
#include <memory>

namespace caretsync::sync {

struct EngineOptions {
    SourceLabels labels{QString::fromLatin1(kHostALabel), QString::fromLatin1(kHostBLabel)};
    std::chrono::milliseconds inbound_threshold = kDefaultInboundThreshold;
    int apply_grace_ms = 100;
    int apply_max_hold_ms = 2000;
    PathPolicy path_policy = PathPolicy::Exact;
    BackoffPolicy backoff;
};

enum class LocalUpdateResult {
    Sent,
    Suppressed,
    NoConnection,
    SendFailed
};

enum class RemoteUpdateResult {
    Applied,
    Malformed,
    Dropped,
    HostFailed
};

/**
 * SyncEngine - Keeps the local caret and the peer's caret in step.
 *
 * Responsibilities:
 * - Local caret moves: outbound suppression, then send on the open link
 * - Peer messages: parse, inbound suppression, then open + move on the host
 * - Connection control and status reporting for the host UI
 *
 * The engine installs itself as the host's caret/focus callback target for
 * its lifetime. All entry points must be called on the event loop thread.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    SyncEngine(HostAdapter& host,
               std::unique_ptr<network::TransportBackend> transport,
               EngineOptions options,
               QObject* parent = nullptr);
    ~SyncEngine() override;

    LocalUpdateResult onLocalPositionChanged(const CursorPosition& position);
    RemoteUpdateResult onRemoteMessage(const QByteArray& raw_message);

    void connect();
    void disconnect();

    /**
     * Manual recovery: disconnect, then start a fresh Connecting(0) cycle.
     */
    void restart();

    [[nodiscard]] const SyncStatus& status() const { return status_; }
    [[nodiscard]] const SuppressionWindow& window() const { return window_; }
    [[nodiscard]] bool applyingRemote() const { return guard_.isHeld(); }
    [[nodiscard]] const EngineOptions& options() const { return options_; }
    [[nodiscard]] network::ConnectionLifecycle& lifecycle() { return *lifecycle_; }

signals:
    void statusChanged(const caretsync::sync::SyncStatus& status);
    void positionSent(const caretsync::CursorPosition& position);
    void remotePositionApplied(const caretsync::CursorPosition& position);
    void focusChanged(bool focused);
    void error(const caretsync::Error& error);

private:
    HostAdapter& host_;
    EngineOptions options_;
    std::unique_ptr<network::ConnectionLifecycle> lifecycle_;
    SuppressionWindow window_;
    RemoteApplyGuard guard_;
    SyncStatus status_;

    void setStatus(SyncStatus status);
    Result<void, Error> applyToHost(const CursorPosition& position);
};

} // namespace caretsync::sync
