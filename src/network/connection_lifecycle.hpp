#pragma once

#include "core/backoff.hpp"
#include "core/result.hpp"
#include "network/transport_backend.hpp"
#include <QByteArray>
#include <QObject>
#include <QTimer>
#include <memory>

namespace caretsync::network {

/**
 * ConnectionState - Lifecycle state of the single peer link.
 */
struct ConnectionState {
    enum class Kind {
        Idle,
        Connecting,
        Open,
        Closed
    };

    Kind kind = Kind::Idle;
    int attempt = 0;  // meaningful for Connecting

    [[nodiscard]] static ConnectionState idle() { return {Kind::Idle, 0}; }
    [[nodiscard]] static ConnectionState connecting(int attempt) { return {Kind::Connecting, attempt}; }
    [[nodiscard]] static ConnectionState open() { return {Kind::Open, 0}; }
    [[nodiscard]] static ConnectionState closed() { return {Kind::Closed, 0}; }

    bool operator==(const ConnectionState&) const = default;
};

[[nodiscard]] QString to_string(const ConnectionState& state);

/**
 * ConnectionLifecycle - Owns the peer link and its state machine.
 *
 *   Idle -> Connecting(0)            requestConnect()
 *   Connecting(n) -> Open            backend opened; attempt counter reset
 *   Connecting(n) -> Closed          backend failed; reconnect scheduled
 *   Open -> Closed                   link dropped; reconnect scheduled
 *   Closed -> Connecting(0)          link dropped while the backend still
 *                                    accepts inbound peers; no timer
 *   Closed -> Connecting(n+1)        backoff timer fired
 *   any -> Idle                      requestDisconnect(); timer cancelled
 *
 * A BindFailure leaves the lifecycle Closed without scheduling a reconnect, as
 * does exhausting BackoffPolicy::max_attempts; both are reported through
 * fatalError().
 */
class ConnectionLifecycle : public QObject {
    Q_OBJECT

public:
    ConnectionLifecycle(std::unique_ptr<TransportBackend> backend,
                        BackoffPolicy policy,
                        QObject* parent = nullptr);
    ~ConnectionLifecycle() override;

    void requestConnect();
    void requestDisconnect();

    /**
     * Send one message on the open link. A transport failure drops the peer
     * and is treated as an unexpected close.
     */
    Result<void, Error> send(const QByteArray& payload);

    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] bool isOpen() const { return state_.kind == ConnectionState::Kind::Open; }
    [[nodiscard]] bool reconnectPending() const { return reconnect_timer_->isActive(); }
    [[nodiscard]] const BackoffPolicy& policy() const { return policy_; }
    [[nodiscard]] TransportBackend& backend() { return *backend_; }

signals:
    void stateChanged(const caretsync::network::ConnectionState& state);
    void messageReceived(const QByteArray& payload);
    void reconnectScheduled(int attempt, int delay_ms);
    void fatalError(const caretsync::Error& error);

private slots:
    void onReconnectTimer();

private:
    std::unique_ptr<TransportBackend> backend_;
    BackoffPolicy policy_;
    std::unique_ptr<QTimer> reconnect_timer_;
    ConnectionState state_ = ConnectionState::idle();
    int attempt_ = 0;
    bool manual_disconnect_ = true;

    void setState(ConnectionState state);
    void handleOpened();
    void handleFailed(const Error& error);
    void handleClosed(const Error& error);
    void scheduleReconnect();
};

} // namespace caretsync::network
