#include "network/connection_lifecycle.hpp"
#include "core/logging.hpp"
#include <QDebug>

namespace caretsync::network {

QString to_string(const ConnectionState& state) {
    switch (state.kind) {
        case ConnectionState::Kind::Idle: return QStringLiteral("Idle");
        case ConnectionState::Kind::Connecting:
            return QStringLiteral("Connecting(%1)").arg(state.attempt);
        case ConnectionState::Kind::Open: return QStringLiteral("Open");
        case ConnectionState::Kind::Closed: return QStringLiteral("Closed");
    }
    return QStringLiteral("?");
}

ConnectionLifecycle::ConnectionLifecycle(std::unique_ptr<TransportBackend> backend,
                                         BackoffPolicy policy,
                                         QObject* parent)
    : QObject(parent)
    , backend_(std::move(backend))
    , policy_(policy)
    , reconnect_timer_(std::make_unique<QTimer>(this))
{
    reconnect_timer_->setSingleShot(true);
    connect(reconnect_timer_.get(), &QTimer::timeout,
            this, &ConnectionLifecycle::onReconnectTimer);

    backend_->on_opened = [this]() { handleOpened(); };
    backend_->on_failed = [this](const Error& error) { handleFailed(error); };
    backend_->on_closed = [this](const Error& error) { handleClosed(error); };
    backend_->on_message = [this](const QByteArray& payload) {
        if (isOpen()) {
            emit messageReceived(payload);
        }
    };
}

ConnectionLifecycle::~ConnectionLifecycle() {
    manual_disconnect_ = true;
    reconnect_timer_->stop();
    backend_->on_opened = nullptr;
    backend_->on_failed = nullptr;
    backend_->on_closed = nullptr;
    backend_->on_message = nullptr;
    backend_->close();
}

void ConnectionLifecycle::requestConnect() {
    if (state_.kind == ConnectionState::Kind::Connecting ||
        state_.kind == ConnectionState::Kind::Open) {
        qInfo() << "LINK: connect ignored, already" << to_string(state_);
        return;
    }

    reconnect_timer_->stop();
    manual_disconnect_ = false;
    attempt_ = 0;
    qInfo() << "LINK: connect" << backend_->describe();
    setState(ConnectionState::connecting(0));
    backend_->open();
}

void ConnectionLifecycle::requestDisconnect() {
    reconnect_timer_->stop();
    if (state_.kind == ConnectionState::Kind::Idle) {
        qInfo() << "LINK: disconnect ignored, already Idle";
        return;
    }

    // Set before closing so the teardown is never taken for a drop.
    manual_disconnect_ = true;
    backend_->close();
    attempt_ = 0;
    qInfo() << "LINK: disconnected by request";
    setState(ConnectionState::idle());
}

Result<void, Error> ConnectionLifecycle::send(const QByteArray& payload) {
    if (!isOpen()) {
        return Result<void, Error>::err(Error{ErrorKind::NotConnected, "Link is not open"});
    }

    auto sent = backend_->send(payload);
    if (sent.is_err()) {
        const auto error = Error{ErrorKind::TransportError, sent.unwrap_err().message};
        qWarning() << "LINK: send failed:" << error.message.c_str();
        backend_->dropPeer();
        handleClosed(error);
        return Result<void, Error>::err(error);
    }
    return Result<void, Error>::ok();
}

void ConnectionLifecycle::setState(ConnectionState state) {
    if (state_ == state) {
        return;
    }
    if (sync_debug_enabled()) {
        qInfo() << "LINK: state" << to_string(state_) << "->" << to_string(state);
    }
    state_ = state;
    emit stateChanged(state_);
}

void ConnectionLifecycle::handleOpened() {
    if (manual_disconnect_) {
        return;
    }
    if (state_.kind == ConnectionState::Kind::Open) {
        // Listener adopted a newer peer socket; the link stays open.
        qInfo() << "LINK: peer connection replaced";
        return;
    }

    reconnect_timer_->stop();
    attempt_ = 0;
    qInfo() << "LINK: open" << backend_->describe();
    setState(ConnectionState::open());
}

void ConnectionLifecycle::handleFailed(const Error& error) {
    if (manual_disconnect_) {
        return;
    }

    qWarning() << "LINK:" << to_string(state_) << "failed:" << error.message.c_str();
    setState(ConnectionState::closed());

    if (error.kind == ErrorKind::BindFailure) {
        // Local resource problem, not a transient peer loss.
        emit fatalError(error);
        return;
    }
    scheduleReconnect();
}

void ConnectionLifecycle::handleClosed(const Error& error) {
    if (manual_disconnect_ || state_.kind == ConnectionState::Kind::Closed) {
        return;
    }

    qInfo() << "LINK: closed unexpectedly:" << error.message.c_str();
    setState(ConnectionState::closed());

    if (backend_->acceptsInbound()) {
        // Port still bound: the next peer arrives on its own, no backoff cycle.
        attempt_ = 0;
        setState(ConnectionState::connecting(0));
        return;
    }
    scheduleReconnect();
}

void ConnectionLifecycle::scheduleReconnect() {
    if (policy_.exhausted(attempt_)) {
        const auto message = QStringLiteral("Giving up after %1 reconnect attempts").arg(attempt_);
        qWarning() << "LINK:" << message;
        emit fatalError(Error{ErrorKind::TransportError, message.toStdString()});
        return;
    }

    const auto delay = policy_.delay(attempt_);
    const int delay_ms = static_cast<int>(delay.count());
    qInfo() << "LINK: reconnect attempt" << attempt_ + 1 << "in" << delay_ms << "ms";
    emit reconnectScheduled(attempt_ + 1, delay_ms);
    reconnect_timer_->start(delay_ms);
}

void ConnectionLifecycle::onReconnectTimer() {
    if (manual_disconnect_ || state_.kind != ConnectionState::Kind::Closed) {
        return;
    }

    ++attempt_;
    setState(ConnectionState::connecting(attempt_));
    backend_->open();
}

} // namespace caretsync::network
