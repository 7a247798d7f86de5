#include "network/tcp_transport.hpp"
#include "core/logging.hpp"
#include <QDebug>

namespace caretsync::network {

namespace {

Error closed_error(const QString& endpoint) {
    return Error{ErrorKind::TransportError,
                 QStringLiteral("Connection to %1 closed").arg(endpoint).toStdString()};
}

} // namespace

// ============================================================================
// TcpListenerTransport
// ============================================================================

TcpListenerTransport::TcpListenerTransport(uint16_t port, QObject* parent)
    : QObject(parent)
    , port_(port)
    , server_(std::make_unique<TransportServer>(this))
{
    connect(server_.get(), &TransportServer::newConnection,
            this, &TcpListenerTransport::onNewConnection);
}

TcpListenerTransport::~TcpListenerTransport() {
    close();
}

void TcpListenerTransport::open() {
    if (server_->isListening()) {
        if (sync_debug_enabled()) {
            qInfo() << "LINK: listener waiting for peer on port" << server_->port();
        }
        return;
    }

    auto listen_result = server_->listen(QHostAddress::LocalHost, port_);
    if (listen_result.is_err()) {
        qWarning() << "LINK: cannot listen on port" << port_ << ":"
                   << listen_result.unwrap_err().message.c_str();
        if (on_failed) on_failed(listen_result.unwrap_err());
        return;
    }
    qInfo() << "LINK: listening on localhost port" << listen_result.unwrap();
}

void TcpListenerTransport::close() {
    releaseConnection(true);
    if (server_->isListening()) {
        server_->close();
        qInfo() << "LINK: listener closed";
    }
}

void TcpListenerTransport::dropPeer() {
    if (connection_) {
        qInfo() << "LINK: dropping peer" << connection_->peerDescription();
    }
    releaseConnection(true);
}

bool TcpListenerTransport::acceptsInbound() const {
    return server_->isListening();
}

bool TcpListenerTransport::isListening() const {
    return server_->isListening();
}

Result<void, Error> TcpListenerTransport::send(const QByteArray& payload) {
    if (!connection_ || !connection_->isConnected()) {
        return Result<void, Error>::err(Error{ErrorKind::NotConnected, "No peer connected"});
    }
    return connection_->send(MessageType::CursorUpdate, payload);
}

QString TcpListenerTransport::describe() const {
    return QStringLiteral("listen localhost:%1").arg(server_->isListening() ? server_->port() : port_);
}

uint16_t TcpListenerTransport::listeningPort() const {
    return server_->port();
}

void TcpListenerTransport::onNewConnection(QTcpSocket* socket) {
    if (connection_) {
        qInfo() << "LINK: new peer replaces" << connection_->peerDescription();
        releaseConnection(true);
    }

    connection_ = std::make_unique<Connection>(this);
    auto* conn = connection_.get();

    connect(conn, &Connection::disconnected, this, [this, conn]() {
        if (connection_.get() != conn) return;
        const auto endpoint = conn->peerDescription();
        releaseConnection(false);
        if (on_closed) on_closed(closed_error(endpoint));
    });
    connect(conn, &Connection::error, this, [conn](const QString& message) {
        qWarning() << "LINK:" << conn->peerDescription() << message;
    });
    connect(conn, &Connection::messageReceived, this,
            [this](MessageType type, const QByteArray& payload) {
                if (type == MessageType::CursorUpdate && on_message) {
                    on_message(payload);
                }
            });

    conn->acceptConnection(socket);
    qInfo() << "LINK: peer connected from" << conn->peerDescription();
    if (on_opened) on_opened();
}

void TcpListenerTransport::releaseConnection(bool graceful) {
    if (!connection_) return;

    // Detach first: a released connection never reports back.
    QObject::disconnect(connection_.get(), nullptr, this, nullptr);
    if (graceful) {
        connection_->disconnect();
    }
    // May be running inside one of its signals.
    connection_.release()->deleteLater();
}

// ============================================================================
// TcpDialerTransport
// ============================================================================

TcpDialerTransport::TcpDialerTransport(QString host, uint16_t port, int connect_timeout_ms,
                                       QObject* parent)
    : QObject(parent)
    , host_(std::move(host))
    , port_(port)
    , connect_timeout_ms_(connect_timeout_ms)
{
}

TcpDialerTransport::~TcpDialerTransport() {
    close();
}

void TcpDialerTransport::open() {
    releaseConnection(false);

    connection_ = std::make_unique<Connection>(this);
    auto* conn = connection_.get();

    connect(conn, &Connection::connected, this, [this, conn]() {
        if (connection_.get() != conn) return;
        qInfo() << "LINK: connected to" << host_ << port_;
        if (on_opened) on_opened();
    });
    connect(conn, &Connection::disconnected, this, [this, conn]() {
        if (connection_.get() != conn) return;
        releaseConnection(false);
        if (on_closed) on_closed(closed_error(describe()));
    });
    connect(conn, &Connection::error, this, [this, conn](const QString& message) {
        if (connection_.get() != conn) return;
        qWarning() << "LINK:" << describe() << message;
        if (conn->state() == Connection::State::Failed) {
            releaseConnection(false);
            if (on_failed) on_failed(Error{ErrorKind::TransportError, message.toStdString()});
        }
    });
    connect(conn, &Connection::messageReceived, this,
            [this](MessageType type, const QByteArray& payload) {
                if (type == MessageType::CursorUpdate && on_message) {
                    on_message(payload);
                }
            });

    if (sync_debug_enabled()) {
        qInfo() << "LINK: dialing" << host_ << port_ << "timeout_ms=" << connect_timeout_ms_;
    }
    conn->connectToPeer(host_, port_, connect_timeout_ms_);
}

void TcpDialerTransport::close() {
    releaseConnection(true);
}

void TcpDialerTransport::dropPeer() {
    releaseConnection(true);
}

Result<void, Error> TcpDialerTransport::send(const QByteArray& payload) {
    if (!connection_ || !connection_->isConnected()) {
        return Result<void, Error>::err(Error{ErrorKind::NotConnected, "Not connected to peer"});
    }
    return connection_->send(MessageType::CursorUpdate, payload);
}

QString TcpDialerTransport::describe() const {
    return QStringLiteral("dial %1:%2").arg(host_).arg(port_);
}

void TcpDialerTransport::releaseConnection(bool graceful) {
    if (!connection_) return;

    QObject::disconnect(connection_.get(), nullptr, this, nullptr);
    if (graceful) {
        connection_->disconnect();
    }
    connection_.release()->deleteLater();
}

} // namespace caretsync::network
