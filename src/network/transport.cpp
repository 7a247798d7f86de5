#include "network/transport.hpp"
#include "core/logging.hpp"
#include <QDebug>

namespace caretsync::network {

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(QObject* parent)
    : QObject(parent)
    , connect_timer_(std::make_unique<QTimer>(this))
{
    connect_timer_->setSingleShot(true);
    connect(connect_timer_.get(), &QTimer::timeout,
            this, &Connection::onConnectTimeout);
}

Connection::~Connection() {
    disconnect();
}

void Connection::connectToPeer(const QString& host, uint16_t port, int timeout_ms) {
    socket_ = std::make_unique<QTcpSocket>(this);
    wireSocket();
    connect(socket_.get(), &QTcpSocket::connected,
            this, &Connection::onSocketConnected);

    setState(State::Connecting);
    if (timeout_ms > 0) {
        connect_timer_->start(timeout_ms);
    }
    socket_->connectToHost(host, port);
}

void Connection::acceptConnection(QTcpSocket* socket) {
    // Take ownership of socket
    socket->setParent(this);
    socket_.reset(socket);
    wireSocket();

    setState(State::Connected);
}

void Connection::disconnect() {
    connect_timer_->stop();
    if (!socket_ || state_ == State::Disconnected) {
        return;
    }

    const auto previous = state_;
    // Set first so the socket's disconnected signal is not reported as a drop.
    setState(State::Disconnected);

    if (previous == State::Connected) {
        auto bye = sendRaw(MessageType::Disconnect, {});
        if (bye.is_err() && sync_debug_enabled()) {
            qInfo() << "LINK: Disconnect frame not sent:" << bye.unwrap_err().message.c_str();
        }
        socket_->disconnectFromHost();
    } else {
        socket_->abort();
    }
}

Result<void, Error> Connection::send(MessageType type, const QByteArray& payload) {
    if (state_ != State::Connected) {
        return Result<void, Error>::err(Error{ErrorKind::NotConnected, "Not connected"});
    }
    if (payload.size() > static_cast<qsizetype>(MessageHeader::MAX_PAYLOAD)) {
        return Result<void, Error>::err(Error{ErrorKind::TransportError, "Payload too large"});
    }
    return sendRaw(type, payload);
}

QString Connection::peerDescription() const {
    if (!socket_) {
        return QStringLiteral("<none>");
    }
    return QStringLiteral("%1:%2").arg(socket_->peerAddress().toString()).arg(socket_->peerPort());
}

void Connection::setState(State state) {
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

void Connection::wireSocket() {
    connect(socket_.get(), &QTcpSocket::disconnected,
            this, &Connection::onSocketDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred,
            this, &Connection::onSocketError);
    connect(socket_.get(), &QTcpSocket::readyRead,
            this, &Connection::onReadyRead);
}

void Connection::dropWithError(const QString& message) {
    emit error(message);
    if (state_ == State::Connected) {
        setState(State::Disconnected);
        socket_->abort();
        emit disconnected();
    }
}

void Connection::onSocketConnected() {
    connect_timer_->stop();
    if (state_ != State::Connecting) {
        return;
    }
    setState(State::Connected);
    emit connected();
}

void Connection::onSocketDisconnected() {
    // Only a drop of an established link is reported; local closes and
    // failed dials are not.
    if (state_ != State::Connected) {
        return;
    }
    setState(State::Disconnected);
    emit disconnected();
}

void Connection::onSocketError(QAbstractSocket::SocketError err) {
    Q_UNUSED(err)
    if (state_ == State::Connecting) {
        connect_timer_->stop();
        setState(State::Failed);
        emit error(socket_->errorString());
        return;
    }
    if (state_ == State::Connected) {
        // The disconnected signal follows for errors that end the link.
        emit error(socket_->errorString());
    }
}

void Connection::onConnectTimeout() {
    if (state_ != State::Connecting) {
        return;
    }
    setState(State::Failed);
    socket_->abort();
    emit error(QStringLiteral("Connect timed out"));
}

void Connection::onReadyRead() {
    read_buffer_.append(socket_->readAll());

    while (state_ == State::Connected &&
           read_buffer_.size() >= static_cast<qsizetype>(MessageHeader::HEADER_SIZE)) {
        std::vector<uint8_t> header_data(
            read_buffer_.begin(),
            read_buffer_.begin() + MessageHeader::HEADER_SIZE
        );

        auto header_result = deserializeHeader(header_data);
        if (header_result.is_err()) {
            dropWithError(QString::fromStdString(header_result.unwrap_err().message));
            return;
        }

        const auto header = header_result.unwrap();
        const auto total_size = static_cast<qsizetype>(MessageHeader::HEADER_SIZE + header.length);

        if (read_buffer_.size() < total_size) {
            // Need more data
            return;
        }

        const QByteArray payload = read_buffer_.mid(
            static_cast<qsizetype>(MessageHeader::HEADER_SIZE),
            static_cast<qsizetype>(header.length));
        read_buffer_.remove(0, total_size);

        if (header.type == MessageType::Disconnect) {
            if (sync_debug_enabled()) {
                qInfo() << "LINK: peer announced disconnect" << peerDescription();
            }
            continue;
        }

        emit messageReceived(header.type, payload);
    }
}

Result<void, Error> Connection::sendRaw(MessageType type, const QByteArray& data) {
    MessageHeader header;
    header.type = type;
    header.length = static_cast<uint32_t>(data.size());

    const auto header_bytes = serializeHeader(header);

    QByteArray frame;
    frame.reserve(static_cast<qsizetype>(header_bytes.size()) + data.size());
    frame.append(reinterpret_cast<const char*>(header_bytes.data()),
                 static_cast<qsizetype>(header_bytes.size()));
    frame.append(data);

    if (socket_->write(frame) != frame.size()) {
        return Result<void, Error>::err(
            Error{ErrorKind::TransportError, socket_->errorString().toStdString()});
    }
    socket_->flush();

    return Result<void, Error>::ok();
}

// ============================================================================
// TransportServer
// ============================================================================

TransportServer::TransportServer(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>(this))
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &TransportServer::onNewConnection);
}

TransportServer::~TransportServer() {
    close();
}

Result<uint16_t, Error> TransportServer::listen(const QHostAddress& address, uint16_t port) {
    if (!server_->listen(address, port)) {
        return Result<uint16_t, Error>::err(
            Error{ErrorKind::BindFailure, server_->errorString().toStdString()});
    }

    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void TransportServer::close() {
    server_->close();
}

uint16_t TransportServer::port() const {
    return server_->serverPort();
}

bool TransportServer::isListening() const {
    return server_->isListening();
}

void TransportServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        emit newConnection(socket);
    }
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<uint8_t> serializeHeader(const MessageHeader& header) {
    std::vector<uint8_t> data(MessageHeader::HEADER_SIZE);

    data[0] = MessageHeader::MAGIC[0];
    data[1] = MessageHeader::MAGIC[1];
    data[2] = MessageHeader::VERSION;
    data[3] = static_cast<uint8_t>(header.type);
    data[4] = (header.length >> 24) & 0xFF;
    data[5] = (header.length >> 16) & 0xFF;
    data[6] = (header.length >> 8) & 0xFF;
    data[7] = header.length & 0xFF;

    return data;
}

Result<MessageHeader, Error> deserializeHeader(const std::vector<uint8_t>& data) {
    if (data.size() < MessageHeader::HEADER_SIZE) {
        return Result<MessageHeader, Error>::err(Error{ErrorKind::TransportError, "Header too short"});
    }

    if (data[0] != MessageHeader::MAGIC[0] || data[1] != MessageHeader::MAGIC[1]) {
        return Result<MessageHeader, Error>::err(Error{ErrorKind::TransportError, "Invalid magic"});
    }

    if (data[2] != MessageHeader::VERSION) {
        return Result<MessageHeader, Error>::err(Error{ErrorKind::TransportError, "Unsupported version"});
    }

    const auto type = static_cast<MessageType>(data[3]);
    if (type != MessageType::CursorUpdate && type != MessageType::Disconnect) {
        return Result<MessageHeader, Error>::err(Error{ErrorKind::TransportError, "Unknown message type"});
    }

    MessageHeader header;
    header.type = type;
    header.length = (static_cast<uint32_t>(data[4]) << 24) |
                    (static_cast<uint32_t>(data[5]) << 16) |
                    (static_cast<uint32_t>(data[6]) << 8) |
                    static_cast<uint32_t>(data[7]);

    if (header.length > MessageHeader::MAX_PAYLOAD) {
        return Result<MessageHeader, Error>::err(Error{ErrorKind::TransportError, "Payload too large"});
    }

    return Result<MessageHeader, Error>::ok(header);
}

} // namespace caretsync::network
