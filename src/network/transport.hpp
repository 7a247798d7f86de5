#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QHostAddress>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <cstdint>
#include <memory>
#include <vector>

namespace caretsync::network {

/**
 * Message types carried in a frame.
 */
enum class MessageType : uint8_t {
    CursorUpdate = 0x01,
    Disconnect = 0x3F
};

/**
 * Frame header.
 *
 * Format:
 * - Magic (2 bytes): 0x43 0x53 ("CS")
 * - Version (1 byte)
 * - Type (1 byte)
 * - Length (4 bytes, big-endian)
 * - Payload (variable)
 */
struct MessageHeader {
    static constexpr uint8_t MAGIC[2] = {0x43, 0x53};  // "CS"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr uint32_t MAX_PAYLOAD = 64 * 1024;

    MessageType type;
    uint32_t length;
};

/**
 * Connection - One framed TCP connection to the peer.
 */
class Connection : public QObject {
    Q_OBJECT

public:
    enum class State {
        Disconnected,
        Connecting,
        Connected,
        Failed
    };

    explicit Connection(QObject* parent = nullptr);
    ~Connection() override;

    /**
     * Dial the peer. Fails (state Failed, error emitted) if the socket is
     * not connected within `timeout_ms`.
     */
    void connectToPeer(const QString& host, uint16_t port, int timeout_ms);

    /**
     * Adopt a socket accepted by a TransportServer.
     */
    void acceptConnection(QTcpSocket* socket);

    /**
     * Close gracefully: best-effort Disconnect frame, then close.
     * Does not emit disconnected().
     */
    void disconnect();

    Result<void, Error> send(MessageType type, const QByteArray& payload);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == State::Connected; }
    [[nodiscard]] QString peerDescription() const;

signals:
    void connected();
    void disconnected();
    void messageReceived(caretsync::network::MessageType type, const QByteArray& payload);
    void error(const QString& message);
    void stateChanged(caretsync::network::Connection::State state);

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();
    void onConnectTimeout();

private:
    State state_ = State::Disconnected;
    std::unique_ptr<QTcpSocket> socket_;
    std::unique_ptr<QTimer> connect_timer_;
    QByteArray read_buffer_;

    void setState(State state);
    void wireSocket();
    void dropWithError(const QString& message);
    Result<void, Error> sendRaw(MessageType type, const QByteArray& data);
};

/**
 * TransportServer - Listens for incoming peer connections.
 */
class TransportServer : public QObject {
    Q_OBJECT

public:
    explicit TransportServer(QObject* parent = nullptr);
    ~TransportServer() override;

    /**
     * Start listening.
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port, or a BindFailure error
     */
    Result<uint16_t, Error> listen(const QHostAddress& address, uint16_t port);

    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;

signals:
    void newConnection(QTcpSocket* socket);

private slots:
    void onNewConnection();

private:
    std::unique_ptr<QTcpServer> server_;
};

std::vector<uint8_t> serializeHeader(const MessageHeader& header);

/**
 * Validates magic, version, type and payload size.
 */
Result<MessageHeader, Error> deserializeHeader(const std::vector<uint8_t>& data);

} // namespace caretsync::network
