#pragma once

#include "network/transport.hpp"
#include "network/transport_backend.hpp"
#include <QObject>
#include <memory>

namespace caretsync::network {

/**
 * TcpListenerTransport - Binds the rendezvous port on the loopback interface.
 *
 * The most recently accepted peer socket replaces any previous one. The port
 * stays bound across peer drops and is released only by close().
 */
class TcpListenerTransport : public QObject, public TransportBackend {
    Q_OBJECT

public:
    explicit TcpListenerTransport(uint16_t port, QObject* parent = nullptr);
    ~TcpListenerTransport() override;

    void open() override;
    void close() override;
    void dropPeer() override;
    [[nodiscard]] bool acceptsInbound() const override;
    Result<void, Error> send(const QByteArray& payload) override;
    [[nodiscard]] QString describe() const override;

    [[nodiscard]] bool isListening() const;

    // Bound port (useful when constructed with port 0).
    [[nodiscard]] uint16_t listeningPort() const;

private slots:
    void onNewConnection(QTcpSocket* socket);

private:
    uint16_t port_;
    std::unique_ptr<TransportServer> server_;
    std::unique_ptr<Connection> connection_;

    void releaseConnection(bool graceful);
};

/**
 * TcpDialerTransport - Dials the peer's rendezvous port.
 */
class TcpDialerTransport : public QObject, public TransportBackend {
    Q_OBJECT

public:
    TcpDialerTransport(QString host, uint16_t port, int connect_timeout_ms,
                       QObject* parent = nullptr);
    ~TcpDialerTransport() override;

    void open() override;
    void close() override;
    void dropPeer() override;
    Result<void, Error> send(const QByteArray& payload) override;
    [[nodiscard]] QString describe() const override;

private:
    QString host_;
    uint16_t port_;
    int connect_timeout_ms_;
    std::unique_ptr<Connection> connection_;

    void releaseConnection(bool graceful);
};

} // namespace caretsync::network
