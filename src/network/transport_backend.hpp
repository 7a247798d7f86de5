#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QString>
#include <functional>

namespace caretsync::network {

/**
 * TransportBackend - Abstract peer link driven by ConnectionLifecycle.
 *
 * Implementations:
 * - TcpListenerTransport: binds the rendezvous port and adopts the peer that dials it
 * - TcpDialerTransport: dials the rendezvous port, one attempt per open()
 *
 * Callbacks are invoked on the thread running the Qt event loop. close() and
 * dropPeer() are local teardowns and must not invoke on_closed or on_failed.
 */
class TransportBackend {
public:
    virtual ~TransportBackend() = default;

    // Begin one connection cycle; the outcome arrives via on_opened or on_failed.
    virtual void open() = 0;
    virtual void close() = 0;

    // Release the current peer link only. A listener keeps its port bound.
    virtual void dropPeer() = 0;

    // True while new peers can arrive without another open() call.
    [[nodiscard]] virtual bool acceptsInbound() const { return false; }

    virtual Result<void, Error> send(const QByteArray& payload) = 0;

    // Human-readable endpoint for logs, e.g. "listen localhost:3000".
    [[nodiscard]] virtual QString describe() const = 0;

    // Callbacks
    std::function<void()> on_opened;
    std::function<void(Error)> on_failed;
    std::function<void(Error)> on_closed;
    std::function<void(QByteArray)> on_message;
};

} // namespace caretsync::network
