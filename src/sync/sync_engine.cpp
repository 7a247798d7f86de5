#include "sync/sync_engine.hpp"
#include "core/logging.hpp"
#include <QDebug>
#include <exception>

namespace caretsync::sync {

SyncEngine::SyncEngine(HostAdapter& host,
                       std::unique_ptr<network::TransportBackend> transport,
                       EngineOptions options,
                       QObject* parent)
    : QObject(parent)
    , host_(host)
    , options_(std::move(options))
    , lifecycle_(std::make_unique<network::ConnectionLifecycle>(
          std::move(transport), options_.backoff, this))
    , guard_(options_.apply_grace_ms, options_.apply_max_hold_ms)
{
    QObject::connect(lifecycle_.get(), &network::ConnectionLifecycle::stateChanged,
                     this, [this](const network::ConnectionState& state) {
                         setStatus(status_from_state(state));
                     });
    QObject::connect(lifecycle_.get(), &network::ConnectionLifecycle::fatalError,
                     this, [this](const Error& err) {
                         setStatus({SyncStatus::Kind::Failed, 0, QString::fromStdString(err.message)});
                         emit error(err);
                     });
    QObject::connect(lifecycle_.get(), &network::ConnectionLifecycle::messageReceived,
                     this, [this](const QByteArray& payload) {
                         onRemoteMessage(payload);
                     });

    host_.on_caret_moved = [this](const QString& path, int line, int character) {
        onLocalPositionChanged(CursorPosition(path, line, character, Origin::Local));
    };
    host_.on_focus_changed = [this](bool focused) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: focus" << (focused ? "gained" : "lost");
        }
        emit focusChanged(focused);
    };
}

SyncEngine::~SyncEngine() {
    host_.on_caret_moved = nullptr;
    host_.on_focus_changed = nullptr;
}

LocalUpdateResult SyncEngine::onLocalPositionChanged(const CursorPosition& position) {
    const CursorPosition candidate(apply_path_policy(position.file(), options_.path_policy),
                                   position.line(),
                                   position.character(),
                                   Origin::Local,
                                   position.timestamp());

    const auto decision = decide_outbound(window_,
                                          candidate,
                                          guard_.isHeld(),
                                          host_.isFocused(),
                                          host_.isSyncableDocument(candidate.file()));
    if (!decision.accepted()) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: local" << candidate.describe() << "suppressed:"
                    << to_string(decision.kind) << decision.reason;
        }
        return LocalUpdateResult::Suppressed;
    }

    if (!lifecycle_->isOpen()) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: no open connection; not sending" << candidate.describe();
        }
        return LocalUpdateResult::NoConnection;
    }

    auto sent = lifecycle_->send(serialize_cursor_message(candidate, options_.labels));
    if (sent.is_err()) {
        qWarning() << "SYNC: send failed:" << sent.unwrap_err().message.c_str();
        return LocalUpdateResult::SendFailed;
    }

    record_sent(window_, candidate);
    if (sync_debug_enabled()) {
        qInfo() << "SYNC: sent" << candidate.describe();
    }
    emit positionSent(candidate);
    return LocalUpdateResult::Sent;
}

RemoteUpdateResult SyncEngine::onRemoteMessage(const QByteArray& raw_message) {
    auto parsed = parse_cursor_message(raw_message, options_.labels);
    if (parsed.is_err()) {
        qWarning() << "SYNC: dropping malformed message:" << parsed.unwrap_err().message.c_str();
        emit error(parsed.unwrap_err());
        return RemoteUpdateResult::Malformed;
    }

    const auto& received = parsed.unwrap();
    const CursorPosition candidate(apply_path_policy(received.file(), options_.path_policy),
                                   received.line(),
                                   received.character(),
                                   received.origin(),
                                   received.timestamp());

    const auto decision = decide_inbound(window_, candidate, options_.inbound_threshold);
    if (!decision.accepted()) {
        if (sync_debug_enabled()) {
            qInfo() << "SYNC: remote" << candidate.describe() << "dropped:"
                    << to_string(decision.kind) << decision.reason;
        }
        return RemoteUpdateResult::Dropped;
    }

    record_accepted(window_, candidate);

    auto applied = applyToHost(candidate);
    if (applied.is_err()) {
        qWarning() << "SYNC: could not apply" << candidate.describe() << ":"
                   << applied.unwrap_err().message.c_str();
        emit error(applied.unwrap_err());
        return RemoteUpdateResult::HostFailed;
    }

    if (sync_debug_enabled()) {
        qInfo() << "SYNC: applied" << candidate.describe();
    }
    emit remotePositionApplied(candidate);
    return RemoteUpdateResult::Applied;
}

Result<void, Error> SyncEngine::applyToHost(const CursorPosition& position) {
    // Held until this scope exits (any path), then for the grace period.
    auto token = guard_.acquire();

    try {
        auto document = host_.findOrOpenDocument(position.file());
        if (document.is_err()) {
            return Result<void, Error>::err(
                Error{ErrorKind::HostOperationFailed, document.unwrap_err().message});
        }

        auto moved = host_.moveCaret(document.unwrap(), position.line(), position.character());
        if (moved.is_err()) {
            return Result<void, Error>::err(
                Error{ErrorKind::HostOperationFailed, moved.unwrap_err().message});
        }
    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            Error{ErrorKind::HostOperationFailed, std::string("host threw: ") + e.what()});
    }

    return Result<void, Error>::ok();
}

void SyncEngine::connect() {
    lifecycle_->requestConnect();
}

void SyncEngine::disconnect() {
    lifecycle_->requestDisconnect();
}

void SyncEngine::restart() {
    qInfo() << "SYNC: restart";
    lifecycle_->requestDisconnect();
    lifecycle_->requestConnect();
}

void SyncEngine::setStatus(SyncStatus status) {
    if (status_ == status) {
        return;
    }
    status_ = std::move(status);
    qInfo() << "SYNC: status" << to_string(status_);
    emit statusChanged(status_);
}

} // namespace caretsync::sync
