#include "core/suppression_policy.hpp"

namespace caretsync {

OutboundDecision decide_outbound(const SuppressionWindow& window,
                                 const CursorPosition& candidate,
                                 bool applying_remote,
                                 bool focused,
                                 bool syncable_document) {
    if (applying_remote) {
        return {OutboundDecisionKind::SuppressApplyingRemote,
                QStringLiteral("caret moved by a remote update")};
    }

    if (!focused) {
        return {OutboundDecisionKind::SuppressUnfocused, QStringLiteral("window not focused")};
    }

    if (!syncable_document) {
        return {OutboundDecisionKind::SuppressNonSourceDocument,
                QStringLiteral("not a source document: %1").arg(candidate.file())};
    }

    if (window.last_sent && window.last_sent->samePlace(candidate)) {
        return {OutboundDecisionKind::SuppressDuplicate, QStringLiteral("same position as last sent")};
    }

    return {OutboundDecisionKind::Send, QString{}};
}

InboundDecision decide_inbound(const SuppressionWindow& window,
                               const CursorPosition& candidate,
                               std::chrono::milliseconds threshold) {
    if (candidate.origin() != Origin::Remote) {
        return {InboundDecisionKind::DropNotPeerSourced, QStringLiteral("message not from peer")};
    }

    if (window.last_accepted && window.last_accepted->samePlace(candidate)) {
        const auto delta = candidate.timestamp() - window.last_accepted->timestamp();
        if (delta < threshold) {
            return {InboundDecisionKind::DropDuplicateWithinWindow,
                    QStringLiteral("duplicate within %1 ms (delta %2 ms)")
                        .arg(threshold.count())
                        .arg(delta.count())};
        }
    }

    return {InboundDecisionKind::Apply, QString{}};
}

void record_sent(SuppressionWindow& window, const CursorPosition& position) {
    window.last_sent = position;
}

void record_accepted(SuppressionWindow& window, const CursorPosition& position) {
    window.last_accepted = position;
}

const char* to_string(OutboundDecisionKind kind) {
    switch (kind) {
        case OutboundDecisionKind::Send: return "Send";
        case OutboundDecisionKind::SuppressApplyingRemote: return "SuppressApplyingRemote";
        case OutboundDecisionKind::SuppressUnfocused: return "SuppressUnfocused";
        case OutboundDecisionKind::SuppressNonSourceDocument: return "SuppressNonSourceDocument";
        case OutboundDecisionKind::SuppressDuplicate: return "SuppressDuplicate";
    }
    return "?";
}

const char* to_string(InboundDecisionKind kind) {
    switch (kind) {
        case InboundDecisionKind::Apply: return "Apply";
        case InboundDecisionKind::DropNotPeerSourced: return "DropNotPeerSourced";
        case InboundDecisionKind::DropDuplicateWithinWindow: return "DropDuplicateWithinWindow";
    }
    return "?";
}

} // namespace caretsync
