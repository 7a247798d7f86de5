#pragma once

#include "core/cursor_position.hpp"

#include <QString>
#include <chrono>
#include <optional>

namespace caretsync {

/**
 * SuppressionWindow - The last position sent and the last position accepted.
 *
 * Both start empty and are only overwritten by an accepted update. The window
 * lives as long as the engine and is deliberately kept across reconnects.
 */
struct SuppressionWindow {
    std::optional<CursorPosition> last_sent;
    std::optional<CursorPosition> last_accepted;
};

enum class OutboundDecisionKind {
    Send,
    SuppressApplyingRemote,
    SuppressUnfocused,
    SuppressNonSourceDocument,
    SuppressDuplicate,
};

enum class InboundDecisionKind {
    Apply,
    DropNotPeerSourced,
    DropDuplicateWithinWindow,
};

struct OutboundDecision {
    OutboundDecisionKind kind = OutboundDecisionKind::Send;
    QString reason;

    [[nodiscard]] bool accepted() const { return kind == OutboundDecisionKind::Send; }
};

struct InboundDecision {
    InboundDecisionKind kind = InboundDecisionKind::Apply;
    QString reason;

    [[nodiscard]] bool accepted() const { return kind == InboundDecisionKind::Apply; }
};

inline constexpr std::chrono::milliseconds kDefaultInboundThreshold{250};

/**
 * Decide whether a locally observed caret move goes out.
 *
 * A repeat of the last sent coordinate is suppressed regardless of elapsed
 * time. Does not touch the window; see record_sent().
 */
[[nodiscard]] OutboundDecision decide_outbound(const SuppressionWindow& window,
                                               const CursorPosition& candidate,
                                               bool applying_remote,
                                               bool focused,
                                               bool syncable_document);

/**
 * Decide whether an update received from the peer is applied.
 *
 * A repeat of the last accepted coordinate is dropped only while its
 * timestamp is less than `threshold` after the accepted one.
 */
[[nodiscard]] InboundDecision decide_inbound(const SuppressionWindow& window,
                                             const CursorPosition& candidate,
                                             std::chrono::milliseconds threshold = kDefaultInboundThreshold);

void record_sent(SuppressionWindow& window, const CursorPosition& position);
void record_accepted(SuppressionWindow& window, const CursorPosition& position);

[[nodiscard]] const char* to_string(OutboundDecisionKind kind);
[[nodiscard]] const char* to_string(InboundDecisionKind kind);

} // namespace caretsync
