#include "sync/remote_apply_guard.hpp"

namespace caretsync::sync {

RemoteApplyGuard::RemoteApplyGuard(int grace_ms, int max_hold_ms)
    : grace_ms_(grace_ms)
    , max_hold_ms_(max_hold_ms)
{
    clock_.start();
}

RemoteApplyGuard::Token RemoteApplyGuard::acquire() {
    if (depth_ == 0) {
        held_since_ms_ = clock_.elapsed();
    }
    ++depth_;
    return Token(this);
}

bool RemoteApplyGuard::isHeld() const {
    const qint64 now = clock_.elapsed();
    if (depth_ > 0) {
        return now - held_since_ms_ < max_hold_ms_;
    }
    return release_at_ms_ >= 0 && now < release_at_ms_;
}

void RemoteApplyGuard::release() {
    if (depth_ == 0) {
        return;
    }
    --depth_;
    if (depth_ == 0) {
        release_at_ms_ = clock_.elapsed() + grace_ms_;
    }
}

} // namespace caretsync::sync
