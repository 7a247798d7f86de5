#pragma once

#include <QElapsedTimer>
#include <QtGlobal>

namespace caretsync::sync {

/**
 * RemoteApplyGuard - Suppresses local caret notifications caused by applying
 * a remote position.
 *
 * acquire() returns a Token; the guard is held while any token is alive and
 * for `grace_ms` after the last one is released. A token that is never
 * released (a host operation that hangs) stops counting after `max_hold_ms`.
 */
class RemoteApplyGuard {
public:
    class Token {
    public:
        Token() = default;
        explicit Token(RemoteApplyGuard* guard) : guard_(guard) {}
        ~Token() { reset(); }

        Token(const Token&) = delete;
        Token& operator=(const Token&) = delete;

        Token(Token&& other) noexcept : guard_(other.guard_) { other.guard_ = nullptr; }
        Token& operator=(Token&& other) noexcept {
            if (this != &other) {
                reset();
                guard_ = other.guard_;
                other.guard_ = nullptr;
            }
            return *this;
        }

        void reset() {
            if (guard_) {
                guard_->release();
                guard_ = nullptr;
            }
        }

    private:
        RemoteApplyGuard* guard_ = nullptr;
    };

    RemoteApplyGuard(int grace_ms, int max_hold_ms);

    [[nodiscard]] Token acquire();
    [[nodiscard]] bool isHeld() const;

    [[nodiscard]] int graceMs() const { return grace_ms_; }

private:
    void release();

    int grace_ms_;
    int max_hold_ms_;
    int depth_ = 0;
    qint64 held_since_ms_ = 0;
    qint64 release_at_ms_ = -1;
    QElapsedTimer clock_;
};

} // namespace caretsync::sync
