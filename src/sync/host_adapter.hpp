#pragma once

#include "core/result.hpp"
#include <QString>
#include <QtGlobal>
#include <functional>

namespace caretsync::sync {

/**
 * DocumentHandle - An open document as identified by the host.
 */
struct DocumentHandle {
    QString path;
    quintptr native = 0;  // host-specific editor reference, opaque to the engine
};

/**
 * HostAdapter - Editor capabilities consumed by SyncEngine.
 *
 * One implementation per editor integration. All calls happen on the thread
 * running the Qt event loop. A host whose caret move completes asynchronously
 * may return from moveCaret() before it settles; the engine keeps local
 * notifications suppressed for a bounded time afterwards.
 */
class HostAdapter {
public:
    virtual ~HostAdapter() = default;

    [[nodiscard]] virtual bool isFocused() const = 0;

    // False for output/log/debug panels and other non-source artifacts.
    [[nodiscard]] virtual bool isSyncableDocument(const QString& path) const = 0;

    // Fails with HostOperationFailed when the path cannot be opened.
    virtual Result<DocumentHandle, Error> findOrOpenDocument(const QString& path) = 0;

    // Moves the caret and reveals it.
    virtual Result<void, Error> moveCaret(const DocumentHandle& document, int line, int character) = 0;

    // Callbacks, installed by SyncEngine
    std::function<void(const QString& path, int line, int character)> on_caret_moved;
    std::function<void(bool focused)> on_focus_changed;
};

/**
 * Default non-source heuristic: rejects extension output channels, debug
 * consoles and `output:` / `extension:` pseudo paths.
 */
[[nodiscard]] bool is_default_syncable_path(const QString& path);

} // namespace caretsync::sync
