#pragma once

#include <QString>

namespace caretsync {

// Installs a Qt message handler that stamps time/level/category, appends to
// the log file and echoes to stderr.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Per-message sync tracing, enabled by CARETSYNC_DEBUG_SYNC.
[[nodiscard]] bool sync_debug_enabled();

} // namespace caretsync
