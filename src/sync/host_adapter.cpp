#include "sync/host_adapter.hpp"

namespace caretsync::sync {

bool is_default_syncable_path(const QString& path) {
    return !(path.contains(QLatin1String("extension-output-")) ||
             path.contains(QLatin1String("debug-console")) ||
             path.startsWith(QLatin1String("output:")) ||
             path.startsWith(QLatin1String("extension:")));
}

} // namespace caretsync::sync
