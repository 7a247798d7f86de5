#pragma once

#include <QDir>
#include <QString>

namespace caretsync::sync {

/**
 * How document paths are compared between peers.
 *
 * Exact keeps the bytes the host reported. Clean converts separators to '/'
 * and resolves "." and ".." segments; it does not touch case or symlinks.
 */
enum class PathPolicy {
    Exact,
    Clean
};

[[nodiscard]] inline QString apply_path_policy(const QString& path, PathPolicy policy) {
    if (policy == PathPolicy::Clean) {
        return QDir::cleanPath(QDir::fromNativeSeparators(path));
    }
    return path;
}

} // namespace caretsync::sync
