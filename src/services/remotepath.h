/**
 * @file remotepath.h
 * @brief POSIX path helpers for remote (server-side) paths.
 *
 * Remote paths are always '/'-separated regardless of the host platform.
 * Local paths go through QDir/QFileInfo instead.
 */

#ifndef REMOTEPATH_H
#define REMOTEPATH_H

#include <QString>
#include <QStringList>

namespace RemotePath {

/**
 * @brief Normalizes a remote path.
 *
 * Backslashes become '/', a leading '/' is added, duplicate slashes are
 * collapsed and a trailing '/' is removed except for the root itself.
 * An empty path normalizes to "/".
 */
[[nodiscard]] QString normalize(const QString &path);

/**
 * @brief Joins a base directory and a name the way posix.join does.
 *
 * "." and ".." segments are resolved; the result is never empty.
 */
[[nodiscard]] QString join(const QString &base, const QString &name);

/// @brief Parent directory of a normalized path ("/" for top-level entries and root)
[[nodiscard]] QString parent(const QString &path);

/// @brief Last segment of the path (empty for root)
[[nodiscard]] QString fileName(const QString &path);

/// @brief Non-empty '/'-separated segments of the path
[[nodiscard]] QStringList segments(const QString &path);

/// @brief True for "/" and for the empty string
[[nodiscard]] bool isRoot(const QString &path);

/// @brief True if @p path equals @p ancestor or lies below it
[[nodiscard]] bool isWithin(const QString &path, const QString &ancestor);

} // namespace RemotePath

#endif // REMOTEPATH_H
