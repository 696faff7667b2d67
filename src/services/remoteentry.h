/**
 * @file remoteentry.h
 * @brief Value types returned by the public remote file operations.
 */

#ifndef REMOTEENTRY_H
#define REMOTEENTRY_H

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>
#include <vector>

enum class RemoteEntryKind { File, Directory };

/**
 * @brief A listed remote file or directory with its absolute path.
 *
 * Produced fresh by every listing call and never cached.
 */
struct RemoteEntry {
    QString name;         ///< File name without directory
    QString path;         ///< Absolute POSIX path (basePath joined with name)
    RemoteEntryKind kind = RemoteEntryKind::File;
    qint64 size = 0;      ///< Size in bytes as reported by the server
    QDateTime modifiedAt; ///< Last modification time (invalid if unknown)
    QString permissions;  ///< Unix-style permission string

    [[nodiscard]] bool isDirectory() const { return kind == RemoteEntryKind::Directory; }
};

/**
 * @brief Node of a recursive listing produced by listAll().
 */
struct RemoteTreeNode {
    RemoteEntry entry;
    std::vector<RemoteTreeNode> children;  ///< Empty for files and unreadable directories
};

/**
 * @brief Answer of an existence check.
 */
struct ExistsResult {
    bool exists = false;
    std::optional<RemoteEntryKind> kind;  ///< Unset when nothing exists at the path
};

/**
 * @brief Outcome of one syncToLocal() run.
 */
struct SyncResult {
    QString root;         ///< Fresh timestamped local destination directory
    int filesSynced = 0;  ///< Number of files downloaded successfully
};

#endif // REMOTEENTRY_H
