/**
 * @file ftperror.h
 * @brief Error taxonomy and result wrapper shared by all remote operations.
 */

#ifndef FTPERROR_H
#define FTPERROR_H

#include <QString>

#include <functional>
#include <utility>

/**
 * @brief Kinds of failure a remote operation can report.
 */
enum class FtpErrorKind {
    None,        ///< No error
    Connection,  ///< Authentication or network failure during connect/reconnect
    Transfer,    ///< Upload/download failed after the reconnect-and-retry attempt
    Listing,     ///< Every listing strategy failed
    Filesystem,  ///< Local directory creation, file read or write failed
    Command      ///< A single remote command (delete, rename, size, mkdir) failed
};

/// @brief Convert FtpErrorKind to string for logging
[[nodiscard]] inline const char *ftpErrorKindToString(FtpErrorKind kind)
{
    switch (kind) {
    case FtpErrorKind::None: return "None";
    case FtpErrorKind::Connection: return "ConnectionError";
    case FtpErrorKind::Transfer: return "TransferError";
    case FtpErrorKind::Listing: return "ListingError";
    case FtpErrorKind::Filesystem: return "FilesystemError";
    case FtpErrorKind::Command: return "CommandError";
    }
    return "Unknown";
}

/**
 * @brief An error value: kind plus human-readable message.
 *
 * A default-constructed FtpError means success.
 */
struct FtpError {
    FtpErrorKind kind = FtpErrorKind::None;
    QString message;

    [[nodiscard]] bool isError() const { return kind != FtpErrorKind::None; }

    [[nodiscard]] static FtpError none() { return {}; }
    [[nodiscard]] static FtpError make(FtpErrorKind kind, const QString &message)
    {
        return FtpError{kind, message};
    }

    /// Same message, re-labelled with a new kind and a context prefix
    [[nodiscard]] FtpError wrapped(FtpErrorKind newKind, const QString &prefix) const
    {
        return FtpError{newKind, prefix + message};
    }
};

/**
 * @brief Value-or-error result delivered to operation callbacks.
 */
template <typename T>
struct FtpResult {
    T value{};
    FtpError error;

    [[nodiscard]] bool ok() const { return !error.isError(); }

    [[nodiscard]] static FtpResult success(T value)
    {
        FtpResult result;
        result.value = std::move(value);
        return result;
    }

    [[nodiscard]] static FtpResult failure(const FtpError &error)
    {
        FtpResult result;
        result.error = error;
        return result;
    }
};

/// Completion callback for operations without a value
using StatusCallback = std::function<void(const FtpError &error)>;

/// Completion callback for operations producing a value
template <typename T>
using ResultCallback = std::function<void(const FtpResult<T> &result)>;

#endif // FTPERROR_H
