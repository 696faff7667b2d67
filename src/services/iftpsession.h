/**
 * @file iftpsession.h
 * @brief Interface for a single FTP control session.
 *
 * This interface allows dependency injection of FTP sessions, enabling
 * runtime swapping between the QtNetwork implementation and the in-memory
 * test double. ConnectionManager creates sessions through a SessionFactory
 * so that a closed session can be discarded and rebuilt.
 */

#ifndef IFTPSESSION_H
#define IFTPSESSION_H

#include <QByteArray>
#include <QList>
#include <QObject>
#include <QString>

#include <functional>

#include "connectionconfig.h"
#include "ftpentry.h"
#include "ftperror.h"

/**
 * @brief Abstract interface for one stateful FTP control connection.
 *
 * Every command is asynchronous and completes exactly once through its
 * callback. Implementations serialize their own protocol commands, but
 * callers are still expected to issue one logical operation at a time
 * (see FtpTaskQueue): the working-directory cursor is shared state.
 *
 * Errors are reported with FtpErrorKind::Command for server rejections and
 * FtpErrorKind::Connection when the control connection is lost or times
 * out; in the latter case isClosed() returns true afterwards.
 *
 * @par Example usage:
 * @code
 * IFtpSession *session = new FtpSession(this);
 * session->open(config, [session](const FtpError &error) {
 *     if (error.isError()) {
 *         qWarning() << error.message;
 *         return;
 *     }
 *     session->list(QString(), [](const FtpResult<QList<FtpEntry>> &result) {
 *         qDebug() << result.value.size() << "entries";
 *     });
 * });
 * @endcode
 */
class IFtpSession : public QObject
{
    Q_OBJECT

public:
    using PathCallback = ResultCallback<QString>;
    using ListCallback = ResultCallback<QList<FtpEntry>>;
    using SizeCallback = ResultCallback<qint64>;

    /**
     * @brief Constructs a session interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit IFtpSession(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~IFtpSession() override = default;

    /// @name Lifecycle
    /// @{

    /**
     * @brief Connects and logs in.
     * @param config Host, credentials and TLS settings.
     * @param done Called with an error of kind Connection on failure.
     */
    virtual void open(const ConnectionConfig &config, StatusCallback done) = 0;

    /**
     * @brief Sends QUIT and closes the control connection.
     * @param done Called once the session is closed (never fails).
     */
    virtual void close(StatusCallback done) = 0;

    /**
     * @brief Returns true once the control connection is gone.
     *
     * A session is closed before open() succeeds, after close(), and after
     * the transport detected a timeout or a dropped connection.
     */
    [[nodiscard]] virtual bool isClosed() const = 0;
    /// @}

    /// @name Working Directory
    /// @{

    /**
     * @brief Queries the server-side working directory (PWD).
     */
    virtual void pwd(PathCallback done) = 0;

    /**
     * @brief Changes the server-side working directory (CWD).
     * @param path Absolute or relative path.
     */
    virtual void cd(const QString &path, StatusCallback done) = 0;
    /// @}

    /// @name Directory Operations
    /// @{

    /**
     * @brief Lists a directory (LIST).
     * @param path Directory to list; empty lists the working directory.
     */
    virtual void list(const QString &path, ListCallback done) = 0;

    /**
     * @brief Creates a single directory (MKD).
     */
    virtual void makeDirectory(const QString &path, StatusCallback done) = 0;

    /**
     * @brief Removes an empty directory (RMD).
     */
    virtual void removeDirectory(const QString &path, StatusCallback done) = 0;
    /// @}

    /// @name File Operations
    /// @{

    /**
     * @brief Downloads a remote file into a local file (RETR).
     * @param localPath Local destination, created or truncated.
     * @param remotePath Absolute path or name relative to the working directory.
     */
    virtual void downloadTo(const QString &localPath, const QString &remotePath,
                            StatusCallback done) = 0;

    /**
     * @brief Uploads bytes to a remote file (STOR).
     * @param data Content to store.
     * @param remotePath Absolute path or name relative to the working directory.
     */
    virtual void upload(const QByteArray &data, const QString &remotePath,
                        StatusCallback done) = 0;

    /**
     * @brief Deletes a remote file (DELE).
     */
    virtual void remove(const QString &path, StatusCallback done) = 0;

    /**
     * @brief Renames or moves a remote file (RNFR/RNTO).
     */
    virtual void rename(const QString &oldPath, const QString &newPath,
                        StatusCallback done) = 0;

    /**
     * @brief Queries the size of a remote file (SIZE).
     */
    virtual void size(const QString &path, SizeCallback done) = 0;
    /// @}

signals:
    /**
     * @brief Emitted when the control connection goes away.
     *
     * Purely informational: ConnectionManager discovers closure lazily
     * through isClosed() on the next ensureConnected().
     */
    void disconnected();

    /**
     * @brief Emitted during a download.
     * @param file The remote file path.
     * @param received Bytes received so far.
     * @param total Total file size (0 if unknown).
     */
    void downloadProgress(const QString &file, qint64 received, qint64 total);

    /**
     * @brief Emitted during an upload.
     * @param file The remote file path.
     * @param sent Bytes sent so far.
     * @param total Total size.
     */
    void uploadProgress(const QString &file, qint64 sent, qint64 total);
};

/// Builds a fresh, unopened session; the returned object is owned by @p parent
using SessionFactory = std::function<IFtpSession *(QObject *parent)>;

#endif // IFTPSESSION_H
