/**
 * @file transferexecutor.h
 * @brief File transfers with path fallbacks and one retry after reconnect.
 */

#ifndef TRANSFEREXECUTOR_H
#define TRANSFEREXECUTOR_H

#include <QByteArray>
#include <QObject>
#include <QString>

#include "connectionmanager.h"
#include "workingdirectoryguard.h"

/**
 * @brief Downloads, uploads and directory creation against the session.
 *
 * Every transfer is attempted at most twice. If the first attempt fails for
 * any reason the executor calls ConnectionManager::ensureConnected() once
 * (which rebuilds the session only if it was found closed) and repeats the
 * whole attempt. A second failure is reported with kind Transfer; a failed
 * reconnect is reported with kind Connection.
 *
 * Downloads first pass the absolute path to RETR. Servers that reject
 * absolute paths get a second try from inside the parent directory, after
 * which the previous working directory is restored.
 *
 * Like DirectoryLister, nothing here serializes itself; run the calls
 * through FtpTaskQueue.
 */
class TransferExecutor : public QObject
{
    Q_OBJECT

public:
    explicit TransferExecutor(ConnectionManager *connection, QObject *parent = nullptr);

    /**
     * @brief Directory for temporary download files (default: QDir::tempPath()).
     */
    void setTemporaryDirectory(const QString &path) { tempDir_ = path; }
    [[nodiscard]] QString temporaryDirectory() const { return tempDir_; }

    /**
     * @brief Downloads a file and returns its content as UTF-8 text.
     * @param remotePath Absolute remote path.
     * @param localPath Destination file; if empty, a temporary file is used
     *        and removed again before @p done is called.
     */
    void downloadFile(const QString &remotePath, const QString &localPath,
                      ResultCallback<QString> done);

    /**
     * @brief Downloads a file to @p localPath without reading it back.
     */
    void downloadToFile(const QString &remotePath, const QString &localPath, StatusCallback done);

    /**
     * @brief Uploads @p source to @p remotePath.
     *
     * @p source is the path of an existing local file, a
     * "data:<type>;base64,<payload>" URL, or literal text stored as UTF-8.
     * The destination directory is created when missing.
     */
    void uploadFile(const QString &source, const QString &remotePath, StatusCallback done);

    /**
     * @brief Creates @p remotePath and any missing parents.
     *
     * Fails with kind Command if the directory cannot be entered afterwards.
     * The working directory is left unchanged.
     */
    void createDirectory(const QString &remotePath, StatusCallback done);

    /**
     * @brief Resolves an upload source to the bytes to store.
     */
    [[nodiscard]] static FtpResult<QByteArray> loadUploadSource(const QString &source);

    /**
     * @brief Returns a fresh "ftp-<msecs>-<hex>.tmp" path inside @p directory.
     */
    [[nodiscard]] static QString temporaryFilePath(const QString &directory);

private:
    using Attempt = std::function<void(StatusCallback done)>;

    void runWithRetry(const QString &operation, const Attempt &attempt, StatusCallback done);
    void fetch(const QString &remotePath, const QString &localPath, StatusCallback done);
    void store(const QByteArray &data, const QString &remotePath, StatusCallback done);
    static void makeDirectories(IFtpSession *session, const QString &remotePath,
                                const std::function<void()> &next);

    ConnectionManager *connection_ = nullptr;
    QString tempDir_;
};

#endif // TRANSFEREXECUTOR_H
