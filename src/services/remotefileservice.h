/**
 * @file remotefileservice.h
 * @brief Public remote file API: every operation runs through one FIFO queue.
 */

#ifndef REMOTEFILESERVICE_H
#define REMOTEFILESERVICE_H

#include <QObject>
#include <QString>

#include <vector>

#include "connectionmanager.h"
#include "directorylister.h"
#include "ftptaskqueue.h"
#include "ignorerules.h"
#include "remoteentry.h"
#include "transferexecutor.h"
#include "treesynchronizer.h"

/**
 * @brief Facade over the connection, queue, lister, executor and synchronizer.
 *
 * All operations that touch the session are submitted to one FtpTaskQueue,
 * so they reach the server strictly in call order and never overlap. Each
 * call gets its own completion callback; a failing call does not affect
 * the ones queued after it.
 *
 * syncToLocal() is the exception: the run itself is not queued, but every
 * listing and download it performs is, so other calls can interleave with
 * a long synchronization.
 *
 * @par Example usage:
 * @code
 * auto *files = new RemoteFileService(RemoteFileService::defaultSessionFactory(), this);
 * files->connectToServer(config, [](const FtpError &error) { ... });
 * files->listFiles("/", [](const FtpResult<QList<RemoteEntry>> &result) {
 *     for (const RemoteEntry &entry : result.value) {
 *         qDebug() << entry.path;
 *     }
 * });
 * @endcode
 */
class RemoteFileService : public QObject
{
    Q_OBJECT

public:
    using EntriesCallback = DirectoryLister::EntriesCallback;
    using TreeCallback = DirectoryLister::TreeCallback;
    using ProgressCallback = TreeSynchronizer::ProgressCallback;

    /**
     * @brief Constructs the service.
     * @param factory Builds transport sessions (see defaultSessionFactory()).
     * @param parent Optional parent QObject for memory management.
     */
    explicit RemoteFileService(SessionFactory factory, QObject *parent = nullptr);
    ~RemoteFileService() override;

    /**
     * @brief Factory producing FtpSession instances.
     */
    [[nodiscard]] static SessionFactory defaultSessionFactory();

    /// @name Components
    /// @{
    [[nodiscard]] ConnectionManager *connection() const { return connection_; }
    [[nodiscard]] FtpTaskQueue *queue() const { return queue_; }
    [[nodiscard]] TransferExecutor *executor() const { return executor_; }
    /// @}

    [[nodiscard]] bool isConnected() const { return connection_->isConnected(); }

    /// @name Connection
    /// @{
    void connectToServer(const ConnectionConfig &config, StatusCallback done);
    void disconnectFromServer(StatusCallback done = nullptr);
    /// @}

    /// @name Listing
    /// @{
    void listFiles(const QString &path, EntriesCallback done);
    void listFilesReadonly(const QString &path, EntriesCallback done);
    void listAll(const QString &path, TreeCallback done);
    /// @}

    /// @name Transfers
    /// @{

    /**
     * @brief Downloads a file and returns its text.
     * @param localPath Where to keep the file; empty for a temporary copy.
     */
    void downloadFile(const QString &remotePath, const QString &localPath,
                      ResultCallback<QString> done);

    /**
     * @brief Uploads a local file, a base64 data URL or plain text.
     */
    void uploadFile(const QString &source, const QString &remotePath, StatusCallback done);
    /// @}

    /// @name File Management
    /// @{
    void createDirectory(const QString &remotePath, StatusCallback done);
    void deleteFile(const QString &remotePath, StatusCallback done);

    /**
     * @brief Deletes a directory together with everything below it.
     */
    void deleteDirectory(const QString &remotePath, StatusCallback done);

    void rename(const QString &oldPath, const QString &newPath, StatusCallback done);
    void getFileSize(const QString &remotePath, ResultCallback<qint64> done);

    /**
     * @brief Checks a path: enterable means directory, a SIZE answer means file.
     */
    void exists(const QString &remotePath, ResultCallback<ExistsResult> done);
    /// @}

    /// @name Synchronization
    /// @{
    void syncToLocal(const QString &remoteRoot, const QString &localRoot,
                     const IgnoreRuleSet &ignoreRules, ProgressCallback onProgress,
                     ResultCallback<SyncResult> done);
    /// @}

private:
    using SessionCommand = std::function<void(IFtpSession *session, StatusCallback done)>;

    void runCommand(const QString &label, const QString &errorPrefix,
                    const SessionCommand &command, StatusCallback done);
    void removeTree(const QString &remotePath, StatusCallback done);

    ConnectionManager *connection_ = nullptr;
    FtpTaskQueue *queue_ = nullptr;
    DirectoryLister *lister_ = nullptr;
    TransferExecutor *executor_ = nullptr;
    TreeSynchronizer *synchronizer_ = nullptr;
};

#endif // REMOTEFILESERVICE_H
