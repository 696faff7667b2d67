/**
 * @file treesynchronizer.h
 * @brief Mirrors a remote directory tree into a fresh local snapshot folder.
 */

#ifndef TREESYNCHRONIZER_H
#define TREESYNCHRONIZER_H

#include <QDateTime>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>

#include "directorylister.h"
#include "ftptaskqueue.h"
#include "ignorerules.h"
#include "remoteentry.h"
#include "transferexecutor.h"

/**
 * @brief Depth-first download of a remote subtree.
 *
 * Each run writes into its own directory below the local root, named
 * after the start time ("2024-05-01_14-30"). If that directory already
 * exists (two runs in the same minute) a counter is appended
 * ("2024-05-01_14-30_2"), so a run never writes into an earlier snapshot.
 *
 * Every listing and every download is submitted to the task queue as a
 * separate task. The run itself does not hold the queue, so other callers
 * interleave between its steps.
 *
 * A failing file download or an unreadable subdirectory is logged and
 * skipped. Only a failure to list the root, or to create a local
 * directory, ends the run with an error. Names starting with "._"
 * (AppleDouble metadata files) are never downloaded.
 */
class TreeSynchronizer : public QObject
{
    Q_OBJECT

public:
    /// Called after each successful download with the running total
    using ProgressCallback = std::function<void(int filesSynced)>;

    TreeSynchronizer(FtpTaskQueue *queue, DirectoryLister *lister, TransferExecutor *executor,
                     QObject *parent = nullptr);
    ~TreeSynchronizer() override;

    /**
     * @brief Starts a synchronization run.
     * @param remoteRoot Remote directory to mirror ("/" if empty).
     * @param localRoot Local parent of the snapshot directory; must not be empty.
     * @param ignoreRules Paths and names to leave out.
     * @param onProgress Optional progress callback, called synchronously.
     * @param done Receives the snapshot directory and the number of files.
     */
    void syncToLocal(const QString &remoteRoot, const QString &localRoot,
                     const IgnoreRuleSet &ignoreRules, ProgressCallback onProgress,
                     ResultCallback<SyncResult> done);

    /**
     * @brief Snapshot directory name for @p time, e.g. "2024-05-01_14-30".
     */
    [[nodiscard]] static QString timestampName(const QDateTime &time);

    /**
     * @brief Creates a snapshot directory below @p localRoot that did not exist before.
     */
    [[nodiscard]] static FtpResult<QString> claimDestination(const QString &localRoot,
                                                             const QDateTime &time);

private:
    struct Run;

    void step(const std::shared_ptr<Run> &run);
    void listFrame(const std::shared_ptr<Run> &run);
    void downloadEntry(const std::shared_ptr<Run> &run, const RemoteEntry &entry,
                       const QString &localPath);
    void finish(const std::shared_ptr<Run> &run, const FtpError &error);

    FtpTaskQueue *queue_ = nullptr;
    DirectoryLister *lister_ = nullptr;
    TransferExecutor *executor_ = nullptr;
};

#endif // TREESYNCHRONIZER_H
