#include "treesynchronizer.h"

#include "remotepath.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QPointer>

#include <vector>

namespace {

constexpr int MaxDestinationAttempts = 100;

bool isAppleDouble(const QString &name)
{
    return name.startsWith(QLatin1String("._"));
}

} // namespace

struct TreeSynchronizer::Run {
    struct Frame {
        QString remoteDir;
        QString localDir;
        bool listed = false;
        QList<RemoteEntry> entries;
        int next = 0;
    };

    QString remoteRoot;
    QString destination;
    IgnoreRuleSet rules;
    ProgressCallback onProgress;
    ResultCallback<SyncResult> done;
    std::vector<Frame> stack;
    int filesSynced = 0;
    int filesFailed = 0;
    bool finished = false;
};

TreeSynchronizer::TreeSynchronizer(FtpTaskQueue *queue, DirectoryLister *lister,
                                   TransferExecutor *executor, QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , lister_(lister)
    , executor_(executor)
{
}

TreeSynchronizer::~TreeSynchronizer() = default;

QString TreeSynchronizer::timestampName(const QDateTime &time)
{
    return time.toString(QStringLiteral("yyyy-MM-dd_HH-mm"));
}

FtpResult<QString> TreeSynchronizer::claimDestination(const QString &localRoot, const QDateTime &time)
{
    QDir root(localRoot);
    if (!root.mkpath(QStringLiteral("."))) {
        return FtpResult<QString>::failure(
            FtpError::make(FtpErrorKind::Filesystem,
                           tr("Cannot create local folder '%1'").arg(localRoot)));
    }

    const QString stamp = timestampName(time);
    for (int attempt = 1; attempt <= MaxDestinationAttempts; ++attempt) {
        const QString name = attempt == 1 ? stamp : QStringLiteral("%1_%2").arg(stamp).arg(attempt);
        // mkdir() fails for an existing directory, which makes the claim exclusive
        if (root.mkdir(name)) {
            return FtpResult<QString>::success(root.absoluteFilePath(name));
        }
        if (!root.exists(name)) {
            return FtpResult<QString>::failure(
                FtpError::make(FtpErrorKind::Filesystem,
                               tr("Cannot create local folder '%1'").arg(root.filePath(name))));
        }
    }
    return FtpResult<QString>::failure(
        FtpError::make(FtpErrorKind::Filesystem,
                       tr("Too many snapshot folders named '%1' in '%2'").arg(stamp, localRoot)));
}

void TreeSynchronizer::syncToLocal(const QString &remoteRoot, const QString &localRoot,
                                   const IgnoreRuleSet &ignoreRules, ProgressCallback onProgress,
                                   ResultCallback<SyncResult> done)
{
    if (localRoot.trimmed().isEmpty()) {
        done(FtpResult<SyncResult>::failure(
            FtpError::make(FtpErrorKind::Filesystem, tr("Local sync folder is not set"))));
        return;
    }

    const FtpResult<QString> destination = claimDestination(localRoot, QDateTime::currentDateTime());
    if (!destination.ok()) {
        done(FtpResult<SyncResult>::failure(destination.error));
        return;
    }

    auto run = std::make_shared<Run>();
    run->remoteRoot = RemotePath::normalize(remoteRoot);
    run->destination = destination.value;
    run->rules = ignoreRules;
    run->onProgress = std::move(onProgress);
    run->done = std::move(done);

    qDebug() << "Sync: Mirroring" << run->remoteRoot << "into" << run->destination;

    if (run->rules.isIgnored(run->remoteRoot)) {
        qDebug() << "Sync: Root" << run->remoteRoot << "is ignored, nothing to do";
        finish(run, FtpError::none());
        return;
    }

    Run::Frame root;
    root.remoteDir = run->remoteRoot;
    root.localDir = run->destination;
    run->stack.push_back(root);
    step(run);
}

void TreeSynchronizer::step(const std::shared_ptr<Run> &run)
{
    while (!run->stack.empty()) {
        Run::Frame &frame = run->stack.back();
        if (!frame.listed) {
            listFrame(run);
            return;
        }

        if (frame.next >= frame.entries.size()) {
            run->stack.pop_back();
            continue;
        }

        const RemoteEntry entry = frame.entries.at(frame.next++);
        if (entry.name.isEmpty() || isAppleDouble(entry.name)) {
            continue;
        }
        const QString remoteChild = RemotePath::normalize(entry.path);
        if (run->rules.isIgnored(remoteChild)) {
            LOG_VERBOSE() << "Sync: Skipping ignored" << remoteChild;
            continue;
        }
        const QString localChild = QDir(frame.localDir).filePath(entry.name);

        if (entry.isDirectory()) {
            Run::Frame child;
            child.remoteDir = remoteChild;
            child.localDir = localChild;
            // frame is invalidated by push_back
            run->stack.push_back(child);
            continue;
        }

        RemoteEntry file = entry;
        file.path = remoteChild;
        downloadEntry(run, file, localChild);
        return;
    }

    finish(run, FtpError::none());
}

void TreeSynchronizer::listFrame(const std::shared_ptr<Run> &run)
{
    const QString remoteDir = run->stack.back().remoteDir;
    QPointer<TreeSynchronizer> self(this);

    queue_->runQueued<QList<RemoteEntry>>(
        QStringLiteral("sync: list %1").arg(remoteDir),
        [self, remoteDir](ResultCallback<QList<RemoteEntry>> listed) {
            if (!self) {
                listed(FtpResult<QList<RemoteEntry>>::failure(
                    FtpError::make(FtpErrorKind::Listing, tr("Synchronization cancelled"))));
                return;
            }
            self->lister_->listFilesExact(remoteDir, listed);
        },
        [self, run, remoteDir](const FtpResult<QList<RemoteEntry>> &result) {
            if (!self || run->finished) {
                return;
            }
            const bool isRoot = run->stack.size() == 1;
            if (!result.ok()) {
                if (isRoot) {
                    self->finish(run, result.error);
                    return;
                }
                qWarning() << "Sync: Cannot list" << remoteDir << "- skipping:" << result.error.message;
                run->stack.pop_back();
                self->step(run);
                return;
            }

            Run::Frame &frame = run->stack.back();
            if (!QDir().mkpath(frame.localDir)) {
                self->finish(run, FtpError::make(FtpErrorKind::Filesystem,
                                                 tr("Cannot create local folder '%1'").arg(frame.localDir)));
                return;
            }
            frame.entries = result.value;
            frame.listed = true;
            self->step(run);
        });
}

void TreeSynchronizer::downloadEntry(const std::shared_ptr<Run> &run, const RemoteEntry &entry,
                                     const QString &localPath)
{
    const QString remotePath = entry.path;
    QPointer<TreeSynchronizer> self(this);

    queue_->runQueued(
        QStringLiteral("sync: get %1").arg(remotePath),
        [self, remotePath, localPath](StatusCallback downloaded) {
            if (!self) {
                downloaded(FtpError::make(FtpErrorKind::Transfer, tr("Synchronization cancelled")));
                return;
            }
            self->executor_->downloadToFile(remotePath, localPath, downloaded);
        },
        [self, run, remotePath](const FtpError &error) {
            if (!self || run->finished) {
                return;
            }
            if (error.isError()) {
                ++run->filesFailed;
                qWarning() << "Sync: Failed to download" << remotePath << ":" << error.message;
            } else {
                ++run->filesSynced;
                LOG_VERBOSE() << "Sync: Downloaded" << remotePath;
                if (run->onProgress) {
                    run->onProgress(run->filesSynced);
                }
            }
            self->step(run);
        });
}

void TreeSynchronizer::finish(const std::shared_ptr<Run> &run, const FtpError &error)
{
    if (run->finished) {
        return;
    }
    run->finished = true;
    run->stack.clear();

    if (error.isError()) {
        qWarning() << "Sync: Aborted:" << error.message;
        run->done(FtpResult<SyncResult>::failure(error));
        return;
    }

    qDebug() << "Sync: Finished" << run->remoteRoot << "-" << run->filesSynced << "files,"
             << run->filesFailed << "failed";
    SyncResult result;
    result.root = run->destination;
    result.filesSynced = run->filesSynced;
    run->done(FtpResult<SyncResult>::success(result));
}
