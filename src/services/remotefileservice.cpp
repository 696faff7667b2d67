#include "remotefileservice.h"

#include "ftpsession.h"
#include "remotepath.h"
#include "utils/logging.h"

#include <QDebug>
#include <QPointer>

namespace {

struct DeletionStep {
    QString path;
    bool directory = false;
};

// Children before their parent directory
void collectPostOrder(const std::vector<RemoteTreeNode> &nodes, QList<DeletionStep> &out)
{
    for (const RemoteTreeNode &node : nodes) {
        if (node.entry.isDirectory()) {
            collectPostOrder(node.children, out);
        }
        out.append(DeletionStep{node.entry.path, node.entry.isDirectory()});
    }
}

void runDeletions(QPointer<IFtpSession> session, const QList<DeletionStep> &steps, int index,
                  StatusCallback done)
{
    if (index >= steps.size()) {
        done(FtpError::none());
        return;
    }
    if (!session) {
        done(FtpError::make(FtpErrorKind::Connection, QObject::tr("FTP session closed during delete")));
        return;
    }

    const DeletionStep step = steps.at(index);
    auto next = [session, steps, index, done](const FtpError &error) {
        if (error.isError()) {
            done(error);
            return;
        }
        runDeletions(session, steps, index + 1, done);
    };

    LOG_VERBOSE() << "FTP: Deleting" << (step.directory ? "directory" : "file") << step.path;
    if (step.directory) {
        session->removeDirectory(step.path, next);
    } else {
        session->remove(step.path, next);
    }
}

} // namespace

RemoteFileService::RemoteFileService(SessionFactory factory, QObject *parent)
    : QObject(parent)
    , connection_(new ConnectionManager(std::move(factory), this))
    , queue_(new FtpTaskQueue(this))
    , lister_(new DirectoryLister(connection_, this))
    , executor_(new TransferExecutor(connection_, this))
    , synchronizer_(new TreeSynchronizer(queue_, lister_, executor_, this))
{
}

RemoteFileService::~RemoteFileService() = default;

SessionFactory RemoteFileService::defaultSessionFactory()
{
    return [](QObject *parent) -> IFtpSession * { return new FtpSession(parent); };
}

// Connection

void RemoteFileService::connectToServer(const ConnectionConfig &config, StatusCallback done)
{
    queue_->runQueued(
        QStringLiteral("connect %1").arg(config.host),
        [this, config](StatusCallback connected) { connection_->connectToServer(config, connected); },
        done);
}

void RemoteFileService::disconnectFromServer(StatusCallback done)
{
    queue_->runQueued(
        QStringLiteral("disconnect"),
        [this](StatusCallback closed) { connection_->disconnectFromServer(closed); },
        done);
}

// Listing

void RemoteFileService::listFiles(const QString &path, EntriesCallback done)
{
    queue_->runQueued<QList<RemoteEntry>>(
        QStringLiteral("list %1").arg(path),
        [this, path](EntriesCallback listed) { lister_->listFiles(path, listed); },
        done);
}

void RemoteFileService::listFilesReadonly(const QString &path, EntriesCallback done)
{
    queue_->runQueued<QList<RemoteEntry>>(
        QStringLiteral("list (read-only) %1").arg(path),
        [this, path](EntriesCallback listed) { lister_->listFilesReadonly(path, listed); },
        done);
}

void RemoteFileService::listAll(const QString &path, TreeCallback done)
{
    queue_->runQueued<std::vector<RemoteTreeNode>>(
        QStringLiteral("list tree %1").arg(path),
        [this, path](TreeCallback listed) {
            lister_->listAll(path, [listed](const FtpResult<std::vector<RemoteTreeNode>> &result) {
                listed(result.ok() ? result
                                   : FtpResult<std::vector<RemoteTreeNode>>::failure(
                                         result.error.wrapped(FtpErrorKind::Listing,
                                                              tr("Failed to list tree: "))));
            });
        },
        done);
}

// Transfers

void RemoteFileService::downloadFile(const QString &remotePath, const QString &localPath,
                                     ResultCallback<QString> done)
{
    queue_->runQueued<QString>(
        QStringLiteral("download %1").arg(remotePath),
        [this, remotePath, localPath](ResultCallback<QString> downloaded) {
            executor_->downloadFile(remotePath, localPath, downloaded);
        },
        done);
}

void RemoteFileService::uploadFile(const QString &source, const QString &remotePath,
                                   StatusCallback done)
{
    queue_->runQueued(
        QStringLiteral("upload %1").arg(remotePath),
        [this, source, remotePath](StatusCallback uploaded) {
            executor_->uploadFile(source, remotePath, uploaded);
        },
        done);
}

// File management

void RemoteFileService::runCommand(const QString &label, const QString &errorPrefix,
                                   const SessionCommand &command, StatusCallback done)
{
    queue_->runQueued(
        label,
        [this, errorPrefix, command](StatusCallback finished) {
            connection_->ensureConnected([this, errorPrefix, command, finished](const FtpError &error) {
                if (error.isError()) {
                    finished(error);
                    return;
                }
                command(connection_->session(), [errorPrefix, finished](const FtpError &commandError) {
                    if (commandError.isError() && commandError.kind != FtpErrorKind::Connection) {
                        finished(commandError.wrapped(FtpErrorKind::Command, errorPrefix));
                        return;
                    }
                    finished(commandError);
                });
            });
        },
        done);
}

void RemoteFileService::createDirectory(const QString &remotePath, StatusCallback done)
{
    queue_->runQueued(
        QStringLiteral("mkdir %1").arg(remotePath),
        [this, remotePath](StatusCallback created) { executor_->createDirectory(remotePath, created); },
        done);
}

void RemoteFileService::deleteFile(const QString &remotePath, StatusCallback done)
{
    const QString path = RemotePath::normalize(remotePath);
    runCommand(QStringLiteral("delete %1").arg(path), tr("Failed to delete file: "),
               [path](IFtpSession *session, StatusCallback removed) { session->remove(path, removed); },
               done);
}

void RemoteFileService::deleteDirectory(const QString &remotePath, StatusCallback done)
{
    const QString path = RemotePath::normalize(remotePath);
    if (RemotePath::isRoot(path)) {
        done(FtpError::make(FtpErrorKind::Command, tr("Failed to delete directory: refusing to delete '/'")));
        return;
    }
    queue_->runQueued(
        QStringLiteral("delete tree %1").arg(path),
        [this, path](StatusCallback removed) { removeTree(path, removed); },
        done);
}

void RemoteFileService::removeTree(const QString &remotePath, StatusCallback done)
{
    const QString prefix = tr("Failed to delete directory: ");
    lister_->listAll(remotePath, [this, remotePath, prefix, done](const FtpResult<std::vector<RemoteTreeNode>> &tree) {
        if (!tree.ok()) {
            done(tree.error.kind == FtpErrorKind::Connection
                     ? tree.error
                     : tree.error.wrapped(FtpErrorKind::Command, prefix));
            return;
        }

        QList<DeletionStep> steps;
        collectPostOrder(tree.value, steps);
        steps.append(DeletionStep{remotePath, true});
        qDebug() << "FTP: Deleting" << remotePath << "with" << steps.size() - 1 << "entries";

        runDeletions(QPointer<IFtpSession>(connection_->session()), steps, 0,
                     [prefix, done](const FtpError &error) {
            if (error.isError() && error.kind != FtpErrorKind::Connection) {
                done(error.wrapped(FtpErrorKind::Command, prefix));
                return;
            }
            done(error);
        });
    });
}

void RemoteFileService::rename(const QString &oldPath, const QString &newPath, StatusCallback done)
{
    const QString from = RemotePath::normalize(oldPath);
    const QString to = RemotePath::normalize(newPath);
    runCommand(QStringLiteral("rename %1").arg(from), tr("Failed to rename: "),
               [from, to](IFtpSession *session, StatusCallback renamed) { session->rename(from, to, renamed); },
               done);
}

void RemoteFileService::getFileSize(const QString &remotePath, ResultCallback<qint64> done)
{
    const QString path = RemotePath::normalize(remotePath);
    queue_->runQueued<qint64>(
        QStringLiteral("size %1").arg(path),
        [this, path](ResultCallback<qint64> sized) {
            connection_->ensureConnected([this, path, sized](const FtpError &error) {
                if (error.isError()) {
                    sized(FtpResult<qint64>::failure(error));
                    return;
                }
                connection_->session()->size(path, [sized](const FtpResult<qint64> &result) {
                    if (!result.ok() && result.error.kind != FtpErrorKind::Connection) {
                        sized(FtpResult<qint64>::failure(
                            result.error.wrapped(FtpErrorKind::Command, tr("Failed to get file size: "))));
                        return;
                    }
                    sized(result);
                });
            });
        },
        done);
}

void RemoteFileService::exists(const QString &remotePath, ResultCallback<ExistsResult> done)
{
    const QString path = RemotePath::normalize(remotePath);
    queue_->runQueued<ExistsResult>(
        QStringLiteral("exists %1").arg(path),
        [this, path](ResultCallback<ExistsResult> answered) {
            connection_->ensureConnected([this, path, answered](const FtpError &error) {
                if (error.isError()) {
                    answered(FtpResult<ExistsResult>::failure(error));
                    return;
                }
                IFtpSession *session = connection_->session();
                QPointer<IFtpSession> guarded(session);
                WorkingDirectoryGuard::capture(session, [guarded, path, answered](
                                                            const WorkingDirectoryGuard::Ptr &guard,
                                                            const FtpError &pwdError) {
                    if (!guarded) {
                        answered(FtpResult<ExistsResult>::failure(pwdError));
                        return;
                    }
                    guarded->cd(path, [guarded, guard, path, answered](const FtpError &cdError) {
                        if (!cdError.isError()) {
                            ExistsResult found;
                            found.exists = true;
                            found.kind = RemoteEntryKind::Directory;
                            if (!guard) {
                                answered(FtpResult<ExistsResult>::success(found));
                                return;
                            }
                            guard->restore([guard, found, answered](const FtpError &restoreError) {
                                if (restoreError.isError()) {
                                    qWarning() << "FTP: Could not restore working directory"
                                               << guard->directory() << ":" << restoreError.message;
                                }
                                answered(FtpResult<ExistsResult>::success(found));
                            });
                            return;
                        }
                        if (!guarded) {
                            answered(FtpResult<ExistsResult>::failure(cdError));
                            return;
                        }
                        // A failed CWD leaves the working directory where it was
                        if (guard) {
                            guard->dismiss();
                        }
                        guarded->size(path, [answered](const FtpResult<qint64> &sized) {
                            if (!sized.ok() && sized.error.kind == FtpErrorKind::Connection) {
                                answered(FtpResult<ExistsResult>::failure(sized.error));
                                return;
                            }
                            ExistsResult found;
                            found.exists = sized.ok();
                            if (found.exists) {
                                found.kind = RemoteEntryKind::File;
                            }
                            answered(FtpResult<ExistsResult>::success(found));
                        });
                    });
                });
            });
        },
        done);
}

// Synchronization

void RemoteFileService::syncToLocal(const QString &remoteRoot, const QString &localRoot,
                                    const IgnoreRuleSet &ignoreRules, ProgressCallback onProgress,
                                    ResultCallback<SyncResult> done)
{
    synchronizer_->syncToLocal(remoteRoot, localRoot, ignoreRules, std::move(onProgress), std::move(done));
}
