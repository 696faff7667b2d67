#include "directorylister.h"

#include "remotepath.h"
#include "utils/logging.h"

#include <QDebug>
#include <QPointer>

namespace {

FtpError sessionLost()
{
    return FtpError::make(FtpErrorKind::Connection, QObject::tr("FTP session closed during listing"));
}

// PWD with a fallback value when the server won't answer
void pwdOr(IFtpSession *session, const QString &fallback, std::function<void(const QString &)> next)
{
    session->pwd([fallback, next](const FtpResult<QString> &result) {
        next(result.ok() && !result.value.isEmpty() ? result.value : fallback);
    });
}

// CWD into each segment in turn; individual failures are ignored
void walkSegments(QPointer<IFtpSession> session, const QStringList &segments, int index,
                  std::function<void()> next)
{
    if (!session || index >= segments.size()) {
        next();
        return;
    }
    const QString segment = segments.at(index);
    session->cd(segment, [session, segments, index, next, segment](const FtpError &error) {
        if (error.isError()) {
            LOG_VERBOSE() << "FTP: segment-walk could not enter" << segment << ":" << error.message;
        }
        walkSegments(session, segments, index + 1, next);
    });
}

FtpResult<DirectoryLister::Listing> listed(const QList<FtpEntry> &entries, const QString &basePath)
{
    return FtpResult<DirectoryLister::Listing>::success(
        DirectoryLister::Listing{basePath, DirectoryLister::toRemoteEntries(entries, basePath)});
}

void tryStrategy(QPointer<IFtpSession> session, const QString &path, bool exact, std::size_t index,
                 QStringList failures, DirectoryLister::EntriesCallback done)
{
    const auto &strategies = DirectoryLister::strategies();
    if (index >= strategies.size()) {
        done(FtpResult<QList<RemoteEntry>>::failure(
            FtpError::make(FtpErrorKind::Listing,
                           QObject::tr("Failed to list files: %1").arg(failures.join(QStringLiteral("; "))))));
        return;
    }
    if (!session || session->isClosed()) {
        done(FtpResult<QList<RemoteEntry>>::failure(sessionLost()));
        return;
    }

    const DirectoryLister::Strategy &strategy = strategies.at(index);
    const QString name = strategy.name;
    strategy.run(session.data(), path,
                 [session, path, exact, index, failures, done, name](const FtpResult<DirectoryLister::Listing> &result) mutable {
        if (!result.ok()) {
            LOG_VERBOSE() << "FTP: Listing strategy" << name << "failed for" << path
                          << ":" << result.error.message;
            failures.append(QStringLiteral("%1: %2").arg(name, result.error.message));
            tryStrategy(session, path, exact, index + 1, failures, done);
            return;
        }
        const QString basePath = RemotePath::normalize(result.value.basePath);
        if (exact && !RemotePath::isRoot(path) && basePath != path) {
            LOG_VERBOSE() << "FTP: Listing strategy" << name << "reached" << basePath
                          << "instead of" << path;
            failures.append(QObject::tr("%1: listed %2 instead").arg(name, basePath));
            tryStrategy(session, path, exact, index + 1, failures, done);
            return;
        }
        LOG_VERBOSE() << "FTP: Listed" << path << "using" << name
                      << "(" << result.value.entries.size() << "entries)";
        done(FtpResult<QList<RemoteEntry>>::success(result.value.entries));
    });
}

} // namespace

struct DirectoryLister::TreeLevel {
    std::vector<RemoteTreeNode> nodes;
    std::size_t next = 0;
};

DirectoryLister::DirectoryLister(ConnectionManager *connection, QObject *parent)
    : QObject(parent)
    , connection_(connection)
{
}

const std::vector<DirectoryLister::Strategy> &DirectoryLister::strategies()
{
    static const std::vector<Strategy> list = {
        {QStringLiteral("direct"), &DirectoryLister::listDirect},
        {QStringLiteral("cd-then-list"), &DirectoryLister::listAfterCd},
        {QStringLiteral("segment-walk"), &DirectoryLister::listBySegments},
    };
    return list;
}

QList<RemoteEntry> DirectoryLister::toRemoteEntries(const QList<FtpEntry> &entries,
                                                    const QString &basePath)
{
    QList<RemoteEntry> result;
    result.reserve(entries.size());
    for (const FtpEntry &item : entries) {
        RemoteEntry entry;
        entry.name = item.name;
        entry.path = RemotePath::join(basePath, item.name);
        entry.kind = item.isDirectory ? RemoteEntryKind::Directory : RemoteEntryKind::File;
        entry.size = item.size;
        entry.modifiedAt = item.modified;
        entry.permissions = item.permissions;
        result.append(entry);
    }
    return result;
}

// Strategies

void DirectoryLister::listDirect(IFtpSession *session, const QString &path, ListingCallback done)
{
    const bool root = RemotePath::isRoot(path);
    QPointer<IFtpSession> guarded(session);

    session->list(root ? QString() : path, [guarded, root, path, done](const FtpResult<QList<FtpEntry>> &result) {
        if (!result.ok()) {
            done(FtpResult<Listing>::failure(result.error));
            return;
        }
        if (!root) {
            done(listed(result.value, path));
            return;
        }
        if (!guarded) {
            done(FtpResult<Listing>::failure(sessionLost()));
            return;
        }
        // Root lists the working directory, which may be a default path
        const QList<FtpEntry> entries = result.value;
        pwdOr(guarded.data(), QStringLiteral("/"), [entries, done](const QString &basePath) {
            done(listed(entries, basePath));
        });
    });
}

void DirectoryLister::listAfterCd(IFtpSession *session, const QString &path, ListingCallback done)
{
    QPointer<IFtpSession> guarded(session);

    auto listHere = [guarded, path, done]() {
        if (!guarded) {
            done(FtpResult<Listing>::failure(sessionLost()));
            return;
        }
        guarded->list(QString(), [guarded, path, done](const FtpResult<QList<FtpEntry>> &result) {
            if (!result.ok()) {
                done(FtpResult<Listing>::failure(result.error));
                return;
            }
            if (!guarded) {
                done(FtpResult<Listing>::failure(sessionLost()));
                return;
            }
            const QList<FtpEntry> entries = result.value;
            pwdOr(guarded.data(), path, [entries, done](const QString &basePath) {
                done(listed(entries, basePath));
            });
        });
    };

    if (RemotePath::isRoot(path)) {
        listHere();
        return;
    }
    session->cd(path, [listHere, done](const FtpError &error) {
        if (error.isError()) {
            done(FtpResult<Listing>::failure(error));
            return;
        }
        listHere();
    });
}

void DirectoryLister::listBySegments(IFtpSession *session, const QString &path, ListingCallback done)
{
    QPointer<IFtpSession> guarded(session);

    pwdOr(session, QStringLiteral("/"), [guarded, path, done](const QString &before) {
        walkSegments(guarded, RemotePath::segments(path), 0, [guarded, before, done]() {
            if (!guarded) {
                done(FtpResult<Listing>::failure(sessionLost()));
                return;
            }
            guarded->list(QString(), [guarded, before, done](const FtpResult<QList<FtpEntry>> &result) {
                if (!result.ok()) {
                    done(FtpResult<Listing>::failure(result.error));
                    return;
                }
                if (!guarded) {
                    done(FtpResult<Listing>::failure(sessionLost()));
                    return;
                }
                const QList<FtpEntry> entries = result.value;
                pwdOr(guarded.data(), before, [entries, done](const QString &basePath) {
                    done(listed(entries, basePath));
                });
            });
        });
    });
}

// Public operations

void DirectoryLister::runStrategies(IFtpSession *session, const QString &path, bool exact,
                                    EntriesCallback done)
{
    tryStrategy(QPointer<IFtpSession>(session), RemotePath::normalize(path), exact, 0, QStringList(), done);
}

void DirectoryLister::listFiles(const QString &path, EntriesCallback done)
{
    const QString normalized = RemotePath::normalize(path);
    connection_->ensureConnected([this, normalized, done](const FtpError &error) {
        if (error.isError()) {
            done(FtpResult<QList<RemoteEntry>>::failure(error));
            return;
        }
        runStrategies(connection_->session(), normalized, false, done);
    });
}

void DirectoryLister::listFilesExact(const QString &path, EntriesCallback done)
{
    const QString normalized = RemotePath::normalize(path);
    connection_->ensureConnected([this, normalized, done](const FtpError &error) {
        if (error.isError()) {
            done(FtpResult<QList<RemoteEntry>>::failure(error));
            return;
        }
        runStrategies(connection_->session(), normalized, true, done);
    });
}

void DirectoryLister::listFilesReadonly(const QString &path, EntriesCallback done)
{
    const QString normalized = RemotePath::normalize(path);
    connection_->ensureConnected([this, normalized, done](const FtpError &error) {
        if (error.isError()) {
            done(FtpResult<QList<RemoteEntry>>::failure(error));
            return;
        }
        IFtpSession *session = connection_->session();
        WorkingDirectoryGuard::capture(session,
                                       [this, session, normalized, done](const WorkingDirectoryGuard::Ptr &guard,
                                                                         const FtpError &pwdError) {
            if (!guard) {
                // Nothing to restore to; list anyway
                qWarning() << "FTP: Cannot capture working directory before listing" << normalized
                           << ":" << pwdError.message;
                if (pwdError.kind == FtpErrorKind::Connection) {
                    done(FtpResult<QList<RemoteEntry>>::failure(pwdError));
                    return;
                }
            }
            runStrategies(session, normalized, false, [guard, normalized, done](const FtpResult<QList<RemoteEntry>> &result) {
                QList<RemoteEntry> entries;
                if (result.ok()) {
                    entries = result.value;
                } else {
                    qWarning() << "FTP: Read-only listing of" << normalized << "failed:" << result.error.message;
                }
                if (!guard) {
                    done(FtpResult<QList<RemoteEntry>>::success(entries));
                    return;
                }
                guard->restore([entries, done, guard](const FtpError &restoreError) {
                    if (restoreError.isError()) {
                        qWarning() << "FTP: Could not restore working directory" << guard->directory()
                                   << ":" << restoreError.message;
                    }
                    done(FtpResult<QList<RemoteEntry>>::success(entries));
                });
            });
        });
    });
}

void DirectoryLister::listAll(const QString &path, TreeCallback done)
{
    const QString normalized = RemotePath::normalize(path);
    connection_->ensureConnected([this, normalized, done](const FtpError &error) {
        if (error.isError()) {
            done(FtpResult<std::vector<RemoteTreeNode>>::failure(error));
            return;
        }
        IFtpSession *session = connection_->session();
        WorkingDirectoryGuard::capture(session,
                                       [this, session, normalized, done](const WorkingDirectoryGuard::Ptr &guard,
                                                                         const FtpError &pwdError) {
            if (!guard) {
                done(FtpResult<std::vector<RemoteTreeNode>>::failure(pwdError));
                return;
            }
            buildTree(session, normalized, [guard, done](const FtpResult<std::vector<RemoteTreeNode>> &result) {
                guard->restore([guard, result, done](const FtpError &restoreError) {
                    if (restoreError.isError()) {
                        qWarning() << "FTP: Could not restore working directory" << guard->directory()
                                   << ":" << restoreError.message;
                    }
                    done(result);
                });
            });
        });
    });
}

void DirectoryLister::buildTree(IFtpSession *session, const QString &path, TreeCallback done)
{
    QPointer<IFtpSession> guarded(session);
    runStrategies(session, path, true, [this, guarded, done](const FtpResult<QList<RemoteEntry>> &result) {
        if (!result.ok()) {
            done(FtpResult<std::vector<RemoteTreeNode>>::failure(result.error));
            return;
        }
        auto level = std::make_shared<TreeLevel>();
        level->nodes.reserve(static_cast<std::size_t>(result.value.size()));
        for (const RemoteEntry &entry : result.value) {
            level->nodes.push_back(RemoteTreeNode{entry, {}});
        }
        fillChildren(guarded.data(), level, done);
    });
}

void DirectoryLister::fillChildren(IFtpSession *session, const std::shared_ptr<TreeLevel> &level,
                                   TreeCallback done)
{
    while (level->next < level->nodes.size() && !level->nodes[level->next].entry.isDirectory()) {
        ++level->next;
    }
    if (level->next >= level->nodes.size()) {
        done(FtpResult<std::vector<RemoteTreeNode>>::success(std::move(level->nodes)));
        return;
    }
    if (!session || session->isClosed()) {
        done(FtpResult<std::vector<RemoteTreeNode>>::failure(sessionLost()));
        return;
    }

    const std::size_t index = level->next;
    const QString childPath = level->nodes[index].entry.path;
    QPointer<IFtpSession> guarded(session);
    buildTree(session, childPath, [this, guarded, level, index, childPath, done](
                                      const FtpResult<std::vector<RemoteTreeNode>> &result) {
        if (result.ok()) {
            level->nodes[index].children = result.value;
        } else {
            qWarning() << "FTP: Cannot list" << childPath << ":" << result.error.message;
        }
        level->next = index + 1;
        fillChildren(guarded.data(), level, done);
    });
}
