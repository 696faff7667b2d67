#include "transferexecutor.h"

#include "remotepath.h"
#include "utils/logging.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QPointer>
#include <QRandomGenerator>

namespace {

FtpError sessionLost()
{
    return FtpError::make(FtpErrorKind::Connection, QObject::tr("FTP session closed during transfer"));
}

// MKD every prefix of the path in turn; existing directories just fail
void makePrefixes(QPointer<IFtpSession> session, const QStringList &prefixes, int index,
                  std::function<void()> next)
{
    if (!session || index >= prefixes.size()) {
        next();
        return;
    }
    session->makeDirectory(prefixes.at(index), [session, prefixes, index, next](const FtpError &error) {
        if (error.isError()) {
            LOG_VERBOSE() << "FTP: MKD" << prefixes.at(index) << "ignored:" << error.message;
        }
        makePrefixes(session, prefixes, index + 1, next);
    });
}

// Restores the guard (if any) and reports @p result afterwards
void restoreThen(const WorkingDirectoryGuard::Ptr &guard, const FtpError &result, StatusCallback done)
{
    if (!guard) {
        done(result);
        return;
    }
    guard->restore([guard, result, done](const FtpError &restoreError) {
        if (restoreError.isError()) {
            qWarning() << "FTP: Could not restore working directory" << guard->directory()
                       << ":" << restoreError.message;
        }
        done(result);
    });
}

} // namespace

TransferExecutor::TransferExecutor(ConnectionManager *connection, QObject *parent)
    : QObject(parent)
    , connection_(connection)
    , tempDir_(QDir::tempPath())
{
}

QString TransferExecutor::temporaryFilePath(const QString &directory)
{
    const QString name = QStringLiteral("ftp-%1-%2.tmp")
                             .arg(QDateTime::currentMSecsSinceEpoch())
                             .arg(QRandomGenerator::global()->generate64(), 0, 16);
    return QDir(directory).filePath(name);
}

FtpResult<QByteArray> TransferExecutor::loadUploadSource(const QString &source)
{
    const QFileInfo info(source);
    if (!source.isEmpty() && info.exists() && info.isFile()) {
        QFile file(source);
        if (!file.open(QIODevice::ReadOnly)) {
            return FtpResult<QByteArray>::failure(
                FtpError::make(FtpErrorKind::Filesystem,
                               tr("Cannot read local file '%1': %2").arg(source, file.errorString())));
        }
        return FtpResult<QByteArray>::success(file.readAll());
    }

    static const QLatin1String base64Marker(";base64,");
    if (source.startsWith(QLatin1String("data:"))) {
        const int marker = source.indexOf(base64Marker);
        if (marker > 0) {
            const QByteArray encoded = source.mid(marker + base64Marker.size()).toLatin1();
            auto decoded = QByteArray::fromBase64Encoding(encoded);
            if (!decoded) {
                return FtpResult<QByteArray>::failure(
                    FtpError::make(FtpErrorKind::Filesystem, tr("Invalid base64 content in data URL")));
            }
            return FtpResult<QByteArray>::success(*decoded);
        }
    }

    return FtpResult<QByteArray>::success(source.toUtf8());
}

// Retry policy

void TransferExecutor::runWithRetry(const QString &operation, const Attempt &attempt,
                                    StatusCallback done)
{
    connection_->ensureConnected([this, operation, attempt, done](const FtpError &error) {
        if (error.isError()) {
            done(error);
            return;
        }
        attempt([this, operation, attempt, done](const FtpError &firstError) {
            if (!firstError.isError()) {
                done(FtpError::none());
                return;
            }
            if (firstError.kind == FtpErrorKind::Filesystem) {
                // Local problems don't get better by reconnecting
                done(firstError);
                return;
            }
            qWarning() << "FTP:" << operation << "failed, reconnecting and retrying once:"
                       << firstError.message;
            connection_->ensureConnected([operation, attempt, done](const FtpError &reconnectError) {
                if (reconnectError.isError()) {
                    done(reconnectError);
                    return;
                }
                attempt([operation, done](const FtpError &secondError) {
                    if (!secondError.isError() || secondError.kind == FtpErrorKind::Filesystem) {
                        done(secondError);
                        return;
                    }
                    done(secondError.wrapped(FtpErrorKind::Transfer,
                                             tr("Failed to %1: ").arg(operation)));
                });
            });
        });
    });
}

// Download

void TransferExecutor::fetch(const QString &remotePath, const QString &localPath, StatusCallback done)
{
    IFtpSession *session = connection_->session();
    if (!session) {
        done(sessionLost());
        return;
    }
    QPointer<IFtpSession> guarded(session);

    session->downloadTo(localPath, remotePath, [guarded, remotePath, localPath, done](const FtpError &error) {
        if (!error.isError() || error.kind == FtpErrorKind::Filesystem) {
            done(error);
            return;
        }
        if (!guarded || guarded->isClosed()) {
            done(error);
            return;
        }

        // Some servers only accept a bare file name in RETR
        LOG_VERBOSE() << "FTP: Direct RETR of" << remotePath << "failed, retrying from parent directory";
        WorkingDirectoryGuard::capture(guarded.data(), [guarded, remotePath, localPath, done](
                                                           const WorkingDirectoryGuard::Ptr &guard,
                                                           const FtpError &pwdError) {
            if (!guarded) {
                done(sessionLost());
                return;
            }
            if (!guard) {
                qWarning() << "FTP: Cannot capture working directory:" << pwdError.message;
            }
            const QString dir = RemotePath::parent(remotePath);
            const QString base = RemotePath::fileName(remotePath);

            auto retrieve = [guarded, guard, base, localPath, done]() {
                if (!guarded) {
                    done(sessionLost());
                    return;
                }
                guarded->downloadTo(localPath, base, [guard, done](const FtpError &fallbackError) {
                    restoreThen(guard, fallbackError, done);
                });
            };

            if (RemotePath::isRoot(dir)) {
                retrieve();
                return;
            }
            guarded->cd(dir, [dir, retrieve](const FtpError &cdError) {
                if (cdError.isError()) {
                    LOG_VERBOSE() << "FTP: Cannot enter" << dir << ":" << cdError.message;
                }
                retrieve();
            });
        });
    });
}

void TransferExecutor::downloadToFile(const QString &remotePath, const QString &localPath,
                                      StatusCallback done)
{
    const QString remote = RemotePath::normalize(remotePath);
    runWithRetry(tr("download file"),
                 [this, remote, localPath](StatusCallback attemptDone) { fetch(remote, localPath, attemptDone); },
                 done);
}

void TransferExecutor::downloadFile(const QString &remotePath, const QString &localPath,
                                    ResultCallback<QString> done)
{
    const bool temporary = localPath.isEmpty();
    const QString target = temporary ? temporaryFilePath(tempDir_) : localPath;

    downloadToFile(remotePath, target, [temporary, target, done](const FtpError &error) {
        if (error.isError()) {
            if (temporary) {
                QFile::remove(target);
            }
            done(FtpResult<QString>::failure(error));
            return;
        }

        QFile file(target);
        if (!file.open(QIODevice::ReadOnly)) {
            const FtpError readError = FtpError::make(
                FtpErrorKind::Filesystem,
                tr("Cannot read downloaded file '%1': %2").arg(target, file.errorString()));
            if (temporary) {
                QFile::remove(target);
            }
            done(FtpResult<QString>::failure(readError));
            return;
        }
        const QString content = QString::fromUtf8(file.readAll());
        file.close();

        if (temporary && !QFile::remove(target)) {
            qWarning() << "FTP: Could not remove temporary file" << target;
        }
        done(FtpResult<QString>::success(content));
    });
}

// Upload

void TransferExecutor::makeDirectories(IFtpSession *session, const QString &remotePath,
                                       const std::function<void()> &next)
{
    QStringList prefixes;
    QString current;
    for (const QString &segment : RemotePath::segments(remotePath)) {
        current += QLatin1Char('/') + segment;
        prefixes.append(current);
    }
    makePrefixes(QPointer<IFtpSession>(session), prefixes, 0, next);
}

void TransferExecutor::store(const QByteArray &data, const QString &remotePath, StatusCallback done)
{
    IFtpSession *session = connection_->session();
    if (!session) {
        done(sessionLost());
        return;
    }
    QPointer<IFtpSession> guarded(session);
    const QString dir = RemotePath::parent(remotePath);
    const QString base = RemotePath::fileName(remotePath);

    WorkingDirectoryGuard::capture(session, [guarded, dir, base, data, done](
                                                const WorkingDirectoryGuard::Ptr &guard,
                                                const FtpError &pwdError) {
        if (!guarded) {
            done(sessionLost());
            return;
        }
        if (!guard) {
            qWarning() << "FTP: Cannot capture working directory:" << pwdError.message;
        }
        makeDirectories(guarded.data(), dir, [guarded, guard, dir, base, data, done]() {
            if (!guarded) {
                done(sessionLost());
                return;
            }
            guarded->cd(dir, [guarded, guard, dir, base, data, done](const FtpError &cdError) {
                if (cdError.isError()) {
                    restoreThen(guard, cdError, done);
                    return;
                }
                if (!guarded) {
                    done(sessionLost());
                    return;
                }
                guarded->upload(data, base, [guard, done](const FtpError &uploadError) {
                    restoreThen(guard, uploadError, done);
                });
            });
        });
    });
}

void TransferExecutor::uploadFile(const QString &source, const QString &remotePath, StatusCallback done)
{
    const FtpResult<QByteArray> content = loadUploadSource(source);
    if (!content.ok()) {
        done(content.error);
        return;
    }
    const QByteArray data = content.value;
    const QString remote = RemotePath::normalize(remotePath);
    LOG_VERBOSE() << "FTP: Uploading" << data.size() << "bytes to" << remote;

    runWithRetry(tr("upload file"),
                 [this, data, remote](StatusCallback attemptDone) { store(data, remote, attemptDone); },
                 done);
}

// Directories

void TransferExecutor::createDirectory(const QString &remotePath, StatusCallback done)
{
    const QString remote = RemotePath::normalize(remotePath);
    connection_->ensureConnected([this, remote, done](const FtpError &error) {
        if (error.isError()) {
            done(error);
            return;
        }
        IFtpSession *session = connection_->session();
        QPointer<IFtpSession> guarded(session);
        WorkingDirectoryGuard::capture(session, [guarded, remote, done](const WorkingDirectoryGuard::Ptr &guard,
                                                                        const FtpError &pwdError) {
            if (!guarded) {
                done(sessionLost());
                return;
            }
            if (!guard) {
                qWarning() << "FTP: Cannot capture working directory:" << pwdError.message;
            }
            makeDirectories(guarded.data(), remote, [guarded, guard, remote, done]() {
                if (!guarded) {
                    done(sessionLost());
                    return;
                }
                // The directory exists if we can enter it
                guarded->cd(remote, [guard, remote, done](const FtpError &cdError) {
                    const FtpError result = cdError.isError()
                        ? cdError.wrapped(FtpErrorKind::Command, tr("Failed to create directory: "))
                        : FtpError::none();
                    restoreThen(guard, result, done);
                });
            });
        });
    });
}
