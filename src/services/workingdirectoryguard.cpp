#include "workingdirectoryguard.h"

#include "utils/logging.h"

#include <QDebug>

void WorkingDirectoryGuard::capture(IFtpSession *session,
                                    std::function<void(const Ptr &, const FtpError &)> done)
{
    if (!session) {
        done(nullptr, FtpError::make(FtpErrorKind::Connection, QObject::tr("Not connected to FTP server")));
        return;
    }
    QPointer<IFtpSession> guarded(session);
    session->pwd([guarded, done](const FtpResult<QString> &result) {
        if (!result.ok() || !guarded) {
            done(nullptr, result.ok()
                              ? FtpError::make(FtpErrorKind::Connection,
                                               QObject::tr("Session closed while querying directory"))
                              : result.error);
            return;
        }
        done(std::make_shared<WorkingDirectoryGuard>(guarded.data(), result.value), FtpError::none());
    });
}

WorkingDirectoryGuard::WorkingDirectoryGuard(IFtpSession *session, const QString &directory)
    : session_(session)
    , directory_(directory)
{
}

WorkingDirectoryGuard::~WorkingDirectoryGuard()
{
    if (restored_ || !session_ || session_->isClosed()) {
        return;
    }
    restored_ = true;
    LOG_VERBOSE() << "FTP: Restoring working directory to" << directory_ << "(unwinding)";
    const QString directory = directory_;
    session_->cd(directory, [directory](const FtpError &error) {
        if (error.isError()) {
            qWarning() << "FTP: Failed to restore working directory" << directory
                       << ":" << error.message;
        }
    });
}

void WorkingDirectoryGuard::restore(StatusCallback done)
{
    if (restored_) {
        if (done) {
            done(FtpError::none());
        }
        return;
    }
    restored_ = true;

    if (!session_ || session_->isClosed()) {
        if (done) {
            done(FtpError::make(FtpErrorKind::Connection,
                                QObject::tr("Cannot restore working directory: not connected")));
        }
        return;
    }

    LOG_VERBOSE() << "FTP: Restoring working directory to" << directory_;
    session_->cd(directory_, [done](const FtpError &error) {
        if (done) {
            done(error);
        }
    });
}
