/**
 * @file workingdirectoryguard.h
 * @brief Scoped restore of the session's working directory.
 */

#ifndef WORKINGDIRECTORYGUARD_H
#define WORKINGDIRECTORYGUARD_H

#include <QPointer>
#include <QString>

#include <memory>

#include "iftpsession.h"

/**
 * @brief Restores a captured working directory on every exit path.
 *
 * Operations that move the cursor with CWD and promise to leave it where
 * they found it capture it first with WorkingDirectoryGuard::capture().
 * On the normal path they call restore() and continue from its callback.
 * If the guard is destroyed without restore() having been called (an early
 * return or a dropped callback chain), the destructor issues the CWD anyway
 * and does not wait for it.
 *
 * Guards are shared between the callbacks of one operation, so they are
 * handed out as std::shared_ptr.
 */
class WorkingDirectoryGuard
{
public:
    using Ptr = std::shared_ptr<WorkingDirectoryGuard>;

    /**
     * @brief Queries PWD and creates a guard for the answer.
     *
     * @p done receives nullptr (and the error) if PWD failed.
     */
    static void capture(IFtpSession *session,
                        std::function<void(const Ptr &guard, const FtpError &error)> done);

    WorkingDirectoryGuard(IFtpSession *session, const QString &directory);
    ~WorkingDirectoryGuard();

    WorkingDirectoryGuard(const WorkingDirectoryGuard &) = delete;
    WorkingDirectoryGuard &operator=(const WorkingDirectoryGuard &) = delete;

    [[nodiscard]] QString directory() const { return directory_; }

    /**
     * @brief Changes back to the captured directory.
     *
     * Safe to call more than once; only the first call issues CWD.
     */
    void restore(StatusCallback done);

    /// @brief Marks the cursor as already restored; the destructor does nothing
    void dismiss() { restored_ = true; }

private:
    QPointer<IFtpSession> session_;
    QString directory_;
    bool restored_ = false;
};

#endif // WORKINGDIRECTORYGUARD_H
