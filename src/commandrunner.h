/**
 * @file commandrunner.h
 * @brief Executes one command-line request against a RemoteFileService.
 */

#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QObject>
#include <QStringList>
#include <QTextStream>

#include "services/connectionconfig.h"
#include "services/ftperror.h"
#include "services/ignorerules.h"
#include "services/remoteentry.h"

class ErrorHandler;
class RemoteFileService;

/**
 * @brief Connects, runs a single command, prints its result and disconnects.
 *
 * Commands: ls, lsro, tree, get, put, mkdir, rm, rmdir, mv, size, exists,
 * sync. finished() carries the process exit code: 0 on success, 1 when
 * the operation failed and 2 for a usage error.
 */
class CommandRunner : public QObject
{
    Q_OBJECT

public:
    static constexpr int ExitSuccess = 0;
    static constexpr int ExitFailure = 1;
    static constexpr int ExitUsage = 2;

    /**
     * @brief Everything a run needs besides the service.
     */
    struct Request {
        ConnectionConfig config;
        QString command;
        QStringList arguments;
        IgnoreRuleSet ignoreRules;
        QString syncFolder;
        QString syncRemoteRoot = QStringLiteral("/");
    };

    CommandRunner(RemoteFileService *service, ErrorHandler *errors, QObject *parent = nullptr);

    /// @brief Names accepted as command
    [[nodiscard]] static QStringList commands();

    /// @brief Usage text for the positional arguments
    [[nodiscard]] static QString usage();

    /**
     * @brief Starts the run; finished() is emitted exactly once.
     */
    void start(const Request &request);

signals:
    void finished(int exitCode);

private:
    void runCommand();
    void complete(int exitCode);
    void fail(const QString &operation, const FtpError &error);
    void printEntries(const QList<RemoteEntry> &entries);
    void printTree(const std::vector<RemoteTreeNode> &nodes, int depth);
    [[nodiscard]] bool requireArguments(int count);

    RemoteFileService *service_ = nullptr;
    ErrorHandler *errors_ = nullptr;
    Request request_;
    bool finished_ = false;
    QTextStream out_;
};

#endif // COMMANDRUNNER_H
