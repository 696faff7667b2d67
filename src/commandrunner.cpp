#include "commandrunner.h"

#include "services/errorhandler.h"
#include "services/remotefileservice.h"
#include "utils/logging.h"

#include <QDebug>

CommandRunner::CommandRunner(RemoteFileService *service, ErrorHandler *errors, QObject *parent)
    : QObject(parent)
    , service_(service)
    , errors_(errors)
    , out_(stdout)
{
}

QStringList CommandRunner::commands()
{
    return {QStringLiteral("ls"), QStringLiteral("lsro"), QStringLiteral("tree"),
            QStringLiteral("get"), QStringLiteral("put"), QStringLiteral("mkdir"),
            QStringLiteral("rm"), QStringLiteral("rmdir"), QStringLiteral("mv"),
            QStringLiteral("size"), QStringLiteral("exists"), QStringLiteral("sync")};
}

QString CommandRunner::usage()
{
    return QStringLiteral(
        "Commands:\n"
        "  ls [path]                  List a directory\n"
        "  lsro [path]                List without moving the working directory\n"
        "  tree [path]                List recursively\n"
        "  get <remote> [local]       Download (prints content without local)\n"
        "  put <source> <remote>      Upload a local file, data: URL or text\n"
        "  mkdir <remote>             Create a directory and its parents\n"
        "  rm <remote>                Delete a file\n"
        "  rmdir <remote>             Delete a directory and its contents\n"
        "  mv <from> <to>             Rename or move\n"
        "  size <remote>              Print the size in bytes\n"
        "  exists <remote>            Print file, directory or missing\n"
        "  sync [remote] [local]      Mirror into a new timestamped folder\n");
}

void CommandRunner::start(const Request &request)
{
    request_ = request;

    if (!commands().contains(request_.command)) {
        errors_->handleValidationError(tr("Unknown command '%1'").arg(request_.command));
        complete(ExitUsage);
        return;
    }
    if (!request_.config.isValid()) {
        errors_->handleValidationError(tr("No host given (use --host or --profile)"));
        complete(ExitUsage);
        return;
    }

    service_->connectToServer(request_.config, [this](const FtpError &error) {
        if (error.isError()) {
            errors_->handleFtpError(tr("Connect"), error);
            complete(ExitFailure);
            return;
        }
        runCommand();
    });
}

bool CommandRunner::requireArguments(int count)
{
    if (request_.arguments.size() >= count) {
        return true;
    }
    errors_->handleValidationError(tr("'%1' needs %n argument(s)", nullptr, count).arg(request_.command));
    out_ << usage();
    out_.flush();
    complete(ExitUsage);
    return false;
}

void CommandRunner::runCommand()
{
    const QString &command = request_.command;
    const QStringList &args = request_.arguments;
    const QString firstOrRoot = args.value(0, QStringLiteral("/"));

    auto statusDone = [this](const QString &operation) {
        return [this, operation](const FtpError &error) {
            if (error.isError()) {
                fail(operation, error);
                return;
            }
            complete(ExitSuccess);
        };
    };

    if (command == QLatin1String("ls") || command == QLatin1String("lsro")) {
        auto listed = [this](const FtpResult<QList<RemoteEntry>> &result) {
            if (!result.ok()) {
                fail(tr("List"), result.error);
                return;
            }
            printEntries(result.value);
            complete(ExitSuccess);
        };
        if (command == QLatin1String("ls")) {
            service_->listFiles(firstOrRoot, listed);
        } else {
            service_->listFilesReadonly(firstOrRoot, listed);
        }
    } else if (command == QLatin1String("tree")) {
        service_->listAll(firstOrRoot, [this](const FtpResult<std::vector<RemoteTreeNode>> &result) {
            if (!result.ok()) {
                fail(tr("List"), result.error);
                return;
            }
            printTree(result.value, 0);
            complete(ExitSuccess);
        });
    } else if (command == QLatin1String("get")) {
        if (!requireArguments(1)) {
            return;
        }
        const bool toFile = args.size() > 1;
        service_->downloadFile(args.at(0), args.value(1), [this, toFile](const FtpResult<QString> &result) {
            if (!result.ok()) {
                fail(tr("Download"), result.error);
                return;
            }
            if (!toFile) {
                out_ << result.value;
                out_.flush();
            }
            complete(ExitSuccess);
        });
    } else if (command == QLatin1String("put")) {
        if (!requireArguments(2)) {
            return;
        }
        service_->uploadFile(args.at(0), args.at(1), statusDone(tr("Upload")));
    } else if (command == QLatin1String("mkdir")) {
        if (!requireArguments(1)) {
            return;
        }
        service_->createDirectory(args.at(0), statusDone(tr("Create directory")));
    } else if (command == QLatin1String("rm")) {
        if (!requireArguments(1)) {
            return;
        }
        service_->deleteFile(args.at(0), statusDone(tr("Delete")));
    } else if (command == QLatin1String("rmdir")) {
        if (!requireArguments(1)) {
            return;
        }
        service_->deleteDirectory(args.at(0), statusDone(tr("Delete directory")));
    } else if (command == QLatin1String("mv")) {
        if (!requireArguments(2)) {
            return;
        }
        service_->rename(args.at(0), args.at(1), statusDone(tr("Rename")));
    } else if (command == QLatin1String("size")) {
        if (!requireArguments(1)) {
            return;
        }
        service_->getFileSize(args.at(0), [this](const FtpResult<qint64> &result) {
            if (!result.ok()) {
                fail(tr("Size"), result.error);
                return;
            }
            out_ << result.value << Qt::endl;
            complete(ExitSuccess);
        });
    } else if (command == QLatin1String("exists")) {
        if (!requireArguments(1)) {
            return;
        }
        service_->exists(args.at(0), [this](const FtpResult<ExistsResult> &result) {
            if (!result.ok()) {
                fail(tr("Exists"), result.error);
                return;
            }
            if (!result.value.exists) {
                out_ << "missing" << Qt::endl;
            } else {
                out_ << (result.value.kind == RemoteEntryKind::Directory ? "directory" : "file") << Qt::endl;
            }
            complete(ExitSuccess);
        });
    } else if (command == QLatin1String("sync")) {
        const QString remoteRoot = args.value(0, request_.syncRemoteRoot);
        const QString localRoot = args.value(1, request_.syncFolder);
        service_->syncToLocal(
            remoteRoot, localRoot, request_.ignoreRules,
            [](int count) { LOG_VERBOSE() << "Sync:" << count << "files"; },
            [this](const FtpResult<SyncResult> &result) {
                if (!result.ok()) {
                    fail(tr("Sync"), result.error);
                    return;
                }
                out_ << result.value.filesSynced << " files -> " << result.value.root << Qt::endl;
                complete(ExitSuccess);
            });
    }
}

void CommandRunner::printEntries(const QList<RemoteEntry> &entries)
{
    for (const RemoteEntry &entry : entries) {
        out_ << (entry.isDirectory() ? 'd' : '-')
             << (entry.permissions.isEmpty() ? QStringLiteral("---------") : entry.permissions)
             << ' ' << QString::number(entry.size).rightJustified(10)
             << ' ' << entry.path << Qt::endl;
    }
}

void CommandRunner::printTree(const std::vector<RemoteTreeNode> &nodes, int depth)
{
    for (const RemoteTreeNode &node : nodes) {
        out_ << QString(depth * 2, QLatin1Char(' ')) << node.entry.name
             << (node.entry.isDirectory() ? "/" : "") << Qt::endl;
        printTree(node.children, depth + 1);
    }
}

void CommandRunner::fail(const QString &operation, const FtpError &error)
{
    errors_->handleFtpError(operation, error);
    complete(ExitFailure);
}

void CommandRunner::complete(int exitCode)
{
    if (finished_) {
        return;
    }
    finished_ = true;
    out_.flush();

    if (!service_->isConnected()) {
        emit finished(exitCode);
        return;
    }
    service_->disconnectFromServer([this, exitCode](const FtpError &) { emit finished(exitCode); });
}
