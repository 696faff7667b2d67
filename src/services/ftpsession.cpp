#include "ftpsession.h"

#include "utils/logging.h"

#include <QDebug>
#include <QRegularExpression>

namespace {

bool isPositiveCompletion(int code)
{
    return code >= 200 && code < 300;
}

bool isPreliminary(int code)
{
    return code >= 100 && code < 200;
}

FtpError commandError(const QString &message)
{
    return FtpError::make(FtpErrorKind::Command, message);
}

} // namespace

FtpSession::FtpSession(QObject *parent)
    : IFtpSession(parent)
    , controlSocket_(new QSslSocket(this))
    , dataSocket_(new QSslSocket(this))
    , commandTimer_(new QTimer(this))
{
    commandTimer_->setSingleShot(true);
    connect(commandTimer_, &QTimer::timeout,
            this, &FtpSession::onCommandTimeout);

    connect(controlSocket_, &QSslSocket::connected,
            this, &FtpSession::onControlConnected);
    connect(controlSocket_, &QSslSocket::encrypted,
            this, &FtpSession::onControlEncrypted);
    connect(controlSocket_, &QSslSocket::disconnected,
            this, &FtpSession::onControlDisconnected);
    connect(controlSocket_, &QSslSocket::readyRead,
            this, &FtpSession::onControlReadyRead);
    connect(controlSocket_, &QSslSocket::errorOccurred,
            this, &FtpSession::onControlError);

    connect(dataSocket_, &QSslSocket::connected,
            this, &FtpSession::onDataConnected);
    connect(dataSocket_, &QSslSocket::encrypted,
            this, &FtpSession::onDataEncrypted);
    connect(dataSocket_, &QSslSocket::readyRead,
            this, &FtpSession::onDataReadyRead);
    connect(dataSocket_, &QSslSocket::disconnected,
            this, &FtpSession::onDataDisconnected);
    connect(dataSocket_, &QSslSocket::errorOccurred,
            this, &FtpSession::onDataError);
}

FtpSession::~FtpSession()
{
    // Socket signals must not reach a half-destroyed object
    controlSocket_->disconnect(this);
    dataSocket_->disconnect(this);

    if (transfer_ && transfer_->file) {
        transfer_->file->close();
    }
    for (const PendingCommand &pending : std::as_const(commandQueue_)) {
        if (pending.request && pending.request->file) {
            pending.request->file->close();
        }
    }
    commandQueue_.clear();

    dataSocket_->abort();
    controlSocket_->abort();
}

void FtpSession::setState(State state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

// Lifecycle

void FtpSession::open(const ConnectionConfig &config, StatusCallback done)
{
    if (state_ != State::Disconnected) {
        qDebug() << "FTP: open called but state is" << static_cast<int>(state_);
        if (done) {
            done(FtpError::make(FtpErrorKind::Connection,
                                tr("Cannot connect: connection already in progress or established")));
        }
        return;
    }

    config_ = config;
    protectData_ = false;
    loggedIn_ = false;
    quitting_ = false;
    closed_ = false;
    currentDir_ = QStringLiteral("/");
    responseBuffer_.clear();

    openRequest_ = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });

    const bool verifyPeer = config_.secureOptions.value(QStringLiteral("rejectUnauthorized"), true).toBool();
    const auto verifyMode = verifyPeer ? QSslSocket::VerifyPeer : QSslSocket::VerifyNone;
    controlSocket_->setPeerVerifyMode(verifyMode);
    dataSocket_->setPeerVerifyMode(verifyMode);

    if (!config_.passive) {
        qWarning() << "FTP: Active mode requested but not supported, using passive mode";
    }

    qDebug() << "FTP: Connecting to" << config_.host << ":" << config_.port
             << (config_.secure ? "(explicit TLS)" : "");
    setState(State::Connecting);
    commandTimer_->start(CommandTimeoutMs);
    controlSocket_->connectToHost(config_.host, config_.port);
}

void FtpSession::close(StatusCallback done)
{
    if (closed_ || state_ == State::Disconnected) {
        closed_ = true;
        if (done) {
            done(FtpError::none());
        }
        return;
    }

    auto request = makeRequest([done](const FtpError &, const Request &) {
        // Closing never fails from the caller's point of view
        if (done) {
            done(FtpError::none());
        }
    });
    queueCommand(Command::Quit, QString(), request);
}

// Command pipeline

std::shared_ptr<FtpSession::Request> FtpSession::makeRequest(
    std::function<void(const FtpError &, const Request &)> complete)
{
    auto request = std::make_shared<Request>();
    request->complete = std::move(complete);
    return request;
}

bool FtpSession::rejectIfNotLoggedIn(const std::shared_ptr<Request> &request,
                                     const QString &operation)
{
    if (loggedIn_ && !closed_) {
        return false;
    }
    finishRequest(request, FtpError::make(FtpErrorKind::Connection,
                                          tr("Cannot %1: not connected to server").arg(operation)));
    return true;
}

void FtpSession::finishRequest(const std::shared_ptr<Request> &request, const FtpError &error)
{
    if (!request || request->finished) {
        return;
    }
    request->finished = true;

    if (request->file) {
        request->file->close();
        // Don't leave a truncated download behind
        if (error.isError() && error.kind != FtpErrorKind::Filesystem) {
            request->file->remove();
        }
    }

    if (error.isError()) {
        // Remaining commands of a failed request must not reach the server
        commandQueue_.removeIf([&request](const PendingCommand &pending) {
            return pending.request == request;
        });
    }

    if (request->complete) {
        auto complete = std::move(request->complete);
        request->complete = nullptr;
        complete(error, *request);
    }
}

void FtpSession::sendCommand(const QString &command)
{
    if (controlSocket_->state() != QAbstractSocket::ConnectedState) {
        qDebug() << "FTP: Cannot send command, socket not connected";
        return;
    }
    // Don't log password
    if (command.startsWith(QLatin1String("PASS "))) {
        LOG_VERBOSE() << "FTP: >>" << "PASS ****";
    } else {
        LOG_VERBOSE() << "FTP: >>" << command;
    }
    commandTimer_->start(CommandTimeoutMs);
    controlSocket_->write((command + QStringLiteral("\r\n")).toUtf8());
}

void FtpSession::queueCommand(Command cmd, const QString &arg,
                              const std::shared_ptr<Request> &request)
{
    PendingCommand pending;
    pending.cmd = cmd;
    pending.arg = arg;
    pending.request = request;
    commandQueue_.enqueue(pending);

    if (state_ == State::Ready) {
        processNextCommand();
    }
}

void FtpSession::processNextCommand()
{
    // Drop commands whose request already failed
    while (!commandQueue_.isEmpty() && commandQueue_.head().request
           && commandQueue_.head().request->finished) {
        commandQueue_.dequeue();
    }

    if (commandQueue_.isEmpty()) {
        currentCommand_ = Command::None;
        currentRequest_.reset();
        commandTimer_->stop();
        if (loggedIn_) {
            setState(State::Ready);
        }
        return;
    }

    setState(State::Busy);
    PendingCommand pending = commandQueue_.dequeue();
    currentCommand_ = pending.cmd;
    currentArg_ = pending.arg;
    currentRequest_ = pending.request;

    switch (currentCommand_) {
    case Command::AuthTls:
        sendCommand(QStringLiteral("AUTH TLS"));
        break;
    case Command::User:
        sendCommand(QStringLiteral("USER ")
                    + (config_.username.isEmpty() ? QStringLiteral("anonymous") : config_.username));
        break;
    case Command::Pass:
        sendCommand(QStringLiteral("PASS ") + config_.password);
        break;
    case Command::Pbsz:
        sendCommand(QStringLiteral("PBSZ 0"));
        break;
    case Command::Prot:
        sendCommand(QStringLiteral("PROT P"));
        break;
    case Command::Pwd:
        sendCommand(QStringLiteral("PWD"));
        break;
    case Command::Cwd:
        sendCommand(QStringLiteral("CWD ") + currentArg_);
        break;
    case Command::Type:
        sendCommand(QStringLiteral("TYPE ") + currentArg_);
        break;
    case Command::Pasv:
        sendCommand(QStringLiteral("PASV"));
        break;
    case Command::List:
        sendCommand(currentArg_.isEmpty() ? QStringLiteral("LIST")
                                          : QStringLiteral("LIST ") + currentArg_);
        break;
    case Command::Retr:
        sendCommand(QStringLiteral("RETR ") + currentArg_);
        break;
    case Command::Stor:
        sendCommand(QStringLiteral("STOR ") + currentArg_);
        break;
    case Command::Size:
        sendCommand(QStringLiteral("SIZE ") + currentArg_);
        break;
    case Command::Mkd:
        sendCommand(QStringLiteral("MKD ") + currentArg_);
        break;
    case Command::Rmd:
        sendCommand(QStringLiteral("RMD ") + currentArg_);
        break;
    case Command::Dele:
        sendCommand(QStringLiteral("DELE ") + currentArg_);
        break;
    case Command::RnFr:
        sendCommand(QStringLiteral("RNFR ") + currentArg_);
        break;
    case Command::RnTo:
        sendCommand(QStringLiteral("RNTO ") + currentArg_);
        break;
    case Command::Quit:
        quitting_ = true;
        sendCommand(QStringLiteral("QUIT"));
        break;
    case Command::None:
        processNextCommand();
        break;
    }
}

void FtpSession::failCurrent(const QString &message)
{
    auto request = currentRequest_;
    if (transfer_ && transfer_ == request) {
        if (dataSocket_->state() != QAbstractSocket::UnconnectedState) {
            dataSocket_->abort();
        }
        resetTransferState();
    }
    finishRequest(request, commandError(message));
    processNextCommand();
}

void FtpSession::failSession(const QString &message)
{
    const bool wasOpen = !closed_;
    closed_ = true;
    loggedIn_ = false;
    commandTimer_->stop();

    if (dataSocket_->state() != QAbstractSocket::UnconnectedState) {
        dataSocket_->abort();
    }
    resetTransferState();

    const FtpError error = FtpError::make(FtpErrorKind::Connection, message);

    // Collect first: callbacks may queue new commands (which are rejected)
    QList<std::shared_ptr<Request>> pending;
    if (openRequest_) {
        pending.append(openRequest_);
    }
    if (currentRequest_) {
        pending.append(currentRequest_);
    }
    for (const PendingCommand &command : std::as_const(commandQueue_)) {
        if (command.request && !pending.contains(command.request)) {
            pending.append(command.request);
        }
    }
    commandQueue_.clear();
    currentRequest_.reset();
    currentCommand_ = Command::None;
    openRequest_.reset();

    setState(State::Disconnected);

    for (const auto &request : std::as_const(pending)) {
        finishRequest(request, error);
    }

    if (wasOpen) {
        emit disconnected();
    }
}

// Control connection

void FtpSession::onControlConnected()
{
    qDebug() << "FTP: Control socket connected to" << controlSocket_->peerAddress().toString();
    setState(State::Connected);
}

void FtpSession::onControlEncrypted()
{
    qDebug() << "FTP: Control connection encrypted";
    processNextCommand();
}

void FtpSession::onControlDisconnected()
{
    qDebug() << "FTP: Control socket disconnected";
    if (quitting_) {
        closed_ = true;
        loggedIn_ = false;
        setState(State::Disconnected);
        emit disconnected();
        return;
    }
    failSession(tr("Connection closed by server"));
}

void FtpSession::onControlError(QAbstractSocket::SocketError socketError)
{
    qDebug() << "FTP: Control socket error:" << socketError << controlSocket_->errorString();
    if (quitting_ && socketError == QAbstractSocket::RemoteHostClosedError) {
        return;
    }
    failSession(controlSocket_->errorString());
}

void FtpSession::onCommandTimeout()
{
    qWarning() << "FTP: Command timed out after" << CommandTimeoutMs / 1000 << "seconds";
    failSession(tr("Command timed out after %1 seconds").arg(CommandTimeoutMs / 1000));
    controlSocket_->abort();
}

void FtpSession::onControlReadyRead()
{
    responseBuffer_ += QString::fromUtf8(controlSocket_->readAll());

    // FTP responses end with \r\n
    while (responseBuffer_.contains(QLatin1String("\r\n"))) {
        const int idx = responseBuffer_.indexOf(QLatin1String("\r\n"));
        const QString line = responseBuffer_.left(idx);
        responseBuffer_ = responseBuffer_.mid(idx + CrLfLength);

        // Parse response code (first 3 digits)
        if (line.length() < FtpReplyCodeLength) {
            continue;
        }
        bool ok = false;
        const int code = line.left(FtpReplyCodeLength).toInt(&ok);
        if (!ok) {
            continue;  // continuation line of a multi-line reply
        }
        if (line.length() > FtpReplyCodeLength && line[FtpReplyCodeLength] == '-') {
            continue;  // multi-line reply, wait for final line
        }
        handleResponse(code, line.mid(FtpReplyTextOffset));
        if (closed_) {
            return;
        }
    }
}

void FtpSession::handleResponse(int code, const QString &text)
{
    LOG_VERBOSE() << "FTP: <<" << code << text << "(state:" << static_cast<int>(state_) << ")";

    if (code == FtpReplyServiceClosing && currentCommand_ != Command::Quit) {
        failSession(tr("Server closed the session: %1").arg(text));
        controlSocket_->abort();
        return;
    }

    switch (state_) {
    case State::Connected:
        // Welcome message
        if (code == FtpReplyServiceReady) {
            setState(State::LoggingIn);
            if (config_.secure) {
                queueCommand(Command::AuthTls, QString(), openRequest_);
            }
            queueCommand(Command::User, QString(), openRequest_);
            processNextCommand();
        } else if (code >= FtpReplyErrorThreshold) {
            failSession(tr("Server refused connection: %1").arg(text));
            controlSocket_->abort();
        }
        break;

    case State::Busy:
        handleBusyResponse(code, text);
        break;

    default:
        break;
    }
}

void FtpSession::handleBusyResponse(int code, const QString &text)
{
    if (isTransferCommand(currentCommand_)) {
        handleTransferResponse(code, text);
        return;
    }

    if (isPreliminary(code)) {
        return;
    }

    auto request = currentRequest_;

    switch (currentCommand_) {
    case Command::AuthTls:
        if (code == FtpReplyAuthAccepted) {
            controlSocket_->startClientEncryption();
            // onControlEncrypted() continues with USER
            return;
        }
        failSession(tr("Server does not support TLS: %1").arg(text));
        controlSocket_->abort();
        return;

    case Command::User:
        if (code == FtpReplyPasswordRequired) {
            // Password must be the very next command
            commandQueue_.prepend(PendingCommand{Command::Pass, QString(), request});
        } else if (code == FtpReplyUserLoggedIn) {
            loggedIn_ = true;
        } else {
            failSession(tr("Login failed: server rejected username. %1").arg(text));
            controlSocket_->abort();
            return;
        }
        break;

    case Command::Pass:
        if (code == FtpReplyUserLoggedIn || isPositiveCompletion(code)) {
            loggedIn_ = true;
        } else {
            failSession(tr("Login failed: invalid password. %1").arg(text));
            controlSocket_->abort();
            return;
        }
        break;

    case Command::Pbsz:
        break;

    case Command::Prot:
        if (isPositiveCompletion(code)) {
            protectData_ = true;
        } else {
            qWarning() << "FTP: Server refused PROT P, data connections stay unencrypted:" << text;
        }
        break;

    case Command::Pwd:
        if (code == FtpReplyPathCreated) {
            const QString path = parsePwdResponse(text);
            if (!path.isEmpty()) {
                currentDir_ = path;
                request->text = path;
                break;
            }
        }
        failCurrent(tr("Cannot determine working directory: %1").arg(text));
        return;

    case Command::Cwd:
        if (!isPositiveCompletion(code)) {
            failCurrent(tr("Cannot access directory '%1': %2").arg(currentArg_, text));
            return;
        }
        if (currentArg_.startsWith('/')) {
            currentDir_ = currentArg_;
        }
        break;

    case Command::Type:
        if (!isPositiveCompletion(code)) {
            failCurrent(tr("Cannot set transfer type: %1").arg(text));
            return;
        }
        break;

    case Command::Pasv: {
        QString dataHost;
        quint16 dataPort = 0;
        if (code != FtpReplyEnteringPassive) {
            failCurrent(tr("Data transfer failed: server does not support passive mode. %1").arg(text));
            return;
        }
        if (!parsePassiveResponse(text, dataHost, dataPort)) {
            failCurrent(tr("Data transfer failed: unable to establish data connection"));
            return;
        }
        // Use the control socket's peer address instead of the IP from PASV
        // Many FTP servers return internal IPs that aren't reachable
        const QString actualHost = controlSocket_->peerAddress().toString();
        LOG_VERBOSE() << "FTP: PASV response host:" << dataHost << "port:" << dataPort
                      << "using:" << actualHost;
        resetTransferState();
        transfer_ = request;
        if (dataSocket_->state() != QAbstractSocket::UnconnectedState) {
            dataSocket_->abort();
        }
        dataSocket_->connectToHost(actualHost, dataPort);
        // The next command (LIST/RETR/STOR) is sent immediately;
        // the server expects it before sending data
        break;
    }

    case Command::Size: {
        if (code != FtpReplyFileStatus) {
            failCurrent(tr("Cannot get size of '%1': %2").arg(currentArg_, text));
            return;
        }
        bool ok = false;
        const qint64 value = text.trimmed().toLongLong(&ok);
        if (!ok) {
            failCurrent(tr("Unexpected SIZE reply: %1").arg(text));
            return;
        }
        request->number = value;
        break;
    }

    case Command::Mkd:
        if (!isPositiveCompletion(code)) {
            failCurrent(tr("Cannot create directory '%1': %2").arg(currentArg_, text));
            return;
        }
        break;

    case Command::Rmd:
    case Command::Dele:
        if (!isPositiveCompletion(code)) {
            failCurrent(tr("Cannot delete '%1': %2").arg(currentArg_, text));
            return;
        }
        break;

    case Command::RnFr:
        if (code != FtpReplyPendingFurtherInfo) {
            failCurrent(tr("Cannot rename '%1': file not found or access denied. %2")
                            .arg(currentArg_, text));
            return;
        }
        break;

    case Command::RnTo:
        if (!isPositiveCompletion(code)) {
            failCurrent(tr("Cannot rename to '%1': %2").arg(currentArg_, text));
            return;
        }
        break;

    case Command::Quit:
        finishRequest(request, FtpError::none());
        controlSocket_->disconnectFromHost();
        return;

    default:
        break;
    }

    // A request completes when its last queued command succeeded
    const bool moreForRequest = !commandQueue_.isEmpty() && commandQueue_.head().request == request;
    if (!moreForRequest) {
        if (request == openRequest_ && loggedIn_) {
            openRequest_.reset();
            qDebug() << "FTP: Logged in to" << config_.host;
        }
        finishRequest(request, FtpError::none());
    }

    // AUTH TLS continues from onControlEncrypted()
    processNextCommand();
}

// Data transfers

bool FtpSession::isTransferCommand(Command cmd) const
{
    return cmd == Command::List || cmd == Command::Retr || cmd == Command::Stor;
}

void FtpSession::resetTransferState()
{
    transfer_.reset();
    transferCommand_ = Command::None;
    transferSize_ = 0;
    transferred_ = 0;
    dataReady_ = false;
    dataDone_ = false;
    replyDone_ = false;
    storAccepted_ = false;
    dataError_.clear();
}

void FtpSession::handleTransferResponse(int code, const QString &text)
{
    transferCommand_ = currentCommand_;

    if (code == FtpReplyFileStatusOk || code == FtpReplyDataConnectionOpen) {
        // Transfer starting - data may already have arrived
        // (some servers send data before the 150 reply)
        if (currentCommand_ == Command::Retr) {
            QRegularExpression rx(QStringLiteral("\\((\\d+)\\s+bytes\\)"));
            auto match = rx.match(text);
            if (match.hasMatch()) {
                transferSize_ = match.captured(1).toLongLong();
            }
        } else if (currentCommand_ == Command::Stor) {
            storAccepted_ = true;
            maybeStartUpload();
        }
        return;
    }

    if (isPositiveCompletion(code)) {
        replyDone_ = true;
        if (!dataError_.isEmpty()) {
            failCurrent(tr("File transfer interrupted: %1").arg(dataError_));
            return;
        }
        if (currentCommand_ == Command::Stor
            || dataSocket_->state() == QAbstractSocket::UnconnectedState) {
            dataDone_ = true;
        }
        maybeFinishTransfer();
        return;
    }

    if (code >= FtpReplyErrorThreshold) {
        switch (currentCommand_) {
        case Command::List:
            failCurrent(tr("Cannot list directory contents: %1").arg(text));
            break;
        case Command::Retr:
            failCurrent(tr("Download failed for '%1': %2").arg(currentArg_, text));
            break;
        default:
            failCurrent(tr("Upload failed for '%1': %2").arg(currentArg_, text));
            break;
        }
    }
}

void FtpSession::maybeStartUpload()
{
    if (!transfer_ || transferCommand_ != Command::Stor || !storAccepted_ || !dataReady_) {
        return;
    }
    const QByteArray &payload = transfer_->payload;
    dataSocket_->write(payload);
    transferred_ = payload.size();
    emit uploadProgress(currentArg_, transferred_, payload.size());
    dataSocket_->disconnectFromHost();
}

void FtpSession::maybeFinishTransfer()
{
    if (!transfer_ || !replyDone_ || !dataDone_) {
        return;
    }

    auto request = transfer_;
    resetTransferState();
    finishRequest(request, FtpError::none());
    processNextCommand();
}

void FtpSession::onDataConnected()
{
    LOG_VERBOSE() << "FTP: Data socket connected to" << dataSocket_->peerAddress().toString()
                  << ":" << dataSocket_->peerPort();
    if (protectData_) {
        dataSocket_->startClientEncryption();
        return;
    }
    dataReady_ = true;
    maybeStartUpload();
}

void FtpSession::onDataEncrypted()
{
    dataReady_ = true;
    maybeStartUpload();
}

void FtpSession::onDataReadyRead()
{
    const QByteArray data = dataSocket_->readAll();
    if (!transfer_ || data.isEmpty()) {
        return;
    }
    LOG_VERBOSE() << "FTP: Data received:" << data.size() << "bytes";

    // Data keeps the command alive
    commandTimer_->start(CommandTimeoutMs);
    transferred_ += data.size();

    if (transfer_->file) {
        if (transfer_->file->write(data) != data.size()) {
            dataError_ = tr("cannot write local file '%1'").arg(transfer_->file->fileName());
        }
        emit downloadProgress(transfer_->remotePath, transferred_, transferSize_);
    } else {
        transfer_->buffer.append(data);
    }
}

void FtpSession::onDataDisconnected()
{
    // Read any remaining data before disconnect completes
    if (dataSocket_->bytesAvailable() > 0) {
        onDataReadyRead();
    }
    dataDone_ = true;
    maybeFinishTransfer();
}

void FtpSession::onDataError(QAbstractSocket::SocketError socketError)
{
    // RemoteHostClosedError is normal - server closes after sending data
    if (socketError == QAbstractSocket::RemoteHostClosedError) {
        if (dataSocket_->bytesAvailable() > 0) {
            onDataReadyRead();
        }
        return;
    }
    qDebug() << "FTP: Data socket error:" << socketError << dataSocket_->errorString();
    if (!transfer_) {
        return;
    }
    // The control connection still owes a final reply for this command
    dataError_ = dataSocket_->errorString();
    if (replyDone_) {
        failCurrent(tr("File transfer interrupted: %1").arg(dataError_));
    }
}

// Parsing

bool FtpSession::parsePassiveResponse(const QString &text, QString &host, quint16 &port)
{
    // Parse response like: 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)
    static const QRegularExpression rx(
        QStringLiteral("\\((\\d+),(\\d+),(\\d+),(\\d+),(\\d+),(\\d+)\\)"));
    auto match = rx.match(text);

    if (!match.hasMatch()) {
        return false;
    }

    host = QStringLiteral("%1.%2.%3.%4")
               .arg(match.captured(1), match.captured(2), match.captured(3), match.captured(4));

    const int p1 = match.captured(5).toInt();
    const int p2 = match.captured(6).toInt();
    port = static_cast<quint16>((p1 * PassivePortMultiplier) + p2);

    return true;
}

QList<FtpEntry> FtpSession::parseDirectoryListing(const QByteArray &data)
{
    QList<FtpEntry> entries;
    const QString listing = QString::fromUtf8(data);
    const QStringList lines = listing.split(QRegularExpression(QStringLiteral("\r?\n")),
                                            Qt::SkipEmptyParts);

    // Unix-style listing: drwxr-xr-x 2 user group 4096 Jan 1 12:00 dirname
    // Or simple listing: filename
    static const QRegularExpression unixRx(QStringLiteral(
        "^([dl\\-])([rwxsStT\\-]{9})\\S*\\s+\\d+\\s+\\S+\\s+\\S+\\s+(\\d+)\\s+"
        "(\\w+\\s+\\d+\\s+[\\d:]+)\\s+(.+)$"));

    for (const QString &line : lines) {
        if (line.trimmed().isEmpty() || line.startsWith(QLatin1String("total "))) {
            continue;
        }

        FtpEntry entry;
        auto match = unixRx.match(line);

        if (match.hasMatch()) {
            entry.isDirectory = (match.captured(1) == QLatin1String("d"));
            entry.permissions = match.captured(2);
            entry.size = match.captured(3).toLongLong();
            entry.name = match.captured(5);
            if (match.captured(1) == QLatin1String("l")) {
                // "name -> target"
                const int arrow = entry.name.indexOf(QLatin1String(" -> "));
                if (arrow > 0) {
                    entry.name = entry.name.left(arrow);
                }
            }

            const QString stamp = match.captured(4).simplified();
            QDateTime modified = QDateTime::fromString(stamp, QStringLiteral("MMM d yyyy"));
            if (!modified.isValid()) {
                modified = QDateTime::fromString(
                    stamp + ' ' + QString::number(QDate::currentDate().year()),
                    QStringLiteral("MMM d HH:mm yyyy"));
            }
            entry.modified = modified;
        } else {
            // Simple listing - just filename
            entry.name = line.trimmed();
            entry.isDirectory = false;  // Can't tell from simple listing
        }

        if (!entry.name.isEmpty() && entry.name != QLatin1String(".")
            && entry.name != QLatin1String("..")) {
            entries.append(entry);
        }
    }

    return entries;
}

QString FtpSession::parsePwdResponse(const QString &text)
{
    // Extract path from response like: 257 "/path" is current directory
    static const QRegularExpression rx(QStringLiteral("\"(.*)\""));
    auto match = rx.match(text);
    if (!match.hasMatch()) {
        return QString();
    }
    // Embedded quotes are doubled
    return match.captured(1).replace(QLatin1String("\"\""), QLatin1String("\""));
}

// Public interface methods

void FtpSession::pwd(PathCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &request) {
        if (done) {
            done(error.isError() ? FtpResult<QString>::failure(error)
                                 : FtpResult<QString>::success(request.text));
        }
    });
    if (rejectIfNotLoggedIn(request, tr("query working directory"))) {
        return;
    }
    queueCommand(Command::Pwd, QString(), request);
}

void FtpSession::cd(const QString &path, StatusCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });
    if (rejectIfNotLoggedIn(request, tr("change directory"))) {
        return;
    }
    queueCommand(Command::Cwd, path, request);
}

void FtpSession::list(const QString &path, ListCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &request) {
        if (!done) {
            return;
        }
        if (error.isError()) {
            done(FtpResult<QList<FtpEntry>>::failure(error));
            return;
        }
        const QList<FtpEntry> entries = parseDirectoryListing(request.buffer);
        LOG_VERBOSE() << "FTP: Parsed" << entries.size() << "entries";
        done(FtpResult<QList<FtpEntry>>::success(entries));
    });
    if (rejectIfNotLoggedIn(request, tr("list directory"))) {
        return;
    }
    request->remotePath = path;
    queueCommand(Command::Type, QStringLiteral("A"), request);  // ASCII mode for listing
    queueCommand(Command::Pasv, QString(), request);
    queueCommand(Command::List, path, request);
}

void FtpSession::makeDirectory(const QString &path, StatusCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });
    if (rejectIfNotLoggedIn(request, tr("create directory"))) {
        return;
    }
    queueCommand(Command::Mkd, path, request);
}

void FtpSession::removeDirectory(const QString &path, StatusCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });
    if (rejectIfNotLoggedIn(request, tr("remove directory"))) {
        return;
    }
    queueCommand(Command::Rmd, path, request);
}

void FtpSession::downloadTo(const QString &localPath, const QString &remotePath,
                            StatusCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });
    if (rejectIfNotLoggedIn(request, tr("download file"))) {
        return;
    }

    // Create the file now, but pass ownership to the request so the
    // handle stays with this RETR even if other requests are queued
    auto file = std::make_shared<QFile>(localPath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        finishRequest(request, FtpError::make(FtpErrorKind::Filesystem,
                                              tr("Cannot save file '%1': %2")
                                                  .arg(localPath, file->errorString())));
        return;
    }
    request->file = std::move(file);
    request->remotePath = remotePath;

    queueCommand(Command::Type, QStringLiteral("I"), request);  // Binary mode
    queueCommand(Command::Pasv, QString(), request);
    queueCommand(Command::Retr, remotePath, request);
}

void FtpSession::upload(const QByteArray &data, const QString &remotePath, StatusCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });
    if (rejectIfNotLoggedIn(request, tr("upload file"))) {
        return;
    }
    request->payload = data;
    request->remotePath = remotePath;

    queueCommand(Command::Type, QStringLiteral("I"), request);  // Binary mode
    queueCommand(Command::Pasv, QString(), request);
    queueCommand(Command::Stor, remotePath, request);
}

void FtpSession::remove(const QString &path, StatusCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });
    if (rejectIfNotLoggedIn(request, tr("delete file"))) {
        return;
    }
    queueCommand(Command::Dele, path, request);
}

void FtpSession::rename(const QString &oldPath, const QString &newPath, StatusCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &) {
        if (done) {
            done(error);
        }
    });
    if (rejectIfNotLoggedIn(request, tr("rename file"))) {
        return;
    }
    queueCommand(Command::RnFr, oldPath, request);
    queueCommand(Command::RnTo, newPath, request);
}

void FtpSession::size(const QString &path, SizeCallback done)
{
    auto request = makeRequest([done](const FtpError &error, const Request &request) {
        if (done) {
            done(error.isError() ? FtpResult<qint64>::failure(error)
                                 : FtpResult<qint64>::success(request.number));
        }
    });
    if (rejectIfNotLoggedIn(request, tr("get file size"))) {
        return;
    }
    queueCommand(Command::Type, QStringLiteral("I"), request);  // SIZE is defined for binary mode
    queueCommand(Command::Size, path, request);
}
