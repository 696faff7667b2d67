/**
 * @file ftpsession.h
 * @brief QtNetwork implementation of a single FTP/FTPS control session.
 *
 * Provides the wire protocol underneath ConnectionManager: login (with
 * optional explicit TLS), passive data connections, directory listing,
 * transfers and simple file management commands.
 */

#ifndef FTPSESSION_H
#define FTPSESSION_H

#include <QFile>
#include <QQueue>
#include <QSslSocket>
#include <QTimer>

#include <memory>

#include "iftpsession.h"

/**
 * @brief Asynchronous FTP client session over QSslSocket.
 *
 * Each public call is turned into a request made of one or more protocol
 * commands (e.g. TYPE I, PASV, RETR). Commands are sent strictly one at a
 * time; the request's callback fires exactly once, either when its last
 * command completes or as soon as one of its commands fails, in which case
 * the remaining commands of that request are dropped.
 *
 * Every command is guarded by a fixed timeout. A timeout, a 421 reply or
 * a dropped control socket closes the session: all pending requests fail
 * with FtpErrorKind::Connection and isClosed() turns true.
 *
 * Only passive data connections are implemented. The data socket connects
 * to the control connection's peer address rather than the address in the
 * PASV reply, since many servers advertise unreachable internal IPs.
 *
 * @par Example usage:
 * @code
 * auto *session = new FtpSession(this);
 * ConnectionConfig config;
 * config.host = "ftp.example.com";
 * config.username = "user";
 * config.password = "secret";
 *
 * session->open(config, [session](const FtpError &error) {
 *     if (!error.isError()) {
 *         session->pwd([](const FtpResult<QString> &cwd) { qDebug() << cwd.value; });
 *     }
 * });
 * @endcode
 */
class FtpSession : public IFtpSession
{
    Q_OBJECT

public:
    /// @name FTP Protocol Constants
    /// @{
    static constexpr int FtpReplyCodeLength = 3;  ///< Length of FTP reply code
    static constexpr int FtpReplyTextOffset = 4;  ///< Offset to reply text after code
    static constexpr int CrLfLength = 2;  ///< Length of CRLF line ending
    static constexpr int PassivePortMultiplier = 256;  ///< Multiplier for passive port calculation
    static constexpr int CommandTimeoutMs = 30000;  ///< Fixed per-command timeout
    /// @}

    /// @name FTP Response Codes (RFC 959, RFC 4217)
    /// @{
    static constexpr int FtpReplyDataConnectionOpen = 125;  ///< Data connection already open
    static constexpr int FtpReplyFileStatusOk = 150;  ///< File status okay, opening connection
    static constexpr int FtpReplyFileStatus = 213;  ///< File status (SIZE)
    static constexpr int FtpReplyServiceReady = 220;  ///< Service ready for new user
    static constexpr int FtpReplyEnteringPassive = 227;  ///< Entering passive mode
    static constexpr int FtpReplyUserLoggedIn = 230;  ///< User logged in, proceed
    static constexpr int FtpReplyAuthAccepted = 234;  ///< Security data exchange complete
    static constexpr int FtpReplyPathCreated = 257;  ///< Pathname created / current directory
    static constexpr int FtpReplyPasswordRequired = 331;  ///< User name okay, need password
    static constexpr int FtpReplyPendingFurtherInfo = 350;  ///< Requested action pending further info
    static constexpr int FtpReplyServiceClosing = 421;  ///< Service not available, closing control connection
    static constexpr int FtpReplyErrorThreshold = 400;  ///< Codes >= this indicate error
    /// @}

    /**
     * @brief Connection state of the session.
     */
    enum class State {
        Disconnected,  ///< Not connected to any host
        Connecting,    ///< TCP connection in progress
        Connected,     ///< TCP connected, awaiting server greeting
        LoggingIn,     ///< Authentication in progress
        Ready,         ///< Logged in and ready for commands
        Busy           ///< Command in progress
    };
    Q_ENUM(State)

    /**
     * @brief Constructs an unopened session.
     * @param parent Optional parent QObject for memory management.
     */
    explicit FtpSession(QObject *parent = nullptr);

    /**
     * @brief Destructor. Aborts the sockets; pending callbacks are dropped.
     */
    ~FtpSession() override;

    /**
     * @brief Returns the current connection state.
     */
    [[nodiscard]] State state() const { return state_; }

    /**
     * @brief Checks if successfully logged in.
     */
    [[nodiscard]] bool isLoggedIn() const { return loggedIn_; }

    /**
     * @brief Last working directory confirmed by PWD or CWD.
     */
    [[nodiscard]] QString currentDirectory() const { return currentDir_; }

    /// @name IFtpSession Implementation
    /// @{
    void open(const ConnectionConfig &config, StatusCallback done) override;
    void close(StatusCallback done) override;
    [[nodiscard]] bool isClosed() const override { return closed_; }

    void pwd(PathCallback done) override;
    void cd(const QString &path, StatusCallback done) override;

    void list(const QString &path, ListCallback done) override;
    void makeDirectory(const QString &path, StatusCallback done) override;
    void removeDirectory(const QString &path, StatusCallback done) override;

    void downloadTo(const QString &localPath, const QString &remotePath,
                    StatusCallback done) override;
    void upload(const QByteArray &data, const QString &remotePath,
                StatusCallback done) override;
    void remove(const QString &path, StatusCallback done) override;
    void rename(const QString &oldPath, const QString &newPath,
                StatusCallback done) override;
    void size(const QString &path, SizeCallback done) override;
    /// @}

    /// @name Protocol Parsing
    /// @{

    /**
     * @brief Extracts the data address from a 227 reply.
     * @param text Reply text, e.g. "Entering Passive Mode (h1,h2,h3,h4,p1,p2)".
     * @param host Receives the dotted IPv4 address.
     * @param port Receives the data port.
     * @return False if the reply does not contain an address.
     */
    [[nodiscard]] static bool parsePassiveResponse(const QString &text, QString &host,
                                                   quint16 &port);

    /**
     * @brief Parses LIST output (Unix "ls -l" lines or bare names).
     *
     * "." and ".." are filtered out.
     */
    [[nodiscard]] static QList<FtpEntry> parseDirectoryListing(const QByteArray &data);

    /**
     * @brief Extracts the quoted path from a 257 reply.
     * @return The path, or an empty string if none is quoted.
     */
    [[nodiscard]] static QString parsePwdResponse(const QString &text);
    /// @}

signals:
    /**
     * @brief Emitted when the connection state changes.
     * @param state The new connection state.
     */
    void stateChanged(FtpSession::State state);

private slots:
    void onControlConnected();
    void onControlEncrypted();
    void onControlDisconnected();
    void onControlReadyRead();
    void onControlError(QAbstractSocket::SocketError error);

    void onDataConnected();
    void onDataEncrypted();
    void onDataReadyRead();
    void onDataDisconnected();
    void onDataError(QAbstractSocket::SocketError error);

    void onCommandTimeout();

private:
    enum class Command {
        None,
        AuthTls,
        User,
        Pass,
        Pbsz,
        Prot,
        Pwd,
        Cwd,
        Type,
        Pasv,
        List,
        Retr,
        Stor,
        Size,
        Mkd,
        Rmd,
        Dele,
        RnFr,
        RnTo,
        Quit
    };

    // One public call; owns its transfer buffers and completion
    struct Request {
        QString remotePath;
        std::shared_ptr<QFile> file;  // RETR destination
        QByteArray payload;           // STOR source
        QByteArray buffer;            // LIST data
        QString text;                 // PWD result
        qint64 number = 0;            // SIZE result
        bool finished = false;
        std::function<void(const FtpError &error, const Request &request)> complete;
    };

    struct PendingCommand {
        Command cmd = Command::None;
        QString arg;
        std::shared_ptr<Request> request;
    };

    void setState(State state);
    void sendCommand(const QString &command);
    void queueCommand(Command cmd, const QString &arg, const std::shared_ptr<Request> &request);
    void processNextCommand();
    void handleResponse(int code, const QString &text);
    void handleBusyResponse(int code, const QString &text);
    void handleTransferResponse(int code, const QString &text);

    [[nodiscard]] std::shared_ptr<Request> makeRequest(
        std::function<void(const FtpError &, const Request &)> complete);
    [[nodiscard]] bool rejectIfNotLoggedIn(const std::shared_ptr<Request> &request,
                                           const QString &operation);
    void finishRequest(const std::shared_ptr<Request> &request, const FtpError &error);
    void failCurrent(const QString &message);
    void failSession(const QString &message);

    void resetTransferState();
    void maybeStartUpload();
    void maybeFinishTransfer();
    [[nodiscard]] bool isTransferCommand(Command cmd) const;

    // Network connections
    QSslSocket *controlSocket_ = nullptr;
    QSslSocket *dataSocket_ = nullptr;
    QTimer *commandTimer_ = nullptr;

    // Configuration
    ConnectionConfig config_;
    bool protectData_ = false;

    // Connection state
    State state_ = State::Disconnected;
    bool loggedIn_ = false;
    bool closed_ = true;
    bool quitting_ = false;
    QString currentDir_ = QStringLiteral("/");
    std::shared_ptr<Request> openRequest_;

    // Command processing
    Command currentCommand_ = Command::None;
    QString currentArg_;
    std::shared_ptr<Request> currentRequest_;
    QQueue<PendingCommand> commandQueue_;
    QString responseBuffer_;

    // Data transfer state (valid between PASV and the transfer's final reply)
    std::shared_ptr<Request> transfer_;
    Command transferCommand_ = Command::None;
    qint64 transferSize_ = 0;
    qint64 transferred_ = 0;
    bool dataReady_ = false;       // data socket connected (and encrypted if protected)
    bool dataDone_ = false;        // data socket closed by peer
    bool replyDone_ = false;       // final 2xx reply received on control connection
    bool storAccepted_ = false;    // 150/125 received for STOR
    QString dataError_;
};

#endif // FTPSESSION_H
