/**
 * @file mockftpserver.h
 * @brief In-memory FTP server and session for testing.
 *
 * MockFtpServer holds a virtual filesystem shared by every MockFtpSession
 * it creates. Sessions implement IFtpSession and are injected through
 * MockFtpServer::sessionFactory(), so the components under test run their
 * real logic against a controllable server.
 */

#ifndef MOCKFTPSERVER_H
#define MOCKFTPSERVER_H

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QPointer>
#include <QQueue>
#include <QSet>
#include <QStringList>

#include <functional>

#include "services/iftpsession.h"

class MockFtpSession;

/**
 * @brief Controllable in-memory FTP server.
 *
 * @par Features:
 * - Queue-based operation processing (replies only arrive when the test
 *   calls mockProcessNextOperation() or mockProcessAllOperations())
 * - Virtual directory tree with file contents
 * - Command log in wire notation ("CWD /web", "LIST ", "RETR /a.txt")
 * - Failure injection: rejected logins, failing paths, servers that refuse
 *   absolute paths or multi-level CWD, dropped connections
 *
 * @par Example usage:
 * @code
 * MockFtpServer *server = new MockFtpServer(this);
 * server->mockAddFile("/web/index.html", "<html/>");
 *
 * auto *manager = new ConnectionManager(server->sessionFactory(), this);
 * manager->connectToServer(config, callback);
 * server->mockProcessAllOperations();
 *
 * QCOMPARE(server->mockLoginCount(), 1);
 * @endcode
 */
class MockFtpServer : public QObject
{
    Q_OBJECT

public:
    explicit MockFtpServer(QObject *parent = nullptr);
    ~MockFtpServer() override;

    /**
     * @brief Factory producing sessions connected to this server.
     */
    [[nodiscard]] SessionFactory sessionFactory();

    /// @name Virtual Filesystem
    /// @{
    void mockAddDirectory(const QString &path);
    void mockAddFile(const QString &path, const QByteArray &data);
    void mockSetHomeDirectory(const QString &path) { home_ = path; }

    [[nodiscard]] bool mockHasDirectory(const QString &path) const;
    [[nodiscard]] bool mockHasFile(const QString &path) const;
    [[nodiscard]] QByteArray mockFileData(const QString &path) const;
    /// @}

    /// @name Failure Injection
    /// @{
    void mockSetRejectLogin(bool reject) { rejectLogin_ = reject; }

    /// RETR/STOR of this path always fails
    void mockFailPath(const QString &path) { failPaths_.insert(path); }

    /// RETR and STOR only accept names relative to the working directory
    void mockSetRejectAbsoluteTransfers(bool reject) { rejectAbsoluteTransfers_ = reject; }

    /// LIST only works without an argument
    void mockSetRejectListArguments(bool reject) { rejectListArguments_ = reject; }

    /// Every LIST fails, as on a server without directory read permission
    void mockSetRejectListing(bool reject) { rejectListing_ = reject; }

    /// The directory exists but can be neither entered nor listed
    void mockDenyDirectory(const QString &path);

    /// CWD only accepts a single path segment
    void mockSetRejectMultiSegmentCwd(bool reject) { rejectMultiSegmentCwd_ = reject; }

    /// The next @p count RETR commands drop the connection instead of replying
    void mockDropConnectionOnDownload(int count = 1) { dropOnDownload_ = count; }

    /// Closes every open session, as if the server timed them out
    void mockDropConnections();
    /// @}

    /// @name Operation Processing
    /// @{
    void mockProcessNextOperation();
    void mockProcessAllOperations();
    [[nodiscard]] int mockPendingOperationCount() const { return static_cast<int>(pendingOps_.size()); }
    /// @}

    /// @name Inspection
    /// @{
    [[nodiscard]] QStringList mockCommandLog() const { return commandLog_; }
    void mockClearCommandLog() { commandLog_.clear(); }
    [[nodiscard]] int mockLoginCount() const { return loginCount_; }
    [[nodiscard]] int mockSessionsCreated() const { return sessionsCreated_; }

    /// Working directory of the most recently created session
    [[nodiscard]] QString mockCurrentDirectory() const;
    [[nodiscard]] MockFtpSession *mockCurrentSession() const;
    /// @}

private:
    friend class MockFtpSession;

    void enqueue(std::function<void()> op) { pendingOps_.enqueue(std::move(op)); }
    void log(const QString &command) { commandLog_.append(command); }
    [[nodiscard]] QList<FtpEntry> childrenOf(const QString &dir) const;

    QString home_ = QStringLiteral("/");
    QSet<QString> directories_;
    QMap<QString, QByteArray> files_;

    bool rejectLogin_ = false;
    bool rejectAbsoluteTransfers_ = false;
    bool rejectListArguments_ = false;
    bool rejectMultiSegmentCwd_ = false;
    bool rejectListing_ = false;
    int dropOnDownload_ = 0;
    QSet<QString> failPaths_;
    QSet<QString> deniedDirectories_;

    QQueue<std::function<void()>> pendingOps_;
    QStringList commandLog_;
    int loginCount_ = 0;
    int sessionsCreated_ = 0;
    QList<QPointer<MockFtpSession>> sessions_;
};

/**
 * @brief IFtpSession backed by a MockFtpServer.
 *
 * Each call is logged immediately and answered when the server processes
 * its pending operations. A destroyed session never invokes callbacks.
 */
class MockFtpSession : public IFtpSession
{
    Q_OBJECT

public:
    MockFtpSession(MockFtpServer *server, QObject *parent = nullptr);
    ~MockFtpSession() override = default;

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

    [[nodiscard]] QString mockCurrentDirectory() const { return cwd_; }

    /// Marks the session closed and emits disconnected()
    void mockDrop();

private:
    [[nodiscard]] QString resolve(const QString &path) const;
    [[nodiscard]] static FtpError replyError(const QString &message);
    [[nodiscard]] static FtpError closedError();

    /// Queues @p op; it runs only while this session is alive
    void schedule(const QString &command, std::function<void()> op);

    MockFtpServer *server_ = nullptr;
    QString cwd_ = QStringLiteral("/");
    bool closed_ = true;
};

#endif // MOCKFTPSERVER_H
