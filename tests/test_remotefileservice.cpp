/**
 * @file test_remotefileservice.cpp
 * @brief Integration tests for RemoteFileService against the mock server.
 *
 * Tests verify:
 * - Operations reach the server strictly in submission order
 * - A failing operation does not block later ones
 * - File management commands report prefixed errors
 * - Dropped connections are rebuilt transparently
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "mocks/mockftpserver.h"
#include "services/remotefileservice.h"

class TestRemoteFileService : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Ordering
    void testOperationsRunInSubmissionOrder();
    void testFailureDoesNotBlockLaterOperations();

    // Connection
    void testOperationWithoutConnection();
    void testReconnectsAfterDrop();
    void testDisconnect();

    // File management
    void testDeleteFile();
    void testDeleteMissingFile();
    void testDeleteDirectoryRecursively();
    void testDeleteRootIsRefused();
    void testDeleteMissingDirectoryLeavesTreeIntact();
    void testDeleteMissingNestedDirectoryLeavesParentIntact();
    void testRename();
    void testRenameFailure();
    void testGetFileSize();
    void testGetFileSizeMissing();

    // Existence
    void testExistsDirectory();
    void testExistsFile();
    void testExistsMissing();

    // Listing and sync through the facade
    void testListAll();
    void testSyncToLocal();

private:
    void connectTo(const QString &defaultPath = QString());
    void flush();

    MockFtpServer *server_ = nullptr;
    RemoteFileService *service_ = nullptr;
};

void TestRemoteFileService::init()
{
    server_ = new MockFtpServer(this);
    server_->mockAddFile("/web/index.html", "<html/>");
    server_->mockAddFile("/web/css/site.css", "body {}");
    server_->mockAddFile("/web/css/print.css", "@media print {}");
    server_->mockAddDirectory("/web/empty");
    server_->mockAddFile("/notes.txt", "notes");

    service_ = new RemoteFileService(server_->sessionFactory(), this);
}

void TestRemoteFileService::cleanup()
{
    delete service_;
    service_ = nullptr;
    delete server_;
    server_ = nullptr;
}

void TestRemoteFileService::flush()
{
    int quietPasses = 0;
    for (int i = 0; i < 10000 && quietPasses < 2; ++i) {
        QCoreApplication::processEvents();
        const bool quiet = server_->mockPendingOperationCount() == 0
                           && !service_->queue()->isBusy() && service_->queue()->pendingCount() == 0;
        server_->mockProcessAllOperations();
        quietPasses = quiet ? quietPasses + 1 : 0;
    }
}

void TestRemoteFileService::connectTo(const QString &defaultPath)
{
    ConnectionConfig config;
    config.host = "ftp.example.com";
    config.username = "deploy";
    config.defaultRemotePath = defaultPath;

    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    service_->connectToServer(config, [&result](const FtpError &error) { result = error; });
    flush();
    QVERIFY2(!result.isError(), qPrintable(result.message));
    QVERIFY(service_->isConnected());
    server_->mockClearCommandLog();
}

void TestRemoteFileService::testOperationsRunInSubmissionOrder()
{
    connectTo();
    QStringList completed;

    service_->listFiles("/web", [&completed](const FtpResult<QList<RemoteEntry>> &result) {
        QVERIFY(result.ok());
        completed.append("list");
    });
    service_->uploadFile("new content", "/web/new.txt", [&completed](const FtpError &error) {
        QVERIFY(!error.isError());
        completed.append("upload");
    });
    service_->downloadFile("/web/new.txt", QString(), [&completed](const FtpResult<QString> &result) {
        QCOMPARE(result.value, QString("new content"));
        completed.append("download");
    });
    service_->getFileSize("/web/new.txt", [&completed](const FtpResult<qint64> &result) {
        QCOMPARE(result.value, qint64(11));
        completed.append("size");
    });
    flush();

    QCOMPARE(completed, QStringList({"list", "upload", "download", "size"}));

    const QStringList log = server_->mockCommandLog();
    const int list = log.indexOf("LIST /web");
    const int stor = log.indexOf("STOR new.txt");
    const int retr = log.indexOf("RETR /web/new.txt");
    const int size = log.indexOf("SIZE /web/new.txt");
    QVERIFY(list >= 0);
    QVERIFY(list < stor);
    QVERIFY(stor < retr);
    QVERIFY(retr < size);
}

void TestRemoteFileService::testFailureDoesNotBlockLaterOperations()
{
    connectTo();
    FtpError deleteResult;
    FtpError renameResult = FtpError::make(FtpErrorKind::Command, "not called");

    service_->deleteFile("/missing.txt", [&deleteResult](const FtpError &error) { deleteResult = error; });
    service_->rename("/notes.txt", "/notes.md", [&renameResult](const FtpError &error) { renameResult = error; });
    flush();

    QVERIFY(deleteResult.isError());
    QVERIFY(!renameResult.isError());
    QVERIFY(server_->mockHasFile("/notes.md"));
}

void TestRemoteFileService::testOperationWithoutConnection()
{
    FtpResult<QList<RemoteEntry>> captured;
    service_->listFiles("/web", [&captured](const FtpResult<QList<RemoteEntry>> &result) { captured = result; });
    flush();

    QVERIFY(!captured.ok());
    QCOMPARE(captured.error.kind, FtpErrorKind::Connection);
    QCOMPARE(captured.error.message, QString("Not connected to FTP server"));
}

void TestRemoteFileService::testReconnectsAfterDrop()
{
    connectTo("/web");
    server_->mockDropConnections();
    QVERIFY(!service_->isConnected());

    FtpResult<QList<RemoteEntry>> captured;
    service_->listFiles("/", [&captured](const FtpResult<QList<RemoteEntry>> &result) { captured = result; });
    flush();

    QVERIFY2(captured.ok(), qPrintable(captured.error.message));
    QCOMPARE(server_->mockLoginCount(), 2);
    // Root resolves to the re-applied default path
    QCOMPARE(captured.value.first().path, QString("/web/css"));
}

void TestRemoteFileService::testDisconnect()
{
    connectTo();

    bool done = false;
    service_->disconnectFromServer([&done](const FtpError &) { done = true; });
    flush();

    QVERIFY(done);
    QVERIFY(!service_->isConnected());
    QCOMPARE(server_->mockCommandLog(), QStringList({"QUIT"}));
}

void TestRemoteFileService::testDeleteFile()
{
    connectTo();

    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    service_->deleteFile("/notes.txt", [&result](const FtpError &error) { result = error; });
    flush();

    QVERIFY(!result.isError());
    QVERIFY(!server_->mockHasFile("/notes.txt"));
}

void TestRemoteFileService::testDeleteMissingFile()
{
    connectTo();

    FtpError result;
    service_->deleteFile("/missing.txt", [&result](const FtpError &error) { result = error; });
    flush();

    QCOMPARE(result.kind, FtpErrorKind::Command);
    QVERIFY(result.message.startsWith("Failed to delete file: 550"));
}

void TestRemoteFileService::testDeleteDirectoryRecursively()
{
    connectTo();

    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    service_->deleteDirectory("/web", [&result](const FtpError &error) { result = error; });
    flush();

    QVERIFY2(!result.isError(), qPrintable(result.message));
    QVERIFY(!server_->mockHasDirectory("/web"));
    QVERIFY(!server_->mockHasFile("/web/css/site.css"));
    QVERIFY(server_->mockHasFile("/notes.txt"));

    const QStringList log = server_->mockCommandLog();
    QVERIFY(log.indexOf("DELE /web/css/site.css") < log.indexOf("RMD /web/css"));
    QVERIFY(log.indexOf("RMD /web/empty") < log.indexOf("RMD /web"));
    QCOMPARE(log.last(), QString("RMD /web"));
}

void TestRemoteFileService::testDeleteRootIsRefused()
{
    connectTo();

    FtpError result;
    service_->deleteDirectory("/", [&result](const FtpError &error) { result = error; });
    flush();

    QVERIFY(result.isError());
    QVERIFY(result.message.startsWith("Failed to delete directory: "));
    QVERIFY(server_->mockCommandLog().isEmpty());
}

void TestRemoteFileService::testDeleteMissingDirectoryLeavesTreeIntact()
{
    connectTo();

    FtpError result;
    service_->deleteDirectory("/missing", [&result](const FtpError &error) { result = error; });
    flush();

    QCOMPARE(result.kind, FtpErrorKind::Command);
    QVERIFY(result.message.startsWith("Failed to delete directory: "));
    QVERIFY(server_->mockHasFile("/notes.txt"));
    QVERIFY(server_->mockHasFile("/web/index.html"));
    QVERIFY(server_->mockCommandLog().filter("DELE").isEmpty());
    QVERIFY(server_->mockCommandLog().filter("RMD").isEmpty());
}

void TestRemoteFileService::testDeleteMissingNestedDirectoryLeavesParentIntact()
{
    connectTo();

    FtpError result;
    service_->deleteDirectory("/web/css/missing", [&result](const FtpError &error) { result = error; });
    flush();

    QCOMPARE(result.kind, FtpErrorKind::Command);
    QVERIFY(server_->mockHasFile("/web/css/site.css"));
    QVERIFY(server_->mockHasFile("/web/css/print.css"));
    QVERIFY(server_->mockCommandLog().filter("DELE").isEmpty());
    QVERIFY(server_->mockCommandLog().filter("RMD").isEmpty());
}

void TestRemoteFileService::testRename()
{
    connectTo();

    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    service_->rename("/web/css", "/web/styles", [&result](const FtpError &error) { result = error; });
    flush();

    QVERIFY(!result.isError());
    QVERIFY(server_->mockHasFile("/web/styles/site.css"));
    QVERIFY(!server_->mockHasDirectory("/web/css"));
    QCOMPARE(server_->mockCommandLog(), QStringList({"RNFR /web/css", "RNTO /web/styles"}));
}

void TestRemoteFileService::testRenameFailure()
{
    connectTo();

    FtpError result;
    service_->rename("/missing.txt", "/other.txt", [&result](const FtpError &error) { result = error; });
    flush();

    QCOMPARE(result.kind, FtpErrorKind::Command);
    QVERIFY(result.message.startsWith("Failed to rename: "));
}

void TestRemoteFileService::testGetFileSize()
{
    connectTo();

    FtpResult<qint64> captured;
    service_->getFileSize("/web/index.html", [&captured](const FtpResult<qint64> &result) { captured = result; });
    flush();

    QVERIFY(captured.ok());
    QCOMPARE(captured.value, qint64(7));
}

void TestRemoteFileService::testGetFileSizeMissing()
{
    connectTo();

    FtpResult<qint64> captured;
    service_->getFileSize("/missing.txt", [&captured](const FtpResult<qint64> &result) { captured = result; });
    flush();

    QVERIFY(!captured.ok());
    QCOMPARE(captured.error.kind, FtpErrorKind::Command);
    QVERIFY(captured.error.message.startsWith("Failed to get file size: "));
}

void TestRemoteFileService::testExistsDirectory()
{
    connectTo("/web");

    FtpResult<ExistsResult> captured;
    service_->exists("/web/css", [&captured](const FtpResult<ExistsResult> &result) { captured = result; });
    flush();

    QVERIFY(captured.ok());
    QVERIFY(captured.value.exists);
    QVERIFY(captured.value.kind == RemoteEntryKind::Directory);
    QCOMPARE(server_->mockCurrentDirectory(), QString("/web"));
}

void TestRemoteFileService::testExistsFile()
{
    connectTo("/web");

    FtpResult<ExistsResult> captured;
    service_->exists("/web/index.html", [&captured](const FtpResult<ExistsResult> &result) { captured = result; });
    flush();

    QVERIFY(captured.ok());
    QVERIFY(captured.value.exists);
    QVERIFY(captured.value.kind == RemoteEntryKind::File);
    QCOMPARE(server_->mockCurrentDirectory(), QString("/web"));
}

void TestRemoteFileService::testExistsMissing()
{
    connectTo();

    FtpResult<ExistsResult> captured;
    service_->exists("/nothing/here", [&captured](const FtpResult<ExistsResult> &result) { captured = result; });
    flush();

    QVERIFY(captured.ok());
    QVERIFY(!captured.value.exists);
    QVERIFY(!captured.value.kind.has_value());
}

void TestRemoteFileService::testListAll()
{
    connectTo();

    FtpResult<std::vector<RemoteTreeNode>> captured;
    service_->listAll("/web", [&captured](const FtpResult<std::vector<RemoteTreeNode>> &result) {
        captured = result;
    });
    flush();

    QVERIFY(captured.ok());
    QCOMPARE(captured.value.size(), std::size_t(3));
    QCOMPARE(captured.value[0].entry.path, QString("/web/css"));
    QCOMPARE(captured.value[0].children.size(), std::size_t(2));
    QCOMPARE(captured.value[1].entry.path, QString("/web/empty"));
    QVERIFY(captured.value[1].children.empty());
}

void TestRemoteFileService::testSyncToLocal()
{
    connectTo();
    QTemporaryDir localRoot;
    QVERIFY(localRoot.isValid());

    FtpResult<SyncResult> captured;
    service_->syncToLocal("/web", localRoot.path(), IgnoreRuleSet(QStringList{"print.css"}), nullptr,
                          [&captured](const FtpResult<SyncResult> &result) { captured = result; });
    flush();

    QVERIFY2(captured.ok(), qPrintable(captured.error.message));
    QCOMPARE(captured.value.filesSynced, 2);
    QVERIFY(QFile::exists(QDir(captured.value.root).filePath("css/site.css")));
    QVERIFY(QDir(captured.value.root).exists("empty"));
}

QTEST_MAIN(TestRemoteFileService)
#include "test_remotefileservice.moc"
