/**
 * @file test_transferexecutor.cpp
 * @brief Unit tests for TransferExecutor.
 *
 * Tests verify:
 * - Downloads fall back to a relative RETR from the parent directory
 * - A failed transfer is retried once after reconnecting
 * - Temporary download files are always removed
 * - Upload sources are read from files, data URLs or plain text
 * - Directory creation leaves the working directory unchanged
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "mocks/mockftpserver.h"
#include "services/transferexecutor.h"

class TestTransferExecutor : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Download
    void testDownloadFileReturnsContent();
    void testDownloadToLocalPath();
    void testDownloadFallsBackToParentDirectory();
    void testDownloadRetriesAfterDroppedConnection();
    void testDownloadPermanentFailure();
    void testDownloadWithoutConnection();

    // Upload
    void testUploadTextCreatesDirectories();
    void testUploadDataUrl();
    void testUploadLocalFile();
    void testUploadRestoresWorkingDirectory();

    // Directories
    void testCreateDirectory();
    void testCreateExistingDirectory();
    void testCreateDirectoryFailure();

    // Helpers
    void testLoadUploadSource();
    void testTemporaryFilePathIsUnique();

private:
    void connectTo(const QString &defaultPath = QString());
    FtpResult<QString> download(const QString &remotePath, const QString &localPath = QString());
    FtpError upload(const QString &source, const QString &remotePath);
    [[nodiscard]] QStringList tempFiles() const;

    MockFtpServer *server_ = nullptr;
    ConnectionManager *connection_ = nullptr;
    TransferExecutor *executor_ = nullptr;
    QTemporaryDir *tempDir_ = nullptr;
};

void TestTransferExecutor::init()
{
    server_ = new MockFtpServer(this);
    server_->mockAddFile("/web/index.html", "<html/>");
    server_->mockAddFile("/web/css/site.css", "body {}");

    connection_ = new ConnectionManager(server_->sessionFactory(), this);
    executor_ = new TransferExecutor(connection_, this);

    tempDir_ = new QTemporaryDir();
    QVERIFY(tempDir_->isValid());
    executor_->setTemporaryDirectory(tempDir_->path());
}

void TestTransferExecutor::cleanup()
{
    delete executor_;
    executor_ = nullptr;
    delete connection_;
    connection_ = nullptr;
    delete server_;
    server_ = nullptr;
    delete tempDir_;
    tempDir_ = nullptr;
}

void TestTransferExecutor::connectTo(const QString &defaultPath)
{
    ConnectionConfig config;
    config.host = "ftp.example.com";
    config.defaultRemotePath = defaultPath;
    connection_->connectToServer(config, nullptr);
    server_->mockProcessAllOperations();
    QVERIFY(connection_->isConnected());
    server_->mockClearCommandLog();
}

FtpResult<QString> TestTransferExecutor::download(const QString &remotePath, const QString &localPath)
{
    FtpResult<QString> captured =
        FtpResult<QString>::failure(FtpError::make(FtpErrorKind::Command, "not called"));
    executor_->downloadFile(remotePath, localPath,
                            [&captured](const FtpResult<QString> &result) { captured = result; });
    server_->mockProcessAllOperations();
    return captured;
}

FtpError TestTransferExecutor::upload(const QString &source, const QString &remotePath)
{
    FtpError captured = FtpError::make(FtpErrorKind::Command, "not called");
    executor_->uploadFile(source, remotePath, [&captured](const FtpError &error) { captured = error; });
    server_->mockProcessAllOperations();
    return captured;
}

QStringList TestTransferExecutor::tempFiles() const
{
    return QDir(tempDir_->path()).entryList(QDir::Files | QDir::NoDotAndDotDot);
}

void TestTransferExecutor::testDownloadFileReturnsContent()
{
    connectTo();

    auto result = download("/web/index.html");

    QVERIFY2(result.ok(), qPrintable(result.error.message));
    QCOMPARE(result.value, QString("<html/>"));
    QCOMPARE(server_->mockCommandLog(), QStringList({"RETR /web/index.html"}));
    QVERIFY(tempFiles().isEmpty());
}

void TestTransferExecutor::testDownloadToLocalPath()
{
    connectTo();
    const QString target = tempDir_->filePath("out/site.css");

    auto result = download("/web/css/site.css", target);

    QVERIFY(result.ok());
    QCOMPARE(result.value, QString("body {}"));
    QVERIFY(QFile::exists(target));
}

void TestTransferExecutor::testDownloadFallsBackToParentDirectory()
{
    server_->mockSetRejectAbsoluteTransfers(true);
    connectTo();

    auto result = download("/web/index.html");

    QVERIFY2(result.ok(), qPrintable(result.error.message));
    QCOMPARE(result.value, QString("<html/>"));
    QCOMPARE(server_->mockCommandLog(),
             QStringList({"RETR /web/index.html", "PWD", "CWD /web", "RETR index.html", "CWD /"}));
    QCOMPARE(server_->mockCurrentDirectory(), QString("/"));
}

void TestTransferExecutor::testDownloadRetriesAfterDroppedConnection()
{
    connectTo();
    server_->mockDropConnectionOnDownload(1);

    auto result = download("/web/index.html");

    QVERIFY2(result.ok(), qPrintable(result.error.message));
    QCOMPARE(result.value, QString("<html/>"));
    QCOMPARE(server_->mockLoginCount(), 2);
    QCOMPARE(server_->mockCommandLog().count("RETR /web/index.html"), 2);
}

void TestTransferExecutor::testDownloadPermanentFailure()
{
    server_->mockFailPath("/web/index.html");
    connectTo();

    auto result = download("/web/index.html");

    QVERIFY(!result.ok());
    QCOMPARE(result.error.kind, FtpErrorKind::Transfer);
    QVERIFY(result.error.message.startsWith("Failed to download file: "));
    QVERIFY(result.error.message.contains("451"));

    // Two attempts, each trying the absolute and the relative form
    const QStringList log = server_->mockCommandLog();
    QCOMPARE(log.count("RETR /web/index.html") + log.count("RETR index.html"), 4);
    QVERIFY(tempFiles().isEmpty());
    QCOMPARE(server_->mockCurrentDirectory(), QString("/"));
}

void TestTransferExecutor::testDownloadWithoutConnection()
{
    auto result = download("/web/index.html");

    QVERIFY(!result.ok());
    QCOMPARE(result.error.kind, FtpErrorKind::Connection);
    QVERIFY(tempFiles().isEmpty());
}

void TestTransferExecutor::testUploadTextCreatesDirectories()
{
    connectTo();

    FtpError error = upload("hello world", "/new/dir/a.txt");

    QVERIFY2(!error.isError(), qPrintable(error.message));
    QVERIFY(server_->mockHasDirectory("/new/dir"));
    QCOMPARE(server_->mockFileData("/new/dir/a.txt"), QByteArray("hello world"));

    const QStringList log = server_->mockCommandLog();
    QVERIFY(log.contains("MKD /new"));
    QVERIFY(log.contains("MKD /new/dir"));
    QVERIFY(log.indexOf("CWD /new/dir") < log.indexOf("STOR a.txt"));
}

void TestTransferExecutor::testUploadDataUrl()
{
    connectTo();

    FtpError error = upload("data:text/plain;base64,aGVsbG8=", "/web/hello.txt");

    QVERIFY(!error.isError());
    QCOMPARE(server_->mockFileData("/web/hello.txt"), QByteArray("hello"));
}

void TestTransferExecutor::testUploadLocalFile()
{
    connectTo();
    const QString localPath = tempDir_->filePath("logo.bin");
    const QByteArray bytes("\x00\x01\xfe\xff", 4);
    {
        QFile file(localPath);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(bytes);
    }

    FtpError error = upload(localPath, "/web/img/logo.bin");

    QVERIFY(!error.isError());
    QCOMPARE(server_->mockFileData("/web/img/logo.bin"), bytes);
}

void TestTransferExecutor::testUploadRestoresWorkingDirectory()
{
    connectTo("/web/css");

    FtpError error = upload("x", "/web/js/app.js");

    QVERIFY(!error.isError());
    QCOMPARE(server_->mockCurrentDirectory(), QString("/web/css"));
    QCOMPARE(server_->mockCommandLog().last(), QString("CWD /web/css"));
}

void TestTransferExecutor::testCreateDirectory()
{
    connectTo("/web");

    FtpError captured = FtpError::make(FtpErrorKind::Command, "not called");
    executor_->createDirectory("/a/b/c", [&captured](const FtpError &error) { captured = error; });
    server_->mockProcessAllOperations();

    QVERIFY(!captured.isError());
    QVERIFY(server_->mockHasDirectory("/a/b/c"));
    QCOMPARE(server_->mockCurrentDirectory(), QString("/web"));
}

void TestTransferExecutor::testCreateExistingDirectory()
{
    connectTo();

    FtpError captured = FtpError::make(FtpErrorKind::Command, "not called");
    executor_->createDirectory("/web/css", [&captured](const FtpError &error) { captured = error; });
    server_->mockProcessAllOperations();

    QVERIFY(!captured.isError());
}

void TestTransferExecutor::testCreateDirectoryFailure()
{
    server_->mockSetRejectMultiSegmentCwd(true);
    connectTo();

    FtpError captured;
    executor_->createDirectory("/a/b", [&captured](const FtpError &error) { captured = error; });
    server_->mockProcessAllOperations();

    QCOMPARE(captured.kind, FtpErrorKind::Command);
    QVERIFY(captured.message.startsWith("Failed to create directory: "));
    QCOMPARE(server_->mockCurrentDirectory(), QString("/"));
}

void TestTransferExecutor::testLoadUploadSource()
{
    auto text = TransferExecutor::loadUploadSource("plain ünïcode");
    QVERIFY(text.ok());
    QCOMPARE(text.value, QString("plain ünïcode").toUtf8());

    // Not base64-encoded, so the data URL is taken literally
    auto literal = TransferExecutor::loadUploadSource("data:text/plain,hello");
    QVERIFY(literal.ok());
    QCOMPARE(literal.value, QByteArray("data:text/plain,hello"));

    auto decoded = TransferExecutor::loadUploadSource("data:application/octet-stream;base64,AAEC");
    QVERIFY(decoded.ok());
    QCOMPARE(decoded.value, QByteArray("\x00\x01\x02", 3));
}

void TestTransferExecutor::testTemporaryFilePathIsUnique()
{
    const QString first = TransferExecutor::temporaryFilePath(tempDir_->path());
    const QString second = TransferExecutor::temporaryFilePath(tempDir_->path());

    QVERIFY(first != second);
    QVERIFY(first.startsWith(tempDir_->path()));
    QVERIFY(QFileInfo(first).fileName().startsWith("ftp-"));
    QVERIFY(first.endsWith(".tmp"));
}

QTEST_MAIN(TestTransferExecutor)
#include "test_transferexecutor.moc"
