/**
 * @file test_connectionmanager.cpp
 * @brief Unit tests for ConnectionManager.
 *
 * Tests verify:
 * - Login failures are reported as connection errors
 * - ensureConnected() reuses a live session
 * - A dropped session is rebuilt with the stored configuration
 * - Concurrent callers share a single reconnect
 */

#include <QtTest/QtTest>
#include <QSignalSpy>

#include "mocks/mockftpserver.h"
#include "services/connectionmanager.h"

class TestConnectionManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Connect
    void testConnectSuccess();
    void testConnectRejectedLogin();
    void testConnectWithoutHost();
    void testConnectAppliesDefaultPath();
    void testConnectReplacesExistingSession();
    void testFailedConnectForgetsPreviousServer();

    // ensureConnected
    void testEnsureConnectedNeverConnected();
    void testEnsureConnectedReusesSession();
    void testEnsureConnectedRebuildsDroppedSession();
    void testConcurrentReconnectIsShared();
    void testReconnectFailure();

    // Disconnect
    void testDisconnectKeepsConfig();
    void testDestructionDeletesSession();

private:
    ConnectionConfig makeConfig() const;
    void connectOrFail();

    MockFtpServer *server_ = nullptr;
    ConnectionManager *manager_ = nullptr;
};

void TestConnectionManager::init()
{
    server_ = new MockFtpServer(this);
    server_->mockAddDirectory("/web/css");
    manager_ = new ConnectionManager(server_->sessionFactory(), this);
}

void TestConnectionManager::cleanup()
{
    delete manager_;
    manager_ = nullptr;
    delete server_;
    server_ = nullptr;
}

ConnectionConfig TestConnectionManager::makeConfig() const
{
    ConnectionConfig config;
    config.host = "ftp.example.com";
    config.username = "deploy";
    config.password = "secret";
    return config;
}

void TestConnectionManager::connectOrFail()
{
    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    manager_->connectToServer(makeConfig(), [&result](const FtpError &error) { result = error; });
    server_->mockProcessAllOperations();
    QVERIFY2(!result.isError(), qPrintable(result.message));
}

void TestConnectionManager::testConnectSuccess()
{
    QSignalSpy connectedSpy(manager_, &ConnectionManager::connected);

    connectOrFail();

    QVERIFY(manager_->isConnected());
    QCOMPARE(manager_->state(), ConnectionManager::ConnectionState::Connected);
    QCOMPARE(connectedSpy.count(), 1);
    QCOMPARE(server_->mockCommandLog(), QStringList({"USER deploy"}));
}

void TestConnectionManager::testConnectRejectedLogin()
{
    server_->mockSetRejectLogin(true);
    QSignalSpy errorSpy(manager_, &ConnectionManager::connectionError);

    FtpError result;
    manager_->connectToServer(makeConfig(), [&result](const FtpError &error) { result = error; });
    server_->mockProcessAllOperations();

    QCOMPARE(result.kind, FtpErrorKind::Connection);
    QVERIFY(result.message.startsWith("FTP connection failed: "));
    QVERIFY(result.message.contains("530"));
    QVERIFY(!manager_->isConnected());
    QVERIFY(!manager_->hasConfig());
    QCOMPARE(errorSpy.count(), 1);
}

void TestConnectionManager::testConnectWithoutHost()
{
    FtpError result;
    manager_->connectToServer(ConnectionConfig(), [&result](const FtpError &error) { result = error; });

    QCOMPARE(result.kind, FtpErrorKind::Connection);
    QCOMPARE(server_->mockSessionsCreated(), 0);
}

void TestConnectionManager::testConnectAppliesDefaultPath()
{
    ConnectionConfig config = makeConfig();
    config.defaultRemotePath = "/web";

    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    manager_->connectToServer(config, [&result](const FtpError &error) { result = error; });
    server_->mockProcessAllOperations();

    QVERIFY(!result.isError());
    QCOMPARE(server_->mockCurrentDirectory(), QString("/web"));
}

void TestConnectionManager::testConnectReplacesExistingSession()
{
    connectOrFail();
    connectOrFail();

    QCOMPARE(server_->mockSessionsCreated(), 2);
    QCOMPARE(server_->mockCommandLog(), QStringList({"USER deploy", "QUIT", "USER deploy"}));
    QVERIFY(manager_->isConnected());
}

void TestConnectionManager::testEnsureConnectedNeverConnected()
{
    FtpError result;
    manager_->ensureConnected([&result](const FtpError &error) { result = error; });

    QCOMPARE(result.kind, FtpErrorKind::Connection);
    QCOMPARE(result.message, QString("Not connected to FTP server"));
    QCOMPARE(server_->mockSessionsCreated(), 0);
}

void TestConnectionManager::testEnsureConnectedReusesSession()
{
    connectOrFail();

    int calls = 0;
    for (int i = 0; i < 3; ++i) {
        manager_->ensureConnected([&calls](const FtpError &error) {
            QVERIFY(!error.isError());
            ++calls;
        });
    }
    server_->mockProcessAllOperations();

    QCOMPARE(calls, 3);
    QCOMPARE(server_->mockSessionsCreated(), 1);
    QCOMPARE(server_->mockLoginCount(), 1);
}

void TestConnectionManager::testEnsureConnectedRebuildsDroppedSession()
{
    ConnectionConfig config = makeConfig();
    config.defaultRemotePath = "/web";
    manager_->connectToServer(config, nullptr);
    server_->mockProcessAllOperations();
    QVERIFY(manager_->isConnected());

    server_->mockDropConnections();
    QVERIFY(!manager_->isConnected());

    QSignalSpy reconnectedSpy(manager_, &ConnectionManager::reconnected);
    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    manager_->ensureConnected([&result](const FtpError &error) { result = error; });
    server_->mockProcessAllOperations();

    QVERIFY(!result.isError());
    QVERIFY(manager_->isConnected());
    QCOMPARE(server_->mockLoginCount(), 2);
    QCOMPARE(reconnectedSpy.count(), 1);
    // Default path is re-applied on the new session
    QCOMPARE(server_->mockCurrentDirectory(), QString("/web"));
}

void TestConnectionManager::testConcurrentReconnectIsShared()
{
    connectOrFail();
    server_->mockDropConnections();

    int succeeded = 0;
    for (int i = 0; i < 3; ++i) {
        manager_->ensureConnected([&succeeded](const FtpError &error) {
            if (!error.isError()) {
                ++succeeded;
            }
        });
    }
    QCOMPARE(manager_->state(), ConnectionManager::ConnectionState::Reconnecting);
    server_->mockProcessAllOperations();

    QCOMPARE(succeeded, 3);
    QCOMPARE(server_->mockLoginCount(), 2);
    QCOMPARE(server_->mockSessionsCreated(), 2);
}

void TestConnectionManager::testReconnectFailure()
{
    connectOrFail();
    server_->mockDropConnections();
    server_->mockSetRejectLogin(true);

    QList<FtpError> results;
    manager_->ensureConnected([&results](const FtpError &error) { results.append(error); });
    manager_->ensureConnected([&results](const FtpError &error) { results.append(error); });
    server_->mockProcessAllOperations();

    QCOMPARE(results.size(), 2);
    QCOMPARE(results.at(0).kind, FtpErrorKind::Connection);
    QCOMPARE(results.at(1).kind, FtpErrorKind::Connection);
    QCOMPARE(manager_->state(), ConnectionManager::ConnectionState::Disconnected);

    // The next call tries again
    server_->mockSetRejectLogin(false);
    FtpError retry = FtpError::make(FtpErrorKind::Command, "not called");
    manager_->ensureConnected([&retry](const FtpError &error) { retry = error; });
    server_->mockProcessAllOperations();
    QVERIFY(!retry.isError());
}

void TestConnectionManager::testDisconnectKeepsConfig()
{
    connectOrFail();
    QSignalSpy disconnectedSpy(manager_, &ConnectionManager::disconnected);

    bool done = false;
    manager_->disconnectFromServer([&done](const FtpError &) { done = true; });
    server_->mockProcessAllOperations();

    QVERIFY(done);
    QVERIFY(!manager_->isConnected());
    QVERIFY(manager_->hasConfig());
    QCOMPARE(disconnectedSpy.count(), 1);

    // A later operation reconnects transparently
    FtpError result = FtpError::make(FtpErrorKind::Command, "not called");
    manager_->ensureConnected([&result](const FtpError &error) { result = error; });
    server_->mockProcessAllOperations();
    QVERIFY(!result.isError());
    QCOMPARE(server_->mockLoginCount(), 2);
}

void TestConnectionManager::testFailedConnectForgetsPreviousServer()
{
    connectOrFail();
    QCOMPARE(server_->mockLoginCount(), 1);

    ConnectionConfig other = makeConfig();
    other.host = "other.example.com";
    server_->mockSetRejectLogin(true);
    FtpError connectResult;
    manager_->connectToServer(other, [&connectResult](const FtpError &error) { connectResult = error; });
    server_->mockProcessAllOperations();
    QCOMPARE(connectResult.kind, FtpErrorKind::Connection);
    QVERIFY(!manager_->hasConfig());

    // Logging back into the first server would succeed now
    server_->mockSetRejectLogin(false);
    server_->mockClearCommandLog();
    FtpError result;
    manager_->ensureConnected([&result](const FtpError &error) { result = error; });
    server_->mockProcessAllOperations();

    QCOMPARE(result.kind, FtpErrorKind::Connection);
    QCOMPARE(server_->mockLoginCount(), 1);
    QVERIFY(server_->mockCommandLog().isEmpty());
}

void TestConnectionManager::testDestructionDeletesSession()
{
    connectOrFail();
    QPointer<MockFtpSession> session(server_->mockCurrentSession());
    QVERIFY(session);

    delete manager_;
    manager_ = nullptr;

    QVERIFY(session.isNull());
}

QTEST_MAIN(TestConnectionManager)
#include "test_connectionmanager.moc"
