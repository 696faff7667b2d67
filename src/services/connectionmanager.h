/**
 * @file connectionmanager.h
 * @brief Owns the single FTP session and rebuilds it when it goes away.
 */

#ifndef CONNECTIONMANAGER_H
#define CONNECTIONMANAGER_H

#include <QList>
#include <QObject>
#include <QPointer>

#include <optional>

#include "connectionconfig.h"
#include "iftpsession.h"

/**
 * @brief Connection lifecycle manager for one FTP/FTPS server.
 *
 * ConnectionManager holds exactly one IFtpSession at a time. Sessions are
 * built through a SessionFactory so that a closed session (timeout, server
 * disconnect) can be thrown away and replaced transparently by
 * ensureConnected(), using the configuration stored by the last successful
 * connectToServer().
 *
 * Callers that invoke ensureConnected() while a rebuild is already running
 * are parked and completed with the outcome of that rebuild; only one new
 * session is ever constructed per outage.
 *
 * After each successful login the manager tries to change into
 * ConnectionConfig::defaultRemotePath. Failure to do so is logged and
 * otherwise ignored.
 *
 * @par Example usage:
 * @code
 * auto *manager = new ConnectionManager([](QObject *parent) {
 *     return new FtpSession(parent);
 * }, this);
 *
 * manager->connectToServer(config, [](const FtpError &error) {
 *     if (error.isError()) {
 *         qWarning() << error.message;
 *     }
 * });
 * @endcode
 */
class ConnectionManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(ConnectionState state READ state NOTIFY stateChanged)
    Q_PROPERTY(bool connected READ isConnected NOTIFY stateChanged)

public:
    /**
     * @brief Connection state of the manager.
     */
    enum class ConnectionState {
        Disconnected,   ///< No usable session
        Connecting,     ///< connectToServer() in progress
        Connected,      ///< Logged in
        Reconnecting    ///< Rebuilding a session after it was found closed
    };
    Q_ENUM(ConnectionState)

    /**
     * @brief Constructs a connection manager.
     * @param factory Builds fresh, unopened sessions.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ConnectionManager(SessionFactory factory, QObject *parent = nullptr);

    /**
     * @brief Destructor. The session is deleted as a child, without QUIT.
     */
    ~ConnectionManager() override;

    /// @name Connection State
    /// @{
    [[nodiscard]] ConnectionState state() const { return state_; }

    /**
     * @brief True when logged in and the session has not reported closure.
     */
    [[nodiscard]] bool isConnected() const;

    /**
     * @brief Returns true if a configuration is stored for reconnection.
     */
    [[nodiscard]] bool hasConfig() const { return config_.has_value(); }

    /**
     * @brief Returns the stored configuration (default-constructed if none).
     */
    [[nodiscard]] ConnectionConfig config() const { return config_.value_or(ConnectionConfig()); }

    /**
     * @brief Returns the current session, or nullptr.
     *
     * The pointer is only valid until the next ensureConnected() rebuilds
     * the session; do not store it across operations.
     */
    [[nodiscard]] IFtpSession *session() const { return session_; }
    /// @}

    /// @name Lifecycle
    /// @{

    /**
     * @brief Opens a new session with @p config.
     *
     * An existing session is closed first and the stored configuration is
     * dropped. On success @p config is stored for later reconnection. On
     * failure the state is Disconnected, no configuration is stored and
     * @p done receives an error of kind Connection.
     */
    void connectToServer(const ConnectionConfig &config, StatusCallback done);

    /**
     * @brief Closes the session. The stored configuration is kept.
     */
    void disconnectFromServer(StatusCallback done = nullptr);

    /**
     * @brief Makes sure a live, logged-in session exists.
     *
     * Completes immediately when connected. Otherwise rebuilds the session
     * from the stored configuration; fails with kind Connection when no
     * configuration is stored or the login fails.
     */
    void ensureConnected(StatusCallback done);
    /// @}

signals:
    /**
     * @brief Emitted when the connection state changes.
     * @param state The new connection state.
     */
    void stateChanged(ConnectionManager::ConnectionState state);

    /**
     * @brief Emitted after connectToServer() succeeded.
     */
    void connected();

    /**
     * @brief Emitted after disconnectFromServer().
     */
    void disconnected();

    /**
     * @brief Emitted after ensureConnected() rebuilt the session.
     */
    void reconnected();

    /**
     * @brief Emitted when connecting or reconnecting fails.
     * @param message Error description.
     */
    void connectionError(const QString &message);

private:
    void setState(ConnectionState state);
    void openSession(const ConnectionConfig &config, StatusCallback done);
    void applyDefaultPath(const ConnectionConfig &config, const std::function<void()> &next);
    void discardSession();
    void finishReconnect(const FtpError &error);

    SessionFactory factory_;
    QPointer<IFtpSession> session_;
    std::optional<ConnectionConfig> config_;
    ConnectionState state_ = ConnectionState::Disconnected;

    bool reconnecting_ = false;
    QList<StatusCallback> reconnectWaiters_;
};

#endif // CONNECTIONMANAGER_H
