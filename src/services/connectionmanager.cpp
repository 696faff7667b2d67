#include "connectionmanager.h"

#include "utils/logging.h"

#include <QDebug>

#include <utility>

ConnectionManager::ConnectionManager(SessionFactory factory, QObject *parent)
    : QObject(parent)
    , factory_(std::move(factory))
{
}

ConnectionManager::~ConnectionManager()
{
    reconnectWaiters_.clear();
    // The session is a child and goes away with us
    if (session_) {
        session_->disconnect(this);
    }
}

bool ConnectionManager::isConnected() const
{
    return state_ == ConnectionState::Connected && session_ && !session_->isClosed();
}

void ConnectionManager::setState(ConnectionState state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

void ConnectionManager::discardSession()
{
    if (!session_) {
        return;
    }
    IFtpSession *old = session_;
    session_ = nullptr;
    old->disconnect(this);
    // May be called from one of the session's own callbacks
    old->deleteLater();
}

void ConnectionManager::connectToServer(const ConnectionConfig &config, StatusCallback done)
{
    if (!config.isValid()) {
        const QString message = tr("FTP connection failed: no host configured");
        emit connectionError(message);
        if (done) {
            done(FtpError::make(FtpErrorKind::Connection, message));
        }
        return;
    }

    auto connectFresh = [this, config, done]() {
        discardSession();
        // A failed connect must not leave the previous server for ensureConnected()
        config_.reset();
        setState(ConnectionState::Connecting);

        openSession(config, [this, config, done](const FtpError &error) {
            if (error.isError()) {
                setState(ConnectionState::Disconnected);
                emit connectionError(error.message);
                if (done) {
                    done(error);
                }
                return;
            }

            config_ = config;
            setState(ConnectionState::Connected);
            qDebug() << "ConnectionManager: Connected to" << config.host << ":" << config.port;
            emit connected();
            if (done) {
                done(FtpError::none());
            }
        });
    };

    if (session_ && !session_->isClosed()) {
        qDebug() << "ConnectionManager: Replacing existing connection";
        disconnectFromServer([connectFresh](const FtpError &) { connectFresh(); });
        return;
    }
    connectFresh();
}

void ConnectionManager::disconnectFromServer(StatusCallback done)
{
    const bool wasConnected = state_ != ConnectionState::Disconnected;

    auto finish = [this, wasConnected, done]() {
        discardSession();
        setState(ConnectionState::Disconnected);
        if (wasConnected) {
            emit disconnected();
        }
        if (done) {
            done(FtpError::none());
        }
    };

    if (!session_ || session_->isClosed()) {
        finish();
        return;
    }

    // Don't let the session's own disconnected() race the explicit close
    session_->disconnect(this);
    session_->close([finish](const FtpError &error) {
        if (error.isError()) {
            qWarning() << "ConnectionManager: Error while closing session:" << error.message;
        }
        finish();
    });
}

void ConnectionManager::ensureConnected(StatusCallback done)
{
    if (isConnected()) {
        if (done) {
            done(FtpError::none());
        }
        return;
    }

    if (reconnecting_) {
        LOG_VERBOSE() << "ConnectionManager: Waiting for reconnect in progress";
        reconnectWaiters_.append(done);
        return;
    }

    if (!config_) {
        const FtpError error = FtpError::make(FtpErrorKind::Connection,
                                              tr("Not connected to FTP server"));
        if (done) {
            done(error);
        }
        return;
    }

    qDebug() << "ConnectionManager: Session closed, reconnecting to" << config_->host;
    reconnecting_ = true;
    reconnectWaiters_.append(done);
    discardSession();
    setState(ConnectionState::Reconnecting);

    openSession(*config_, [this](const FtpError &error) { finishReconnect(error); });
}

void ConnectionManager::finishReconnect(const FtpError &error)
{
    reconnecting_ = false;

    if (error.isError()) {
        qWarning() << "ConnectionManager: Reconnect failed:" << error.message;
        setState(ConnectionState::Disconnected);
        emit connectionError(error.message);
    } else {
        setState(ConnectionState::Connected);
        emit reconnected();
    }

    const QList<StatusCallback> waiters = std::exchange(reconnectWaiters_, {});
    for (const StatusCallback &waiter : waiters) {
        if (waiter) {
            waiter(error);
        }
    }
}

void ConnectionManager::openSession(const ConnectionConfig &config, StatusCallback done)
{
    IFtpSession *session = factory_ ? factory_(this) : nullptr;
    if (!session) {
        done(FtpError::make(FtpErrorKind::Connection,
                            tr("FTP connection failed: no session available")));
        return;
    }
    session_ = session;

    QPointer<IFtpSession> guard(session);
    session->open(config, [this, guard, config, done](const FtpError &error) {
        if (!guard || guard != session_) {
            // Superseded by a newer session
            done(FtpError::make(FtpErrorKind::Connection,
                                tr("FTP connection failed: connection was replaced")));
            return;
        }
        if (error.isError()) {
            qWarning() << "ConnectionManager: Login failed:" << error.message;
            discardSession();
            done(FtpError::make(FtpErrorKind::Connection,
                                tr("FTP connection failed: %1").arg(error.message)));
            return;
        }

        connect(guard.data(), &IFtpSession::disconnected, this, []() {
            LOG_VERBOSE() << "ConnectionManager: Session reported disconnect";
            // Rebuilt lazily by the next ensureConnected()
        });

        applyDefaultPath(config, [done]() { done(FtpError::none()); });
    });
}

void ConnectionManager::applyDefaultPath(const ConnectionConfig &config,
                                         const std::function<void()> &next)
{
    const QString path = config.defaultRemotePath;
    if (path.isEmpty() || path == QLatin1String("/") || !session_) {
        next();
        return;
    }

    session_->cd(path, [path, next](const FtpError &error) {
        if (error.isError()) {
            qWarning() << "ConnectionManager: Cannot change to default path" << path
                       << ":" << error.message;
        } else {
            LOG_VERBOSE() << "ConnectionManager: Working directory set to" << path;
        }
        next();
    });
}
