#ifndef CONNECTIONCONFIG_H
#define CONNECTIONCONFIG_H

#include <QString>
#include <QVariantMap>

/**
 * @brief Everything needed to (re)open a session with the file server.
 *
 * Treated as immutable once passed to ConnectionManager::connectToServer();
 * the manager keeps a copy for transparent reconnection.
 */
struct ConnectionConfig {
    static constexpr quint16 DefaultPort = 21;  ///< Default FTP control port

    QString host;
    quint16 port = DefaultPort;
    QString username;              ///< Empty means "anonymous"
    QString password;
    bool secure = false;           ///< Explicit FTPS (AUTH TLS)
    QVariantMap secureOptions;     ///< e.g. {"rejectUnauthorized": false}
    bool passive = true;           ///< Only passive data connections are supported
    QString defaultRemotePath;     ///< Best-effort CWD target after login

    [[nodiscard]] bool isValid() const { return !host.isEmpty() && port != 0; }
};

#endif // CONNECTIONCONFIG_H
