/**
 * @file profilestore.h
 * @brief Connection profiles stored as INI files.
 */

#ifndef PROFILESTORE_H
#define PROFILESTORE_H

#include <QString>
#include <QStringList>

#include "connectionconfig.h"
#include "ftperror.h"

/**
 * @brief A named server connection plus its synchronization settings.
 */
struct ConnectionProfile {
    QString name;
    ConnectionConfig connection;
    QString syncFolder;           ///< Local parent folder for snapshots
    QString syncRemoteRoot = QStringLiteral("/");
    QStringList ignorePatterns;
};

/**
 * @brief Reads and writes ConnectionProfile as an INI file.
 *
 * Layout:
 * @code
 * name=My site
 *
 * [connection]
 * host=ftp.example.com
 * port=21
 * username=u
 * password=p
 * secure=false
 * rejectUnauthorized=true
 * defaultRemotePath=/web
 *
 * [sync]
 * folder=/home/me/backups
 * remoteRoot=/web
 * ignore=node_modules, /web/private
 * @endcode
 *
 * The password is stored in plain text; leave it out of the file and pass
 * it on the command line when that matters.
 */
class ProfileStore
{
public:
    explicit ProfileStore(const QString &filePath);

    [[nodiscard]] QString filePath() const { return filePath_; }

    /**
     * @brief Loads the profile; fails with kind Filesystem if the file is
     *        missing or unreadable and with kind Connection if it names no host.
     */
    [[nodiscard]] FtpResult<ConnectionProfile> load() const;

    /**
     * @brief Writes the profile, replacing the file's previous content.
     */
    [[nodiscard]] FtpError save(const ConnectionProfile &profile) const;

private:
    QString filePath_;
};

#endif // PROFILESTORE_H
