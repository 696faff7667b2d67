#ifndef FTPENTRY_H
#define FTPENTRY_H

#include <QDateTime>
#include <QMetaType>
#include <QString>

/**
 * @brief Represents a single entry in a raw FTP directory listing.
 *
 * This is what the transport parses off the data connection; it carries
 * no path. DirectoryLister turns it into a RemoteEntry.
 */
struct FtpEntry {
    QString name;              ///< Name of the file or directory
    bool isDirectory = false;  ///< True if this entry is a directory
    qint64 size = 0;           ///< Size in bytes
    QString permissions;       ///< Unix-style permission string
    QDateTime modified;        ///< Last modification timestamp (invalid if unknown)
};

Q_DECLARE_METATYPE(FtpEntry)

#endif // FTPENTRY_H
