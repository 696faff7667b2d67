/**
 * @file directorylister.h
 * @brief Directory listing with ordered fallback strategies.
 *
 * FTP servers disagree about which LIST forms they accept: some reject
 * absolute paths, some only list the working directory, some refuse to CWD
 * across several levels at once. DirectoryLister tries a fixed list of
 * named strategies and keeps the first one that succeeds.
 */

#ifndef DIRECTORYLISTER_H
#define DIRECTORYLISTER_H

#include <QList>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>
#include <vector>

#include "connectionmanager.h"
#include "remoteentry.h"
#include "workingdirectoryguard.h"

/**
 * @brief Lists remote directories, resolving paths the server may reject.
 *
 * Strategies, in order:
 * - @c direct: LIST with the path itself (an empty argument for root);
 *   for root the base path is taken from PWD.
 * - @c cd-then-list: CWD into the path, LIST the working directory, take
 *   the base path from PWD.
 * - @c segment-walk: CWD one segment at a time ignoring failures, then
 *   LIST and PWD.
 *
 * listFiles() may leave the working directory anywhere. listFilesReadonly()
 * restores it on every exit path and returns an empty list instead of an
 * error when every strategy fails.
 *
 * segment-walk can end up listing an ancestor of the requested directory.
 * listFilesExact() and listAll() reject such a listing, so a directory that
 * cannot be entered is reported as unreadable rather than replaced by its
 * parent.
 *
 * None of these methods serialize themselves; run them through FtpTaskQueue.
 */
class DirectoryLister : public QObject
{
    Q_OBJECT

public:
    using EntriesCallback = ResultCallback<QList<RemoteEntry>>;
    using TreeCallback = ResultCallback<std::vector<RemoteTreeNode>>;

    /**
     * @brief Entries of one directory and the directory they were read from.
     */
    struct Listing {
        QString basePath;
        QList<RemoteEntry> entries;
    };
    using ListingCallback = ResultCallback<Listing>;

    /**
     * @brief One way of obtaining a listing.
     */
    struct Strategy {
        QString name;
        std::function<void(IFtpSession *session, const QString &path, ListingCallback done)> run;
    };

    explicit DirectoryLister(ConnectionManager *connection, QObject *parent = nullptr);

    /**
     * @brief Lists @p path; fails with kind Listing when all strategies fail.
     */
    void listFiles(const QString &path, EntriesCallback done);

    /**
     * @brief Like listFiles(), but only accepts a listing of @p path itself.
     *
     * Root is exempt: it always lists the working directory.
     */
    void listFilesExact(const QString &path, EntriesCallback done);

    /**
     * @brief Lists @p path and restores the working directory afterwards.
     *
     * Never fails because of the listing itself (an empty list is returned);
     * only a connection failure is reported.
     */
    void listFilesReadonly(const QString &path, EntriesCallback done);

    /**
     * @brief Lists @p path recursively.
     *
     * Every level must list the directory asked for (see listFilesExact()).
     * Subdirectories that cannot be listed get no children. The working
     * directory is restored afterwards.
     */
    void listAll(const QString &path, TreeCallback done);

    /// @brief The strategies in the order they are tried
    [[nodiscard]] static const std::vector<Strategy> &strategies();

    /**
     * @brief Converts raw transport entries, joining names onto @p basePath.
     */
    [[nodiscard]] static QList<RemoteEntry> toRemoteEntries(const QList<FtpEntry> &entries,
                                                            const QString &basePath);

private:
    void runStrategies(IFtpSession *session, const QString &path, bool exact, EntriesCallback done);
    struct TreeLevel;

    void buildTree(IFtpSession *session, const QString &path, TreeCallback done);
    void fillChildren(IFtpSession *session, const std::shared_ptr<TreeLevel> &level,
                      TreeCallback done);

    static void listDirect(IFtpSession *session, const QString &path, ListingCallback done);
    static void listAfterCd(IFtpSession *session, const QString &path, ListingCallback done);
    static void listBySegments(IFtpSession *session, const QString &path, ListingCallback done);

    ConnectionManager *connection_ = nullptr;
};

#endif // DIRECTORYLISTER_H
