/**
 * @file profilestore.cpp
 * @brief Implementation of the ProfileStore INI reader/writer.
 */

#include "profilestore.h"

#include <QFileInfo>
#include <QSettings>

ProfileStore::ProfileStore(const QString &filePath)
    : filePath_(filePath)
{
}

FtpResult<ConnectionProfile> ProfileStore::load() const
{
    const QFileInfo info(filePath_);
    if (!info.exists() || !info.isReadable()) {
        return FtpResult<ConnectionProfile>::failure(
            FtpError::make(FtpErrorKind::Filesystem,
                           QStringLiteral("Cannot read profile '%1'").arg(filePath_)));
    }

    QSettings settings(filePath_, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        return FtpResult<ConnectionProfile>::failure(
            FtpError::make(FtpErrorKind::Filesystem,
                           QStringLiteral("Malformed profile '%1'").arg(filePath_)));
    }

    ConnectionProfile profile;
    profile.name = settings.value("name", info.completeBaseName()).toString();

    settings.beginGroup("connection");
    ConnectionConfig &config = profile.connection;
    config.host = settings.value("host").toString().trimmed();
    config.port = static_cast<quint16>(settings.value("port", ConnectionConfig::DefaultPort).toUInt());
    config.username = settings.value("username").toString();
    config.password = settings.value("password").toString();
    config.secure = settings.value("secure", false).toBool();
    config.passive = settings.value("passive", true).toBool();
    config.defaultRemotePath = settings.value("defaultRemotePath").toString();
    if (settings.contains("rejectUnauthorized")) {
        config.secureOptions.insert(QStringLiteral("rejectUnauthorized"),
                                    settings.value("rejectUnauthorized").toBool());
    }
    settings.endGroup();

    settings.beginGroup("sync");
    profile.syncFolder = settings.value("folder").toString();
    profile.syncRemoteRoot = settings.value("remoteRoot", QStringLiteral("/")).toString();
    // QSettings returns a single string for one value and a list for several
    const QVariant ignore = settings.value("ignore");
    QStringList patterns = ignore.toStringList();
    if (patterns.size() == 1) {
        patterns = patterns.first().split(QLatin1Char(','), Qt::SkipEmptyParts);
    }
    for (const QString &pattern : std::as_const(patterns)) {
        if (!pattern.trimmed().isEmpty()) {
            profile.ignorePatterns.append(pattern.trimmed());
        }
    }
    settings.endGroup();

    if (config.host.isEmpty()) {
        return FtpResult<ConnectionProfile>::failure(
            FtpError::make(FtpErrorKind::Connection,
                           QStringLiteral("Profile '%1' does not name a host").arg(filePath_)));
    }

    return FtpResult<ConnectionProfile>::success(profile);
}

FtpError ProfileStore::save(const ConnectionProfile &profile) const
{
    QSettings settings(filePath_, QSettings::IniFormat);
    settings.clear();

    settings.setValue("name", profile.name);

    settings.beginGroup("connection");
    const ConnectionConfig &config = profile.connection;
    settings.setValue("host", config.host);
    settings.setValue("port", config.port);
    settings.setValue("username", config.username);
    settings.setValue("password", config.password);
    settings.setValue("secure", config.secure);
    settings.setValue("passive", config.passive);
    settings.setValue("defaultRemotePath", config.defaultRemotePath);
    if (config.secureOptions.contains(QStringLiteral("rejectUnauthorized"))) {
        settings.setValue("rejectUnauthorized",
                          config.secureOptions.value(QStringLiteral("rejectUnauthorized")).toBool());
    }
    settings.endGroup();

    settings.beginGroup("sync");
    settings.setValue("folder", profile.syncFolder);
    settings.setValue("remoteRoot", profile.syncRemoteRoot);
    settings.setValue("ignore", profile.ignorePatterns);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        return FtpError::make(FtpErrorKind::Filesystem,
                              QStringLiteral("Cannot write profile '%1'").arg(filePath_));
    }
    return FtpError::none();
}
