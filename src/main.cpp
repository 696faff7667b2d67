#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include "commandrunner.h"
#include "services/errorhandler.h"
#include "services/profilestore.h"
#include "services/remotefileservice.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("ftpsync");
    app.setApplicationVersion(FTPSYNC_VERSION);
    app.setOrganizationName("ftpsync");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Resilient FTP/FTPS client with snapshot synchronization");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption profileOption("profile", "Load connection settings from an INI profile", "file");
    QCommandLineOption hostOption("host", "Server host name", "host");
    QCommandLineOption portOption("port", "Control port (default 21)", "port");
    QCommandLineOption userOption("user", "User name (default anonymous)", "name");
    QCommandLineOption passwordOption("password", "Password", "password");
    QCommandLineOption secureOption("secure", "Use explicit FTPS (AUTH TLS)");
    QCommandLineOption insecureOption("insecure", "Accept any TLS certificate");
    QCommandLineOption defaultPathOption("default-path", "Directory to enter after login", "path");
    QCommandLineOption ignoreOption("ignore", "Ignore rule for sync (repeatable)", "pattern");

    parser.addOptions({verboseOption, profileOption, hostOption, portOption, userOption,
                       passwordOption, secureOption, insecureOption, defaultPathOption,
                       ignoreOption});
    parser.addPositionalArgument("command", CommandRunner::usage());
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    parser.process(app);

    // Set verbose logging flag
    ftpsync::verboseLogging = parser.isSet(verboseOption);

    if (ftpsync::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    QTextStream err(stderr);
    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        err << parser.helpText() << Qt::endl;
        return CommandRunner::ExitUsage;
    }

    CommandRunner::Request request;
    request.command = positional.takeFirst();
    request.arguments = positional;

    // Profile first, command line options override it
    if (parser.isSet(profileOption)) {
        const FtpResult<ConnectionProfile> profile = ProfileStore(parser.value(profileOption)).load();
        if (!profile.ok()) {
            err << profile.error.message << Qt::endl;
            return CommandRunner::ExitUsage;
        }
        request.config = profile.value.connection;
        request.syncFolder = profile.value.syncFolder;
        request.syncRemoteRoot = profile.value.syncRemoteRoot;
        request.ignoreRules = IgnoreRuleSet(profile.value.ignorePatterns);
    }

    ConnectionConfig &config = request.config;
    if (parser.isSet(hostOption)) {
        config.host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const uint port = parser.value(portOption).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            err << "Invalid port: " << parser.value(portOption) << Qt::endl;
            return CommandRunner::ExitUsage;
        }
        config.port = static_cast<quint16>(port);
    }
    if (parser.isSet(userOption)) {
        config.username = parser.value(userOption);
    }
    if (parser.isSet(passwordOption)) {
        config.password = parser.value(passwordOption);
    }
    if (parser.isSet(secureOption)) {
        config.secure = true;
    }
    if (parser.isSet(insecureOption)) {
        config.secureOptions.insert("rejectUnauthorized", false);
    }
    if (parser.isSet(defaultPathOption)) {
        config.defaultRemotePath = parser.value(defaultPathOption);
    }
    for (const QString &pattern : parser.values(ignoreOption)) {
        request.ignoreRules.add(pattern);
    }

    RemoteFileService service(RemoteFileService::defaultSessionFactory());
    // Failures reach stderr through the Qt message handler
    ErrorHandler errors;

    CommandRunner runner(&service, &errors);
    QObject::connect(&runner, &CommandRunner::finished, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    });
    // Start once the event loop runs so exit() is never called before exec()
    QMetaObject::invokeMethod(&runner, [&runner, request]() { runner.start(request); },
                              Qt::QueuedConnection);

    return app.exec();
}
