#include <QApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QSettings>
#include "mainwindow.h"
#include "services/hoststore.h"
#include "services/sshtransport.h"
#include "utils/appconfig.h"
#include "utils/logging.h"
#include "version.h"

#include <cstdio>
#include <memory>

namespace {

QString expandTilde(const QString &path)
{
    if (path == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

void printError(const QString &message)
{
    std::fprintf(stderr, "twinscp: %s\n", qPrintable(message));
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("twinscp");
    app.setApplicationVersion(TWINSCP_VERSION);
    app.setOrganizationName("twinscp");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Dual-pane local/remote file browser over ssh with background transfers");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("alias", "Saved host from the sshm host database.", "[alias]");

    QCommandLineOption hostOption("host", "Remote host name or address.", "host");
    QCommandLineOption portOption("port", "ssh port (default 22).", "port");
    QCommandLineOption userOption("user", "Remote user (default root).", "user");
    QCommandLineOption identityOption("identity", "Private key file passed to ssh/scp.", "file");
    QCommandLineOption jumpOption("jump", "ProxyJump host passed to ssh/scp.", "jump");
    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(hostOption);
    parser.addOption(portOption);
    parser.addOption(userOption);
    parser.addOption(identityOption);
    parser.addOption(jumpOption);
    parser.addOption(verboseOption);

    parser.process(app);

    // Set verbose logging flag
    twinscp::verboseLogging = parser.isSet(verboseOption);

    if (twinscp::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    SshTarget target;

    // Saved host first, explicit options override it
    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1) {
        printError(QStringLiteral("expected at most one host alias"));
        return 1;
    }
    if (!positional.isEmpty()) {
        HostStore store;
        QString error;
        const QString storePath = HostStore::defaultPath();
        if (!store.load(storePath, &error)) {
            qWarning() << "Could not load host database:" << error;
        }
        auto host = store.find(positional.first());
        if (!host) {
            printError(QStringLiteral("unknown host alias '%1' (looked in %2)")
                           .arg(positional.first(), storePath));
            return 1;
        }
        target.host = host->host;
        target.port = static_cast<quint16>(host->port);
        target.user = host->username;
        target.identityFile = host->identityFile;
        target.proxyJump = host->proxyJump;
    }

    if (parser.isSet(hostOption)) {
        target.host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        bool ok = false;
        const uint port = parser.value(portOption).toUInt(&ok);
        if (!ok || port == 0 || port > 65535) {
            printError(QStringLiteral("invalid port '%1'").arg(parser.value(portOption)));
            return 1;
        }
        target.port = static_cast<quint16>(port);
    }
    if (parser.isSet(userOption)) {
        target.user = parser.value(userOption);
    }
    if (parser.isSet(identityOption)) {
        target.identityFile = parser.value(identityOption);
    }
    if (parser.isSet(jumpOption)) {
        target.proxyJump = parser.value(jumpOption);
    }
    target.identityFile = expandTilde(target.identityFile);

    if (!target.isValid()) {
        printError(QStringLiteral("no remote host given; pass an alias or --host"));
        parser.showHelp(1);
    }

    QSettings settings;
    const AppConfig config = AppConfig::load(settings);

    auto transport = std::make_shared<SshTransport>(target, config.sshProgram, config.scpProgram);
    LOG_VERBOSE() << "Connecting to" << transport->describeTarget()
                  << "via" << config.sshProgram << "/" << config.scpProgram;

    MainWindow window(config, transport);
    window.show();
    window.start();

    return app.exec();
}
