#include "sshtransport.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QProcess>

SshTransport::SshTransport(const SshTarget &target,
                           const QString &sshProgram,
                           const QString &scpProgram)
    : target_(target)
    , sshProgram_(sshProgram)
    , scpProgram_(scpProgram)
{
}

CommandResult SshTransport::list(const QString &remotePath)
{
    return run(sshProgram_, sshArguments(listCommand(remotePath)));
}

CommandResult SshTransport::stat(const QString &remotePath)
{
    return run(sshProgram_, sshArguments(statCommand(remotePath)));
}

CommandResult SshTransport::home()
{
    // A non-interactive session starts in the login directory
    return run(sshProgram_, sshArguments(QStringLiteral("pwd")));
}

CommandResult SshTransport::get(const QString &remotePath, const QString &localPath)
{
    return run(scpProgram_, scpArguments(remoteSpec(remotePath), localPath));
}

CommandResult SshTransport::put(const QString &localPath, const QString &remotePath)
{
    return run(scpProgram_, scpArguments(localPath, remoteSpec(remotePath)));
}

CommandResult SshTransport::mkdirParents(const QString &remotePath)
{
    return run(sshProgram_, sshArguments(mkdirCommand(remotePath)));
}

QString SshTransport::describeTarget() const
{
    return QStringLiteral("%1:%2").arg(target_.destination(), QString::number(target_.port));
}

QStringList SshTransport::sshArguments(const QString &remoteCommand) const
{
    QStringList args;
    args << QStringLiteral("-p") << QString::number(target_.port);
    if (!target_.identityFile.isEmpty()) {
        args << QStringLiteral("-i") << target_.identityFile;
    }
    if (!target_.proxyJump.isEmpty()) {
        args << QStringLiteral("-J") << target_.proxyJump;
    }
    // Never block a worker on an interactive password prompt
    args << QStringLiteral("-o") << QStringLiteral("BatchMode=yes");
    args << target_.destination() << remoteCommand;
    return args;
}

QStringList SshTransport::scpArguments(const QString &source, const QString &destination) const
{
    QStringList args;
    args << QStringLiteral("-q");
    // Legacy protocol: the remote shell unquotes the escaped path, SFTP mode would not
    args << QStringLiteral("-O");
    args << QStringLiteral("-P") << QString::number(target_.port);
    if (!target_.identityFile.isEmpty()) {
        args << QStringLiteral("-i") << target_.identityFile;
    }
    if (!target_.proxyJump.isEmpty()) {
        args << QStringLiteral("-J") << target_.proxyJump;
    }
    args << QStringLiteral("-o") << QStringLiteral("BatchMode=yes");
    args << source << destination;
    return args;
}

QString SshTransport::remoteSpec(const QString &remotePath) const
{
    return target_.destination() + QLatin1Char(':') + PathUtils::shellEscape(remotePath);
}

QString SshTransport::listCommand(const QString &remotePath)
{
    return QStringLiteral("LC_ALL=C ls -p -1 -- %1").arg(PathUtils::shellEscape(remotePath));
}

QString SshTransport::statCommand(const QString &remotePath)
{
    // GNU stat first, BSD stat as fallback
    const QString p = PathUtils::shellEscape(remotePath);
    return QStringLiteral("LC_ALL=C stat -c %s -- %1 2>/dev/null || stat -f %z -- %1 2>/dev/null").arg(p);
}

QString SshTransport::mkdirCommand(const QString &remotePath)
{
    return QStringLiteral("mkdir -p -- %1").arg(PathUtils::shellEscape(remotePath));
}

CommandResult SshTransport::run(const QString &program, const QStringList &arguments) const
{
    LOG_VERBOSE() << "Transport:" << program << arguments;

    CommandResult result;
    QProcess process;
    process.start(program, arguments);

    if (!process.waitForStarted(-1)) {
        result.errorString = process.errorString();
        qWarning() << "Transport: failed to start" << program << "-" << result.errorString;
        return result;
    }

    process.closeWriteChannel();
    process.waitForFinished(-1);

    result.standardOutput = process.readAllStandardOutput();
    result.standardError = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();

    if (process.exitStatus() == QProcess::CrashExit) {
        result.errorString = process.errorString();
        qWarning() << "Transport:" << program << "crashed -" << result.errorString;
        return result;
    }

    result.exitCode = process.exitCode();
    LOG_VERBOSE() << "Transport:" << program << "exited with" << result.exitCode;
    return result;
}
