#ifndef SSHTRANSPORT_H
#define SSHTRANSPORT_H

#include <QStringList>

#include "itransport.h"

/**
 * @brief Connection parameters forwarded to ssh/scp.
 */
struct SshTarget {
    QString host;
    quint16 port = 22;
    QString user = QStringLiteral("root");
    QString identityFile;   ///< Optional private key passed with -i
    QString proxyJump;      ///< Optional jump host passed with -J

    [[nodiscard]] QString destination() const { return user + QLatin1Char('@') + host; }
    [[nodiscard]] bool isValid() const { return !host.isEmpty() && !user.isEmpty() && port != 0; }
};

/**
 * @brief Transport that runs the system ssh and scp clients.
 *
 * Each call starts its own QProcess and waits for it to finish, so the
 * object can be shared between worker threads. Remote paths embedded in
 * remote commands are quoted with PathUtils::shellEscape().
 */
class SshTransport : public ITransport
{
public:
    explicit SshTransport(const SshTarget &target,
                          const QString &sshProgram = QStringLiteral("ssh"),
                          const QString &scpProgram = QStringLiteral("scp"));

    CommandResult list(const QString &remotePath) override;
    CommandResult stat(const QString &remotePath) override;
    CommandResult home() override;
    CommandResult get(const QString &remotePath, const QString &localPath) override;
    CommandResult put(const QString &localPath, const QString &remotePath) override;
    CommandResult mkdirParents(const QString &remotePath) override;
    [[nodiscard]] QString describeTarget() const override;

    [[nodiscard]] const SshTarget &target() const { return target_; }

    /// @name Command construction (exposed for tests)
    /// @{
    [[nodiscard]] QStringList sshArguments(const QString &remoteCommand) const;
    [[nodiscard]] QStringList scpArguments(const QString &source, const QString &destination) const;
    [[nodiscard]] QString remoteSpec(const QString &remotePath) const;

    [[nodiscard]] static QString listCommand(const QString &remotePath);
    [[nodiscard]] static QString statCommand(const QString &remotePath);
    [[nodiscard]] static QString mkdirCommand(const QString &remotePath);
    /// @}

private:
    [[nodiscard]] CommandResult run(const QString &program, const QStringList &arguments) const;

    SshTarget target_;
    QString sshProgram_;
    QString scpProgram_;
};

#endif // SSHTRANSPORT_H
