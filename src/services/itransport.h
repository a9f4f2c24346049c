/**
 * @file itransport.h
 * @brief Interface for the external remote-file transport.
 *
 * This interface allows dependency injection of transports, enabling
 * runtime swapping between the ssh/scp implementation and mock
 * implementations for testing.
 */

#ifndef ITRANSPORT_H
#define ITRANSPORT_H

#include <QByteArray>
#include <QString>

/**
 * @brief Outcome of one blocking transport command.
 */
struct CommandResult {
    int exitCode = -1;           ///< Process exit code (-1 if it never ran)
    QByteArray standardOutput;   ///< Captured stdout
    QString standardError;       ///< Captured stderr, trimmed
    QString errorString;         ///< Set when the process failed to start or crashed

    /// @brief True when the command ran and exited with status 0.
    [[nodiscard]] bool isSuccess() const { return errorString.isEmpty() && exitCode == 0; }

    /**
     * @brief Human-readable failure description.
     * @param program Name of the program that ran, used as a prefix.
     */
    [[nodiscard]] QString failureMessage(const QString &program) const
    {
        if (!errorString.isEmpty()) {
            return QStringLiteral("%1: %2").arg(program, errorString);
        }
        QString message = QStringLiteral("%1 exited with status %2")
                              .arg(program, QString::number(exitCode));
        if (!standardError.isEmpty()) {
            message += QStringLiteral(": ") + standardError;
        }
        return message;
    }
};

/**
 * @brief Abstract interface for transport implementations.
 *
 * Every call blocks the calling thread until the external command finishes.
 * No timeout is applied. Implementations must allow concurrent calls from
 * several worker threads.
 *
 * @par Example usage:
 * @code
 * // Production code
 * auto transport = std::make_shared<SshTransport>(target);
 *
 * // Test code
 * auto transport = std::make_shared<MockTransport>();
 *
 * CommandResult result = transport->get("/etc/hosts", "/tmp/hosts");
 * if (!result.isSuccess()) {
 *     qWarning() << result.failureMessage("scp");
 * }
 * @endcode
 */
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @name Queries
    /// @{

    /**
     * @brief Lists a remote directory, one entry per line, '/' marking directories.
     * @param remotePath Directory to list.
     */
    virtual CommandResult list(const QString &remotePath) = 0;

    /**
     * @brief Prints the size of a remote file in bytes.
     * @param remotePath File to probe.
     */
    virtual CommandResult stat(const QString &remotePath) = 0;

    /**
     * @brief Prints the login (home) directory of the remote user.
     */
    virtual CommandResult home() = 0;
    /// @}

    /// @name Transfers
    /// @{

    /**
     * @brief Copies a remote file to a local path.
     * @param remotePath Source on the remote host.
     * @param localPath Destination on the local filesystem.
     */
    virtual CommandResult get(const QString &remotePath, const QString &localPath) = 0;

    /**
     * @brief Copies a local file to a remote path.
     * @param localPath Source on the local filesystem.
     * @param remotePath Destination on the remote host.
     */
    virtual CommandResult put(const QString &localPath, const QString &remotePath) = 0;

    /**
     * @brief Creates a remote directory and any missing parents. Idempotent.
     * @param remotePath Directory to create.
     */
    virtual CommandResult mkdirParents(const QString &remotePath) = 0;
    /// @}

    /**
     * @brief Short description of the remote end for titles and logs.
     * @return For example "root@example.com:22".
     */
    [[nodiscard]] virtual QString describeTarget() const = 0;
};

#endif // ITRANSPORT_H
