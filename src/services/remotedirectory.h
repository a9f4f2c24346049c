#ifndef REMOTEDIRECTORY_H
#define REMOTEDIRECTORY_H

#include <QByteArray>
#include <QList>
#include <QString>

#include <memory>
#include <optional>

#include "fileentry.h"

class ITransport;

/**
 * @brief Directory listing and size probing on the remote host.
 *
 * Listing is deliberately permissive: any failure yields an empty list so
 * the browser stays usable against unreadable paths. Callers that need to
 * tell "empty" from "unreachable" pass the @c ok out-parameter.
 *
 * Safe to use from worker threads as long as the transport is.
 */
class RemoteDirectory
{
public:
    explicit RemoteDirectory(std::shared_ptr<ITransport> transport);

    /**
     * @brief Lists a remote directory.
     * @param path Remote directory path.
     * @param ok Optional; set to false when the transport failed.
     * @return Sorted entries (directories first), empty on failure.
     */
    [[nodiscard]] QList<FileEntry> listRemote(const QString &path, bool *ok = nullptr) const;

    /**
     * @brief Probes the size of a remote file.
     * @return The size in bytes, or std::nullopt if the probe failed or
     *         printed nothing parsable.
     */
    [[nodiscard]] std::optional<quint64> probeRemoteSize(const QString &path) const;

    /**
     * @brief Resolves the remote user's home directory.
     * @return Absolute path, or an empty string if it could not be resolved.
     */
    [[nodiscard]] QString homeDirectory() const;

    /// @brief Parses `ls -p -1` output.
    [[nodiscard]] static QList<FileEntry> parseListing(const QByteArray &output);

    /// @brief Returns the first line of @p output that parses as an unsigned integer.
    [[nodiscard]] static std::optional<quint64> parseSize(const QByteArray &output);

    [[nodiscard]] std::shared_ptr<ITransport> transport() const { return transport_; }

private:
    std::shared_ptr<ITransport> transport_;
};

#endif // REMOTEDIRECTORY_H
