#ifndef PATHUTILS_H
#define PATHUTILS_H

#include <QSet>
#include <QString>

/**
 * @brief Helpers for remote (POSIX) paths and local destination naming.
 *
 * Remote paths are always '/'-separated strings handled textually; they are
 * never resolved against the local filesystem. Local helpers use QDir/QFileInfo.
 */
class PathUtils
{
public:
    /**
     * @brief Joins a remote directory and an entry name with a single '/'.
     * @param base Remote directory. "/" acts as a bare prefix.
     * @param name Entry name to append.
     * @return The joined remote path.
     */
    static QString joinRemotePath(const QString &base, const QString &name);

    /**
     * @brief Returns the parent of a remote path.
     * @param path Remote path.
     * @return "/" for "/" itself or when the parent would be empty.
     *
     * Segments such as "." and ".." are not normalized.
     */
    static QString parentRemotePath(const QString &path);

    /**
     * @brief Returns the last segment of a remote path.
     */
    static QString remoteFileName(const QString &path);

    /**
     * @brief Quotes a path for a POSIX shell command line.
     * @param path The raw path.
     * @return The path wrapped in single quotes, with embedded quotes
     *         written as '\''. An empty path becomes ''.
     *
     * @note This is a minimal quoting helper for paths passed to remote
     * commands. It is not a general shell-injection defence.
     */
    static QString shellEscape(const QString &path);

    /**
     * @brief Picks a local path in @p dir that does not exist yet.
     * @param dir Destination directory.
     * @param fileName Desired file name.
     * @param reserved Paths already promised to other transfers.
     * @return dir/fileName if free, otherwise "dir/base (n)suffix" with the
     *         smallest n >= 1 that is free.
     *
     * The name is split at its first '.', so "archive.tar.gz" becomes
     * "archive (1).tar.gz".
     */
    static QString uniqueLocalPath(const QString &dir, const QString &fileName,
                                   const QSet<QString> &reserved = QSet<QString>());
};

#endif // PATHUTILS_H
