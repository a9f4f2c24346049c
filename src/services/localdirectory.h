#ifndef LOCALDIRECTORY_H
#define LOCALDIRECTORY_H

#include <QList>
#include <QString>

#include <optional>

#include "fileentry.h"

/**
 * @brief Lists directories on the local filesystem.
 *
 * Unlike RemoteDirectory, failures are reported to the caller: a local
 * listing error is a real problem the operator has to see.
 */
class LocalDirectory
{
public:
    /**
     * @brief Lists a local directory, hidden entries included.
     * @param path Directory path.
     * @param errorMessage Optional; receives a description on failure.
     * @return Sorted entries (directories first), or std::nullopt if the
     *         directory is missing, not a directory, or unreadable.
     */
    [[nodiscard]] static std::optional<QList<FileEntry>> listLocal(const QString &path,
                                                                   QString *errorMessage = nullptr);

    /**
     * @brief Returns the parent of a local directory.
     * @return The absolute parent path, or an empty string at the root.
     */
    [[nodiscard]] static QString parentDirectory(const QString &path);
};

#endif // LOCALDIRECTORY_H
