#ifndef FILEENTRY_H
#define FILEENTRY_H

#include <QList>
#include <QString>

#include <algorithm>

/**
 * @brief Represents a single entry in a local or remote directory listing.
 */
struct FileEntry {
    QString name;              ///< Name of the file or directory
    bool isDirectory = false;  ///< True if this entry is a directory

    /// @brief True for the synthetic ".." entry that leads to the parent.
    [[nodiscard]] bool isParentLink() const { return name == QLatin1String(".."); }

    [[nodiscard]] static FileEntry parentLink() { return FileEntry{QStringLiteral(".."), true}; }

    bool operator==(const FileEntry &other) const
    {
        return name == other.name && isDirectory == other.isDirectory;
    }
};

/**
 * @brief Sorts entries directories-first, then case-insensitively by name.
 */
inline void sortFileEntries(QList<FileEntry> &entries)
{
    std::stable_sort(entries.begin(), entries.end(),
                     [](const FileEntry &a, const FileEntry &b) {
        if (a.isDirectory != b.isDirectory) {
            return a.isDirectory;
        }
        return a.name.compare(b.name, Qt::CaseInsensitive) < 0;
    });
}

#endif // FILEENTRY_H
