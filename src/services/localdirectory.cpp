#include "localdirectory.h"

#include <QDir>
#include <QFileInfo>
#include <QObject>

std::optional<QList<FileEntry>> LocalDirectory::listLocal(const QString &path, QString *errorMessage)
{
    auto fail = [errorMessage](const QString &message) -> std::optional<QList<FileEntry>> {
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };

    QFileInfo info(path);
    if (!info.exists()) {
        return fail(QObject::tr("%1: No such file or directory").arg(path));
    }
    if (!info.isDir()) {
        return fail(QObject::tr("%1: Not a directory").arg(path));
    }

    QDir dir(path);
    if (!info.isReadable() || !info.isExecutable() || !dir.isReadable()) {
        return fail(QObject::tr("%1: Permission denied").arg(path));
    }

    const QFileInfoList infos = dir.entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
        QDir::NoSort);

    QList<FileEntry> entries;
    entries.reserve(infos.size());
    for (const QFileInfo &entryInfo : infos) {
        entries.append(FileEntry{entryInfo.fileName(), entryInfo.isDir()});
    }

    sortFileEntries(entries);
    return entries;
}

QString LocalDirectory::parentDirectory(const QString &path)
{
    QDir dir(path);
    if (dir.isRoot() || !dir.cdUp()) {
        return QString();
    }
    return dir.absolutePath();
}
