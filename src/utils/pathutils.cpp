#include "pathutils.h"

#include <QDir>
#include <QFileInfo>

namespace {

bool isTaken(const QString &path, const QSet<QString> &reserved)
{
    // A dangling symlink does not "exist" but would still be written through
    QFileInfo info(path);
    return info.exists() || info.isSymLink() || reserved.contains(path);
}

} // namespace

QString PathUtils::joinRemotePath(const QString &base, const QString &name)
{
    if (base == QLatin1String("/")) {
        return QLatin1Char('/') + name;
    }
    if (base.endsWith(QLatin1Char('/'))) {
        return base + name;
    }
    return base + QLatin1Char('/') + name;
}

QString PathUtils::parentRemotePath(const QString &path)
{
    if (path == QLatin1String("/")) {
        return QStringLiteral("/");
    }

    QString trimmed = path;
    while (trimmed.size() > 1 && trimmed.endsWith(QLatin1Char('/'))) {
        trimmed.chop(1);
    }

    int slash = trimmed.lastIndexOf(QLatin1Char('/'));
    if (slash <= 0) {
        return QStringLiteral("/");
    }

    QString parent = trimmed.left(slash);
    while (parent.size() > 1 && parent.endsWith(QLatin1Char('/'))) {
        parent.chop(1);
    }
    return parent.isEmpty() ? QStringLiteral("/") : parent;
}

QString PathUtils::remoteFileName(const QString &path)
{
    QString trimmed = path;
    while (trimmed.size() > 1 && trimmed.endsWith(QLatin1Char('/'))) {
        trimmed.chop(1);
    }
    int slash = trimmed.lastIndexOf(QLatin1Char('/'));
    return slash < 0 ? trimmed : trimmed.mid(slash + 1);
}

QString PathUtils::shellEscape(const QString &path)
{
    if (path.isEmpty()) {
        return QStringLiteral("''");
    }

    QString escaped = path;
    escaped.replace(QLatin1Char('\''), QStringLiteral("'\\''"));
    return QLatin1Char('\'') + escaped + QLatin1Char('\'');
}

QString PathUtils::uniqueLocalPath(const QString &dir, const QString &fileName,
                                   const QSet<QString> &reserved)
{
    QString base = fileName;
    QString suffix;
    int dot = fileName.indexOf(QLatin1Char('.'));
    if (dot >= 0) {
        base = fileName.left(dot);
        suffix = fileName.mid(dot);
    }

    QDir directory(dir);
    QString candidate = directory.filePath(base + suffix);
    if (!isTaken(candidate, reserved)) {
        return candidate;
    }

    for (int n = 1;; ++n) {
        candidate = directory.filePath(QStringLiteral("%1 (%2)%3").arg(base, QString::number(n), suffix));
        if (!isTaken(candidate, reserved)) {
            return candidate;
        }
    }
}
