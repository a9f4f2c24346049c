#include "remotedirectory.h"
#include "itransport.h"
#include "utils/logging.h"

#include <utility>

RemoteDirectory::RemoteDirectory(std::shared_ptr<ITransport> transport)
    : transport_(std::move(transport))
{
}

QList<FileEntry> RemoteDirectory::listRemote(const QString &path, bool *ok) const
{
    CommandResult result = transport_->list(path);
    if (ok) {
        *ok = result.isSuccess();
    }

    if (!result.isSuccess()) {
        LOG_VERBOSE() << "RemoteDirectory: listing" << path << "failed:"
                      << result.failureMessage(QStringLiteral("ls"));
        return {};
    }

    return parseListing(result.standardOutput);
}

std::optional<quint64> RemoteDirectory::probeRemoteSize(const QString &path) const
{
    CommandResult result = transport_->stat(path);
    if (!result.isSuccess()) {
        LOG_VERBOSE() << "RemoteDirectory: size probe for" << path << "failed";
        return std::nullopt;
    }
    return parseSize(result.standardOutput);
}

QString RemoteDirectory::homeDirectory() const
{
    CommandResult result = transport_->home();
    if (!result.isSuccess()) {
        return QString();
    }

    const QList<QByteArray> lines = result.standardOutput.split('\n');
    for (const QByteArray &line : lines) {
        QString candidate = QString::fromUtf8(line).trimmed();
        if (candidate.startsWith(QLatin1Char('/'))) {
            return candidate;
        }
    }
    return QString();
}

QList<FileEntry> RemoteDirectory::parseListing(const QByteArray &output)
{
    QList<FileEntry> entries;

    const QList<QByteArray> lines = output.split('\n');
    for (const QByteArray &rawLine : lines) {
        QString line = QString::fromUtf8(rawLine).trimmed();
        if (line.isEmpty()) {
            continue;
        }

        FileEntry entry;
        entry.isDirectory = line.endsWith(QLatin1Char('/'));
        if (entry.isDirectory) {
            while (line.endsWith(QLatin1Char('/'))) {
                line.chop(1);
            }
        }
        entry.name = line;
        if (!entry.name.isEmpty() && entry.name != QLatin1String(".")
            && entry.name != QLatin1String("..")) {
            entries.append(entry);
        }
    }

    sortFileEntries(entries);
    return entries;
}

std::optional<quint64> RemoteDirectory::parseSize(const QByteArray &output)
{
    const QList<QByteArray> lines = output.split('\n');
    for (const QByteArray &line : lines) {
        QByteArray trimmed = line.trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }
        bool ok = false;
        quint64 value = trimmed.toULongLong(&ok);
        if (ok) {
            return value;
        }
    }
    return std::nullopt;
}
