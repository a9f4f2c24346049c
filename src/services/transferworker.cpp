#include "transferworker.h"
#include "itransport.h"
#include "progresschannel.h"
#include "remotedirectory.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QThread>

#include <utility>

namespace {

bool scanLocalDirectory(const QString &localDir, const QString &relativeDir,
                        QList<TransferWorker::PlannedFile> &files, QStringList &directories,
                        QString *unreadableDir)
{
    const QFileInfo dirInfo(localDir);
    if (!dirInfo.isDir() || !dirInfo.isReadable() || !dirInfo.isExecutable()) {
        if (unreadableDir) {
            *unreadableDir = localDir;
        }
        return false;
    }

    const QFileInfoList infos = QDir(localDir).entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
        QDir::DirsFirst | QDir::Name | QDir::IgnoreCase);

    for (const QFileInfo &info : infos) {
        const QString relativePath = relativeDir.isEmpty()
            ? info.fileName()
            : relativeDir + QLatin1Char('/') + info.fileName();

        if (info.isDir()) {
            if (info.isSymLink()) {
                LOG_VERBOSE() << "TransferWorker: skipping symlinked directory" << info.filePath();
                continue;
            }
            directories << relativePath;
            if (!scanLocalDirectory(info.filePath(), relativePath, files, directories, unreadableDir)) {
                return false;
            }
        } else {
            TransferWorker::PlannedFile file;
            file.sourcePath = info.filePath();
            file.relativePath = relativePath;
            file.size = static_cast<quint64>(qMax<qint64>(0, info.size()));
            files << file;
        }
    }
    return true;
}

} // namespace

TransferWorker::TransferWorker(std::shared_ptr<ITransport> transport,
                               std::shared_ptr<ProgressChannel> channel)
    : transport_(std::move(transport))
    , channel_(std::move(channel))
{
}

void TransferWorker::run(const TransferJob &job)
{
    LOG_VERBOSE() << "TransferWorker: job" << job.id << transferKindToString(job.kind)
                  << job.sourcePath << "->" << job.destPath;

    if (job.kind == TransferKind::Download) {
        if (job.isDirectory) {
            downloadFolder(job);
        } else {
            downloadFile(job);
        }
    } else {
        if (job.isDirectory) {
            uploadFolder(job);
        } else {
            uploadFile(job);
        }
    }
}

QThread *TransferWorker::start(std::shared_ptr<ITransport> transport,
                               std::shared_ptr<ProgressChannel> channel,
                               const TransferJob &job)
{
    QThread *thread = QThread::create([transport, channel, job]() {
        TransferWorker worker(transport, channel);
        worker.run(job);
    });
    thread->setObjectName(QStringLiteral("transfer-%1").arg(job.id));
    QObject::connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();
    return thread;
}

void TransferWorker::downloadFile(const TransferJob &job)
{
    CommandResult result = transport_->get(job.sourcePath, job.destPath);
    if (!result.isSuccess()) {
        finish(job, result.failureMessage(QStringLiteral("scp")));
        return;
    }
    finish(job);
}

void TransferWorker::downloadFolder(const TransferJob &job)
{
    QList<PlannedFile> files;
    QStringList directories;
    if (!scanRemoteTree(job.sourcePath, files, directories)) {
        finish(job, QObject::tr("Cannot list remote folder %1").arg(job.sourcePath));
        return;
    }

    quint64 bytesTotal = 0;
    for (const PlannedFile &file : files) {
        bytesTotal += file.size;
    }
    const int filesTotal = files.size();
    channel_->send(ProgressEvent::progress(job, job.fileName, 0, filesTotal, 0, bytesTotal));

    QDir localRoot(job.destPath);
    if (!QDir().mkpath(job.destPath)) {
        finish(job, QObject::tr("Cannot create local directory %1").arg(job.destPath));
        return;
    }
    for (const QString &directory : directories) {
        if (!localRoot.mkpath(directory)) {
            finish(job, QObject::tr("Cannot create local directory %1").arg(localRoot.filePath(directory)));
            return;
        }
    }

    int filesDone = 0;
    quint64 bytesDone = 0;
    for (const PlannedFile &file : files) {
        CommandResult result = transport_->get(file.sourcePath, localRoot.filePath(file.relativePath));
        if (!result.isSuccess()) {
            finish(job, QObject::tr("%1: %2").arg(file.relativePath,
                                                   result.failureMessage(QStringLiteral("scp"))));
            return;
        }

        ++filesDone;
        bytesDone += file.size;
        channel_->send(ProgressEvent::progress(job, file.relativePath, filesDone, filesTotal,
                                               bytesDone, bytesTotal));
    }

    finish(job);
}

void TransferWorker::uploadFile(const TransferJob &job)
{
    const quint64 size = job.expectedTotalBytes.value_or(0);
    channel_->send(ProgressEvent::progress(job, job.fileName, 0, 1, 0, size));

    const QString remoteDir = PathUtils::parentRemotePath(job.destPath);
    CommandResult mkdir = transport_->mkdirParents(remoteDir);
    if (!mkdir.isSuccess()) {
        finish(job, QObject::tr("Cannot create remote directory %1: %2")
                        .arg(remoteDir, mkdir.failureMessage(QStringLiteral("mkdir"))));
        return;
    }

    CommandResult result = transport_->put(job.sourcePath, job.destPath);
    if (!result.isSuccess()) {
        finish(job, result.failureMessage(QStringLiteral("scp")));
        return;
    }

    channel_->send(ProgressEvent::progress(job, job.fileName, 1, 1, size, size));
    finish(job);
}

void TransferWorker::uploadFolder(const TransferJob &job)
{
    QList<PlannedFile> files;
    QStringList directories;
    QString unreadableDir;
    if (!scanLocalTree(job.sourcePath, files, directories, &unreadableDir)) {
        finish(job, QObject::tr("Cannot read local folder %1").arg(unreadableDir));
        return;
    }

    quint64 bytesTotal = 0;
    for (const PlannedFile &file : files) {
        bytesTotal += file.size;
    }
    const int filesTotal = files.size();
    channel_->send(ProgressEvent::progress(job, job.fileName, 0, filesTotal, 0, bytesTotal));

    QStringList remoteDirectories;
    remoteDirectories << job.destPath;
    for (const QString &directory : directories) {
        remoteDirectories << PathUtils::joinRemotePath(job.destPath, directory);
    }

    // Any directory that cannot be created aborts the whole folder
    for (const QString &remoteDir : remoteDirectories) {
        CommandResult mkdir = transport_->mkdirParents(remoteDir);
        if (!mkdir.isSuccess()) {
            finish(job, QObject::tr("Cannot create remote directory %1: %2")
                            .arg(remoteDir, mkdir.failureMessage(QStringLiteral("mkdir"))));
            return;
        }
    }

    int filesDone = 0;
    quint64 bytesDone = 0;
    for (const PlannedFile &file : files) {
        const QString remotePath = PathUtils::joinRemotePath(job.destPath, file.relativePath);
        CommandResult result = transport_->put(file.sourcePath, remotePath);
        if (!result.isSuccess()) {
            finish(job, QObject::tr("%1: %2").arg(file.relativePath,
                                                   result.failureMessage(QStringLiteral("scp"))));
            return;
        }

        ++filesDone;
        bytesDone += file.size;
        channel_->send(ProgressEvent::progress(job, file.relativePath, filesDone, filesTotal,
                                               bytesDone, bytesTotal));
    }

    finish(job);
}

bool TransferWorker::scanRemoteTree(const QString &remoteRoot, QList<PlannedFile> &files,
                                    QStringList &directories) const
{
    bool rootListed = false;
    scanRemoteDirectory(remoteRoot, QString(), files, directories, &rootListed);
    return rootListed;
}

void TransferWorker::scanRemoteDirectory(const QString &remoteDir, const QString &relativeDir,
                                         QList<PlannedFile> &files, QStringList &directories,
                                         bool *ok) const
{
    // Subdirectories that cannot be listed are treated as empty
    RemoteDirectory remote(transport_);
    const QList<FileEntry> entries = remote.listRemote(remoteDir, ok);

    for (const FileEntry &entry : entries) {
        const QString remotePath = PathUtils::joinRemotePath(remoteDir, entry.name);
        const QString relativePath = relativeDir.isEmpty()
            ? entry.name
            : relativeDir + QLatin1Char('/') + entry.name;

        if (entry.isDirectory) {
            directories << relativePath;
            scanRemoteDirectory(remotePath, relativePath, files, directories);
        } else {
            PlannedFile file;
            file.sourcePath = remotePath;
            file.relativePath = relativePath;
            file.size = remote.probeRemoteSize(remotePath).value_or(0);
            files << file;
        }
    }
}

bool TransferWorker::scanLocalTree(const QString &localRoot, QList<PlannedFile> &files,
                                   QStringList &directories, QString *unreadableDir)
{
    return scanLocalDirectory(localRoot, QString(), files, directories, unreadableDir);
}

void TransferWorker::finish(const TransferJob &job, const QString &errorMessage)
{
    if (errorMessage.isEmpty()) {
        LOG_VERBOSE() << "TransferWorker: job" << job.id << "completed";
        channel_->send(ProgressEvent::succeeded(job));
    } else {
        qWarning() << "TransferWorker: job" << job.id << job.fileName << "failed:" << errorMessage;
        channel_->send(ProgressEvent::failed(job, errorMessage));
    }
}
