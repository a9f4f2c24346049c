#include "transferservice.h"
#include "itransport.h"
#include "progresschannel.h"
#include "transferworker.h"
#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDir>
#include <QFileInfo>

#include <utility>

TransferService::TransferService(std::shared_ptr<ITransport> transport, QObject *parent)
    : QObject(parent)
    , transport_(std::move(transport))
    , channel_(std::make_shared<ProgressChannel>())
    , remote_(transport_)
    , aggregator_(new ProgressAggregator(channel_, this))
    , queue_(new TransferQueue(aggregator_, this))
{
    // Default launcher: one detached worker thread per job
    std::shared_ptr<ITransport> workerTransport = transport_;
    std::shared_ptr<ProgressChannel> workerChannel = channel_;
    setLauncher([workerTransport, workerChannel](const TransferJob &job) {
        TransferWorker::start(workerTransport, workerChannel, job);
    });

    connect(aggregator_, &ProgressAggregator::statusMessage,
            this, &TransferService::statusMessage);
}

TransferService::~TransferService() = default;

void TransferService::setLauncher(TransferQueue::Launcher launcher)
{
    launcher_ = launcher;
    queue_->setLauncher(std::move(launcher));
}

quint64 TransferService::downloadFile(const QString &remotePath, const QString &localDir)
{
    TransferJob job;
    job.id = nextJobId();
    job.kind = TransferKind::Download;
    job.fileName = PathUtils::remoteFileName(remotePath);
    job.sourcePath = remotePath;
    job.destPath = PathUtils::uniqueLocalPath(localDir, job.fileName, reservedLocalPaths());
    job.expectedTotalBytes = remote_.probeRemoteSize(remotePath);

    if (!job.expectedTotalBytes) {
        LOG_VERBOSE() << "TransferService: size of" << remotePath << "unknown, progress indeterminate";
    }

    queue_->enqueue(job);
    queue_->processPending();

    if (queue_->isQueued(job.id)) {
        emit statusMessage(tr("Queued download: %1 (%2 ahead)")
                               .arg(job.fileName, QString::number(queue_->pendingCount() - 1)),
                           3000);
    } else {
        emit statusMessage(tr("Downloading %1 -> %2").arg(job.fileName, job.destPath), 3000);
    }
    return job.id;
}

quint64 TransferService::downloadDirectory(const QString &remoteDir, const QString &localDir)
{
    TransferJob job;
    job.id = nextJobId();
    job.kind = TransferKind::Download;
    job.isDirectory = true;
    job.fileName = PathUtils::remoteFileName(remoteDir);
    job.sourcePath = remoteDir;
    job.destPath = PathUtils::uniqueLocalPath(localDir, job.fileName, reservedLocalPaths());

    startNow(job);
    emit statusMessage(tr("Downloading folder %1 -> %2").arg(job.fileName, job.destPath), 3000);
    return job.id;
}

quint64 TransferService::uploadFile(const QString &localPath, const QString &remoteDir)
{
    QFileInfo fileInfo(localPath);

    TransferJob job;
    job.id = nextJobId();
    job.kind = TransferKind::Upload;
    job.fileName = fileInfo.fileName();
    job.sourcePath = localPath;
    job.destPath = PathUtils::joinRemotePath(remoteDir, job.fileName);
    if (fileInfo.exists()) {
        job.expectedTotalBytes = static_cast<quint64>(fileInfo.size());
    }

    startNow(job);
    emit statusMessage(tr("Uploading %1 -> %2").arg(job.fileName, remoteDir), 3000);
    return job.id;
}

quint64 TransferService::uploadDirectory(const QString &localDir, const QString &remoteDir)
{
    QFileInfo fileInfo(QDir::cleanPath(localDir));

    TransferJob job;
    job.id = nextJobId();
    job.kind = TransferKind::Upload;
    job.isDirectory = true;
    job.fileName = fileInfo.fileName();
    job.sourcePath = QDir::cleanPath(localDir);
    job.destPath = PathUtils::joinRemotePath(remoteDir, job.fileName);

    startNow(job);
    emit statusMessage(tr("Uploading folder %1 -> %2").arg(job.fileName, remoteDir), 3000);
    return job.id;
}

void TransferService::tick()
{
    aggregator_->drain();
    queue_->processPending();
    aggregator_->sampleLocalSizes();
}

void TransferService::startNow(const TransferJob &job)
{
    aggregator_->beginTransfer(job);
    LOG_VERBOSE() << "TransferService: starting" << transferKindToString(job.kind)
                  << "job" << job.id << job.sourcePath << "->" << job.destPath;
    if (launcher_) {
        launcher_(job);
    } else {
        qWarning() << "TransferService: no launcher set, job" << job.id << "will never run";
    }
}

QSet<QString> TransferService::reservedLocalPaths() const
{
    return queue_->reservedLocalPaths() | aggregator_->reservedLocalPaths();
}
