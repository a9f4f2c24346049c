#include "transferqueue.h"
#include "progressaggregator.h"
#include "utils/logging.h"

#include <utility>

TransferQueue::TransferQueue(ProgressAggregator *aggregator, QObject *parent)
    : QObject(parent)
    , aggregator_(aggregator)
{
}

TransferQueue::~TransferQueue() = default;

void TransferQueue::setLauncher(Launcher launcher)
{
    launcher_ = std::move(launcher);
}

void TransferQueue::setMaxParallelDownloads(int maxParallel)
{
    maxParallelDownloads_ = qMax(1, maxParallel);
}

void TransferQueue::enqueue(const TransferJob &job)
{
    if (!job.isSingleFileDownload()) {
        qWarning() << "TransferQueue: only single-file downloads are queued, ignoring job" << job.id;
        return;
    }

    pending_.enqueue(job);
    LOG_VERBOSE() << "TransferQueue: queued job" << job.id << job.fileName
                  << "(" << pending_.size() << "pending )";
    emit jobQueued(job.id);
    emit queueChanged();
}

int TransferQueue::processPending()
{
    if (!launcher_) {
        qWarning() << "TransferQueue: no launcher set, cannot start downloads";
        return 0;
    }

    int promoted = 0;
    while (!pending_.isEmpty()
           && aggregator_->activeSingleDownloadCount() < maxParallelDownloads_) {
        TransferJob job = pending_.dequeue();

        // Track before launching so the cap holds even if the worker finishes instantly
        aggregator_->beginTransfer(job);
        LOG_VERBOSE() << "TransferQueue: starting job" << job.id << job.fileName;
        launcher_(job);

        ++promoted;
        emit jobStarted(job.id);
    }

    if (promoted > 0) {
        emit queueChanged();
    }
    return promoted;
}

bool TransferQueue::isQueued(quint64 jobId) const
{
    for (const TransferJob &job : pending_) {
        if (job.id == jobId) {
            return true;
        }
    }
    return false;
}

QSet<QString> TransferQueue::reservedLocalPaths() const
{
    QSet<QString> paths;
    for (const TransferJob &job : pending_) {
        paths.insert(job.destPath);
    }
    return paths;
}
