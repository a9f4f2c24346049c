#include "progressaggregator.h"
#include "services/progresschannel.h"
#include "utils/logging.h"

#include <QFileInfo>

#include <limits>
#include <utility>

ProgressAggregator::ProgressAggregator(std::shared_ptr<ProgressChannel> channel, QObject *parent)
    : QObject(parent)
    , channel_(std::move(channel))
{
}

ProgressAggregator::~ProgressAggregator() = default;

void ProgressAggregator::beginTransfer(const TransferJob &job)
{
    ActiveTransfer transfer;
    transfer.job = job;
    transfer.startedAt = QDateTime::currentDateTime();
    active_.append(transfer);
    emit activeTransfersChanged();
}

int ProgressAggregator::drain()
{
    const QList<ProgressEvent> events = channel_->drain();
    if (events.isEmpty()) {
        return 0;
    }

    bool refreshLocal = false;
    bool refreshRemote = false;
    for (const ProgressEvent &event : events) {
        if (event.isCompleted()) {
            applyCompleted(event, refreshLocal, refreshRemote);
        } else {
            applyProgress(event);
        }
    }

    // One refresh per panel no matter how many jobs finished this tick
    if (refreshLocal) {
        emit panelRefreshRequested(PanelSide::Local);
    }
    if (refreshRemote) {
        emit panelRefreshRequested(PanelSide::Remote);
    }

    emit activeTransfersChanged();
    return events.size();
}

void ProgressAggregator::sampleLocalSizes()
{
    for (ActiveTransfer &transfer : active_) {
        if (!transfer.job.isSingleFileDownload()) {
            continue;
        }
        QFileInfo info(transfer.job.destPath);
        if (info.exists()) {
            transfer.bytesDone = static_cast<quint64>(qMax<qint64>(0, info.size()));
        }
    }
}

int ProgressAggregator::activeSingleDownloadCount() const
{
    int count = 0;
    for (const ActiveTransfer &transfer : active_) {
        if (transfer.job.isSingleFileDownload()) {
            ++count;
        }
    }
    return count;
}

bool ProgressAggregator::isActive(quint64 jobId) const
{
    return indexOf(jobId) >= 0;
}

const ActiveTransfer *ProgressAggregator::mostRecentTransfer() const
{
    return active_.isEmpty() ? nullptr : &active_.last();
}

std::optional<TransferProgress> ProgressAggregator::progressFor(quint64 jobId) const
{
    auto it = progress_.constFind(jobId);
    if (it == progress_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QSet<QString> ProgressAggregator::reservedLocalPaths() const
{
    QSet<QString> paths;
    for (const ActiveTransfer &transfer : active_) {
        if (transfer.job.kind == TransferKind::Download) {
            paths.insert(transfer.job.destPath);
        }
    }
    return paths;
}

std::optional<int> ProgressAggregator::percent(quint64 bytesDone, quint64 bytesTotal)
{
    if (bytesTotal == 0) {
        return std::nullopt;
    }
    const quint64 clamped = qMin(bytesDone, bytesTotal);
    // Divide first for huge totals so the multiplication cannot overflow
    if (clamped > std::numeric_limits<quint64>::max() / 100) {
        return static_cast<int>(clamped / (bytesTotal / 100));
    }
    return static_cast<int>(clamped * 100 / bytesTotal);
}

std::optional<int> ProgressAggregator::percentFor(const ActiveTransfer &transfer) const
{
    auto it = progress_.constFind(transfer.job.id);
    if (it != progress_.constEnd()) {
        return percent(it->bytesDone, it->bytesTotal);
    }
    return percent(transfer.bytesDone, transfer.job.expectedTotalBytes.value_or(0));
}

void ProgressAggregator::applyProgress(const ProgressEvent &event)
{
    TransferProgress &view = progress_[event.jobId];
    view.label = event.label;
    view.filesDone = event.filesDone;
    view.filesTotal = event.filesTotal;
    view.bytesDone = event.bytesDone;
    view.bytesTotal = event.bytesTotal;

    int index = indexOf(event.jobId);
    if (index >= 0) {
        active_[index].bytesDone = event.bytesDone;
    }
}

void ProgressAggregator::applyCompleted(const ProgressEvent &event, bool &refreshLocal, bool &refreshRemote)
{
    int index = indexOf(event.jobId);
    if (index >= 0) {
        active_.removeAt(index);
    } else {
        LOG_VERBOSE() << "ProgressAggregator: completion for untracked job" << event.jobId;
    }
    progress_.remove(event.jobId);

    if (event.kind == TransferKind::Download) {
        refreshLocal = true;
    } else {
        refreshRemote = true;
    }

    emit transferFinished(event.jobId, event.ok);

    if (event.ok) {
        lastStatusMessage_ = event.kind == TransferKind::Download
            ? tr("Downloaded %1 ✓").arg(event.fileName)
            : tr("Uploaded %1 ✓").arg(event.fileName);
        emit statusMessage(lastStatusMessage_, 3000);
    } else {
        lastStatusMessage_ = event.kind == TransferKind::Download
            ? tr("Download error for %1: %2").arg(event.fileName, event.errorMessage)
            : tr("Upload error for %1: %2").arg(event.fileName, event.errorMessage);
        emit transferFailed(event.fileName, lastStatusMessage_);
    }
}

int ProgressAggregator::indexOf(quint64 jobId) const
{
    for (int i = 0; i < active_.size(); ++i) {
        if (active_.at(i).job.id == jobId) {
            return i;
        }
    }
    return -1;
}
