/**
 * @file transferservice.h
 * @brief Service for coordinating background file transfers.
 *
 * This service turns user transfer requests into jobs, applies the naming
 * and concurrency policy, and owns the channel/aggregator/queue trio that
 * moves progress from worker threads to the UI.
 */

#ifndef TRANSFERSERVICE_H
#define TRANSFERSERVICE_H

#include <QObject>
#include <QString>

#include <memory>

#include "models/progressaggregator.h"
#include "models/transferqueue.h"
#include "remotedirectory.h"

class ITransport;
class ProgressChannel;

/**
 * @brief Service for coordinating file transfer operations.
 *
 * TransferService provides the high-level transfer interface used by the
 * main window:
 * - Single-file downloads are probed for their size, given a collision-free
 *   local name and queued behind the parallel download cap
 * - Folder downloads and all uploads start a worker immediately
 * - tick() drains worker events, promotes queued downloads and samples
 *   on-disk progress; the window calls it from its UI timer
 *
 * @par Example usage:
 * @code
 * TransferService *service = new TransferService(transport, this);
 *
 * connect(service->aggregator(), &ProgressAggregator::panelRefreshRequested,
 *         this, &MyWindow::refreshPanel);
 *
 * service->downloadFile("/srv/log.txt", QDir::homePath());
 * service->uploadDirectory("/home/me/site", "/var/www");
 * @endcode
 */
class TransferService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transfer service.
     * @param transport Transport shared with every worker thread.
     * @param parent Optional parent QObject for memory management.
     *
     * Jobs are started on worker threads via TransferWorker::start() unless
     * another launcher is installed with setLauncher().
     */
    explicit TransferService(std::shared_ptr<ITransport> transport,
                             QObject *parent = nullptr);

    /**
     * @brief Destructor.
     *
     * Running workers are not joined; they keep their own references to the
     * transport and channel.
     */
    ~TransferService() override;

    /// @brief Replaces how a job is started (used by tests).
    void setLauncher(TransferQueue::Launcher launcher);

    /// @name Download Operations
    /// @{

    /**
     * @brief Queues a single remote file for download into @p localDir.
     * @return Id of the queued job.
     */
    quint64 downloadFile(const QString &remotePath, const QString &localDir);

    /**
     * @brief Starts a recursive download of @p remoteDir into @p localDir.
     * @return Id of the started job.
     */
    quint64 downloadDirectory(const QString &remoteDir, const QString &localDir);
    /// @}

    /// @name Upload Operations
    /// @{

    /**
     * @brief Starts an upload of one local file into @p remoteDir.
     *
     * An existing remote file of the same name is overwritten.
     * @return Id of the started job.
     */
    quint64 uploadFile(const QString &localPath, const QString &remoteDir);

    /**
     * @brief Starts a recursive upload of @p localDir into @p remoteDir.
     * @return Id of the started job.
     */
    quint64 uploadDirectory(const QString &localDir, const QString &remoteDir);
    /// @}

    /**
     * @brief One UI tick: drain events, promote queued downloads, sample sizes.
     */
    void tick();

    /// @name State Queries
    /// @{
    [[nodiscard]] ProgressAggregator *aggregator() const { return aggregator_; }
    [[nodiscard]] TransferQueue *queue() const { return queue_; }
    [[nodiscard]] std::shared_ptr<ProgressChannel> channel() const { return channel_; }
    [[nodiscard]] int queuedCount() const { return queue_->pendingCount(); }
    [[nodiscard]] int activeCount() const { return aggregator_->activeCount(); }
    [[nodiscard]] bool isBusy() const { return activeCount() > 0 || queuedCount() > 0; }
    /// @}

signals:
    /**
     * @brief Emitted with a short message for the footer.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds.
     */
    void statusMessage(const QString &message, int timeout);

private:
    void startNow(const TransferJob &job);
    [[nodiscard]] QSet<QString> reservedLocalPaths() const;
    [[nodiscard]] quint64 nextJobId() { return ++lastJobId_; }

    std::shared_ptr<ITransport> transport_;
    std::shared_ptr<ProgressChannel> channel_;
    RemoteDirectory remote_;
    ProgressAggregator *aggregator_ = nullptr;
    TransferQueue *queue_ = nullptr;
    TransferQueue::Launcher launcher_;
    quint64 lastJobId_ = 0;
};

#endif // TRANSFERSERVICE_H
