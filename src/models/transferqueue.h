#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QList>
#include <QObject>
#include <QQueue>
#include <QSet>
#include <QString>

#include <functional>

#include "transferjob.h"

class ProgressAggregator;

/**
 * @brief FIFO of queued single-file downloads plus the bounded worker pool.
 *
 * Per-job state machine: Queued -> Active -> Completed(Ok|Err). A job is
 * Queued while it sits here, Active once handed to the launcher (the
 * aggregator then tracks it) and Completed when the aggregator sees its
 * Completed event. There are no retries.
 *
 * Only single-file downloads are capped, at maxParallelDownloads() active
 * at once. Folder downloads and uploads bypass the queue entirely and are
 * not counted against the cap.
 *
 * Lives on the UI thread; not thread-safe.
 *
 * @par Example usage:
 * @code
 * TransferQueue *queue = new TransferQueue(aggregator, this);
 * queue->setLauncher([](const TransferJob &job) { ... start a worker ... });
 * queue->enqueue(job);
 * queue->processPending();   // also called on every UI tick
 * @endcode
 */
class TransferQueue : public QObject
{
    Q_OBJECT

public:
    static constexpr int MaxParallelDownloads = 3;

    /// Starts a worker for a promoted job
    using Launcher = std::function<void(const TransferJob &)>;

    /**
     * @brief Constructs a queue.
     * @param aggregator Owner of the active set (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferQueue(ProgressAggregator *aggregator, QObject *parent = nullptr);
    ~TransferQueue() override;

    void setLauncher(Launcher launcher);

    void setMaxParallelDownloads(int maxParallel);
    [[nodiscard]] int maxParallelDownloads() const { return maxParallelDownloads_; }

    /**
     * @brief Appends a single-file download in Queued state.
     *
     * Does not launch anything; call processPending() afterwards.
     */
    void enqueue(const TransferJob &job);

    /**
     * @brief Promotes queued jobs in FIFO order while fewer than
     *        maxParallelDownloads() single-file downloads are active.
     * @return Number of jobs promoted.
     */
    int processPending();

    [[nodiscard]] int pendingCount() const { return pending_.size(); }
    [[nodiscard]] bool isEmpty() const { return pending_.isEmpty(); }
    [[nodiscard]] QList<TransferJob> pendingJobs() const { return pending_; }
    [[nodiscard]] bool isQueued(quint64 jobId) const;

    /// @brief Local destination paths of every queued job.
    [[nodiscard]] QSet<QString> reservedLocalPaths() const;

signals:
    void jobQueued(quint64 jobId);
    void jobStarted(quint64 jobId);
    void queueChanged();

private:
    ProgressAggregator *aggregator_ = nullptr;
    Launcher launcher_;
    QQueue<TransferJob> pending_;
    int maxParallelDownloads_ = MaxParallelDownloads;
};

#endif // TRANSFERQUEUE_H
