#ifndef PROGRESSCHANNEL_H
#define PROGRESSCHANNEL_H

#include <QList>
#include <QMutex>
#include <QQueue>

#include "models/transferjob.h"

/**
 * @brief Multi-producer, single-consumer queue of ProgressEvents.
 *
 * Workers call send() from their own threads; the UI thread calls drain()
 * once per tick. drain() never blocks on producers beyond the short
 * critical section that swaps the queue out.
 */
class ProgressChannel
{
public:
    ProgressChannel() = default;

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /// @brief Appends an event. Thread-safe.
    void send(const ProgressEvent &event);

    /// @brief Removes and returns every pending event in arrival order.
    [[nodiscard]] QList<ProgressEvent> drain();

    [[nodiscard]] int pendingCount() const;

private:
    mutable QMutex mutex_;
    QQueue<ProgressEvent> events_;
};

#endif // PROGRESSCHANNEL_H
