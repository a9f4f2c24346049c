#include "progresschannel.h"

#include <QMutexLocker>

void ProgressChannel::send(const ProgressEvent &event)
{
    QMutexLocker locker(&mutex_);
    events_.enqueue(event);
}

QList<ProgressEvent> ProgressChannel::drain()
{
    QQueue<ProgressEvent> pending;
    {
        QMutexLocker locker(&mutex_);
        pending.swap(events_);
    }
    return pending;
}

int ProgressChannel::pendingCount() const
{
    QMutexLocker locker(&mutex_);
    return events_.size();
}
