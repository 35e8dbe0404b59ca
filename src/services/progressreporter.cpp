#include "progressreporter.h"

#include <QMutexLocker>

ProgressReporter::ProgressReporter(int capacity, QObject *parent)
    : QObject(parent)
    , capacity_(qMax(1, capacity))
{
    qRegisterMetaType<ProgressEvent>("ProgressEvent");
}

bool ProgressReporter::publish(const ProgressEvent &event)
{
    bool accepted = true;
    bool wasEmpty = false;

    {
        QMutexLocker locker(&mutex_);
        wasEmpty = queue_.isEmpty();

        if (!event.isTerminal()) {
            // Replace a queued update for the same unit that the consumer has not seen yet
            for (int i = queue_.size() - 1; i >= 0; --i) {
                ProgressEvent &queued = queue_[i];
                if (queued.isTerminal()) {
                    if (queued.batchId == event.batchId &&
                        (queued.unitIndex == event.unitIndex || queued.unitIndex < 0)) {
                        break;  // Never move progress past a terminal event for the same unit
                    }
                    continue;
                }
                if (queued.batchId == event.batchId && queued.unitIndex == event.unitIndex) {
                    queued = event;
                    coalesced_++;
                    return true;
                }
            }

            if (queue_.size() >= capacity_) {
                coalesced_++;
                accepted = false;
            } else {
                queue_.append(event);
            }
        } else {
            queue_.append(event);
        }
    }

    if (accepted && wasEmpty) {
        emit eventsAvailable();
    }
    return accepted;
}

QList<ProgressEvent> ProgressReporter::takeAll()
{
    QMutexLocker locker(&mutex_);
    QList<ProgressEvent> events;
    events.swap(queue_);
    return events;
}

std::optional<ProgressEvent> ProgressReporter::takeNext()
{
    QMutexLocker locker(&mutex_);
    if (queue_.isEmpty()) {
        return std::nullopt;
    }
    return queue_.takeFirst();
}

int ProgressReporter::pendingCount() const
{
    QMutexLocker locker(&mutex_);
    return queue_.size();
}

int ProgressReporter::coalescedCount() const
{
    QMutexLocker locker(&mutex_);
    return coalesced_;
}
