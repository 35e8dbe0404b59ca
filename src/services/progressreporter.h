/**
 * @file progressreporter.h
 * @brief Bounded event stream between the transfer engine and the UI.
 */

#ifndef PROGRESSREPORTER_H
#define PROGRESSREPORTER_H

#include <QList>
#include <QMutex>
#include <QObject>
#include <optional>

#include "models/progressevent.h"

/**
 * @brief Thread-safe, bounded queue of ProgressEvents.
 *
 * Producers (the coordinator and transfer workers) call publish() from
 * any thread. Consumers call takeAll() or takeNext() when they receive
 * eventsAvailable().
 *
 * Backpressure rules:
 * - A byte-progress event replaces a still-queued byte-progress event
 *   for the same unit (latest count wins).
 * - When the queue holds @c capacity events, further byte-progress
 *   events are discarded and counted in coalescedCount().
 * - Terminal events (UnitFinished, BatchFinished) are always queued,
 *   even beyond capacity.
 */
class ProgressReporter : public QObject
{
    Q_OBJECT

public:
    explicit ProgressReporter(int capacity = 256, QObject *parent = nullptr);
    ~ProgressReporter() override = default;

    /**
     * @brief Queues an event.
     * @return False if a byte-progress event was discarded.
     */
    bool publish(const ProgressEvent &event);

    /**
     * @brief Removes and returns every queued event, oldest first.
     */
    [[nodiscard]] QList<ProgressEvent> takeAll();

    /**
     * @brief Removes and returns the oldest queued event, if any.
     */
    [[nodiscard]] std::optional<ProgressEvent> takeNext();

    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int capacity() const { return capacity_; }

    /// Byte-progress events merged or discarded so far
    [[nodiscard]] int coalescedCount() const;

signals:
    /**
     * @brief Emitted when the queue goes from empty to non-empty.
     */
    void eventsAvailable();

private:
    mutable QMutex mutex_;
    QList<ProgressEvent> queue_;
    int capacity_;
    int coalesced_ = 0;
};

#endif // PROGRESSREPORTER_H
