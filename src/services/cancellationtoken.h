/**
 * @file cancellationtoken.h
 * @brief Thread-safe flag used to stop planning and pending units of a batch.
 */

#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <QAtomicInteger>

/**
 * @brief Set-once cancellation flag shared between the UI and the coordinator.
 *
 * Safe to set from any thread. The planner checks it before each folder
 * it expands and the coordinator checks it between units; a listing or
 * unit that is already running is never interrupted.
 */
class CancellationToken
{
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel() { cancelled_.storeRelease(1); }
    [[nodiscard]] bool isCancelled() const { return cancelled_.loadAcquire() != 0; }

private:
    QAtomicInteger<int> cancelled_{0};
};

#endif // CANCELLATIONTOKEN_H
