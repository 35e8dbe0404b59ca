/**
 * @file retrypolicy.h
 * @brief Retry policy and the per-unit attempt state machine.
 */

#ifndef RETRYPOLICY_H
#define RETRYPOLICY_H

#include "remoteerror.h"

/**
 * @brief Bounds for retrying transient failures.
 *
 * Backoff doubles with each retry, starting at initialBackoffMs and
 * capped at maxBackoffMs.
 */
struct RetryPolicy {
    int maxAttempts = 3;
    int initialBackoffMs = 500;
    int maxBackoffMs = 4000;

    /**
     * @brief Delay before the attempt following @p failedAttempt.
     * @param failedAttempt 1-based number of the attempt that just failed.
     */
    [[nodiscard]] int backoffAfter(int failedAttempt) const;
};

/// @brief States of a single unit's attempt sequence
enum class AttemptState {
    Idle,          ///< No attempt made yet
    Attempting,    ///< An attempt is in flight
    RetryPending,  ///< Last attempt failed transiently; another one is allowed
    Succeeded,     ///< Terminal
    Failed         ///< Terminal: permanent failure or attempts exhausted
};

[[nodiscard]] inline const char* attemptStateToString(AttemptState state) {
    switch (state) {
        case AttemptState::Idle: return "Idle";
        case AttemptState::Attempting: return "Attempting";
        case AttemptState::RetryPending: return "RetryPending";
        case AttemptState::Succeeded: return "Succeeded";
        case AttemptState::Failed: return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Attempt -> {Success, TransientFailure -> Attempt, PermanentFailure}.
 *
 * Kept free of I/O so the retry rules can be tested on their own:
 * @code
 * RetryStateMachine machine(policy);
 * while (machine.beginAttempt()) {
 *     RemoteError error = doCall();
 *     if (!error.isError()) {
 *         machine.recordSuccess();
 *     } else if (machine.recordFailure(error) == AttemptState::RetryPending) {
 *         QThread::msleep(machine.nextBackoffMs());
 *     }
 * }
 * @endcode
 */
class RetryStateMachine
{
public:
    explicit RetryStateMachine(const RetryPolicy &policy);

    /**
     * @brief Starts the next attempt.
     * @return False if the sequence is already finished.
     */
    bool beginAttempt();

    AttemptState recordSuccess();

    /**
     * @brief Records a failed attempt and decides whether to retry.
     * @return RetryPending for a transient failure with attempts left,
     *         Failed otherwise.
     */
    AttemptState recordFailure(const RemoteError &error);

    [[nodiscard]] AttemptState state() const { return state_; }
    [[nodiscard]] int attempt() const { return attempt_; }
    [[nodiscard]] bool isFinished() const
    {
        return state_ == AttemptState::Succeeded || state_ == AttemptState::Failed;
    }

    /// True when the sequence failed because transient retries ran out
    [[nodiscard]] bool exhausted() const { return exhausted_; }
    [[nodiscard]] const RemoteError &lastError() const { return lastError_; }
    [[nodiscard]] int nextBackoffMs() const;

private:
    RetryPolicy policy_;
    AttemptState state_ = AttemptState::Idle;
    int attempt_ = 0;
    bool exhausted_ = false;
    RemoteError lastError_;
};

#endif // RETRYPOLICY_H
