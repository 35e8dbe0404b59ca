#include "retrypolicy.h"

#include <QDebug>
#include <algorithm>

int RetryPolicy::backoffAfter(int failedAttempt) const
{
    if (initialBackoffMs <= 0 || failedAttempt < 1) {
        return 0;
    }

    qint64 delay = initialBackoffMs;
    for (int i = 1; i < failedAttempt && delay < maxBackoffMs; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<qint64>(delay, std::max(maxBackoffMs, 0)));
}

RetryStateMachine::RetryStateMachine(const RetryPolicy &policy)
    : policy_(policy)
{
    policy_.maxAttempts = std::max(policy_.maxAttempts, 1);
}

bool RetryStateMachine::beginAttempt()
{
    switch (state_) {
    case AttemptState::Idle:
    case AttemptState::RetryPending:
        attempt_++;
        state_ = AttemptState::Attempting;
        return true;

    case AttemptState::Attempting:
        qWarning() << "RetryStateMachine: beginAttempt while attempt" << attempt_ << "is in flight";
        return false;

    case AttemptState::Succeeded:
    case AttemptState::Failed:
        return false;
    }
    return false;
}

AttemptState RetryStateMachine::recordSuccess()
{
    if (state_ == AttemptState::Attempting) {
        state_ = AttemptState::Succeeded;
        lastError_ = RemoteError();
    }
    return state_;
}

AttemptState RetryStateMachine::recordFailure(const RemoteError &error)
{
    if (state_ != AttemptState::Attempting) {
        return state_;
    }

    lastError_ = error;

    if (!error.isTransient()) {
        state_ = AttemptState::Failed;
        return state_;
    }

    if (attempt_ >= policy_.maxAttempts) {
        exhausted_ = true;
        state_ = AttemptState::Failed;
        return state_;
    }

    state_ = AttemptState::RetryPending;
    return state_;
}

int RetryStateMachine::nextBackoffMs() const
{
    if (state_ != AttemptState::RetryPending) {
        return 0;
    }
    return policy_.backoffAfter(attempt_);
}
