#include <QtTest>

#include "services/retrypolicy.h"

class TestRetryPolicy : public QObject
{
    Q_OBJECT

private:
    static RemoteError networkError()
    {
        return RemoteError::transient(RemoteErrorCode::Network, "connection reset");
    }

private slots:
    void testBackoffDoublesAndIsCapped()
    {
        RetryPolicy policy;
        policy.initialBackoffMs = 500;
        policy.maxBackoffMs = 4000;

        QCOMPARE(policy.backoffAfter(1), 500);
        QCOMPARE(policy.backoffAfter(2), 1000);
        QCOMPARE(policy.backoffAfter(3), 2000);
        QCOMPARE(policy.backoffAfter(4), 4000);
        QCOMPARE(policy.backoffAfter(10), 4000);
    }

    void testZeroBackoff()
    {
        RetryPolicy policy;
        policy.initialBackoffMs = 0;
        QCOMPARE(policy.backoffAfter(1), 0);
        QCOMPARE(policy.backoffAfter(3), 0);
    }

    void testSuccessOnFirstAttempt()
    {
        RetryStateMachine machine{RetryPolicy()};
        QCOMPARE(machine.state(), AttemptState::Idle);

        QVERIFY(machine.beginAttempt());
        QCOMPARE(machine.state(), AttemptState::Attempting);
        QCOMPARE(machine.recordSuccess(), AttemptState::Succeeded);
        QVERIFY(machine.isFinished());
        QCOMPARE(machine.attempt(), 1);
        QVERIFY(!machine.beginAttempt());
    }

    void testTransientTwiceThenSuccess()
    {
        RetryPolicy policy;
        policy.maxAttempts = 3;
        RetryStateMachine machine(policy);

        QVERIFY(machine.beginAttempt());
        QCOMPARE(machine.recordFailure(networkError()), AttemptState::RetryPending);
        QCOMPARE(machine.nextBackoffMs(), 500);

        QVERIFY(machine.beginAttempt());
        QCOMPARE(machine.recordFailure(networkError()), AttemptState::RetryPending);
        QCOMPARE(machine.nextBackoffMs(), 1000);

        QVERIFY(machine.beginAttempt());
        QCOMPARE(machine.recordSuccess(), AttemptState::Succeeded);
        QCOMPARE(machine.attempt(), 3);
        QVERIFY(!machine.exhausted());
        QVERIFY(!machine.lastError().isError());
    }

    void testPermanentFailureIsNotRetried()
    {
        RetryStateMachine machine{RetryPolicy()};

        QVERIFY(machine.beginAttempt());
        RemoteError denied = RemoteError::permanent(RemoteErrorCode::PermissionDenied, "denied");
        QCOMPARE(machine.recordFailure(denied), AttemptState::Failed);
        QCOMPARE(machine.attempt(), 1);
        QVERIFY(!machine.exhausted());
        QCOMPARE(machine.lastError().code, RemoteErrorCode::PermissionDenied);
        QVERIFY(!machine.beginAttempt());
    }

    void testTransientFailuresExhaustAttempts()
    {
        RetryPolicy policy;
        policy.maxAttempts = 3;
        RetryStateMachine machine(policy);

        int attempts = 0;
        while (machine.beginAttempt()) {
            attempts++;
            machine.recordFailure(RemoteError::transient(RemoteErrorCode::Timeout, "timed out"));
        }

        QCOMPARE(attempts, 3);
        QCOMPARE(machine.state(), AttemptState::Failed);
        QVERIFY(machine.exhausted());
        QCOMPARE(machine.lastError().code, RemoteErrorCode::Timeout);
        QCOMPARE(machine.nextBackoffMs(), 0);
    }

    void testAtLeastOneAttempt()
    {
        RetryPolicy policy;
        policy.maxAttempts = 0;
        RetryStateMachine machine(policy);

        QVERIFY(machine.beginAttempt());
        QCOMPARE(machine.recordFailure(networkError()), AttemptState::Failed);
        QVERIFY(machine.exhausted());
    }

    void testBeginWhileAttemptingIsRefused()
    {
        RetryStateMachine machine{RetryPolicy()};
        QVERIFY(machine.beginAttempt());
        QVERIFY(!machine.beginAttempt());
        QCOMPARE(machine.attempt(), 1);
    }

    void testErrorClassificationFromCode()
    {
        QVERIFY(RemoteError::fromCode(RemoteErrorCode::Network, "x").isTransient());
        QVERIFY(RemoteError::fromCode(RemoteErrorCode::Timeout, "x").isTransient());
        QVERIFY(RemoteError::fromCode(RemoteErrorCode::QuotaExceeded, "x").isPermanent());
        QVERIFY(RemoteError::fromCode(RemoteErrorCode::NotFound, "x").isPermanent());
        QVERIFY(!RemoteError::fromCode(RemoteErrorCode::None, "x").isError());
    }
};

QTEST_MAIN(TestRetryPolicy)
#include "test_retrypolicy.moc"
