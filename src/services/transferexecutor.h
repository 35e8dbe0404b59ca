/**
 * @file transferexecutor.h
 * @brief Executes one transfer unit against the remote store, with retries.
 */

#ifndef TRANSFEREXECUTOR_H
#define TRANSFEREXECUTOR_H

#include <QDeadlineTimer>
#include <QString>

#include "iremotestore.h"
#include "retrypolicy.h"
#include "transferlogger.h"
#include "models/batch.h"
#include "models/transfererror.h"
#include "models/transferunit.h"

class ProgressReporter;

/**
 * @brief Outcome of executing one unit to completion.
 */
struct UnitResult {
    UnitOutcome outcome = UnitOutcome::Failed;  ///< Succeeded or Failed
    QString resultId;   ///< Created folder id, uploaded file id, or local path
    TransferError error;
    int attempts = 0;

    [[nodiscard]] bool succeeded() const { return outcome == UnitOutcome::Succeeded; }
};

/**
 * @brief Performs the I/O of a single TransferUnit.
 *
 * execute() blocks until the unit succeeds or fails for good, so it is
 * meant to be called from a worker thread. All members are read-only
 * after construction and one executor may be shared by every worker.
 *
 * Unit semantics:
 * - UploadFile / DownloadFile stream through the store and publish
 *   throttled BytesProgress events.
 * - Downloads are written to a temporary sibling of the target and moved
 *   into place only when complete. A download that ends short of the
 *   expected size fails the attempt transiently. A failed attempt removes
 *   its temporary file and leaves an existing target untouched.
 * - Remote CreateFolder reuses an existing folder of the same name.
 * - Delete treats NotFound as success.
 *
 * Transient failures are retried according to the RetryPolicy, each
 * attempt gets its own deadline of @c unitTimeoutMs.
 */
class TransferExecutor
{
public:
    TransferExecutor(IRemoteStore *store,
                     TransferLogger *logger,
                     ProgressReporter *reporter,
                     const RetryPolicy &policy = RetryPolicy(),
                     int unitTimeoutMs = 300000,
                     int progressIntervalMs = 250);

    /**
     * @brief Executes @p unit, retrying transient failures.
     * @param batchId Owning batch, for log records and progress events.
     * @param unitIndex Index of the unit within the batch.
     * @param totalUnits Number of units in the batch.
     * @param unit The unit to execute.
     * @param resolvedParentId Remote parent created earlier in the batch,
     *        or empty to use the unit's own targetParentId.
     */
    [[nodiscard]] UnitResult execute(int batchId, int unitIndex, int totalUnits,
                                     const TransferUnit &unit,
                                     const QString &resolvedParentId = QString()) const;

    [[nodiscard]] const RetryPolicy &retryPolicy() const { return policy_; }

private:
    struct AttemptContext {
        int batchId;
        int unitIndex;
        int totalUnits;
        QString parentId;
    };

    RemoteError attemptOnce(const AttemptContext &context, const TransferUnit &unit,
                            QString *resultId) const;

    RemoteError uploadFile(const AttemptContext &context, const TransferUnit &unit,
                           const QDeadlineTimer &deadline, QString *resultId) const;
    RemoteError downloadFile(const AttemptContext &context, const TransferUnit &unit,
                             const QDeadlineTimer &deadline) const;
    RemoteError createRemoteFolder(const QString &parentId, const QString &name,
                                   const QDeadlineTimer &deadline, QString *resultId) const;
    RemoteError createLocalFolder(const TransferUnit &unit) const;
    RemoteError removeItem(const TransferUnit &unit, const QDeadlineTimer &deadline) const;

    IRemoteStore::ProgressCallback progressCallback(const AttemptContext &context,
                                                    const TransferUnit &unit) const;

    [[nodiscard]] QDeadlineTimer attemptDeadline() const;
    void log(LogRecord::Level level, int batchId, const TransferUnit &unit, const QString &message) const;

    IRemoteStore *store_ = nullptr;
    TransferLogger *logger_ = nullptr;
    ProgressReporter *reporter_ = nullptr;
    RetryPolicy policy_;
    int unitTimeoutMs_;
    int progressIntervalMs_;
};

#endif // TRANSFEREXECUTOR_H
