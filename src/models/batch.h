/**
 * @file batch.h
 * @brief A user-initiated group of transfer units sharing one completion event.
 */

#ifndef BATCH_H
#define BATCH_H

#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>

#include "transfererror.h"
#include "transferunit.h"

enum class BatchStatus { Pending, Running, Cancelling, Completed, Failed, PartiallyFailed };

/// @brief Convert BatchStatus to string for logs and display
[[nodiscard]] inline const char* batchStatusToString(BatchStatus status) {
    switch (status) {
        case BatchStatus::Pending: return "Pending";
        case BatchStatus::Running: return "Running";
        case BatchStatus::Cancelling: return "Cancelling";
        case BatchStatus::Completed: return "Completed";
        case BatchStatus::Failed: return "Failed";
        case BatchStatus::PartiallyFailed: return "PartiallyFailed";
    }
    return "Unknown";
}

[[nodiscard]] inline bool isTerminalStatus(BatchStatus status) {
    return status == BatchStatus::Completed
        || status == BatchStatus::Failed
        || status == BatchStatus::PartiallyFailed;
}

enum class UnitOutcome { Pending, Running, Succeeded, Failed, Skipped, Cancelled };

[[nodiscard]] inline const char* unitOutcomeToString(UnitOutcome outcome) {
    switch (outcome) {
        case UnitOutcome::Pending: return "Pending";
        case UnitOutcome::Running: return "Running";
        case UnitOutcome::Succeeded: return "Succeeded";
        case UnitOutcome::Failed: return "Failed";
        case UnitOutcome::Skipped: return "Skipped";
        case UnitOutcome::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/**
 * @brief Per-unit execution state kept alongside the immutable unit.
 */
struct UnitRecord {
    UnitOutcome outcome = UnitOutcome::Pending;
    QString resultId;     ///< Id yielded by the unit (created folder, uploaded file)
    TransferError error;
    int attempts = 0;

    [[nodiscard]] bool isSettled() const
    {
        return outcome != UnitOutcome::Pending && outcome != UnitOutcome::Running;
    }
};

/**
 * @brief Counts carried by the batch-terminal event for the UI to render.
 */
struct BatchSummary {
    int totalUnits = 0;
    int succeeded = 0;
    int failed = 0;
    int skipped = 0;
    int cancelled = 0;
    int planningErrors = 0;
};

/**
 * @brief A batch of transfer units.
 *
 * Mutated only by BatchCoordinator. The record* methods are the only
 * way to settle a unit and refuse to settle a unit twice, which keeps
 * completedCount + failedUnits + skippedUnits equal to the number of
 * settled units.
 */
struct Batch {
    int batchId = 0;
    OperationKind operation = OperationKind::Upload;
    QString description;
    BatchStatus status = BatchStatus::Pending;
    bool planned = false;  ///< True once the planner's units have been installed
    bool planningCancelled = false;  ///< Planning stopped early on cancellation

    QList<TransferUnit> units;
    QList<UnitRecord> records;

    int completedCount = 0;
    QMap<int, TransferError> failedUnits;
    QMap<int, UnitOutcome> skippedUnits;  ///< Skipped or Cancelled
    QList<TransferError> planningErrors;

    [[nodiscard]] int totalCount() const { return units.size(); }
    [[nodiscard]] int settledCount() const
    {
        return completedCount + failedUnits.size() + skippedUnits.size();
    }
    [[nodiscard]] bool isSettled() const { return planned && settledCount() == totalCount(); }
    [[nodiscard]] bool isTerminal() const { return isTerminalStatus(status); }

    void setUnits(const QList<TransferUnit> &plannedUnits);

    void markRunning(int index);
    bool recordSuccess(int index, const QString &resultId, int attempts);
    bool recordFailure(int index, const TransferError &error);
    bool recordSkipped(int index, UnitOutcome reason);

    [[nodiscard]] BatchSummary summary() const;

    /**
     * @brief Terminal status implied by the settled units.
     *
     * Completed when every unit succeeded and planning reported no error,
     * Failed when nothing succeeded, PartiallyFailed otherwise. An empty
     * plan is Completed unless its planning was cancelled.
     */
    [[nodiscard]] BatchStatus resolveTerminalStatus() const;

private:
    [[nodiscard]] bool canSettle(int index) const;
};

Q_DECLARE_METATYPE(BatchStatus)
Q_DECLARE_METATYPE(BatchSummary)

#endif // BATCH_H
