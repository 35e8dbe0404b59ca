#include "batch.h"

#include <QDebug>

void Batch::setUnits(const QList<TransferUnit> &plannedUnits)
{
    units = plannedUnits;
    records.clear();
    records.reserve(units.size());
    for (int i = 0; i < units.size(); ++i) {
        records.append(UnitRecord());
    }
    completedCount = 0;
    failedUnits.clear();
    skippedUnits.clear();
    planned = true;
}

bool Batch::canSettle(int index) const
{
    if (index < 0 || index >= records.size()) {
        qWarning() << "Batch: unit index out of range" << index << "in batch" << batchId;
        return false;
    }
    if (records[index].isSettled()) {
        qWarning() << "Batch: unit" << index << "of batch" << batchId << "already settled as"
                   << unitOutcomeToString(records[index].outcome);
        return false;
    }
    return true;
}

void Batch::markRunning(int index)
{
    if (!canSettle(index)) {
        return;
    }
    records[index].outcome = UnitOutcome::Running;
}

bool Batch::recordSuccess(int index, const QString &resultId, int attempts)
{
    if (!canSettle(index)) {
        return false;
    }
    UnitRecord &record = records[index];
    record.outcome = UnitOutcome::Succeeded;
    record.resultId = resultId;
    record.attempts = attempts;
    completedCount++;
    return true;
}

bool Batch::recordFailure(int index, const TransferError &error)
{
    if (!canSettle(index)) {
        return false;
    }
    UnitRecord &record = records[index];
    record.outcome = UnitOutcome::Failed;
    record.error = error;
    record.attempts = error.attempts;
    failedUnits.insert(index, error);
    return true;
}

bool Batch::recordSkipped(int index, UnitOutcome reason)
{
    if (reason != UnitOutcome::Skipped && reason != UnitOutcome::Cancelled) {
        return false;
    }
    if (!canSettle(index)) {
        return false;
    }
    records[index].outcome = reason;
    skippedUnits.insert(index, reason);
    return true;
}

BatchSummary Batch::summary() const
{
    BatchSummary result;
    result.totalUnits = units.size();
    result.succeeded = completedCount;
    result.failed = failedUnits.size();
    for (UnitOutcome outcome : skippedUnits) {
        if (outcome == UnitOutcome::Cancelled) {
            result.cancelled++;
        } else {
            result.skipped++;
        }
    }
    result.planningErrors = planningErrors.size();
    return result;
}

BatchStatus Batch::resolveTerminalStatus() const
{
    if (completedCount == 0) {
        // A plan with neither units nor errors has nothing left to do
        if (units.isEmpty() && planningErrors.isEmpty() && !planningCancelled) {
            return BatchStatus::Completed;
        }
        return BatchStatus::Failed;
    }

    if (completedCount == units.size() && planningErrors.isEmpty()) {
        return BatchStatus::Completed;
    }

    return BatchStatus::PartiallyFailed;
}
