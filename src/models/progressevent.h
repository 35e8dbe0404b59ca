/**
 * @file progressevent.h
 * @brief Events delivered from the transfer engine to the UI.
 */

#ifndef PROGRESSEVENT_H
#define PROGRESSEVENT_H

#include <QMetaType>
#include <QString>
#include <optional>

#include "batch.h"

/**
 * @brief One progress notification.
 *
 * BytesProgress events may be coalesced by a slow consumer; UnitFinished
 * and BatchFinished events are terminal and always delivered.
 */
struct ProgressEvent {
    enum class Type {
        BytesProgress,  ///< Bytes moved for an in-flight unit
        UnitFinished,   ///< A unit settled (any outcome)
        BatchFinished   ///< The batch entered a terminal status
    };

    Type type = Type::BytesProgress;
    int batchId = -1;
    int unitIndex = -1;   ///< -1 for batch events
    int totalUnits = 0;
    QString unitName;
    std::optional<qint64> bytesTransferred;
    std::optional<qint64> bytesTotal;
    std::optional<UnitOutcome> unitResult;
    QString errorMessage;  ///< Failure reason for unit events
    std::optional<BatchStatus> batchStatus;
    BatchSummary summary;  ///< Filled for BatchFinished

    [[nodiscard]] bool isTerminal() const { return type != Type::BytesProgress; }

    [[nodiscard]] static ProgressEvent bytes(int batchId, int unitIndex, int totalUnits,
                                             const QString &unitName, qint64 transferred, qint64 total)
    {
        ProgressEvent event;
        event.type = Type::BytesProgress;
        event.batchId = batchId;
        event.unitIndex = unitIndex;
        event.totalUnits = totalUnits;
        event.unitName = unitName;
        event.bytesTransferred = transferred;
        event.bytesTotal = total;
        return event;
    }

    [[nodiscard]] static ProgressEvent unitFinished(int batchId, int unitIndex, int totalUnits,
                                                    const QString &unitName, UnitOutcome outcome,
                                                    const QString &errorMessage = QString())
    {
        ProgressEvent event;
        event.type = Type::UnitFinished;
        event.batchId = batchId;
        event.unitIndex = unitIndex;
        event.totalUnits = totalUnits;
        event.unitName = unitName;
        event.unitResult = outcome;
        event.errorMessage = errorMessage;
        return event;
    }

    [[nodiscard]] static ProgressEvent batchFinished(int batchId, BatchStatus status, const BatchSummary &summary)
    {
        ProgressEvent event;
        event.type = Type::BatchFinished;
        event.batchId = batchId;
        event.totalUnits = summary.totalUnits;
        event.batchStatus = status;
        event.summary = summary;
        return event;
    }
};

Q_DECLARE_METATYPE(ProgressEvent)

#endif // PROGRESSEVENT_H
