/**
 * @file batchcoordinator.h
 * @brief Schedules the units of submitted batches onto a bounded worker pool.
 */

#ifndef BATCHCOORDINATOR_H
#define BATCHCOORDINATOR_H

#include <QList>
#include <QMap>
#include <QObject>
#include <QString>
#include <QThreadPool>
#include <memory>
#include <optional>

#include "cancellationtoken.h"
#include "pathplanner.h"
#include "transferexecutor.h"
#include "transfersettings.h"
#include "models/batch.h"
#include "models/transferselection.h"

class BrowseSession;
class IRemoteStore;
class ProgressReporter;
class TransferLogger;

/**
 * @brief Owns submitted batches and drives them to a terminal status.
 *
 * A submitted batch is planned on the worker pool, then its units are
 * dispatched to TransferExecutor with at most @c workerCount units in
 * flight across all batches. Batches are served in submission order.
 *
 * Scheduling rules:
 * - A unit starts only when every unit it depends on has succeeded.
 *   If one of them failed, was skipped or was cancelled, the unit is
 *   marked Skipped without being attempted.
 * - After cancelBatch() no further unit of that batch is started; units
 *   already running finish normally and the rest become Cancelled.
 * - Batch bookkeeping is only touched on the coordinator's thread, in
 *   the handler that receives each unit's result.
 *
 * Each batch produces exactly one BatchFinished progress event and one
 * batchFinished() signal. When autoRefresh is enabled, refreshRequested()
 * follows once per batch.
 *
 * @par Example usage:
 * @code
 * BatchCoordinator *coordinator =
 *     new BatchCoordinator(store, reporter, logger, settings, this);
 * connect(coordinator, &BatchCoordinator::refreshRequested,
 *         this, &Browser::reloadCurrentFolder);
 *
 * TransferSelection selection;
 * selection.localPaths << "/home/user/photos";
 * QString error;
 * int batchId = coordinator->submitBatch(selection, OperationKind::Upload,
 *                                        session, &error);
 * @endcode
 */
class BatchCoordinator : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a coordinator.
     * @param store Store that units are executed against (not owned, must be thread-safe).
     * @param reporter Event stream for progress (not owned).
     * @param logger Transfer log (not owned).
     * @param settings Engine settings.
     * @param parent Parent QObject.
     */
    BatchCoordinator(IRemoteStore *store,
                     ProgressReporter *reporter,
                     TransferLogger *logger,
                     const TransferSettings &settings = TransferSettings::defaults(),
                     QObject *parent = nullptr);

    /// Waits for running planners and units to finish
    ~BatchCoordinator() override;

    /// @name Batch Operations
    /// @{

    /**
     * @brief Plans and queues a batch.
     * @param selection Local paths (upload) or remote items (download/delete).
     * @param kind Operation to perform.
     * @param session Browse session; uploads go into its current folder.
     * @param errorMessage Set when the selection is rejected.
     * @return The new batch id, or -1 if the selection is empty or invalid.
     */
    int submitBatch(const TransferSelection &selection,
                    OperationKind kind,
                    const BrowseSession &session,
                    QString *errorMessage = nullptr);

    /**
     * @brief Requests cancellation of a batch.
     * @return False if the batch is unknown or already terminal.
     */
    bool cancelBatch(int batchId);

    /**
     * @brief Forgets a terminal batch once the UI has shown its result.
     * @return False if the batch is unknown or still running.
     */
    bool acknowledgeBatch(int batchId);
    /// @}

    /// @name Batch State
    /// @{

    /**
     * @brief Returns a copy of the batch, if it is still known.
     */
    [[nodiscard]] std::optional<Batch> batch(int batchId) const;

    [[nodiscard]] QList<int> batchIds() const;

    [[nodiscard]] std::shared_ptr<CancellationToken> cancellationToken(int batchId) const;

    [[nodiscard]] bool hasActiveBatches() const;

    /// Units currently executing on the worker pool
    [[nodiscard]] int inFlightCount() const { return inFlight_; }
    /// @}

    /// @name Settings
    /// @{

    /**
     * @brief Replaces the settings. Units already running keep the
     *        previous retry policy and timeout.
     */
    void setSettings(const TransferSettings &settings);

    [[nodiscard]] TransferSettings settings() const { return settings_; }
    /// @}

signals:
    void batchStarted(int batchId);
    void batchStatusChanged(int batchId, BatchStatus status);
    void batchFinished(int batchId, BatchStatus status, const BatchSummary &summary);

    /**
     * @brief Emitted once per finished batch when autoRefresh is enabled.
     */
    void refreshRequested(int batchId);

private:
    struct BatchState {
        Batch batch;
        std::shared_ptr<CancellationToken> token;
        bool finished = false;
    };

    enum class Readiness { Ready, Waiting, Blocked };

    void onPlanFinished(int batchId, const PlanResult &plan);
    void onUnitFinished(int batchId, int unitIndex, const UnitResult &result);

    void schedule();
    void scheduleBatch(BatchState &state);
    void dispatchUnit(BatchState &state, int index);
    void cancelPendingUnits(BatchState &state);
    void finishIfSettled(BatchState &state);
    void setStatus(BatchState &state, BatchStatus status);

    [[nodiscard]] Readiness readiness(const Batch &batch, int index) const;
    [[nodiscard]] QString resolvedParentId(const Batch &batch, const TransferUnit &unit) const;
    [[nodiscard]] QString validateSelection(const TransferSelection &selection, OperationKind kind,
                                            const QString &localDestination) const;
    void rebuildExecutor();

    IRemoteStore *store_ = nullptr;
    ProgressReporter *reporter_ = nullptr;
    TransferLogger *logger_ = nullptr;
    TransferSettings settings_;
    std::shared_ptr<const TransferExecutor> executor_;
    QThreadPool pool_;

    QMap<int, BatchState> batches_;  // Keyed by id, which follows submission order
    int nextBatchId_ = 1;
    int inFlight_ = 0;
    bool scheduling_ = false;
    bool rescheduleRequested_ = false;
};

#endif // BATCHCOORDINATOR_H
