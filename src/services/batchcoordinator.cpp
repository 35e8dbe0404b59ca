#include "batchcoordinator.h"
#include "iremotestore.h"
#include "progressreporter.h"
#include "transferlogger.h"
#include "models/browsesession.h"
#include "utils/logging.h"

#include <QDebug>
#include <QtConcurrent>

BatchCoordinator::BatchCoordinator(IRemoteStore *store,
                                   ProgressReporter *reporter,
                                   TransferLogger *logger,
                                   const TransferSettings &settings,
                                   QObject *parent)
    : QObject(parent)
    , store_(store)
    , reporter_(reporter)
    , logger_(logger)
    , settings_(settings.normalized())
{
    qRegisterMetaType<BatchStatus>("BatchStatus");
    qRegisterMetaType<BatchSummary>("BatchSummary");
    qRegisterMetaType<ProgressEvent>("ProgressEvent");

    // One extra thread so planning never waits behind a full set of units
    pool_.setMaxThreadCount(settings_.workerCount + 1);
    rebuildExecutor();
}

BatchCoordinator::~BatchCoordinator()
{
    for (auto it = batches_.begin(); it != batches_.end(); ++it) {
        it->token->cancel();
    }
    pool_.waitForDone();
}

int BatchCoordinator::submitBatch(const TransferSelection &selection,
                                  OperationKind kind,
                                  const BrowseSession &session,
                                  QString *errorMessage)
{
    const QString localDestination = selection.localDestination.isEmpty()
        ? settings_.defaultDownloadPath
        : selection.localDestination;

    QString problem = validateSelection(selection, kind, localDestination);
    const bool needsRemoteFolder = kind == OperationKind::Upload || kind == OperationKind::CreateFolder;
    if (needsRemoteFolder && problem.isEmpty() && session.currentFolderId().isEmpty()) {
        problem = tr("No destination folder is open");
    }
    if (!problem.isEmpty()) {
        qWarning() << "BatchCoordinator: Rejected" << operationKindToString(kind) << "selection:" << problem;
        if (errorMessage) {
            *errorMessage = problem;
        }
        return -1;
    }

    const int batchId = nextBatchId_++;
    int itemCount = selection.remoteItems.size();
    if (kind == OperationKind::Upload) {
        itemCount = selection.localPaths.size();
    } else if (kind == OperationKind::CreateFolder) {
        itemCount = 1;
    }

    BatchState state;
    state.batch.batchId = batchId;
    state.batch.operation = kind;
    state.token = std::make_shared<CancellationToken>();

    switch (kind) {
    case OperationKind::Upload:
        state.batch.description = tr("Upload %1 item(s) to %2").arg(itemCount).arg(session.currentFolderName());
        break;
    case OperationKind::Download:
        state.batch.description = tr("Download %1 item(s) to %2").arg(itemCount).arg(localDestination);
        break;
    case OperationKind::Delete:
        state.batch.description = tr("Delete %1 item(s)").arg(itemCount);
        break;
    case OperationKind::CreateFolder:
        state.batch.description = tr("Create folder %1 in %2")
                                      .arg(selection.folderName.trimmed(), session.currentFolderName());
        break;
    }

    batches_.insert(batchId, state);

    logger_->log(LogRecord::Level::Info, batchId, QString(),
                 QString("submitted: %1").arg(state.batch.description));

    PlanContext context;
    context.remoteParentId = session.currentFolderId();
    context.localDestination = localDestination;
    context.listTimeoutMs = settings_.unitTimeoutMs;
    context.cancellation = state.token;

    PathPlanner planner(store_, settings_.retryPolicy());

    (void)QtConcurrent::run(&pool_, [this, planner, selection, kind, context, batchId]() {
        PlanResult plan = planner.plan(selection, kind, context);
        QMetaObject::invokeMethod(this, [this, batchId, plan]() {
            onPlanFinished(batchId, plan);
        }, Qt::QueuedConnection);
    });

    emit batchStarted(batchId);
    emit batchStatusChanged(batchId, BatchStatus::Pending);
    return batchId;
}

bool BatchCoordinator::cancelBatch(int batchId)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end() || it->finished) {
        return false;
    }

    if (it->token->isCancelled()) {
        return true;
    }

    it->token->cancel();
    logger_->log(LogRecord::Level::Info, batchId, QString(), "cancellation requested");

    if (it->batch.status == BatchStatus::Running) {
        setStatus(*it, BatchStatus::Cancelling);
    }

    // Pending units become Cancelled now; a batch still planning is
    // cancelled when its plan arrives
    schedule();
    return true;
}

bool BatchCoordinator::acknowledgeBatch(int batchId)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end() || !it->finished) {
        return false;
    }
    batches_.erase(it);
    LOG_VERBOSE() << "BatchCoordinator: Batch" << batchId << "acknowledged";
    return true;
}

std::optional<Batch> BatchCoordinator::batch(int batchId) const
{
    auto it = batches_.constFind(batchId);
    if (it == batches_.constEnd()) {
        return std::nullopt;
    }
    return it->batch;
}

QList<int> BatchCoordinator::batchIds() const
{
    return batches_.keys();
}

std::shared_ptr<CancellationToken> BatchCoordinator::cancellationToken(int batchId) const
{
    auto it = batches_.constFind(batchId);
    if (it == batches_.constEnd()) {
        return nullptr;
    }
    return it->token;
}

bool BatchCoordinator::hasActiveBatches() const
{
    for (const BatchState &state : batches_) {
        if (!state.finished) {
            return true;
        }
    }
    return false;
}

void BatchCoordinator::setSettings(const TransferSettings &settings)
{
    settings_ = settings.normalized();
    pool_.setMaxThreadCount(settings_.workerCount + 1);
    rebuildExecutor();
    schedule();
}

void BatchCoordinator::rebuildExecutor()
{
    executor_ = std::make_shared<const TransferExecutor>(
        store_, logger_, reporter_, settings_.retryPolicy(),
        settings_.unitTimeoutMs, settings_.progressIntervalMs);
}

QString BatchCoordinator::validateSelection(const TransferSelection &selection, OperationKind kind,
                                            const QString &localDestination) const
{
    if (!store_) {
        return tr("No store is connected");
    }

    switch (kind) {
    case OperationKind::Upload:
        if (selection.localPaths.isEmpty()) {
            return tr("No local files selected");
        }
        for (const QString &path : selection.localPaths) {
            if (path.trimmed().isEmpty()) {
                return tr("Selection contains an empty path");
            }
        }
        break;

    case OperationKind::Download:
    case OperationKind::Delete:
        if (selection.remoteItems.isEmpty()) {
            return tr("No remote items selected");
        }
        for (const RemoteItem &item : selection.remoteItems) {
            if (item.id.isEmpty()) {
                return tr("Selection contains an item without an id");
            }
            if (kind == OperationKind::Delete && item.id == store_->rootId()) {
                return tr("The root folder cannot be deleted");
            }
        }
        if (kind == OperationKind::Download && localDestination.isEmpty()) {
            return tr("No download destination set");
        }
        break;

    case OperationKind::CreateFolder: {
        const QString name = selection.folderName.trimmed();
        if (name.isEmpty()) {
            return tr("No folder name given");
        }
        if (name.contains(QLatin1Char('/')) || name == QLatin1String(".") || name == QLatin1String("..")) {
            return tr("Invalid folder name: %1").arg(name);
        }
        break;
    }
    }

    return QString();
}

void BatchCoordinator::onPlanFinished(int batchId, const PlanResult &plan)
{
    auto it = batches_.find(batchId);
    if (it == batches_.end()) {
        return;
    }

    Batch &batch = it->batch;
    batch.setUnits(plan.units);
    batch.planningErrors = plan.errors;
    batch.planningCancelled = plan.cancelled;

    for (const TransferError &error : plan.errors) {
        logger_->log(LogRecord::Level::Warning, batchId, QString(),
                     QString("planning error for %1: %2").arg(error.path, error.message));
    }
    logger_->log(LogRecord::Level::Info, batchId, QString(),
                 QString("planned %1 unit(s), %2 planning error(s)")
                     .arg(plan.units.size())
                     .arg(plan.errors.size()));
    if (plan.cancelled) {
        logger_->log(LogRecord::Level::Info, batchId, QString(), "planning stopped by cancellation");
    }

    schedule();
}

void BatchCoordinator::onUnitFinished(int batchId, int unitIndex, const UnitResult &result)
{
    inFlight_--;

    auto it = batches_.find(batchId);
    if (it == batches_.end()) {
        qWarning() << "BatchCoordinator: Result for unknown batch" << batchId;
        schedule();
        return;
    }

    Batch &batch = it->batch;
    const TransferUnit &unit = batch.units[unitIndex];

    bool recorded = result.succeeded()
        ? batch.recordSuccess(unitIndex, result.resultId, result.attempts)
        : batch.recordFailure(unitIndex, result.error);

    if (recorded) {
        reporter_->publish(ProgressEvent::unitFinished(batchId, unitIndex, batch.totalCount(), unit.name,
                                                       result.outcome, result.error.message));
        LOG_VERBOSE() << "BatchCoordinator: Batch" << batchId << "unit" << unitIndex
                      << unitOutcomeToString(result.outcome)
                      << batch.settledCount() << "/" << batch.totalCount();
    }

    schedule();
}

void BatchCoordinator::schedule()
{
    // Signals emitted below may lead back here; finish the current pass first
    if (scheduling_) {
        rescheduleRequested_ = true;
        return;
    }

    scheduling_ = true;
    do {
        rescheduleRequested_ = false;
        const QList<int> ids = batches_.keys();
        for (int batchId : ids) {
            auto it = batches_.find(batchId);
            if (it == batches_.end() || it->finished || !it->batch.planned) {
                continue;
            }
            scheduleBatch(*it);
        }
    } while (rescheduleRequested_);
    scheduling_ = false;
}

void BatchCoordinator::scheduleBatch(BatchState &state)
{
    Batch &batch = state.batch;

    if (state.token->isCancelled()) {
        cancelPendingUnits(state);
        finishIfSettled(state);
        return;
    }

    for (int i = 0; i < batch.units.size(); ++i) {
        if (batch.records[i].outcome != UnitOutcome::Pending) {
            continue;
        }

        switch (readiness(batch, i)) {
        case Readiness::Blocked:
            if (batch.recordSkipped(i, UnitOutcome::Skipped)) {
                logger_->log(LogRecord::Level::Warning, batch.batchId, batch.units[i].unitId(batch.batchId),
                             "skipped: a unit it depends on did not succeed");
                reporter_->publish(ProgressEvent::unitFinished(
                    batch.batchId, i, batch.totalCount(), batch.units[i].name, UnitOutcome::Skipped,
                    tr("Parent operation failed")));
            }
            break;

        case Readiness::Ready:
            if (inFlight_ < settings_.workerCount && !state.token->isCancelled()) {
                dispatchUnit(state, i);
            }
            break;

        case Readiness::Waiting:
            break;
        }
    }

    finishIfSettled(state);
}

BatchCoordinator::Readiness BatchCoordinator::readiness(const Batch &batch, int index) const
{
    Readiness result = Readiness::Ready;
    for (int dependency : batch.units[index].dependsOn) {
        if (dependency < 0 || dependency >= batch.records.size()) {
            continue;
        }
        switch (batch.records[dependency].outcome) {
        case UnitOutcome::Succeeded:
            break;
        case UnitOutcome::Pending:
        case UnitOutcome::Running:
            result = Readiness::Waiting;
            break;
        case UnitOutcome::Failed:
        case UnitOutcome::Skipped:
        case UnitOutcome::Cancelled:
            return Readiness::Blocked;
        }
    }
    return result;
}

QString BatchCoordinator::resolvedParentId(const Batch &batch, const TransferUnit &unit) const
{
    if (unit.location != TransferUnit::Location::Remote
        || unit.parentUnit < 0 || unit.parentUnit >= batch.records.size()) {
        return QString();
    }
    return batch.records[unit.parentUnit].resultId;
}

void BatchCoordinator::dispatchUnit(BatchState &state, int index)
{
    Batch &batch = state.batch;
    const TransferUnit unit = batch.units[index];
    const QString parentId = resolvedParentId(batch, unit);
    const int batchId = batch.batchId;
    const int totalUnits = batch.totalCount();

    batch.markRunning(index);
    inFlight_++;

    LOG_VERBOSE() << "BatchCoordinator: Dispatching batch" << batchId << "unit" << index
                  << unitKindToString(unit.kind) << unit.name << "in flight:" << inFlight_;

    std::shared_ptr<const TransferExecutor> executor = executor_;
    (void)QtConcurrent::run(&pool_, [this, executor, batchId, index, totalUnits, unit, parentId]() {
        UnitResult result = executor->execute(batchId, index, totalUnits, unit, parentId);
        QMetaObject::invokeMethod(this, [this, batchId, index, result]() {
            onUnitFinished(batchId, index, result);
        }, Qt::QueuedConnection);
    });

    if (batch.status == BatchStatus::Pending) {
        setStatus(state, BatchStatus::Running);
    }
}

void BatchCoordinator::cancelPendingUnits(BatchState &state)
{
    Batch &batch = state.batch;
    int cancelled = 0;

    for (int i = 0; i < batch.units.size(); ++i) {
        if (batch.records[i].outcome != UnitOutcome::Pending) {
            continue;
        }
        if (batch.recordSkipped(i, UnitOutcome::Cancelled)) {
            cancelled++;
            reporter_->publish(ProgressEvent::unitFinished(
                batch.batchId, i, batch.totalCount(), batch.units[i].name, UnitOutcome::Cancelled));
        }
    }

    if (cancelled > 0) {
        logger_->log(LogRecord::Level::Info, batch.batchId, QString(),
                     QString("cancelled %1 unit(s) that had not started").arg(cancelled));
    }
}

void BatchCoordinator::finishIfSettled(BatchState &state)
{
    if (state.finished || !state.batch.isSettled()) {
        return;
    }

    state.finished = true;
    Batch &batch = state.batch;
    const int batchId = batch.batchId;
    const BatchStatus status = batch.resolveTerminalStatus();
    const BatchSummary summary = batch.summary();
    batch.status = status;

    reporter_->publish(ProgressEvent::batchFinished(batchId, status, summary));

    logger_->log(status == BatchStatus::Completed ? LogRecord::Level::Info : LogRecord::Level::Warning,
                 batchId, QString(),
                 QString("finished %1: %2 succeeded, %3 failed, %4 skipped, %5 cancelled, %6 planning error(s)")
                     .arg(batchStatusToString(status))
                     .arg(summary.succeeded)
                     .arg(summary.failed)
                     .arg(summary.skipped)
                     .arg(summary.cancelled)
                     .arg(summary.planningErrors));

    const bool refresh = settings_.autoRefresh;

    // The batch may be acknowledged from a slot, so state is not touched past this point
    emit batchStatusChanged(batchId, status);
    emit batchFinished(batchId, status, summary);
    if (refresh) {
        emit refreshRequested(batchId);
    }
}

void BatchCoordinator::setStatus(BatchState &state, BatchStatus status)
{
    if (state.batch.status == status) {
        return;
    }

    qDebug() << "BatchCoordinator: Batch" << state.batch.batchId
             << batchStatusToString(state.batch.status) << "->" << batchStatusToString(status);
    state.batch.status = status;
    emit batchStatusChanged(state.batch.batchId, status);
}
