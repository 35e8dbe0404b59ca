#include "transferexecutor.h"
#include "progressreporter.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QTemporaryFile>
#include <QThread>

TransferExecutor::TransferExecutor(IRemoteStore *store,
                                   TransferLogger *logger,
                                   ProgressReporter *reporter,
                                   const RetryPolicy &policy,
                                   int unitTimeoutMs,
                                   int progressIntervalMs)
    : store_(store)
    , logger_(logger)
    , reporter_(reporter)
    , policy_(policy)
    , unitTimeoutMs_(unitTimeoutMs)
    , progressIntervalMs_(progressIntervalMs)
{
}

UnitResult TransferExecutor::execute(int batchId, int unitIndex, int totalUnits,
                                     const TransferUnit &unit,
                                     const QString &resolvedParentId) const
{
    UnitResult result;

    if (!store_) {
        result.error = TransferError::fromRemote(
            RemoteError::permanent(RemoteErrorCode::Other, QObject::tr("No remote store configured")),
            unit.sourcePath, 0);
        return result;
    }

    AttemptContext context{batchId, unitIndex, totalUnits,
                           resolvedParentId.isEmpty() ? unit.targetParentId : resolvedParentId};

    RetryStateMachine machine(policy_);

    while (machine.beginAttempt()) {
        log(LogRecord::Level::Info, batchId, unit,
            QString("attempt %1 of %2: %3 %4")
                .arg(machine.attempt())
                .arg(policy_.maxAttempts)
                .arg(QString(unitKindToString(unit.kind)), unit.name));

        QString resultId;
        RemoteError error = attemptOnce(context, unit, &resultId);

        if (!error.isError()) {
            machine.recordSuccess();
            result.outcome = UnitOutcome::Succeeded;
            result.resultId = resultId;
            result.attempts = machine.attempt();
            log(LogRecord::Level::Info, batchId, unit,
                QString("succeeded after %1 attempt(s)").arg(machine.attempt()));
            return result;
        }

        if (machine.recordFailure(error) == AttemptState::RetryPending) {
            int backoff = machine.nextBackoffMs();
            log(LogRecord::Level::Warning, batchId, unit,
                QString("attempt %1 failed (%2, %3): %4; retrying in %5 ms")
                    .arg(machine.attempt())
                    .arg(remoteErrorCodeToString(error.code))
                    .arg("transient")
                    .arg(error.message)
                    .arg(backoff));
            if (backoff > 0) {
                QThread::msleep(static_cast<unsigned long>(backoff));
            }
        }
    }

    const RemoteError &last = machine.lastError();
    result.outcome = UnitOutcome::Failed;
    result.attempts = machine.attempt();
    result.error = TransferError::fromRemote(last, unit.sourcePath, machine.attempt());

    log(LogRecord::Level::Error, batchId, unit,
        QString("failed after %1 attempt(s) (%2, %3): %4")
            .arg(machine.attempt())
            .arg(remoteErrorCodeToString(last.code))
            .arg(machine.exhausted() ? "retries exhausted" : "permanent")
            .arg(last.message));

    return result;
}

RemoteError TransferExecutor::attemptOnce(const AttemptContext &context, const TransferUnit &unit,
                                          QString *resultId) const
{
    const QDeadlineTimer deadline = attemptDeadline();

    switch (unit.kind) {
    case TransferUnit::Kind::UploadFile:
        return uploadFile(context, unit, deadline, resultId);

    case TransferUnit::Kind::DownloadFile: {
        RemoteError error = downloadFile(context, unit, deadline);
        if (!error.isError()) {
            *resultId = unit.localPath;
        }
        return error;
    }

    case TransferUnit::Kind::CreateFolder:
        if (unit.location == TransferUnit::Location::Local) {
            RemoteError error = createLocalFolder(unit);
            if (!error.isError()) {
                *resultId = unit.localPath;
            }
            return error;
        }
        return createRemoteFolder(context.parentId, unit.name, deadline, resultId);

    case TransferUnit::Kind::Delete: {
        RemoteError error = removeItem(unit, deadline);
        if (!error.isError()) {
            *resultId = unit.sourcePath;
        }
        return error;
    }
    }

    return RemoteError::permanent(RemoteErrorCode::Other, QObject::tr("Unknown unit kind"));
}

RemoteError TransferExecutor::uploadFile(const AttemptContext &context, const TransferUnit &unit,
                                         const QDeadlineTimer &deadline, QString *resultId) const
{
    QFileInfo info(unit.sourcePath);
    if (!info.exists() || !info.isFile()) {
        return RemoteError::permanent(RemoteErrorCode::NotFound,
                                      QObject::tr("Local file not found: %1").arg(unit.sourcePath));
    }
    if (!info.isReadable()) {
        return RemoteError::permanent(RemoteErrorCode::PermissionDenied,
                                      QObject::tr("Cannot read local file: %1").arg(unit.sourcePath));
    }
    if (context.parentId.isEmpty()) {
        return RemoteError::permanent(RemoteErrorCode::Other,
                                      QObject::tr("No destination folder for %1").arg(unit.name));
    }

    auto uploaded = store_->upload(context.parentId, unit.sourcePath, deadline,
                                   progressCallback(context, unit));
    if (!uploaded.ok()) {
        return uploaded.error;
    }

    *resultId = uploaded.value;
    return RemoteError();
}

RemoteError TransferExecutor::downloadFile(const AttemptContext &context, const TransferUnit &unit,
                                           const QDeadlineTimer &deadline) const
{
    const QString targetDir = QFileInfo(unit.localPath).absolutePath();
    if (!QDir().mkpath(targetDir)) {
        return RemoteError::permanent(RemoteErrorCode::Io,
                                      QObject::tr("Cannot create local directory: %1").arg(targetDir));
    }

    // Content lands in a sibling file first; the target is only replaced
    // by a complete download, and a failed attempt removes just its own file
    QTemporaryFile partial(unit.localPath + QStringLiteral(".XXXXXX.part"));
    if (!partial.open()) {
        return RemoteError::permanent(RemoteErrorCode::Io,
                                      QObject::tr("Cannot create %1: %2").arg(partial.fileTemplate(),
                                                                              partial.errorString()));
    }
    const QString partialPath = partial.fileName();
    partial.close();

    RemoteError error = store_->download(unit.sourcePath, partialPath, deadline,
                                         progressCallback(context, unit));
    if (error.isError()) {
        LOG_VERBOSE() << "TransferExecutor: Discarding partial file" << partialPath;
        return error;
    }

    if (unit.sizeBytes.has_value()) {
        const qint64 actual = QFileInfo(partialPath).size();
        if (actual != unit.sizeBytes.value()) {
            return RemoteError::transient(
                RemoteErrorCode::Io,
                QObject::tr("Incomplete download: %1 of %2 bytes").arg(actual).arg(unit.sizeBytes.value()));
        }
    }

    QFileInfo target(unit.localPath);
    if (target.isDir()) {
        return RemoteError::permanent(RemoteErrorCode::AlreadyExists,
                                      QObject::tr("A folder is in the way of %1").arg(unit.localPath));
    }
    if (target.exists() && !QFile::remove(unit.localPath)) {
        return RemoteError::permanent(RemoteErrorCode::PermissionDenied,
                                      QObject::tr("Cannot replace %1").arg(unit.localPath));
    }

    // From here on the file is removed by hand if it cannot be moved
    partial.setAutoRemove(false);
    if (!QFile::setPermissions(partialPath, QFileDevice::ReadOwner | QFileDevice::WriteOwner
                                                | QFileDevice::ReadGroup | QFileDevice::ReadOther)) {
        qWarning() << "TransferExecutor: Could not set permissions on" << partialPath;
    }
    if (!QFile::rename(partialPath, unit.localPath)) {
        if (!QFile::remove(partialPath)) {
            qWarning() << "TransferExecutor: Failed to remove partial file" << partialPath;
        }
        return RemoteError::permanent(RemoteErrorCode::Io,
                                      QObject::tr("Cannot move download into place: %1").arg(unit.localPath));
    }

    return RemoteError();
}

RemoteError TransferExecutor::createRemoteFolder(const QString &parentId, const QString &name,
                                                 const QDeadlineTimer &deadline,
                                                 QString *resultId) const
{
    if (parentId.isEmpty()) {
        return RemoteError::permanent(RemoteErrorCode::Other,
                                      QObject::tr("No parent folder for %1").arg(name));
    }

    // Reuse a folder left behind by an earlier attempt or batch
    auto findExisting = [&]() -> RemoteResult<QString> {
        auto listing = store_->list(parentId, deadline);
        if (!listing.ok()) {
            return RemoteResult<QString>::failure(listing.error);
        }
        for (const RemoteItem &item : listing.value) {
            if (item.isFolder && item.name == name) {
                return RemoteResult<QString>::success(item.id);
            }
        }
        return RemoteResult<QString>::success(QString());
    };

    auto existing = findExisting();
    if (!existing.ok()) {
        return existing.error;
    }
    if (!existing.value.isEmpty()) {
        LOG_VERBOSE() << "TransferExecutor: Reusing existing folder" << name << existing.value;
        *resultId = existing.value;
        return RemoteError();
    }

    auto created = store_->createFolder(parentId, name, deadline);
    if (created.ok()) {
        *resultId = created.value;
        return RemoteError();
    }

    if (created.error.code != RemoteErrorCode::AlreadyExists) {
        return created.error;
    }

    // Created concurrently; resolve the id the same way
    existing = findExisting();
    if (!existing.ok()) {
        return existing.error;
    }
    if (existing.value.isEmpty()) {
        // The name is taken by something that is not a folder
        return created.error;
    }
    *resultId = existing.value;
    return RemoteError();
}

RemoteError TransferExecutor::createLocalFolder(const TransferUnit &unit) const
{
    QFileInfo info(unit.localPath);
    if (info.exists()) {
        if (info.isDir()) {
            return RemoteError();
        }
        return RemoteError::permanent(RemoteErrorCode::AlreadyExists,
                                      QObject::tr("A file is in the way of folder %1").arg(unit.localPath));
    }

    if (!QDir().mkpath(unit.localPath)) {
        return RemoteError::permanent(RemoteErrorCode::Io,
                                      QObject::tr("Cannot create local directory: %1").arg(unit.localPath));
    }
    return RemoteError();
}

RemoteError TransferExecutor::removeItem(const TransferUnit &unit, const QDeadlineTimer &deadline) const
{
    RemoteError error = store_->remove(unit.sourcePath, deadline);
    if (error.code == RemoteErrorCode::NotFound) {
        LOG_VERBOSE() << "TransferExecutor: Already absent" << unit.sourcePath;
        return RemoteError();
    }
    return error;
}

IRemoteStore::ProgressCallback TransferExecutor::progressCallback(const AttemptContext &context,
                                                                  const TransferUnit &unit) const
{
    if (!reporter_) {
        return IRemoteStore::ProgressCallback();
    }

    ProgressReporter *reporter = reporter_;
    const int interval = progressIntervalMs_;
    const QString unitName = unit.name;
    QElapsedTimer timer;
    bool published = false;

    // Publish the first report, then at most one per interval, plus the final count
    return [=](qint64 transferred, qint64 total) mutable {
        const bool finished = total > 0 && transferred >= total;
        if (published && !finished && timer.isValid() && timer.elapsed() < interval) {
            return;
        }
        published = true;
        timer.restart();
        reporter->publish(ProgressEvent::bytes(context.batchId, context.unitIndex, context.totalUnits,
                                               unitName, transferred, total));
    };
}

QDeadlineTimer TransferExecutor::attemptDeadline() const
{
    if (unitTimeoutMs_ <= 0) {
        return QDeadlineTimer(QDeadlineTimer::Forever);
    }
    return QDeadlineTimer(unitTimeoutMs_);
}

void TransferExecutor::log(LogRecord::Level level, int batchId, const TransferUnit &unit,
                           const QString &message) const
{
    if (logger_) {
        logger_->log(level, batchId, unit.unitId(batchId), message);
    } else {
        qDebug().noquote() << "TransferExecutor:" << unit.unitId(batchId) << message;
    }
}
