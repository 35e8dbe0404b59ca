#include "commandrunner.h"
#include "consoleprogressview.h"
#include "services/batchcoordinator.h"
#include "services/iremotestore.h"
#include "utils/formatting.h"
#include "utils/logging.h"

#include <QDebug>
#include <QFileInfo>
#include <algorithm>
#include <cstdio>

CommandRunner::CommandRunner(IRemoteStore *store,
                             BatchCoordinator *coordinator,
                             ConsoleProgressView *view,
                             const TransferSettings &settings,
                             bool assumeYes,
                             QObject *parent)
    : QObject(parent)
    , store_(store)
    , coordinator_(coordinator)
    , view_(view)
    , settings_(settings)
    , assumeYes_(assumeYes)
    , session_(store->rootId(), QStringLiteral("/"))
    , out_(stdout)
    , err_(stderr)
{
    connect(coordinator_, &BatchCoordinator::batchFinished,
            this, &CommandRunner::onBatchFinished);
    connect(coordinator_, &BatchCoordinator::refreshRequested,
            this, &CommandRunner::onRefreshRequested);
}

int CommandRunner::listFolder(const QString &folderId)
{
    auto listing = store_->list(folderId);
    if (!listing.ok()) {
        err_ << tr("Cannot list %1: %2").arg(folderId, listing.error.message) << '\n';
        err_.flush();
        return UsageError;
    }

    QList<RemoteItem> items = listing.value;
    std::sort(items.begin(), items.end(), [](const RemoteItem &a, const RemoteItem &b) {
        if (a.isFolder != b.isFolder) {
            return a.isFolder;
        }
        return a.name.compare(b.name, Qt::CaseInsensitive) < 0;
    });

    out_ << folderId << ":\n";
    for (const RemoteItem &item : items) {
        const QString size = item.isFolder ? QStringLiteral("<DIR>") : Formatting::formatFileSize(item.size);
        out_ << "  " << size.rightJustified(10) << "  " << item.name
             << (item.isFolder ? "/" : "") << '\n';
    }
    if (items.isEmpty()) {
        out_ << "  " << tr("(empty)") << '\n';
    }
    out_.flush();
    return Success;
}

bool CommandRunner::resolveItems(const QStringList &remoteIds, QList<RemoteItem> *items)
{
    for (const QString &id : remoteIds) {
        auto resolved = store_->item(id);
        if (!resolved.ok()) {
            err_ << tr("Cannot find %1: %2").arg(id, resolved.error.message) << '\n';
            err_.flush();
            return false;
        }
        items->append(resolved.value);
    }
    return true;
}

bool CommandRunner::confirm(const QString &question)
{
    if (assumeYes_ || !settings_.confirmOperations) {
        return true;
    }

    out_ << question << " [y/N] ";
    out_.flush();

    QTextStream in(stdin);
    const QString answer = in.readLine().trimmed().toLower();
    return answer == QLatin1String("y") || answer == QLatin1String("yes");
}

bool CommandRunner::startUpload(const QStringList &localPaths, const QString &remoteFolderId)
{
    auto folder = store_->item(remoteFolderId);
    if (!folder.ok() || !folder.value.isFolder) {
        err_ << tr("Not a folder: %1").arg(remoteFolderId) << '\n';
        err_.flush();
        exitCode_ = UsageError;
        return false;
    }
    if (folder.value.id != session_.rootId()) {
        session_.enterFolder(folder.value.id, folder.value.name);
    }

    TransferSelection selection;
    for (const QString &path : localPaths) {
        selection.localPaths.append(QFileInfo(path).absoluteFilePath());
    }

    if (!confirm(tr("Upload %1 item(s) to %2?").arg(localPaths.size()).arg(folder.value.id))) {
        out_ << tr("Cancelled") << '\n';
        out_.flush();
        exitCode_ = BatchNotCompleted;
        return false;
    }

    return submit(selection, OperationKind::Upload);
}

bool CommandRunner::startDownload(const QStringList &remoteIds, const QString &localDestination)
{
    TransferSelection selection;
    if (!resolveItems(remoteIds, &selection.remoteItems)) {
        exitCode_ = UsageError;
        return false;
    }
    selection.localDestination = localDestination.isEmpty()
        ? settings_.defaultDownloadPath
        : QFileInfo(localDestination).absoluteFilePath();

    if (!confirm(tr("Download %1 item(s) to %2?").arg(remoteIds.size()).arg(selection.localDestination))) {
        out_ << tr("Cancelled") << '\n';
        out_.flush();
        exitCode_ = BatchNotCompleted;
        return false;
    }

    return submit(selection, OperationKind::Download);
}

bool CommandRunner::startDelete(const QStringList &remoteIds)
{
    TransferSelection selection;
    if (!resolveItems(remoteIds, &selection.remoteItems)) {
        exitCode_ = UsageError;
        return false;
    }

    // Show the folder the deleted items lived in afterwards
    const RemoteItem &first = selection.remoteItems.first();
    if (!first.parentId.isEmpty() && first.parentId != session_.rootId()) {
        auto parent = store_->item(first.parentId);
        if (parent.ok()) {
            session_.enterFolder(parent.value.id, parent.value.name);
        }
    }

    if (!confirm(tr("Delete %1 item(s)? This cannot be undone.").arg(remoteIds.size()))) {
        out_ << tr("Cancelled") << '\n';
        out_.flush();
        exitCode_ = BatchNotCompleted;
        return false;
    }

    return submit(selection, OperationKind::Delete);
}

bool CommandRunner::startCreateFolder(const QString &name, const QString &parentFolderId)
{
    auto folder = store_->item(parentFolderId);
    if (!folder.ok() || !folder.value.isFolder) {
        err_ << tr("Not a folder: %1").arg(parentFolderId) << '\n';
        err_.flush();
        exitCode_ = UsageError;
        return false;
    }
    if (folder.value.id != session_.rootId()) {
        session_.enterFolder(folder.value.id, folder.value.name);
    }

    TransferSelection selection;
    selection.folderName = name;
    return submit(selection, OperationKind::CreateFolder);
}

bool CommandRunner::submit(const TransferSelection &selection, OperationKind kind)
{
    QString error;
    batchId_ = coordinator_->submitBatch(selection, kind, session_, &error);
    if (batchId_ < 0) {
        err_ << error << '\n';
        err_.flush();
        exitCode_ = UsageError;
        return false;
    }

    LOG_VERBOSE() << "CommandRunner: Submitted batch" << batchId_;
    return true;
}

void CommandRunner::cancel()
{
    if (batchId_ >= 0 && !batchDone_ && coordinator_->cancelBatch(batchId_)) {
        err_ << '\n' << tr("Cancelling... running transfers will finish first") << '\n';
        err_.flush();
    }
}

void CommandRunner::onBatchFinished(int batchId, BatchStatus status, const BatchSummary &summary)
{
    Q_UNUSED(summary)
    if (batchId != batchId_) {
        return;
    }

    batchDone_ = true;
    exitCode_ = status == BatchStatus::Completed ? Success : BatchNotCompleted;

    if (view_) {
        view_->drain();
    }

    if (auto batch = coordinator_->batch(batchId)) {
        for (auto it = batch->failedUnits.constBegin(); it != batch->failedUnits.constEnd(); ++it) {
            err_ << tr("  failed: %1 (%2)").arg(batch->units[it.key()].name, it.value().message) << '\n';
        }
        for (const TransferError &error : batch->planningErrors) {
            err_ << tr("  not planned: %1 (%2)").arg(error.path, error.message) << '\n';
        }
        err_.flush();
    }

    if (!settings_.autoRefresh) {
        finish();
    }
}

void CommandRunner::onRefreshRequested(int batchId)
{
    if (batchId != batchId_) {
        return;
    }
    listFolder(session_.currentFolderId());
    finish();
}

void CommandRunner::finish()
{
    coordinator_->acknowledgeBatch(batchId_);
    emit finished(exitCode_);
}
