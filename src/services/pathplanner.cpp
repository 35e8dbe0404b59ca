#include "pathplanner.h"
#include "utils/formatting.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QSet>
#include <QThread>
#include <algorithm>

PathPlanner::PathPlanner(IRemoteStore *store, const RetryPolicy &listRetry)
    : store_(store)
    , listRetry_(listRetry)
{
}

PlanResult PathPlanner::plan(const TransferSelection &selection,
                             OperationKind kind,
                             const PlanContext &context) const
{
    switch (kind) {
    case OperationKind::Upload:
        return planUpload(selection.localPaths, context.remoteParentId, context);
    case OperationKind::Download:
        return planDownload(selection.remoteItems, context.localDestination, context);
    case OperationKind::Delete:
        return planDelete(selection.remoteItems, context);
    case OperationKind::CreateFolder:
        return planCreateFolder(selection.folderName, context.remoteParentId);
    }
    return PlanResult();
}

PlanResult PathPlanner::planUpload(const QStringList &localPaths,
                                   const QString &remoteParentId,
                                   const PlanContext &context) const
{
    PlanResult result;

    for (const QString &rawPath : localPaths) {
        if (stopIfCancelled(context, result)) {
            break;
        }

        const QString path = QDir::cleanPath(rawPath);
        QFileInfo info(path);

        if (!info.exists()) {
            result.errors.append(TransferError::planning(
                path, QObject::tr("File or directory does not exist"), RemoteErrorCode::NotFound));
            continue;
        }
        if (!info.isReadable()) {
            result.errors.append(TransferError::planning(
                path, QObject::tr("No read permission for this path"), RemoteErrorCode::PermissionDenied));
            continue;
        }

        if (info.isDir()) {
            appendUploadTree(path, remoteParentId, context, result);
        } else if (info.isFile()) {
            TransferUnit unit;
            unit.kind = TransferUnit::Kind::UploadFile;
            unit.location = TransferUnit::Location::Remote;
            unit.sourcePath = info.absoluteFilePath();
            unit.name = info.fileName();
            unit.targetParentId = remoteParentId;
            unit.sizeBytes = info.size();
            appendUnit(result, unit);
        } else {
            result.errors.append(TransferError::planning(
                path, QObject::tr("Path is neither a file nor directory")));
        }
    }

    qDebug() << "PathPlanner: Upload plan has" << result.units.size() << "units,"
             << result.errors.size() << "errors";
    return result;
}

void PathPlanner::appendUploadTree(const QString &rootPath, const QString &remoteParentId,
                                   const PlanContext &context, PlanResult &result) const
{
    struct Frame {
        QString path;
        int parentUnit = -1;
    };

    QList<Frame> stack;
    stack.append(Frame{rootPath, -1});

    while (!stack.isEmpty()) {
        if (stopIfCancelled(context, result)) {
            return;
        }

        const Frame frame = stack.takeLast();
        QFileInfo info(frame.path);

        // Listing needs both read and search permission on the directory
        if (!info.isReadable() || !info.isExecutable()) {
            result.errors.append(TransferError::planning(
                frame.path, QObject::tr("Folder cannot be read"), RemoteErrorCode::PermissionDenied));
            continue;
        }

        TransferUnit folder;
        folder.kind = TransferUnit::Kind::CreateFolder;
        folder.location = TransferUnit::Location::Remote;
        folder.sourcePath = info.absoluteFilePath();
        folder.name = info.fileName();
        folder.parentUnit = frame.parentUnit;
        if (frame.parentUnit < 0) {
            folder.targetParentId = remoteParentId;
        } else {
            folder.dependsOn.append(frame.parentUnit);
        }
        const int folderIndex = appendUnit(result, folder);

        const QFileInfoList entries = QDir(frame.path).entryInfoList(
            QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
            QDir::Name | QDir::IgnoreCase);

        QList<QFileInfo> subfolders;
        for (const QFileInfo &entry : entries) {
            if (entry.isDir()) {
                if (entry.isSymLink()) {
                    LOG_VERBOSE() << "PathPlanner: Not following symlinked folder" << entry.filePath();
                    continue;
                }
                subfolders.append(entry);
                continue;
            }

            if (!entry.isFile()) {
                continue;
            }

            if (!entry.isReadable()) {
                result.errors.append(TransferError::planning(
                    entry.filePath(), QObject::tr("No read permission for this path"),
                    RemoteErrorCode::PermissionDenied));
                continue;
            }

            TransferUnit file;
            file.kind = TransferUnit::Kind::UploadFile;
            file.location = TransferUnit::Location::Remote;
            file.sourcePath = entry.absoluteFilePath();
            file.name = entry.fileName();
            file.parentUnit = folderIndex;
            file.dependsOn.append(folderIndex);
            file.sizeBytes = entry.size();
            appendUnit(result, file);
        }

        // Reverse push so the first subfolder is planned next
        for (int i = subfolders.size() - 1; i >= 0; --i) {
            stack.append(Frame{subfolders[i].absoluteFilePath(), folderIndex});
        }
    }
}

PlanResult PathPlanner::planDownload(const QList<RemoteItem> &items,
                                     const QString &localDestination,
                                     const PlanContext &context) const
{
    PlanResult result;
    const QDir destination(localDestination);
    QSet<QString> takenNames;

    for (const RemoteItem &item : items) {
        if (stopIfCancelled(context, result)) {
            break;
        }
        if (item.id.isEmpty()) {
            result.errors.append(TransferError::planning(
                item.name, QObject::tr("Item has no identifier")));
            continue;
        }

        if (item.isFolder) {
            appendDownloadTree(item, localDestination, takenNames, context, result);
            continue;
        }

        TransferUnit unit;
        unit.kind = TransferUnit::Kind::DownloadFile;
        unit.location = TransferUnit::Location::Local;
        unit.sourcePath = item.id;
        unit.name = item.name;
        unit.localPath = destination.filePath(uniqueLocalName(item.name, takenNames));
        unit.sizeBytes = item.size;
        appendUnit(result, unit);
    }

    qDebug() << "PathPlanner: Download plan has" << result.units.size() << "units,"
             << result.errors.size() << "errors";
    return result;
}

void PathPlanner::appendDownloadTree(const RemoteItem &root, const QString &localDestination,
                                     QSet<QString> &takenNames, const PlanContext &context,
                                     PlanResult &result) const
{
    struct Frame {
        RemoteItem item;
        QString localPath;
        int parentUnit = -1;
    };

    QList<Frame> stack;
    stack.append(Frame{root, QDir(localDestination).filePath(uniqueLocalName(root.name, takenNames)), -1});

    while (!stack.isEmpty()) {
        if (stopIfCancelled(context, result)) {
            return;
        }

        const Frame frame = stack.takeLast();

        // List before emitting the folder so an unreadable branch leaves no units behind
        auto listing = listWithRetry(frame.item.id, context);
        if (!listing.ok()) {
            result.errors.append(TransferError::planning(
                frame.item.id,
                QObject::tr("Cannot list folder %1: %2").arg(frame.item.name, listing.error.message),
                listing.error.code));
            continue;
        }

        const QString folderPath = frame.localPath;

        TransferUnit folder;
        folder.kind = TransferUnit::Kind::CreateFolder;
        folder.location = TransferUnit::Location::Local;
        folder.sourcePath = frame.item.id;
        folder.name = frame.item.name;
        folder.localPath = folderPath;
        folder.parentUnit = frame.parentUnit;
        if (frame.parentUnit >= 0) {
            folder.dependsOn.append(frame.parentUnit);
        }
        const int folderIndex = appendUnit(result, folder);

        QList<RemoteItem> children = listing.value;
        sortByName(children);

        // Files claim names first, matching the order their units are emitted in
        QSet<QString> childNames;
        QList<Frame> subfolders;
        for (const RemoteItem &child : children) {
            if (child.isFolder) {
                continue;
            }

            TransferUnit file;
            file.kind = TransferUnit::Kind::DownloadFile;
            file.location = TransferUnit::Location::Local;
            file.sourcePath = child.id;
            file.name = child.name;
            file.localPath = QDir(folderPath).filePath(uniqueLocalName(child.name, childNames));
            file.parentUnit = folderIndex;
            file.dependsOn.append(folderIndex);
            file.sizeBytes = child.size;
            appendUnit(result, file);
        }

        for (const RemoteItem &child : children) {
            if (child.isFolder) {
                subfolders.append(Frame{child, QDir(folderPath).filePath(uniqueLocalName(child.name, childNames)),
                                        folderIndex});
            }
        }

        for (int i = subfolders.size() - 1; i >= 0; --i) {
            stack.append(subfolders[i]);
        }
    }
}

PlanResult PathPlanner::planDelete(const QList<RemoteItem> &items, const PlanContext &context) const
{
    PlanResult result;
    const bool deep = store_ && store_->supportsDeepDelete();

    for (const RemoteItem &item : items) {
        if (stopIfCancelled(context, result)) {
            break;
        }
        if (item.id.isEmpty()) {
            result.errors.append(TransferError::planning(
                item.name, QObject::tr("Item has no identifier")));
            continue;
        }

        if (item.isFolder && !deep) {
            appendDeleteTree(item, context, result);
            continue;
        }

        TransferUnit unit;
        unit.kind = TransferUnit::Kind::Delete;
        unit.location = TransferUnit::Location::Remote;
        unit.sourcePath = item.id;
        unit.name = item.name;
        if (!item.isFolder) {
            unit.sizeBytes = item.size;
        }
        appendUnit(result, unit);
    }

    qDebug() << "PathPlanner: Delete plan has" << result.units.size() << "units,"
             << result.errors.size() << "errors" << (deep ? "(deep delete)" : "(expanded)");
    return result;
}

void PathPlanner::appendDeleteTree(const RemoteItem &root, const PlanContext &context,
                                   PlanResult &result) const
{
    // Post-order walk: a frame stays on the stack below its subfolders and
    // is emitted once they have all been emitted.
    struct Frame {
        RemoteItem item;
        int parentFrame = -1;
        bool expanded = false;
        bool blocked = false;     // Some content could not be listed
        bool listFailed = false;  // This folder's own listing failed
        QList<int> childUnits;
    };

    QList<Frame> frames;
    QList<int> stack;
    frames.append(Frame{root, -1, false, false, false, {}});
    stack.append(0);

    while (!stack.isEmpty()) {
        const int frameIndex = stack.last();

        if (!frames[frameIndex].expanded) {
            // Folders whose contents were never listed must not be deleted
            if (stopIfCancelled(context, result)) {
                return;
            }
            frames[frameIndex].expanded = true;
            const RemoteItem folder = frames[frameIndex].item;

            auto listing = listWithRetry(folder.id, context);
            if (!listing.ok()) {
                result.errors.append(TransferError::planning(
                    folder.id,
                    QObject::tr("Cannot list folder %1: %2").arg(folder.name, listing.error.message),
                    listing.error.code));
                frames[frameIndex].blocked = true;
                frames[frameIndex].listFailed = true;
                continue;  // Popped as blocked on the next iteration
            }

            QList<RemoteItem> children = listing.value;
            sortByName(children);

            QList<RemoteItem> subfolders;
            for (const RemoteItem &child : children) {
                if (child.isFolder) {
                    subfolders.append(child);
                    continue;
                }
                TransferUnit file;
                file.kind = TransferUnit::Kind::Delete;
                file.location = TransferUnit::Location::Remote;
                file.sourcePath = child.id;
                file.name = child.name;
                file.sizeBytes = child.size;
                frames[frameIndex].childUnits.append(appendUnit(result, file));
            }

            for (int i = subfolders.size() - 1; i >= 0; --i) {
                frames.append(Frame{subfolders[i], frameIndex, false, false, false, {}});
                stack.append(frames.size() - 1);
            }
            continue;
        }

        stack.removeLast();
        const Frame frame = frames[frameIndex];

        if (frame.blocked) {
            if (frame.parentFrame >= 0) {
                frames[frame.parentFrame].blocked = true;
            }
            if (!frame.listFailed) {
                result.errors.append(TransferError::planning(
                    frame.item.id,
                    QObject::tr("Folder %1 kept because its contents could not be listed").arg(frame.item.name)));
            }
            continue;
        }

        TransferUnit folderUnit;
        folderUnit.kind = TransferUnit::Kind::Delete;
        folderUnit.location = TransferUnit::Location::Remote;
        folderUnit.sourcePath = frame.item.id;
        folderUnit.name = frame.item.name;
        folderUnit.dependsOn = frame.childUnits;
        const int unitIndex = appendUnit(result, folderUnit);

        if (frame.parentFrame >= 0) {
            frames[frame.parentFrame].childUnits.append(unitIndex);
        }
    }
}

PlanResult PathPlanner::planCreateFolder(const QString &name, const QString &remoteParentId) const
{
    PlanResult result;
    const QString trimmed = name.trimmed();

    if (trimmed.isEmpty() || trimmed.contains(QLatin1Char('/'))
        || trimmed == QLatin1String(".") || trimmed == QLatin1String("..")) {
        result.errors.append(TransferError::planning(
            name, QObject::tr("Invalid folder name")));
        return result;
    }

    TransferUnit unit;
    unit.kind = TransferUnit::Kind::CreateFolder;
    unit.location = TransferUnit::Location::Remote;
    unit.name = trimmed;
    unit.targetParentId = remoteParentId;
    appendUnit(result, unit);

    qDebug() << "PathPlanner: Create folder plan for" << trimmed << "in" << remoteParentId;
    return result;
}

RemoteResult<QList<RemoteItem>> PathPlanner::listWithRetry(const QString &folderId,
                                                           const PlanContext &context) const
{
    if (!store_) {
        return RemoteResult<QList<RemoteItem>>::failure(
            RemoteError::permanent(RemoteErrorCode::Other, QObject::tr("No remote store configured")));
    }

    RetryStateMachine machine(listRetry_);
    RemoteResult<QList<RemoteItem>> listing;

    while (machine.beginAttempt()) {
        listing = store_->list(folderId, QDeadlineTimer(context.listTimeoutMs));
        if (listing.ok()) {
            machine.recordSuccess();
            break;
        }

        if (machine.recordFailure(listing.error) == AttemptState::RetryPending) {
            qDebug() << "PathPlanner: Listing" << folderId << "failed (attempt" << machine.attempt()
                     << "):" << listing.error.message << "- retrying";
            QThread::msleep(static_cast<unsigned long>(machine.nextBackoffMs()));
        }
    }

    return listing;
}

int PathPlanner::appendUnit(PlanResult &result, TransferUnit unit)
{
    unit.sequenceIndex = result.units.size();
    result.units.append(unit);
    return unit.sequenceIndex;
}

bool PathPlanner::stopIfCancelled(const PlanContext &context, PlanResult &result)
{
    if (!context.isCancelled()) {
        return false;
    }
    if (!result.cancelled) {
        LOG_VERBOSE() << "PathPlanner: Cancelled after" << result.units.size() << "units";
        result.cancelled = true;
    }
    return true;
}

QString PathPlanner::uniqueLocalName(const QString &remoteName, QSet<QString> &taken)
{
    const QString sanitized = Formatting::sanitizeFileName(remoteName);

    // Compared case-insensitively so the plan also holds on such file systems
    QString candidate = sanitized;
    if (!taken.contains(candidate.toLower())) {
        taken.insert(candidate.toLower());
        return candidate;
    }

    const int dot = sanitized.lastIndexOf(QLatin1Char('.'));
    const QString base = dot > 0 ? sanitized.left(dot) : sanitized;
    const QString extension = dot > 0 ? sanitized.mid(dot) : QString();

    for (int n = 1;; ++n) {
        candidate = QString("%1 (%2)%3").arg(base).arg(n).arg(extension);
        if (!taken.contains(candidate.toLower())) {
            taken.insert(candidate.toLower());
            return candidate;
        }
    }
}

void PathPlanner::sortByName(QList<RemoteItem> &items)
{
    std::stable_sort(items.begin(), items.end(), [](const RemoteItem &a, const RemoteItem &b) {
        return a.name.compare(b.name, Qt::CaseInsensitive) < 0;
    });
}
