#include "localdirectorystore.h"
#include "utils/logging.h"

#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QObject>
#include <QSaveFile>
#include <algorithm>

LocalDirectoryStore::LocalDirectoryStore(const QString &rootPath, int chunkSize, bool deepDelete)
    : rootPath_(QDir::cleanPath(QDir(rootPath).absolutePath()))
    , chunkSize_(std::max(chunkSize, 512))
    , deepDelete_(deepDelete)
{
    qDebug() << "LocalDirectoryStore: Serving" << rootPath_
             << (deepDelete_ ? "(deep delete)" : "(shallow delete)");
}

bool LocalDirectoryStore::isValid() const
{
    return QFileInfo(rootPath_).isDir();
}

QString LocalDirectoryStore::normalizeId(const QString &id)
{
    QString normalized = QDir::cleanPath(QStringLiteral("/") + id);
    return normalized.isEmpty() ? QStringLiteral("/") : normalized;
}

QString LocalDirectoryStore::childId(const QString &parentId, const QString &name)
{
    const QString parent = normalizeId(parentId);
    return parent == QLatin1String("/") ? parent + name : parent + QLatin1Char('/') + name;
}

bool LocalDirectoryStore::isValidName(const QString &name)
{
    return !name.isEmpty()
        && name != QLatin1String(".")
        && name != QLatin1String("..")
        && !name.contains(QLatin1Char('/'))
        && !name.contains(QLatin1Char('\\'));
}

QString LocalDirectoryStore::localPathFor(const QString &id) const
{
    const QString normalized = normalizeId(id);
    if (normalized == QLatin1String("/")) {
        return rootPath_;
    }

    const QString path = QDir::cleanPath(rootPath_ + normalized);
    if (!path.startsWith(rootPath_ + QLatin1Char('/'))) {
        return QString();
    }
    return path;
}

RemoteError LocalDirectoryStore::errorFromDevice(const QFileDevice &device, const QString &what)
{
    const QString message = QString("%1: %2").arg(what, device.errorString());

    switch (device.error()) {
    case QFileDevice::PermissionsError:
        return RemoteError::permanent(RemoteErrorCode::PermissionDenied, message);
    case QFileDevice::ResourceError:
        return RemoteError::permanent(RemoteErrorCode::QuotaExceeded, message);
    case QFileDevice::TimeOutError:
        return RemoteError::transient(RemoteErrorCode::Timeout, message);
    case QFileDevice::OpenError:
        if (!QFileInfo::exists(device.fileName())) {
            return RemoteError::permanent(RemoteErrorCode::NotFound, message);
        }
        return RemoteError::permanent(RemoteErrorCode::Io, message);
    default:
        return RemoteError::permanent(RemoteErrorCode::Io, message);
    }
}

RemoteError LocalDirectoryStore::timeoutError(const QString &what)
{
    return RemoteError::transient(RemoteErrorCode::Timeout,
                                  QObject::tr("Deadline exceeded: %1").arg(what));
}

RemoteResult<QList<RemoteItem>> LocalDirectoryStore::list(const QString &folderId, QDeadlineTimer deadline)
{
    using Result = RemoteResult<QList<RemoteItem>>;

    if (deadline.hasExpired()) {
        return Result::failure(timeoutError(folderId));
    }

    const QString path = localPathFor(folderId);
    QFileInfo info(path);
    if (path.isEmpty() || !info.exists()) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::NotFound,
                                                      QObject::tr("Folder not found: %1").arg(folderId)));
    }
    if (!info.isDir()) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::Other,
                                                      QObject::tr("Not a folder: %1").arg(folderId)));
    }
    if (!info.isReadable() || !info.isExecutable()) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::PermissionDenied,
                                                      QObject::tr("Cannot read folder: %1").arg(folderId)));
    }

    const QString parentId = normalizeId(folderId);
    const QFileInfoList entries = QDir(path).entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
        QDir::DirsFirst | QDir::Name | QDir::IgnoreCase);

    QList<RemoteItem> items;
    items.reserve(entries.size());
    for (const QFileInfo &entry : entries) {
        if (!entry.isDir() && !entry.isFile()) {
            continue;
        }
        RemoteItem item;
        item.id = childId(parentId, entry.fileName());
        item.name = entry.fileName();
        item.isFolder = entry.isDir();
        item.size = item.isFolder ? 0 : entry.size();
        item.parentId = parentId;
        items.append(item);
    }

    LOG_VERBOSE() << "LocalDirectoryStore: Listed" << parentId << "-" << items.size() << "entries";
    return Result::success(items);
}

RemoteResult<RemoteItem> LocalDirectoryStore::item(const QString &id, QDeadlineTimer deadline)
{
    using Result = RemoteResult<RemoteItem>;

    if (deadline.hasExpired()) {
        return Result::failure(timeoutError(id));
    }

    const QString path = localPathFor(id);
    QFileInfo info(path);
    if (path.isEmpty() || !info.exists()) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::NotFound,
                                                      QObject::tr("Item not found: %1").arg(id)));
    }

    const QString normalized = normalizeId(id);
    RemoteItem item;
    item.id = normalized;
    item.isFolder = info.isDir();
    item.size = item.isFolder ? 0 : info.size();
    if (normalized == QLatin1String("/")) {
        item.name = QFileInfo(rootPath_).fileName();
    } else {
        item.name = info.fileName();
        item.parentId = normalizeId(normalized.section(QLatin1Char('/'), 0, -2));
    }
    return Result::success(item);
}

RemoteError LocalDirectoryStore::copyStream(QFileDevice &source, QFileDevice &target, qint64 total,
                                            const QDeadlineTimer &deadline,
                                            const ProgressCallback &progress) const
{
    qint64 transferred = 0;
    if (progress) {
        progress(0, total);
    }

    while (!source.atEnd()) {
        const QByteArray chunk = source.read(chunkSize_);
        if (chunk.isEmpty() && source.error() != QFileDevice::NoError) {
            return errorFromDevice(source, QObject::tr("Read failed"));
        }
        if (chunk.isEmpty()) {
            break;
        }
        if (target.write(chunk) != chunk.size()) {
            return errorFromDevice(target, QObject::tr("Write failed"));
        }

        transferred += chunk.size();
        if (progress) {
            progress(transferred, total);
        }

        if (deadline.hasExpired()) {
            return timeoutError(source.fileName());
        }
    }

    return RemoteError();
}

RemoteResult<QString> LocalDirectoryStore::upload(const QString &parentId,
                                                  const QString &localPath,
                                                  QDeadlineTimer deadline,
                                                  const ProgressCallback &progress)
{
    using Result = RemoteResult<QString>;

    const QString parentPath = localPathFor(parentId);
    if (parentPath.isEmpty() || !QFileInfo(parentPath).isDir()) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::NotFound,
                                                      QObject::tr("Folder not found: %1").arg(parentId)));
    }

    QFile source(localPath);
    if (!source.open(QIODevice::ReadOnly)) {
        return Result::failure(errorFromDevice(source, QObject::tr("Cannot open %1").arg(localPath)));
    }

    const QString name = QFileInfo(localPath).fileName();
    const QString id = childId(parentId, name);
    const QString targetPath = localPathFor(id);

    if (QFileInfo(targetPath).isDir()) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::AlreadyExists,
                                                      QObject::tr("A folder named %1 already exists").arg(name)));
    }

    QSaveFile target(targetPath);
    if (!target.open(QIODevice::WriteOnly)) {
        return Result::failure(errorFromDevice(target, QObject::tr("Cannot create %1").arg(id)));
    }

    RemoteError error = copyStream(source, target, source.size(), deadline, progress);
    if (error.isError()) {
        target.cancelWriting();
        return Result::failure(error);
    }

    if (!target.commit()) {
        return Result::failure(errorFromDevice(target, QObject::tr("Cannot finish %1").arg(id)));
    }

    LOG_VERBOSE() << "LocalDirectoryStore: Uploaded" << localPath << "as" << id;
    return Result::success(id);
}

RemoteError LocalDirectoryStore::download(const QString &remoteId,
                                          const QString &localPath,
                                          QDeadlineTimer deadline,
                                          const ProgressCallback &progress)
{
    const QString sourcePath = localPathFor(remoteId);
    QFileInfo info(sourcePath);
    if (sourcePath.isEmpty() || !info.exists()) {
        return RemoteError::permanent(RemoteErrorCode::NotFound,
                                      QObject::tr("File not found: %1").arg(remoteId));
    }
    if (!info.isFile()) {
        return RemoteError::permanent(RemoteErrorCode::Other,
                                      QObject::tr("Not a file: %1").arg(remoteId));
    }

    QFile source(sourcePath);
    if (!source.open(QIODevice::ReadOnly)) {
        return errorFromDevice(source, QObject::tr("Cannot open %1").arg(remoteId));
    }

    QFile target(localPath);
    if (!target.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return errorFromDevice(target, QObject::tr("Cannot create %1").arg(localPath));
    }

    RemoteError error = copyStream(source, target, source.size(), deadline, progress);
    target.close();

    if (!error.isError()) {
        LOG_VERBOSE() << "LocalDirectoryStore: Downloaded" << remoteId << "to" << localPath;
    }
    return error;
}

RemoteResult<QString> LocalDirectoryStore::createFolder(const QString &parentId,
                                                        const QString &name,
                                                        QDeadlineTimer deadline)
{
    using Result = RemoteResult<QString>;

    if (deadline.hasExpired()) {
        return Result::failure(timeoutError(name));
    }
    if (!isValidName(name)) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::Other,
                                                      QObject::tr("Invalid folder name: %1").arg(name)));
    }

    const QString parentPath = localPathFor(parentId);
    if (parentPath.isEmpty() || !QFileInfo(parentPath).isDir()) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::NotFound,
                                                      QObject::tr("Folder not found: %1").arg(parentId)));
    }

    const QString id = childId(parentId, name);

    QMutexLocker locker(&structureMutex_);
    if (QFileInfo::exists(localPathFor(id))) {
        return Result::failure(RemoteError::permanent(RemoteErrorCode::AlreadyExists,
                                                      QObject::tr("%1 already exists").arg(id)));
    }

    if (!QDir(parentPath).mkdir(name)) {
        if (!QFileInfo(parentPath).isWritable()) {
            return Result::failure(RemoteError::permanent(RemoteErrorCode::PermissionDenied,
                                                          QObject::tr("Cannot write to %1").arg(parentId)));
        }
        return Result::failure(RemoteError::permanent(RemoteErrorCode::Io,
                                                      QObject::tr("Cannot create folder %1").arg(id)));
    }

    LOG_VERBOSE() << "LocalDirectoryStore: Created folder" << id;
    return Result::success(id);
}

RemoteError LocalDirectoryStore::remove(const QString &id, QDeadlineTimer deadline)
{
    if (deadline.hasExpired()) {
        return timeoutError(id);
    }

    const QString normalized = normalizeId(id);
    if (normalized == QLatin1String("/")) {
        return RemoteError::permanent(RemoteErrorCode::PermissionDenied,
                                      QObject::tr("The root folder cannot be deleted"));
    }

    const QString path = localPathFor(normalized);
    QFileInfo info(path);
    if (path.isEmpty() || (!info.exists() && !info.isSymLink())) {
        return RemoteError::permanent(RemoteErrorCode::NotFound,
                                      QObject::tr("Item not found: %1").arg(id));
    }

    QMutexLocker locker(&structureMutex_);

    if (info.isDir() && !info.isSymLink()) {
        QDir dir(path);
        if (deepDelete_) {
            if (!dir.removeRecursively()) {
                return RemoteError::permanent(RemoteErrorCode::Io,
                                              QObject::tr("Cannot delete folder %1").arg(id));
            }
        } else {
            if (!dir.isEmpty(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System)) {
                return RemoteError::permanent(RemoteErrorCode::Other,
                                              QObject::tr("Folder is not empty: %1").arg(id));
            }
            if (!QDir(info.absolutePath()).rmdir(info.fileName())) {
                return RemoteError::permanent(RemoteErrorCode::Io,
                                              QObject::tr("Cannot delete folder %1").arg(id));
            }
        }
    } else {
        QFile file(path);
        if (!file.remove()) {
            return errorFromDevice(file, QObject::tr("Cannot delete %1").arg(id));
        }
    }

    LOG_VERBOSE() << "LocalDirectoryStore: Removed" << normalized;
    return RemoteError();
}
