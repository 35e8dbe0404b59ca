/**
 * @file localdirectorystore.h
 * @brief RemoteStore implementation backed by a local directory tree.
 */

#ifndef LOCALDIRECTORYSTORE_H
#define LOCALDIRECTORYSTORE_H

#include <QMutex>
#include <QString>

#include "iremotestore.h"

class QFileDevice;

/**
 * @brief Serves a directory on disk (a mounted share, a sync folder) as a
 *        hierarchical store.
 *
 * Identifiers are paths relative to the root, always starting with '/'.
 * The root itself is "/". Identifiers that would leave the root are
 * rejected with NotFound.
 *
 * Content is streamed in chunks of @c chunkSize bytes; the deadline is
 * checked after every chunk. Uploads are written through QSaveFile so a
 * failed upload never leaves a truncated file behind.
 */
class LocalDirectoryStore : public IRemoteStore
{
public:
    /**
     * @brief Constructs a store.
     * @param rootPath Directory to serve.
     * @param chunkSize Streaming chunk size in bytes.
     * @param deepDelete Whether remove() deletes non-empty folders.
     */
    explicit LocalDirectoryStore(const QString &rootPath,
                                 int chunkSize = 8192,
                                 bool deepDelete = true);
    ~LocalDirectoryStore() override = default;

    /**
     * @brief Returns true if the root exists and is a directory.
     */
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] QString rootPath() const { return rootPath_; }

    /**
     * @brief Maps an identifier to its absolute path on disk.
     * @return Empty if the identifier points outside the root.
     */
    [[nodiscard]] QString localPathFor(const QString &id) const;

    /// @name IRemoteStore
    /// @{
    [[nodiscard]] QString rootId() const override { return QStringLiteral("/"); }
    [[nodiscard]] bool supportsDeepDelete() const override { return deepDelete_; }

    RemoteResult<QList<RemoteItem>> list(const QString &folderId,
                                         QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever)) override;
    RemoteResult<RemoteItem> item(const QString &id,
                                  QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever)) override;
    RemoteResult<QString> upload(const QString &parentId,
                                 const QString &localPath,
                                 QDeadlineTimer deadline,
                                 const ProgressCallback &progress = ProgressCallback()) override;
    RemoteError download(const QString &remoteId,
                         const QString &localPath,
                         QDeadlineTimer deadline,
                         const ProgressCallback &progress = ProgressCallback()) override;
    RemoteResult<QString> createFolder(const QString &parentId,
                                       const QString &name,
                                       QDeadlineTimer deadline) override;
    RemoteError remove(const QString &id, QDeadlineTimer deadline) override;
    /// @}

private:
    [[nodiscard]] static QString normalizeId(const QString &id);
    [[nodiscard]] static QString childId(const QString &parentId, const QString &name);
    [[nodiscard]] static bool isValidName(const QString &name);
    [[nodiscard]] static RemoteError errorFromDevice(const QFileDevice &device, const QString &what);
    [[nodiscard]] static RemoteError timeoutError(const QString &what);

    RemoteError copyStream(QFileDevice &source, QFileDevice &target, qint64 total,
                           const QDeadlineTimer &deadline, const ProgressCallback &progress) const;

    QString rootPath_;
    int chunkSize_;
    bool deepDelete_;
    QMutex structureMutex_;  // Serializes folder creation and removal
};

#endif // LOCALDIRECTORYSTORE_H
