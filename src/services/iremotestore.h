/**
 * @file iremotestore.h
 * @brief Interface for remote hierarchical file store implementations.
 *
 * This interface allows dependency injection of store clients, enabling
 * runtime swapping between production and mock implementations for testing.
 */

#ifndef IREMOTESTORE_H
#define IREMOTESTORE_H

#include <QDeadlineTimer>
#include <QList>
#include <QString>
#include <functional>

#include "remoteerror.h"
#include "remoteitem.h"

/**
 * @brief Abstract interface for remote store clients.
 *
 * Calls are blocking and are issued from transfer worker threads, so
 * implementations must be safe to call concurrently. Workers share one
 * store instance and never change its connection state.
 *
 * Every call takes a deadline. An implementation that cannot finish in
 * time returns a Timeout error, which the engine treats as transient.
 *
 * @par Example usage:
 * @code
 * // Production code
 * IRemoteStore *store = new LocalDirectoryStore("/mnt/share");
 *
 * // Test code
 * IRemoteStore *store = new MockRemoteStore();
 *
 * // Both can be used identically
 * auto listing = store->list(store->rootId());
 * if (!listing.ok()) {
 *     qWarning() << listing.error.message;
 * }
 * @endcode
 */
class IRemoteStore
{
public:
    /**
     * @brief Progress callback for streaming calls.
     * @param transferred Bytes transferred so far.
     * @param total Total bytes (0 if unknown).
     */
    using ProgressCallback = std::function<void(qint64 transferred, qint64 total)>;

    virtual ~IRemoteStore() = default;

    /**
     * @brief Returns the identifier of the root folder.
     */
    [[nodiscard]] virtual QString rootId() const = 0;

    /**
     * @brief Whether remove() on a folder deletes its whole subtree.
     *
     * When false, callers must delete folder contents first.
     */
    [[nodiscard]] virtual bool supportsDeepDelete() const = 0;

    /// @name Browsing
    /// @{

    /**
     * @brief Lists the direct children of a folder.
     * @param folderId Folder to list.
     * @param deadline Time limit for the call.
     */
    virtual RemoteResult<QList<RemoteItem>> list(const QString &folderId,
                                                 QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever)) = 0;

    /**
     * @brief Fetches metadata for a single item.
     * @param id Item identifier.
     * @param deadline Time limit for the call.
     */
    virtual RemoteResult<RemoteItem> item(const QString &id,
                                          QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever)) = 0;
    /// @}

    /// @name Transfers
    /// @{

    /**
     * @brief Uploads a local file into a folder, keeping its file name.
     * @param parentId Destination folder.
     * @param localPath File to upload.
     * @param deadline Time limit for the call.
     * @param progress Optional progress callback.
     * @return The identifier of the new remote file.
     */
    virtual RemoteResult<QString> upload(const QString &parentId,
                                         const QString &localPath,
                                         QDeadlineTimer deadline,
                                         const ProgressCallback &progress = ProgressCallback()) = 0;

    /**
     * @brief Downloads a remote file to a local path.
     * @param remoteId File to download.
     * @param localPath Where to write the content.
     * @param deadline Time limit for the call.
     * @param progress Optional progress callback.
     */
    virtual RemoteError download(const QString &remoteId,
                                 const QString &localPath,
                                 QDeadlineTimer deadline,
                                 const ProgressCallback &progress = ProgressCallback()) = 0;
    /// @}

    /// @name Structure
    /// @{

    /**
     * @brief Creates a folder.
     * @return The identifier of the new folder, or an AlreadyExists error
     *         if the store refuses duplicate names.
     */
    virtual RemoteResult<QString> createFolder(const QString &parentId,
                                               const QString &name,
                                               QDeadlineTimer deadline) = 0;

    /**
     * @brief Deletes a file or folder by identifier.
     */
    virtual RemoteError remove(const QString &id, QDeadlineTimer deadline) = 0;
    /// @}
};

#endif // IREMOTESTORE_H
