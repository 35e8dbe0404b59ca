/**
 * @file mockremotestore.h
 * @brief In-memory RemoteStore for testing the transfer engine.
 *
 * This mock implements IRemoteStore and can be shared by worker threads
 * exactly like a production store.
 */

#ifndef MOCKREMOTESTORE_H
#define MOCKREMOTESTORE_H

#include <QByteArray>
#include <QHash>
#include <QMutex>
#include <QQueue>
#include <QStringList>
#include <QWaitCondition>

#include "services/iremotestore.h"

/**
 * @brief Thread-safe mock store holding a folder tree in memory.
 *
 * @par Features:
 * - Opaque identifiers ("root", "id-1", ...) so tests cannot rely on paths
 * - Scripted errors per operation and key, consumed in order
 * - Call log and concurrency tracking for scheduling assertions
 * - Optional latency, and gates that hold calls until released
 * - Short downloads and create-folder races
 *
 * @par Example usage:
 * @code
 * MockRemoteStore store;
 * QString docs = store.mockAddFolder(store.rootId(), "docs");
 * store.mockAddFile(docs, "a.txt", "hello");
 * store.mockQueueError(MockRemoteStore::Operation::Upload, "b.txt",
 *                      RemoteError::transient(RemoteErrorCode::Network, "reset"));
 * @endcode
 */
class MockRemoteStore : public IRemoteStore
{
public:
    enum class Operation { List, Item, Upload, Download, CreateFolder, Remove };

    MockRemoteStore();
    ~MockRemoteStore() override;

    /// @name IRemoteStore Implementation
    /// @{
    [[nodiscard]] QString rootId() const override { return QStringLiteral("root"); }
    [[nodiscard]] bool supportsDeepDelete() const override;

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

    /// @name Mock Control Methods
    /// @{

    /**
     * @brief Adds a folder under @p parentId.
     * @return The new folder's id.
     */
    QString mockAddFolder(const QString &parentId, const QString &name);

    /**
     * @brief Adds a file under @p parentId.
     * @return The new file's id.
     */
    QString mockAddFile(const QString &parentId, const QString &name, const QByteArray &content);

    void mockSetDeepDelete(bool deep);

    /**
     * @brief Makes the next call of @p op for @p key fail.
     * @param key Item id for List/Item/Download/Remove, item name for
     *        Upload (local file name) and CreateFolder. Empty matches any key.
     *
     * Errors queued for the same operation and key are consumed in order.
     */
    void mockQueueError(Operation op, const QString &key, const RemoteError &error);

    /**
     * @brief Makes downloads of @p id write @p missingBytes fewer bytes.
     */
    void mockSetDownloadShortfall(const QString &id, qint64 missingBytes);

    /**
     * @brief Makes createFolder(name) create the folder but answer
     *        AlreadyExists, as if another client created it first.
     */
    void mockSetCreateFolderConflict(const QString &name);

    /**
     * @brief Delays every call by @p ms. A call whose deadline is shorter
     *        fails with a Timeout error.
     */
    void mockSetLatency(int ms);

    /**
     * @brief Holds calls of @p op until mockRelease() is called.
     */
    void mockHold(Operation op);

    /**
     * @brief Lets @p count held calls proceed.
     */
    void mockRelease(int count = 1);

    /**
     * @brief Stops holding calls and releases every waiting call.
     */
    void mockReleaseAll();
    /// @}

    /// @name Test Inspection Methods
    /// @{

    /**
     * @brief Returns every call made, as "operation:key" strings.
     */
    [[nodiscard]] QStringList mockCalls() const;

    [[nodiscard]] int mockCallCount(Operation op) const;

    /// Calls currently blocked by mockHold()
    [[nodiscard]] int mockHeldCount() const;

    /// Highest number of calls that were in progress at the same time
    [[nodiscard]] int mockMaxConcurrent() const;

    [[nodiscard]] bool mockExists(const QString &id) const;
    [[nodiscard]] QByteArray mockContent(const QString &id) const;

    /**
     * @brief Finds a child by name.
     * @return The child's id, or empty.
     */
    [[nodiscard]] QString mockChildId(const QString &parentId, const QString &name) const;

    [[nodiscard]] QStringList mockChildNames(const QString &parentId) const;

    void mockReset();
    /// @}

    [[nodiscard]] static QString operationName(Operation op);

private:
    struct Node {
        QString id;
        QString name;
        QString parentId;
        bool isFolder = false;
        QByteArray content;
    };

    /// Keeps the in-progress count for the lifetime of one call
    class ActiveCall
    {
    public:
        explicit ActiveCall(MockRemoteStore *store) : store_(store) {}
        ~ActiveCall() { store_->leave(); }
        ActiveCall(const ActiveCall &) = delete;
        ActiveCall &operator=(const ActiveCall &) = delete;

    private:
        MockRemoteStore *store_;
    };

    /// Begins a call: logs it, waits for gates and latency, pops scripted errors
    RemoteError enter(Operation op, const QString &key, const QDeadlineTimer &deadline);
    void leave();

    QString addNodeLocked(const QString &parentId, const QString &name, bool isFolder,
                          const QByteArray &content);
    QString childIdLocked(const QString &parentId, const QString &name) const;
    void removeSubtreeLocked(const QString &id);
    [[nodiscard]] RemoteItem toItem(const Node &node) const;

    mutable QMutex mutex_;
    QWaitCondition gate_;

    QHash<QString, Node> nodes_;
    QStringList order_;   // Insertion order of node ids
    int nextId_ = 1;
    bool deepDelete_ = true;

    QHash<QString, QQueue<RemoteError>> errors_;
    QHash<QString, qint64> shortfalls_;
    QStringList conflicts_;
    int latencyMs_ = 0;

    QList<Operation> held_;
    int permits_ = 0;
    int waiting_ = 0;
    int active_ = 0;
    int maxActive_ = 0;
    QStringList calls_;
};

#endif // MOCKREMOTESTORE_H
