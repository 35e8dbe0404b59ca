/**
 * @file pathplanner.h
 * @brief Expands a user selection into an ordered list of transfer units.
 */

#ifndef PATHPLANNER_H
#define PATHPLANNER_H

#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <memory>

#include "cancellationtoken.h"
#include "iremotestore.h"
#include "retrypolicy.h"
#include "models/transfererror.h"
#include "models/transferselection.h"
#include "models/transferunit.h"

/**
 * @brief Where a planned batch reads from and writes to.
 */
struct PlanContext {
    QString remoteParentId;     ///< Upload destination folder
    QString localDestination;   ///< Download destination directory
    int listTimeoutMs = 300000; ///< Deadline for each remote listing attempt
    std::shared_ptr<const CancellationToken> cancellation; ///< Stops planning when set

    [[nodiscard]] bool isCancelled() const { return cancellation && cancellation->isCancelled(); }
};

/**
 * @brief Units plus the errors of branches that could not be planned.
 */
struct PlanResult {
    QList<TransferUnit> units;
    QList<TransferError> errors;
    bool cancelled = false; ///< Planning stopped early; units cover only what was expanded
};

/**
 * @brief Turns selections into flat, dependency-ordered unit lists.
 *
 * Ordering rules:
 * - Uploads and downloads walk folders depth-first, pre-order. A folder's
 *   CreateFolder unit comes first, then its files by name, then its
 *   subfolders by name. Every child depends on its folder's unit.
 * - Deletes produce one unit per selected item when the store deletes
 *   folders deeply. Otherwise folder contents are expanded post-order
 *   and each folder's unit depends on all of its direct children.
 *
 * A branch that cannot be read (unreadable local path, failed remote
 * listing) is dropped with a planning error; the remaining selections
 * are still planned. Folders are walked with an explicit stack, so
 * hierarchy depth does not grow the call stack. Once the context's
 * cancellation token is set no further selection or folder is expanded.
 *
 * plan() only reads from the store and may run on a worker thread.
 */
class PathPlanner
{
public:
    /**
     * @brief Constructs a planner.
     * @param store Store used for remote listings (not owned).
     * @param listRetry Retry rules for transient listing failures.
     */
    explicit PathPlanner(IRemoteStore *store, const RetryPolicy &listRetry = RetryPolicy());

    [[nodiscard]] PlanResult plan(const TransferSelection &selection,
                                  OperationKind kind,
                                  const PlanContext &context) const;

    [[nodiscard]] PlanResult planUpload(const QStringList &localPaths,
                                        const QString &remoteParentId,
                                        const PlanContext &context = PlanContext()) const;

    [[nodiscard]] PlanResult planDownload(const QList<RemoteItem> &items,
                                          const QString &localDestination,
                                          const PlanContext &context = PlanContext()) const;

    [[nodiscard]] PlanResult planDelete(const QList<RemoteItem> &items,
                                        const PlanContext &context = PlanContext()) const;

    /// One remote CreateFolder unit named @p name under @p remoteParentId.
    [[nodiscard]] PlanResult planCreateFolder(const QString &name,
                                              const QString &remoteParentId) const;

private:
    void appendUploadTree(const QString &rootPath, const QString &remoteParentId,
                          const PlanContext &context, PlanResult &result) const;
    void appendDownloadTree(const RemoteItem &root, const QString &localDestination,
                            QSet<QString> &takenNames, const PlanContext &context,
                            PlanResult &result) const;
    void appendDeleteTree(const RemoteItem &root, const PlanContext &context,
                          PlanResult &result) const;

    [[nodiscard]] RemoteResult<QList<RemoteItem>> listWithRetry(const QString &folderId,
                                                                const PlanContext &context) const;

    static int appendUnit(PlanResult &result, TransferUnit unit);
    static bool stopIfCancelled(const PlanContext &context, PlanResult &result);

    /**
     * @brief Sanitizes @p remoteName and makes it unique among @p taken,
     *        adding " (1)", " (2)", ... before the extension.
     */
    static QString uniqueLocalName(const QString &remoteName, QSet<QString> &taken);
    static void sortByName(QList<RemoteItem> &items);

    IRemoteStore *store_ = nullptr;
    RetryPolicy listRetry_;
};

#endif // PATHPLANNER_H
