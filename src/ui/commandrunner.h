#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QObject>
#include <QStringList>
#include <QTextStream>

#include "models/batch.h"
#include "models/browsesession.h"
#include "models/transferselection.h"
#include "models/transferunit.h"
#include "services/transfersettings.h"

class BatchCoordinator;
class ConsoleProgressView;
class IRemoteStore;

/**
 * @brief Runs one command-line operation against a store.
 *
 * Browsing commands complete synchronously. Transfer commands resolve
 * their arguments, ask for confirmation when the settings require it,
 * submit a batch and report finished() once the batch is terminal and,
 * with autoRefresh enabled, the affected folder has been listed again.
 */
class CommandRunner : public QObject
{
    Q_OBJECT

public:
    enum ExitCode {
        Success = 0,
        BatchNotCompleted = 1,
        UsageError = 2
    };

    CommandRunner(IRemoteStore *store,
                  BatchCoordinator *coordinator,
                  ConsoleProgressView *view,
                  const TransferSettings &settings,
                  bool assumeYes,
                  QObject *parent = nullptr);

    /**
     * @brief Prints the contents of a folder, folders first.
     * @return Success or UsageError if the folder cannot be listed.
     */
    int listFolder(const QString &folderId);

    /**
     * @brief Uploads local paths into a remote folder.
     * @return False if nothing was submitted; exitCode() says why.
     */
    bool startUpload(const QStringList &localPaths, const QString &remoteFolderId);

    /**
     * @brief Downloads remote items into a local directory.
     * @param localDestination Target directory, or empty for the default.
     */
    bool startDownload(const QStringList &remoteIds, const QString &localDestination);

    bool startDelete(const QStringList &remoteIds);

    /**
     * @brief Creates one folder named @p name inside a remote folder.
     *
     * Runs as a single-unit batch without confirmation; an existing
     * folder with the same name is reused.
     */
    bool startCreateFolder(const QString &name, const QString &parentFolderId);

    /**
     * @brief Cancels the running batch, if any.
     */
    void cancel();

    [[nodiscard]] int exitCode() const { return exitCode_; }
    [[nodiscard]] int batchId() const { return batchId_; }

signals:
    void finished(int exitCode);

private slots:
    void onBatchFinished(int batchId, BatchStatus status, const BatchSummary &summary);
    void onRefreshRequested(int batchId);

private:
    bool resolveItems(const QStringList &remoteIds, QList<RemoteItem> *items);
    bool confirm(const QString &question);
    bool submit(const TransferSelection &selection, OperationKind kind);
    void finish();

    IRemoteStore *store_;
    BatchCoordinator *coordinator_;
    ConsoleProgressView *view_;
    TransferSettings settings_;
    bool assumeYes_;
    BrowseSession session_;
    QTextStream out_;
    QTextStream err_;
    int batchId_ = -1;
    int exitCode_ = Success;
    bool batchDone_ = false;
};

#endif // COMMANDRUNNER_H
