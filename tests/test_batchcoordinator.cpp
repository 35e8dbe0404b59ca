#include <QtTest>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "mocks/mockremotestore.h"
#include "models/browsesession.h"
#include "services/batchcoordinator.h"
#include "services/progressreporter.h"
#include "services/transferlogger.h"

class TestBatchCoordinator : public QObject
{
    Q_OBJECT

private:
    MockRemoteStore *store;
    ProgressReporter *reporter;
    TransferLogger *logger;
    BatchCoordinator *coordinator;
    QTemporaryDir *tempDir;
    BrowseSession session{QStringLiteral("root")};

    TransferSettings testSettings(int workers = 3)
    {
        TransferSettings settings = TransferSettings::defaults();
        settings.workerCount = workers;
        settings.initialBackoffMs = 1;
        settings.maxBackoffMs = 2;
        settings.progressIntervalMs = 0;
        settings.defaultDownloadPath = tempDir->filePath("downloads");
        return settings;
    }

    void recreateCoordinator(const TransferSettings &settings)
    {
        delete coordinator;
        coordinator = new BatchCoordinator(store, reporter, logger, settings);
    }

    QString writeFile(const QString &relativePath, const QByteArray &content = "data")
    {
        const QString path = tempDir->filePath(relativePath);
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write(content);
        }
        return path;
    }

    RemoteItem remoteItem(const QString &id)
    {
        return store->item(id).value;
    }

    int submitUpload(const QStringList &paths)
    {
        TransferSelection selection;
        selection.localPaths = paths;
        return coordinator->submitBatch(selection, OperationKind::Upload, session);
    }

    static void verifyBookkeeping(const Batch &batch)
    {
        QCOMPARE(batch.completedCount + batch.failedUnits.size() + batch.skippedUnits.size(),
                 batch.totalCount());
        for (const UnitRecord &record : batch.records) {
            QVERIFY(record.isSettled());
        }
    }

private slots:
    void init()
    {
        store = new MockRemoteStore();
        reporter = new ProgressReporter();
        logger = new TransferLogger();
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());
        coordinator = nullptr;
        recreateCoordinator(testSettings());
    }

    void cleanup()
    {
        store->mockReleaseAll();
        delete coordinator;
        delete logger;
        delete reporter;
        delete store;
        delete tempDir;
        coordinator = nullptr;
        logger = nullptr;
        reporter = nullptr;
        store = nullptr;
        tempDir = nullptr;
    }

    // Upload X/{a.txt, sub/b.txt} creates the tree in the store and completes
    void testFolderUploadCompletes()
    {
        writeFile("X/a.txt", "A");
        writeFile("X/sub/b.txt", "BB");
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload({tempDir->filePath("X")});
        QVERIFY(batchId > 0);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.first().at(0).toInt(), batchId);
        QCOMPARE(finishedSpy.first().at(1).value<BatchStatus>(), BatchStatus::Completed);

        QString x = store->mockChildId("root", "X");
        QVERIFY(!x.isEmpty());
        QString sub = store->mockChildId(x, "sub");
        QVERIFY(!sub.isEmpty());
        QCOMPARE(store->mockContent(store->mockChildId(x, "a.txt")), QByteArray("A"));
        QCOMPARE(store->mockContent(store->mockChildId(sub, "b.txt")), QByteArray("BB"));

        auto batch = coordinator->batch(batchId);
        QVERIFY(batch.has_value());
        QCOMPARE(batch->status, BatchStatus::Completed);
        QCOMPARE(batch->completedCount, 4);
        verifyBookkeeping(*batch);
    }

    // Three downloads, the second fails permanently
    void testPermanentFailureMidBatchIsPartial()
    {
        QString f1 = store->mockAddFile("root", "file1", "1");
        QString f2 = store->mockAddFile("root", "file2", "2");
        QString f3 = store->mockAddFile("root", "file3", "3");
        store->mockQueueError(MockRemoteStore::Operation::Download, f2,
                              RemoteError::permanent(RemoteErrorCode::PermissionDenied, "denied"));
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        TransferSelection selection;
        selection.remoteItems << remoteItem(f1) << remoteItem(f2) << remoteItem(f3);
        selection.localDestination = tempDir->filePath("dl");
        int batchId = coordinator->submitBatch(selection, OperationKind::Download, session);

        QTRY_COMPARE(finishedSpy.count(), 1);
        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->status, BatchStatus::PartiallyFailed);
        QCOMPARE(batch->completedCount, 2);
        QCOMPARE(batch->failedUnits.keys(), QList<int>{1});
        QCOMPARE(batch->failedUnits.value(1).code, RemoteErrorCode::PermissionDenied);
        QVERIFY(QFile::exists(tempDir->filePath("dl/file1")));
        QVERIFY(!QFile::exists(tempDir->filePath("dl/file2")));
        QVERIFY(QFile::exists(tempDir->filePath("dl/file3")));

        BatchSummary summary = finishedSpy.first().at(2).value<BatchSummary>();
        QCOMPARE(summary.succeeded, 2);
        QCOMPARE(summary.failed, 1);
        verifyBookkeeping(*batch);
    }

    // Cancel after unit 1 of 5 is dispatched: unit 1 finishes, the rest are cancelled
    void testCancelAfterFirstDispatch()
    {
        recreateCoordinator(testSettings(1));
        QStringList paths;
        for (int i = 1; i <= 5; ++i) {
            paths << writeFile(QString("f%1.txt").arg(i));
        }
        store->mockHold(MockRemoteStore::Operation::Upload);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload(paths);
        QTRY_COMPARE(store->mockHeldCount(), 1);

        QVERIFY(coordinator->cancelBatch(batchId));
        auto cancelling = coordinator->batch(batchId);
        QCOMPARE(cancelling->status, BatchStatus::Cancelling);
        for (int i = 1; i < 5; ++i) {
            QCOMPARE(cancelling->records[i].outcome, UnitOutcome::Cancelled);
        }
        QCOMPARE(cancelling->records[0].outcome, UnitOutcome::Running);

        store->mockReleaseAll();
        QTRY_COMPARE(finishedSpy.count(), 1);

        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->records[0].outcome, UnitOutcome::Succeeded);
        QCOMPARE(batch->status, BatchStatus::PartiallyFailed);
        QCOMPARE(batch->summary().cancelled, 4);
        QCOMPARE(store->mockCallCount(MockRemoteStore::Operation::Upload), 1);
        verifyBookkeeping(*batch);
    }

    void testCancelAfterFirstDispatchWhichFails()
    {
        recreateCoordinator(testSettings(1));
        QStringList paths;
        for (int i = 1; i <= 5; ++i) {
            paths << writeFile(QString("f%1.txt").arg(i));
        }
        store->mockQueueError(MockRemoteStore::Operation::Upload, "f1.txt",
                              RemoteError::permanent(RemoteErrorCode::QuotaExceeded, "full"));
        store->mockHold(MockRemoteStore::Operation::Upload);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload(paths);
        QTRY_COMPARE(store->mockHeldCount(), 1);
        QVERIFY(coordinator->cancelBatch(batchId));
        store->mockReleaseAll();

        QTRY_COMPARE(finishedSpy.count(), 1);
        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->records[0].outcome, UnitOutcome::Failed);
        QCOMPARE(batch->status, BatchStatus::Failed);
        verifyBookkeeping(*batch);
    }

    void testCancelDuringPlanning()
    {
        QString docs = store->mockAddFolder("root", "docs");
        store->mockAddFile(docs, "a.txt", "x");
        store->mockHold(MockRemoteStore::Operation::List);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        TransferSelection selection;
        selection.remoteItems << remoteItem(docs);
        int batchId = coordinator->submitBatch(selection, OperationKind::Download, session);
        QTRY_COMPARE(store->mockHeldCount(), 1);

        QVERIFY(coordinator->cancelBatch(batchId));
        QCOMPARE(coordinator->batch(batchId)->status, BatchStatus::Pending);
        store->mockReleaseAll();

        QTRY_COMPARE(finishedSpy.count(), 1);
        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->status, BatchStatus::Failed);
        QCOMPARE(batch->totalCount(), 2);
        QCOMPARE(batch->summary().cancelled, 2);
        QCOMPARE(store->mockCallCount(MockRemoteStore::Operation::Download), 0);
    }

    void testCancelDuringPlanningStopsListingSubfolders()
    {
        QString docs = store->mockAddFolder("root", "docs");
        store->mockAddFile(docs, "a.txt", "x");
        QString first = store->mockAddFolder(docs, "first");
        store->mockAddFile(first, "b.txt", "y");
        QString second = store->mockAddFolder(docs, "second");
        store->mockAddFile(second, "c.txt", "z");
        store->mockHold(MockRemoteStore::Operation::List);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        TransferSelection selection;
        selection.remoteItems << remoteItem(docs);
        int batchId = coordinator->submitBatch(selection, OperationKind::Download, session);
        QTRY_COMPARE(store->mockHeldCount(), 1);

        QVERIFY(coordinator->cancelBatch(batchId));
        store->mockReleaseAll();

        QTRY_COMPARE(finishedSpy.count(), 1);
        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->status, BatchStatus::Failed);
        QVERIFY(batch->planningCancelled);
        QCOMPARE(store->mockCallCount(MockRemoteStore::Operation::List), 1);
        QCOMPARE(batch->totalCount(), 2);
        QCOMPARE(batch->summary().cancelled, 2);
        QVERIFY(!QFileInfo::exists(tempDir->filePath("downloads/docs/first")));
        verifyBookkeeping(*batch);
    }

    void testFailedParentSkipsDescendants()
    {
        writeFile("X/a.txt");
        writeFile("X/sub/b.txt");
        store->mockQueueError(MockRemoteStore::Operation::CreateFolder, "X",
                              RemoteError::permanent(RemoteErrorCode::PermissionDenied, "read-only"));
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload({tempDir->filePath("X")});

        QTRY_COMPARE(finishedSpy.count(), 1);
        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->status, BatchStatus::Failed);
        QCOMPARE(batch->records[0].outcome, UnitOutcome::Failed);
        for (int i = 1; i < 4; ++i) {
            QCOMPARE(batch->records[i].outcome, UnitOutcome::Skipped);
        }
        QCOMPARE(batch->summary().skipped, 3);
        QCOMPARE(store->mockCallCount(MockRemoteStore::Operation::Upload), 0);
        verifyBookkeeping(*batch);
    }

    void testRefreshRequestedOncePerBatch()
    {
        QStringList paths;
        for (int i = 0; i < 6; ++i) {
            paths << writeFile(QString("many%1.txt").arg(i));
        }
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);
        QSignalSpy refreshSpy(coordinator, &BatchCoordinator::refreshRequested);

        int batchId = submitUpload(paths);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(refreshSpy.count(), 1);
        QCOMPARE(refreshSpy.first().at(0).toInt(), batchId);

        // Nothing else arrives later
        QTest::qWait(50);
        QCOMPARE(finishedSpy.count(), 1);
        QCOMPARE(refreshSpy.count(), 1);
    }

    void testNoRefreshWhenAutoRefreshDisabled()
    {
        TransferSettings settings = testSettings();
        settings.autoRefresh = false;
        recreateCoordinator(settings);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);
        QSignalSpy refreshSpy(coordinator, &BatchCoordinator::refreshRequested);

        submitUpload({writeFile("one.txt")});

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(refreshSpy.count(), 0);
    }

    void testProgressEventsPerUnitAndBatch()
    {
        QStringList paths;
        for (int i = 0; i < 4; ++i) {
            paths << writeFile(QString("p%1.txt").arg(i));
        }
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload(paths);
        QTRY_COMPARE(finishedSpy.count(), 1);

        QList<ProgressEvent> events = reporter->takeAll();
        int unitEvents = 0;
        int batchEvents = 0;
        for (const ProgressEvent &event : events) {
            if (event.batchId != batchId) {
                continue;
            }
            if (event.type == ProgressEvent::Type::UnitFinished) {
                unitEvents++;
            } else if (event.type == ProgressEvent::Type::BatchFinished) {
                batchEvents++;
                QCOMPARE(event.batchStatus.value(), BatchStatus::Completed);
                QCOMPARE(event.summary.succeeded, 4);
            }
        }
        QCOMPARE(unitEvents, 4);
        QCOMPARE(batchEvents, 1);
        QCOMPARE(events.last().type, ProgressEvent::Type::BatchFinished);
    }

    void testEmptySelectionIsRejected()
    {
        QSignalSpy startedSpy(coordinator, &BatchCoordinator::batchStarted);
        QString error;

        int batchId = coordinator->submitBatch(TransferSelection(), OperationKind::Upload, session, &error);

        QCOMPARE(batchId, -1);
        QVERIFY(!error.isEmpty());
        QCOMPARE(startedSpy.count(), 0);
        QVERIFY(coordinator->batchIds().isEmpty());
    }

    void testCreateFolderBatchCompletesAndRefreshesOnce()
    {
        QString projects = store->mockAddFolder("root", "Projects");
        BrowseSession inProjects(QStringLiteral("root"));
        inProjects.enterFolder(projects, "Projects");
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);
        QSignalSpy refreshSpy(coordinator, &BatchCoordinator::refreshRequested);

        TransferSelection selection;
        selection.folderName = " Reports ";
        int batchId = coordinator->submitBatch(selection, OperationKind::CreateFolder, inProjects);
        QVERIFY(batchId > 0);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(finishedSpy.first().at(1).value<BatchStatus>(), BatchStatus::Completed);
        QCOMPARE(refreshSpy.count(), 1);

        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->operation, OperationKind::CreateFolder);
        QCOMPARE(batch->totalCount(), 1);
        QVERIFY(batch->description.contains("Reports"));
        const QString created = store->mockChildId(projects, "Reports");
        QVERIFY(!created.isEmpty());
        QCOMPARE(batch->records[0].resultId, created);

        QTest::qWait(50);
        QCOMPARE(refreshSpy.count(), 1);
    }

    void testCreateFolderReusesExistingFolder()
    {
        QString existing = store->mockAddFolder("root", "Reports");
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        TransferSelection selection;
        selection.folderName = "Reports";
        int batchId = coordinator->submitBatch(selection, OperationKind::CreateFolder, session);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(coordinator->batch(batchId)->status, BatchStatus::Completed);
        QCOMPARE(coordinator->batch(batchId)->records[0].resultId, existing);
        QCOMPARE(store->mockChildNames("root"), QStringList{"Reports"});
    }

    void testInvalidFolderNameIsRejected()
    {
        QSignalSpy startedSpy(coordinator, &BatchCoordinator::batchStarted);
        QString error;

        TransferSelection blank;
        blank.folderName = "   ";
        QCOMPARE(coordinator->submitBatch(blank, OperationKind::CreateFolder, session, &error), -1);
        QVERIFY(!error.isEmpty());

        TransferSelection nested;
        nested.folderName = "a/b";
        error.clear();
        QCOMPARE(coordinator->submitBatch(nested, OperationKind::CreateFolder, session, &error), -1);
        QVERIFY(!error.isEmpty());

        QCOMPARE(startedSpy.count(), 0);
        QCOMPARE(store->mockCallCount(MockRemoteStore::Operation::CreateFolder), 0);
    }

    void testDeletingRootIsRejected()
    {
        TransferSelection selection;
        selection.remoteItems << remoteItem("root");
        QString error;

        QCOMPARE(coordinator->submitBatch(selection, OperationKind::Delete, session, &error), -1);
        QVERIFY(!error.isEmpty());
    }

    void testWorkerBoundIsRespected()
    {
        recreateCoordinator(testSettings(2));
        store->mockSetLatency(30);
        QStringList paths;
        for (int i = 0; i < 6; ++i) {
            paths << writeFile(QString("c%1.txt").arg(i));
        }
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        submitUpload(paths);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(store->mockMaxConcurrent(), 2);
        QCOMPARE(coordinator->inFlightCount(), 0);
    }

    void testBatchesAreServedInSubmissionOrder()
    {
        recreateCoordinator(testSettings(1));
        QStringList first;
        first << writeFile("first-a.txt") << writeFile("first-b.txt") << writeFile("first-c.txt");
        QStringList second;
        second << writeFile("second-a.txt") << writeFile("second-b.txt");
        store->mockHold(MockRemoteStore::Operation::Upload);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int firstId = submitUpload(first);
        QTRY_COMPARE(store->mockHeldCount(), 1);
        int secondId = submitUpload(second);
        QTRY_VERIFY(coordinator->batch(secondId)->planned);

        store->mockReleaseAll();
        QTRY_COMPARE(finishedSpy.count(), 2);
        QCOMPARE(finishedSpy.at(0).at(0).toInt(), firstId);
        QCOMPARE(finishedSpy.at(1).at(0).toInt(), secondId);

        QStringList uploads;
        for (const QString &call : store->mockCalls()) {
            if (call.startsWith("upload:")) {
                uploads << call.mid(7);
            }
        }
        QCOMPARE(uploads, QStringList({"first-a.txt", "first-b.txt", "first-c.txt",
                                       "second-a.txt", "second-b.txt"}));
    }

    void testPlanningErrorMakesBatchPartial()
    {
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload({tempDir->filePath("missing.txt"), writeFile("present.txt")});

        QTRY_COMPARE(finishedSpy.count(), 1);
        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->status, BatchStatus::PartiallyFailed);
        QCOMPARE(batch->planningErrors.size(), 1);
        QCOMPARE(batch->completedCount, 1);
    }

    void testPlanWithOnlyErrorsFails()
    {
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload({tempDir->filePath("missing.txt")});

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(coordinator->batch(batchId)->status, BatchStatus::Failed);
        QCOMPARE(coordinator->batch(batchId)->totalCount(), 0);
    }

    void testShallowDeleteRemovesContentsFirst()
    {
        store->mockSetDeepDelete(false);
        QString folder = store->mockAddFolder("root", "old");
        store->mockAddFile(folder, "a.txt", "x");
        QString sub = store->mockAddFolder(folder, "nested");
        store->mockAddFile(sub, "b.txt", "x");
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        TransferSelection selection;
        selection.remoteItems << remoteItem(folder);
        int batchId = coordinator->submitBatch(selection, OperationKind::Delete, session);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(coordinator->batch(batchId)->status, BatchStatus::Completed);
        QVERIFY(!store->mockExists(folder));
        QVERIFY(store->mockChildNames("root").isEmpty());
    }

    void testFolderDownloadUsesDefaultPath()
    {
        QString music = store->mockAddFolder("root", "Music");
        QString albums = store->mockAddFolder(music, "Albums");
        store->mockAddFile(albums, "track.sid", "sid");
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        TransferSelection selection;
        selection.remoteItems << remoteItem(music);
        coordinator->submitBatch(selection, OperationKind::Download, session);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QFile file(tempDir->filePath("downloads/Music/Albums/track.sid"));
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), QByteArray("sid"));
    }

    void testUploadGoesIntoSessionFolder()
    {
        QString target = store->mockAddFolder("root", "Inbox");
        BrowseSession inbox(QStringLiteral("root"));
        inbox.enterFolder(target, "Inbox");
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        TransferSelection selection;
        selection.localPaths << writeFile("mail.txt");
        coordinator->submitBatch(selection, OperationKind::Upload, inbox);

        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(store->mockChildNames(target), QStringList{"mail.txt"});
    }

    void testAcknowledgeOnlyTerminalBatches()
    {
        store->mockHold(MockRemoteStore::Operation::Upload);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload({writeFile("ack.txt")});
        QTRY_COMPARE(store->mockHeldCount(), 1);
        QVERIFY(!coordinator->acknowledgeBatch(batchId));
        QVERIFY(coordinator->hasActiveBatches());

        store->mockReleaseAll();
        QTRY_COMPARE(finishedSpy.count(), 1);
        QVERIFY(!coordinator->hasActiveBatches());
        QVERIFY(!coordinator->cancelBatch(batchId));
        QVERIFY(coordinator->acknowledgeBatch(batchId));
        QVERIFY(!coordinator->batch(batchId).has_value());
        QVERIFY(!coordinator->acknowledgeBatch(batchId));
    }

    void testStatusTransitions()
    {
        QSignalSpy statusSpy(coordinator, &BatchCoordinator::batchStatusChanged);
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        submitUpload({writeFile("s.txt")});
        QTRY_COMPARE(finishedSpy.count(), 1);

        QStringList statuses;
        for (const QList<QVariant> &args : statusSpy) {
            statuses << batchStatusToString(args.at(1).value<BatchStatus>());
        }
        QCOMPARE(statuses, QStringList({"Pending", "Running", "Completed"}));
    }

    void testTransientErrorsAreLoggedPerAttempt()
    {
        QString path = writeFile("retry.txt");
        store->mockQueueError(MockRemoteStore::Operation::Upload, "retry.txt",
                              RemoteError::transient(RemoteErrorCode::Network, "reset"));
        store->mockQueueError(MockRemoteStore::Operation::Upload, "retry.txt",
                              RemoteError::transient(RemoteErrorCode::Network, "reset"));
        QSignalSpy finishedSpy(coordinator, &BatchCoordinator::batchFinished);

        int batchId = submitUpload({path});
        QTRY_COMPARE(finishedSpy.count(), 1);

        auto batch = coordinator->batch(batchId);
        QCOMPARE(batch->status, BatchStatus::Completed);
        QCOMPARE(batch->records[0].attempts, 3);

        int starts = 0;
        for (const LogRecord &record : logger->recordsForUnit(QString("%1/0").arg(batchId))) {
            if (record.message.contains(" of 3: ")) {
                starts++;
            }
        }
        QCOMPARE(starts, 3);
    }
};

QTEST_MAIN(TestBatchCoordinator)
#include "test_batchcoordinator.moc"
