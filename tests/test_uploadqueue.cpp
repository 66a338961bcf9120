#include <QtTest>
#include <QSignalSpy>

#include <optional>
#include <utility>

#include "mocks/mocktransferclient.h"
#include "models/uploadqueue.h"
#include "services/uploadscheduler.h"

class TestUploadQueue : public QObject
{
    Q_OBJECT

private:
    MockTransferClient *mockClient;
    UploadQueue *queue;
    UploadScheduler *scheduler;

    QString submitFile(const QString &name, qint64 size = 1000)
    {
        return queue->submit({"/tmp/" + name, name, size, "uploads"});
    }

    std::optional<UploadState> stateOf(const QString &id) const
    {
        std::optional<UploadTask> task = queue->task(id);
        if (!task) {
            return std::nullopt;
        }
        return task->state;
    }

    static std::optional<UploadState> taskStateIn(const UploadSnapshot &snapshot, const QString &id)
    {
        for (const UploadTask &task : snapshot.tasks) {
            if (task.id == id) {
                return task.state;
            }
        }
        return std::nullopt;
    }

    static UploadSnapshot lastSnapshot(const QSignalSpy &spy)
    {
        return spy.last().at(0).value<UploadSnapshot>();
    }

private slots:
    void initTestCase()
    {
        qRegisterMetaType<UploadSnapshot>();
        qRegisterMetaType<UploadError>();
    }

    void init()
    {
        mockClient = new MockTransferClient(this);
        queue = new UploadQueue(this);
        scheduler = new UploadScheduler(queue, mockClient, this);
    }

    void cleanup()
    {
        delete scheduler;
        delete queue;
        delete mockClient;
        scheduler = nullptr;
        queue = nullptr;
        mockClient = nullptr;
    }

    // ========== Submission ==========

    void testSubmitCreatesWaitingTaskAndAdmitsIt()
    {
        QSignalSpy startedSpy(queue, &UploadQueue::uploadStarted);

        QString id = submitFile("a.jpg", 5000);

        QVERIFY(!id.isEmpty());
        QCOMPARE(queue->count(), 1);
        QCOMPARE(stateOf(id), std::optional(UploadState::Active));
        QCOMPARE(startedSpy.count(), 1);
        QCOMPARE(startedSpy.first().at(0).toString(), id);

        std::optional<UploadTask> task = queue->task(id);
        QVERIFY(task.has_value());
        QCOMPARE(task->displayName, QString("a.jpg"));
        QCOMPARE(task->declaredSize, qint64(5000));
        QCOMPARE(task->retryCount, 0);
        QCOMPARE(task->maxRetries, UploadTask::DefaultMaxRetries);
        QCOMPARE(task->attempt, 1);

        QCOMPARE(mockClient->mockGetStartRequests(), QStringList{"/tmp/a.jpg"});
        QCOMPARE(mockClient->mockGetDestinationHints(), QStringList{"uploads"});
    }

    void testSubmitDefaultsDisplayNameToFileName()
    {
        QString id = queue->submit({"/data/photos/b.png", QString(), 0, QString()});
        QCOMPARE(queue->task(id)->displayName, QString("b.png"));
    }

    void testIdsAreUnique()
    {
        QSet<QString> ids;
        for (int i = 0; i < 20; ++i) {
            ids.insert(submitFile(QString("f%1.jpg").arg(i)));
        }
        QCOMPARE(ids.size(), 20);
    }

    void testSnapshotAfterSubmit()
    {
        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);

        submitFile("a.jpg");

        QVERIFY(snapshotSpy.count() >= 1);
        UploadSnapshot snapshot = lastSnapshot(snapshotSpy);
        QCOMPARE(snapshot.counts.total, 1);
        QCOMPARE(snapshot.counts.active, 1);
        QCOMPARE(snapshot.overallProgress, 0);
    }

    // ========== Admission limit ==========

    // activeLimit=2, three files: two start at once, the third waits for a slot
    void testActiveLimitHoldsBackExtraTasks()
    {
        queue->setActiveLimit(2);
        QString t1 = submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");
        QString t3 = submitFile("3.jpg");

        QCOMPARE(stateOf(t1), std::optional(UploadState::Active));
        QCOMPARE(stateOf(t2), std::optional(UploadState::Active));
        QCOMPARE(stateOf(t3), std::optional(UploadState::Waiting));
        QCOMPARE(mockClient->mockStartCount(), 2);

        mockClient->mockLatestHandle("/tmp/1.jpg")->mockSucceed("https://cdn/1.jpg", 120);

        QCOMPARE(stateOf(t1), std::optional(UploadState::Succeeded));
        QCOMPARE(stateOf(t3), std::optional(UploadState::Active));
        QCOMPARE(mockClient->mockStartCount(), 3);
        QCOMPARE(queue->activeCount(), 2);
    }

    void testActiveCountNeverExceedsLimit()
    {
        queue->setActiveLimit(3);
        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);

        for (int i = 0; i < 10; ++i) {
            submitFile(QString("%1.jpg").arg(i));
        }
        while (!mockClient->mockLiveHandles().isEmpty()) {
            MockTransferHandle *handle = mockClient->mockLiveHandles().first();
            handle->mockProgress(50, 1000.0);
            handle->mockSucceed("https://cdn/" + handle->sourcePath());
        }

        for (const QList<QVariant> &args : std::as_const(snapshotSpy)) {
            QVERIFY(args.at(0).value<UploadSnapshot>().counts.active <= 3);
        }
        QCOMPARE(mockClient->mockStartCount(), 10);
        QCOMPARE(lastSnapshot(snapshotSpy).counts.succeeded, 10);
        QCOMPARE(lastSnapshot(snapshotSpy).overallProgress, 100);
    }

    void testAdmissionIsFifo()
    {
        queue->setActiveLimit(1);
        submitFile("first.jpg");
        submitFile("second.jpg");
        submitFile("third.jpg");

        mockClient->mockLatestHandle("/tmp/first.jpg")->mockFail("Invalid token");
        mockClient->mockLatestHandle("/tmp/second.jpg")->mockSucceed("https://cdn/2");

        QCOMPARE(mockClient->mockGetStartRequests(),
                 (QStringList{"/tmp/first.jpg", "/tmp/second.jpg", "/tmp/third.jpg"}));
    }

    void testRaisingLimitAdmitsMore()
    {
        queue->setActiveLimit(1);
        submitFile("1.jpg");
        submitFile("2.jpg");
        submitFile("3.jpg");
        QCOMPARE(queue->activeCount(), 1);

        queue->setActiveLimit(3);
        QCOMPARE(queue->activeCount(), 3);
        QCOMPARE(queue->waitingCount(), 0);
    }

    void testLoweringLimitDoesNotPreempt()
    {
        queue->setActiveLimit(3);
        submitFile("1.jpg");
        submitFile("2.jpg");
        submitFile("3.jpg");
        submitFile("4.jpg");

        queue->setActiveLimit(1);
        QCOMPARE(queue->activeCount(), 3);
        QCOMPARE(mockClient->mockAbortedCount(), 0);

        // Freed slots are not refilled until the count drops below the new limit
        mockClient->mockLatestHandle("/tmp/1.jpg")->mockSucceed("https://cdn/1");
        QCOMPARE(queue->activeCount(), 2);
        QCOMPARE(mockClient->mockStartCount(), 3);
    }

    void testLimitBelowOneClamped()
    {
        queue->setActiveLimit(0);
        QCOMPARE(queue->activeLimit(), 1);
        queue->setActiveLimit(-5);
        QCOMPARE(queue->activeLimit(), 1);
    }

    // ========== Progress ==========

    void testProgressNeverMovesBackwards()
    {
        QString id = submitFile("a.jpg");
        MockTransferHandle *handle = mockClient->mockLatestHandle("/tmp/a.jpg");

        handle->mockProgress(50);
        QCOMPARE(queue->task(id)->progressPercent, 50);

        handle->mockProgress(30);
        QCOMPARE(queue->task(id)->progressPercent, 50);

        handle->mockProgress(140);
        QCOMPARE(queue->task(id)->progressPercent, 100);
        QCOMPARE(stateOf(id), std::optional(UploadState::Active));
    }

    void testThroughputIsSmoothed()
    {
        QString id = submitFile("a.jpg");
        MockTransferHandle *handle = mockClient->mockLatestHandle("/tmp/a.jpg");

        handle->mockProgress(10, 100.0);
        handle->mockProgress(20, 300.0);
        QCOMPARE(queue->task(id)->throughputEstimate, 200.0);

        // Missing estimates do not drag the average down
        handle->mockProgress(30, 0.0);
        QCOMPARE(queue->task(id)->throughputEstimate, 200.0);
        QCOMPARE(queue->snapshot().averageThroughput, 200.0);
    }

    void testSuccessRecordsResult()
    {
        QSignalSpy succeededSpy(queue, &UploadQueue::uploadSucceeded);
        QString id = submitFile("a.jpg");

        mockClient->mockLatestHandle("/tmp/a.jpg")->mockSucceed("https://cdn/a.jpg", 850);

        std::optional<UploadTask> task = queue->task(id);
        QCOMPARE(task->state, UploadState::Succeeded);
        QCOMPARE(task->progressPercent, 100);
        QCOMPARE(task->resultLocation, QString("https://cdn/a.jpg"));
        QCOMPARE(task->elapsedMs, qint64(850));
        QCOMPARE(succeededSpy.count(), 1);
        QCOMPARE(succeededSpy.first().at(1).toString(), QString("https://cdn/a.jpg"));
    }

    // ========== Failure and retry ==========

    // A transient failure can be retried and goes back through Waiting to Active
    void testTransientFailureThenRetry()
    {
        QSignalSpy failedSpy(queue, &UploadQueue::uploadFailed);
        QString id = submitFile("a.jpg");
        MockTransferHandle *handle = mockClient->mockLatestHandle("/tmp/a.jpg");
        handle->mockProgress(40);

        handle->mockFail("network timeout");

        std::optional<UploadTask> task = queue->task(id);
        QCOMPARE(task->state, UploadState::Failed);
        QVERIFY(task->retryable);
        QCOMPARE(task->lastError.kind, UploadErrorKind::Transient);
        QCOMPARE(task->lastError.message, QString("network timeout"));
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.first().at(1).value<UploadError>().kind, UploadErrorKind::Transient);

        queue->retry(id);

        task = queue->task(id);
        QCOMPARE(task->state, UploadState::Active);
        QCOMPARE(task->retryCount, 1);
        QCOMPARE(task->progressPercent, 0);
        QCOMPARE(task->attempt, 2);
        QVERIFY(task->lastError.isNull());
        QCOMPARE(mockClient->mockStartCount(), 2);
    }

    void testRetryIsObservedWaitingBeforeActive()
    {
        QString id = submitFile("a.jpg");
        mockClient->mockLatestHandle("/tmp/a.jpg")->mockFail("Connection reset");

        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        queue->retry(id);

        QCOMPARE(snapshotSpy.count(), 2);
        QCOMPARE(taskStateIn(snapshotSpy.at(0).at(0).value<UploadSnapshot>(), id),
                 std::optional(UploadState::Waiting));
        QCOMPARE(taskStateIn(snapshotSpy.at(1).at(0).value<UploadSnapshot>(), id),
                 std::optional(UploadState::Active));
    }

    void testSubmitIsObservedWaitingBeforeActive()
    {
        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        QString id = submitFile("a.jpg");

        QCOMPARE(snapshotSpy.count(), 2);
        QCOMPARE(taskStateIn(snapshotSpy.at(0).at(0).value<UploadSnapshot>(), id),
                 std::optional(UploadState::Waiting));
        QCOMPARE(taskStateIn(snapshotSpy.at(1).at(0).value<UploadSnapshot>(), id),
                 std::optional(UploadState::Active));
    }

    void testSuccessIsPublishedBeforeNextAdmission()
    {
        queue->setActiveLimit(1);
        QString t1 = submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");

        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        mockClient->mockLatestHandle("/tmp/1.jpg")->mockSucceed("https://cdn/1");

        QCOMPARE(snapshotSpy.count(), 2);
        UploadSnapshot first = snapshotSpy.at(0).at(0).value<UploadSnapshot>();
        QCOMPARE(taskStateIn(first, t1), std::optional(UploadState::Succeeded));
        QCOMPARE(taskStateIn(first, t2), std::optional(UploadState::Waiting));
        UploadSnapshot second = snapshotSpy.at(1).at(0).value<UploadSnapshot>();
        QCOMPARE(taskStateIn(second, t2), std::optional(UploadState::Active));
    }

    void testPermanentFailureIsNotRetryable()
    {
        QString id = submitFile("a.jpg");
        mockClient->mockLatestHandle("/tmp/a.jpg")->mockFail("Forbidden", 403);

        QVERIFY(!queue->task(id)->retryable);
        QCOMPARE(queue->task(id)->lastError.statusCode, 403);

        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        queue->retry(id);
        QCOMPARE(stateOf(id), std::optional(UploadState::Failed));
        QCOMPARE(snapshotSpy.count(), 0);
    }

    void testRetryBudgetIsBounded()
    {
        QString id = submitFile("a.jpg");

        for (int round = 0; round < 6; ++round) {
            MockTransferHandle *handle = mockClient->mockLatestHandle("/tmp/a.jpg");
            QVERIFY(handle);
            handle->mockFail("Connection reset");
            queue->retry(id);
        }

        std::optional<UploadTask> task = queue->task(id);
        QCOMPARE(task->retryCount, 3);
        QCOMPARE(task->state, UploadState::Failed);
        QVERIFY(!task->retryable);
        QCOMPARE(mockClient->mockStartCount(), 4);
    }

    void testRetryPolicyMaxRetriesAppliesToNewTasks()
    {
        queue->setRetryPolicy(RetryPolicy(1));
        QString id = submitFile("a.jpg");
        QCOMPARE(queue->task(id)->maxRetries, 1);

        mockClient->mockLatestHandle("/tmp/a.jpg")->mockFail("Network timeout");
        queue->retry(id);
        mockClient->mockLatestHandle("/tmp/a.jpg")->mockFail("Network timeout");

        QVERIFY(!queue->task(id)->retryable);
    }

    void testRetryOnNonFailedTaskIsNoop()
    {
        QString id = submitFile("a.jpg");
        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);

        queue->retry(id);
        queue->retry("no-such-task");

        QCOMPARE(snapshotSpy.count(), 0);
        QCOMPARE(queue->task(id)->retryCount, 0);
    }

    // Three permanent failures: retryAll has nothing to do
    void testRetryAllSkipsPermanentFailures()
    {
        QString t1 = submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");
        QString t3 = submitFile("3.jpg");
        for (const QString &name : {"1.jpg", "2.jpg", "3.jpg"}) {
            mockClient->mockLatestHandle("/tmp/" + QString(name))->mockFail("Invalid token", 401);
        }

        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        QSignalSpy startedSpy(queue, &UploadQueue::uploadStarted);
        queue->retryAll();

        QCOMPARE(snapshotSpy.count(), 0);
        QCOMPARE(startedSpy.count(), 0);
        for (const QString &id : {t1, t2, t3}) {
            QCOMPARE(stateOf(id), std::optional(UploadState::Failed));
            QCOMPARE(queue->task(id)->retryCount, 0);
        }
        QVERIFY(queue->snapshot().allFailed);
    }

    void testRetryAllRetriesOnlyEligible()
    {
        QString t1 = submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");
        mockClient->mockLatestHandle("/tmp/1.jpg")->mockFail("Network timeout");
        mockClient->mockLatestHandle("/tmp/2.jpg")->mockFail("Unsupported file type", 415);

        queue->retryAll();

        QCOMPARE(stateOf(t1), std::optional(UploadState::Active));
        QCOMPARE(queue->task(t1)->retryCount, 1);
        QCOMPARE(stateOf(t2), std::optional(UploadState::Failed));
    }

    // ========== Cancellation ==========

    // limit 3, four files: cancelling an active one promotes the fourth
    void testCancelActivePromotesWaiting()
    {
        queue->setActiveLimit(3);
        QString t1 = submitFile("1.jpg");
        submitFile("2.jpg");
        submitFile("3.jpg");
        QString t4 = submitFile("4.jpg");
        QCOMPARE(stateOf(t4), std::optional(UploadState::Waiting));

        QPointer<MockTransferHandle> handle = mockClient->mockLatestHandle("/tmp/1.jpg");
        QSignalSpy cancelledSpy(queue, &UploadQueue::uploadCancelled);

        queue->cancel(t1);

        QVERIFY(!stateOf(t1).has_value());
        QCOMPARE(queue->count(), 3);
        QCOMPARE(stateOf(t4), std::optional(UploadState::Active));
        QCOMPARE(cancelledSpy.count(), 1);
        QVERIFY(handle.isNull() || handle->isAborted());
    }

    void testCancelWaitingDoesNotTouchTransfers()
    {
        queue->setActiveLimit(1);
        submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");

        queue->cancel(t2);

        QCOMPARE(queue->count(), 1);
        QCOMPARE(mockClient->mockAbortedCount(), 0);
        QCOMPARE(mockClient->mockStartCount(), 1);
    }

    void testCancelIsIdempotent()
    {
        QString id = submitFile("a.jpg");
        queue->cancel(id);

        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        QSignalSpy cancelledSpy(queue, &UploadQueue::uploadCancelled);
        queue->cancel(id);
        queue->cancel("unknown");

        QCOMPARE(snapshotSpy.count(), 0);
        QCOMPARE(cancelledSpy.count(), 0);
    }

    void testCancelAfterSuccessIsNoop()
    {
        QString id = submitFile("a.jpg");
        mockClient->mockLatestHandle("/tmp/a.jpg")->mockSucceed("https://cdn/a");

        queue->cancel(id);

        QCOMPARE(stateOf(id), std::optional(UploadState::Succeeded));
        QCOMPARE(queue->count(), 1);
    }

    void testLateEventsAfterCancelAreIgnored()
    {
        QString id = submitFile("a.jpg");
        std::optional<UploadTask> before = queue->task(id);
        queue->cancel(id);

        // The queue no longer knows the attempt, whatever arrives is dropped
        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        queue->recordProgress(id, before->attempt, 80, 10.0);
        queue->recordSuccess(id, before->attempt, "https://cdn/late", 10);
        queue->recordFailure(id, before->attempt, UploadError());

        QCOMPARE(snapshotSpy.count(), 0);
        QVERIFY(!queue->task(id).has_value());
    }

    // ========== Clearing ==========

    void testClearCompletedRemovesOnlySucceeded()
    {
        QString t1 = submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");
        QString t3 = submitFile("3.jpg");
        mockClient->mockLatestHandle("/tmp/1.jpg")->mockSucceed("https://cdn/1");
        mockClient->mockLatestHandle("/tmp/2.jpg")->mockFail("Invalid token");

        queue->clearCompleted();

        QVERIFY(!queue->task(t1).has_value());
        QCOMPARE(stateOf(t2), std::optional(UploadState::Failed));
        QCOMPARE(stateOf(t3), std::optional(UploadState::Active));
        QCOMPARE(queue->count(), 2);
    }

    void testClearCompletedWithNothingToClearEmitsNothing()
    {
        submitFile("a.jpg");
        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);
        queue->clearCompleted();
        QCOMPARE(snapshotSpy.count(), 0);
    }

    void testClearAbortsEverything()
    {
        submitFile("1.jpg");
        submitFile("2.jpg");
        QList<MockTransferHandle*> live = mockClient->mockLiveHandles();
        QCOMPARE(live.size(), 2);

        queue->clear();

        QCOMPARE(queue->count(), 0);
        QCOMPARE(queue->activeCount(), 0);
        QCOMPARE(mockClient->mockAbortedCount(), 2);
        QVERIFY(queue->snapshot().isEmpty());
    }

    // ========== Pause and resume ==========

    void testPauseReturnsActiveToWaiting()
    {
        queue->setActiveLimit(2);
        QString t1 = submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");
        QString t3 = submitFile("3.jpg");
        mockClient->mockLatestHandle("/tmp/1.jpg")->mockProgress(60);

        queue->pauseAll();

        QVERIFY(queue->isPaused());
        QCOMPARE(stateOf(t1), std::optional(UploadState::Waiting));
        QCOMPARE(stateOf(t2), std::optional(UploadState::Waiting));
        QCOMPARE(stateOf(t3), std::optional(UploadState::Waiting));
        QCOMPARE(queue->task(t1)->progressPercent, 0);
        QCOMPARE(queue->task(t1)->retryCount, 0);
        QCOMPARE(queue->activeCount(), 0);
        QCOMPARE(mockClient->mockAbortedCount(), 2);
        QVERIFY(queue->snapshot().paused);

        // Held while paused
        submitFile("4.jpg");
        QCOMPARE(queue->activeCount(), 0);
        QCOMPARE(mockClient->mockStartCount(), 2);
    }

    void testResumeRestartsInSubmissionOrder()
    {
        queue->setActiveLimit(2);
        QString t1 = submitFile("1.jpg");
        QString t2 = submitFile("2.jpg");
        submitFile("3.jpg");
        queue->pauseAll();

        queue->resumeAll();

        QVERIFY(!queue->isPaused());
        QCOMPARE(stateOf(t1), std::optional(UploadState::Active));
        QCOMPARE(stateOf(t2), std::optional(UploadState::Active));
        QCOMPARE(queue->task(t1)->attempt, 2);
        QCOMPARE(mockClient->mockStartCount(), 4);
    }

    void testStaleEventsFromPausedAttemptAreDropped()
    {
        QString id = submitFile("a.jpg");
        queue->pauseAll();
        queue->resumeAll();
        QCOMPARE(queue->task(id)->attempt, 2);

        queue->recordSuccess(id, 1, "https://cdn/stale", 5);
        QCOMPARE(stateOf(id), std::optional(UploadState::Active));

        mockClient->mockLatestHandle("/tmp/a.jpg")->mockSucceed("https://cdn/fresh");
        QCOMPARE(queue->task(id)->resultLocation, QString("https://cdn/fresh"));
    }

    void testPauseTwiceEmitsOnce()
    {
        submitFile("a.jpg");
        QSignalSpy snapshotSpy(queue, &UploadQueue::snapshotChanged);

        queue->pauseAll();
        queue->pauseAll();
        queue->resumeAll();
        queue->resumeAll();

        QCOMPARE(snapshotSpy.count(), 3);  // pause, resume, admission
    }

    // ========== Completion ==========

    void testAllUploadsFinishedOnLastTerminal()
    {
        QSignalSpy finishedSpy(queue, &UploadQueue::allUploadsFinished);
        submitFile("1.jpg");
        submitFile("2.jpg");

        mockClient->mockLatestHandle("/tmp/1.jpg")->mockSucceed("https://cdn/1");
        QCOMPARE(finishedSpy.count(), 0);

        mockClient->mockLatestHandle("/tmp/2.jpg")->mockFail("Invalid token");
        QCOMPARE(finishedSpy.count(), 1);
        QVERIFY(queue->snapshot().isFinished());
    }

    void testCancellingLastPendingTaskFinishes()
    {
        QSignalSpy finishedSpy(queue, &UploadQueue::allUploadsFinished);
        QString id = submitFile("a.jpg");
        queue->cancel(id);
        QCOMPARE(finishedSpy.count(), 1);
    }

    void testEtaFromDeclaredSizes()
    {
        queue->setActiveLimit(1);
        submitFile("1.jpg", 2000);
        submitFile("2.jpg", 1000);

        mockClient->mockLatestHandle("/tmp/1.jpg")->mockProgress(50, 100.0);

        UploadSnapshot snapshot = queue->snapshot();
        QCOMPARE(snapshot.overallProgress, 25);
        QCOMPARE(snapshot.averageThroughput, 100.0);
        QCOMPARE(snapshot.estimatedRemainingSeconds, qint64(20));
    }

    void testDefaultDeclaredSizeUsedForUnknownWaiting()
    {
        queue->setActiveLimit(1);
        queue->setDefaultDeclaredSize(500);
        submitFile("1.jpg", 1000);
        submitFile("2.jpg", 0);

        mockClient->mockLatestHandle("/tmp/1.jpg")->mockProgress(50, 100.0);

        QCOMPARE(queue->snapshot().estimatedRemainingSeconds, qint64(10));
    }
};

QTEST_MAIN(TestUploadQueue)
#include "test_uploadqueue.moc"
