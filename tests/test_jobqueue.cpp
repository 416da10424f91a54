/**
 * @file test_jobqueue.cpp
 * @brief Unit tests for JobQueue lifecycle transitions.
 *
 * Tests verify:
 * - Jobs are claimed in FIFO order, each exactly once
 * - Failed attempts are retried until MaxRetries, then failed
 * - Interrupted jobs are recovered ahead of waiting ones
 * - Transitions on jobs that moved on are no-ops
 * - Producer edits (remove, clear, retry, pause)
 * - Store failures leave the document untouched
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QThread>

#include <memory>
#include <vector>

#include "services/jobqueue.h"

class TestJobQueue : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Enqueue and claim
    void testEnqueueAppendsToPending();
    void testClaimBatchIsFifo();
    void testClaimBatchOnEmptyQueue();
    void testMarkInFlight();
    void testMarkInFlightSkipsDuplicates();
    void testConcurrentClaimsNeverOverlap();

    // Outcomes
    void testCompleteMovesToCompleted();
    void testCompleteIsIdempotent();
    void testFailOrRetryRequeuesAtTail();
    void testFailOrRetryFailsAfterMaxRetries();
    void testFailOrRetryOnUnknownJobIsNoOp();
    void testReleaseInFlight();

    // Recovery
    void testRecoverCrashedPutsInFlightFirst();
    void testRecoverCrashedWithNothingInFlight();

    // Producer operations
    void testRemovePending();
    void testRemovePendingOutOfRange();
    void testClearBuckets();
    void testRetryAllFailedResetsRetries();
    void testSetPaused();
    void testRequeueAndDiscardInFlight();

    // Store errors
    void testCorruptStoreFailsWithoutChanges();
    void testInitializeQuarantinesCorruptStore();

private:
    JobQueue *makeQueue();
    Job add(JobQueue *queue, const QString &name);
    QList<Job> claimInFlight(JobQueue *queue, int count);

    QTemporaryDir *tempDir_ = nullptr;
    QString queueFile_;
    QString lockFile_;
    JobQueue *queue_ = nullptr;
};

void TestJobQueue::init()
{
    tempDir_ = new QTemporaryDir();
    QVERIFY(tempDir_->isValid());
    queueFile_ = tempDir_->filePath("queue.json");
    lockFile_ = tempDir_->filePath("queue.lock");
    queue_ = makeQueue();
    QVERIFY(queue_->initialize());
}

void TestJobQueue::cleanup()
{
    delete queue_;
    queue_ = nullptr;
    delete tempDir_;
    tempDir_ = nullptr;
}

JobQueue *TestJobQueue::makeQueue()
{
    return new JobQueue(queueFile_, lockFile_);
}

Job TestJobQueue::add(JobQueue *queue, const QString &name)
{
    return queue->enqueue("remote:/Sync/" + name, tempDir_->filePath("out/" + name), name, 1024);
}

QList<Job> TestJobQueue::claimInFlight(JobQueue *queue, int count)
{
    const QList<Job> batch = queue->claimBatch(count);
    if (!queue->markInFlight(batch)) {
        return {};
    }
    return batch;
}

void TestJobQueue::testEnqueueAppendsToPending()
{
    QSignalSpy changedSpy(queue_, &JobQueue::queueChanged);

    const Job a = add(queue_, "a.bin");
    const Job b = add(queue_, "b.bin");

    QVERIFY(a.isValid());
    QVERIFY(b.isValid());
    QVERIFY(a.id != b.id);
    QCOMPARE(a.retries, 0);
    QVERIFY(a.enqueuedAt.isValid());
    QCOMPARE(changedSpy.count(), 2);

    const auto doc = queue_->snapshot();
    QVERIFY(doc.has_value());
    QCOMPARE(doc->pending.size(), 2);
    QCOMPARE(doc->pending.at(0).id, a.id);
    QCOMPARE(doc->pending.at(1).id, b.id);
    QCOMPARE(doc->pending.at(0).source, QString("remote:/Sync/a.bin"));
    QCOMPARE(doc->pending.at(0).sizeBytes, qint64(1024));
}

void TestJobQueue::testClaimBatchIsFifo()
{
    const Job a = add(queue_, "a");
    const Job b = add(queue_, "b");
    const Job c = add(queue_, "c");

    const QList<Job> first = queue_->claimBatch(2);
    QCOMPARE(first.size(), 2);
    QCOMPARE(first.at(0).id, a.id);
    QCOMPARE(first.at(1).id, b.id);

    const QList<Job> second = queue_->claimBatch(2);
    QCOMPARE(second.size(), 1);
    QCOMPARE(second.at(0).id, c.id);

    QCOMPARE(queue_->counts()->pending, 0);
}

void TestJobQueue::testClaimBatchOnEmptyQueue()
{
    QSignalSpy changedSpy(queue_, &JobQueue::queueChanged);

    QVERIFY(queue_->claimBatch(2).isEmpty());
    QVERIFY(queue_->claimBatch(0).isEmpty());
    QCOMPARE(queue_->error(), QueueError::None);
    QCOMPARE(changedSpy.count(), 0);
}

void TestJobQueue::testMarkInFlight()
{
    add(queue_, "a");
    add(queue_, "b");

    const QList<Job> batch = queue_->claimBatch(2);
    QCOMPARE(queue_->counts()->inFlight, 0);

    QVERIFY(queue_->markInFlight(batch));

    const QueueCounts counts = *queue_->counts();
    QCOMPARE(counts.pending, 0);
    QCOMPARE(counts.inFlight, 2);
}

void TestJobQueue::testMarkInFlightSkipsDuplicates()
{
    add(queue_, "a");
    const QList<Job> batch = claimInFlight(queue_, 1);
    QCOMPARE(batch.size(), 1);

    QVERIFY(queue_->markInFlight(batch));
    QCOMPARE(queue_->counts()->inFlight, 1);
}

void TestJobQueue::testConcurrentClaimsNeverOverlap()
{
    constexpr int kJobs = 24;
    constexpr int kClaimers = 3;

    QMutex resultMutex;
    QSet<QString> enqueued;
    QStringList claimed;
    bool producerDone = false;

    // One producer enqueues while the claimers are already draining
    std::unique_ptr<QThread> producer(QThread::create([&]() {
        JobQueue queue(queueFile_, lockFile_);
        for (int i = 0; i < kJobs; ++i) {
            const Job job = add(&queue, QString("job%1").arg(i));
            QMutexLocker locker(&resultMutex);
            enqueued.insert(job.id);
        }
        QMutexLocker locker(&resultMutex);
        producerDone = true;
    }));

    std::vector<std::unique_ptr<QThread>> claimers;
    for (int t = 0; t < kClaimers; ++t) {
        claimers.emplace_back(QThread::create([&]() {
            JobQueue queue(queueFile_, lockFile_);
            forever {
                bool doneBeforeClaim = false;
                {
                    QMutexLocker locker(&resultMutex);
                    doneBeforeClaim = producerDone;
                }

                const QList<Job> batch = queue.claimBatch(2);
                if (batch.isEmpty()) {
                    // Empty after the last enqueue: nothing more will come
                    if (doneBeforeClaim) {
                        break;
                    }
                    QThread::msleep(1);
                    continue;
                }

                QMutexLocker locker(&resultMutex);
                for (const Job &job : batch) {
                    claimed.append(job.id);
                }
            }
        }));
    }

    for (auto &thread : claimers) {
        thread->start();
    }
    producer->start();

    QVERIFY(producer->wait(120000));
    for (auto &thread : claimers) {
        QVERIFY(thread->wait(120000));
    }

    QCOMPARE(enqueued.size(), kJobs);
    QCOMPARE(claimed.size(), kJobs);
    const QSet<QString> unique(claimed.cbegin(), claimed.cend());
    QCOMPARE(unique.size(), kJobs);
    QVERIFY(unique == enqueued);
    QCOMPARE(queue_->counts()->pending, 0);
}

void TestJobQueue::testCompleteMovesToCompleted()
{
    add(queue_, "a");
    const QList<Job> batch = claimInFlight(queue_, 1);

    QVERIFY(queue_->complete(batch.first()));

    const auto doc = queue_->snapshot();
    QVERIFY(doc->inFlight.isEmpty());
    QCOMPARE(doc->completed.size(), 1);
    QCOMPARE(doc->completed.first().id, batch.first().id);
    QVERIFY(doc->completed.first().completedAt.isValid());
}

void TestJobQueue::testCompleteIsIdempotent()
{
    add(queue_, "a");
    const QList<Job> batch = claimInFlight(queue_, 1);
    QVERIFY(queue_->complete(batch.first()));

    QFile file(queueFile_);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray before = file.readAll();
    file.close();

    QSignalSpy noOpSpy(queue_, &JobQueue::lifecycleNoOp);
    QSignalSpy changedSpy(queue_, &JobQueue::queueChanged);

    QVERIFY(queue_->complete(batch.first()));

    QCOMPARE(noOpSpy.count(), 1);
    QCOMPARE(noOpSpy.at(0).at(0).toString(), QString("complete"));
    QCOMPARE(noOpSpy.at(0).at(1).toString(), batch.first().id);
    QCOMPARE(changedSpy.count(), 0);

    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), before);
}

void TestJobQueue::testFailOrRetryRequeuesAtTail()
{
    const Job a = add(queue_, "a");
    const Job b = add(queue_, "b");
    const QList<Job> batch = claimInFlight(queue_, 1);
    QCOMPARE(batch.first().id, a.id);

    JobQueue::FailOutcome outcome = JobQueue::FailOutcome::NoOp;
    QVERIFY(queue_->failOrRetry(batch.first(), &outcome));
    QCOMPARE(outcome, JobQueue::FailOutcome::Retried);

    const auto doc = queue_->snapshot();
    QVERIFY(doc->inFlight.isEmpty());
    QCOMPARE(doc->pending.size(), 2);
    QCOMPARE(doc->pending.at(0).id, b.id);
    QCOMPARE(doc->pending.at(1).id, a.id);
    QCOMPARE(doc->pending.at(1).retries, 1);
}

void TestJobQueue::testFailOrRetryFailsAfterMaxRetries()
{
    const Job a = add(queue_, "a");

    JobQueue::FailOutcome outcome = JobQueue::FailOutcome::NoOp;
    for (int attempt = 1; attempt <= JobQueue::MaxRetries; ++attempt) {
        const QList<Job> batch = claimInFlight(queue_, 1);
        QCOMPARE(batch.size(), 1);
        QCOMPARE(batch.first().id, a.id);
        // The claimed copy may be stale; the in-flight record is authoritative
        Job stale = batch.first();
        stale.retries = 0;
        QVERIFY(queue_->failOrRetry(stale, &outcome));
    }

    QCOMPARE(outcome, JobQueue::FailOutcome::Failed);

    const auto doc = queue_->snapshot();
    QVERIFY(doc->pending.isEmpty());
    QVERIFY(doc->inFlight.isEmpty());
    QCOMPARE(doc->failed.size(), 1);
    QCOMPARE(doc->failed.first().id, a.id);
    QCOMPARE(doc->failed.first().retries, JobQueue::MaxRetries);
    QVERIFY(doc->failed.first().failedAt.isValid());
}

void TestJobQueue::testFailOrRetryOnUnknownJobIsNoOp()
{
    const Job a = add(queue_, "a");
    QSignalSpy noOpSpy(queue_, &JobQueue::lifecycleNoOp);

    // Still pending, never claimed
    JobQueue::FailOutcome outcome = JobQueue::FailOutcome::Retried;
    QVERIFY(queue_->failOrRetry(a, &outcome));

    QCOMPARE(outcome, JobQueue::FailOutcome::NoOp);
    QCOMPARE(noOpSpy.count(), 1);
    QCOMPARE(queue_->counts()->pending, 1);
    QCOMPARE(queue_->snapshot()->pending.first().retries, 0);
}

void TestJobQueue::testReleaseInFlight()
{
    add(queue_, "a");
    add(queue_, "b");
    const QList<Job> batch = claimInFlight(queue_, 2);

    QVERIFY(queue_->complete(batch.at(0)));
    QVERIFY(queue_->releaseInFlight({batch.at(0).id, batch.at(1).id}));

    const QueueCounts counts = *queue_->counts();
    QCOMPARE(counts.inFlight, 0);
    QCOMPARE(counts.completed, 1);
    QCOMPARE(counts.pending, 0);

    QVERIFY(queue_->releaseInFlight({}));
}

void TestJobQueue::testRecoverCrashedPutsInFlightFirst()
{
    const Job a = add(queue_, "a");
    const Job b = add(queue_, "b");
    const Job c = add(queue_, "c");
    const Job d = add(queue_, "d");
    claimInFlight(queue_, 2);

    // A new process picks up the same files
    std::unique_ptr<JobQueue> restarted(makeQueue());
    int recovered = 0;
    QVERIFY(restarted->recoverCrashed(&recovered));
    QCOMPARE(recovered, 2);

    const auto doc = restarted->snapshot();
    QVERIFY(doc->inFlight.isEmpty());
    QCOMPARE(doc->pending.size(), 4);
    QCOMPARE(doc->pending.at(0).id, a.id);
    QCOMPARE(doc->pending.at(1).id, b.id);
    QCOMPARE(doc->pending.at(2).id, c.id);
    QCOMPARE(doc->pending.at(3).id, d.id);
}

void TestJobQueue::testRecoverCrashedWithNothingInFlight()
{
    add(queue_, "a");
    QSignalSpy changedSpy(queue_, &JobQueue::queueChanged);

    int recovered = -1;
    QVERIFY(queue_->recoverCrashed(&recovered));
    QCOMPARE(recovered, 0);
    QCOMPARE(changedSpy.count(), 0);
}

void TestJobQueue::testRemovePending()
{
    const Job a = add(queue_, "a");
    add(queue_, "b");
    const Job c = add(queue_, "c");

    QVERIFY(queue_->removePending(1));

    const auto doc = queue_->snapshot();
    QCOMPARE(doc->pending.size(), 2);
    QCOMPARE(doc->pending.at(0).id, a.id);
    QCOMPARE(doc->pending.at(1).id, c.id);
}

void TestJobQueue::testRemovePendingOutOfRange()
{
    add(queue_, "a");
    QSignalSpy noOpSpy(queue_, &JobQueue::lifecycleNoOp);

    QVERIFY(queue_->removePending(5));
    QVERIFY(queue_->removePending(-1));

    QCOMPARE(noOpSpy.count(), 2);
    QCOMPARE(queue_->counts()->pending, 1);
}

void TestJobQueue::testClearBuckets()
{
    add(queue_, "a");
    add(queue_, "b");
    const QList<Job> batch = claimInFlight(queue_, 2);
    QVERIFY(queue_->complete(batch.at(0)));

    // Fail "b" until it lands in the failed bucket
    Job attempt = batch.at(1);
    for (int i = 0; i < JobQueue::MaxRetries; ++i) {
        QVERIFY(queue_->failOrRetry(attempt));
        if (i + 1 < JobQueue::MaxRetries) {
            const QList<Job> again = claimInFlight(queue_, 1);
            QCOMPARE(again.size(), 1);
            attempt = again.first();
        }
    }

    QueueCounts counts = *queue_->counts();
    QCOMPARE(counts.completed, 1);
    QCOMPARE(counts.failed, 1);

    QVERIFY(queue_->clearCompleted());
    QVERIFY(queue_->clearFailed());
    add(queue_, "c");
    QVERIFY(queue_->clearPending());

    counts = *queue_->counts();
    QCOMPARE(counts.pending, 0);
    QCOMPARE(counts.completed, 0);
    QCOMPARE(counts.failed, 0);
}

void TestJobQueue::testRetryAllFailedResetsRetries()
{
    const Job a = add(queue_, "a");
    for (int i = 0; i < JobQueue::MaxRetries; ++i) {
        QVERIFY(queue_->failOrRetry(claimInFlight(queue_, 1).first()));
    }
    const Job b = add(queue_, "b");
    QCOMPARE(queue_->counts()->failed, 1);

    int moved = 0;
    QVERIFY(queue_->retryAllFailed(&moved));
    QCOMPARE(moved, 1);

    const auto doc = queue_->snapshot();
    QVERIFY(doc->failed.isEmpty());
    QCOMPARE(doc->pending.size(), 2);
    QCOMPARE(doc->pending.at(0).id, b.id);
    QCOMPARE(doc->pending.at(1).id, a.id);
    QCOMPARE(doc->pending.at(1).retries, 0);
    QVERIFY(!doc->pending.at(1).failedAt.isValid());
}

void TestJobQueue::testSetPaused()
{
    QCOMPARE(queue_->isPaused().value_or(true), false);

    QVERIFY(queue_->setPaused(true));
    QCOMPARE(queue_->isPaused().value_or(false), true);

    QSignalSpy changedSpy(queue_, &JobQueue::queueChanged);
    QVERIFY(queue_->setPaused(true));
    QCOMPARE(changedSpy.count(), 0);

    QVERIFY(queue_->setPaused(false));
    QCOMPARE(queue_->isPaused().value_or(true), false);
}

void TestJobQueue::testRequeueAndDiscardInFlight()
{
    const Job a = add(queue_, "a");
    add(queue_, "b");
    const Job c = add(queue_, "c");
    claimInFlight(queue_, 1);

    int moved = 0;
    QVERIFY(queue_->requeueInFlight(&moved));
    QCOMPARE(moved, 1);
    QCOMPARE(queue_->snapshot()->pending.first().id, a.id);

    claimInFlight(queue_, 2);
    int dropped = 0;
    QVERIFY(queue_->discardInFlight(&dropped));
    QCOMPARE(dropped, 2);

    const auto doc = queue_->snapshot();
    QVERIFY(doc->inFlight.isEmpty());
    QCOMPARE(doc->pending.size(), 1);
    QCOMPARE(doc->pending.first().id, c.id);
}

void TestJobQueue::testCorruptStoreFailsWithoutChanges()
{
    add(queue_, "a");

    QFile file(queueFile_);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{ broken");
    file.close();

    QSignalSpy errorSpy(queue_, &JobQueue::storeError);

    QVERIFY(!add(queue_, "b").isValid());
    QCOMPARE(queue_->error(), QueueError::StoreUnavailable);
    QVERIFY(queue_->claimBatch(1).isEmpty());
    QVERIFY(!queue_->counts().has_value());
    QCOMPARE(errorSpy.count(), 3);

    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("{ broken"));
}

void TestJobQueue::testInitializeQuarantinesCorruptStore()
{
    QFile file(queueFile_);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("garbage");
    file.close();

    std::unique_ptr<JobQueue> queue(makeQueue());
    QVERIFY(queue->initialize());

    const auto counts = queue->counts();
    QVERIFY(counts.has_value());
    QCOMPARE(counts->active(), 0);

    const QStringList aside = QDir(tempDir_->path()).entryList({"queue.json.corrupt-*"});
    QCOMPARE(aside.size(), 1);
}

QTEST_MAIN(TestJobQueue)
#include "test_jobqueue.moc"
