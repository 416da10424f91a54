/**
 * @file jobqueue.h
 * @brief Gate-protected job lifecycle transitions on the persisted queue.
 */

#ifndef JOBQUEUE_H
#define JOBQUEUE_H

#include <QObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "models/job.h"
#include "models/queuedocument.h"
#include "models/queueerror.h"
#include "services/queuegate.h"
#include "services/queuestore.h"

/**
 * @brief Job lifecycle manager.
 *
 * Every public operation is one load/transform/save transaction executed
 * inside QueueGate. A transaction either commits a complete new document or
 * leaves the stored one untouched. Separate JobQueue instances (in separate
 * threads or processes) pointing at the same files are serialized by the
 * gate, so for example two concurrent claimBatch() calls never hand out the
 * same job.
 *
 * A transition that references a job no longer in the expected bucket is a
 * no-op: it succeeds, changes nothing and emits lifecycleNoOp().
 *
 * @par Example usage:
 * @code
 * JobQueue queue(config.queueFile(), config.lockFile());
 * queue.enqueue("remote:/Sync/a.bin", "/data/a.bin", "a.bin", 1024);
 *
 * QList<Job> batch = queue.claimBatch(2);
 * queue.markInFlight(batch);
 * for (const Job &job : batch) {
 *     ok ? queue.complete(job) : queue.failOrRetry(job);
 * }
 * @endcode
 */
class JobQueue : public QObject
{
    Q_OBJECT

public:
    /// Failed attempts after which a job moves to the failed bucket
    static constexpr int MaxRetries = 3;

    /**
     * @brief Result of failOrRetry().
     */
    enum class FailOutcome {
        Retried,    ///< Re-queued at the tail of pending
        Failed,     ///< Moved to failed (retry cap reached)
        NoOp        ///< Job was not in flight; nothing changed
    };
    Q_ENUM(FailOutcome)

    JobQueue(const QString &queueFile, const QString &lockFile, QObject *parent = nullptr);
    ~JobQueue() override = default;

    /**
     * @brief Creates the store on first use, quarantining a corrupt one.
     */
    bool initialize();

    /// @name Worker-side transitions
    /// @{

    /**
     * @brief Appends a new job to the tail of pending.
     * @return The stored job, or an invalid Job if the store is unavailable.
     */
    Job enqueue(const QString &source, const QString &destination,
                const QString &displayName, qint64 sizeBytes);

    /**
     * @brief Removes up to @p count jobs from the head of pending.
     * @return The claimed jobs in queue order (empty on error or no work).
     */
    QList<Job> claimBatch(int count);

    /**
     * @brief Records claimed jobs in the in-flight bucket.
     */
    bool markInFlight(const QList<Job> &batch);

    /**
     * @brief Moves a job from in-flight to completed.
     */
    bool complete(const Job &job);

    /**
     * @brief Counts a failed attempt and either re-queues or fails the job.
     *
     * The retry count of the in-flight record is incremented. Below
     * MaxRetries the job goes to the tail of pending, otherwise to failed.
     *
     * @param outcome Receives what happened, if non-null.
     */
    bool failOrRetry(const Job &job, FailOutcome *outcome = nullptr);

    /**
     * @brief Puts every in-flight job back at the head of pending.
     *
     * Run once at worker startup: anything still in flight then was left
     * behind by a worker that died mid-transfer.
     *
     * @param recovered Receives the number of jobs moved, if non-null.
     */
    bool recoverCrashed(int *recovered = nullptr);

    /**
     * @brief Drops in-flight entries left over for the given ids.
     */
    bool releaseInFlight(const QStringList &ids);
    /// @}

    /// @name Producer-side operations
    /// @{
    bool removePending(int index);
    bool clearPending();
    bool clearCompleted();
    bool clearFailed();

    /**
     * @brief Moves every failed job to the tail of pending with retries reset.
     */
    bool retryAllFailed(int *moved = nullptr);

    bool setPaused(bool paused);

    /**
     * @brief Operator re-queue of in-flight jobs (same move as recoverCrashed()).
     */
    bool requeueInFlight(int *moved = nullptr);

    /**
     * @brief Operator discard of in-flight jobs.
     */
    bool discardInFlight(int *dropped = nullptr);

    [[nodiscard]] std::optional<QueueCounts> counts();
    [[nodiscard]] std::optional<bool> isPaused();
    [[nodiscard]] std::optional<QueueDocument> snapshot();
    /// @}

    [[nodiscard]] QueueError error() const { return error_; }
    [[nodiscard]] QString errorString() const { return errorString_; }

    [[nodiscard]] QString queueFile() const { return store_.filePath(); }

signals:
    /**
     * @brief Emitted when a transition found nothing to act on.
     * @param operation The operation name (e.g. "complete").
     * @param jobId The job id or index that was not found.
     */
    void lifecycleNoOp(const QString &operation, const QString &jobId);

    /**
     * @brief Emitted when the store or the gate fails.
     */
    void storeError(const QString &message);

    /**
     * @brief Emitted after a transaction committed a changed document.
     */
    void queueChanged();

private:
    /// Returns true if the document was modified and must be saved
    using Transform = std::function<bool(QueueDocument &doc)>;

    struct NoOp {
        QString operation;
        QString jobId;
    };

    bool transact(const Transform &transform);
    bool read(const std::function<void(const QueueDocument &doc)> &reader);
    void noteNoOp(const QString &operation, const QString &jobId);
    void flushNoOps();
    void failWith(QueueError error, const QString &message);

    static int moveInFlightToPendingHead(QueueDocument &doc);
    static QDateTime now();

    QueueStore store_;
    QueueGate gate_;
    QList<NoOp> noOps_;
    QueueError error_ = QueueError::None;
    QString errorString_;
};

#endif // JOBQUEUE_H
