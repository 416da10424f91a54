/**
 * @file queueservice.h
 * @brief Producer-side interface to the queue and the worker process.
 *
 * The command line tool talks to this service only. It wraps JobQueue for
 * queue edits and manages the detached worker through its token.
 */

#ifndef QUEUESERVICE_H
#define QUEUESERVICE_H

#include <QObject>
#include <QString>
#include <optional>

#include "models/job.h"
#include "models/queuedocument.h"
#include "services/queueconfig.h"
#include "services/workertoken.h"

class JobQueue;

/**
 * @brief Service for producer operations.
 *
 * QueueService gives producers a high-level interface:
 * - Queue edits delegate to JobQueue (each one gate-protected)
 * - The worker is started on demand as a detached process
 * - stopWorker() and halt() signal the worker named by its token
 *
 * @par Example usage:
 * @code
 * JobQueue queue(config.queueFile(), config.lockFile());
 * QueueService service(&queue, config);
 *
 * Job job = service.enqueue("remote:/Sync/a.bin", "/data/a.bin");
 * if (job.isValid() && !service.queryPausedState().value_or(false)) {
 *     service.startWorkerIfNotRunning();
 * }
 * @endcode
 */
class QueueService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a queue service.
     * @param queue The job queue to delegate to (not owned).
     * @param config State directory and worker program.
     * @param parent Optional parent QObject for memory management.
     */
    QueueService(JobQueue *queue, const QueueConfig &config, QObject *parent = nullptr);
    ~QueueService() override;

    /// @name Queue Operations
    /// @{

    /**
     * @brief Adds a job to the tail of pending.
     * @param source Remote path understood by the transfer engine.
     * @param destination Local destination file path. Relative paths are
     *        resolved against the current directory before storing.
     * @param displayName Name shown in status output (defaults to the
     *        destination's file name).
     * @param sizeBytes Size hint for display (0 if unknown).
     * @return The stored job, or an invalid Job if the store is unavailable.
     */
    Job enqueue(const QString &source, const QString &destination,
                const QString &displayName = QString(), qint64 sizeBytes = 0);

    /**
     * @brief Removes the pending job at @p index (0-based).
     * @return False only if the store is unavailable; a bad index is a no-op.
     */
    bool removePending(int index);

    bool clearPending();
    bool clearCompleted();
    bool clearFailed();

    /**
     * @brief Moves every failed job back to pending.
     * @return Number of jobs moved, or std::nullopt on store failure.
     */
    std::optional<int> retryAllFailed();

    bool setPaused(bool paused);
    /// @}

    /// @name Queue State
    /// @{
    [[nodiscard]] std::optional<QueueCounts> queryCounts();
    [[nodiscard]] std::optional<bool> queryPausedState();

    /**
     * @brief Returns the whole document for listing.
     */
    [[nodiscard]] std::optional<QueueDocument> snapshot();
    /// @}

    /// @name Worker Control
    /// @{

    /**
     * @brief True if a live worker holds the token.
     */
    [[nodiscard]] bool isWorkerAlive() const;

    /**
     * @brief Process id of the live worker, if any.
     */
    [[nodiscard]] std::optional<qint64> workerPid() const;

    /**
     * @brief Launches the worker as a detached process unless one is alive.
     *
     * Two producers racing here may both launch; the second worker finds
     * the token taken and exits without touching the queue.
     *
     * @return True if a worker is running afterwards (already or newly).
     */
    bool startWorkerIfNotRunning();

    /**
     * @brief Sends SIGTERM to the live worker.
     * @return True if a worker was signalled or none was running.
     */
    bool stopWorker();

    /**
     * @brief Blocks until the worker token is no longer live.
     * @return False if the worker is still alive after @p timeoutMs.
     */
    bool waitForWorkerExit(int timeoutMs);

    /**
     * @brief Stops the worker, re-queues in-flight jobs and pauses the queue.
     */
    bool halt();

    /**
     * @brief Interrupts running transfers and puts them back at the head of
     *        pending. The worker is restarted unless the queue is paused.
     * @return Number of jobs re-queued, or std::nullopt on failure.
     */
    std::optional<int> requeueInFlight();

    /**
     * @brief Interrupts running transfers and drops them from the queue.
     *        The worker is restarted unless the queue is paused.
     * @return Number of jobs dropped, or std::nullopt on failure.
     */
    std::optional<int> discardInFlight();
    /// @}

    [[nodiscard]] QString errorString() const;

signals:
    /**
     * @brief Emitted with a one-line description of each completed action.
     */
    void statusMessage(const QString &message);

private:
    JobQueue *queue_ = nullptr;
    QueueConfig config_;
    WorkerToken token_;
    QString lastError_;
};

#endif // QUEUESERVICE_H
