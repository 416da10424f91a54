/**
 * @file worker.h
 * @brief Long-running consumer that drains the queue under the connection ceiling.
 */

#ifndef WORKER_H
#define WORKER_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include "models/job.h"
#include "services/queueconfig.h"
#include "services/queuegate.h"
#include "services/schedulerpolicy.h"

class ErrorHandler;
class ITransferEngine;
class JobQueue;
class QTimer;
class WorkerToken;

/**
 * @brief Event-driven worker loop.
 *
 * The worker polls the queue on a single-shot timer, asks SchedulerPolicy
 * what to start, claims that many jobs and hands them to the transfer
 * engine. Outcomes arrive through ITransferEngine::transferFinished() and
 * are recorded one by one. Once every job of a batch has resolved the
 * worker pauses for batchPauseMs and polls again.
 *
 * Only one worker runs per state directory. start() claims the WorkerToken
 * inside the queue gate and refuses to run while another live worker holds
 * it.
 *
 * @par Example usage:
 * @code
 * JobQueue queue(config.queueFile(), config.lockFile());
 * WorkerToken token(config.tokenFile());
 * RcloneTransferEngine engine(config.engine);
 * Worker worker(&queue, &token, &engine, config);
 *
 * connect(&worker, &Worker::stopped, &app, &QCoreApplication::exit);
 * if (!worker.start()) {
 *     return worker.exitCode();
 * }
 * return app.exec();
 * @endcode
 */
class Worker : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    /**
     * @brief Worker lifecycle state.
     */
    enum class State {
        Starting,       ///< Constructed, start() not yet succeeded
        Idle,           ///< Waiting for the next poll
        Dispatching,    ///< A batch is being transferred
        Stopped         ///< Terminal
    };
    Q_ENUM(State)

    /// Exit code when the worker stops normally (idle timeout or signal)
    static constexpr int ExitNormal = 0;
    /// Exit code when another worker already holds the token
    static constexpr int ExitAlreadyRunning = 1;
    /// Exit code when the queue store cannot be read or written
    static constexpr int ExitStoreUnavailable = 2;

    /**
     * @brief Constructs a worker.
     * @param queue The job queue (not owned).
     * @param token The single-instance token (not owned).
     * @param engine The transfer engine (not owned).
     * @param config Poll, stagger and pause timings.
     * @param parent Optional parent QObject for memory management.
     */
    Worker(JobQueue *queue, WorkerToken *token, ITransferEngine *engine,
           const QueueConfig &config, QObject *parent = nullptr);
    ~Worker() override;

    /**
     * @brief Claims the token, recovers interrupted jobs and starts polling.
     * @return False if another worker is running or the store is unusable.
     *         exitCode() then tells which.
     */
    bool start();

    /**
     * @brief Stops the worker.
     *
     * Running transfers are aborted; their jobs stay in flight and are
     * recovered by the next worker. The token is removed and stopped() is
     * emitted. Has no effect once stopped.
     */
    void stop(int exitCode = ExitNormal);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] int exitCode() const { return exitCode_; }
    [[nodiscard]] int idlePolls() const { return idlePolls_; }
    [[nodiscard]] qint64 processId() const { return pid_; }
    [[nodiscard]] ErrorHandler *errorHandler() const { return errorHandler_; }

signals:
    void stateChanged(Worker::State state);

    /**
     * @brief Emitted when a batch has been claimed and is about to launch.
     */
    void batchDispatched(int batchSize, int streamsPerJob);

    void jobCompleted(const QString &jobId);

    /**
     * @brief Emitted when a transfer failed.
     * @param willRetry True if the job went back to pending.
     */
    void jobFailed(const QString &jobId, bool willRetry);

    void stopped(int exitCode);

private slots:
    void pollOnce();
    void launchNext();
    void onTransferFinished(const QString &jobId, bool success, const QString &errorMessage);

private:
    void setState(State state);
    void schedulePoll(int delayMs);
    void dispatch(const ScheduleDecision &decision);
    void finishBatch();
    void stopOnStoreFailure();

    JobQueue *queue_ = nullptr;
    WorkerToken *token_ = nullptr;
    ITransferEngine *engine_ = nullptr;
    QueueConfig config_;
    QueueGate gate_;
    ErrorHandler *errorHandler_ = nullptr;

    QTimer *pollTimer_ = nullptr;
    QTimer *launchTimer_ = nullptr;

    State state_ = State::Starting;
    qint64 pid_ = 0;
    bool tokenHeld_ = false;
    int exitCode_ = ExitNormal;
    int idlePolls_ = 0;

    // Current batch
    int streamsPerJob_ = 0;
    QStringList batchIds_;
    QList<Job> toLaunch_;
    QHash<QString, Job> outstanding_;
};

#endif // WORKER_H
