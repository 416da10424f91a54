#include "worker.h"

#include <QCoreApplication>
#include <QDebug>
#include <QTimer>

#include <optional>

#include "services/errorhandler.h"
#include "services/itransferengine.h"
#include "services/jobqueue.h"
#include "services/workertoken.h"
#include "utils/logging.h"

Worker::Worker(JobQueue *queue, WorkerToken *token, ITransferEngine *engine,
               const QueueConfig &config, QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , token_(token)
    , engine_(engine)
    , config_(config)
    , gate_(config.lockFile())
    , errorHandler_(new ErrorHandler(this))
    , pollTimer_(new QTimer(this))
    , launchTimer_(new QTimer(this))
    , pid_(QCoreApplication::applicationPid())
{
    pollTimer_->setSingleShot(true);
    connect(pollTimer_, &QTimer::timeout, this, &Worker::pollOnce);

    launchTimer_->setSingleShot(true);
    connect(launchTimer_, &QTimer::timeout, this, &Worker::launchNext);

    connect(engine_, &ITransferEngine::transferFinished,
            this, &Worker::onTransferFinished);

    connect(queue_, &JobQueue::storeError,
            errorHandler_, &ErrorHandler::handleStoreError);
    connect(queue_, &JobQueue::lifecycleNoOp,
            errorHandler_, &ErrorHandler::handleLifecycleNoOp);
}

Worker::~Worker()
{
    if (state_ != State::Stopped && tokenHeld_) {
        engine_->abortAll();
        token_->remove(pid_);
    }
}

void Worker::setState(State state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

bool Worker::start()
{
    if (state_ != State::Starting) {
        return false;
    }

    // Check and claim in one step so two starting workers cannot both win.
    // Nothing in the store is touched until the token is ours.
    bool acquired = false;
    std::optional<qint64> holder;
    const bool locked = gate_.withExclusiveLock([this, &acquired, &holder]() {
        acquired = token_->acquire(pid_);
        if (!acquired) {
            holder = token_->readPid();
        }
        return true;
    });

    if (!locked) {
        errorHandler_->handleQueueError(gate_.error(), gate_.errorString());
        stop(ExitStoreUnavailable);
        return false;
    }

    if (!acquired) {
        if (holder && *holder != pid_ && WorkerToken::isProcessAlive(*holder)) {
            errorHandler_->handleAlreadyRunning(*holder);
            exitCode_ = ExitAlreadyRunning;
            setState(State::Stopped);
            emit stopped(exitCode_);
        } else {
            errorHandler_->handleError(ErrorCategory::Worker, ErrorSeverity::Critical,
                                       tr("Cannot write worker token"), token_->path());
            stop(ExitStoreUnavailable);
        }
        return false;
    }
    tokenHeld_ = true;

    if (!queue_->initialize()) {
        stopOnStoreFailure();
        return false;
    }

    qInfo() << "Worker started, pid" << pid_;

    if (!queue_->recoverCrashed()) {
        stopOnStoreFailure();
        return false;
    }

    idlePolls_ = 0;
    setState(State::Idle);
    schedulePoll(0);
    return true;
}

void Worker::stop(int exitCode)
{
    if (state_ == State::Stopped) {
        return;
    }

    pollTimer_->stop();
    launchTimer_->stop();
    toLaunch_.clear();

    const int running = engine_->activeCount();
    engine_->abortAll();
    if (running > 0) {
        qInfo() << "Worker: aborted" << running << "transfer(s), left in flight for recovery";
    }
    outstanding_.clear();
    batchIds_.clear();

    if (tokenHeld_) {
        if (!token_->remove(pid_)) {
            qWarning() << "Worker: could not remove token" << token_->path();
        }
        tokenHeld_ = false;
    }

    exitCode_ = exitCode;
    setState(State::Stopped);
    qInfo() << "Worker stopped, exit code" << exitCode;
    emit stopped(exitCode);
}

void Worker::schedulePoll(int delayMs)
{
    pollTimer_->start(delayMs);
}

void Worker::pollOnce()
{
    if (state_ != State::Idle) {
        return;
    }

    const std::optional<QueueDocument> doc = queue_->snapshot();
    if (!doc) {
        stopOnStoreFailure();
        return;
    }

    // Paused time does not count towards the idle limit
    if (doc->paused) {
        LOG_VERBOSE() << "Worker: queue paused";
        schedulePoll(config_.pollIntervalMs);
        return;
    }

    const QueueCounts counts = doc->counts();
    if (counts.pending == 0 && counts.inFlight == 0) {
        ++idlePolls_;
        LOG_VERBOSE() << "Worker: nothing to do" << idlePolls_ << "/" << config_.maxIdlePolls;
        if (idlePolls_ >= config_.maxIdlePolls) {
            qInfo() << "Worker: no jobs after" << idlePolls_ << "polls, exiting";
            stop(ExitNormal);
            return;
        }
        schedulePoll(config_.pollIntervalMs);
        return;
    }

    idlePolls_ = 0;

    const ScheduleDecision decision = SchedulerPolicy::decide(counts.pending, counts.inFlight);
    if (decision.isEmpty()) {
        schedulePoll(config_.pollIntervalMs);
        return;
    }

    dispatch(decision);
}

void Worker::dispatch(const ScheduleDecision &decision)
{
    setState(State::Dispatching);

    const QList<Job> batch = queue_->claimBatch(decision.batchSize);
    if (batch.isEmpty()) {
        if (queue_->error() != QueueError::None) {
            stopOnStoreFailure();
            return;
        }
        // Someone removed the pending jobs between poll and claim
        setState(State::Idle);
        schedulePoll(config_.pollIntervalMs);
        return;
    }

    if (!queue_->markInFlight(batch)) {
        stopOnStoreFailure();
        return;
    }

    streamsPerJob_ = decision.streamsPerJob;
    batchIds_.clear();
    outstanding_.clear();
    for (const Job &job : batch) {
        batchIds_.append(job.id);
        outstanding_.insert(job.id, job);
    }
    toLaunch_ = batch;

    qInfo().noquote() << QString("Starting batch: %1 job(s), %2 stream(s) each")
                             .arg(batch.size())
                             .arg(streamsPerJob_);
    emit batchDispatched(static_cast<int>(batch.size()), streamsPerJob_);

    launchNext();
}

void Worker::launchNext()
{
    if (state_ != State::Dispatching || toLaunch_.isEmpty()) {
        return;
    }

    const Job job = toLaunch_.takeFirst();
    engine_->transfer(job, streamsPerJob_);

    if (state_ != State::Dispatching || toLaunch_.isEmpty()) {
        return;
    }

    if (config_.staggerMs > 0) {
        launchTimer_->start(config_.staggerMs);
    } else {
        launchNext();
    }
}

void Worker::onTransferFinished(const QString &jobId, bool success, const QString &errorMessage)
{
    if (state_ != State::Dispatching || !outstanding_.contains(jobId)) {
        return;
    }

    const Job job = outstanding_.take(jobId);

    if (success) {
        if (!queue_->complete(job)) {
            stopOnStoreFailure();
            return;
        }
        qInfo().noquote() << "Completed:" << job.displayName;
        emit jobCompleted(jobId);
    } else {
        JobQueue::FailOutcome outcome = JobQueue::FailOutcome::NoOp;
        if (!queue_->failOrRetry(job, &outcome)) {
            stopOnStoreFailure();
            return;
        }
        const bool willRetry = outcome == JobQueue::FailOutcome::Retried;
        errorHandler_->handleTransferFailure(job.displayName, errorMessage, willRetry);
        emit jobFailed(jobId, willRetry);
    }

    if (outstanding_.isEmpty()) {
        finishBatch();
    }
}

void Worker::finishBatch()
{
    if (!queue_->releaseInFlight(batchIds_)) {
        stopOnStoreFailure();
        return;
    }
    batchIds_.clear();

    LOG_VERBOSE() << "Worker: batch done";
    setState(State::Idle);
    schedulePoll(config_.batchPauseMs);
}

void Worker::stopOnStoreFailure()
{
    qCritical().noquote() << "Worker: queue store unavailable, stopping:" << queue_->errorString();
    stop(ExitStoreUnavailable);
}
