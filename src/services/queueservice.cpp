#include "queueservice.h"

#include <QDebug>
#include <QDeadlineTimer>
#include <QFileInfo>
#include <QProcess>
#include <QThread>

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <sys/types.h>

#include "services/jobqueue.h"
#include "utils/logging.h"

QueueService::QueueService(JobQueue *queue, const QueueConfig &config, QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , config_(config)
    , token_(config.tokenFile())
{
}

QueueService::~QueueService() = default;

Job QueueService::enqueue(const QString &source, const QString &destination,
                          const QString &displayName, qint64 sizeBytes)
{
    lastError_.clear();

    // The worker may run from any directory, so relative paths are pinned here
    const QFileInfo target(destination);
    const QString name = displayName.isEmpty() ? target.fileName() : displayName;
    Job job = queue_->enqueue(source, target.absoluteFilePath(), name, sizeBytes);
    if (job.isValid()) {
        emit statusMessage(tr("Added: %1").arg(job.displayName));
    }
    return job;
}

bool QueueService::removePending(int index)
{
    lastError_.clear();

    bool removed = true;
    const QMetaObject::Connection noOp = connect(queue_, &JobQueue::lifecycleNoOp, this,
                                                 [&removed]() { removed = false; });
    const bool ok = queue_->removePending(index);
    disconnect(noOp);

    if (!ok) {
        return false;
    }
    if (removed) {
        emit statusMessage(tr("Removed pending job %1").arg(index + 1));
    }
    return true;
}

bool QueueService::clearPending()
{
    lastError_.clear();
    if (!queue_->clearPending()) {
        return false;
    }
    emit statusMessage(tr("Cleared pending jobs"));
    return true;
}

bool QueueService::clearCompleted()
{
    lastError_.clear();
    if (!queue_->clearCompleted()) {
        return false;
    }
    emit statusMessage(tr("Cleared completed jobs"));
    return true;
}

bool QueueService::clearFailed()
{
    lastError_.clear();
    if (!queue_->clearFailed()) {
        return false;
    }
    emit statusMessage(tr("Cleared failed jobs"));
    return true;
}

std::optional<int> QueueService::retryAllFailed()
{
    lastError_.clear();
    int moved = 0;
    if (!queue_->retryAllFailed(&moved)) {
        return std::nullopt;
    }
    emit statusMessage(tr("Retrying %n failed job(s)", nullptr, moved));
    return moved;
}

bool QueueService::setPaused(bool paused)
{
    lastError_.clear();
    if (!queue_->setPaused(paused)) {
        return false;
    }
    emit statusMessage(paused ? tr("Queue paused") : tr("Queue resumed"));
    return true;
}

std::optional<QueueCounts> QueueService::queryCounts()
{
    lastError_.clear();
    return queue_->counts();
}

std::optional<bool> QueueService::queryPausedState()
{
    lastError_.clear();
    return queue_->isPaused();
}

std::optional<QueueDocument> QueueService::snapshot()
{
    lastError_.clear();
    return queue_->snapshot();
}

bool QueueService::isWorkerAlive() const
{
    return token_.isAlive();
}

std::optional<qint64> QueueService::workerPid() const
{
    const std::optional<qint64> pid = token_.readPid();
    if (pid && WorkerToken::isProcessAlive(*pid)) {
        return pid;
    }
    return std::nullopt;
}

bool QueueService::startWorkerIfNotRunning()
{
    lastError_.clear();

    if (const std::optional<qint64> pid = workerPid()) {
        LOG_VERBOSE() << "QueueService: worker already running, pid" << *pid;
        return true;
    }

    const QStringList args{QStringLiteral("--state-dir"), config_.stateDir};
    qint64 pid = 0;
    if (!QProcess::startDetached(config_.workerProgram, args, QString(), &pid)) {
        lastError_ = tr("Cannot start worker %1").arg(config_.workerProgram);
        qWarning().noquote() << "QueueService:" << lastError_;
        return false;
    }

    qInfo() << "QueueService: started worker, pid" << pid;
    emit statusMessage(tr("Worker started (pid %1)").arg(pid));
    return true;
}

bool QueueService::stopWorker()
{
    lastError_.clear();

    const std::optional<qint64> pid = workerPid();
    if (!pid) {
        emit statusMessage(tr("Worker not running"));
        return true;
    }

    if (::kill(static_cast<pid_t>(*pid), SIGTERM) != 0) {
        lastError_ = tr("Cannot signal worker %1: %2")
                         .arg(*pid)
                         .arg(QString::fromLocal8Bit(std::strerror(errno)));
        qWarning().noquote() << "QueueService:" << lastError_;
        return false;
    }

    emit statusMessage(tr("Stop requested (pid %1)").arg(*pid));
    return true;
}

bool QueueService::waitForWorkerExit(int timeoutMs)
{
    QDeadlineTimer deadline(timeoutMs);
    while (isWorkerAlive()) {
        if (deadline.hasExpired()) {
            return false;
        }
        QThread::msleep(100);
    }
    return true;
}

bool QueueService::halt()
{
    if (!stopWorker()) {
        return false;
    }
    if (!waitForWorkerExit(10000)) {
        qWarning() << "QueueService: worker still running, re-queueing anyway";
    }

    int moved = 0;
    if (!queue_->requeueInFlight(&moved)) {
        return false;
    }
    if (!queue_->setPaused(true)) {
        return false;
    }

    emit statusMessage(tr("Halted: %n job(s) returned to pending, queue paused", nullptr, moved));
    return true;
}

std::optional<int> QueueService::requeueInFlight()
{
    if (!stopWorker()) {
        return std::nullopt;
    }
    if (!waitForWorkerExit(10000)) {
        qWarning() << "QueueService: worker still running, re-queueing anyway";
    }

    int moved = 0;
    if (!queue_->requeueInFlight(&moved)) {
        return std::nullopt;
    }
    emit statusMessage(tr("%n job(s) returned to pending", nullptr, moved));

    if (!queryPausedState().value_or(true) && !startWorkerIfNotRunning()) {
        emit statusMessage(errorString());
    }
    return moved;
}

std::optional<int> QueueService::discardInFlight()
{
    if (!stopWorker()) {
        return std::nullopt;
    }
    if (!waitForWorkerExit(10000)) {
        qWarning() << "QueueService: worker still running, discarding anyway";
    }

    int dropped = 0;
    if (!queue_->discardInFlight(&dropped)) {
        return std::nullopt;
    }
    emit statusMessage(tr("%n job(s) removed from the queue", nullptr, dropped));

    if (!queryPausedState().value_or(true) && !startWorkerIfNotRunning()) {
        emit statusMessage(errorString());
    }
    return dropped;
}

QString QueueService::errorString() const
{
    return lastError_.isEmpty() ? queue_->errorString() : lastError_;
}
