#include "jobqueue.h"

#include <QDateTime>
#include <QDebug>
#include <QSet>
#include <algorithm>
#include <utility>

#include "utils/logging.h"

JobQueue::JobQueue(const QString &queueFile, const QString &lockFile, QObject *parent)
    : QObject(parent)
    , store_(queueFile)
    , gate_(lockFile)
{
}

bool JobQueue::initialize()
{
    error_ = QueueError::None;
    errorString_.clear();

    const bool lockOk = gate_.withExclusiveLock([this]() {
        return store_.initialize();
    });

    if (!lockOk) {
        if (gate_.error() != QueueError::None) {
            failWith(gate_.error(), gate_.errorString());
        } else {
            failWith(store_.error(), store_.errorString());
        }
        return false;
    }
    return true;
}

Job JobQueue::enqueue(const QString &source, const QString &destination,
                      const QString &displayName, qint64 sizeBytes)
{
    Job job;
    job.id = Job::generateId();
    job.source = source;
    job.destination = destination;
    job.displayName = displayName;
    job.sizeBytes = sizeBytes;
    job.retries = 0;
    job.enqueuedAt = now();

    const bool ok = transact([&job](QueueDocument &doc) {
        doc.pending.append(job);
        return true;
    });

    if (!ok) {
        return Job();
    }

    LOG_VERBOSE() << "JobQueue: enqueued" << job.displayName << job.id;
    return job;
}

QList<Job> JobQueue::claimBatch(int count)
{
    QList<Job> claimed;
    if (count <= 0) {
        return claimed;
    }

    const bool ok = transact([&claimed, count](QueueDocument &doc) {
        const int take = std::min(count, static_cast<int>(doc.pending.size()));
        if (take == 0) {
            return false;
        }
        claimed = doc.pending.mid(0, take);
        doc.pending.remove(0, take);
        return true;
    });

    // On failure error() says why; an empty result alone is not an error
    if (!ok) {
        return {};
    }
    return claimed;
}

bool JobQueue::markInFlight(const QList<Job> &batch)
{
    if (batch.isEmpty()) {
        return true;
    }

    return transact([&batch](QueueDocument &doc) {
        bool changed = false;
        for (const Job &job : batch) {
            if (doc.indexOf(QueueDocument::Bucket::InFlight, job.id) < 0) {
                doc.inFlight.append(job);
                changed = true;
            }
        }
        return changed;
    });
}

bool JobQueue::complete(const Job &job)
{
    return transact([this, &job](QueueDocument &doc) {
        const int index = doc.indexOf(QueueDocument::Bucket::InFlight, job.id);
        if (index < 0) {
            noteNoOp(QStringLiteral("complete"), job.id);
            return false;
        }

        Job done = doc.inFlight.takeAt(index);
        done.completedAt = now();
        doc.completed.append(done);
        return true;
    });
}

bool JobQueue::failOrRetry(const Job &job, FailOutcome *outcome)
{
    FailOutcome result = FailOutcome::NoOp;

    const bool ok = transact([this, &job, &result](QueueDocument &doc) {
        const int index = doc.indexOf(QueueDocument::Bucket::InFlight, job.id);
        if (index < 0) {
            noteNoOp(QStringLiteral("failOrRetry"), job.id);
            return false;
        }

        Job attempt = doc.inFlight.takeAt(index);
        attempt.retries += 1;

        if (attempt.retries < MaxRetries) {
            // Tail, not head: a retry does not jump ahead of fresh work
            doc.pending.append(attempt);
            result = FailOutcome::Retried;
        } else {
            attempt.failedAt = now();
            doc.failed.append(attempt);
            result = FailOutcome::Failed;
        }
        return true;
    });

    if (outcome) {
        *outcome = result;
    }
    return ok;
}

bool JobQueue::recoverCrashed(int *recovered)
{
    int moved = 0;
    const bool ok = transact([&moved](QueueDocument &doc) {
        moved = moveInFlightToPendingHead(doc);
        return moved > 0;
    });

    if (ok && moved > 0) {
        qInfo() << "JobQueue: recovered" << moved << "interrupted transfer(s)";
    }
    if (recovered) {
        *recovered = moved;
    }
    return ok;
}

bool JobQueue::releaseInFlight(const QStringList &ids)
{
    if (ids.isEmpty()) {
        return true;
    }

    return transact([&ids](QueueDocument &doc) {
        const auto removed = doc.inFlight.removeIf([&ids](const Job &job) {
            return ids.contains(job.id);
        });
        return removed > 0;
    });
}

bool JobQueue::removePending(int index)
{
    return transact([this, index](QueueDocument &doc) {
        if (index < 0 || index >= doc.pending.size()) {
            noteNoOp(QStringLiteral("removePending"), QString::number(index));
            return false;
        }
        doc.pending.removeAt(index);
        return true;
    });
}

bool JobQueue::clearPending()
{
    return transact([](QueueDocument &doc) {
        if (doc.pending.isEmpty()) {
            return false;
        }
        doc.pending.clear();
        return true;
    });
}

bool JobQueue::clearCompleted()
{
    return transact([](QueueDocument &doc) {
        if (doc.completed.isEmpty()) {
            return false;
        }
        doc.completed.clear();
        return true;
    });
}

bool JobQueue::clearFailed()
{
    return transact([](QueueDocument &doc) {
        if (doc.failed.isEmpty()) {
            return false;
        }
        doc.failed.clear();
        return true;
    });
}

bool JobQueue::retryAllFailed(int *moved)
{
    int count = 0;
    const bool ok = transact([&count](QueueDocument &doc) {
        count = doc.failed.size();
        for (Job job : std::as_const(doc.failed)) {
            job.retries = 0;
            job.failedAt = QDateTime();
            doc.pending.append(job);
        }
        doc.failed.clear();
        return count > 0;
    });

    if (moved) {
        *moved = count;
    }
    return ok;
}

bool JobQueue::setPaused(bool paused)
{
    return transact([paused](QueueDocument &doc) {
        if (doc.paused == paused) {
            return false;
        }
        doc.paused = paused;
        return true;
    });
}

bool JobQueue::requeueInFlight(int *moved)
{
    int count = 0;
    const bool ok = transact([&count](QueueDocument &doc) {
        count = moveInFlightToPendingHead(doc);
        return count > 0;
    });

    if (moved) {
        *moved = count;
    }
    return ok;
}

bool JobQueue::discardInFlight(int *dropped)
{
    int count = 0;
    const bool ok = transact([&count](QueueDocument &doc) {
        count = doc.inFlight.size();
        doc.inFlight.clear();
        return count > 0;
    });

    if (dropped) {
        *dropped = count;
    }
    return ok;
}

std::optional<QueueCounts> JobQueue::counts()
{
    QueueCounts result;
    if (!read([&result](const QueueDocument &doc) { result = doc.counts(); })) {
        return std::nullopt;
    }
    return result;
}

std::optional<bool> JobQueue::isPaused()
{
    bool paused = false;
    if (!read([&paused](const QueueDocument &doc) { paused = doc.paused; })) {
        return std::nullopt;
    }
    return paused;
}

std::optional<QueueDocument> JobQueue::snapshot()
{
    QueueDocument copy;
    if (!read([&copy](const QueueDocument &doc) { copy = doc; })) {
        return std::nullopt;
    }
    return copy;
}

bool JobQueue::transact(const Transform &transform)
{
    error_ = QueueError::None;
    errorString_.clear();
    noOps_.clear();

    bool changed = false;
    const bool ok = gate_.withExclusiveLock([this, &transform, &changed]() {
        QueueDocument doc;
        if (!store_.load(doc)) {
            return false;
        }

        changed = transform(doc);
        if (!changed) {
            return true;
        }

        return store_.save(doc);
    });

    if (!ok) {
        noOps_.clear();
        if (gate_.error() != QueueError::None) {
            failWith(gate_.error(), gate_.errorString());
        } else {
            failWith(store_.error(), store_.errorString());
        }
        return false;
    }

    // Signals go out after the lock is released
    flushNoOps();
    if (changed) {
        emit queueChanged();
    }
    return true;
}

bool JobQueue::read(const std::function<void(const QueueDocument &doc)> &reader)
{
    return transact([&reader](QueueDocument &doc) {
        reader(doc);
        return false;
    });
}

void JobQueue::noteNoOp(const QString &operation, const QString &jobId)
{
    noOps_.append({operation, jobId});
}

void JobQueue::flushNoOps()
{
    const QList<NoOp> pending = std::exchange(noOps_, {});
    for (const NoOp &noOp : pending) {
        qDebug() << "JobQueue:" << noOp.operation << "found nothing for" << noOp.jobId;
        emit lifecycleNoOp(noOp.operation, noOp.jobId);
    }
}

void JobQueue::failWith(QueueError error, const QString &message)
{
    error_ = error;
    errorString_ = message;
    qWarning().noquote() << "JobQueue:" << queueErrorToString(error) << "-" << message;
    emit storeError(message);
}

int JobQueue::moveInFlightToPendingHead(QueueDocument &doc)
{
    const int count = doc.inFlight.size();
    if (count == 0) {
        return 0;
    }

    QList<Job> reordered = doc.inFlight;
    reordered.append(doc.pending);
    doc.pending = reordered;
    doc.inFlight.clear();
    return count;
}

QDateTime JobQueue::now()
{
    return QDateTime::fromSecsSinceEpoch(QDateTime::currentSecsSinceEpoch());
}
