#include "queuedocument.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

namespace {

const QString kPausedKey = QStringLiteral("paused");

constexpr QueueDocument::Bucket kAllBuckets[] = {
    QueueDocument::Bucket::Pending,
    QueueDocument::Bucket::InFlight,
    QueueDocument::Bucket::Completed,
    QueueDocument::Bucket::Failed,
};

QJsonArray toArray(const QList<Job> &jobs)
{
    QJsonArray array;
    for (const Job &job : jobs) {
        array.append(job.toJson());
    }
    return array;
}

QList<Job> fromArray(const QJsonArray &array)
{
    QList<Job> jobs;
    jobs.reserve(array.size());
    for (const QJsonValue &value : array) {
        if (value.isObject()) {
            jobs.append(Job::fromJson(value.toObject()));
        }
    }
    return jobs;
}

} // namespace

QueueCounts QueueDocument::counts() const
{
    QueueCounts c;
    c.pending = pending.size();
    c.inFlight = inFlight.size();
    c.completed = completed.size();
    c.failed = failed.size();
    return c;
}

bool QueueDocument::isEmpty() const
{
    return pending.isEmpty() && inFlight.isEmpty() && completed.isEmpty() && failed.isEmpty();
}

int QueueDocument::indexOf(Bucket bucket, const QString &id) const
{
    const QList<Job> &list = jobs(bucket);
    for (int i = 0; i < list.size(); ++i) {
        if (list.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

QStringList QueueDocument::duplicateIds() const
{
    QSet<QString> seen;
    QStringList duplicates;
    for (Bucket bucket : kAllBuckets) {
        for (const Job &job : jobs(bucket)) {
            if (seen.contains(job.id)) {
                if (!duplicates.contains(job.id)) {
                    duplicates.append(job.id);
                }
            } else {
                seen.insert(job.id);
            }
        }
    }
    return duplicates;
}

QList<Job> &QueueDocument::jobs(Bucket bucket)
{
    switch (bucket) {
    case Bucket::Pending: return pending;
    case Bucket::InFlight: return inFlight;
    case Bucket::Completed: return completed;
    case Bucket::Failed: return failed;
    }
    return pending;
}

const QList<Job> &QueueDocument::jobs(Bucket bucket) const
{
    switch (bucket) {
    case Bucket::Pending: return pending;
    case Bucket::InFlight: return inFlight;
    case Bucket::Completed: return completed;
    case Bucket::Failed: return failed;
    }
    return pending;
}

QJsonObject QueueDocument::toJson() const
{
    QJsonObject root;
    for (Bucket bucket : kAllBuckets) {
        root[bucketKey(bucket)] = toArray(jobs(bucket));
    }
    root[kPausedKey] = paused;
    return root;
}

QByteArray QueueDocument::toBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

QueueDocument QueueDocument::fromJson(const QJsonObject &root)
{
    QueueDocument doc;
    for (Bucket bucket : kAllBuckets) {
        doc.jobs(bucket) = fromArray(root[bucketKey(bucket)].toArray());
    }
    doc.paused = root[kPausedKey].toBool(false);
    return doc;
}

QString QueueDocument::bucketKey(Bucket bucket)
{
    switch (bucket) {
    case Bucket::Pending: return QStringLiteral("pending");
    // Stored as "downloading" so existing queue files stay readable
    case Bucket::InFlight: return QStringLiteral("downloading");
    case Bucket::Completed: return QStringLiteral("completed");
    case Bucket::Failed: return QStringLiteral("failed");
    }
    return QString();
}
