#include "job.h"

#include <QUuid>

namespace {

const QString kIdKey = QStringLiteral("id");
const QString kSourceKey = QStringLiteral("remote_path");
const QString kDestinationKey = QStringLiteral("local_path");
const QString kNameKey = QStringLiteral("filename");
const QString kSizeKey = QStringLiteral("size");
const QString kRetriesKey = QStringLiteral("retries");
const QString kEnqueuedKey = QStringLiteral("added_at");
const QString kCompletedKey = QStringLiteral("completed_at");
const QString kFailedKey = QStringLiteral("failed_at");

// Always written with an explicit offset ("Z" for UTC) so a parsed value
// serializes back to the same text
QString formatTimestamp(const QDateTime &ts)
{
    return ts.toOffsetFromUtc(ts.offsetFromUtc()).toString(Qt::ISODate);
}

QDateTime parseTimestamp(const QJsonValue &value)
{
    if (!value.isString()) {
        return QDateTime();
    }
    return QDateTime::fromString(value.toString(), Qt::ISODate);
}

} // namespace

QJsonObject Job::toJson() const
{
    QJsonObject obj = extra;
    obj[kIdKey] = id;
    obj[kSourceKey] = source;
    obj[kDestinationKey] = destination;
    obj[kNameKey] = displayName;
    obj[kSizeKey] = sizeBytes;
    obj[kRetriesKey] = retries;

    if (enqueuedAt.isValid()) {
        obj[kEnqueuedKey] = formatTimestamp(enqueuedAt);
    }
    if (completedAt.isValid()) {
        obj[kCompletedKey] = formatTimestamp(completedAt);
    } else {
        obj.remove(kCompletedKey);
    }
    if (failedAt.isValid()) {
        obj[kFailedKey] = formatTimestamp(failedAt);
    } else {
        obj.remove(kFailedKey);
    }

    return obj;
}

Job Job::fromJson(const QJsonObject &obj)
{
    Job job;
    job.id = obj[kIdKey].toString();
    job.source = obj[kSourceKey].toString();
    job.destination = obj[kDestinationKey].toString();
    job.displayName = obj[kNameKey].toString();

    // Older queue files stored the size as a string
    const QJsonValue size = obj[kSizeKey];
    job.sizeBytes = size.isString() ? size.toString().toLongLong() : size.toInteger();

    job.retries = obj[kRetriesKey].toInt(0);
    job.enqueuedAt = parseTimestamp(obj[kEnqueuedKey]);
    job.completedAt = parseTimestamp(obj[kCompletedKey]);
    job.failedAt = parseTimestamp(obj[kFailedKey]);

    job.extra = obj;
    for (const QString &key : {kIdKey, kSourceKey, kDestinationKey, kNameKey, kSizeKey,
                               kRetriesKey, kEnqueuedKey, kCompletedKey, kFailedKey}) {
        job.extra.remove(key);
    }

    return job;
}

QString Job::generateId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}
