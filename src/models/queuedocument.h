/**
 * @file queuedocument.h
 * @brief The persisted aggregate of all jobs plus the pause flag.
 */

#ifndef QUEUEDOCUMENT_H
#define QUEUEDOCUMENT_H

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QStringList>

#include "job.h"

/**
 * @brief Per-bucket job counts.
 */
struct QueueCounts {
    int pending = 0;
    int inFlight = 0;
    int completed = 0;
    int failed = 0;

    [[nodiscard]] int active() const { return pending + inFlight; }
};

/**
 * @brief All queue state in one document.
 *
 * A job lives in exactly one of the four buckets. Order matters for
 * @c pending (FIFO, head is index 0); the other buckets keep insertion
 * order for display only.
 *
 * The document is a plain value. Loading, saving and locking are the
 * business of QueueStore and QueueGate; the transforms here never touch
 * the filesystem.
 */
class QueueDocument
{
public:
    enum class Bucket { Pending, InFlight, Completed, Failed };

    QList<Job> pending;
    QList<Job> inFlight;
    QList<Job> completed;
    QList<Job> failed;
    bool paused = false;

    [[nodiscard]] QueueCounts counts() const;
    [[nodiscard]] bool isEmpty() const;

    /**
     * @brief Finds a job id in one bucket.
     * @return Index within the bucket, or -1 if absent.
     */
    [[nodiscard]] int indexOf(Bucket bucket, const QString &id) const;

    /**
     * @brief Returns every id that appears in more than one place.
     *
     * Used to check the "each id at most once" rule on loaded documents.
     */
    [[nodiscard]] QStringList duplicateIds() const;

    [[nodiscard]] QList<Job> &jobs(Bucket bucket);
    [[nodiscard]] const QList<Job> &jobs(Bucket bucket) const;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] QByteArray toBytes() const;

    /**
     * @brief Builds a document from its JSON form.
     *
     * Missing buckets load as empty and a missing pause flag as false.
     * Entries that are not objects are skipped.
     */
    [[nodiscard]] static QueueDocument fromJson(const QJsonObject &root);

    [[nodiscard]] static QString bucketKey(Bucket bucket);
};

#endif // QUEUEDOCUMENT_H
