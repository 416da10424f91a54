/**
 * @file job.h
 * @brief A single queued transfer and its JSON record form.
 */

#ifndef JOB_H
#define JOB_H

#include <QDateTime>
#include <QJsonObject>
#include <QString>

/**
 * @brief One unit of transfer work.
 *
 * The id is assigned at enqueue time and never changes; it is the only key
 * used to find a job when it moves between buckets. Fields the queue does
 * not know about are kept in @c extra so a record written by another tool
 * survives a load/save cycle unchanged.
 */
struct Job {
    QString id;
    QString source;        // Remote locator, e.g. "remote:/Sync/file.bin"
    QString destination;   // Local file path
    QString displayName;
    qint64 sizeBytes = 0;
    int retries = 0;
    QDateTime enqueuedAt;
    QDateTime completedAt;
    QDateTime failedAt;
    QJsonObject extra;

    [[nodiscard]] bool isValid() const { return !id.isEmpty(); }

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static Job fromJson(const QJsonObject &obj);

    /// Generates a fresh opaque job id.
    [[nodiscard]] static QString generateId();
};

#endif // JOB_H
