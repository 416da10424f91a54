/**
 * @file workertoken.h
 * @brief Liveness token proving a worker process is running.
 */

#ifndef WORKERTOKEN_H
#define WORKERTOKEN_H

#include <QString>
#include <optional>

/**
 * @brief Process-id file used as the single-instance guard for the worker.
 *
 * The token holds the worker's process id as decimal text. It counts as
 * live only while a process with that id exists, so a token left behind by
 * a crashed worker does not block the next one.
 *
 * acquire() is a check-then-write; callers that can race (two workers
 * starting at once) run it inside QueueGate::withExclusiveLock().
 */
class WorkerToken
{
public:
    explicit WorkerToken(const QString &path);

    [[nodiscard]] const QString &path() const { return path_; }

    /**
     * @brief Claims the token for @p ownPid.
     * @return False if a live token names a different process.
     */
    bool acquire(qint64 ownPid);

    /**
     * @brief Atomically writes @p pid as the token content.
     */
    bool write(qint64 pid);

    /**
     * @brief Reads the recorded process id.
     * @return The pid, or std::nullopt if the token is missing or garbled.
     */
    [[nodiscard]] std::optional<qint64> readPid() const;

    /**
     * @brief Deletes the token if it names @p ownPid.
     *
     * A token that now belongs to another process is left alone.
     */
    bool remove(qint64 ownPid);

    /**
     * @brief True if the token exists and its process is alive.
     */
    [[nodiscard]] bool isAlive() const;

    /**
     * @brief OS process-table check for @p pid.
     */
    [[nodiscard]] static bool isProcessAlive(qint64 pid);

private:
    QString path_;
};

#endif // WORKERTOKEN_H
