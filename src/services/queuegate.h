/**
 * @file queuegate.h
 * @brief Cross-process mutual exclusion for queue document updates.
 */

#ifndef QUEUEGATE_H
#define QUEUEGATE_H

#include <QString>
#include <functional>

#include "models/queueerror.h"

/**
 * @brief Serializes every read-modify-write of the queue document.
 *
 * The gate holds a QLockFile on a dedicated lock path for the duration of
 * one action. The lock is exclusive between processes and between threads
 * of one process (each acquisition uses its own QLockFile). Acquisition
 * blocks until the current holder is done; there is no timeout.
 *
 * The lock is released when the action returns, on every path out of
 * withExclusiveLock(). If the holding process dies, the lock file is left
 * behind naming a process that no longer exists; the next acquirer treats
 * it as stale and takes it over. Age-based staleness is switched off so a
 * slow but live holder is never broken.
 *
 * @par Example usage:
 * @code
 * QueueGate gate(config.lockFile());
 * bool ok = gate.withExclusiveLock([&]() {
 *     QueueDocument doc;
 *     return store.load(doc) && store.save(transform(doc));
 * });
 * @endcode
 */
class QueueGate
{
public:
    explicit QueueGate(const QString &lockPath);

    [[nodiscard]] const QString &lockPath() const { return lockPath_; }

    /**
     * @brief Runs @p action while holding the exclusive lock.
     * @param action The critical section. Its return value is passed through.
     * @return False if the lock could not be acquired or @p action failed.
     */
    bool withExclusiveLock(const std::function<bool()> &action);

    [[nodiscard]] QueueError error() const { return error_; }
    [[nodiscard]] QString errorString() const { return errorString_; }

private:
    QString lockPath_;
    QueueError error_ = QueueError::None;
    QString errorString_;
};

#endif // QUEUEGATE_H
