/**
 * @file itransferengine.h
 * @brief Interface for transfer engine implementations.
 *
 * This interface allows dependency injection of transfer engines, enabling
 * runtime swapping between the rclone-backed engine and mock implementations
 * for testing.
 */

#ifndef ITRANSFERENGINE_H
#define ITRANSFERENGINE_H

#include <QObject>
#include <QString>

#include "models/job.h"

/**
 * @brief Abstract interface for transfer engine implementations.
 *
 * An engine performs one job's byte transfer per transfer() call and
 * reports the outcome asynchronously through transferFinished(). The
 * engine owns everything below that line: network I/O, chunking,
 * verification and its own low-level retries.
 *
 * @par Example usage:
 * @code
 * // Production code
 * ITransferEngine *engine = new RcloneTransferEngine(config, this);
 *
 * // Test code
 * ITransferEngine *engine = new MockTransferEngine(this);
 *
 * connect(engine, &ITransferEngine::transferFinished,
 *         this, &Worker::onTransferFinished);
 * engine->transfer(job, 2);
 * @endcode
 */
class ITransferEngine : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a transfer engine interface.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ITransferEngine(QObject *parent = nullptr) : QObject(parent) {}

    /**
     * @brief Virtual destructor.
     */
    ~ITransferEngine() override = default;

    /**
     * @brief Starts transferring one job.
     * @param job The job to transfer (source to destination).
     * @param streamCount Parallel streams the engine may open for this job.
     *
     * Every call results in exactly one transferFinished() for job.id,
     * unless abortAll() is called first.
     */
    virtual void transfer(const Job &job, int streamCount) = 0;

    /**
     * @brief Kills all running transfers without reporting outcomes.
     */
    virtual void abortAll() = 0;

    /**
     * @brief Returns the number of transfers currently running.
     */
    [[nodiscard]] virtual int activeCount() const = 0;

signals:
    /**
     * @brief Emitted when a transfer ends.
     * @param jobId The id of the job that was transferred.
     * @param success True if the engine reported success.
     * @param errorMessage Human-readable failure reason (empty on success).
     */
    void transferFinished(const QString &jobId, bool success, const QString &errorMessage);
};

#endif // ITRANSFERENGINE_H
