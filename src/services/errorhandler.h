/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error reporting.
 *
 * This service standardizes how queue, worker and transfer errors are
 * categorized and logged, so every executable reports them the same way.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "models/queueerror.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Store,      ///< Queue document or lock problems
    Lifecycle,  ///< Transitions that found nothing to act on
    Transfer,   ///< Individual transfer failures
    Worker      ///< Worker process startup/shutdown problems
};

/**
 * @brief Severity levels determining how errors are logged.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - expected, recoverable
    Warning,   ///< Warning - something failed but work continues
    Critical   ///< Critical - the operation or process cannot continue
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the tools:
 * - Categorizes errors for appropriate handling
 * - Logs at a level matching the severity
 * - Maps QueueError values onto a category and severity
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(queue, &JobQueue::storeError,
 *         handler, &ErrorHandler::handleStoreError);
 * connect(queue, &JobQueue::lifecycleNoOp,
 *         handler, &ErrorHandler::handleLifecycleNoOp);
 *
 * handler->handleTransferFailure("movie.mkv", "exited with code 1", true);
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Handles a QueueError using its default category and severity.
     * @param error The queue error.
     * @param details Detailed error message.
     */
    void handleQueueError(QueueError error, const QString &details);
    /// @}

    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles an unreadable or unwritable store (critical severity).
     * @param message The error message.
     */
    void handleStoreError(const QString &message);

    /**
     * @brief Handles a failed transfer (warning severity).
     * @param jobName Display name of the job.
     * @param error The engine's error message.
     * @param willRetry True if the job went back to pending.
     */
    void handleTransferFailure(const QString &jobName, const QString &error, bool willRetry);

    /**
     * @brief Handles a transition that found nothing to act on (info severity).
     * @param operation The lifecycle operation.
     * @param jobId The job id or index involved.
     */
    void handleLifecycleNoOp(const QString &operation, const QString &jobId);

    /**
     * @brief Handles a second worker start attempt (critical severity).
     * @param runningPid Process id of the worker already running.
     */
    void handleAlreadyRunning(qint64 runningPid);
    /// @}

    /**
     * @brief Returns the number of errors logged since construction.
     */
    [[nodiscard]] int errorCount() const { return errorCount_; }

signals:
    /**
     * @brief Emitted when an error is logged (for monitoring and tests).
     * @param category The error category.
     * @param severity The error severity.
     * @param title The error title.
     * @param details The error details.
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    /**
     * @brief Logs an error through the Qt message handlers.
     */
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    /**
     * @brief Converts category to string for logging.
     * @param category The error category.
     * @return String representation.
     */
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /**
     * @brief Converts severity to string for logging.
     * @param severity The error severity.
     * @return String representation.
     */
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

    int errorCount_ = 0;
};

#endif // ERRORHANDLER_H
