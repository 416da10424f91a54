#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    ++errorCount_;
    logError(category, severity, title, details);
}

void ErrorHandler::handleQueueError(QueueError error, const QString &details)
{
    switch (error) {
    case QueueError::None:
        return;
    case QueueError::StoreUnavailable:
        handleStoreError(details);
        return;
    case QueueError::AlreadyRunning:
        handleError(ErrorCategory::Worker, ErrorSeverity::Critical,
                    tr("Worker already running"), details);
        return;
    case QueueError::TransferFailure:
        handleError(ErrorCategory::Transfer, ErrorSeverity::Warning,
                    tr("Transfer failed"), details);
        return;
    case QueueError::LifecycleNoOp:
        handleError(ErrorCategory::Lifecycle, ErrorSeverity::Info,
                    tr("Nothing to do"), details);
        return;
    }
}

void ErrorHandler::handleStoreError(const QString &message)
{
    handleError(ErrorCategory::Store,
                ErrorSeverity::Critical,
                tr("Queue store unavailable"),
                message);
}

void ErrorHandler::handleTransferFailure(const QString &jobName, const QString &error, bool willRetry)
{
    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Warning,
                willRetry ? tr("Failed: %1 (will retry)").arg(jobName)
                          : tr("Failed: %1 (max retries reached)").arg(jobName),
                error);
}

void ErrorHandler::handleLifecycleNoOp(const QString &operation, const QString &jobId)
{
    handleError(ErrorCategory::Lifecycle,
                ErrorSeverity::Info,
                tr("%1 skipped").arg(operation),
                tr("job %1 not found").arg(jobId));
}

void ErrorHandler::handleAlreadyRunning(qint64 runningPid)
{
    handleError(ErrorCategory::Worker,
                ErrorSeverity::Critical,
                tr("Worker already running"),
                tr("pid %1").arg(runningPid));
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Store:
        return QStringLiteral("Store");
    case ErrorCategory::Lifecycle:
        return QStringLiteral("Lifecycle");
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Worker:
        return QStringLiteral("Worker");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
