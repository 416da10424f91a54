#ifndef QUEUEERROR_H
#define QUEUEERROR_H

/**
 * @brief Error conditions raised by the queue subsystem.
 */
enum class QueueError {
    None,
    StoreUnavailable,   ///< Queue document or lock unreadable/corrupt
    AlreadyRunning,     ///< Another live worker holds the liveness token
    TransferFailure,    ///< A single transfer failed; routed through retry
    LifecycleNoOp       ///< Referenced job not found; the transition was skipped
};

/// @brief Convert QueueError to string for logging
[[nodiscard]] inline const char* queueErrorToString(QueueError error) {
    switch (error) {
        case QueueError::None: return "None";
        case QueueError::StoreUnavailable: return "StoreUnavailable";
        case QueueError::AlreadyRunning: return "AlreadyRunning";
        case QueueError::TransferFailure: return "TransferFailure";
        case QueueError::LifecycleNoOp: return "LifecycleNoOp";
    }
    return "Unknown";
}

#endif // QUEUEERROR_H
