#include "queuegate.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QLockFile>

QueueGate::QueueGate(const QString &lockPath)
    : lockPath_(lockPath)
{
}

bool QueueGate::withExclusiveLock(const std::function<bool()> &action)
{
    error_ = QueueError::None;
    errorString_.clear();

    const QString dirPath = QFileInfo(lockPath_).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        error_ = QueueError::StoreUnavailable;
        errorString_ = QString("Cannot create lock directory %1").arg(dirPath);
        return false;
    }

    QLockFile lock(lockPath_);
    lock.setStaleLockTime(0);

    if (!lock.lock()) {
        error_ = QueueError::StoreUnavailable;
        switch (lock.error()) {
        case QLockFile::PermissionError:
            errorString_ = QString("No permission to create lock %1").arg(lockPath_);
            break;
        default:
            errorString_ = QString("Cannot acquire lock %1").arg(lockPath_);
            break;
        }
        qWarning().noquote() << "QueueGate:" << errorString_;
        return false;
    }

    // QLockFile's destructor releases the lock if action() throws
    const bool ok = action();
    lock.unlock();
    return ok;
}
