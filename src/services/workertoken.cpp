#include "workertoken.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <cerrno>
#include <signal.h>
#include <sys/types.h>

WorkerToken::WorkerToken(const QString &path)
    : path_(path)
{
}

bool WorkerToken::acquire(qint64 ownPid)
{
    const std::optional<qint64> holder = readPid();
    if (holder && *holder != ownPid && isProcessAlive(*holder)) {
        return false;
    }

    if (holder && *holder != ownPid) {
        qInfo() << "WorkerToken: replacing stale token for pid" << *holder;
    }
    return write(ownPid);
}

bool WorkerToken::write(qint64 pid)
{
    const QString dirPath = QFileInfo(path_).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        qWarning() << "WorkerToken: cannot create" << dirPath;
        return false;
    }

    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "WorkerToken: cannot write" << path_ << file.errorString();
        return false;
    }
    file.write(QByteArray::number(pid));
    file.write("\n");
    return file.commit();
}

std::optional<qint64> WorkerToken::readPid() const
{
    QFile file(path_);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }

    bool ok = false;
    const qint64 pid = file.readAll().trimmed().toLongLong(&ok);
    if (!ok || pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WorkerToken::remove(qint64 ownPid)
{
    const std::optional<qint64> holder = readPid();
    if (holder && *holder != ownPid) {
        return false;
    }
    if (!QFile::exists(path_)) {
        return true;
    }
    return QFile::remove(path_);
}

bool WorkerToken::isAlive() const
{
    const std::optional<qint64> pid = readPid();
    return pid && isProcessAlive(*pid);
}

bool WorkerToken::isProcessAlive(qint64 pid)
{
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    // The process exists but belongs to someone else
    return errno == EPERM;
}
