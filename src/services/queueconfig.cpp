#include "queueconfig.h"

#include <QCoreApplication>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

#include <algorithm>

void QueueConfig::setStateDir(const QString &dir)
{
    stateDir = dir;
    engine.logFile = logFile();
}

QString QueueConfig::queueFile() const
{
    return QDir(stateDir).filePath(QStringLiteral("queue.json"));
}

QString QueueConfig::lockFile() const
{
    return QDir(stateDir).filePath(QStringLiteral("queue.lock"));
}

QString QueueConfig::tokenFile() const
{
    return QDir(stateDir).filePath(QStringLiteral("worker.pid"));
}

QString QueueConfig::logFile() const
{
    return QDir(stateDir).filePath(QStringLiteral("syncq.log"));
}

QString QueueConfig::defaultStateDir()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (dir.isEmpty()) {
        dir = QDir::home().filePath(QStringLiteral(".syncq"));
    }
    return dir;
}

QString QueueConfig::defaultWorkerProgram()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("syncq-worker"));
}

QueueConfig QueueConfig::fromSettings(const QSettings &settings)
{
    QueueConfig config;

    config.workerProgram = settings.value("worker/program", defaultWorkerProgram()).toString();

    config.pollIntervalMs = std::max(0, settings.value("worker/pollIntervalMs", config.pollIntervalMs).toInt());
    config.maxIdlePolls = std::max(1, settings.value("worker/maxIdlePolls", config.maxIdlePolls).toInt());
    config.staggerMs = std::max(0, settings.value("worker/staggerMs", config.staggerMs).toInt());
    config.batchPauseMs = std::max(0, settings.value("worker/batchPauseMs", config.batchPauseMs).toInt());

    config.engine.program = settings.value("engine/program", config.engine.program).toString();
    config.engine.timeout = settings.value("engine/timeout", config.engine.timeout).toString();
    config.engine.connectTimeout = settings.value("engine/connectTimeout", config.engine.connectTimeout).toString();
    config.engine.lowLevelRetries = settings.value("engine/lowLevelRetries", config.engine.lowLevelRetries).toInt();
    config.engine.retries = settings.value("engine/retries", config.engine.retries).toInt();
    config.setStateDir(settings.value("queue/stateDir", defaultStateDir()).toString());

    return config;
}
