#include "rclonetransferengine.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTimer>

#include <utility>

#include "utils/logging.h"

RcloneTransferEngine::RcloneTransferEngine(const EngineConfig &config, QObject *parent)
    : ITransferEngine(parent)
    , config_(config)
{
}

RcloneTransferEngine::~RcloneTransferEngine()
{
    abortAll();
}

QStringList RcloneTransferEngine::buildArguments(const EngineConfig &config,
                                                 const Job &job, int streamCount)
{
    const QString destinationDir = QFileInfo(job.destination).absolutePath();

    QStringList args;
    args << "copy" << job.source << destinationDir
         << "--multi-thread-streams" << QString::number(streamCount)
         << "--multi-thread-cutoff" << "0"
         << "--timeout" << config.timeout
         << "--contimeout" << config.connectTimeout
         << "--low-level-retries" << QString::number(config.lowLevelRetries)
         << "--retries" << QString::number(config.retries)
         << "--stats=30s"
         << "--stats-one-line";

    if (!config.logFile.isEmpty()) {
        args << QString("--log-file=%1").arg(config.logFile)
             << "--log-level=INFO";
    }

    return args;
}

void RcloneTransferEngine::transfer(const Job &job, int streamCount)
{
    if (processes_.contains(job.id)) {
        qWarning() << "RcloneTransferEngine: job already running" << job.id;
        return;
    }

    const QString jobId = job.id;
    const QString destinationDir = QFileInfo(job.destination).absolutePath();
    if (!QDir().mkpath(destinationDir)) {
        // Report asynchronously, like every other outcome
        const QString message = QString("Cannot create directory %1").arg(destinationDir);
        QTimer::singleShot(0, this, [this, jobId, message]() {
            emit transferFinished(jobId, false, message);
        });
        return;
    }

    qInfo().noquote() << QString("Downloading: %1 (%2MB) [streams=%3]")
                             .arg(job.displayName)
                             .arg(job.sizeBytes / 1048576)
                             .arg(streamCount);

    auto *process = new QProcess(this);
    process->setProgram(config_.program);
    process->setArguments(buildArguments(config_, job, streamCount));
    process->setProcessChannelMode(QProcess::ForwardedChannels);

    connect(process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished), this,
            [this, jobId](int exitCode, QProcess::ExitStatus status) {
                onProcessFinished(jobId, exitCode, status);
            });
    connect(process, &QProcess::errorOccurred, this,
            [this, jobId](QProcess::ProcessError error) {
                onProcessError(jobId, error);
            });

    processes_.insert(jobId, process);
    LOG_VERBOSE() << "RcloneTransferEngine:" << config_.program << process->arguments();
    process->start();
}

void RcloneTransferEngine::abortAll()
{
    const QHash<QString, QProcess *> running = std::exchange(processes_, {});
    for (QProcess *process : running) {
        process->disconnect(this);
        if (process->state() != QProcess::NotRunning) {
            process->kill();
            process->waitForFinished(3000);
        }
        process->deleteLater();
    }
}

void RcloneTransferEngine::onProcessFinished(const QString &jobId, int exitCode,
                                             QProcess::ExitStatus status)
{
    if (status == QProcess::NormalExit && exitCode == 0) {
        finish(jobId, true, QString());
    } else if (status == QProcess::CrashExit) {
        finish(jobId, false, QStringLiteral("Transfer process terminated abnormally"));
    } else {
        finish(jobId, false, QString("Transfer process exited with code %1").arg(exitCode));
    }
}

void RcloneTransferEngine::onProcessError(const QString &jobId, QProcess::ProcessError error)
{
    // Only a failed start is terminal here; other errors are followed by finished()
    if (error == QProcess::FailedToStart) {
        finish(jobId, false, QString("Cannot start %1").arg(config_.program));
    }
}

void RcloneTransferEngine::finish(const QString &jobId, bool success, const QString &errorMessage)
{
    QProcess *process = processes_.take(jobId);
    if (!process) {
        return;
    }
    process->deleteLater();

    emit transferFinished(jobId, success, errorMessage);
}
