/**
 * @file rclonetransferengine.h
 * @brief Transfer engine that runs one "rclone copy" child process per job.
 */

#ifndef RCLONETRANSFERENGINE_H
#define RCLONETRANSFERENGINE_H

#include <QHash>
#include <QProcess>
#include <QStringList>

#include "itransferengine.h"
#include "queueconfig.h"

/**
 * @brief ITransferEngine backed by the rclone command line tool.
 *
 * Each transfer() starts a child process
 * @code
 * rclone copy <source> <destination dir> --multi-thread-streams <n> ...
 * @endcode
 * and reports success when it exits normally with code 0. A non-zero exit,
 * a crash (including a kill from outside) or a failure to start are all
 * reported as failures.
 */
class RcloneTransferEngine : public ITransferEngine
{
    Q_OBJECT

public:
    explicit RcloneTransferEngine(const EngineConfig &config, QObject *parent = nullptr);
    ~RcloneTransferEngine() override;

    void transfer(const Job &job, int streamCount) override;
    void abortAll() override;
    [[nodiscard]] int activeCount() const override { return static_cast<int>(processes_.size()); }

    /**
     * @brief Builds the rclone argument list for one job.
     */
    [[nodiscard]] static QStringList buildArguments(const EngineConfig &config,
                                                    const Job &job, int streamCount);

private:
    void onProcessFinished(const QString &jobId, int exitCode, QProcess::ExitStatus status);
    void onProcessError(const QString &jobId, QProcess::ProcessError error);
    void finish(const QString &jobId, bool success, const QString &errorMessage);

    EngineConfig config_;
    QHash<QString, QProcess *> processes_;
};

#endif // RCLONETRANSFERENGINE_H
