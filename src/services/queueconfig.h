/**
 * @file queueconfig.h
 * @brief Runtime configuration for the queue, the worker and the engine.
 */

#ifndef QUEUECONFIG_H
#define QUEUECONFIG_H

#include <QString>

class QSettings;

/**
 * @brief Parameters handed to the rclone transfer engine.
 *
 * These are fixed per installation and never exposed to the scheduler.
 */
struct EngineConfig {
    QString program = QStringLiteral("rclone");
    QString timeout = QStringLiteral("5m");
    QString connectTimeout = QStringLiteral("60s");
    int lowLevelRetries = 3;
    int retries = 1;
    QString logFile;   // Passed as --log-file when set
};

/**
 * @brief Everything the queue tools read from settings.
 *
 * Values come from QSettings (see fromSettings()) and may be overridden
 * from the command line. All state files live in one directory.
 */
struct QueueConfig {
    QString stateDir;
    QString workerProgram;
    int pollIntervalMs = 5000;
    int maxIdlePolls = 12;      // Worker exits after this many empty polls
    int staggerMs = 1000;       // Delay between launches within a batch
    int batchPauseMs = 2000;    // Delay before polling again after a batch
    EngineConfig engine;

    /// Points all state files (and the engine log) at @p dir
    void setStateDir(const QString &dir);

    [[nodiscard]] QString queueFile() const;
    [[nodiscard]] QString lockFile() const;
    [[nodiscard]] QString tokenFile() const;
    [[nodiscard]] QString logFile() const;

    /// Default state directory (application-local data location)
    [[nodiscard]] static QString defaultStateDir();

    /// Default worker executable, next to the running program
    [[nodiscard]] static QString defaultWorkerProgram();

    /**
     * @brief Reads the configuration, falling back to defaults per key.
     */
    [[nodiscard]] static QueueConfig fromSettings(const QSettings &settings);
};

#endif // QUEUECONFIG_H
