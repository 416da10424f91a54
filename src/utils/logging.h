/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag and optional log file.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QString>

namespace syncq {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

/**
 * @brief Routes Qt log output to @p path in addition to stderr.
 *
 * Lines are written as "[yyyy-MM-dd hh:mm:ss] LEVEL: message". Debug
 * messages are dropped unless verbose logging is on.
 *
 * @return False if the log file could not be opened (stderr still works).
 */
bool installFileLogger(const QString &path);

/**
 * @brief Restores the default Qt message handler and closes the log file.
 */
void uninstallFileLogger();

/// Formats one log line the way installFileLogger() writes it
[[nodiscard]] QString formatLogLine(QtMsgType type, const QString &message);

} // namespace syncq

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (syncq::verboseLogging) qDebug()

#endif // LOGGING_H
