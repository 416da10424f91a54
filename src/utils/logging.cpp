#include "logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>

namespace syncq {

namespace {

QMutex logMutex;
QFile *logFile = nullptr;
QtMessageHandler previousHandler = nullptr;

const char *levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg: return "DEBUG";
    case QtInfoMsg: return "INFO";
    case QtWarningMsg: return "WARN";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg: return "FATAL";
    }
    return "INFO";
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    if (type == QtDebugMsg && !verboseLogging) {
        return;
    }

    const QByteArray line = formatLogLine(type, message).toUtf8();

    {
        QMutexLocker locker(&logMutex);
        if (logFile && logFile->isOpen()) {
            logFile->write(line);
            logFile->write("\n");
            logFile->flush();
        }
    }

    if (previousHandler) {
        previousHandler(type, context, message);
    } else {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

} // namespace

QString formatLogLine(QtMsgType type, const QString &message)
{
    return QString("[%1] %2: %3")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss"),
             QString::fromLatin1(levelName(type)),
             message);
}

bool installFileLogger(const QString &path)
{
    QMutexLocker locker(&logMutex);

    if (!logFile) {
        auto *file = new QFile(path);
        if (!QDir().mkpath(QFileInfo(path).absolutePath())
            || !file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            delete file;
            locker.unlock();
            qWarning() << "Cannot open log file" << path;
            return false;
        }
        logFile = file;
        previousHandler = qInstallMessageHandler(fileMessageHandler);
    }
    return true;
}

void uninstallFileLogger()
{
    QMutexLocker locker(&logMutex);
    if (!logFile) {
        return;
    }

    qInstallMessageHandler(previousHandler);
    previousHandler = nullptr;
    logFile->close();
    delete logFile;
    logFile = nullptr;
}

} // namespace syncq
