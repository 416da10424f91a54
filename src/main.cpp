#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include <algorithm>
#include <optional>

#include "services/jobqueue.h"
#include "services/queueconfig.h"
#include "services/queueservice.h"
#include "utils/logging.h"
#include "utils/sizeformat.h"
#include "version.h"

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int reportFailure(QueueService &service)
{
    err() << "Error: " << service.errorString() << Qt::endl;
    return 1;
}

int usageError(const QString &message)
{
    err() << message << Qt::endl
          << "Run with --help for usage." << Qt::endl;
    return 1;
}

int startWorkerUnlessPaused(QueueService &service)
{
    const std::optional<bool> paused = service.queryPausedState();
    if (!paused) {
        return reportFailure(service);
    }
    if (*paused) {
        out() << "Queue is paused; run \"resume\" to start downloading." << Qt::endl;
        return 0;
    }
    return service.startWorkerIfNotRunning() ? 0 : reportFailure(service);
}

int printStatus(QueueService &service)
{
    const std::optional<QueueDocument> doc = service.snapshot();
    if (!doc) {
        return reportFailure(service);
    }

    const QueueCounts counts = doc->counts();
    const std::optional<qint64> workerPid = service.workerPid();

    QTextStream &s = out();
    s << "Worker:      " << (workerPid ? QString("running (pid %1)").arg(*workerPid)
                                      : QStringLiteral("stopped")) << Qt::endl;
    s << "Queue:       " << (doc->paused ? "paused" : "active") << Qt::endl;
    s << Qt::endl;
    s << "Pending:     " << counts.pending << Qt::endl;
    s << "Downloading: " << counts.inFlight << Qt::endl;
    s << "Completed:   " << counts.completed << Qt::endl;
    s << "Failed:      " << counts.failed << Qt::endl;

    if (!doc->inFlight.isEmpty()) {
        s << Qt::endl << "Currently downloading:" << Qt::endl;
        for (const Job &job : doc->inFlight) {
            s << "  > " << job.displayName << " (" << syncq::formatSize(job.sizeBytes) << ")" << Qt::endl;
        }
    }

    if (!doc->pending.isEmpty()) {
        s << Qt::endl << "Pending queue:" << Qt::endl;
        int index = 1;
        for (const Job &job : doc->pending) {
            s << "  [" << index++ << "] " << job.displayName
              << " (" << syncq::formatSize(job.sizeBytes) << ")" << Qt::endl;
        }
    }

    if (!doc->failed.isEmpty()) {
        s << Qt::endl << "Failed:" << Qt::endl;
        for (const Job &job : doc->failed) {
            s << "  x " << job.displayName << " (retries: " << job.retries << ")" << Qt::endl;
        }
    }

    if (!doc->completed.isEmpty()) {
        s << Qt::endl << "Recently completed (last 5):" << Qt::endl;
        const auto first = std::max<qsizetype>(0, doc->completed.size() - 5);
        for (qsizetype i = first; i < doc->completed.size(); ++i) {
            s << "  + " << doc->completed.at(i).displayName << Qt::endl;
        }
    }

    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("syncq");
    app.setApplicationVersion(SYNCQ_VERSION);
    app.setOrganizationName("syncq");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Persistent download queue.\n\n"
        "Commands:\n"
        "  add <source> <destination>   Queue a file and start the worker\n"
        "  status                       Show workers, counts and queued jobs\n"
        "  remove <n>                   Remove pending job number n\n"
        "  clear                        Remove all pending jobs\n"
        "  clear-completed              Forget completed jobs\n"
        "  clear-failed                 Forget failed jobs\n"
        "  retry                        Move failed jobs back to pending\n"
        "  pause | resume               Pause or resume the queue\n"
        "  start | stop                 Start or stop the worker\n"
        "  halt                         Stop everything, re-queue, pause\n"
        "  requeue                      Interrupt downloads and re-queue them\n"
        "  discard                      Interrupt downloads and drop them");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption stateDirOption(
        "state-dir",
        "Directory holding the queue, lock, worker token and log.",
        "dir");
    parser.addOption(stateDirOption);

    QCommandLineOption nameOption("name", "Display name for \"add\".", "name");
    parser.addOption(nameOption);

    QCommandLineOption sizeOption("size", "Size in bytes for \"add\".", "bytes");
    parser.addOption(sizeOption);

    parser.addPositionalArgument("command", "The command to run.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    parser.process(app);

    // Set verbose logging flag
    syncq::verboseLogging = parser.isSet(verboseOption);

    QSettings settings;
    QueueConfig config = QueueConfig::fromSettings(settings);
    if (parser.isSet(stateDirOption)) {
        config.setStateDir(parser.value(stateDirOption));
    }
    LOG_VERBOSE() << "State directory:" << config.stateDir;

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.first();

    JobQueue queue(config.queueFile(), config.lockFile());
    QueueService service(&queue, config);
    QObject::connect(&service, &QueueService::statusMessage, [](const QString &message) {
        out() << message << Qt::endl;
    });

    if (!queue.initialize()) {
        return reportFailure(service);
    }

    if (command == "add") {
        if (args.size() != 3) {
            return usageError("Usage: syncq add <source> <destination> [--name N] [--size B]");
        }
        qint64 size = 0;
        if (parser.isSet(sizeOption)) {
            bool ok = false;
            size = parser.value(sizeOption).toLongLong(&ok);
            if (!ok || size < 0) {
                return usageError(QString("Invalid size: %1").arg(parser.value(sizeOption)));
            }
        }
        const Job job = service.enqueue(args.at(1), args.at(2), parser.value(nameOption), size);
        if (!job.isValid()) {
            return reportFailure(service);
        }
        return startWorkerUnlessPaused(service);
    }

    if (command == "status") {
        return printStatus(service);
    }

    if (command == "remove") {
        bool ok = false;
        const int number = args.value(1).toInt(&ok);
        if (args.size() != 2 || !ok || number < 1) {
            return usageError("Usage: syncq remove <n>  (n as listed by \"status\")");
        }
        const std::optional<QueueCounts> counts = service.queryCounts();
        if (!counts) {
            return reportFailure(service);
        }
        if (number > counts->pending) {
            return usageError(QString("No pending job %1").arg(number));
        }
        return service.removePending(number - 1) ? 0 : reportFailure(service);
    }

    if (command == "clear") {
        return service.clearPending() ? 0 : reportFailure(service);
    }

    if (command == "clear-completed") {
        return service.clearCompleted() ? 0 : reportFailure(service);
    }

    if (command == "clear-failed") {
        return service.clearFailed() ? 0 : reportFailure(service);
    }

    if (command == "retry") {
        const std::optional<int> moved = service.retryAllFailed();
        if (!moved) {
            return reportFailure(service);
        }
        return *moved > 0 ? startWorkerUnlessPaused(service) : 0;
    }

    if (command == "pause") {
        return service.setPaused(true) ? 0 : reportFailure(service);
    }

    if (command == "resume") {
        if (!service.setPaused(false)) {
            return reportFailure(service);
        }
        return service.startWorkerIfNotRunning() ? 0 : reportFailure(service);
    }

    if (command == "start") {
        return service.startWorkerIfNotRunning() ? 0 : reportFailure(service);
    }

    if (command == "stop") {
        return service.stopWorker() ? 0 : reportFailure(service);
    }

    if (command == "halt") {
        return service.halt() ? 0 : reportFailure(service);
    }

    if (command == "requeue") {
        return service.requeueInFlight() ? 0 : reportFailure(service);
    }

    if (command == "discard") {
        return service.discardInFlight() ? 0 : reportFailure(service);
    }

    return usageError(QString("Unknown command: %1").arg(command));
}
