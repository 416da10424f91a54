#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTimer>

#include <csignal>
#include <signal.h>

#include "services/jobqueue.h"
#include "services/queueconfig.h"
#include "services/rclonetransferengine.h"
#include "services/worker.h"
#include "services/workertoken.h"
#include "utils/logging.h"
#include "version.h"

namespace {

// Async-signal-safe: the handler only sets the flag
volatile sig_atomic_t shutdownRequested = 0;

void onTerminationSignal(int)
{
    shutdownRequested = 1;
}

bool installSignalHandlers()
{
    struct sigaction action{};
    action.sa_handler = onTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    bool ok = true;
    for (int signalNumber : {SIGTERM, SIGINT, SIGHUP}) {
        if (sigaction(signalNumber, &action, nullptr) != 0) {
            qWarning() << "Cannot install handler for signal" << signalNumber;
            ok = false;
        }
    }
    return ok;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("syncq");
    app.setApplicationVersion(SYNCQ_VERSION);
    app.setOrganizationName("syncq");

    QCommandLineParser parser;
    parser.setApplicationDescription("Background worker draining the syncq download queue");
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

    parser.process(app);

    syncq::verboseLogging = parser.isSet(verboseOption);

    QSettings settings;
    QueueConfig config = QueueConfig::fromSettings(settings);
    if (parser.isSet(stateDirOption)) {
        config.setStateDir(parser.value(stateDirOption));
    }

    if (!syncq::installFileLogger(config.logFile())) {
        qWarning() << "Logging to stderr only";
    }

    if (!installSignalHandlers()) {
        qWarning() << "Termination signals will not stop the worker cleanly";
    }

    JobQueue queue(config.queueFile(), config.lockFile());
    WorkerToken token(config.tokenFile());
    RcloneTransferEngine engine(config.engine);
    Worker worker(&queue, &token, &engine, config);

    QObject::connect(&worker, &Worker::stopped, &app, [](int exitCode) {
        QCoreApplication::exit(exitCode);
    });

    // Picks up termination signals on the event loop
    QTimer signalWatcher;
    signalWatcher.setInterval(200);
    QObject::connect(&signalWatcher, &QTimer::timeout, &worker, [&worker]() {
        if (shutdownRequested) {
            qInfo() << "Termination signal received, shutting down";
            worker.stop(Worker::ExitNormal);
        }
    });

    if (!worker.start()) {
        syncq::uninstallFileLogger();
        return worker.exitCode();
    }
    signalWatcher.start();

    const int exitCode = app.exec();
    syncq::uninstallFileLogger();
    return exitCode;
}
