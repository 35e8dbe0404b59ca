#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSettings>
#include <QTimer>
#include <csignal>

#include "services/batchcoordinator.h"
#include "services/localdirectorystore.h"
#include "services/progressreporter.h"
#include "services/transferlogger.h"
#include "services/transfersettings.h"
#include "ui/commandrunner.h"
#include "ui/consoleprogressview.h"
#include "utils/logging.h"
#include "version.h"

namespace {

volatile std::sig_atomic_t interruptRequested = 0;

void handleInterrupt(int)
{
    interruptRequested = 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("drivebatch");
    app.setApplicationVersion(DRIVEBATCH_VERSION);
    app.setOrganizationName("drivebatch");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Batch upload, download, delete and folder creation for hierarchical file stores");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption storeOption(
        QStringList() << "s" << "store",
        "Directory served as the remote store", "dir");
    parser.addOption(storeOption);

    QCommandLineOption settingsOption(
        "settings", "Read settings from an INI file", "ini");
    parser.addOption(settingsOption);

    QCommandLineOption workersOption(
        QStringList() << "w" << "workers",
        "Number of concurrent transfers (1-8)", "count");
    parser.addOption(workersOption);

    QCommandLineOption yesOption(
        QStringList() << "y" << "yes",
        "Do not ask for confirmation");
    parser.addOption(yesOption);

    QCommandLineOption toOption(
        "to", "Upload, mkdir: remote folder id (default /). Download: local directory.", "target");
    parser.addOption(toOption);

    QCommandLineOption shallowDeleteOption(
        "shallow-delete", "Delete folder contents item by item instead of in one call");
    parser.addOption(shallowDeleteOption);

    parser.addPositionalArgument("command", "list, upload, download, delete or mkdir");
    parser.addPositionalArgument("items", "Folder id (list), local paths (upload), folder name (mkdir) or remote ids", "[items...]");

    parser.process(app);

    QSettings *settingsStore = parser.isSet(settingsOption)
        ? new QSettings(parser.value(settingsOption), QSettings::IniFormat, &app)
        : new QSettings(&app);
    TransferSettings settings = TransferSettings::load(*settingsStore);

    if (parser.isSet(workersOption)) {
        bool ok = false;
        int workers = parser.value(workersOption).toInt(&ok);
        if (!ok) {
            qCritical() << "Invalid worker count:" << parser.value(workersOption);
            return CommandRunner::UsageError;
        }
        settings.workerCount = workers;
        settings = settings.normalized();
    }

    // Set verbose logging flag
    drivebatch::verboseLogging = parser.isSet(verboseOption) || settings.isVerbose();

    if (drivebatch::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty() || !parser.isSet(storeOption)) {
        parser.showHelp(CommandRunner::UsageError);
    }

    LocalDirectoryStore store(parser.value(storeOption), settings.chunkSize,
                              !parser.isSet(shallowDeleteOption));
    if (!store.isValid()) {
        qCritical() << "Store directory does not exist:" << parser.value(storeOption);
        return CommandRunner::UsageError;
    }

    ProgressReporter reporter;
    TransferLogger logger;
    BatchCoordinator coordinator(&store, &reporter, &logger, settings);
    ConsoleProgressView view(&reporter);
    CommandRunner runner(&store, &coordinator, &view, settings, parser.isSet(yesOption));

    const QString command = args.first();
    const QStringList items = args.mid(1);

    if (command == "list") {
        return runner.listFolder(items.isEmpty() ? store.rootId() : items.first());
    }

    if (items.isEmpty()) {
        qCritical() << "Nothing to" << command;
        return CommandRunner::UsageError;
    }

    bool started = false;
    if (command == "upload") {
        started = runner.startUpload(items, parser.isSet(toOption) ? parser.value(toOption) : store.rootId());
    } else if (command == "download") {
        started = runner.startDownload(items, parser.value(toOption));
    } else if (command == "delete") {
        started = runner.startDelete(items);
    } else if (command == "mkdir") {
        started = runner.startCreateFolder(items.first(),
                                           parser.isSet(toOption) ? parser.value(toOption) : store.rootId());
    } else {
        qCritical() << "Unknown command:" << command;
        return CommandRunner::UsageError;
    }

    if (!started) {
        return runner.exitCode();
    }

    QObject::connect(&runner, &CommandRunner::finished, &app, [&app](int exitCode) {
        app.exit(exitCode);
    }, Qt::QueuedConnection);

    // Ctrl+C cancels the running batch
    std::signal(SIGINT, handleInterrupt);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, &runner, [&runner]() {
        if (interruptRequested) {
            interruptRequested = 0;
            runner.cancel();
        }
    });
    interruptPoll.start(100);

    return app.exec();
}
