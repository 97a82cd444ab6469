#include <atomic>
#include <csignal>
#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "report/ConflictReport.h"
#include "scan/ScanController.h"
#include "settings/AppSettings.h"

namespace {

constexpr int kExitCompleted = 0;
constexpr int kExitInvalidArguments = 1;
constexpr int kExitCancelled = 2;
constexpr int kInterruptPollMs = 50;

std::atomic<bool> g_interruptRequested{false};

void handleInterrupt(int) { g_interruptRequested.store(true, std::memory_order_relaxed); }

struct CommandLine {
    QString root;
    keyclash::ScanOptions options;
    QString suggestionPath;
    bool jsonOutput = false;
    bool saveDefaults = false;
};

bool parseCommandLine(const QCoreApplication& app, CommandLine* out) {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Finds resource keys defined by more than one .package container."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("root"),
                                 QStringLiteral("Mods directory to scan."));

    const QCommandLineOption fastOption(
        QStringLiteral("fast"), QStringLiteral("Skip the tail-scan fallback for unreadable indexes."));
    const QCommandLineOption noRecursiveOption(
        QStringLiteral("no-recursive"), QStringLiteral("Only scan the top-level directory."));
    const QCommandLineOption inventoryOption(
        QStringLiteral("inventory"),
        QStringLiteral("Use a JSON inventory snapshot instead of walking the tree."),
        QStringLiteral("file"));
    const QCommandLineOption cacheOption(QStringLiteral("cache"),
                                         QStringLiteral("Parse cache file."),
                                         QStringLiteral("file"));
    const QCommandLineOption noCacheOption(QStringLiteral("no-cache"),
                                           QStringLiteral("Disable the parse cache."));
    const QCommandLineOption workersOption(
        QStringLiteral("workers"), QStringLiteral("Parser thread count (0 = automatic)."),
        QStringLiteral("n"));
    const QCommandLineOption jsonOption(QStringLiteral("json"),
                                        QStringLiteral("Print the report as JSON."));
    const QCommandLineOption suggestOrderOption(
        QStringLiteral("suggest-order"),
        QStringLiteral("Write a load-order suggestion built from the conflicts."),
        QStringLiteral("file"));
    const QCommandLineOption saveDefaultsOption(
        QStringLiteral("save-defaults"),
        QStringLiteral("Store the effective scan options as the new defaults."));
    parser.addOptions({fastOption, noRecursiveOption, inventoryOption, cacheOption,
                       noCacheOption, workersOption, jsonOption, suggestOrderOption,
                       saveDefaultsOption});

    if (!parser.parse(app.arguments())) {
        std::cerr << "[cli][error] " << parser.errorText().toStdString() << '\n';
        return false;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        parser.showHelp(kExitCompleted);
    }
    if (parser.isSet(QStringLiteral("version"))) {
        parser.showVersion();
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        std::cerr << "[cli][error] expected exactly one scan root\n";
        return false;
    }

    keyclash::ScanOptions options = keyclash::AppSettings::scanOptions();
    if (parser.isSet(fastOption)) {
        options.fastMode = true;
    }
    if (parser.isSet(noRecursiveOption)) {
        options.recursive = false;
    }
    if (parser.isSet(inventoryOption)) {
        options.useInventorySnapshot = true;
        options.inventorySnapshotPath = parser.value(inventoryOption);
    }
    if (parser.isSet(cacheOption)) {
        options.cachePath = parser.value(cacheOption);
    }
    if (parser.isSet(noCacheOption)) {
        options.cachePath.clear();
    }
    if (parser.isSet(workersOption)) {
        bool ok = false;
        const int workers = parser.value(workersOption).toInt(&ok);
        if (!ok || workers < 0) {
            std::cerr << "[cli][error] --workers expects a non-negative integer\n";
            return false;
        }
        options.workerCount = workers;
    }

    out->root = positional.first();
    out->options = options;
    out->suggestionPath = parser.value(suggestOrderOption);
    out->jsonOutput = parser.isSet(jsonOption);
    out->saveDefaults = parser.isSet(saveDefaultsOption);
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("keyclash"));
    QCoreApplication::setApplicationName(QStringLiteral("keyclash"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    CommandLine commandLine;
    if (!parseCommandLine(app, &commandLine)) {
        return kExitInvalidArguments;
    }
    if (commandLine.saveDefaults) {
        keyclash::AppSettings::storeScanOptions(commandLine.options);
    }

    keyclash::ScanController controller;
    QObject::connect(&controller, &keyclash::ScanController::scanError,
                     [](const QString& message) {
                         std::cerr << "[cli][error] " << message.toStdString() << '\n';
                     });
    QObject::connect(&controller, &keyclash::ScanController::progressUpdated,
                     [](int processed, int total) {
                         std::cerr << "[cli] progress " << processed << '/' << total << '\n';
                     });
    QObject::connect(&controller, &keyclash::ScanController::scanFinished, &app,
                     [&app](bool cancelled) {
                         app.exit(cancelled ? kExitCancelled : kExitCompleted);
                     });

    if (std::signal(SIGINT, handleInterrupt) == SIG_ERR) {
        std::cerr << "[cli][warn] could not install SIGINT handler, Ctrl+C will not stop cleanly\n";
    }
    QTimer interruptPoll;
    interruptPoll.setInterval(kInterruptPollMs);
    QObject::connect(&interruptPoll, &QTimer::timeout, &controller, [&controller]() {
        if (g_interruptRequested.exchange(false, std::memory_order_relaxed)) {
            std::cerr << "[cli] interrupt received, stopping scan\n";
            controller.requestStop();
        }
    });
    interruptPoll.start();

    controller.startScan(commandLine.root, commandLine.options);
    if (!controller.isRunning()) {
        return kExitInvalidArguments;
    }

    const int exitCode = app.exec();
    interruptPoll.stop();

    const keyclash::ScanReport& report = controller.lastReport();
    if (!commandLine.suggestionPath.isEmpty() && !report.stats.cancelled) {
        if (report.records.isEmpty()) {
            std::cerr << "[cli] no conflicts, load order suggestion not written\n";
        } else {
            QString error;
            if (keyclash::ConflictReport::saveLoadOrderSuggestion(
                    report.records, commandLine.root, commandLine.suggestionPath, &error)) {
                std::cerr << "[cli] load order suggestion saved: "
                          << commandLine.suggestionPath.toStdString() << '\n';
            } else {
                std::cerr << "[cli][error] load order suggestion not saved: path="
                          << commandLine.suggestionPath.toStdString()
                          << " reason=" << error.toStdString() << '\n';
            }
        }
    }
    if (commandLine.jsonOutput) {
        std::cout << keyclash::ConflictReport::toJson(report).toStdString();
    } else {
        std::cout << keyclash::ConflictReport::toText(report).toStdString() << '\n';
    }
    std::cout.flush();
    return exitCode;
}
