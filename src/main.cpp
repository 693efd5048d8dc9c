#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTimer>
#include <cstdio>
#include <unistd.h>

#include "config/config_store.h"
#include "core/log_manager.h"
#include "core/bootstrap.h"
#include "capability/capability_adapter.h"
#include "frontend/stdio_frontend.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("lspbridge"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    app.setOrganizationName(QStringLiteral("lspbridge"));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Drives a language server and serves capability calls as JSON lines on stdin/stdout."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt(QStringList{"c", "config"}, QStringLiteral("Configuration file."), QStringLiteral("path"));
    QCommandLineOption serverOpt(QStringList{"s", "server"}, QStringLiteral("Backend executable (overrides server.command)."), QStringLiteral("command"));
    QCommandLineOption serverArgOpt(QStringLiteral("server-arg"), QStringLiteral("Backend argument; repeatable."), QStringLiteral("arg"));
    QCommandLineOption workspaceOpt(QStringList{"w", "workspace"}, QStringLiteral("Workspace root."), QStringLiteral("path"));
    QCommandLineOption logDirOpt(QStringLiteral("log-dir"), QStringLiteral("Directory for lspbridge.log."), QStringLiteral("dir"));
    QCommandLineOption debugOpt(QStringLiteral("debug"), QStringLiteral("Log protocol traffic."));
    QCommandLineOption listOpt(QStringLiteral("list-capabilities"), QStringLiteral("Print the capability names and exit."));
    parser.addOptions({configOpt, serverOpt, serverArgOpt, workspaceOpt, logDirOpt, debugOpt, listOpt});
    parser.process(app);

    if (parser.isSet(listOpt)) {
        for (const QString& name : CapabilityAdapter::capabilityNames())
            std::printf("%s\n", qPrintable(name));
        return 0;
    }

    // --- 2. Config ---
    ConfigStore configStore;
    const QString configPath = parser.value(configOpt);
    if (!configStore.load(configPath)) {
        if (!QFileInfo::exists(configStore.filePath())) {
            configStore.save();
        } else {
            std::fprintf(stderr, "lspbridge: cannot load %s: %s\n",
                         qPrintable(configStore.filePath()), qPrintable(configStore.lastError()));
            return 2;
        }
    }

    if (parser.isSet(serverOpt))
        configStore.setServerCommand(parser.value(serverOpt), parser.values(serverArgOpt));
    if (parser.isSet(workspaceOpt))
        configStore.setWorkspaceRoot(QDir(parser.value(workspaceOpt)).absolutePath());

    BridgeConfig config = configStore.config();
    const QString logDir = parser.isSet(logDirOpt) ? parser.value(logDirOpt) : config.logging.dir;
    const bool debug = parser.isSet(debugOpt) || config.logging.debug;
    configStore.setLogging(logDir, debug);

    // --- 3. Log ---
    // stdout carries responses; logs go to stderr and the optional file.
    LogManager::instance().setStderrEnabled(true);
    LogManager::instance().setMinimumLevel(debug ? LogManager::Debug : LogManager::Info);
    if (!logDir.isEmpty()) {
        QDir().mkpath(logDir);
        LogManager::instance().initialize(logDir);
    }
    LOG_INFO(QStringLiteral("lspbridge %1 (config %2)").arg(app.applicationVersion(), configStore.filePath()));

    // --- 4. Bridge ---
    Bootstrap bootstrap(&app);
    bootstrap.setConfig(&configStore);

    QObject::connect(&bootstrap, &Bootstrap::stepProgress, &app,
                     [](const QString& step, bool success, const QString& message) {
        if (success)
            LOG_INFO(QStringLiteral("[%1] %2").arg(step, message));
        else
            LOG_ERROR(QStringLiteral("[%1] failed: %2").arg(step, message));
    });

    StdioFrontend* frontend = nullptr;
    int exitCode = 0;
    QObject::connect(&bootstrap, &Bootstrap::bridgeStatusChanged, &app, [&](bool running) {
        if (running) {
            if (!frontend) {
                frontend = new StdioFrontend(bootstrap.capabilities(), STDIN_FILENO, stdout, &app);
                QObject::connect(frontend, &StdioFrontend::finished, &bootstrap, &Bootstrap::stopAll);
                frontend->start();
            }
            return;
        }
        if (!frontend) {
            // never became ready
            exitCode = 1;
            bootstrap.stopAll();
        }
    });
    QObject::connect(&bootstrap, &Bootstrap::stopped, &app, [&]() {
        app.exit(exitCode);
    });

    QTimer::singleShot(0, &bootstrap, &Bootstrap::startAll);
    return app.exec();
}
