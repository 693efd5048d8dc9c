#pragma once
#include "protocol/timeout_policy.h"
#include "protocol/types.h"
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>

inline QJsonObject defaultInitializationOptions() {
    return QJsonObject{
        {"cargo", QJsonObject{{"buildScripts", QJsonObject{{"enable", true}}}}},
        {"checkOnSave", QJsonObject{{"enable", true}, {"command", "check"}, {"allTargets", true}}},
        {"diagnostics", QJsonObject{{"enable", true}, {"experimental", QJsonObject{{"enable", false}}}}},
        {"procMacro", QJsonObject{{"enable", true}}}
    };
}

struct ServerConfig {
    QString command = "rust-analyzer";
    QStringList args;
    QMap<QString, QString> env;
    QJsonObject initializationOptions = defaultInitializationOptions();
    QString clientName = "lspbridge";
    QString clientVersion = "0.1.0";
    QJsonObject experimentalCapabilities{{"serverStatusNotification", true}};
    QMap<QString, QString> languageIds{{"rs", "rust"}};   // file extension -> languageId
    int spawnProbeMs = 50;
};

struct ReadinessConfig {
    QString method = "experimental/serverStatus";   // empty = handshake-only
    QJsonObject match{{"quiescent", true}};
    int timeoutMs = 120000;
};

struct ShutdownConfig {
    int graceMs = 3000;
};

struct WorkspaceConfig {
    QString root;
    WorkspaceChangeStrategy changeStrategy = WorkspaceChangeStrategy::Auto;
};

struct DiagnosticsConfig {
    int pushWaitMs = 1000;
    bool preferPull = true;
};

struct LoggingConfig {
    QString dir;
    bool debug = false;
};

struct BridgeConfig {
    ServerConfig server;
    ReadinessConfig readiness;
    TimeoutPolicy timeouts;
    ShutdownConfig shutdown;
    WorkspaceConfig workspace;
    DiagnosticsConfig diagnostics;
    LoggingConfig logging;

    bool isValid() const {
        return !server.command.isEmpty() && readiness.timeoutMs > 0;
    }
};

QString workspaceChangeStrategyName(WorkspaceChangeStrategy strategy);
WorkspaceChangeStrategy workspaceChangeStrategyFromName(const QString& name);
