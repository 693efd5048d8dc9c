#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "config/config_store.h"
#include "config/config_types.h"

class TestConfigStore : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsTargetRustAnalyzer() {
        const BridgeConfig c;
        QCOMPARE(c.server.command, QStringLiteral("rust-analyzer"));
        QCOMPARE(c.readiness.method, QStringLiteral("experimental/serverStatus"));
        QVERIFY(c.readiness.match["quiescent"].toBool());
        QVERIFY(c.server.initializationOptions["procMacro"].toObject()["enable"].toBool());
        QCOMPARE(c.server.initializationOptions["checkOnSave"].toObject()["command"].toString(), QStringLiteral("check"));
        QCOMPARE(c.workspace.changeStrategy, WorkspaceChangeStrategy::Auto);
        QVERIFY(c.isValid());
    }

    void testLoadMissingFileKeepsDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/lspbridge.json");

        ConfigStore store;
        QVERIFY(!store.load(path));
        QVERIFY(!store.lastError().isEmpty());
        QCOMPARE(store.filePath(), path);
        QCOMPARE(store.config().server.command, QStringLiteral("rust-analyzer"));
    }

    void testSaveAndReload() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/lspbridge.json");

        ConfigStore store;
        store.load(path);
        store.setServerCommand(QStringLiteral("/opt/ra/rust-analyzer"), {QStringLiteral("--log-file"), QStringLiteral("/tmp/ra.log")});
        store.setWorkspaceRoot(QStringLiteral("/home/me/project"));
        store.setLogging(QStringLiteral("/tmp/logs"), true);
        BridgeConfig c = store.config();
        c.timeouts.perMethod.insert(QStringLiteral("textDocument/formatting"), 5000);
        c.workspace.changeStrategy = WorkspaceChangeStrategy::Restart;
        c.server.env.insert(QStringLiteral("RA_LOG"), QStringLiteral("info"));
        store.setConfig(c);
        QVERIFY(store.save());

        ConfigStore reloaded;
        QVERIFY(reloaded.load(path));
        const BridgeConfig& r = reloaded.config();
        QCOMPARE(r.server.command, QStringLiteral("/opt/ra/rust-analyzer"));
        QCOMPARE(r.server.args, QStringList({QStringLiteral("--log-file"), QStringLiteral("/tmp/ra.log")}));
        QCOMPARE(r.server.env.value(QStringLiteral("RA_LOG")), QStringLiteral("info"));
        QCOMPARE(r.workspace.root, QStringLiteral("/home/me/project"));
        QCOMPARE(r.workspace.changeStrategy, WorkspaceChangeStrategy::Restart);
        QCOMPARE(r.timeouts.perMethod.value(QStringLiteral("textDocument/formatting")), 5000);
        QCOMPARE(r.logging.dir, QStringLiteral("/tmp/logs"));
        QVERIFY(r.logging.debug);
    }

    void testSavedKeysAreSnakeCase() {
        const QJsonObject json = ConfigStore::toJson(BridgeConfig());
        QVERIFY(json["readiness"].toObject().contains(QStringLiteral("timeout_ms")));
        QVERIFY(json["server"].toObject().contains(QStringLiteral("initialization_options")));
        QVERIFY(json["diagnostics"].toObject().contains(QStringLiteral("push_wait_ms")));
        QCOMPARE(json["workspace"].toObject()["change_strategy"].toString(), QStringLiteral("auto"));
    }

    void testCamelCaseKeysAccepted() {
        QJsonObject root;
        root["server"] = QJsonObject{{"command", "clangd"},
                                     {"initializationOptions", QJsonObject{{"fallbackFlags", QJsonArray{"-std=c++23"}}}},
                                     {"languageIds", QJsonObject{{"cpp", "cpp"}, {"h", "cpp"}}}};
        root["readiness"] = QJsonObject{{"method", ""}, {"timeoutMs", 2500}};
        root["timeouts"] = QJsonObject{{"queryMs", 1500}, {"workspaceScanMs", 9000}};
        root["diagnostics"] = QJsonObject{{"pushWaitMs", 250}, {"preferPull", false}};
        root["workspace"] = QJsonObject{{"changeStrategy", "notify"}};

        const BridgeConfig c = ConfigStore::fromJson(root);
        QCOMPARE(c.server.command, QStringLiteral("clangd"));
        QVERIFY(c.server.initializationOptions.contains(QStringLiteral("fallbackFlags")));
        QCOMPARE(c.server.languageIds.value(QStringLiteral("h")), QStringLiteral("cpp"));
        QVERIFY(c.readiness.method.isEmpty());
        QCOMPARE(c.readiness.timeoutMs, 2500);
        QCOMPARE(c.timeouts.queryMs, 1500);
        QCOMPARE(c.timeouts.workspaceScanMs, 9000);
        QCOMPARE(c.timeouts.lifecycleMs, 60000);
        QCOMPARE(c.diagnostics.pushWaitMs, 250);
        QVERIFY(!c.diagnostics.preferPull);
        QCOMPARE(c.workspace.changeStrategy, WorkspaceChangeStrategy::Notify);
    }

    void testSnakeCaseWinsOverCamelCase() {
        QJsonObject root;
        root["readiness"] = QJsonObject{{"timeout_ms", 100}, {"timeoutMs", 900}};
        QCOMPARE(ConfigStore::fromJson(root).readiness.timeoutMs, 100);
    }

    void testValuesAreClamped() {
        QJsonObject root;
        root["readiness"] = QJsonObject{{"timeout_ms", 0}};
        root["timeouts"] = QJsonObject{{"query_ms", -10}};
        root["server"] = QJsonObject{{"spawn_probe_ms", 999999}};
        const BridgeConfig c = ConfigStore::fromJson(root);
        QCOMPARE(c.readiness.timeoutMs, 1);
        QCOMPARE(c.timeouts.queryMs, 0);
        QCOMPARE(c.server.spawnProbeMs, 10000);
    }

    void testUnknownStrategyFallsBackToAuto() {
        QCOMPARE(workspaceChangeStrategyFromName(QStringLiteral("Sideways")), WorkspaceChangeStrategy::Auto);
        QCOMPARE(workspaceChangeStrategyFromName(QStringLiteral(" RESTART ")), WorkspaceChangeStrategy::Restart);
        QCOMPARE(workspaceChangeStrategyName(WorkspaceChangeStrategy::Notify), QStringLiteral("notify"));
    }

    void testInvalidJsonReportsError() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/broken.json");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ \"server\": ");
        file.close();

        ConfigStore store;
        QVERIFY(!store.load(path));
        QVERIFY(!store.lastError().isEmpty());
        QCOMPARE(store.config().server.command, QStringLiteral("rust-analyzer"));
    }

    void testChangeSignal() {
        ConfigStore store;
        QSignalSpy spy(&store, &ConfigStore::configChanged);
        store.setWorkspaceRoot(QStringLiteral("/x"));
        store.setLogging(QString(), false);
        QCOMPARE(spy.count(), 2);
    }

    void testEmptyCommandIsInvalid() {
        BridgeConfig c;
        c.server.command.clear();
        QVERIFY(!c.isValid());
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
