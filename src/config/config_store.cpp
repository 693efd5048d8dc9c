#include "config_store.h"
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStandardPaths>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

QJsonObject jsonObjectEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, const QJsonObject& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isObject() ? value.toObject() : fallback;
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

QMap<QString, QString> stringMap(const QJsonObject& obj)
{
    QMap<QString, QString> out;
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it)
        out.insert(it.key(), it.value().toString());
    return out;
}

QJsonObject stringMapToJson(const QMap<QString, QString>& map)
{
    QJsonObject out;
    for (auto it = map.constBegin(); it != map.constEnd(); ++it)
        out[it.key()] = it.value();
    return out;
}

} // namespace

QString workspaceChangeStrategyName(WorkspaceChangeStrategy strategy) {
    switch (strategy) {
    case WorkspaceChangeStrategy::Notify:  return QStringLiteral("notify");
    case WorkspaceChangeStrategy::Restart: return QStringLiteral("restart");
    case WorkspaceChangeStrategy::Auto:
    default:                               return QStringLiteral("auto");
    }
}

WorkspaceChangeStrategy workspaceChangeStrategyFromName(const QString& name) {
    const QString lower = name.trimmed().toLower();
    if (lower == QStringLiteral("notify"))
        return WorkspaceChangeStrategy::Notify;
    if (lower == QStringLiteral("restart"))
        return WorkspaceChangeStrategy::Restart;
    return WorkspaceChangeStrategy::Auto;
}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

BridgeConfig ConfigStore::fromJson(const QJsonObject& root) {
    BridgeConfig c;

    // server
    QJsonObject s = root["server"].toObject();
    c.server.command = jsonStringEither(s, "command", "command", c.server.command);
    if (s.contains(QStringLiteral("args"))) {
        c.server.args.clear();
        for (const auto& a : s["args"].toArray())
            c.server.args.append(a.toString());
    }
    c.server.env = stringMap(s["env"].toObject());
    c.server.initializationOptions = jsonObjectEither(s, "initialization_options", "initializationOptions",
                                                      c.server.initializationOptions);
    c.server.clientName = jsonStringEither(s, "client_name", "clientName", c.server.clientName);
    c.server.clientVersion = jsonStringEither(s, "client_version", "clientVersion", c.server.clientVersion);
    c.server.experimentalCapabilities = jsonObjectEither(s, "experimental_capabilities", "experimentalCapabilities",
                                                         c.server.experimentalCapabilities);
    const QJsonValue languageIds = jsonValueEither(s, "language_ids", "languageIds");
    if (languageIds.isObject())
        c.server.languageIds = stringMap(languageIds.toObject());
    c.server.spawnProbeMs = clampInt(jsonIntEither(s, "spawn_probe_ms", "spawnProbeMs", c.server.spawnProbeMs), 0, 10000);

    // readiness
    QJsonObject r = root["readiness"].toObject();
    c.readiness.method = jsonStringEither(r, "method", "method", c.readiness.method);
    c.readiness.match = jsonObjectEither(r, "match", "match", c.readiness.match);
    c.readiness.timeoutMs = clampInt(jsonIntEither(r, "timeout_ms", "timeoutMs", c.readiness.timeoutMs), 1, 3600000);

    // timeouts
    QJsonObject t = root["timeouts"].toObject();
    c.timeouts.queryMs = clampInt(jsonIntEither(t, "query_ms", "queryMs", c.timeouts.queryMs), 0, 3600000);
    c.timeouts.workspaceScanMs = clampInt(jsonIntEither(t, "workspace_scan_ms", "workspaceScanMs", c.timeouts.workspaceScanMs), 0, 3600000);
    c.timeouts.lifecycleMs = clampInt(jsonIntEither(t, "lifecycle_ms", "lifecycleMs", c.timeouts.lifecycleMs), 0, 3600000);
    const QJsonObject perMethod = jsonObjectEither(t, "per_method", "perMethod", {});
    for (auto it = perMethod.constBegin(); it != perMethod.constEnd(); ++it)
        c.timeouts.perMethod.insert(it.key(), clampInt(it.value().toInt(), 0, 3600000));

    // shutdown
    QJsonObject sd = root["shutdown"].toObject();
    c.shutdown.graceMs = clampInt(jsonIntEither(sd, "grace_ms", "graceMs", c.shutdown.graceMs), 0, 600000);

    // workspace
    QJsonObject w = root["workspace"].toObject();
    c.workspace.root = jsonStringEither(w, "root", "root", c.workspace.root);
    c.workspace.changeStrategy = workspaceChangeStrategyFromName(
        jsonStringEither(w, "change_strategy", "changeStrategy", QStringLiteral("auto")));

    // diagnostics
    QJsonObject d = root["diagnostics"].toObject();
    c.diagnostics.pushWaitMs = clampInt(jsonIntEither(d, "push_wait_ms", "pushWaitMs", c.diagnostics.pushWaitMs), 0, 600000);
    c.diagnostics.preferPull = jsonBoolEither(d, "prefer_pull", "preferPull", c.diagnostics.preferPull);

    // logging
    QJsonObject l = root["logging"].toObject();
    c.logging.dir = jsonStringEither(l, "dir", "dir", c.logging.dir);
    c.logging.debug = jsonBoolEither(l, "debug", "debug", c.logging.debug);

    return c;
}

QJsonObject ConfigStore::toJson(const BridgeConfig& c) {
    QJsonObject root;
    root["version"] = 1;

    QJsonObject s;
    s["command"] = c.server.command;
    s["args"] = QJsonArray::fromStringList(c.server.args);
    s["env"] = stringMapToJson(c.server.env);
    s["initialization_options"] = c.server.initializationOptions;
    s["client_name"] = c.server.clientName;
    s["client_version"] = c.server.clientVersion;
    s["experimental_capabilities"] = c.server.experimentalCapabilities;
    s["language_ids"] = stringMapToJson(c.server.languageIds);
    s["spawn_probe_ms"] = c.server.spawnProbeMs;
    root["server"] = s;

    QJsonObject r;
    r["method"] = c.readiness.method;
    r["match"] = c.readiness.match;
    r["timeout_ms"] = c.readiness.timeoutMs;
    root["readiness"] = r;

    QJsonObject t;
    t["query_ms"] = c.timeouts.queryMs;
    t["workspace_scan_ms"] = c.timeouts.workspaceScanMs;
    t["lifecycle_ms"] = c.timeouts.lifecycleMs;
    QJsonObject perMethod;
    for (auto it = c.timeouts.perMethod.constBegin(); it != c.timeouts.perMethod.constEnd(); ++it)
        perMethod[it.key()] = it.value();
    t["per_method"] = perMethod;
    root["timeouts"] = t;

    root["shutdown"] = QJsonObject{{"grace_ms", c.shutdown.graceMs}};
    root["workspace"] = QJsonObject{{"root", c.workspace.root},
                                    {"change_strategy", workspaceChangeStrategyName(c.workspace.changeStrategy)}};
    root["diagnostics"] = QJsonObject{{"push_wait_ms", c.diagnostics.pushWaitMs},
                                      {"prefer_pull", c.diagnostics.preferPull}};
    root["logging"] = QJsonObject{{"dir", c.logging.dir}, {"debug", c.logging.debug}};
    return root;
}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    m_lastError.clear();
    if (m_filePath.isEmpty()) {
        QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
        QDir().mkpath(configDir);
        m_filePath = configDir + "/lspbridge.json";
    }
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = file.errorString();
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_lastError = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QStringLiteral("top-level value is not an object");
        return false;
    }

    m_config = fromJson(doc.object());
    emit configChanged();
    return true;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson(m_config)).toJson(QJsonDocument::Indented));
    return true;
}

void ConfigStore::setConfig(const BridgeConfig& config) {
    m_config = config;
    emit configChanged();
}

void ConfigStore::setServerCommand(const QString& command, const QStringList& args) {
    m_config.server.command = command;
    m_config.server.args = args;
    emit configChanged();
}

void ConfigStore::setWorkspaceRoot(const QString& root) {
    m_config.workspace.root = root;
    emit configChanged();
}

void ConfigStore::setLogging(const QString& dir, bool debug) {
    m_config.logging.dir = dir;
    m_config.logging.debug = debug;
    emit configChanged();
}
