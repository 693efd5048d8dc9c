#pragma once
#include "config_types.h"
#include <QObject>

// JSON-file backed bridge configuration. Keys are written in snake_case
// and read in either snake_case or camelCase. Sections or keys missing
// from the file keep their defaults.
class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // Empty path selects <AppConfigLocation>/lspbridge.json. Returns false
    // when the file is missing or unreadable; defaults stay in place.
    bool load(const QString& path);
    bool save();

    QString filePath() const { return m_filePath; }
    QString lastError() const { return m_lastError; }

    const BridgeConfig& config() const { return m_config; }
    void setConfig(const BridgeConfig& config);

    void setServerCommand(const QString& command, const QStringList& args);
    void setWorkspaceRoot(const QString& root);
    void setLogging(const QString& dir, bool debug);

    static BridgeConfig fromJson(const QJsonObject& root);
    static QJsonObject toJson(const BridgeConfig& config);

signals:
    void configChanged();

private:
    BridgeConfig m_config;
    QString m_filePath;
    QString m_lastError;
};
