#pragma once
#include <QObject>
#include <QPointer>

class ConfigStore;
class BridgeSession;
class WorkspaceManager;
class CapabilityAdapter;
class PendingCall;

// Builds the bridge from the configuration and drives its start-up and
// shutdown, reporting each step through stepProgress().
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(QObject* parent = nullptr);
    ~Bootstrap() override;

    void setConfig(ConfigStore* config) { m_config = config; }

    void startAll();
    void stopAll();

    bool isBridgeRunning() const;

    BridgeSession* session() const { return m_session; }
    WorkspaceManager* workspace() const { return m_workspace; }
    CapabilityAdapter* capabilities() const { return m_capabilities; }

signals:
    void stepProgress(const QString& step, bool success, const QString& message);
    void bridgeStatusChanged(bool running);
    void stopped();

private:
    ConfigStore* m_config = nullptr;
    BridgeSession* m_session = nullptr;
    WorkspaceManager* m_workspace = nullptr;
    CapabilityAdapter* m_capabilities = nullptr;
    QPointer<PendingCall> m_startup;
    bool m_stopping = false;

    void teardown();
};
