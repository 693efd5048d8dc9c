#pragma once
#include "config/config_types.h"
#include "rpc/pending_call.h"
#include "protocol/ports.h"
#include <QObject>
#include <QJsonObject>
#include <QPointer>
#include <QTimer>
#include <functional>
#include <memory>
#include <optional>

class ProcessSupervisor;
class MessageChannel;
class RequestCorrelator;
class NotificationRouter;
class DiagnosticsCache;
class Subscription;

// The one session object of a bridge: owns the backend process, the message
// channel, the pending-request table, the notification router and the
// diagnostics cache, and is the single authority on SessionState.
//
//   Uninitialized --start()--> Initializing --response + readiness--> Ready
//   Ready --shutdown()--> ShuttingDown --exit--> Terminated
//   Ready --rehandshake()--> Initializing        (workspace root change)
//   any --framing error / unexpected exit--> Terminated
//
// Per-session state (pending requests, subscriptions, cached diagnostics)
// is cleared on every transition into Terminated and on re-handshake.
class BridgeSession : public QObject {
    Q_OBJECT
public:
    explicit BridgeSession(const BridgeConfig& config, QObject* parent = nullptr);
    ~BridgeSession() override;

    const BridgeConfig& config() const { return m_config; }
    SessionState state() const { return m_state; }

    // Workspace root passed on the next handshake (rootUri, workspaceFolders
    // and the backend's working directory). Empty means no workspace.
    void setRootPath(const QString& path) { m_rootPath = path; }
    QString rootPath() const { return m_rootPath; }

    // Spawns the backend and runs the handshake. Resolves with the server
    // capabilities once Ready, or with the failure that ended start-up:
    // SpawnError, BackendCrashed, Timeout (readiness.timeout_ms) or the
    // backend's error response to initialize.
    PendingCall* start();

    // Replaces the backend process with a fresh one and repeats the
    // handshake. Only valid while Ready.
    PendingCall* rehandshake();

    // Drains pending requests with SessionTerminated, asks the backend to
    // shut down and exit, and terminates the process after graceMs.
    // graceMs < 0 uses shutdown.grace_ms. Resolves with null once Terminated.
    PendingCall* shutdown(int graceMs = -1);

    // Success only while Ready.
    VoidResult requireReady() const;

    // Gated by requireReady(). The caller owns the returned call.
    PendingCall* request(const QString& method, const QJsonValue& params, int timeoutMs = -1);
    VoidResult notify(const QString& method, const QJsonValue& params);

    const QJsonObject& serverCapabilities() const { return m_serverCapabilities; }
    const QJsonObject& serverInfo() const { return m_serverInfo; }
    // True when the capability at dottedPath is present and not false.
    bool serverSupports(const QString& dottedPath) const;

    // Set once the session is Terminated.
    std::optional<BridgeFailure> terminationReason() const { return m_terminationReason; }

    ProcessSupervisor* supervisor() const { return m_supervisor; }
    RequestCorrelator* correlator() const { return m_correlator; }
    NotificationRouter* router() const { return m_router; }
    DiagnosticsCache* diagnostics() const { return m_diagnostics; }

    QJsonObject initializeParams() const;
    static QJsonObject clientCapabilities(const QJsonObject& experimental);

signals:
    void stateChanged(SessionState state, SessionState previous);
    void ready();
    void terminated(const BridgeFailure& reason);
    // Per-session state was dropped (new backend process or termination).
    void sessionReset();

private slots:
    void onBackendExited(int exitCode, bool crashed, bool expected);
    void onFramingError(const BridgeFailure& failure);
    void onServerRequest(const RpcRequest& request);

private:
    BridgeConfig m_config;
    std::unique_ptr<IReadinessProbe> m_probe;
    QString m_rootPath;

    ProcessSupervisor* m_supervisor;
    MessageChannel* m_channel;
    RequestCorrelator* m_correlator;
    DiagnosticsCache* m_diagnostics;
    NotificationRouter* m_router;

    SessionState m_state = SessionState::Uninitialized;
    std::optional<BridgeFailure> m_terminationReason;
    bool m_crashed = false;
    bool m_replacingBackend = false;

    QJsonObject m_serverCapabilities;
    QJsonObject m_serverInfo;

    // Handshake bookkeeping.
    QPointer<PendingCall> m_startup;
    QPointer<PendingCall> m_initializeCall;
    std::unique_ptr<Subscription> m_readiness;
    QTimer m_startupTimer;
    bool m_handshakeDone = false;
    bool m_readinessSeen = false;

    void setState(SessionState state);
    quint64 m_generation = 0;

    void beginHandshake(PendingCall* startup);
    void onInitializeFinished(const Result<QJsonValue>& result);
    void onReadinessSignal();
    void maybeReady();
    void failStartup(const BridgeFailure& failure);
    void resetSessionState(const BridgeFailure& failure);
    void enterTerminated(const BridgeFailure& reason);
    // shutdown request + exit notification + terminate, then done().
    void stopBackend(int graceMs, std::function<void()> done);
};
