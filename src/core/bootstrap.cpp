#include "bootstrap.h"
#include "log_manager.h"
#include "config/config_store.h"
#include "session/bridge_session.h"
#include "session/workspace_manager.h"
#include "capability/capability_adapter.h"
#include "transport/process_supervisor.h"

Bootstrap::Bootstrap(QObject* parent)
    : QObject(parent)
{
}

Bootstrap::~Bootstrap()
{
    teardown();
}

bool Bootstrap::isBridgeRunning() const {
    return m_session && m_session->state() == SessionState::Ready;
}

void Bootstrap::teardown() {
    delete m_capabilities;
    m_capabilities = nullptr;
    delete m_workspace;
    m_workspace = nullptr;
    delete m_session;
    m_session = nullptr;
}

void Bootstrap::startAll() {
    LOG_INFO(QStringLiteral("========== starting bridge =========="));

    if (!m_config) {
        emit stepProgress("init", false, "no configuration");
        emit bridgeStatusChanged(false);
        return;
    }
    if (m_session) {
        emit stepProgress("init", false, "bridge already started");
        return;
    }

    const BridgeConfig config = m_config->config();
    if (!config.isValid()) {
        emit stepProgress("validate", false, "server.command is empty or readiness.timeout_ms is not positive");
        emit bridgeStatusChanged(false);
        return;
    }

    const QString program = ProcessSupervisor::resolveExecutable(config.server.command);
    if (program.isEmpty()) {
        emit stepProgress("validate", false, QStringLiteral("backend executable not found: %1").arg(config.server.command));
        emit bridgeStatusChanged(false);
        return;
    }
    LOG_INFO(QStringLiteral("[1/3] backend: %1").arg(program));
    emit stepProgress("validate", true, program);

    m_session = new BridgeSession(config, this);
    m_workspace = new WorkspaceManager(m_session, config.workspace.changeStrategy, this);
    m_capabilities = new CapabilityAdapter(m_session, m_workspace, this);

    if (!config.workspace.root.isEmpty()) {
        LOG_INFO(QStringLiteral("[2/3] workspace: %1").arg(config.workspace.root));
        PendingCall* set = m_workspace->setWorkspace(config.workspace.root);
        const Result<QJsonValue> outcome = set->result();
        delete set;
        if (!outcome) {
            emit stepProgress("workspace", false, outcome.error().message);
            teardown();
            emit bridgeStatusChanged(false);
            return;
        }
        emit stepProgress("workspace", true, config.workspace.root);
    } else {
        LOG_INFO(QStringLiteral("[2/3] no workspace root configured"));
    }

    LOG_INFO(QStringLiteral("[3/3] handshake..."));
    emit stepProgress("backend_start", true, "waiting for the backend to become ready...");

    connect(m_session, &BridgeSession::terminated, this, [this](const BridgeFailure& reason) {
        if (!m_stopping)
            LOG_ERROR(QStringLiteral("bridge terminated: %1").arg(reason.message));
        emit bridgeStatusChanged(false);
    });

    m_startup = m_session->start();
    m_startup->then(this, [this, call = m_startup.data()](const Result<QJsonValue>& result) {
        call->deleteLater();
        if (!result) {
            emit stepProgress("backend_start", false,
                              QStringLiteral("%1: %2").arg(errorKindName(result.error().kind), result.error().message));
            return;
        }
        emit stepProgress("backend_start", true, "backend is ready");
        LOG_INFO(QStringLiteral("========== bridge ready =========="));
        emit bridgeStatusChanged(true);
    });
}

void Bootstrap::stopAll() {
    if (!m_session || m_stopping) {
        if (!m_session)
            emit stopped();
        return;
    }
    m_stopping = true;
    LOG_INFO(QStringLiteral("========== stopping bridge =========="));

    PendingCall* done = m_session->shutdown();
    done->then(this, [this, done](const Result<QJsonValue>&) {
        done->deleteLater();
        LOG_INFO(QStringLiteral("========== bridge stopped =========="));
        m_stopping = false;
        emit stopped();
    });
}
