#include "bridge_session.h"
#include "readiness_probe.h"
#include "diagnostics_cache.h"
#include "transport/process_supervisor.h"
#include "transport/message_channel.h"
#include "rpc/request_correlator.h"
#include "rpc/notification_router.h"
#include "rpc/subscription.h"
#include "protocol/uri.h"
#include "core/log_manager.h"
#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonArray>

BridgeSession::BridgeSession(const BridgeConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    if (m_config.readiness.method.isEmpty())
        m_probe = std::make_unique<HandshakeOnlyProbe>();
    else
        m_probe = std::make_unique<NotificationReadinessProbe>(m_config.readiness.method, m_config.readiness.match);

    m_supervisor = new ProcessSupervisor(this);
    m_channel = new MessageChannel(m_supervisor, this);
    m_correlator = new RequestCorrelator(m_channel, this);
    m_diagnostics = new DiagnosticsCache(this);
    m_router = new NotificationRouter(m_diagnostics, this);

    m_correlator->setTimeoutPolicy(m_config.timeouts);
    m_router->setInitializationOptions(m_config.server.initializationOptions);

    connect(m_channel, &MessageChannel::responseReceived, this, [this](const RpcResponse& response) {
        m_correlator->complete(response);
    });
    connect(m_channel, &MessageChannel::notificationReceived, m_router, &NotificationRouter::dispatch);
    connect(m_channel, &MessageChannel::requestReceived, this, &BridgeSession::onServerRequest);
    connect(m_channel, &MessageChannel::framingError, this, &BridgeSession::onFramingError);
    connect(m_supervisor, &ProcessSupervisor::exited, this, &BridgeSession::onBackendExited);

    m_startupTimer.setSingleShot(true);
    connect(&m_startupTimer, &QTimer::timeout, this, [this]() {
        failStartup(BridgeFailure::timeout(
            QStringLiteral("backend did not become ready within %1 ms").arg(m_config.readiness.timeoutMs)));
    });
}

BridgeSession::~BridgeSession()
{
    disconnect(m_supervisor, nullptr, this, nullptr);
    m_startupTimer.stop();
    if (m_supervisor->isAlive())
        m_supervisor->terminate(0);
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

void BridgeSession::setState(SessionState state) {
    if (m_state == state)
        return;
    const SessionState previous = m_state;
    m_state = state;
    LOG_CAT_INFO("session", QStringLiteral("%1 -> %2")
                                .arg(sessionStateName(previous), sessionStateName(state)));
    emit stateChanged(state, previous);
}

VoidResult BridgeSession::requireReady() const {
    switch (m_state) {
    case SessionState::Ready:
        return {};
    case SessionState::Uninitialized:
        return std::unexpected(BridgeFailure::sessionNotReady(QStringLiteral("session has not been started")));
    case SessionState::Initializing:
        return std::unexpected(BridgeFailure::sessionNotReady(QStringLiteral("backend is still initializing")));
    case SessionState::ShuttingDown:
        return std::unexpected(BridgeFailure::sessionNotReady(QStringLiteral("session is shutting down")));
    case SessionState::Terminated:
    default:
        break;
    }

    const QString reason = m_terminationReason ? m_terminationReason->message : QStringLiteral("session ended");
    if (m_crashed)
        return std::unexpected(BridgeFailure::backendCrashed(reason));
    return std::unexpected(BridgeFailure::sessionTerminated(reason));
}

bool BridgeSession::serverSupports(const QString& dottedPath) const {
    QJsonValue current = m_serverCapabilities;
    for (const QString& part : dottedPath.split(QLatin1Char('.'))) {
        if (!current.isObject())
            return false;
        current = current.toObject().value(part);
    }
    if (current.isUndefined() || current.isNull())
        return false;
    if (current.isBool())
        return current.toBool();
    return true;
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------

PendingCall* BridgeSession::request(const QString& method, const QJsonValue& params, int timeoutMs) {
    auto ready = requireReady();
    if (!ready)
        return PendingCall::failed(ready.error(), method);
    return m_correlator->send(method, params, timeoutMs);
}

VoidResult BridgeSession::notify(const QString& method, const QJsonValue& params) {
    auto ready = requireReady();
    if (!ready)
        return ready;
    return m_correlator->notify(method, params);
}

void BridgeSession::onServerRequest(const RpcRequest& request) {
    const RpcResponse response = m_router->handleServerRequest(request);
    auto written = m_channel->write(response);
    if (!written) {
        LOG_CAT_WARNING("session", QStringLiteral("could not answer %1: %2")
                                       .arg(request.method, written.error().message));
    }
}

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------

QJsonObject BridgeSession::clientCapabilities(const QJsonObject& experimental) {
    const QJsonObject noDynamic{{"dynamicRegistration", false}};

    QJsonObject textDocument;
    textDocument["synchronization"] = QJsonObject{{"dynamicRegistration", false}, {"didSave", false}};
    textDocument["hover"] = QJsonObject{{"dynamicRegistration", false},
                                        {"contentFormat", QJsonArray{"markdown", "plaintext"}}};
    textDocument["completion"] = QJsonObject{{"dynamicRegistration", false},
                                             {"completionItem", QJsonObject{{"snippetSupport", false}}}};
    textDocument["definition"] = QJsonObject{{"dynamicRegistration", false}, {"linkSupport", false}};
    textDocument["references"] = noDynamic;
    textDocument["documentSymbol"] = QJsonObject{{"dynamicRegistration", false},
                                                 {"hierarchicalDocumentSymbolSupport", true}};
    textDocument["formatting"] = noDynamic;
    textDocument["codeAction"] = QJsonObject{{"dynamicRegistration", false},
                                             {"isPreferredSupport", false},
                                             {"disabledSupport", false},
                                             {"dataSupport", false},
                                             {"honorsChangeAnnotations", false}};
    textDocument["publishDiagnostics"] = QJsonObject{{"relatedInformation", true},
                                                     {"versionSupport", false},
                                                     {"codeDescriptionSupport", false},
                                                     {"dataSupport", false}};
    textDocument["diagnostic"] = QJsonObject{{"dynamicRegistration", false},
                                             {"relatedDocumentSupport", false}};

    QJsonObject workspace;
    workspace["workspaceFolders"] = true;
    workspace["configuration"] = true;
    workspace["didChangeConfiguration"] = noDynamic;
    workspace["symbol"] = noDynamic;

    QJsonObject caps;
    caps["textDocument"] = textDocument;
    caps["workspace"] = workspace;
    caps["window"] = QJsonObject{{"workDoneProgress", true}};
    caps["experimental"] = experimental;
    return caps;
}

QJsonObject BridgeSession::initializeParams() const {
    QJsonObject params;
    params["processId"] = QCoreApplication::applicationPid();
    params["clientInfo"] = QJsonObject{{"name", m_config.server.clientName},
                                       {"version", m_config.server.clientVersion}};

    if (m_rootPath.isEmpty()) {
        params["rootUri"] = QJsonValue::Null;
        params["workspaceFolders"] = QJsonValue::Null;
    } else {
        const QString uri = DocumentUri::fromPath(m_rootPath);
        params["rootUri"] = uri;
        params["rootPath"] = m_rootPath;
        params["workspaceFolders"] = QJsonArray{
            QJsonObject{{"uri", uri}, {"name", QFileInfo(m_rootPath).fileName()}}};
    }

    params["initializationOptions"] = m_config.server.initializationOptions;
    params["capabilities"] = clientCapabilities(m_config.server.experimentalCapabilities);
    params["trace"] = QStringLiteral("off");
    return params;
}

PendingCall* BridgeSession::start() {
    switch (m_state) {
    case SessionState::Uninitialized:
        break;
    case SessionState::Ready:
        return PendingCall::succeeded(m_serverCapabilities, QStringLiteral("start"));
    case SessionState::Initializing:
        return PendingCall::failed(BridgeFailure::sessionNotReady(
            QStringLiteral("start-up is already in progress")), QStringLiteral("start"));
    case SessionState::ShuttingDown:
    case SessionState::Terminated:
    default:
        return PendingCall::failed(BridgeFailure::sessionTerminated(
            QStringLiteral("session has ended; start a new bridge")), QStringLiteral("start"));
    }

    auto* startup = new PendingCall(0, QStringLiteral("start"));
    setState(SessionState::Initializing);
    beginHandshake(startup);
    return startup;
}

void BridgeSession::beginHandshake(PendingCall* startup) {
    const quint64 generation = ++m_generation;
    m_startup = startup;
    m_handshakeDone = false;
    m_readinessSeen = m_probe->method().isEmpty();
    m_serverCapabilities = {};
    m_serverInfo = {};

    m_channel->reset();
    m_supervisor->setEnvironment(m_config.server.env);
    m_supervisor->setWorkingDirectory(m_rootPath);
    m_supervisor->setSpawnProbeMs(m_config.server.spawnProbeMs);

    auto started = m_supervisor->start(m_config.server.command, m_config.server.args);
    if (!started) {
        enterTerminated(started.error());
        return;
    }

    // Subscribe before initialize goes out so an early signal is not missed.
    if (!m_readinessSeen) {
        IReadinessProbe* probe = m_probe.get();
        m_readiness.reset(m_router->subscribe([probe](const QString& method, const QJsonValue& params) {
            return probe->isReadySignal(method, params);
        }, 0, true));
        connect(m_readiness.get(), &Subscription::matched, this, [this, generation]() {
            if (generation == m_generation)
                onReadinessSignal();
        });
    }

    m_startupTimer.start(m_config.readiness.timeoutMs);

    PendingCall* init = m_correlator->send(QStringLiteral("initialize"), initializeParams());
    m_initializeCall = init;
    init->then(this, [this, init, generation](const Result<QJsonValue>& result) {
        init->deleteLater();
        if (generation == m_generation)
            onInitializeFinished(result);
    });
}

void BridgeSession::onInitializeFinished(const Result<QJsonValue>& result) {
    if (m_state != SessionState::Initializing)
        return;
    if (!result) {
        failStartup(result.error());
        return;
    }

    const QJsonObject obj = result->toObject();
    m_serverCapabilities = obj.value(QStringLiteral("capabilities")).toObject();
    m_serverInfo = obj.value(QStringLiteral("serverInfo")).toObject();

    auto sent = m_correlator->notify(QStringLiteral("initialized"), QJsonObject());
    if (!sent) {
        failStartup(sent.error());
        return;
    }

    m_handshakeDone = true;
    LOG_CAT_INFO("session", QStringLiteral("handshake complete with %1 %2")
                                .arg(m_serverInfo.value(QStringLiteral("name")).toString(QStringLiteral("backend")),
                                     m_serverInfo.value(QStringLiteral("version")).toString()));
    maybeReady();
}

void BridgeSession::onReadinessSignal() {
    if (m_state != SessionState::Initializing || m_readinessSeen)
        return;
    m_readinessSeen = true;
    LOG_CAT_INFO("session", QStringLiteral("backend signalled readiness via %1").arg(m_probe->method()));
    maybeReady();
}

void BridgeSession::maybeReady() {
    if (!m_handshakeDone || !m_readinessSeen)
        return;

    m_startupTimer.stop();
    if (m_readiness)
        m_readiness.release()->deleteLater();

    setState(SessionState::Ready);
    if (m_startup)
        m_startup->resolve(QJsonValue(m_serverCapabilities));
    emit ready();
}

void BridgeSession::failStartup(const BridgeFailure& failure) {
    if (m_state != SessionState::Initializing)
        return;
    LOG_CAT_ERROR("session", QStringLiteral("start-up failed: %1").arg(failure.message));
    enterTerminated(failure);
}

// ---------------------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------------------

void BridgeSession::resetSessionState(const BridgeFailure& failure) {
    m_correlator->failAll(failure);
    m_router->closeAll(failure);
    if (m_readiness)
        m_readiness.release()->deleteLater();
    m_diagnostics->clear();
    emit sessionReset();
}

void BridgeSession::enterTerminated(const BridgeFailure& reason) {
    if (m_state == SessionState::Terminated)
        return;

    m_terminationReason = reason;
    m_startupTimer.stop();
    m_replacingBackend = false;
    setState(SessionState::Terminated);
    resetSessionState(reason);
    if (m_startup)
        m_startup->resolve(std::unexpected(reason));

    if (m_supervisor->isAlive())
        m_supervisor->terminate(0);
    emit terminated(reason);
}

void BridgeSession::onBackendExited(int exitCode, bool crashed, bool expected) {
    auto streamEnd = m_channel->endOfStream();
    if (m_replacingBackend || m_state == SessionState::Terminated)
        return;

    if (expected || m_state == SessionState::ShuttingDown) {
        enterTerminated(BridgeFailure::sessionTerminated(QStringLiteral("backend exited")));
        return;
    }

    QString message = QStringLiteral("backend exited unexpectedly with code %1").arg(exitCode);
    if (crashed)
        message += QStringLiteral(" (crashed)");
    if (!streamEnd)
        message += QStringLiteral("; %1").arg(streamEnd.error().message);
    m_crashed = true;
    enterTerminated(BridgeFailure::backendCrashed(message));
}

void BridgeSession::onFramingError(const BridgeFailure& failure) {
    LOG_CAT_ERROR("session", QStringLiteral("transport fault: %1").arg(failure.message));
    enterTerminated(failure);
}

void BridgeSession::stopBackend(int graceMs, std::function<void()> done) {
    if (!m_supervisor->isAlive()) {
        done();
        return;
    }
    if (graceMs <= 0) {
        m_supervisor->terminate(0);
        done();
        return;
    }

    PendingCall* call = m_correlator->send(QStringLiteral("shutdown"),
                                           QJsonValue(QJsonValue::Undefined), graceMs);
    call->then(this, [this, call, graceMs, done](const Result<QJsonValue>& result) {
        call->deleteLater();
        if (!result) {
            LOG_CAT_WARNING("session", QStringLiteral("shutdown request failed: %1").arg(result.error().message));
        }
        if (m_supervisor->isAlive()) {
            auto sent = m_correlator->notify(QStringLiteral("exit"), QJsonValue(QJsonValue::Undefined));
            if (!sent)
                LOG_CAT_WARNING("session", QStringLiteral("could not send exit: %1").arg(sent.error().message));
            m_supervisor->terminate(graceMs);
        }
        done();
    });
}

PendingCall* BridgeSession::shutdown(int graceMs) {
    if (graceMs < 0)
        graceMs = m_config.shutdown.graceMs;

    auto* done = new PendingCall(0, QStringLiteral("shutdown"));
    if (m_state == SessionState::Terminated) {
        done->resolve(QJsonValue(QJsonValue::Null));
        return done;
    }
    connect(this, &BridgeSession::terminated, done, [done]() {
        done->resolve(QJsonValue(QJsonValue::Null));
    });

    if (m_state == SessionState::Uninitialized) {
        enterTerminated(BridgeFailure::sessionTerminated(QStringLiteral("session shut down before start")));
        return done;
    }
    if (m_state == SessionState::ShuttingDown)
        return done;

    setState(SessionState::ShuttingDown);
    m_startupTimer.stop();
    m_replacingBackend = false;

    const BridgeFailure draining = BridgeFailure::sessionTerminated(QStringLiteral("session is shutting down"));
    m_correlator->failAll(draining);
    m_router->closeAll(draining);
    if (m_startup)
        m_startup->resolve(std::unexpected(draining));

    stopBackend(graceMs, [this]() {
        enterTerminated(BridgeFailure::sessionTerminated(QStringLiteral("session shut down")));
    });
    return done;
}

PendingCall* BridgeSession::rehandshake() {
    auto ready = requireReady();
    if (!ready)
        return PendingCall::failed(ready.error(), QStringLiteral("rehandshake"));

    auto* startup = new PendingCall(0, QStringLiteral("rehandshake"));
    m_startup = startup;
    setState(SessionState::Initializing);
    resetSessionState(BridgeFailure::sessionNotReady(QStringLiteral("backend is restarting for a new workspace")));

    ++m_generation;
    m_replacingBackend = true;
    stopBackend(m_config.shutdown.graceMs, [this, startup]() {
        if (!m_replacingBackend || m_state != SessionState::Initializing)
            return;
        m_replacingBackend = false;
        beginHandshake(startup);
    });
    return startup;
}
