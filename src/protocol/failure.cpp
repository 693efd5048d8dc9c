#include "failure.h"

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Spawn:               return QStringLiteral("spawn_error");
    case ErrorKind::Framing:             return QStringLiteral("framing_error");
    case ErrorKind::BackendCrashed:      return QStringLiteral("backend_crashed");
    case ErrorKind::SessionNotReady:     return QStringLiteral("session_not_ready");
    case ErrorKind::SessionTerminated:   return QStringLiteral("session_terminated");
    case ErrorKind::Timeout:             return QStringLiteral("timeout");
    case ErrorKind::Cancelled:           return QStringLiteral("cancelled");
    case ErrorKind::BackendError:        return QStringLiteral("backend_error");
    case ErrorKind::InvalidParameter:    return QStringLiteral("invalid_parameter");
    case ErrorKind::NotificationTimeout: return QStringLiteral("notification_timeout");
    case ErrorKind::WorkspaceNotSet:     return QStringLiteral("workspace_not_set");
    case ErrorKind::Internal:
    default:                             return QStringLiteral("internal");
    }
}

QString sessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Uninitialized: return QStringLiteral("uninitialized");
    case SessionState::Initializing:  return QStringLiteral("initializing");
    case SessionState::Ready:         return QStringLiteral("ready");
    case SessionState::ShuttingDown:  return QStringLiteral("shutting_down");
    case SessionState::Terminated:
    default:                          return QStringLiteral("terminated");
    }
}

QString diagnosticsSourceName(DiagnosticsSource source) {
    switch (source) {
    case DiagnosticsSource::Push: return QStringLiteral("push");
    case DiagnosticsSource::Pull: return QStringLiteral("pull");
    case DiagnosticsSource::None:
    default:                      return QStringLiteral("none");
    }
}

QJsonObject BridgeFailure::toJson() const {
    QJsonObject err;
    err["kind"] = errorKindName(kind);
    err["code"] = code;
    err["message"] = message;
    err["retryable"] = retryable;
    if (kind == ErrorKind::BackendError)
        err["backend_code"] = backendCode;
    QJsonObject root;
    root["error"] = err;
    return root;
}

BridgeFailure BridgeFailure::spawn(const QString& msg) {
    return {ErrorKind::Spawn, "spawn_failed", msg, 0, false};
}

BridgeFailure BridgeFailure::framing(const QString& msg) {
    return {ErrorKind::Framing, "malformed_frame", msg, 0, false};
}

BridgeFailure BridgeFailure::backendCrashed(const QString& msg) {
    return {ErrorKind::BackendCrashed, "backend_crashed", msg, 0, false};
}

BridgeFailure BridgeFailure::sessionNotReady(const QString& msg) {
    return {ErrorKind::SessionNotReady, "session_not_ready", msg, 0, true};
}

BridgeFailure BridgeFailure::sessionTerminated(const QString& msg) {
    return {ErrorKind::SessionTerminated, "session_terminated", msg, 0, false};
}

BridgeFailure BridgeFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, "timeout", msg, 0, true};
}

BridgeFailure BridgeFailure::cancelled(const QString& msg) {
    return {ErrorKind::Cancelled, "cancelled", msg, 0, false};
}

BridgeFailure BridgeFailure::backendError(int backendCode, const QString& msg) {
    return {ErrorKind::BackendError, "backend_error", msg, backendCode, true};
}

BridgeFailure BridgeFailure::invalidParameter(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidParameter, code, msg, 0, false};
}

BridgeFailure BridgeFailure::notificationTimeout(const QString& msg) {
    return {ErrorKind::NotificationTimeout, "notification_timeout", msg, 0, true};
}

BridgeFailure BridgeFailure::workspaceNotSet(const QString& msg) {
    return {ErrorKind::WorkspaceNotSet, "workspace_not_set", msg, 0, false};
}

BridgeFailure BridgeFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg, 0, false};
}
