#pragma once
#include <QtGlobal>
#include <QString>

enum class ErrorKind : quint8 {
    Spawn,               // backend executable missing or exited at once
    Framing,             // malformed transport stream (fatal)
    BackendCrashed,      // unexpected backend exit (fatal)
    SessionNotReady,     // Initializing / ShuttingDown (retryable)
    SessionTerminated,   // Terminated
    Timeout,             // no response within deadline (retryable)
    Cancelled,           // caller-initiated
    BackendError,        // JSON-RPC error response
    InvalidParameter,    // caller's fault
    NotificationTimeout, // subscription expired
    WorkspaceNotSet,     // capability needs a workspace root
    Internal
};

enum class SessionState : quint8 {
    Uninitialized, Initializing, Ready, ShuttingDown, Terminated
};

enum class MethodClass : quint8 {
    Query,          // fast read-only document queries
    WorkspaceScan,  // long-running workspace-wide requests
    Lifecycle       // initialize / shutdown
};

enum class DiagnosticsSource : quint8 {
    None, Push, Pull
};

enum class WorkspaceChangeStrategy : quint8 {
    Auto = 0, Notify = 1, Restart = 2
};

QString errorKindName(ErrorKind kind);
QString sessionStateName(SessionState state);
QString diagnosticsSourceName(DiagnosticsSource source);
