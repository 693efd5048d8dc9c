#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct BridgeFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    int         backendCode = 0;
    bool        retryable = false;

    QJsonObject toJson() const;

    static BridgeFailure spawn(const QString& msg);
    static BridgeFailure framing(const QString& msg);
    static BridgeFailure backendCrashed(const QString& msg);
    static BridgeFailure sessionNotReady(const QString& msg);
    static BridgeFailure sessionTerminated(const QString& msg);
    static BridgeFailure timeout(const QString& msg);
    static BridgeFailure cancelled(const QString& msg);
    static BridgeFailure backendError(int backendCode, const QString& msg);
    static BridgeFailure invalidParameter(const QString& code, const QString& msg);
    static BridgeFailure notificationTimeout(const QString& msg);
    static BridgeFailure workspaceNotSet(const QString& msg);
    static BridgeFailure internal(const QString& msg);
};
