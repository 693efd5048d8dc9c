#include "timeout_policy.h"

MethodClass TimeoutPolicy::classify(const QString& method) {
    if (method == QStringLiteral("initialize") || method == QStringLiteral("shutdown"))
        return MethodClass::Lifecycle;
    if (method.startsWith(QStringLiteral("workspace/"))
        || method == QStringLiteral("rust-analyzer/getFailedObligations"))
        return MethodClass::WorkspaceScan;
    return MethodClass::Query;
}

int TimeoutPolicy::timeoutFor(const QString& method) const {
    auto it = perMethod.constFind(method);
    if (it != perMethod.constEnd())
        return qMax(0, it.value());

    switch (classify(method)) {
    case MethodClass::Lifecycle:     return qMax(0, lifecycleMs);
    case MethodClass::WorkspaceScan: return qMax(0, workspaceScanMs);
    case MethodClass::Query:
    default:                         return qMax(0, queryMs);
    }
}
