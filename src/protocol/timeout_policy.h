#pragma once
#include "types.h"
#include <QMap>
#include <QString>

// Request deadlines per method class, with exact-method overrides.
struct TimeoutPolicy {
    int queryMs = 30000;
    int workspaceScanMs = 120000;
    int lifecycleMs = 60000;
    QMap<QString, int> perMethod;

    static MethodClass classify(const QString& method);
    // 0 means "no deadline".
    int timeoutFor(const QString& method) const;
};
