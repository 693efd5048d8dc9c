#include "notification_router.h"
#include "session/diagnostics_cache.h"
#include "core/log_manager.h"
#include <QJsonArray>

NotificationRouter::NotificationRouter(DiagnosticsCache* cache, QObject* parent)
    : QObject(parent)
    , m_cache(cache)
{
}

// ---------------------------------------------------------------------------
// Notifications
// ---------------------------------------------------------------------------

void NotificationRouter::dispatch(const RpcNotification& notification) {
    ++m_dispatched;
    const QString& method = notification.method;

    if (method == QLatin1String(kPublishDiagnostics))
        routeDiagnostics(notification.params);
    else if (method == QStringLiteral("window/logMessage") || method == QStringLiteral("window/showMessage"))
        logWindowMessage(notification);
    else
        LOG_CAT_DEBUG("router", QStringLiteral("<-- %1").arg(method));

    // Snapshot: a matched subscription may create or delete others.
    const QList<QPointer<Subscription>> subscriptions = m_subscriptions;
    for (const QPointer<Subscription>& sub : subscriptions) {
        if (sub && sub->isActive())
            sub->offer(method, notification.params);
    }
    prune();

    emit notificationObserved(notification);
}

void NotificationRouter::routeDiagnostics(const QJsonValue& params) {
    const QJsonObject obj = params.toObject();
    const QString uri = obj.value(QStringLiteral("uri")).toString();
    if (uri.isEmpty()) {
        LOG_CAT_WARNING("router", QStringLiteral("publishDiagnostics without uri ignored"));
        return;
    }
    if (!m_cache)
        return;

    std::optional<int> version;
    const QJsonValue v = obj.value(QStringLiteral("version"));
    if (v.isDouble())
        version = v.toInt();
    m_cache->recordPush(uri, obj.value(QStringLiteral("diagnostics")).toArray(), version);
}

void NotificationRouter::logWindowMessage(const RpcNotification& notification) {
    const QJsonObject obj = notification.params.toObject();
    const QString text = obj.value(QStringLiteral("message")).toString();

    LogManager::Level level = LogManager::Debug;
    switch (obj.value(QStringLiteral("type")).toInt(4)) {
    case 1: level = LogManager::Error; break;
    case 2: level = LogManager::Warning; break;
    case 3: level = LogManager::Info; break;
    default: break;
    }
    LogManager::instance().log(level, QStringLiteral("backend"), text);
}

// ---------------------------------------------------------------------------
// Subscriptions
// ---------------------------------------------------------------------------

Subscription* NotificationRouter::subscribe(Subscription::Predicate predicate, int timeoutMs, bool oneShot) {
    auto* sub = new Subscription(std::move(predicate), timeoutMs, oneShot);
    m_subscriptions.append(sub);
    return sub;
}

Subscription* NotificationRouter::subscribeMethod(const QString& method, int timeoutMs, bool oneShot) {
    return subscribe([method](const QString& m, const QJsonValue&) { return m == method; },
                     timeoutMs, oneShot);
}

void NotificationRouter::closeAll(const BridgeFailure& failure) {
    const QList<QPointer<Subscription>> subscriptions = m_subscriptions;
    for (const QPointer<Subscription>& sub : subscriptions) {
        if (sub)
            sub->close(failure);
    }
    prune();
}

int NotificationRouter::activeSubscriptionCount() const {
    int count = 0;
    for (const QPointer<Subscription>& sub : m_subscriptions) {
        if (sub && sub->isActive())
            ++count;
    }
    return count;
}

void NotificationRouter::prune() {
    m_subscriptions.removeIf([](const QPointer<Subscription>& sub) {
        return !sub || !sub->isActive();
    });
}

// ---------------------------------------------------------------------------
// Server-initiated requests
// ---------------------------------------------------------------------------

QJsonValue NotificationRouter::configurationSection(const QString& section) const {
    if (section.isEmpty())
        return m_initializationOptions;

    QJsonValue current = m_initializationOptions;
    for (const QString& part : section.split(QLatin1Char('.'))) {
        const QJsonObject obj = current.toObject();
        if (!obj.contains(part))
            return m_initializationOptions;   // e.g. "rust-analyzer": the options are that section
        current = obj.value(part);
    }
    return current;
}

RpcResponse NotificationRouter::handleServerRequest(const RpcRequest& request) {
    RpcResponse response;
    response.id = request.id;
    response.result = QJsonValue::Null;

    const QString& method = request.method;
    LOG_CAT_DEBUG("router", QStringLiteral("<-- server request %1").arg(method));

    if (method == QStringLiteral("window/workDoneProgress/create")
        || method == QStringLiteral("client/registerCapability")
        || method == QStringLiteral("client/unregisterCapability")) {
        // acknowledged, nothing to track
    } else if (method == QStringLiteral("workspace/configuration")) {
        QJsonArray values;
        const QJsonArray items = request.params.toObject().value(QStringLiteral("items")).toArray();
        for (const QJsonValue& item : items)
            values.append(configurationSection(item.toObject().value(QStringLiteral("section")).toString()));
        response.result = values;
    } else {
        LOG_CAT_WARNING("router", QStringLiteral("unsupported server request %1").arg(method));
        response.result = QJsonValue();
        response.error = RpcError{static_cast<int>(RpcErrorCode::MethodNotFound),
                                  QStringLiteral("method not supported by client: %1").arg(method),
                                  QJsonValue()};
    }

    emit serverRequestHandled(method);
    return response;
}
