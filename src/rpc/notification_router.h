#pragma once
#include "subscription.h"
#include "protocol/message.h"
#include <QObject>
#include <QJsonObject>
#include <QList>
#include <QPointer>

class DiagnosticsCache;

// Fans out backend notifications: diagnostics pushes go to the cache,
// every notification is offered to the active subscriptions and then
// published on notificationObserved(). Also answers the requests the
// backend sends to the client.
class NotificationRouter : public QObject {
    Q_OBJECT
public:
    static constexpr const char* kPublishDiagnostics = "textDocument/publishDiagnostics";

    explicit NotificationRouter(DiagnosticsCache* cache, QObject* parent = nullptr);

    void dispatch(const RpcNotification& notification);

    // The caller owns the returned subscription. timeoutMs <= 0 means no
    // expiry. Deleting the subscription unregisters it.
    Subscription* subscribe(Subscription::Predicate predicate, int timeoutMs, bool oneShot = true);
    Subscription* subscribeMethod(const QString& method, int timeoutMs, bool oneShot = true);

    // Resolves every active subscription with failure.
    void closeAll(const BridgeFailure& failure);
    int activeSubscriptionCount() const;

    // Values served for workspace/configuration requests.
    void setInitializationOptions(const QJsonObject& options) { m_initializationOptions = options; }

    RpcResponse handleServerRequest(const RpcRequest& request);

    quint64 dispatchedCount() const { return m_dispatched; }

signals:
    void notificationObserved(const RpcNotification& notification);
    void serverRequestHandled(const QString& method);

private:
    DiagnosticsCache* m_cache;
    QList<QPointer<Subscription>> m_subscriptions;
    QJsonObject m_initializationOptions;
    quint64 m_dispatched = 0;

    void routeDiagnostics(const QJsonValue& params);
    void logWindowMessage(const RpcNotification& notification);
    void prune();
    QJsonValue configurationSection(const QString& section) const;
};
