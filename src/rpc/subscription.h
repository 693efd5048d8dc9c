#pragma once
#include "protocol/ports.h"
#include <QObject>
#include <QTimer>
#include <functional>

// A registered interest in backend notifications. One-shot subscriptions
// resolve on the first match (or NotificationTimeout) and then stop
// listening; persistent ones emit matched() for every match until
// closed or expired.
class Subscription : public QObject {
    Q_OBJECT
public:
    using Predicate = std::function<bool(const QString& method, const QJsonValue& params)>;

    Subscription(Predicate predicate, int timeoutMs, bool oneShot, QObject* parent = nullptr);

    bool isOneShot() const { return m_oneShot; }
    bool isActive() const { return !m_finished; }
    bool isFinished() const { return m_finished; }
    int matchCount() const { return m_matchCount; }

    // For one-shot subscriptions: the matching params, or NotificationTimeout.
    const Result<QJsonValue>& result() const { return m_result; }

    // Returns true when the notification matched. Called by the router.
    bool offer(const QString& method, const QJsonValue& params);

    // Resolves with the given failure unless already finished.
    void close(const BridgeFailure& failure);

    Result<QJsonValue> wait(int timeoutMs = -1);

signals:
    void matched(const QString& method, const QJsonValue& params);
    void finished();

private:
    Predicate m_predicate;
    bool m_oneShot;
    bool m_finished = false;
    int m_matchCount = 0;
    int m_timeoutMs;
    QTimer m_timer;
    Result<QJsonValue> m_result;

    void finish(Result<QJsonValue> result);
};
