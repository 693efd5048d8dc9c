#include "subscription.h"
#include <QEventLoop>

Subscription::Subscription(Predicate predicate, int timeoutMs, bool oneShot, QObject* parent)
    : QObject(parent)
    , m_predicate(std::move(predicate))
    , m_oneShot(oneShot)
    , m_timeoutMs(timeoutMs)
    , m_result(std::unexpected(BridgeFailure::internal(QStringLiteral("subscription still active"))))
{
    m_timer.setSingleShot(true);
    m_timer.setTimerType(Qt::PreciseTimer);
    connect(&m_timer, &QTimer::timeout, this, [this]() {
        finish(std::unexpected(BridgeFailure::notificationTimeout(
            QStringLiteral("no matching notification within %1 ms").arg(m_timeoutMs))));
    });
    if (timeoutMs > 0)
        m_timer.start(timeoutMs);
}

bool Subscription::offer(const QString& method, const QJsonValue& params) {
    if (m_finished)
        return false;
    if (m_predicate && !m_predicate(method, params))
        return false;

    ++m_matchCount;
    emit matched(method, params);
    if (m_oneShot)
        finish(params);
    return true;
}

void Subscription::close(const BridgeFailure& failure) {
    finish(std::unexpected(failure));
}

void Subscription::finish(Result<QJsonValue> result) {
    if (m_finished)
        return;
    m_finished = true;
    m_timer.stop();
    m_result = std::move(result);
    emit finished();
}

Result<QJsonValue> Subscription::wait(int timeoutMs) {
    if (m_finished)
        return m_result;

    QEventLoop loop;
    connect(this, &Subscription::finished, &loop, &QEventLoop::quit);
    QTimer guard;
    guard.setSingleShot(true);
    if (timeoutMs >= 0) {
        connect(&guard, &QTimer::timeout, &loop, &QEventLoop::quit);
        guard.start(timeoutMs);
    }
    loop.exec();

    if (!m_finished) {
        return std::unexpected(BridgeFailure::notificationTimeout(
            QStringLiteral("gave up waiting after %1 ms").arg(timeoutMs)));
    }
    return m_result;
}
