#include "pending_call.h"
#include <QEventLoop>
#include <QPointer>
#include <QTimer>

PendingCall::PendingCall(qint64 id, const QString& method, QObject* parent)
    : QObject(parent)
    , m_id(id)
    , m_method(method)
    , m_result(std::unexpected(BridgeFailure::internal(QStringLiteral("call has not completed"))))
{
}

PendingCall* PendingCall::failed(const BridgeFailure& failure, const QString& method) {
    auto* call = new PendingCall(0, method);
    call->resolve(std::unexpected(failure));
    return call;
}

PendingCall* PendingCall::succeeded(const QJsonValue& value, const QString& method) {
    auto* call = new PendingCall(0, method);
    call->resolve(value);
    return call;
}

bool PendingCall::resolve(Result<QJsonValue> result) {
    if (m_finished)
        return false;
    m_finished = true;
    m_result = std::move(result);
    m_canceller = nullptr;
    emit finished();
    return true;
}

void PendingCall::cancel() {
    if (m_finished)
        return;
    if (m_canceller) {
        auto canceller = m_canceller;
        canceller();
    }
    // The canceller normally resolves us; make sure it happened.
    resolve(std::unexpected(BridgeFailure::cancelled(
        QStringLiteral("%1 was cancelled by the caller").arg(m_method))));
}

Result<QJsonValue> PendingCall::wait(int timeoutMs) {
    if (m_finished)
        return m_result;

    QEventLoop loop;
    QObject::connect(this, &PendingCall::finished, &loop, &QEventLoop::quit);
    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    if (timeoutMs >= 0) {
        QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
        timeoutTimer.start(timeoutMs);
    }
    loop.exec();

    if (!m_finished) {
        return std::unexpected(BridgeFailure::timeout(
            QStringLiteral("gave up waiting for %1 after %2 ms").arg(m_method).arg(timeoutMs)));
    }
    return m_result;
}

PendingCall* PendingCall::map(Shaper shaper) {
    auto* derived = new PendingCall(m_id, m_method);
    setParent(derived);

    QPointer<PendingCall> source(this);
    derived->setCanceller([source]() {
        if (source)
            source->cancel();
    });

    auto forward = [derived, shaper = std::move(shaper)](const Result<QJsonValue>& result) {
        if (!result) {
            derived->resolve(std::unexpected(result.error()));
            return;
        }
        derived->resolve(shaper(*result));
    };

    if (m_finished) {
        forward(m_result);
    } else {
        connect(this, &PendingCall::finished, derived, [this, forward]() {
            forward(m_result);
        });
    }
    return derived;
}

void PendingCall::then(QObject* context, Callback fn) {
    if (m_finished) {
        QPointer<PendingCall> self(this);
        QMetaObject::invokeMethod(context, [self, fn]() {
            if (self)
                fn(self->result());
        }, Qt::QueuedConnection);
        return;
    }
    connect(this, &PendingCall::finished, context, [this, fn]() {
        fn(m_result);
    });
}
