#include "request_correlator.h"
#include "core/log_manager.h"
#include <QJsonObject>

// ---------------------------------------------------------------------------
// RequestCorrelator
// ---------------------------------------------------------------------------

RequestCorrelator::RequestCorrelator(IMessageWriter* writer, QObject* parent)
    : QObject(parent)
    , m_writer(writer)
{
    Q_ASSERT(m_writer);
}

RequestCorrelator::~RequestCorrelator()
{
    failAll(BridgeFailure::sessionTerminated(QStringLiteral("request table destroyed")));
}

PendingCall* RequestCorrelator::send(const QString& method, const QJsonValue& params, int timeoutMs) {
    const qint64 id = m_nextId++;
    auto* call = new PendingCall(id, method);

    QPointer<RequestCorrelator> self(this);
    call->setCanceller([self, id]() {
        if (self)
            self->cancel(id);
    });

    PendingRequest entry;
    entry.id = id;
    entry.method = method;
    entry.timeoutMs = timeoutMs < 0 ? m_policy.timeoutFor(method) : timeoutMs;
    entry.completion = call;
    entry.issuedAt.start();

    if (entry.timeoutMs > 0) {
        entry.deadline = new QTimer(this);
        entry.deadline->setSingleShot(true);
        entry.deadline->setTimerType(Qt::PreciseTimer);
        connect(entry.deadline, &QTimer::timeout, this, [this, id]() { onDeadline(id); });
    }
    m_pending.insert(id, entry);

    RpcRequest request;
    request.id = id;
    request.method = method;
    request.params = params;

    auto written = m_writer->write(request);
    if (!written) {
        LOG_CAT_ERROR("rpc", QStringLiteral("failed to send %1 #%2: %3")
                                 .arg(method)
                                 .arg(id)
                                 .arg(written.error().message));
        complete(id, std::unexpected(written.error()));
        return call;
    }

    if (entry.deadline)
        entry.deadline->start(entry.timeoutMs);

    LOG_CAT_DEBUG("rpc", QStringLiteral("sent %1 #%2 (deadline %3 ms, %4 pending)")
                             .arg(method)
                             .arg(id)
                             .arg(entry.timeoutMs)
                             .arg(m_pending.size()));
    return call;
}

VoidResult RequestCorrelator::notify(const QString& method, const QJsonValue& params) {
    RpcNotification note;
    note.method = method;
    note.params = params;
    return m_writer->write(note);
}

std::optional<PendingRequest> RequestCorrelator::take(qint64 id) {
    auto it = m_pending.find(id);
    if (it == m_pending.end())
        return std::nullopt;

    PendingRequest entry = it.value();
    m_pending.erase(it);
    if (entry.deadline) {
        entry.deadline->stop();
        entry.deadline->deleteLater();
        entry.deadline = nullptr;
    }
    return entry;
}

bool RequestCorrelator::complete(const RpcResponse& response) {
    const QJsonValue& idValue = response.id;
    if (!idValue.isDouble()) {
        LOG_CAT_WARNING("rpc", QStringLiteral("discarding response with non-numeric id %1")
                                   .arg(idValue.toVariant().toString()));
        emit unmatchedResponse(idValue);
        return false;
    }

    const qint64 id = idValue.toInteger();
    if (!m_pending.contains(id)) {
        LOG_CAT_WARNING("rpc", QStringLiteral("discarding response for unknown or settled request #%1").arg(id));
        emit unmatchedResponse(idValue);
        return false;
    }

    if (response.error) {
        const QString method = m_pending.value(id).method;
        return complete(id, std::unexpected(BridgeFailure::backendError(
            response.error->code,
            QStringLiteral("%1 failed: %2").arg(method, response.error->message))));
    }
    return complete(id, response.result);
}

bool RequestCorrelator::complete(qint64 id, Result<QJsonValue> result) {
    auto entry = take(id);
    if (!entry) {
        LOG_CAT_WARNING("rpc", QStringLiteral("no pending request #%1 to complete").arg(id));
        return false;
    }

    LOG_CAT_DEBUG("rpc", QStringLiteral("%1 #%2 settled after %3 ms (%4)")
                             .arg(entry->method)
                             .arg(id)
                             .arg(entry->issuedAt.elapsed())
                             .arg(result ? QStringLiteral("ok") : errorKindName(result.error().kind)));

    if (entry->completion)
        entry->completion->resolve(std::move(result));
    return true;
}

void RequestCorrelator::cancel(qint64 id) {
    auto entry = take(id);
    if (!entry)
        return;

    sendCancelNotification(id, entry->method);
    LOG_CAT_INFO("rpc", QStringLiteral("cancelled %1 #%2").arg(entry->method).arg(id));
    if (entry->completion) {
        entry->completion->resolve(std::unexpected(BridgeFailure::cancelled(
            QStringLiteral("%1 was cancelled by the caller").arg(entry->method))));
    }
}

void RequestCorrelator::onDeadline(qint64 id) {
    auto entry = take(id);
    if (!entry)
        return;

    LOG_CAT_WARNING("rpc", QStringLiteral("%1 #%2 timed out after %3 ms")
                               .arg(entry->method)
                               .arg(id)
                               .arg(entry->timeoutMs));
    sendCancelNotification(id, entry->method);
    emit requestTimedOut(id, entry->method);
    if (entry->completion) {
        entry->completion->resolve(std::unexpected(BridgeFailure::timeout(
            QStringLiteral("%1 timed out after %2 ms").arg(entry->method).arg(entry->timeoutMs))));
    }
}

void RequestCorrelator::failAll(const BridgeFailure& failure) {
    const QList<qint64> ids = m_pending.keys();
    if (!ids.isEmpty()) {
        LOG_CAT_WARNING("rpc", QStringLiteral("failing %1 pending requests: %2")
                                   .arg(ids.size())
                                   .arg(failure.message));
    }
    for (qint64 id : ids) {
        auto entry = take(id);
        if (entry && entry->completion)
            entry->completion->resolve(std::unexpected(failure));
    }
}

void RequestCorrelator::sendCancelNotification(qint64 id, const QString& method) {
    QJsonObject params;
    params["id"] = id;
    auto written = notify(QStringLiteral("$/cancelRequest"), params);
    if (!written) {
        LOG_CAT_DEBUG("rpc", QStringLiteral("could not send $/cancelRequest for %1 #%2: %3")
                                 .arg(method)
                                 .arg(id)
                                 .arg(written.error().message));
    }
}
