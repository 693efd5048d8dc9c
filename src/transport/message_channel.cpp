#include "message_channel.h"
#include "process_supervisor.h"
#include "core/log_manager.h"
#include <QJsonDocument>

MessageChannel::MessageChannel(ProcessSupervisor* supervisor, QObject* parent)
    : QObject(parent)
    , m_supervisor(supervisor)
{
    Q_ASSERT(m_supervisor);
    connect(m_supervisor, &ProcessSupervisor::stdoutData,
            this, &MessageChannel::onStdoutData);
    connect(m_supervisor, &ProcessSupervisor::stdoutClosed,
            this, &MessageChannel::onStdoutClosed);
}

void MessageChannel::reset() {
    m_decoder.reset();
}

VoidResult MessageChannel::endOfStream() {
    if (m_decoder.hasFailed())
        return {};
    auto done = m_decoder.finish();
    if (!done)
        LOG_CAT_WARNING("transport", QStringLiteral("backend stream ended mid-frame: %1").arg(done.error().message));
    return done;
}

VoidResult MessageChannel::write(const RpcMessage& message) {
    const QByteArray frame = FrameCodec::encode(message);
    auto written = m_supervisor->write(frame);
    if (!written)
        return written;

    ++m_framesWritten;
    if (LogManager::instance().minimumLevel() <= LogManager::Debug) {
        LOG_CAT_DEBUG("transport", QStringLiteral("--> %1").arg(QString::fromUtf8(
            QJsonDocument(messageToJson(message)).toJson(QJsonDocument::Compact).left(2048))));
    }
    return {};
}

void MessageChannel::onStdoutData(const QByteArray& bytes) {
    if (m_decoder.hasFailed())
        return;

    m_decoder.feed(bytes);
    while (true) {
        auto next = m_decoder.next();
        if (!next) {
            LOG_CAT_ERROR("transport", QStringLiteral("framing error: %1").arg(next.error().message));
            emit framingError(next.error());
            return;
        }
        if (!next->has_value())
            break;

        ++m_framesRead;
        RpcMessage message = std::move(**next);
        if (LogManager::instance().minimumLevel() <= LogManager::Debug) {
            LOG_CAT_DEBUG("transport", QStringLiteral("<-- %1").arg(QString::fromUtf8(
                QJsonDocument(messageToJson(message)).toJson(QJsonDocument::Compact).left(2048))));
        }

        if (auto* resp = std::get_if<RpcResponse>(&message))
            emit responseReceived(*resp);
        else if (auto* note = std::get_if<RpcNotification>(&message))
            emit notificationReceived(*note);
        else if (auto* req = std::get_if<RpcRequest>(&message))
            emit requestReceived(*req);

        // A slot may have reset or failed the decoder.
        if (m_decoder.hasFailed())
            return;
    }
}

void MessageChannel::onStdoutClosed() {
    if (m_decoder.hasFailed())
        return;
    auto done = endOfStream();
    emit framingError(done ? BridgeFailure::framing(QStringLiteral("backend closed its output stream while still running"))
                           : done.error());
}
