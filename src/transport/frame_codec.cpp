#include "frame_codec.h"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QList>

QByteArray FrameCodec::encode(const RpcMessage& message) {
    const QByteArray body = QJsonDocument(messageToJson(message)).toJson(QJsonDocument::Compact);
    QByteArray frame;
    frame.reserve(body.size() + 32);
    frame.append("Content-Length: ");
    frame.append(QByteArray::number(body.size()));
    frame.append("\r\n\r\n");
    frame.append(body);
    return frame;
}

Result<RpcMessage> FrameCodec::messageFromJson(const QJsonObject& obj) {
    const QJsonValue method = obj.value(QStringLiteral("method"));
    const bool hasId = obj.contains(QStringLiteral("id"));

    if (method.isString()) {
        if (hasId) {
            RpcRequest req;
            req.id = obj.value(QStringLiteral("id"));
            req.method = method.toString();
            req.params = obj.value(QStringLiteral("params"));
            return req;
        }
        RpcNotification note;
        note.method = method.toString();
        note.params = obj.value(QStringLiteral("params"));
        return note;
    }

    if (!method.isUndefined()) {
        return std::unexpected(BridgeFailure::framing(
            QStringLiteral("message has a non-string method")));
    }

    if (!hasId) {
        return std::unexpected(BridgeFailure::framing(
            QStringLiteral("message has neither method nor id")));
    }

    RpcResponse resp;
    resp.id = obj.value(QStringLiteral("id"));
    if (obj.contains(QStringLiteral("error"))) {
        const QJsonValue errValue = obj.value(QStringLiteral("error"));
        if (!errValue.isObject()) {
            return std::unexpected(BridgeFailure::framing(
                QStringLiteral("response error is not an object")));
        }
        const QJsonObject err = errValue.toObject();
        RpcError error;
        error.code = err.value(QStringLiteral("code")).toInt();
        error.message = err.value(QStringLiteral("message")).toString();
        error.data = err.value(QStringLiteral("data"));
        resp.error = error;
    } else if (obj.contains(QStringLiteral("result"))) {
        resp.result = obj.value(QStringLiteral("result"));
    } else {
        return std::unexpected(BridgeFailure::framing(
            QStringLiteral("response carries neither result nor error")));
    }
    return resp;
}

// ---------------------------------------------------------------------------
// FrameDecoder
// ---------------------------------------------------------------------------

void FrameDecoder::feed(const QByteArray& bytes) {
    if (m_failure)
        return;
    m_buffer.append(bytes);
}

void FrameDecoder::reset() {
    m_buffer.clear();
    m_pendingBodyLength = -1;
    m_failure.reset();
}

BridgeFailure FrameDecoder::fail(const QString& message) {
    m_failure = BridgeFailure::framing(message);
    m_buffer.clear();
    return *m_failure;
}

Result<bool> FrameDecoder::parseHeader() {
    const qsizetype end = m_buffer.indexOf("\r\n\r\n");
    if (end < 0) {
        if (m_buffer.size() > kMaxHeaderBytes)
            return std::unexpected(fail(QStringLiteral("header exceeds %1 bytes").arg(kMaxHeaderBytes)));
        return false;
    }
    if (end > kMaxHeaderBytes)
        return std::unexpected(fail(QStringLiteral("header exceeds %1 bytes").arg(kMaxHeaderBytes)));

    const QByteArray block = m_buffer.left(end);
    m_buffer.remove(0, end + 4);

    qsizetype length = -1;
    const QList<QByteArray> lines = block.split('\n');
    for (QByteArray line : lines) {
        if (line.endsWith('\r'))
            line.chop(1);
        if (line.isEmpty())
            continue;

        const qsizetype colon = line.indexOf(':');
        if (colon <= 0)
            return std::unexpected(fail(QStringLiteral("malformed header line: %1")
                                            .arg(QString::fromUtf8(line.left(80)))));

        const QByteArray name = line.left(colon).trimmed().toLower();
        const QByteArray value = line.mid(colon + 1).trimmed();
        if (name == "content-length") {
            bool ok = false;
            const qlonglong parsed = value.toLongLong(&ok);
            if (!ok || parsed < 0 || parsed > kMaxBodyBytes)
                return std::unexpected(fail(QStringLiteral("invalid Content-Length: %1")
                                                .arg(QString::fromUtf8(value))));
            length = static_cast<qsizetype>(parsed);
        }
        // Content-Type and unknown headers are accepted and ignored.
    }

    if (length < 0)
        return std::unexpected(fail(QStringLiteral("frame header without Content-Length")));

    m_pendingBodyLength = length;
    return true;
}

Result<std::optional<RpcMessage>> FrameDecoder::next() {
    if (m_failure)
        return std::unexpected(*m_failure);

    if (m_pendingBodyLength < 0) {
        auto header = parseHeader();
        if (!header)
            return std::unexpected(header.error());
        if (!*header)
            return std::optional<RpcMessage>{};
    }

    if (m_buffer.size() < m_pendingBodyLength)
        return std::optional<RpcMessage>{};

    const QByteArray body = m_buffer.left(m_pendingBodyLength);
    m_buffer.remove(0, m_pendingBodyLength);
    m_pendingBodyLength = -1;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return std::unexpected(fail(QStringLiteral("invalid JSON body: %1").arg(parseError.errorString())));
    if (!doc.isObject())
        return std::unexpected(fail(QStringLiteral("frame body is not a JSON object")));

    auto message = FrameCodec::messageFromJson(doc.object());
    if (!message)
        return std::unexpected(fail(message.error().message));
    return std::optional<RpcMessage>{std::move(*message)};
}

VoidResult FrameDecoder::finish() const {
    if (m_failure)
        return std::unexpected(*m_failure);
    if (m_pendingBodyLength >= 0) {
        return std::unexpected(BridgeFailure::framing(
            QStringLiteral("stream closed with %1 of %2 body bytes received")
                .arg(m_buffer.size())
                .arg(m_pendingBodyLength)));
    }
    if (!m_buffer.isEmpty()) {
        return std::unexpected(BridgeFailure::framing(
            QStringLiteral("stream closed inside a frame header (%1 bytes)").arg(m_buffer.size())));
    }
    return {};
}
