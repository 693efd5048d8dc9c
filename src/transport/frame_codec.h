#pragma once
#include "protocol/ports.h"
#include <QByteArray>
#include <optional>

// Content-Length framing of JSON-RPC messages, as used by the Language
// Server Protocol: "Content-Length: N\r\n" [other headers] "\r\n" <N bytes>.
class FrameCodec {
public:
    static QByteArray encode(const RpcMessage& message);
    static Result<RpcMessage> messageFromJson(const QJsonObject& obj);
};

// Incremental decoder. Bytes arrive in arbitrary chunks; only complete
// frames are turned into messages, partial ones stay buffered.
// Once a framing error is reported the decoder stays failed.
class FrameDecoder {
public:
    static constexpr qsizetype kMaxHeaderBytes = 8 * 1024;
    static constexpr qsizetype kMaxBodyBytes = 512 * 1024 * 1024;

    void feed(const QByteArray& bytes);

    // Next complete message, or std::nullopt when more bytes are needed.
    Result<std::optional<RpcMessage>> next();

    // The stream closed. A partially received frame is a framing error.
    VoidResult finish() const;

    qsizetype bufferedBytes() const { return m_buffer.size(); }
    bool hasFailed() const { return m_failure.has_value(); }
    void reset();

private:
    QByteArray m_buffer;
    qsizetype m_pendingBodyLength = -1;
    std::optional<BridgeFailure> m_failure;

    Result<bool> parseHeader();
    BridgeFailure fail(const QString& message);
};
