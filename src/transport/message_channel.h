#pragma once
#include "frame_codec.h"
#include "protocol/ports.h"
#include <QObject>

class ProcessSupervisor;

// Joins the supervisor's byte streams with the framer. Outgoing messages are
// encoded and written as one frame each; incoming bytes are decoded and
// demultiplexed by message kind.
class MessageChannel : public QObject, public IMessageWriter {
    Q_OBJECT
public:
    explicit MessageChannel(ProcessSupervisor* supervisor, QObject* parent = nullptr);

    VoidResult write(const RpcMessage& message) override;

    // Forgets any partial frame; used when a new backend process starts.
    void reset();

    // Called once the backend's stdout has closed. Fails when a header or
    // body was cut off mid-frame.
    VoidResult endOfStream();

    quint64 framesWritten() const { return m_framesWritten; }
    quint64 framesRead() const { return m_framesRead; }

signals:
    void responseReceived(const RpcResponse& response);
    void notificationReceived(const RpcNotification& notification);
    void requestReceived(const RpcRequest& request);
    void framingError(const BridgeFailure& failure);

private slots:
    void onStdoutData(const QByteArray& bytes);
    void onStdoutClosed();

private:
    ProcessSupervisor* m_supervisor;
    FrameDecoder m_decoder;
    quint64 m_framesWritten = 0;
    quint64 m_framesRead = 0;
};
