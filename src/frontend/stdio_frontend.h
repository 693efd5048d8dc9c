#pragma once
#include <QObject>
#include <QByteArray>
#include <QJsonValue>
#include <cstdio>

class CapabilityAdapter;
class QSocketNotifier;
struct BridgeFailure;

// Line-delimited JSON driver for the capability interface:
//   in:  {"id": <any>, "capability": "hover", "params": {...}}
//   out: {"id": <same>, "result": ...} or {"id": <same>, "error": {...}}
// Calls run concurrently; responses are written as they complete.
class StdioFrontend : public QObject {
    Q_OBJECT
public:
    StdioFrontend(CapabilityAdapter* capabilities, int inputFd, FILE* output, QObject* parent = nullptr);

    void start();
    void handleLine(const QByteArray& line);

    int inFlight() const { return m_inFlight; }

signals:
    // Input reached EOF and every call has been answered.
    void finished();

private slots:
    void onReadable();

private:
    CapabilityAdapter* m_capabilities;
    int m_inputFd;
    FILE* m_output;
    QSocketNotifier* m_notifier = nullptr;
    QByteArray m_buffer;
    int m_inFlight = 0;
    bool m_inputClosed = false;

    void writeResult(const QJsonValue& id, const QJsonValue& result);
    void writeError(const QJsonValue& id, const BridgeFailure& failure);
    void writeLine(const QJsonObject& obj);
    void maybeFinish();
};
