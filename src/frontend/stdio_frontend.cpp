#include "stdio_frontend.h"
#include "capability/capability_adapter.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QSocketNotifier>
#include <cerrno>
#include <cstring>
#include <unistd.h>

StdioFrontend::StdioFrontend(CapabilityAdapter* capabilities, int inputFd, FILE* output, QObject* parent)
    : QObject(parent)
    , m_capabilities(capabilities)
    , m_inputFd(inputFd)
    , m_output(output)
{
}

void StdioFrontend::start() {
    m_notifier = new QSocketNotifier(m_inputFd, QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &StdioFrontend::onReadable);
    LOG_INFO(QStringLiteral("reading capability calls from stdin"));
}

void StdioFrontend::onReadable() {
    char chunk[65536];
    const ssize_t n = ::read(m_inputFd, chunk, sizeof(chunk));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN)
            return;
        LOG_ERROR(QStringLiteral("stdin read failed: %1").arg(QString::fromLocal8Bit(strerror(errno))));
    }

    if (n <= 0) {
        m_notifier->setEnabled(false);
        m_inputClosed = true;
        if (!m_buffer.trimmed().isEmpty())
            handleLine(m_buffer);
        m_buffer.clear();
        maybeFinish();
        return;
    }

    m_buffer.append(chunk, n);
    qsizetype newline = m_buffer.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = m_buffer.left(newline);
        m_buffer.remove(0, newline + 1);
        if (!line.trimmed().isEmpty())
            handleLine(line);
        newline = m_buffer.indexOf('\n');
    }
}

void StdioFrontend::handleLine(const QByteArray& line) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (!doc.isObject()) {
        writeError(QJsonValue::Null, BridgeFailure::invalidParameter(
            QStringLiteral("malformed_call"),
            QStringLiteral("expected a JSON object per line: %1").arg(parseError.errorString())));
        return;
    }

    const QJsonObject call = doc.object();
    const QJsonValue id = call.value(QStringLiteral("id"));
    const QString capability = call.value(QStringLiteral("capability")).toString();
    if (capability.isEmpty()) {
        writeError(id, BridgeFailure::invalidParameter(
            QStringLiteral("missing_capability"), QStringLiteral("capability is required")));
        return;
    }

    PendingCall* pending = m_capabilities->invoke(capability, call.value(QStringLiteral("params")).toObject());
    ++m_inFlight;
    pending->then(this, [this, pending, id](const Result<QJsonValue>& result) {
        pending->deleteLater();
        --m_inFlight;
        if (result)
            writeResult(id, *result);
        else
            writeError(id, result.error());
        maybeFinish();
    });
}

void StdioFrontend::writeResult(const QJsonValue& id, const QJsonValue& result) {
    writeLine(QJsonObject{{"id", id}, {"result", result}});
}

void StdioFrontend::writeError(const QJsonValue& id, const BridgeFailure& failure) {
    writeLine(QJsonObject{{"id", id}, {"error", failure.toJson().value(QStringLiteral("error"))}});
}

void StdioFrontend::writeLine(const QJsonObject& obj) {
    QByteArray bytes = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    bytes.append('\n');
    if (std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), m_output) != static_cast<size_t>(bytes.size()))
        LOG_ERROR(QStringLiteral("failed to write a response to stdout"));
    std::fflush(m_output);
}

void StdioFrontend::maybeFinish() {
    if (m_inputClosed && m_inFlight == 0)
        emit finished();
}
