#include "process_supervisor.h"
#include "core/log_manager.h"
#include <QFileInfo>
#include <QPointer>
#include <QProcessEnvironment>
#include <QStandardPaths>
#include <QTimer>

namespace {

constexpr int kStartTimeoutMs = 10000;
constexpr int kTermWaitMs = 500;
constexpr int kKillWaitMs = 2000;
// An exiting process closes stdout just before it is reaped.
constexpr int kStdoutCloseGraceMs = 250;

}

ProcessSupervisor::ProcessSupervisor(QObject* parent)
    : QObject(parent)
{
}

ProcessSupervisor::~ProcessSupervisor()
{
    if (isAlive())
        terminate(0);
    releaseProcess();
}

QString ProcessSupervisor::resolveExecutable(const QString& executable) {
    if (executable.trimmed().isEmpty())
        return {};

    if (executable.contains(QLatin1Char('/'))) {
        QFileInfo info(executable);
        if (info.exists() && info.isFile() && info.isExecutable())
            return info.absoluteFilePath();
        return {};
    }
    return QStandardPaths::findExecutable(executable);
}

void ProcessSupervisor::releaseProcess() {
    if (!m_process)
        return;
    QObject::disconnect(m_process, nullptr, this, nullptr);
    m_process->deleteLater();
    m_process = nullptr;
}

VoidResult ProcessSupervisor::start(const QString& executable, const QStringList& args) {
    if (isAlive()) {
        return std::unexpected(BridgeFailure::spawn(
            QStringLiteral("backend process is already running (pid %1)").arg(processId())));
    }
    releaseProcess();

    const QString program = resolveExecutable(executable);
    if (program.isEmpty()) {
        return std::unexpected(BridgeFailure::spawn(
            QStringLiteral("backend executable not found: %1").arg(executable)));
    }

    m_program = program;
    m_expectingExit = false;
    m_exitReported = false;
    m_stderrBuffer.clear();

    m_process = new QProcess(this);
    m_process->setProgram(program);
    m_process->setArguments(args);
    m_process->setProcessChannelMode(QProcess::SeparateChannels);
    if (!m_workingDirectory.isEmpty())
        m_process->setWorkingDirectory(m_workingDirectory);

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    for (auto it = m_env.constBegin(); it != m_env.constEnd(); ++it)
        env.insert(it.key(), it.value());
    m_process->setProcessEnvironment(env);

    connect(m_process, &QProcess::readyReadStandardOutput,
            this, &ProcessSupervisor::onReadyReadStdout);
    connect(m_process, &QProcess::readyReadStandardError,
            this, &ProcessSupervisor::onReadyReadStderr);
    connect(m_process, &QProcess::readChannelFinished,
            this, &ProcessSupervisor::onStdoutFinished);
    connect(m_process, &QProcess::finished,
            this, &ProcessSupervisor::onFinished);
    connect(m_process, &QProcess::errorOccurred,
            this, &ProcessSupervisor::onErrorOccurred);

    LOG_CAT_INFO("transport", QStringLiteral("starting backend: %1 %2")
                                  .arg(program, args.join(QLatin1Char(' '))));

    // Exits during the start-up probe are reported by start(), not exited().
    m_exitReported = true;
    m_process->start(QIODevice::ReadWrite);
    if (!m_process->waitForStarted(kStartTimeoutMs)) {
        const QString reason = m_process->errorString();
        releaseProcess();
        return std::unexpected(BridgeFailure::spawn(
            QStringLiteral("failed to start %1: %2").arg(program, reason)));
    }

    if (m_spawnProbeMs > 0 && m_process->waitForFinished(m_spawnProbeMs)) {
        const int code = m_process->exitCode();
        flushStderr(true);
        releaseProcess();
        return std::unexpected(BridgeFailure::spawn(
            QStringLiteral("backend %1 exited immediately with code %2").arg(program).arg(code)));
    }

    m_exitReported = false;
    LOG_CAT_INFO("transport", QStringLiteral("backend started (pid %1)").arg(processId()));
    return {};
}

bool ProcessSupervisor::isAlive() const {
    return m_process && m_process->state() != QProcess::NotRunning;
}

qint64 ProcessSupervisor::processId() const {
    return m_process ? m_process->processId() : 0;
}

VoidResult ProcessSupervisor::write(const QByteArray& bytes) {
    if (!isAlive())
        return std::unexpected(BridgeFailure::backendCrashed(QStringLiteral("backend process is not running")));

    qint64 written = m_process->write(bytes);
    if (written != bytes.size()) {
        return std::unexpected(BridgeFailure::backendCrashed(
            QStringLiteral("short write to backend stdin (%1 of %2 bytes): %3")
                .arg(written)
                .arg(bytes.size())
                .arg(m_process->errorString())));
    }
    return {};
}

void ProcessSupervisor::terminate(int graceMs) {
    if (!isAlive())
        return;

    m_expectingExit = true;
    LOG_CAT_INFO("transport", QStringLiteral("terminating backend (pid %1, grace %2 ms)")
                                  .arg(processId())
                                  .arg(graceMs));

    m_process->closeWriteChannel();
    if (graceMs > 0 && m_process->waitForFinished(graceMs))
        return;

    if (!isAlive())
        return;
    LOG_CAT_WARNING("transport", QStringLiteral("backend ignored the grace period, sending SIGTERM"));
    m_process->terminate();
    if (m_process->waitForFinished(kTermWaitMs))
        return;

    if (!isAlive())
        return;
    LOG_CAT_WARNING("transport", QStringLiteral("backend still running, killing it"));
    m_process->kill();
    m_process->waitForFinished(kKillWaitMs);
}

void ProcessSupervisor::onReadyReadStdout() {
    if (!m_process)
        return;
    const QByteArray bytes = m_process->readAllStandardOutput();
    if (!bytes.isEmpty())
        emit stdoutData(bytes);
}

void ProcessSupervisor::onStdoutFinished() {
    if (!m_process || m_expectingExit)
        return;
    QPointer<QProcess> process(m_process);
    QTimer::singleShot(kStdoutCloseGraceMs, this, [this, process]() {
        if (!process || process != m_process || m_expectingExit || m_exitReported || !isAlive())
            return;
        LOG_CAT_ERROR("transport", QStringLiteral("backend closed stdout but is still running (pid %1)")
                                       .arg(processId()));
        emit stdoutClosed();
    });
}

void ProcessSupervisor::onReadyReadStderr() {
    if (!m_process)
        return;
    m_stderrBuffer.append(m_process->readAllStandardError());
    flushStderr(false);
}

void ProcessSupervisor::flushStderr(bool all) {
    if (m_process)
        m_stderrBuffer.append(m_process->readAllStandardError());

    qsizetype newline = m_stderrBuffer.indexOf('\n');
    while (newline >= 0) {
        QByteArray line = m_stderrBuffer.left(newline);
        m_stderrBuffer.remove(0, newline + 1);
        if (line.endsWith('\r'))
            line.chop(1);
        const QString text = QString::fromUtf8(line);
        LOG_CAT_DEBUG("backend", text);
        emit stderrLine(text);
        newline = m_stderrBuffer.indexOf('\n');
    }

    if (all && !m_stderrBuffer.isEmpty()) {
        const QString text = QString::fromUtf8(m_stderrBuffer);
        m_stderrBuffer.clear();
        LOG_CAT_DEBUG("backend", text);
        emit stderrLine(text);
    }
}

void ProcessSupervisor::onFinished(int exitCode, QProcess::ExitStatus status) {
    if (m_exitReported)
        return;
    m_exitReported = true;

    // Deliver whatever the backend wrote before it left.
    onReadyReadStdout();
    flushStderr(true);

    const bool crashed = status == QProcess::CrashExit;
    if (m_expectingExit) {
        LOG_CAT_INFO("transport", QStringLiteral("backend exited (code %1)").arg(exitCode));
    } else {
        LOG_CAT_ERROR("transport", QStringLiteral("backend exited unexpectedly (code %1%2)")
                                       .arg(exitCode)
                                       .arg(crashed ? QStringLiteral(", crashed") : QString()));
    }
    emit exited(exitCode, crashed, m_expectingExit);
}

void ProcessSupervisor::onErrorOccurred(QProcess::ProcessError error) {
    if (!m_process)
        return;
    if (error == QProcess::FailedToStart) {
        // start() reports this synchronously
        return;
    }
    LOG_CAT_WARNING("transport", QStringLiteral("backend process error %1: %2")
                                     .arg(static_cast<int>(error))
                                     .arg(m_process->errorString()));
}
