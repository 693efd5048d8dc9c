#pragma once
#include "protocol/ports.h"
#include <QObject>
#include <QProcess>
#include <QMap>

// Owns the backend subprocess. It is the only reader of the child's stdout;
// bytes are handed on through stdoutData().
class ProcessSupervisor : public QObject {
    Q_OBJECT
public:
    explicit ProcessSupervisor(QObject* parent = nullptr);
    ~ProcessSupervisor() override;

    void setEnvironment(const QMap<QString, QString>& env) { m_env = env; }
    void setWorkingDirectory(const QString& dir) { m_workingDirectory = dir; }
    void setSpawnProbeMs(int ms) { m_spawnProbeMs = qMax(0, ms); }

    VoidResult start(const QString& executable, const QStringList& args);
    bool isAlive() const;
    qint64 processId() const;

    // Waits up to graceMs for the process to leave on its own (stdin closed),
    // then sends SIGTERM, then kills it.
    void terminate(int graceMs);

    VoidResult write(const QByteArray& bytes);

    static QString resolveExecutable(const QString& executable);

signals:
    void stdoutData(const QByteArray& bytes);
    void stderrLine(const QString& line);
    // expected is true when the exit follows terminate().
    void exited(int exitCode, bool crashed, bool expected);
    // stdout reached EOF while the process kept running.
    void stdoutClosed();

private slots:
    void onReadyReadStdout();
    void onStdoutFinished();
    void onReadyReadStderr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    QProcess* m_process = nullptr;
    QMap<QString, QString> m_env;
    QString m_workingDirectory;
    QString m_program;
    int m_spawnProbeMs = 50;
    bool m_expectingExit = false;
    bool m_exitReported = false;
    QByteArray m_stderrBuffer;

    void releaseProcess();
    void flushStderr(bool all);
};
