#pragma once
#include "rpc/pending_call.h"
#include "protocol/types.h"
#include <QObject>
#include <optional>

class BridgeSession;

// Holds the single active workspace root. Switching roots drops every
// piece of state tied to the old one and tells the backend, either with a
// workspace-folders change notification or by re-running the handshake
// against a fresh process.
class WorkspaceManager : public QObject {
    Q_OBJECT
public:
    WorkspaceManager(BridgeSession* session, WorkspaceChangeStrategy strategy, QObject* parent = nullptr);

    // Absolute, existing directory; returns the cleaned path.
    static Result<QString> validateRoot(const QString& path);

    // Resolves with {"root", "previous", "changed", "strategy"}.
    PendingCall* setWorkspace(const QString& path);

    std::optional<QString> currentRoot() const;
    VoidResult requireWorkspace() const;

    WorkspaceChangeStrategy strategy() const { return m_strategy; }
    void setStrategy(WorkspaceChangeStrategy strategy) { m_strategy = strategy; }
    // What a change would do right now: Notify or Restart.
    WorkspaceChangeStrategy effectiveStrategy() const;

signals:
    void workspaceChanged(const QString& root, const QString& previous);

private:
    BridgeSession* m_session;
    WorkspaceChangeStrategy m_strategy;
    QString m_root;

    QJsonObject changeResult(const QString& previous, bool changed, const QString& strategy) const;
    QJsonObject workspaceFolder(const QString& root) const;
};
