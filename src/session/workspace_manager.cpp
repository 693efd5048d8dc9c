#include "workspace_manager.h"
#include "bridge_session.h"
#include "diagnostics_cache.h"
#include "protocol/uri.h"
#include "config/config_types.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>

WorkspaceManager::WorkspaceManager(BridgeSession* session, WorkspaceChangeStrategy strategy, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_strategy(strategy)
    , m_root(session->rootPath())
{
}

Result<QString> WorkspaceManager::validateRoot(const QString& path) {
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("workspace_path_empty"), QStringLiteral("workspace path must not be empty")));
    }

    QString local = trimmed;
    if (DocumentUri::isFileUri(local))
        local = DocumentUri::toPath(local);

    if (QDir::isRelativePath(local)) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("workspace_path_relative"),
            QStringLiteral("workspace path must be absolute: %1").arg(trimmed)));
    }

    QFileInfo info(local);
    if (!info.exists()) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("workspace_path_missing"),
            QStringLiteral("workspace path does not exist: %1").arg(local)));
    }
    if (!info.isDir()) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("workspace_path_not_directory"),
            QStringLiteral("workspace path is not a directory: %1").arg(local)));
    }
    return QDir::cleanPath(info.absoluteFilePath());
}

std::optional<QString> WorkspaceManager::currentRoot() const {
    if (m_root.isEmpty())
        return std::nullopt;
    return m_root;
}

VoidResult WorkspaceManager::requireWorkspace() const {
    if (m_root.isEmpty()) {
        return std::unexpected(BridgeFailure::workspaceNotSet(
            QStringLiteral("no workspace root is set; call set_workspace first")));
    }
    return {};
}

WorkspaceChangeStrategy WorkspaceManager::effectiveStrategy() const {
    if (m_strategy != WorkspaceChangeStrategy::Auto)
        return m_strategy;
    return m_session->serverSupports(QStringLiteral("workspace.workspaceFolders.changeNotifications"))
        ? WorkspaceChangeStrategy::Notify
        : WorkspaceChangeStrategy::Restart;
}

QJsonObject WorkspaceManager::changeResult(const QString& previous, bool changed, const QString& strategy) const {
    QJsonObject obj;
    obj["root"] = m_root;
    obj["previous"] = previous.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(previous);
    obj["changed"] = changed;
    obj["strategy"] = strategy;
    return obj;
}

QJsonObject WorkspaceManager::workspaceFolder(const QString& root) const {
    return QJsonObject{{"uri", DocumentUri::fromPath(root)}, {"name", QFileInfo(root).fileName()}};
}

PendingCall* WorkspaceManager::setWorkspace(const QString& path) {
    const QString method = QStringLiteral("set_workspace");
    auto validated = validateRoot(path);
    if (!validated)
        return PendingCall::failed(validated.error(), method);

    const QString root = *validated;
    if (root == m_root)
        return PendingCall::succeeded(changeResult(m_root, false, QStringLiteral("none")), method);

    const SessionState state = m_session->state();
    if (state != SessionState::Uninitialized) {
        auto ready = m_session->requireReady();
        if (!ready)
            return PendingCall::failed(ready.error(), method);
    }

    const QString previous = m_root;
    m_root = root;
    m_session->setRootPath(root);
    m_session->diagnostics()->clear();
    LOG_CAT_INFO("workspace", QStringLiteral("workspace root %1 -> %2")
                                  .arg(previous.isEmpty() ? QStringLiteral("(none)") : previous, root));
    emit workspaceChanged(root, previous);

    if (state == SessionState::Uninitialized)
        return PendingCall::succeeded(changeResult(previous, true, QStringLiteral("none")), method);

    if (effectiveStrategy() == WorkspaceChangeStrategy::Notify) {
        QJsonArray removed;
        if (!previous.isEmpty())
            removed.append(workspaceFolder(previous));
        QJsonObject params{{"event", QJsonObject{{"added", QJsonArray{workspaceFolder(root)}},
                                                 {"removed", removed}}}};
        auto sent = m_session->notify(QStringLiteral("workspace/didChangeWorkspaceFolders"), params);
        if (!sent)
            return PendingCall::failed(sent.error(), method);
        return PendingCall::succeeded(changeResult(previous, true, workspaceChangeStrategyName(WorkspaceChangeStrategy::Notify)), method);
    }

    const QJsonObject result = changeResult(previous, true, workspaceChangeStrategyName(WorkspaceChangeStrategy::Restart));
    return m_session->rehandshake()->map([result](const QJsonValue&) -> Result<QJsonValue> {
        return result;
    });
}
