#pragma once
#include "failed_obligations.h"
#include "rpc/pending_call.h"
#include <QObject>
#include <QJsonObject>
#include <functional>

class BridgeSession;
class WorkspaceManager;
class DocumentTracker;

struct DocumentTarget {
    QString path;   // local absolute path
    QString uri;
};

// One entry point per capability. Each validates its parameters, requires
// a Ready session (and a workspace where the call is workspace-wide),
// brings the document in sync with the disk, issues the backend requests
// and shapes the result as documented in result_shaper.h.
//
// Parameters: file_path (absolute path or file:// URI), line and character
// (zero-based), end_line/end_character for ranges, query, workspace_path,
// goal_index.
class CapabilityAdapter : public QObject {
    Q_OBJECT
public:
    CapabilityAdapter(BridgeSession* session, WorkspaceManager* workspace, QObject* parent = nullptr);

    static QStringList capabilityNames();
    // Dispatches by capability name; unknown names fail with InvalidParameter.
    PendingCall* invoke(const QString& name, const QJsonObject& params);

    PendingCall* hover(const QJsonObject& params);
    PendingCall* definition(const QJsonObject& params);
    PendingCall* references(const QJsonObject& params);
    PendingCall* completion(const QJsonObject& params);
    PendingCall* symbols(const QJsonObject& params);
    PendingCall* workspaceSymbols(const QJsonObject& params);
    PendingCall* format(const QJsonObject& params);
    PendingCall* codeActions(const QJsonObject& params);
    PendingCall* diagnostics(const QJsonObject& params);
    PendingCall* workspaceDiagnostics(const QJsonObject& params);
    PendingCall* failedObligations(const QJsonObject& params);
    PendingCall* failedObligationsGoal(const QJsonObject& params);
    PendingCall* setWorkspace(const QJsonObject& params);

    static Result<DocumentTarget> documentParam(const QJsonObject& params);
    static Result<QJsonObject> positionParam(const QJsonObject& params,
                                             const QString& lineKey = QStringLiteral("line"),
                                             const QString& characterKey = QStringLiteral("character"));

    DocumentTracker* documents() const { return m_documents; }
    const FailedObligationStore& obligations() const { return m_obligations; }

public slots:
    // Drops open documents and stored proof trees.
    void resetState();

private:
    using ParamsBuilder = std::function<Result<QJsonObject>(const DocumentTarget&)>;

    BridgeSession* m_session;
    WorkspaceManager* m_workspace;
    DocumentTracker* m_documents;
    FailedObligationStore m_obligations;

    Result<DocumentTarget> prepareDocument(const QJsonObject& params);
    PendingCall* documentRequest(const QString& capability, const QJsonObject& params,
                                 const QString& method, ParamsBuilder build,
                                 PendingCall::Shaper shaper);
    PendingCall* pullDiagnostics(const DocumentTarget& target);
    PendingCall* awaitPushedDiagnostics(const DocumentTarget& target);
};
