#include "capability_adapter.h"
#include "document_tracker.h"
#include "result_shaper.h"
#include "session/bridge_session.h"
#include "session/workspace_manager.h"
#include "session/diagnostics_cache.h"
#include "rpc/notification_router.h"
#include "rpc/subscription.h"
#include "protocol/uri.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QPointer>
#include <cmath>

namespace {

QJsonObject textDocument(const QString& uri) {
    return QJsonObject{{"uri", uri}};
}

bool positionBefore(const QJsonObject& a, const QJsonObject& b) {
    const int la = a.value(QStringLiteral("line")).toInt();
    const int lb = b.value(QStringLiteral("line")).toInt();
    if (la != lb)
        return la < lb;
    return a.value(QStringLiteral("character")).toInt() < b.value(QStringLiteral("character")).toInt();
}

bool rangesOverlap(const QJsonObject& a, const QJsonObject& b) {
    const QJsonObject aStart = a.value(QStringLiteral("start")).toObject();
    const QJsonObject aEnd = a.value(QStringLiteral("end")).toObject();
    const QJsonObject bStart = b.value(QStringLiteral("start")).toObject();
    const QJsonObject bEnd = b.value(QStringLiteral("end")).toObject();
    return !positionBefore(aEnd, bStart) && !positionBefore(bEnd, aStart);
}

Result<int> nonNegativeInt(const QJsonObject& params, const QString& key) {
    const QJsonValue value = params.value(key);
    if (value.isUndefined()) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("missing_%1").arg(key), QStringLiteral("%1 is required").arg(key)));
    }
    const double number = value.toDouble(-1);
    if (!value.isDouble() || number < 0 || std::floor(number) != number || number > 2147483647.0) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("invalid_%1").arg(key),
            QStringLiteral("%1 must be a non-negative integer").arg(key)));
    }
    return static_cast<int>(number);
}

} // namespace

CapabilityAdapter::CapabilityAdapter(BridgeSession* session, WorkspaceManager* workspace, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_workspace(workspace)
    , m_documents(new DocumentTracker(session, session->config().server.languageIds, this))
{
    connect(m_session, &BridgeSession::sessionReset, this, &CapabilityAdapter::resetState);
    connect(m_workspace, &WorkspaceManager::workspaceChanged, this, &CapabilityAdapter::resetState);
}

void CapabilityAdapter::resetState() {
    m_documents->clear();
    m_obligations.clear();
}

QStringList CapabilityAdapter::capabilityNames() {
    return {
        QStringLiteral("hover"),
        QStringLiteral("definition"),
        QStringLiteral("references"),
        QStringLiteral("completion"),
        QStringLiteral("symbols"),
        QStringLiteral("workspace_symbols"),
        QStringLiteral("format"),
        QStringLiteral("code_actions"),
        QStringLiteral("diagnostics"),
        QStringLiteral("workspace_diagnostics"),
        QStringLiteral("failed_obligations"),
        QStringLiteral("failed_obligations_goal"),
        QStringLiteral("set_workspace"),
    };
}

PendingCall* CapabilityAdapter::invoke(const QString& name, const QJsonObject& params) {
    using Entry = PendingCall* (CapabilityAdapter::*)(const QJsonObject&);
    static const QHash<QString, Entry> entries = {
        {QStringLiteral("hover"), &CapabilityAdapter::hover},
        {QStringLiteral("definition"), &CapabilityAdapter::definition},
        {QStringLiteral("references"), &CapabilityAdapter::references},
        {QStringLiteral("completion"), &CapabilityAdapter::completion},
        {QStringLiteral("symbols"), &CapabilityAdapter::symbols},
        {QStringLiteral("workspace_symbols"), &CapabilityAdapter::workspaceSymbols},
        {QStringLiteral("format"), &CapabilityAdapter::format},
        {QStringLiteral("code_actions"), &CapabilityAdapter::codeActions},
        {QStringLiteral("diagnostics"), &CapabilityAdapter::diagnostics},
        {QStringLiteral("workspace_diagnostics"), &CapabilityAdapter::workspaceDiagnostics},
        {QStringLiteral("failed_obligations"), &CapabilityAdapter::failedObligations},
        {QStringLiteral("failed_obligations_goal"), &CapabilityAdapter::failedObligationsGoal},
        {QStringLiteral("set_workspace"), &CapabilityAdapter::setWorkspace},
    };

    auto it = entries.constFind(name);
    if (it == entries.constEnd()) {
        return PendingCall::failed(BridgeFailure::invalidParameter(
            QStringLiteral("unknown_capability"), QStringLiteral("unknown capability: %1").arg(name)), name);
    }
    LOG_CAT_DEBUG("capability", QStringLiteral("invoke %1").arg(name));
    return (this->*it.value())(params);
}

// ---------------------------------------------------------------------------
// Parameter validation
// ---------------------------------------------------------------------------

Result<DocumentTarget> CapabilityAdapter::documentParam(const QJsonObject& params) {
    const QJsonValue value = params.value(QStringLiteral("file_path"));
    if (!value.isString() || value.toString().trimmed().isEmpty()) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("missing_file_path"), QStringLiteral("file_path is required")));
    }

    const QString raw = value.toString().trimmed();
    QString path = raw;
    if (DocumentUri::isFileUri(raw)) {
        path = DocumentUri::toPath(raw);
    } else if (QDir::isRelativePath(raw)) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("relative_file_path"),
            QStringLiteral("file_path must be absolute or a file:// URI: %1").arg(raw)));
    }

    QFileInfo info(path);
    if (path.isEmpty() || !info.exists() || !info.isFile()) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("file_not_found"), QStringLiteral("no such file: %1").arg(raw)));
    }

    DocumentTarget target;
    target.path = QDir::cleanPath(info.absoluteFilePath());
    target.uri = DocumentUri::isFileUri(raw) ? raw : DocumentUri::fromPath(target.path);
    return target;
}

Result<QJsonObject> CapabilityAdapter::positionParam(const QJsonObject& params,
                                                     const QString& lineKey,
                                                     const QString& characterKey) {
    auto line = nonNegativeInt(params, lineKey);
    if (!line)
        return std::unexpected(line.error());
    auto character = nonNegativeInt(params, characterKey);
    if (!character)
        return std::unexpected(character.error());
    return QJsonObject{{"line", *line}, {"character", *character}};
}

Result<DocumentTarget> CapabilityAdapter::prepareDocument(const QJsonObject& params) {
    auto target = documentParam(params);
    if (!target)
        return target;
    auto ready = m_session->requireReady();
    if (!ready)
        return std::unexpected(ready.error());
    auto synced = m_documents->sync(target->path, target->uri);
    if (!synced)
        return std::unexpected(synced.error());
    return target;
}

PendingCall* CapabilityAdapter::documentRequest(const QString& capability, const QJsonObject& params,
                                                const QString& method, ParamsBuilder build,
                                                PendingCall::Shaper shaper) {
    auto target = documentParam(params);
    if (!target)
        return PendingCall::failed(target.error(), capability);
    auto requestParams = build(*target);
    if (!requestParams)
        return PendingCall::failed(requestParams.error(), capability);

    auto prepared = prepareDocument(params);
    if (!prepared)
        return PendingCall::failed(prepared.error(), capability);

    return m_session->request(method, *requestParams)->map(std::move(shaper));
}

// ---------------------------------------------------------------------------
// Document queries
// ---------------------------------------------------------------------------

PendingCall* CapabilityAdapter::hover(const QJsonObject& params) {
    return documentRequest(QStringLiteral("hover"), params, QStringLiteral("textDocument/hover"),
        [&params](const DocumentTarget& target) -> Result<QJsonObject> {
            auto position = positionParam(params);
            if (!position)
                return std::unexpected(position.error());
            return QJsonObject{{"textDocument", textDocument(target.uri)}, {"position", *position}};
        },
        [](const QJsonValue& result) -> Result<QJsonValue> { return ResultShaper::hover(result); });
}

PendingCall* CapabilityAdapter::definition(const QJsonObject& params) {
    return documentRequest(QStringLiteral("definition"), params, QStringLiteral("textDocument/definition"),
        [&params](const DocumentTarget& target) -> Result<QJsonObject> {
            auto position = positionParam(params);
            if (!position)
                return std::unexpected(position.error());
            return QJsonObject{{"textDocument", textDocument(target.uri)}, {"position", *position}};
        },
        [](const QJsonValue& result) -> Result<QJsonValue> { return ResultShaper::locations(result); });
}

PendingCall* CapabilityAdapter::references(const QJsonObject& params) {
    return documentRequest(QStringLiteral("references"), params, QStringLiteral("textDocument/references"),
        [&params](const DocumentTarget& target) -> Result<QJsonObject> {
            auto position = positionParam(params);
            if (!position)
                return std::unexpected(position.error());
            const bool includeDeclaration = params.value(QStringLiteral("include_declaration")).toBool(true);
            return QJsonObject{{"textDocument", textDocument(target.uri)},
                               {"position", *position},
                               {"context", QJsonObject{{"includeDeclaration", includeDeclaration}}}};
        },
        [](const QJsonValue& result) -> Result<QJsonValue> { return ResultShaper::locations(result); });
}

PendingCall* CapabilityAdapter::completion(const QJsonObject& params) {
    return documentRequest(QStringLiteral("completion"), params, QStringLiteral("textDocument/completion"),
        [&params](const DocumentTarget& target) -> Result<QJsonObject> {
            auto position = positionParam(params);
            if (!position)
                return std::unexpected(position.error());
            return QJsonObject{{"textDocument", textDocument(target.uri)}, {"position", *position}};
        },
        [](const QJsonValue& result) -> Result<QJsonValue> { return ResultShaper::completion(result); });
}

PendingCall* CapabilityAdapter::symbols(const QJsonObject& params) {
    return documentRequest(QStringLiteral("symbols"), params, QStringLiteral("textDocument/documentSymbol"),
        [](const DocumentTarget& target) -> Result<QJsonObject> {
            return QJsonObject{{"textDocument", textDocument(target.uri)}};
        },
        [](const QJsonValue& result) -> Result<QJsonValue> { return ResultShaper::documentSymbols(result); });
}

PendingCall* CapabilityAdapter::format(const QJsonObject& params) {
    return documentRequest(QStringLiteral("format"), params, QStringLiteral("textDocument/formatting"),
        [&params](const DocumentTarget& target) -> Result<QJsonObject> {
            const int tabSize = params.value(QStringLiteral("tab_size")).toInt(4);
            if (tabSize <= 0) {
                return std::unexpected(BridgeFailure::invalidParameter(
                    QStringLiteral("invalid_tab_size"), QStringLiteral("tab_size must be positive")));
            }
            const bool insertSpaces = params.value(QStringLiteral("insert_spaces")).toBool(true);
            return QJsonObject{{"textDocument", textDocument(target.uri)},
                               {"options", QJsonObject{{"tabSize", tabSize}, {"insertSpaces", insertSpaces}}}};
        },
        [](const QJsonValue& result) -> Result<QJsonValue> { return ResultShaper::textEdits(result); });
}

PendingCall* CapabilityAdapter::codeActions(const QJsonObject& params) {
    DiagnosticsCache* cache = m_session->diagnostics();
    return documentRequest(QStringLiteral("code_actions"), params, QStringLiteral("textDocument/codeAction"),
        [&params, cache](const DocumentTarget& target) -> Result<QJsonObject> {
            auto start = positionParam(params);
            if (!start)
                return std::unexpected(start.error());

            QJsonObject end = *start;
            if (params.contains(QStringLiteral("end_line")) || params.contains(QStringLiteral("end_character"))) {
                auto explicitEnd = positionParam(params, QStringLiteral("end_line"), QStringLiteral("end_character"));
                if (!explicitEnd)
                    return std::unexpected(explicitEnd.error());
                end = *explicitEnd;
            }
            if (positionBefore(end, *start)) {
                return std::unexpected(BridgeFailure::invalidParameter(
                    QStringLiteral("invalid_range"), QStringLiteral("range end precedes its start")));
            }
            const QJsonObject range{{"start", *start}, {"end", end}};

            // Hand the backend the known diagnostics under the range so it can offer quick fixes.
            QJsonArray diagnostics;
            if (auto entry = cache->entry(target.uri)) {
                for (const QJsonValue& d : entry->items) {
                    if (rangesOverlap(d.toObject().value(QStringLiteral("range")).toObject(), range))
                        diagnostics.append(d);
                }
            }
            return QJsonObject{{"textDocument", textDocument(target.uri)},
                               {"range", range},
                               {"context", QJsonObject{{"diagnostics", diagnostics}}}};
        },
        [](const QJsonValue& result) -> Result<QJsonValue> { return ResultShaper::codeActions(result); });
}

PendingCall* CapabilityAdapter::workspaceSymbols(const QJsonObject& params) {
    const QString capability = QStringLiteral("workspace_symbols");
    const QJsonValue query = params.value(QStringLiteral("query"));
    if (!query.isString()) {
        return PendingCall::failed(BridgeFailure::invalidParameter(
            QStringLiteral("missing_query"), QStringLiteral("query must be a string")), capability);
    }
    auto ready = m_session->requireReady();
    if (!ready)
        return PendingCall::failed(ready.error(), capability);
    auto workspace = m_workspace->requireWorkspace();
    if (!workspace)
        return PendingCall::failed(workspace.error(), capability);

    return m_session->request(QStringLiteral("workspace/symbol"), QJsonObject{{"query", query}})
        ->map([](const QJsonValue& result) -> Result<QJsonValue> {
            return ResultShaper::workspaceSymbols(result);
        });
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

PendingCall* CapabilityAdapter::diagnostics(const QJsonObject& params) {
    auto target = prepareDocument(params);
    if (!target)
        return PendingCall::failed(target.error(), QStringLiteral("diagnostics"));

    if (m_session->config().diagnostics.preferPull && m_session->serverSupports(QStringLiteral("diagnosticProvider")))
        return pullDiagnostics(*target);

    if (auto entry = m_session->diagnostics()->entry(target->uri))
        return PendingCall::succeeded(ResultShaper::diagnosticsReport(target->uri, entry), QStringLiteral("diagnostics"));
    // A zero wait means the cache alone answers.
    if (m_session->config().diagnostics.pushWaitMs <= 0)
        return PendingCall::succeeded(ResultShaper::diagnosticsReport(target->uri, std::nullopt), QStringLiteral("diagnostics"));
    return awaitPushedDiagnostics(*target);
}

PendingCall* CapabilityAdapter::pullDiagnostics(const DocumentTarget& target) {
    DiagnosticsCache* cache = m_session->diagnostics();
    QJsonObject request{{"textDocument", textDocument(target.uri)}};
    const QString previous = cache->previousResultId(target.uri);
    if (!previous.isEmpty())
        request["previousResultId"] = previous;

    QPointer<DiagnosticsCache> guard(cache);
    const QString uri = target.uri;
    return m_session->request(QStringLiteral("textDocument/diagnostic"), request)
        ->map([guard, uri](const QJsonValue& result) -> Result<QJsonValue> {
            if (!guard)
                return std::unexpected(BridgeFailure::sessionTerminated(QStringLiteral("session is gone")));

            const QJsonObject report = result.toObject();
            const QString kind = report.value(QStringLiteral("kind")).toString();
            if (kind == QStringLiteral("full")) {
                guard->recordPull(uri, report.value(QStringLiteral("items")).toArray(),
                                  report.value(QStringLiteral("resultId")).toString());
            } else if (kind != QStringLiteral("unchanged")) {
                LOG_CAT_WARNING("capability", QStringLiteral("unexpected diagnostic report kind '%1'").arg(kind));
            }
            // Serve the newest arrival, which may be a push that beat this pull.
            return ResultShaper::diagnosticsReport(uri, guard->entry(uri));
        });
}

PendingCall* CapabilityAdapter::awaitPushedDiagnostics(const DocumentTarget& target) {
    const QString uri = target.uri;
    const QString key = DocumentUri::key(uri);
    Subscription* sub = m_session->router()->subscribe(
        [key](const QString& method, const QJsonValue& params) {
            return method == QLatin1String(NotificationRouter::kPublishDiagnostics)
                && DocumentUri::key(params.toObject().value(QStringLiteral("uri")).toString()) == key;
        },
        m_session->config().diagnostics.pushWaitMs, true);

    auto* call = new PendingCall(0, QStringLiteral("diagnostics"));
    sub->setParent(call);
    QPointer<DiagnosticsCache> cache(m_session->diagnostics());
    connect(sub, &Subscription::finished, call, [call, sub, cache, uri]() {
        const Result<QJsonValue>& outcome = sub->result();
        if (!outcome && outcome.error().kind != ErrorKind::NotificationTimeout) {
            call->resolve(std::unexpected(outcome.error()));
            return;
        }
        // On NotificationTimeout the report is simply empty.
        call->resolve(ResultShaper::diagnosticsReport(uri, cache ? cache->entry(uri) : std::nullopt));
    });
    call->setCanceller([sub]() {
        sub->close(BridgeFailure::cancelled(QStringLiteral("diagnostics wait was cancelled")));
    });
    return call;
}

PendingCall* CapabilityAdapter::workspaceDiagnostics(const QJsonObject& params) {
    Q_UNUSED(params);
    const QString capability = QStringLiteral("workspace_diagnostics");
    auto ready = m_session->requireReady();
    if (!ready)
        return PendingCall::failed(ready.error(), capability);
    auto workspace = m_workspace->requireWorkspace();
    if (!workspace)
        return PendingCall::failed(workspace.error(), capability);

    QPointer<DiagnosticsCache> guard(m_session->diagnostics());
    auto collect = [guard]() -> QJsonValue {
        QJsonArray documents;
        int count = 0;
        if (guard) {
            for (const DiagnosticsEntry& entry : guard->entries()) {
                count += entry.items.size();
                documents.append(ResultShaper::diagnosticsReport(entry.uri, entry));
            }
        }
        return QJsonObject{{"documents", documents},
                           {"document_count", documents.size()},
                           {"diagnostic_count", count}};
    };

    if (!m_session->config().diagnostics.preferPull
        || !m_session->serverSupports(QStringLiteral("diagnosticProvider.workspaceDiagnostics"))) {
        return PendingCall::succeeded(collect(), capability);
    }

    QJsonArray previous;
    for (const DiagnosticsEntry& entry : m_session->diagnostics()->entries()) {
        if (entry.source == DiagnosticsSource::Pull && !entry.resultId.isEmpty())
            previous.append(QJsonObject{{"uri", entry.uri}, {"value", entry.resultId}});
    }

    return m_session->request(QStringLiteral("workspace/diagnostic"), QJsonObject{{"previousResultIds", previous}})
        ->map([guard, collect](const QJsonValue& result) -> Result<QJsonValue> {
            if (!guard)
                return std::unexpected(BridgeFailure::sessionTerminated(QStringLiteral("session is gone")));
            for (const QJsonValue& value : result.toObject().value(QStringLiteral("items")).toArray()) {
                const QJsonObject report = value.toObject();
                if (report.value(QStringLiteral("kind")).toString() != QStringLiteral("full"))
                    continue;
                guard->recordPull(report.value(QStringLiteral("uri")).toString(),
                                  report.value(QStringLiteral("items")).toArray(),
                                  report.value(QStringLiteral("resultId")).toString());
            }
            return collect();
        });
}

// ---------------------------------------------------------------------------
// rust-analyzer extensions
// ---------------------------------------------------------------------------

PendingCall* CapabilityAdapter::failedObligations(const QJsonObject& params) {
    QPointer<CapabilityAdapter> self(this);
    return documentRequest(QStringLiteral("failed_obligations"), params,
        QStringLiteral("rust-analyzer/getFailedObligations"),
        [&params](const DocumentTarget& target) -> Result<QJsonObject> {
            auto position = positionParam(params);
            if (!position)
                return std::unexpected(position.error());
            return QJsonObject{{"textDocument", textDocument(target.uri)}, {"position", *position}};
        },
        [self](const QJsonValue& result) -> Result<QJsonValue> {
            if (!self)
                return std::unexpected(BridgeFailure::sessionTerminated(QStringLiteral("bridge is gone")));
            auto trees = self->m_obligations.ingest(result);
            if (!trees)
                return std::unexpected(trees.error());
            return *trees;
        });
}

PendingCall* CapabilityAdapter::failedObligationsGoal(const QJsonObject& params) {
    const QString capability = QStringLiteral("failed_obligations_goal");
    auto ready = m_session->requireReady();
    if (!ready)
        return PendingCall::failed(ready.error(), capability);

    auto goals = m_obligations.goals(params.value(QStringLiteral("goal_index")));
    if (!goals)
        return PendingCall::failed(goals.error(), capability);
    return PendingCall::succeeded(*goals, capability);
}

// ---------------------------------------------------------------------------
// Workspace
// ---------------------------------------------------------------------------

PendingCall* CapabilityAdapter::setWorkspace(const QJsonObject& params) {
    const QJsonValue path = params.value(QStringLiteral("workspace_path"));
    if (!path.isString()) {
        return PendingCall::failed(BridgeFailure::invalidParameter(
            QStringLiteral("missing_workspace_path"), QStringLiteral("workspace_path is required")),
            QStringLiteral("set_workspace"));
    }
    return m_workspace->setWorkspace(path.toString());
}
