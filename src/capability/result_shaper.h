#pragma once
#include "session/diagnostics_cache.h"
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

// Normalized capability results. Positions are zero-based LSP positions,
// ranges are {"start": {"line", "character"}, "end": {...}} and every
// location carries both the URI and the local path.
//
//   hover            {"kind": "markdown"|"plaintext", "value", "range"?} or null
//   definition       [{"uri", "path", "range"}]          (Location, Location[], LocationLink[])
//   references       [{"uri", "path", "range"}]
//   completion       {"is_incomplete", "items": [{"label", "kind", "detail"?,
//                     "documentation"?, "insert_text"}]}
//   symbols          [{"name", "kind", "detail"?, "range", "selection_range",
//                     "container"?, "children": [...]}]
//   workspace_symbols [{"name", "kind", "container"?, "uri", "path", "range"}]
//   format           [{"range", "new_text"}]
//   code_actions     [{"title", "kind"?, "is_preferred", "diagnostics", "edit"?, "command"?}]
//   diagnostics      {"uri", "path", "source": "push"|"pull"|"none", "result_id"?,
//                     "received_at"?, "diagnostics": [{"range", "severity", "code"?,
//                     "source"?, "message", "related": [...]}]}
//   workspace_diagnostics {"documents": [<diagnostics>...], "document_count",
//                     "diagnostic_count"}
//
// Kinds and severities are lower-case names ("function", "error").
namespace ResultShaper {

QJsonValue hover(const QJsonValue& result);
QJsonArray locations(const QJsonValue& result);
QJsonObject completion(const QJsonValue& result);
QJsonArray documentSymbols(const QJsonValue& result);
QJsonArray workspaceSymbols(const QJsonValue& result);
QJsonArray textEdits(const QJsonValue& result);
QJsonArray codeActions(const QJsonValue& result);

QJsonObject diagnostic(const QJsonObject& item);
QJsonObject diagnosticsReport(const QString& uri, const std::optional<DiagnosticsEntry>& entry);

QString symbolKindName(int kind);
QString completionKindName(int kind);
QString severityName(int severity);

} // namespace ResultShaper
