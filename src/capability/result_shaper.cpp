#include "result_shaper.h"
#include "protocol/uri.h"

namespace {

const char* const kSymbolKinds[] = {
    "file", "module", "namespace", "package", "class", "method", "property", "field",
    "constructor", "enum", "interface", "function", "variable", "constant", "string",
    "number", "boolean", "array", "object", "key", "null", "enum_member", "struct",
    "event", "operator", "type_parameter"
};

const char* const kCompletionKinds[] = {
    "text", "method", "function", "constructor", "field", "variable", "class", "interface",
    "module", "property", "unit", "value", "enum", "keyword", "snippet", "color", "file",
    "reference", "folder", "enum_member", "constant", "struct", "event", "operator",
    "type_parameter"
};

template <std::size_t N>
QString kindName(const char* const (&names)[N], int kind) {
    if (kind < 1 || kind > static_cast<int>(N))
        return QStringLiteral("unknown");
    return QString::fromLatin1(names[kind - 1]);
}

QJsonArray asArray(const QJsonValue& value) {
    if (value.isArray())
        return value.toArray();
    if (value.isObject())
        return QJsonArray{value};
    return {};
}

QJsonObject location(const QString& uri, const QJsonValue& range) {
    return QJsonObject{{"uri", uri}, {"path", DocumentUri::toPath(uri)}, {"range", range}};
}

// Documentation may be a plain string or MarkupContent.
QString markupText(const QJsonValue& value) {
    if (value.isString())
        return value.toString();
    return value.toObject().value(QStringLiteral("value")).toString();
}

QJsonObject symbolTree(const QJsonObject& sym) {
    QJsonObject out;
    out["name"] = sym.value(QStringLiteral("name"));
    out["kind"] = ResultShaper::symbolKindName(sym.value(QStringLiteral("kind")).toInt());
    if (sym.contains(QStringLiteral("detail")))
        out["detail"] = sym.value(QStringLiteral("detail"));
    out["range"] = sym.value(QStringLiteral("range"));
    out["selection_range"] = sym.value(QStringLiteral("selectionRange"));

    QJsonArray children;
    for (const QJsonValue& child : sym.value(QStringLiteral("children")).toArray())
        children.append(symbolTree(child.toObject()));
    out["children"] = children;
    return out;
}

} // namespace

namespace ResultShaper {

QString symbolKindName(int kind) { return kindName(kSymbolKinds, kind); }
QString completionKindName(int kind) { return kindName(kCompletionKinds, kind); }

QString severityName(int severity) {
    switch (severity) {
    case 1: return QStringLiteral("error");
    case 2: return QStringLiteral("warning");
    case 3: return QStringLiteral("information");
    case 4: return QStringLiteral("hint");
    default: return QStringLiteral("error");   // LSP: missing severity is up to the client
    }
}

QJsonValue hover(const QJsonValue& result) {
    if (!result.isObject())
        return QJsonValue::Null;

    const QJsonObject obj = result.toObject();
    const QJsonValue contents = obj.value(QStringLiteral("contents"));

    QString kind = QStringLiteral("markdown");
    QStringList parts;
    if (contents.isObject() && contents.toObject().contains(QStringLiteral("kind"))) {
        // MarkupContent
        kind = contents.toObject().value(QStringLiteral("kind")).toString();
        parts.append(contents.toObject().value(QStringLiteral("value")).toString());
    } else {
        // MarkedString | MarkedString[]
        const QJsonArray items = contents.isArray() ? contents.toArray() : QJsonArray{contents};
        for (const QJsonValue& item : items) {
            if (item.isString()) {
                parts.append(item.toString());
            } else if (item.isObject()) {
                const QJsonObject marked = item.toObject();
                parts.append(QStringLiteral("```%1\n%2\n```")
                                 .arg(marked.value(QStringLiteral("language")).toString(),
                                      marked.value(QStringLiteral("value")).toString()));
            }
        }
    }

    parts.removeAll(QString());
    if (parts.isEmpty())
        return QJsonValue::Null;

    QJsonObject out{{"kind", kind}, {"value", parts.join(QStringLiteral("\n\n"))}};
    if (obj.contains(QStringLiteral("range")))
        out["range"] = obj.value(QStringLiteral("range"));
    return out;
}

QJsonArray locations(const QJsonValue& result) {
    QJsonArray out;
    for (const QJsonValue& value : asArray(result)) {
        const QJsonObject loc = value.toObject();
        if (loc.contains(QStringLiteral("targetUri"))) {
            const QJsonValue range = loc.contains(QStringLiteral("targetSelectionRange"))
                ? loc.value(QStringLiteral("targetSelectionRange"))
                : loc.value(QStringLiteral("targetRange"));
            out.append(location(loc.value(QStringLiteral("targetUri")).toString(), range));
        } else if (loc.contains(QStringLiteral("uri"))) {
            out.append(location(loc.value(QStringLiteral("uri")).toString(), loc.value(QStringLiteral("range"))));
        }
    }
    return out;
}

QJsonObject completion(const QJsonValue& result) {
    bool incomplete = false;
    QJsonArray items;
    if (result.isArray()) {
        items = result.toArray();
    } else if (result.isObject()) {
        const QJsonObject list = result.toObject();
        incomplete = list.value(QStringLiteral("isIncomplete")).toBool();
        items = list.value(QStringLiteral("items")).toArray();
    }

    QJsonArray shaped;
    for (const QJsonValue& value : items) {
        const QJsonObject item = value.toObject();
        QJsonObject out;
        const QString label = item.value(QStringLiteral("label")).toString();
        out["label"] = label;
        out["kind"] = completionKindName(item.value(QStringLiteral("kind")).toInt());
        if (item.contains(QStringLiteral("detail")))
            out["detail"] = item.value(QStringLiteral("detail"));
        if (item.contains(QStringLiteral("documentation")))
            out["documentation"] = markupText(item.value(QStringLiteral("documentation")));

        QString insert = item.value(QStringLiteral("insertText")).toString();
        const QJsonObject textEdit = item.value(QStringLiteral("textEdit")).toObject();
        if (textEdit.contains(QStringLiteral("newText")))
            insert = textEdit.value(QStringLiteral("newText")).toString();
        out["insert_text"] = insert.isEmpty() ? label : insert;
        shaped.append(out);
    }
    return QJsonObject{{"is_incomplete", incomplete}, {"items", shaped}};
}

QJsonArray documentSymbols(const QJsonValue& result) {
    QJsonArray out;
    for (const QJsonValue& value : asArray(result)) {
        const QJsonObject sym = value.toObject();
        if (sym.contains(QStringLiteral("location"))) {
            // SymbolInformation: flat, position in location.range
            QJsonObject flat;
            flat["name"] = sym.value(QStringLiteral("name"));
            flat["kind"] = symbolKindName(sym.value(QStringLiteral("kind")).toInt());
            const QJsonValue range = sym.value(QStringLiteral("location")).toObject().value(QStringLiteral("range"));
            flat["range"] = range;
            flat["selection_range"] = range;
            if (sym.contains(QStringLiteral("containerName")))
                flat["container"] = sym.value(QStringLiteral("containerName"));
            flat["children"] = QJsonArray();
            out.append(flat);
        } else {
            out.append(symbolTree(sym));
        }
    }
    return out;
}

QJsonArray workspaceSymbols(const QJsonValue& result) {
    QJsonArray out;
    for (const QJsonValue& value : asArray(result)) {
        const QJsonObject sym = value.toObject();
        const QJsonObject loc = sym.value(QStringLiteral("location")).toObject();
        const QString uri = loc.value(QStringLiteral("uri")).toString();

        QJsonObject shaped;
        shaped["name"] = sym.value(QStringLiteral("name"));
        shaped["kind"] = symbolKindName(sym.value(QStringLiteral("kind")).toInt());
        if (sym.contains(QStringLiteral("containerName")))
            shaped["container"] = sym.value(QStringLiteral("containerName"));
        shaped["uri"] = uri;
        shaped["path"] = DocumentUri::toPath(uri);
        shaped["range"] = loc.contains(QStringLiteral("range")) ? loc.value(QStringLiteral("range"))
                                                                 : QJsonValue(QJsonValue::Null);
        out.append(shaped);
    }
    return out;
}

QJsonArray textEdits(const QJsonValue& result) {
    QJsonArray out;
    for (const QJsonValue& value : asArray(result)) {
        const QJsonObject edit = value.toObject();
        out.append(QJsonObject{{"range", edit.value(QStringLiteral("range"))},
                               {"new_text", edit.value(QStringLiteral("newText"))}});
    }
    return out;
}

QJsonArray codeActions(const QJsonValue& result) {
    QJsonArray out;
    for (const QJsonValue& value : asArray(result)) {
        const QJsonObject action = value.toObject();
        QJsonObject shaped;
        shaped["title"] = action.value(QStringLiteral("title"));

        // A bare Command has a string "command" member.
        if (action.value(QStringLiteral("command")).isString()) {
            shaped["is_preferred"] = false;
            shaped["diagnostics"] = QJsonArray();
            shaped["command"] = QJsonObject{{"command", action.value(QStringLiteral("command"))},
                                            {"arguments", action.value(QStringLiteral("arguments")).toArray()}};
            out.append(shaped);
            continue;
        }

        if (action.contains(QStringLiteral("kind")))
            shaped["kind"] = action.value(QStringLiteral("kind"));
        shaped["is_preferred"] = action.value(QStringLiteral("isPreferred")).toBool();
        QJsonArray diags;
        for (const QJsonValue& d : action.value(QStringLiteral("diagnostics")).toArray())
            diags.append(diagnostic(d.toObject()));
        shaped["diagnostics"] = diags;
        if (action.contains(QStringLiteral("edit")))
            shaped["edit"] = action.value(QStringLiteral("edit"));
        if (action.value(QStringLiteral("command")).isObject())
            shaped["command"] = action.value(QStringLiteral("command"));
        out.append(shaped);
    }
    return out;
}

QJsonObject diagnostic(const QJsonObject& item) {
    QJsonObject out;
    out["range"] = item.value(QStringLiteral("range"));
    out["severity"] = severityName(item.value(QStringLiteral("severity")).toInt());
    if (item.contains(QStringLiteral("code")))
        out["code"] = item.value(QStringLiteral("code"));
    if (item.contains(QStringLiteral("source")))
        out["source"] = item.value(QStringLiteral("source"));
    out["message"] = item.value(QStringLiteral("message"));

    QJsonArray related;
    for (const QJsonValue& r : item.value(QStringLiteral("relatedInformation")).toArray()) {
        const QJsonObject info = r.toObject();
        const QJsonObject loc = info.value(QStringLiteral("location")).toObject();
        QJsonObject shaped = location(loc.value(QStringLiteral("uri")).toString(), loc.value(QStringLiteral("range")));
        shaped["message"] = info.value(QStringLiteral("message"));
        related.append(shaped);
    }
    out["related"] = related;
    return out;
}

QJsonObject diagnosticsReport(const QString& uri, const std::optional<DiagnosticsEntry>& entry) {
    QJsonObject out;
    out["uri"] = uri;
    out["path"] = DocumentUri::toPath(uri);

    QJsonArray items;
    if (!entry) {
        out["source"] = diagnosticsSourceName(DiagnosticsSource::None);
        out["diagnostics"] = items;
        return out;
    }

    out["source"] = diagnosticsSourceName(entry->source);
    if (!entry->resultId.isEmpty())
        out["result_id"] = entry->resultId;
    out["received_at"] = entry->receivedAt.toString(Qt::ISODateWithMs);
    for (const QJsonValue& d : entry->items)
        items.append(diagnostic(d.toObject()));
    out["diagnostics"] = items;
    return out;
}

} // namespace ResultShaper
