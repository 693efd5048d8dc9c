#include "failed_obligations.h"
#include <QJsonDocument>
#include <QUuid>

QJsonObject FailedObligationStore::addProofTree(const QJsonObject& tree) {
    const QJsonArray candidates = tree.value(QStringLiteral("candidates")).toArray();

    QJsonArray shaped;
    for (const QJsonValue& candidateValue : candidates) {
        const QJsonObject candidate = candidateValue.toObject();

        QJsonArray nestedSummaries;
        for (const QJsonValue& nestedValue : candidate.value(QStringLiteral("nested_goals")).toArray()) {
            const QJsonObject nested = nestedValue.toObject();
            const QJsonObject expanded = addProofTree(nested);

            QJsonObject summary;
            summary["goal"] = nested.value(QStringLiteral("goal"));
            summary["result"] = nested.value(QStringLiteral("result"));
            if (expanded.contains(QStringLiteral("goal_index"))) {
                const QString index = expanded.value(QStringLiteral("goal_index")).toString();
                m_goals.insert(index, expanded);
                summary["goal_index"] = index;
            }
            summary["candidates"] = nested.value(QStringLiteral("candidates")).toArray().size();
            nestedSummaries.append(summary);
        }

        QJsonObject out;
        out["kind"] = candidate.value(QStringLiteral("kind"));
        out["result"] = candidate.value(QStringLiteral("result"));
        out["impl_header"] = candidate.contains(QStringLiteral("impl_header"))
            ? candidate.value(QStringLiteral("impl_header"))
            : QJsonValue(QJsonValue::Null);
        out["nested_goals"] = nestedSummaries;
        shaped.append(out);
    }

    QJsonObject goal;
    goal["goal"] = tree.value(QStringLiteral("goal"));
    goal["result"] = tree.value(QStringLiteral("result"));
    if (!shaped.isEmpty())
        goal["goal_index"] = QUuid::createUuid().toString(QUuid::WithoutBraces);
    goal["candidates"] = shaped;
    return goal;
}

Result<QJsonArray> FailedObligationStore::ingest(const QJsonValue& backendResult) {
    if (backendResult.isNull() || backendResult.isUndefined())
        return QJsonArray();
    if (!backendResult.isString()) {
        return std::unexpected(BridgeFailure::backendError(
            static_cast<int>(RpcErrorCode::InternalError),
            QStringLiteral("getFailedObligations returned a non-string result")));
    }

    const QByteArray text = backendResult.toString().toUtf8();
    if (text.trimmed().isEmpty())
        return QJsonArray();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(text, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        return std::unexpected(BridgeFailure::backendError(
            static_cast<int>(RpcErrorCode::ParseError),
            QStringLiteral("getFailedObligations payload is not a JSON array: %1").arg(parseError.errorString())));
    }

    QJsonArray trees;
    for (const QJsonValue& value : doc.array()) {
        QJsonObject tree = addProofTree(value.toObject());
        tree.remove(QStringLiteral("goal_index"));
        trees.append(tree);
    }
    return trees;
}

Result<QJsonValue> FailedObligationStore::goals(const QJsonValue& goalIndex) const {
    QStringList indices;
    if (goalIndex.isString()) {
        indices.append(goalIndex.toString());
    } else if (goalIndex.isArray()) {
        for (const QJsonValue& v : goalIndex.toArray()) {
            if (v.isString())
                indices.append(v.toString());
        }
    } else {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("goal_index_type"), QStringLiteral("goal_index must be a string or array of strings")));
    }

    if (indices.isEmpty()) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("goal_index_missing"), QStringLiteral("at least one goal_index is required")));
    }

    QJsonArray found;
    for (const QString& index : indices) {
        auto it = m_goals.constFind(index);
        if (it == m_goals.constEnd()) {
            return std::unexpected(BridgeFailure::invalidParameter(
                QStringLiteral("goal_index_unknown"),
                QStringLiteral("invalid goal_index '%1' or expired data").arg(index)));
        }
        found.append(it.value());
    }

    if (found.size() == 1)
        return found.first();
    return found;
}
