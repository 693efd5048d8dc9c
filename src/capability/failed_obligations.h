#pragma once
#include "protocol/ports.h"
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>

// Proof trees from rust-analyzer/getFailedObligations, flattened so one
// level is returned at a time.
//
// The backend answers with a JSON string holding an array of proof trees:
//   {goal, result, depth, candidates: [{kind, result, impl_header,
//                                       nested_goals: [<tree>...]}]}
// ingest() returns the top-level trees with every nested goal replaced by
//   {goal, result, goal_index?, candidates: <count>}
// Nested goals that have candidates of their own are stored under a fresh
// goal_index and can be expanded later through goals().
class FailedObligationStore {
public:
    Result<QJsonArray> ingest(const QJsonValue& backendResult);

    // goalIndex is a string or an array of strings. One index yields one
    // tree, several yield an array.
    Result<QJsonValue> goals(const QJsonValue& goalIndex) const;

    int size() const { return m_goals.size(); }
    void clear() { m_goals.clear(); }

private:
    QHash<QString, QJsonObject> m_goals;

    QJsonObject addProofTree(const QJsonObject& tree);
};
