#pragma once
#include "protocol/types.h"
#include <QObject>
#include <QDateTime>
#include <QHash>
#include <QJsonArray>
#include <optional>

struct DiagnosticsEntry {
    QString uri;
    QJsonArray items;
    DiagnosticsSource source = DiagnosticsSource::None;
    QString resultId;              // pull reports only
    std::optional<int> version;    // push reports only, when the backend sends one
    QDateTime receivedAt;
    quint64 sequence = 0;          // arrival order across the whole cache
};

// Most recent diagnostics per document, whichever delivery model they came
// through. Every record replaces the previous entry: last writer wins by
// arrival. Written by the notification router (push) and the capability
// layer (pull); cleared on a workspace switch or a new backend process.
class DiagnosticsCache : public QObject {
    Q_OBJECT
public:
    explicit DiagnosticsCache(QObject* parent = nullptr);

    void recordPush(const QString& uri, const QJsonArray& items, std::optional<int> version = std::nullopt);
    void recordPull(const QString& uri, const QJsonArray& items, const QString& resultId);

    std::optional<DiagnosticsEntry> entry(const QString& uri) const;
    // resultId of the last full pull report for uri, even when a push has
    // replaced the entry since. Sent back as previousResultId.
    QString previousResultId(const QString& uri) const;
    QList<DiagnosticsEntry> entries() const;

    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    quint64 lastSequence() const { return m_sequence; }

    void clear();

signals:
    void updated(const QString& uri, DiagnosticsSource source);
    void cleared();

private:
    QHash<QString, DiagnosticsEntry> m_entries;
    QHash<QString, QString> m_pullResultIds;
    quint64 m_sequence = 0;

    void store(DiagnosticsEntry entry);
};
