#include "diagnostics_cache.h"
#include "protocol/uri.h"
#include "core/log_manager.h"
#include <algorithm>

DiagnosticsCache::DiagnosticsCache(QObject* parent)
    : QObject(parent)
{
}

void DiagnosticsCache::recordPush(const QString& uri, const QJsonArray& items, std::optional<int> version) {
    DiagnosticsEntry entry;
    entry.uri = uri;
    entry.items = items;
    entry.source = DiagnosticsSource::Push;
    entry.version = version;
    store(std::move(entry));
}

void DiagnosticsCache::recordPull(const QString& uri, const QJsonArray& items, const QString& resultId) {
    DiagnosticsEntry entry;
    entry.uri = uri;
    entry.items = items;
    entry.source = DiagnosticsSource::Pull;
    entry.resultId = resultId;
    if (resultId.isEmpty())
        m_pullResultIds.remove(DocumentUri::key(uri));
    else
        m_pullResultIds.insert(DocumentUri::key(uri), resultId);
    store(std::move(entry));
}

void DiagnosticsCache::store(DiagnosticsEntry entry) {
    entry.receivedAt = QDateTime::currentDateTimeUtc();
    entry.sequence = ++m_sequence;

    const QString uri = entry.uri;
    const DiagnosticsSource source = entry.source;
    LOG_CAT_DEBUG("router", QStringLiteral("diagnostics %1 for %2: %3 item(s)")
                                .arg(diagnosticsSourceName(source), uri)
                                .arg(entry.items.size()));
    m_entries.insert(DocumentUri::key(uri), std::move(entry));
    emit updated(uri, source);
}

std::optional<DiagnosticsEntry> DiagnosticsCache::entry(const QString& uri) const {
    auto it = m_entries.constFind(DocumentUri::key(uri));
    if (it == m_entries.constEnd())
        return std::nullopt;
    return it.value();
}

QString DiagnosticsCache::previousResultId(const QString& uri) const {
    return m_pullResultIds.value(DocumentUri::key(uri));
}

QList<DiagnosticsEntry> DiagnosticsCache::entries() const {
    QList<DiagnosticsEntry> list = m_entries.values();
    std::sort(list.begin(), list.end(), [](const DiagnosticsEntry& a, const DiagnosticsEntry& b) {
        return a.uri < b.uri;
    });
    return list;
}

void DiagnosticsCache::clear() {
    m_pullResultIds.clear();
    if (m_entries.isEmpty())
        return;
    LOG_CAT_INFO("router", QStringLiteral("dropping cached diagnostics for %1 document(s)").arg(m_entries.size()));
    m_entries.clear();
    emit cleared();
}
