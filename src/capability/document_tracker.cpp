#include "document_tracker.h"
#include "session/bridge_session.h"
#include "protocol/uri.h"
#include "core/log_manager.h"
#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonObject>

DocumentTracker::DocumentTracker(BridgeSession* session, const QMap<QString, QString>& languageIds, QObject* parent)
    : QObject(parent)
    , m_session(session)
    , m_languageIds(languageIds)
{
}

QString DocumentTracker::languageIdFor(const QString& path) const {
    const QString suffix = QFileInfo(path).suffix().toLower();
    return m_languageIds.value(suffix, QStringLiteral("plaintext"));
}

bool DocumentTracker::isOpen(const QString& uri) const {
    return m_documents.contains(DocumentUri::key(uri));
}

int DocumentTracker::version(const QString& uri) const {
    return m_documents.value(DocumentUri::key(uri)).version;
}

void DocumentTracker::clear() {
    if (!m_documents.isEmpty())
        LOG_CAT_DEBUG("capability", QStringLiteral("forgetting %1 open document(s)").arg(m_documents.size()));
    m_documents.clear();
}

VoidResult DocumentTracker::sync(const QString& path, const QString& uri) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(BridgeFailure::invalidParameter(
            QStringLiteral("file_unreadable"),
            QStringLiteral("cannot read %1: %2").arg(path, file.errorString())));
    }
    const QByteArray content = file.readAll();
    const QByteArray digest = QCryptographicHash::hash(content, QCryptographicHash::Sha1);
    const QString text = QString::fromUtf8(content);
    const QString key = DocumentUri::key(uri);

    auto it = m_documents.find(key);
    if (it == m_documents.end()) {
        TrackedDocument doc;
        doc.uri = uri;
        doc.languageId = languageIdFor(path);
        doc.version = 1;
        doc.digest = digest;

        QJsonObject item{{"uri", uri}, {"languageId", doc.languageId}, {"version", doc.version}, {"text", text}};
        auto sent = m_session->notify(QStringLiteral("textDocument/didOpen"), QJsonObject{{"textDocument", item}});
        if (!sent)
            return sent;
        LOG_CAT_DEBUG("capability", QStringLiteral("opened %1 as %2").arg(uri, doc.languageId));
        m_documents.insert(key, doc);
        return {};
    }

    if (it->digest == digest)
        return {};

    const int nextVersion = it->version + 1;
    QJsonObject params{
        {"textDocument", QJsonObject{{"uri", it->uri}, {"version", nextVersion}}},
        {"contentChanges", QJsonArray{QJsonObject{{"text", text}}}}
    };
    auto sent = m_session->notify(QStringLiteral("textDocument/didChange"), params);
    if (!sent)
        return sent;
    it->version = nextVersion;
    it->digest = digest;
    LOG_CAT_DEBUG("capability", QStringLiteral("%1 changed on disk, now version %2").arg(uri).arg(nextVersion));
    return {};
}
