#pragma once
#include "protocol/ports.h"
#include <QHash>
#include <QMap>
#include <QObject>

class BridgeSession;

struct TrackedDocument {
    QString uri;
    QString languageId;
    int version = 0;
    QByteArray digest;
};

// Keeps the backend's view of a document in line with the file on disk:
// didOpen the first time a document is queried, a full-text didChange when
// the file has changed since.
class DocumentTracker : public QObject {
    Q_OBJECT
public:
    DocumentTracker(BridgeSession* session, const QMap<QString, QString>& languageIds, QObject* parent = nullptr);

    // path is a local absolute path; uri is the URI sent to the backend.
    VoidResult sync(const QString& path, const QString& uri);

    bool isOpen(const QString& uri) const;
    int version(const QString& uri) const;
    int openCount() const { return m_documents.size(); }

    QString languageIdFor(const QString& path) const;

public slots:
    void clear();

private:
    BridgeSession* m_session;
    QMap<QString, QString> m_languageIds;
    QHash<QString, TrackedDocument> m_documents;
};
