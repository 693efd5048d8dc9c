#include "uri.h"
#include <QDir>
#include <QUrl>

namespace DocumentUri {

bool isFileUri(const QString& text) {
    return text.startsWith(QStringLiteral("file://"));
}

QString fromPath(const QString& pathOrUri) {
    if (isFileUri(pathOrUri))
        return pathOrUri;
    return QUrl::fromLocalFile(QDir::cleanPath(pathOrUri)).toString(QUrl::FullyEncoded);
}

QString toPath(const QString& uri) {
    const QUrl url(uri);
    if (!url.isLocalFile())
        return {};
    return QDir::cleanPath(url.toLocalFile());
}

QString key(const QString& uri) {
    const QString path = toPath(uri);
    if (!path.isEmpty())
        return QStringLiteral("file://") + path;
    return uri;
}

} // namespace DocumentUri
