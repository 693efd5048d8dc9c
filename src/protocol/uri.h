#pragma once
#include <QString>

namespace DocumentUri {

// "file://" URIs pass through; anything else is treated as a local path.
QString fromPath(const QString& pathOrUri);

// Local path for a file:// URI, empty for any other scheme.
QString toPath(const QString& uri);

bool isFileUri(const QString& text);

// Canonical cache key. Different percent-encodings of the same file
// produce the same key.
QString key(const QString& uri);

} // namespace DocumentUri
