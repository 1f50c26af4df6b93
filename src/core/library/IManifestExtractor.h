#pragma once

#include <QByteArray>
#include <QHash>
#include <QString>
#include <optional>

class QIODevice;

// Internal entry path ("manifests/songs_dlc_abc/abc_bass.json") → raw bytes
using ArchiveContent = QHash<QString, QByteArray>;

// Reads one archive container's file table. The core never parses the
// container itself; implementations wrap an external reader.
class IManifestExtractor {
public:
    virtual ~IManifestExtractor() = default;

    // Returns std::nullopt when the archive is unreadable or corrupt.
    virtual std::optional<ArchiveContent> extract(QIODevice& archive, bool decrypt) = 0;
};
