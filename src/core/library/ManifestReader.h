#pragma once

#include "IManifestExtractor.h"
#include "../SongData.h"

#include <QJsonObject>
#include <QStringList>
#include <optional>

// Interprets the JSON manifests of one archive.
class ManifestReader {
public:
    // manifests/…_bass.json
    static bool isBassManifest(const QString& entryPath);

    // Attributes of the bass arrangement. Candidate manifests are visited in
    // sorted path order and the richest non-empty attribute block wins.
    // std::nullopt when the archive carries no bass arrangement.
    static std::optional<QJsonObject> bassManifestAttributes(const ArchiveContent& content,
                                                             QString* manifestPath = nullptr);

    static SongEntry songEntryFromAttributes(const QJsonObject& attrs,
                                             const QString& archivePath,
                                             qint64 archiveMtime);

    // Upper-cased internal (persistent) id → song id for every bass entry
    static QHash<QString, QString> identifierPairs(const ArchiveContent& content);

    static QString songIdFromAttributes(const QJsonObject& attrs);

private:
    static QStringList sortedBassManifests(const ArchiveContent& content);
    static std::optional<QJsonObject> parseEntries(const QByteArray& json);
};
