#pragma once

#include "../SongData.h"

#include <QJsonObject>

// Reads and writes the catalog document whole:
//   { "version": 1, "scanned_at": "...", "songs": { songId: entry } }
class CatalogStore {
public:
    // Missing file → empty catalog. Corrupt file → empty catalog and a warning.
    static Catalog load(const QString& path);
    static bool save(const Catalog& catalog, const QString& path, QString* errorMessage = nullptr);

    static QJsonObject toJson(const SongEntry& entry);
    static SongEntry songFromJson(const QJsonObject& obj);
};

// Shared by the catalog and identifier-map stores: atomic whole-file write.
bool writeJsonDocument(const QString& path, const QJsonObject& root, QString* errorMessage);
