#pragma once

#include "ArchiveEnumerator.h"
#include "IManifestExtractor.h"

#include <QHash>
#include <QString>
#include <optional>

// Upper-cased internal id → catalog song id
using IdentifierMap = QHash<QString, QString>;

struct IdentifierMapCache {
    static constexpr int kFormatVersion = 1;

    IdentifierMap map;
    QString archiveHash;   // SHA-256 hex of the archive set the map was built from
    int version = kFormatVersion;
};

// Builds the internal-id map from every archive in scope, or returns the
// cached one when the archive set (paths + mtimes) has not changed.
class IdentifierMapBuilder {
public:
    // The extractor is not owned and must outlive the builder.
    IdentifierMapBuilder(IManifestExtractor* extractor, const QString& cachePath, bool decrypt = true);

    IdentifierMap build(const QStringList& folders, bool force);

    bool lastBuildWasCached() const { return m_lastCached; }
    int lastFailureCount() const { return m_lastFailures; }

    void setMaxThreads(int threads) { m_maxThreads = threads; }

    static QString computeArchiveHash(const QVector<ArchiveFile>& archives);

    // ── Cache document ───────────────────────────────────────────────
    // { "version": 1, "archive_hash": "...", "map": { id: songId } }
    static std::optional<IdentifierMapCache> loadCache(const QString& path);
    static bool saveCache(const IdentifierMapCache& cache, const QString& path,
                          QString* errorMessage = nullptr);

private:
    IManifestExtractor* m_extractor;
    QString m_cachePath;
    bool m_decrypt;
    int m_maxThreads = 0;

    bool m_lastCached = false;
    int m_lastFailures = 0;
};
