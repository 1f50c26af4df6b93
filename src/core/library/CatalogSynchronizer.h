#pragma once

#include "ArchiveEnumerator.h"
#include "IManifestExtractor.h"
#include "../SongData.h"

#include <QStringList>
#include <optional>

struct SyncStats {
    int found = 0;       // archives enumerated
    int skipped = 0;     // unchanged since last scan
    int extracted = 0;   // bass arrangement read
    int noBass = 0;      // no bass manifest, not an error
    int failed = 0;      // unreadable or corrupt
};

class CatalogSynchronizer {
public:
    // The extractor is not owned and must outlive the synchronizer.
    explicit CatalogSynchronizer(IManifestExtractor* extractor, bool decrypt = true);

    Catalog sync(const QStringList& folders, bool force,
                 const std::optional<Catalog>& existing = std::nullopt);

    const SyncStats& lastStats() const { return m_stats; }

    // 0 = QThread::idealThreadCount()
    void setMaxThreads(int threads) { m_maxThreads = threads; }

    // Dedup merge: may `candidate` take the slot currently held by `holder`?
    static bool shouldReplace(const SongEntry* holder, const SongEntry& candidate);

private:
    enum class Outcome { Extracted, NoBass, Failed };
    struct ArchiveResult {
        Outcome   outcome = Outcome::Failed;
        SongEntry entry;
    };

    ArchiveResult processArchive(const ArchiveFile& archive) const;

    IManifestExtractor* m_extractor;
    bool m_decrypt;
    int m_maxThreads = 0;
    SyncStats m_stats;
};
