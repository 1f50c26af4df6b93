#include "CatalogSynchronizer.h"
#include "ManifestReader.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QThreadPool>
#include <QtConcurrent>
#include <utility>

CatalogSynchronizer::CatalogSynchronizer(IManifestExtractor* extractor, bool decrypt)
    : m_extractor(extractor)
    , m_decrypt(decrypt)
{
}

// ── Merge rule ──────────────────────────────────────────────────────
// A release from the primary platform (_p) takes the slot from any other
// release. Secondary (_m) and unmarked releases only fill an empty slot or
// refresh their own entry. Between two primary releases the smaller path
// wins, so the survivor never depends on folder order.
bool CatalogSynchronizer::shouldReplace(const SongEntry* holder, const SongEntry& candidate)
{
    if (!holder)
        return true;
    if (holder->archivePath == candidate.archivePath)
        return true;
    if (ArchiveEnumerator::isSecondaryPlatform(candidate.archivePath))
        return false;
    if (!ArchiveEnumerator::isPrimaryPlatform(candidate.archivePath))
        return false;
    if (ArchiveEnumerator::isPrimaryPlatform(holder->archivePath))
        return candidate.archivePath < holder->archivePath;
    return true;
}

// ── processArchive (runs on worker threads) ─────────────────────────
CatalogSynchronizer::ArchiveResult CatalogSynchronizer::processArchive(const ArchiveFile& archive) const
{
    ArchiveResult result;

    QFile file(archive.path);
    if (!file.open(QIODevice::ReadOnly)) {
        qDebug() << "[Scan] Failed to open" << QFileInfo(archive.path).fileName()
                 << ":" << file.errorString();
        return result;
    }

    auto content = m_extractor->extract(file, m_decrypt);
    if (!content) {
        qDebug() << "[Scan] Failed to parse" << QFileInfo(archive.path).fileName();
        return result;
    }

    auto attrs = ManifestReader::bassManifestAttributes(*content);
    if (!attrs) {
        result.outcome = Outcome::NoBass;
        return result;
    }

    result.outcome = Outcome::Extracted;
    result.entry = ManifestReader::songEntryFromAttributes(*attrs, archive.path, archive.mtime);
    return result;
}

// ── sync ────────────────────────────────────────────────────────────
Catalog CatalogSynchronizer::sync(const QStringList& folders, bool force,
                                  const std::optional<Catalog>& existing)
{
    QElapsedTimer pipelineTimer; pipelineTimer.start();
    m_stats = SyncStats{};

    Catalog catalog = existing.value_or(Catalog{});

    const QVector<ArchiveFile> archives = ArchiveEnumerator::findArchives(folders);
    m_stats.found = archives.size();
    if (archives.isEmpty()) {
        qWarning() << "[Scan] No .psarc files found in" << folders;
        return catalog;
    }

    // ── Phase 1: Classify against cached mtimes ──────────────────────
    QHash<QString, qint64> cachedMtimes;   // path → mtime
    QHash<QString, SongEntry> merged;      // dedup key → entry
    for (const SongEntry& e : std::as_const(catalog.songs)) {
        if (!force)
            cachedMtimes.insert(e.archivePath, e.archiveMtime);
        merged.insert(dedupKey(e), e);
    }

    QVector<ArchiveFile> toProcess;
    toProcess.reserve(archives.size());
    for (const ArchiveFile& a : archives) {
        auto it = cachedMtimes.constFind(a.path);
        if (it != cachedMtimes.constEnd() && it.value() == a.mtime) {
            m_stats.skipped++;
            continue;
        }
        toProcess.append(a);
    }

    qDebug() << "[Scan] Phase 1 (classify):" << toProcess.size() << "to process,"
             << m_stats.skipped << "unchanged";

    // ── Phase 2: Parallel extraction ─────────────────────────────────
    QElapsedTimer stepTimer; stepTimer.start();
    QThreadPool pool;
    pool.setMaxThreadCount(m_maxThreads > 0 ? m_maxThreads : QThread::idealThreadCount());

    const QList<ArchiveResult> results = QtConcurrent::blockingMapped<QList<ArchiveResult>>(
        &pool, toProcess, [this](const ArchiveFile& a) { return processArchive(a); });

    qDebug() << "[Scan] Phase 2 (extract):" << toProcess.size() << "archives in"
             << stepTimer.elapsed() << "ms";

    // ── Phase 3: Serial merge in enumeration order ───────────────────
    for (const ArchiveResult& r : results) {
        switch (r.outcome) {
        case Outcome::Failed:
            m_stats.failed++;
            continue;
        case Outcome::NoBass:
            m_stats.noBass++;
            continue;
        case Outcome::Extracted:
            m_stats.extracted++;
            break;
        }

        const QString key = dedupKey(r.entry);
        auto it = merged.find(key);
        const SongEntry* holder = (it != merged.end()) ? &it.value() : nullptr;
        if (holder && holder->archivePath != r.entry.archivePath
            && ArchiveEnumerator::isPrimaryPlatform(holder->archivePath)
            && ArchiveEnumerator::isPrimaryPlatform(r.entry.archivePath)) {
            qWarning() << "[Scan] Duplicate primary releases for" << key << ":"
                       << holder->archivePath << "and" << r.entry.archivePath;
        }
        if (shouldReplace(holder, r.entry))
            merged.insert(key, r.entry);
    }

    // Rebuild catalog from deduped entries
    catalog.songs.clear();
    for (const SongEntry& e : std::as_const(merged))
        catalog.songs.insert(e.songId, e);
    catalog.updateTimestamp();

    if (m_stats.failed > 0)
        qWarning() << "[Scan]" << m_stats.failed << "archive files failed to parse";

    qDebug() << "[Scan] Complete:" << catalog.songs.size() << "songs,"
             << "extracted:" << m_stats.extracted
             << "skipped:" << m_stats.skipped
             << "no bass:" << m_stats.noBass
             << "failed:" << m_stats.failed
             << "in" << pipelineTimer.elapsed() << "ms";

    return catalog;
}
