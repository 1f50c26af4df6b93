#include "IdentifierMapBuilder.h"
#include "CatalogStore.h"
#include "ManifestReader.h"

#include <QCryptographicHash>
#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>
#include <QThreadPool>
#include <QtConcurrent>
#include <algorithm>

IdentifierMapBuilder::IdentifierMapBuilder(IManifestExtractor* extractor,
                                           const QString& cachePath,
                                           bool decrypt)
    : m_extractor(extractor)
    , m_cachePath(cachePath)
    , m_decrypt(decrypt)
{
}

// ── Archive-set hash ────────────────────────────────────────────────
// SHA-256 over the compact JSON array [[path, mtimeMs], ...] sorted by
// path, then mtime.
QString IdentifierMapBuilder::computeArchiveHash(const QVector<ArchiveFile>& archives)
{
    QVector<ArchiveFile> sorted = archives;
    std::sort(sorted.begin(), sorted.end(), [](const ArchiveFile& a, const ArchiveFile& b) {
        if (a.path != b.path) return a.path < b.path;
        return a.mtime < b.mtime;
    });

    QJsonArray entries;
    for (const ArchiveFile& a : sorted)
        entries.append(QJsonArray{ a.path, static_cast<double>(a.mtime) });

    const QByteArray serialized = QJsonDocument(entries).toJson(QJsonDocument::Compact);
    return QString::fromLatin1(
        QCryptographicHash::hash(serialized, QCryptographicHash::Sha256).toHex());
}

// ── Cache document ──────────────────────────────────────────────────
std::optional<IdentifierMapCache> IdentifierMapBuilder::loadCache(const QString& path)
{
    QFile file(path);
    if (!file.exists())
        return std::nullopt;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[IdMap] Cannot open cache" << path << ":" << file.errorString();
        return std::nullopt;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[IdMap] Ignoring corrupt cache" << path << ":" << err.errorString();
        return std::nullopt;
    }

    const QJsonObject root = doc.object();
    IdentifierMapCache cache;
    cache.version = root.value(QStringLiteral("version")).toInt(IdentifierMapCache::kFormatVersion);
    cache.archiveHash = root.value(QStringLiteral("archive_hash")).toString();

    const QJsonObject map = root.value(QStringLiteral("map")).toObject();
    for (auto it = map.constBegin(); it != map.constEnd(); ++it)
        cache.map.insert(it.key(), it.value().toString());

    return cache;
}

bool IdentifierMapBuilder::saveCache(const IdentifierMapCache& cache, const QString& path,
                                     QString* errorMessage)
{
    QJsonObject map;
    for (auto it = cache.map.cbegin(); it != cache.map.cend(); ++it)
        map.insert(it.key(), it.value());

    QJsonObject root{
        { QStringLiteral("version"), cache.version },
        { QStringLiteral("archive_hash"), cache.archiveHash },
        { QStringLiteral("map"), map },
    };
    return writeJsonDocument(path, root, errorMessage);
}

// ── build ───────────────────────────────────────────────────────────
IdentifierMap IdentifierMapBuilder::build(const QStringList& folders, bool force)
{
    m_lastCached = false;
    m_lastFailures = 0;

    const QVector<ArchiveFile> archives = ArchiveEnumerator::findArchives(folders);
    const QString currentHash = computeArchiveHash(archives);

    if (!force) {
        auto cached = loadCache(m_cachePath);
        if (cached && cached->archiveHash == currentHash) {
            qDebug() << "[IdMap] Cache hit (" << cached->map.size() << "entries)";
            m_lastCached = true;
            return cached->map;
        }
        if (cached)
            qDebug() << "[IdMap] Cache stale (hash mismatch), rebuilding";
    }

    if (archives.isEmpty())
        qWarning() << "[IdMap] No .psarc files found to build ID map from" << folders;

    QElapsedTimer timer; timer.start();
    QThreadPool pool;
    pool.setMaxThreadCount(m_maxThreads > 0 ? m_maxThreads : QThread::idealThreadCount());

    // std::nullopt marks an archive that could not be read
    using Partial = std::optional<IdentifierMap>;
    const QList<Partial> partials = QtConcurrent::blockingMapped<QList<Partial>>(
        &pool, archives, [this](const ArchiveFile& a) -> Partial {
            QFile file(a.path);
            if (!file.open(QIODevice::ReadOnly)) {
                qDebug() << "[IdMap] Failed to open" << QFileInfo(a.path).fileName()
                         << ":" << file.errorString();
                return std::nullopt;
            }
            auto content = m_extractor->extract(file, m_decrypt);
            if (!content) {
                qDebug() << "[IdMap] Failed to extract IDs from" << QFileInfo(a.path).fileName();
                return std::nullopt;
            }
            return ManifestReader::identifierPairs(*content);
        });

    // Later archives win on key collision
    IdentifierMapCache cache;
    cache.archiveHash = currentHash;
    for (const Partial& p : partials) {
        if (!p) {
            m_lastFailures++;
            continue;
        }
        for (auto it = p->cbegin(); it != p->cend(); ++it)
            cache.map.insert(it.key(), it.value());
    }

    if (m_lastFailures > 0)
        qWarning() << "[IdMap]" << m_lastFailures << "archive files failed during ID map build";

    QString error;
    if (!saveCache(cache, m_cachePath, &error))
        qWarning() << "[IdMap] Failed to write cache" << m_cachePath << ":" << error;
    else
        qDebug() << "[IdMap] Cached" << cache.map.size() << "entries ->" << m_cachePath
                 << "in" << timer.elapsed() << "ms";

    return cache.map;
}
