#include "Commands.h"

#include "../core/Settings.h"
#include "../core/SongData.h"
#include "../core/Techniques.h"
#include "../core/library/CatalogStore.h"
#include "../core/library/CatalogSynchronizer.h"
#include "../core/library/ExternalManifestExtractor.h"
#include "../core/library/IdentifierMapBuilder.h"
#include "../core/profile/ProfileParser.h"
#include "../core/profile/SaveDecoder.h"
#include "../core/profile/SaveLocator.h"
#include "../core/recommend/RecommendationEngine.h"

#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <algorithm>
#include <optional>
#include <utility>

namespace {

QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

QTextStream& err()
{
    static QTextStream s(stderr);
    return s;
}

// Returns -1 when the command should go on, an exit status otherwise
int parseArgs(QCommandLineParser& parser, const QStringList& args)
{
    const QCommandLineOption helpOption = parser.addHelpOption();
    if (!parser.parse(args)) {
        err() << parser.errorText() << Qt::endl;
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        out() << parser.helpText();
        out().flush();
        return ExitOk;
    }
    if (!parser.positionalArguments().isEmpty()) {
        err() << "Unexpected argument: " << parser.positionalArguments().first() << Qt::endl;
        return ExitUsage;
    }
    return -1;
}

bool checkTechnique(const QString& technique)
{
    if (technique.isEmpty() || Techniques::isKnown(technique))
        return true;
    err() << "Unknown technique: " << technique << Qt::endl;
    err() << "Available: " << Techniques::manifestTechniques().join(QStringLiteral(", ")) << Qt::endl;
    return false;
}

// --dir values, or the configured folders when none is given
std::optional<QStringList> resolveFolders(const QStringList& dirs, const Settings& settings)
{
    if (dirs.isEmpty())
        return settings.archiveFolders();

    QStringList folders;
    for (const QString& d : dirs) {
        QFileInfo fi(d);
        if (!fi.isDir()) {
            err() << "Not a directory: " << d << Qt::endl;
            return std::nullopt;
        }
        folders.append(fi.absoluteFilePath());
    }
    return folders;
}

std::optional<Catalog> loadCatalogOrComplain(const Settings& settings)
{
    Catalog catalog = CatalogStore::load(settings.catalogPath());
    if (catalog.songs.isEmpty()) {
        err() << "No catalog found. Run 'basstutor scan' first." << Qt::endl;
        return std::nullopt;
    }
    return catalog;
}

QString fixed(double v, int decimals)
{
    return QString::number(v, 'f', decimals);
}

QString songLabel(const Catalog& catalog, const QString& songId)
{
    auto it = catalog.songs.constFind(songId);
    if (it == catalog.songs.constEnd())
        return songId;
    return it->artist + QStringLiteral(" - ") + it->title;
}

QString techniqueColumn(const SongEntry& song)
{
    const QStringList techs = song.techniqueList();
    QString text = techs.mid(0, 4).join(QStringLiteral(", "));
    if (techs.size() > 4)
        text += QStringLiteral(" +%1").arg(techs.size() - 4);
    return text;
}

enum class SaveStatus { Loaded, NotFound, Failed };

// Locates (unless given) and decodes the save, then maps it through idMap
SaveStatus loadProfile(const QString& explicitPath, const Settings& settings,
                       const IdentifierMap& idMap, PlayerProfile* profile)
{
    QString path = explicitPath;
    if (path.isEmpty()) {
        auto found = SaveLocator::findLatest(settings.userDataRoot());
        if (!found)
            return SaveStatus::NotFound;
        path = *found;
    } else if (!QFileInfo::exists(path)) {
        err() << "Save file not found: " << path << Qt::endl;
        return SaveStatus::Failed;
    }

    qInfo() << "[Profile] Reading" << path;
    SaveDecodeError decodeError;
    auto doc = SaveDecoder::decode(path, &decodeError);
    if (!doc) {
        err() << "Could not decode " << QDir::toNativeSeparators(path) << ": "
              << decodeError.errorString() << Qt::endl;
        return SaveStatus::Failed;
    }

    *profile = ProfileParser::parse(doc->object(), idMap);
    return SaveStatus::Loaded;
}

QString ceilingDescription(CeilingSource source)
{
    switch (source) {
    case CeilingSource::Competent: return QStringLiteral("85th percentile of competent songs");
    case CeilingSource::Played:    return QStringLiteral("70th percentile of played songs");
    case CeilingSource::Beginner:  return QStringLiteral("beginner default");
    }
    return QString();
}

} // namespace

// ── scan ────────────────────────────────────────────────────────────
int Commands::scan(const QStringList& args, Settings& settings)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Scan archive folders and update the song catalog."));
    QCommandLineOption forceOption(QStringLiteral("force"),
                                   QStringLiteral("Re-extract every archive, ignoring the cache."));
    QCommandLineOption dirOption(QStringLiteral("dir"),
                                 QStringLiteral("Archive folder to scan (repeatable)."),
                                 QStringLiteral("path"));
    parser.addOption(forceOption);
    parser.addOption(dirOption);
    if (int rc = parseArgs(parser, args); rc >= 0)
        return rc;

    auto folders = resolveFolders(parser.values(dirOption), settings);
    if (!folders)
        return ExitUsage;

    const QString catalogPath = settings.catalogPath();
    std::optional<Catalog> existing;
    if (QFileInfo::exists(catalogPath))
        existing = CatalogStore::load(catalogPath);

    ExternalManifestExtractor extractor(settings.extractorCommand(), settings.extractorTimeoutMs());
    CatalogSynchronizer synchronizer(&extractor, settings.extractorDecrypt());
    Catalog catalog = synchronizer.sync(*folders, parser.isSet(forceOption), existing);

    QString error;
    if (!CatalogStore::save(catalog, catalogPath, &error)) {
        err() << "Could not write catalog: " << error << Qt::endl;
        return ExitFailure;
    }

    const SyncStats& stats = synchronizer.lastStats();
    out() << "Archives: " << stats.found
          << " (" << stats.extracted << " extracted, "
          << stats.skipped << " unchanged, "
          << stats.noBass << " without bass, "
          << stats.failed << " failed)" << Qt::endl;
    out() << "Catalog: " << catalog.songCount() << " songs -> "
          << QDir::toNativeSeparators(catalogPath) << Qt::endl;
    return ExitOk;
}

// ── catalog ─────────────────────────────────────────────────────────
int Commands::catalog(const QStringList& args, Settings& settings)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Browse the song catalog."));
    QCommandLineOption techniqueOption(QStringList{ QStringLiteral("t"), QStringLiteral("technique") },
                                       QStringLiteral("Only songs using this technique."),
                                       QStringLiteral("name"));
    QCommandLineOption artistOption(QStringList{ QStringLiteral("a"), QStringLiteral("artist") },
                                    QStringLiteral("Only artists containing this text."),
                                    QStringLiteral("text"));
    QCommandLineOption sortOption(QStringLiteral("sort"),
                                  QStringLiteral("Sort order: name, difficulty or tempo."),
                                  QStringLiteral("key"), QStringLiteral("name"));
    parser.addOption(techniqueOption);
    parser.addOption(artistOption);
    parser.addOption(sortOption);
    if (int rc = parseArgs(parser, args); rc >= 0)
        return rc;

    const QString technique = parser.value(techniqueOption);
    if (!checkTechnique(technique))
        return ExitUsage;

    const QString sortKey = parser.value(sortOption);
    if (sortKey != QLatin1String("name") && sortKey != QLatin1String("difficulty")
        && sortKey != QLatin1String("tempo")) {
        err() << "Unknown sort key: " << sortKey << " (name, difficulty, tempo)" << Qt::endl;
        return ExitUsage;
    }

    auto catalog = loadCatalogOrComplain(settings);
    if (!catalog)
        return ExitFailure;

    const QString artist = parser.value(artistOption);
    QVector<SongEntry> songs;
    if (!technique.isEmpty())
        songs = catalog->songsWithTechnique(technique);
    else if (!artist.isEmpty())
        songs = catalog->songsByArtist(artist);
    else
        songs = QVector<SongEntry>(catalog->songs.cbegin(), catalog->songs.cend());

    if (!technique.isEmpty() && !artist.isEmpty()) {
        songs.erase(std::remove_if(songs.begin(), songs.end(), [&](const SongEntry& s) {
                        return !s.artist.contains(artist, Qt::CaseInsensitive);
                    }),
                    songs.end());
    }

    auto byName = [](const SongEntry& a, const SongEntry& b) {
        const int c = QString::compare(a.artist, b.artist, Qt::CaseInsensitive);
        if (c != 0) return c < 0;
        return QString::compare(a.title, b.title, Qt::CaseInsensitive) < 0;
    };
    if (sortKey == QLatin1String("difficulty")) {
        std::stable_sort(songs.begin(), songs.end(), byName);
        std::stable_sort(songs.begin(), songs.end(), [](const SongEntry& a, const SongEntry& b) {
            return a.difficultyHard < b.difficultyHard;
        });
    } else if (sortKey == QLatin1String("tempo")) {
        std::stable_sort(songs.begin(), songs.end(), byName);
        std::stable_sort(songs.begin(), songs.end(), [](const SongEntry& a, const SongEntry& b) {
            return a.tempo < b.tempo;
        });
    } else {
        std::sort(songs.begin(), songs.end(), byName);
    }

    out() << "Bass Catalog (" << songs.size() << " songs)" << Qt::endl;
    out() << QStringLiteral("Artist").leftJustified(24) << "  "
          << QStringLiteral("Song").leftJustified(28) << "  "
          << QStringLiteral("BPM").rightJustified(4) << "  "
          << QStringLiteral("Diff").rightJustified(5) << "  "
          << QStringLiteral("Notes").rightJustified(5) << "  "
          << QStringLiteral("Techniques") << Qt::endl;
    for (const SongEntry& s : std::as_const(songs)) {
        out() << s.artist.leftJustified(24, QLatin1Char(' '), true) << "  "
              << s.title.leftJustified(28, QLatin1Char(' '), true) << "  "
              << fixed(s.tempo, 0).rightJustified(4) << "  "
              << fixed(s.difficultyHard, 2).rightJustified(5) << "  "
              << QString::number(s.notesHard).rightJustified(5) << "  "
              << techniqueColumn(s) << Qt::endl;
        const QString sections = s.sectionSummary();
        if (!sections.isEmpty())
            out() << QString(4, QLatin1Char(' ')) << sections.left(60) << Qt::endl;
    }
    return ExitOk;
}

// ── idmap ───────────────────────────────────────────────────────────
int Commands::idmap(const QStringList& args, Settings& settings)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Build the save-file identifier map."));
    QCommandLineOption forceOption(QStringLiteral("force"),
                                   QStringLiteral("Rebuild even when the archive set is unchanged."));
    QCommandLineOption dirOption(QStringLiteral("dir"),
                                 QStringLiteral("Archive folder to read (repeatable)."),
                                 QStringLiteral("path"));
    parser.addOption(forceOption);
    parser.addOption(dirOption);
    if (int rc = parseArgs(parser, args); rc >= 0)
        return rc;

    auto folders = resolveFolders(parser.values(dirOption), settings);
    if (!folders)
        return ExitUsage;

    ExternalManifestExtractor extractor(settings.extractorCommand(), settings.extractorTimeoutMs());
    IdentifierMapBuilder builder(&extractor, settings.idMapPath(), settings.extractorDecrypt());
    const IdentifierMap map = builder.build(*folders, parser.isSet(forceOption));

    out() << "Identifier map: " << map.size() << " entries"
          << (builder.lastBuildWasCached() ? " (cached)" : "") << Qt::endl;
    if (builder.lastFailureCount() > 0)
        out() << builder.lastFailureCount() << " archives could not be read" << Qt::endl;
    return ExitOk;
}

// ── profile ─────────────────────────────────────────────────────────
int Commands::profile(const QStringList& args, Settings& settings)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show per-song progress from the save file."));
    QCommandLineOption profileOption(QStringLiteral("profile"),
                                     QStringLiteral("Save file to read instead of the newest one found."),
                                     QStringLiteral("path"));
    parser.addOption(profileOption);
    if (int rc = parseArgs(parser, args); rc >= 0)
        return rc;

    ExternalManifestExtractor extractor(settings.extractorCommand(), settings.extractorTimeoutMs());
    IdentifierMapBuilder builder(&extractor, settings.idMapPath(), settings.extractorDecrypt());
    const IdentifierMap idMap = builder.build(settings.archiveFolders(), false);

    PlayerProfile profile;
    switch (loadProfile(parser.value(profileOption), settings, idMap, &profile)) {
    case SaveStatus::Loaded:
        break;
    case SaveStatus::NotFound:
        err() << "No save file found under "
              << QDir::toNativeSeparators(settings.userDataRoot()) << Qt::endl;
        return ExitFailure;
    case SaveStatus::Failed:
        return ExitFailure;
    }

    const Catalog catalog = CatalogStore::load(settings.catalogPath());

    QVector<SongProgress> rows(profile.songs.cbegin(), profile.songs.cend());
    std::sort(rows.begin(), rows.end(), [&](const SongProgress& a, const SongProgress& b) {
        const int c = QString::compare(songLabel(catalog, a.songId), songLabel(catalog, b.songId),
                                       Qt::CaseInsensitive);
        if (c != 0) return c < 0;
        return a.persistentId < b.persistentId;
    });

    out() << QStringLiteral("Song").leftJustified(40) << "  "
          << QStringLiteral("Plays").rightJustified(5) << "  "
          << QStringLiteral("E/M/H/X") << "  "
          << QStringLiteral("Score").rightJustified(9) << "  "
          << QStringLiteral("DD").rightJustified(5) << "  "
          << QStringLiteral("Status") << Qt::endl;
    for (const SongProgress& p : std::as_const(rows)) {
        QString status;
        if (p.isMastered())
            status = QStringLiteral("mastered");
        else if (p.isCompetent())
            status = QStringLiteral("competent");
        else if (p.isPlayed())
            status = QStringLiteral("played");

        out() << songLabel(catalog, p.songId).leftJustified(40, QLatin1Char(' '), true) << "  "
              << QString::number(p.playCount).rightJustified(5) << "  "
              << QStringLiteral("%1/%2/%3/%4").arg(p.badgeEasy).arg(p.badgeMedium)
                     .arg(p.badgeHard).arg(p.badgeMaster).leftJustified(7) << "  "
              << fixed(p.highScoreHard, 0).rightJustified(9) << "  "
              << fixed(p.dynamicDifficultyAvg, 2).rightJustified(5) << "  "
              << status << Qt::endl;
    }

    out() << rows.size() << " songs, "
          << profile.playedSongIds().size() << " played, "
          << profile.competentSongIds().size() << " competent, "
          << profile.masteredSongIds().size() << " mastered" << Qt::endl;
    return ExitOk;
}

// ── recommend ───────────────────────────────────────────────────────
int Commands::recommend(const QStringList& args, Settings& settings)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Recommend songs just above your comfort level."));
    QCommandLineOption countOption(QStringList{ QStringLiteral("n"), QStringLiteral("count") },
                                   QStringLiteral("Number of songs to list."),
                                   QStringLiteral("n"),
                                   QString::number(settings.recommendationCount()));
    QCommandLineOption zoneOption(QStringList{ QStringLiteral("z"), QStringLiteral("zone") },
                                  QStringLiteral("Only this zone: warm-up, growth, challenge or reach."),
                                  QStringLiteral("zone"));
    QCommandLineOption techniqueOption(QStringList{ QStringLiteral("t"), QStringLiteral("technique") },
                                       QStringLiteral("Only songs using this technique."),
                                       QStringLiteral("name"));
    QCommandLineOption profileOption(QStringLiteral("profile"),
                                     QStringLiteral("Save file to read instead of the newest one found."),
                                     QStringLiteral("path"));
    QCommandLineOption rebuildOption(QStringLiteral("rebuild-ids"),
                                     QStringLiteral("Rebuild the identifier map before reading the save."));
    parser.addOption(countOption);
    parser.addOption(zoneOption);
    parser.addOption(techniqueOption);
    parser.addOption(profileOption);
    parser.addOption(rebuildOption);
    if (int rc = parseArgs(parser, args); rc >= 0)
        return rc;

    bool countOk = false;
    const int count = parser.value(countOption).toInt(&countOk);
    if (!countOk || count <= 0) {
        err() << "Invalid count: " << parser.value(countOption) << Qt::endl;
        return ExitUsage;
    }

    std::optional<Zone> zone;
    if (parser.isSet(zoneOption)) {
        zone = zoneFromName(parser.value(zoneOption));
        if (!zone) {
            err() << "Unknown zone: " << parser.value(zoneOption)
                  << " (warm-up, growth, challenge, reach)" << Qt::endl;
            return ExitUsage;
        }
    }

    const QString technique = parser.value(techniqueOption);
    if (!checkTechnique(technique))
        return ExitUsage;

    auto catalog = loadCatalogOrComplain(settings);
    if (!catalog)
        return ExitFailure;

    ExternalManifestExtractor extractor(settings.extractorCommand(), settings.extractorTimeoutMs());
    IdentifierMapBuilder builder(&extractor, settings.idMapPath(), settings.extractorDecrypt());
    const IdentifierMap idMap = builder.build(settings.archiveFolders(), parser.isSet(rebuildOption));

    PlayerProfile profile;
    switch (loadProfile(parser.value(profileOption), settings, idMap, &profile)) {
    case SaveStatus::Loaded:
        break;
    case SaveStatus::NotFound:
        qWarning() << "[Profile] No save file found, using the beginner ceiling";
        break;
    case SaveStatus::Failed:
        return ExitFailure;
    }

    const RecommendationResult result =
        RecommendationEngine::recommend(*catalog, profile, count, zone, technique);

    out() << "Comfort ceiling: " << fixed(result.ceiling, 2)
          << " (" << ceilingDescription(result.ceilingSource) << ")" << Qt::endl;
    for (const ZoneBounds& zb : result.zones) {
        out() << "  " << zoneName(zb.zone).leftJustified(10)
              << fixed(zb.lo, 2) << " - " << fixed(zb.hi, 2) << Qt::endl;
    }
    out() << Qt::endl;

    if (result.recommendations.isEmpty()) {
        out() << "No songs match." << Qt::endl;
        return ExitOk;
    }

    int rank = 1;
    for (const Recommendation& rec : result.recommendations) {
        out() << QString::number(rank++).rightJustified(3) << ". "
              << zoneName(rec.zone).leftJustified(10)
              << (rec.song.artist + QStringLiteral(" - ") + rec.song.title)
                     .leftJustified(44, QLatin1Char(' '), true) << "  "
              << fixed(rec.song.difficultyHard, 2) << "  "
              << "plays " << rec.playCount << Qt::endl;
        out() << "     " << rec.teachingNote << Qt::endl;
    }
    return ExitOk;
}
