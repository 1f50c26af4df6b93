#include "RecommendationEngine.h"
#include "TeachingNotes.h"

#include <QDebug>
#include <QSet>
#include <algorithm>
#include <cmath>
#include <utility>

// ── Zone helpers ────────────────────────────────────────────────────
QString zoneName(Zone zone)
{
    switch (zone) {
    case Zone::WarmUp:    return QStringLiteral("warm-up");
    case Zone::Growth:    return QStringLiteral("growth");
    case Zone::Challenge: return QStringLiteral("challenge");
    case Zone::Reach:     return QStringLiteral("reach");
    }
    return QString();
}

std::optional<Zone> zoneFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("warm-up") || n == QLatin1String("warmup")) return Zone::WarmUp;
    if (n == QLatin1String("growth")) return Zone::Growth;
    if (n == QLatin1String("challenge")) return Zone::Challenge;
    if (n == QLatin1String("reach")) return Zone::Reach;
    return std::nullopt;
}

int zonePriority(Zone zone)
{
    switch (zone) {
    case Zone::Growth:    return 0;
    case Zone::Challenge: return 1;
    case Zone::WarmUp:    return 2;
    case Zone::Reach:     return 3;
    }
    return 4;
}

static double clamp01(double v)
{
    return std::clamp(v, 0.0, 1.0);
}

// ── Ceiling ─────────────────────────────────────────────────────────
double RecommendationEngine::percentile(QVector<double> values, double p)
{
    if (values.isEmpty())
        return 0.0;
    std::sort(values.begin(), values.end());
    const auto n = values.size();
    qsizetype idx = static_cast<qsizetype>(n * p);
    return values.at(std::min(idx, n - 1));
}

static QVector<double> hardDifficulties(const Catalog& catalog, const QSet<QString>& songIds)
{
    QVector<double> diffs;
    for (const QString& id : songIds) {
        auto it = catalog.songs.constFind(id);
        if (it != catalog.songs.constEnd())
            diffs.append(it->difficultyHard);
    }
    return diffs;
}

double RecommendationEngine::comfortCeiling(const Catalog& catalog, const PlayerProfile& profile,
                                            CeilingSource* source)
{
    const QVector<double> competent = hardDifficulties(catalog, profile.competentSongIds());
    if (competent.size() >= kMinSamples) {
        double ceiling = percentile(competent, kCompetentPercentile);
        qDebug() << "[Recommend] Ceiling from" << competent.size()
                 << "competent songs:" << ceiling << "(85th pct)";
        if (source) *source = CeilingSource::Competent;
        return ceiling;
    }

    const QVector<double> played = hardDifficulties(catalog, profile.playedSongIds());
    if (played.size() >= kMinSamples) {
        double ceiling = percentile(played, kPlayedPercentile);
        qDebug() << "[Recommend] Ceiling from" << played.size()
                 << "played songs:" << ceiling << "(70th pct)";
        if (source) *source = CeilingSource::Played;
        return ceiling;
    }

    qDebug() << "[Recommend] Beginner fallback: ceiling =" << kBeginnerCeiling;
    if (source) *source = CeilingSource::Beginner;
    return kBeginnerCeiling;
}

// ── Zones ───────────────────────────────────────────────────────────
QVector<ZoneBounds> RecommendationEngine::zoneBounds(double c)
{
    const double w = kZoneWidth;
    return {
        { Zone::WarmUp,    clamp01(c - w),     clamp01(c) },
        { Zone::Growth,    clamp01(c),         clamp01(c + w) },
        { Zone::Challenge, clamp01(c + w),     clamp01(c + 2 * w) },
        { Zone::Reach,     clamp01(c + 2 * w), clamp01(c + 3 * w) },
    };
}

// ── recommend ───────────────────────────────────────────────────────
RecommendationResult RecommendationEngine::recommend(const Catalog& catalog,
                                                     const PlayerProfile& profile,
                                                     int count,
                                                     std::optional<Zone> zoneFilter,
                                                     const QString& techniqueFilter)
{
    RecommendationResult result;
    result.ceiling = comfortCeiling(catalog, profile, &result.ceilingSource);
    result.zones = zoneBounds(result.ceiling);

    const QSet<QString> competent = profile.competentSongIds();

    for (const SongEntry& song : catalog.songs) {
        if (competent.contains(song.songId))
            continue;
        if (!techniqueFilter.isEmpty() && !song.hasTechnique(techniqueFilter))
            continue;

        const double diff = song.difficultyHard;
        const ZoneBounds* match = nullptr;
        int hits = 0;
        for (const ZoneBounds& zb : std::as_const(result.zones)) {
            if (zb.contains(diff)) {
                match = &zb;
                ++hits;
            }
        }
        if (hits != 1)
            continue;
        if (zoneFilter && match->zone != *zoneFilter)
            continue;

        const SongProgress* progress = profile.progressForSong(song.songId);

        Recommendation rec;
        rec.song = song;
        rec.zone = match->zone;
        rec.playCount = progress ? progress->playCount : 0;
        rec.key = { zonePriority(match->zone), rec.playCount,
                    std::abs(diff - match->midpoint()) };
        rec.teachingNote = TeachingNotes::templateLine(song);
        result.recommendations.append(rec);
    }

    std::sort(result.recommendations.begin(), result.recommendations.end(),
              [](const Recommendation& a, const Recommendation& b) {
                  if (a.key < b.key) return true;
                  if (b.key < a.key) return false;
                  return a.song.songId < b.song.songId;
              });

    if (count >= 0 && result.recommendations.size() > count)
        result.recommendations.resize(count);

    qDebug() << "[Recommend]" << result.recommendations.size() << "recommendations,"
             << "ceiling" << result.ceiling;
    return result;
}
