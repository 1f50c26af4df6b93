#pragma once

#include "../SongData.h"
#include "../profile/PlayerProfile.h"

#include <QString>
#include <QVector>
#include <optional>

// ── Zones ───────────────────────────────────────────────────────────
enum class Zone {
    WarmUp,
    Growth,
    Challenge,
    Reach
};

QString zoneName(Zone zone);                              // "warm-up", "growth", ...
std::optional<Zone> zoneFromName(const QString& name);
// Lower = recommended first. Growth, Challenge, WarmUp, Reach.
int zonePriority(Zone zone);

struct ZoneBounds {
    Zone   zone = Zone::Growth;
    double lo = 0.0;   // inclusive
    double hi = 0.0;   // exclusive

    double midpoint() const { return (lo + hi) / 2.0; }
    bool contains(double difficulty) const { return lo <= difficulty && difficulty < hi; }
};

struct RecommendationKey {
    int    zonePriority = 0;
    int    playCount = 0;
    double midpointDistance = 0.0;

    bool operator<(const RecommendationKey& o) const
    {
        if (zonePriority != o.zonePriority) return zonePriority < o.zonePriority;
        if (playCount != o.playCount) return playCount < o.playCount;
        return midpointDistance < o.midpointDistance;
    }
};

struct Recommendation {
    SongEntry         song;
    Zone              zone = Zone::Growth;
    int               playCount = 0;
    RecommendationKey key;
    QString           teachingNote;
};

enum class CeilingSource {
    Competent,   // 85th percentile of competent songs
    Played,      // 70th percentile of played songs
    Beginner     // fixed fallback
};

struct RecommendationResult {
    double                  ceiling = 0.0;
    CeilingSource           ceilingSource = CeilingSource::Beginner;
    QVector<ZoneBounds>     zones;   // WarmUp, Growth, Challenge, Reach
    QVector<Recommendation> recommendations;
};

// Picks songs slightly harder than what the player already handles.
class RecommendationEngine {
public:
    static constexpr double kBeginnerCeiling = 0.15;
    static constexpr double kZoneWidth = 0.10;
    static constexpr double kCompetentPercentile = 0.85;
    static constexpr double kPlayedPercentile = 0.70;
    static constexpr int    kMinSamples = 3;

    static RecommendationResult recommend(const Catalog& catalog,
                                          const PlayerProfile& profile,
                                          int count,
                                          std::optional<Zone> zoneFilter = std::nullopt,
                                          const QString& techniqueFilter = QString());

    static double comfortCeiling(const Catalog& catalog, const PlayerProfile& profile,
                                 CeilingSource* source = nullptr);
    static QVector<ZoneBounds> zoneBounds(double ceiling);

    // Sorted ascending; index floor(p * n), clamped to the last element
    static double percentile(QVector<double> values, double p);
};
