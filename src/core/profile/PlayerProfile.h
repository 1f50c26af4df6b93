#pragma once

#include <QHash>
#include <QSet>
#include <QString>

// Per-song progress decoded from the save
struct SongProgress {
    QString persistentId;   // internal id, upper-cased
    QString songId;         // catalog id it maps to

    int badgeEasy = 0;      // 0..5
    int badgeMedium = 0;
    int badgeHard = 0;
    int badgeMaster = 0;

    int    playCount = 0;
    double highScoreHard = 0.0;
    double timestamp = 0.0;           // last played, as stored by the game
    double dynamicDifficultyAvg = 0.0;

    // Silver or better on one of the two hardest difficulties
    bool isCompetent() const { return badgeHard >= 4 || badgeMaster >= 4; }
    // Gold on one of the two hardest difficulties
    bool isMastered() const { return badgeHard >= 5 || badgeMaster >= 5; }
    bool isPlayed() const { return playCount > 0; }
};

struct PlayerProfile {
    QHash<QString, SongProgress> songs;   // persistentId → progress

    QSet<QString> competentSongIds() const;
    QSet<QString> masteredSongIds() const;
    QSet<QString> playedSongIds() const;

    // Lookup by catalog song id; nullptr when the song has no progress
    const SongProgress* progressForSong(const QString& songId) const;
};
