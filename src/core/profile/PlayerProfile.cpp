#include "PlayerProfile.h"

// ── PlayerProfile ───────────────────────────────────────────────────
QSet<QString> PlayerProfile::competentSongIds() const
{
    QSet<QString> ids;
    for (const SongProgress& sp : songs) {
        if (sp.isCompetent()) ids.insert(sp.songId);
    }
    return ids;
}

QSet<QString> PlayerProfile::masteredSongIds() const
{
    QSet<QString> ids;
    for (const SongProgress& sp : songs) {
        if (sp.isMastered()) ids.insert(sp.songId);
    }
    return ids;
}

QSet<QString> PlayerProfile::playedSongIds() const
{
    QSet<QString> ids;
    for (const SongProgress& sp : songs) {
        if (sp.isPlayed()) ids.insert(sp.songId);
    }
    return ids;
}

const SongProgress* PlayerProfile::progressForSong(const QString& songId) const
{
    // Several internal ids can map to one song; prefer the most played
    const SongProgress* best = nullptr;
    for (auto it = songs.cbegin(); it != songs.cend(); ++it) {
        if (it.value().songId != songId)
            continue;
        if (!best || it.value().playCount > best->playCount)
            best = &it.value();
    }
    return best;
}
