#ifndef SONGDATA_H
#define SONGDATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QMap>

// ── Data Structs ────────────────────────────────────────────────────
struct SectionInfo {
    QString name;
    int     number = 0;
    double  startTime = 0.0;   // seconds
    double  endTime = 0.0;     // seconds
    bool    isSolo = false;

    bool operator==(const SectionInfo& o) const;
    bool operator!=(const SectionInfo& o) const { return !(*this == o); }
};

struct SongEntry {
    QString songId;          // lower-cased FullName, e.g. "abc_mysong_bass"
    QString artist;
    QString title;
    QString album;
    int     year = 0;

    QString archivePath;     // absolute path of the source .psarc
    qint64  archiveMtime = 0;  // ms since epoch

    double  tempo = 0.0;       // average BPM
    double  songLength = 0.0;  // seconds

    QMap<QString, int> tuning;   // string index ("0".."5") → semitone offset
    bool    standardTuning = false;

    double  difficultyEasy = 0.0;
    double  difficultyMedium = 0.0;
    double  difficultyHard = 0.0;
    int     notesEasy = 0;
    int     notesMedium = 0;
    int     notesHard = 0;
    int     maxPhraseDifficulty = 0;

    QMap<QString, bool>  techniques;   // taxonomy name → flag
    QVector<SectionInfo> sections;
    QString dlcKey;

    bool operator==(const SongEntry& o) const;
    bool operator!=(const SongEntry& o) const { return !(*this == o); }

    QStringList techniqueList() const;
    bool hasTechnique(const QString& technique) const;
    // "intro(1),verse(2),chorus(2)" in first-appearance order
    QString sectionSummary() const;
    QString oneLineSummary() const;
};

// Normalized (artist, title) key used to merge duplicate releases.
QString dedupKey(const SongEntry& entry);

// ── Catalog ─────────────────────────────────────────────────────────
struct Catalog {
    static constexpr int kFormatVersion = 1;

    QHash<QString, SongEntry> songs;   // songId → entry
    QString scannedAt;                 // ISO-8601 UTC
    int     version = kFormatVersion;

    int songCount() const { return songs.size(); }
    void updateTimestamp();

    QVector<SongEntry> songsWithTechnique(const QString& technique) const;
    QVector<SongEntry> songsByArtist(const QString& artistSubstr) const;
};

#endif // SONGDATA_H
