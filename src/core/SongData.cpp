#include "SongData.h"
#include "Techniques.h"

#include <QDateTime>

// ── SectionInfo ─────────────────────────────────────────────────────
bool SectionInfo::operator==(const SectionInfo& o) const
{
    return name == o.name
        && number == o.number
        && startTime == o.startTime
        && endTime == o.endTime
        && isSolo == o.isSolo;
}

// ── SongEntry ───────────────────────────────────────────────────────
bool SongEntry::operator==(const SongEntry& o) const
{
    return songId == o.songId
        && artist == o.artist
        && title == o.title
        && album == o.album
        && year == o.year
        && archivePath == o.archivePath
        && archiveMtime == o.archiveMtime
        && tempo == o.tempo
        && songLength == o.songLength
        && tuning == o.tuning
        && standardTuning == o.standardTuning
        && difficultyEasy == o.difficultyEasy
        && difficultyMedium == o.difficultyMedium
        && difficultyHard == o.difficultyHard
        && notesEasy == o.notesEasy
        && notesMedium == o.notesMedium
        && notesHard == o.notesHard
        && maxPhraseDifficulty == o.maxPhraseDifficulty
        && techniques == o.techniques
        && sections == o.sections
        && dlcKey == o.dlcKey;
}

QStringList SongEntry::techniqueList() const
{
    QStringList list;
    for (const QString& name : Techniques::manifestTechniques()) {
        if (techniques.value(name, false))
            list.append(name);
    }
    return list;
}

bool SongEntry::hasTechnique(const QString& technique) const
{
    return techniques.value(technique, false);
}

QString SongEntry::sectionSummary() const
{
    QStringList order;
    QHash<QString, int> counts;
    for (const SectionInfo& s : sections) {
        if (!counts.contains(s.name))
            order.append(s.name);
        counts[s.name] += 1;
    }

    QStringList parts;
    parts.reserve(order.size());
    for (const QString& name : order)
        parts.append(QStringLiteral("%1(%2)").arg(name).arg(counts.value(name)));
    return parts.join(QLatin1Char(','));
}

QString SongEntry::oneLineSummary() const
{
    return QStringLiteral("%1 - %2 | %3bpm | diff:%4 | %5 | sections: %6")
        .arg(artist, title)
        .arg(tempo, 0, 'f', 0)
        .arg(difficultyHard, 0, 'f', 2)
        .arg(techniqueList().join(QLatin1Char(',')), sectionSummary());
}

QString dedupKey(const SongEntry& entry)
{
    return entry.artist.toLower() + QLatin1Char('|') + entry.title.toLower();
}

// ── Catalog ─────────────────────────────────────────────────────────
void Catalog::updateTimestamp()
{
    scannedAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

QVector<SongEntry> Catalog::songsWithTechnique(const QString& technique) const
{
    QVector<SongEntry> result;
    for (const SongEntry& s : songs) {
        if (s.hasTechnique(technique))
            result.append(s);
    }
    return result;
}

QVector<SongEntry> Catalog::songsByArtist(const QString& artistSubstr) const
{
    QVector<SongEntry> result;
    for (const SongEntry& s : songs) {
        if (s.artist.contains(artistSubstr, Qt::CaseInsensitive))
            result.append(s);
    }
    return result;
}
