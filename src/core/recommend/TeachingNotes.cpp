#include "TeachingNotes.h"
#include "../Techniques.h"

#include <QStringList>
#include <QVector>
#include <array>

namespace {

using BassOffsets = std::array<int, 4>;

struct KnownTuning {
    const char* name;
    BassOffsets offsets;
};

const KnownTuning kKnownTunings[] = {
    { "Drop D",      { -2,  0,  0,  0 } },
    { "Drop C",      { -4, -2, -2, -2 } },
    { "Drop C#",     { -3, -1, -1, -1 } },
    { "D Standard",  { -1, -1, -1, -1 } },
    { "Eb Standard", {  1,  1,  1,  1 } },
    { "C Standard",  { -4, -4, -4, -4 } },
};

} // namespace

QString TeachingNotes::skillFocus(const QMap<QString, bool>& techniques)
{
    QStringList parts;
    for (const SkillGroup& group : Techniques::skillGroups()) {
        QStringList active;
        for (const QString& tech : group.techniques) {
            if (techniques.value(tech, false))
                active.append(tech);
        }
        if (!active.isEmpty())
            parts.append(QStringLiteral("%1 (%2)").arg(group.name, active.join(QStringLiteral(", "))));
    }
    if (parts.isEmpty())
        return QStringLiteral("General");
    return parts.join(QStringLiteral(" | "));
}

QString TeachingNotes::tuningName(const QMap<QString, int>& tuning)
{
    BassOffsets bass{};
    for (int i = 0; i < 4; ++i)
        bass[i] = tuning.value(QString::number(i), 0);

    if (bass == BassOffsets{ 0, 0, 0, 0 })
        return QStringLiteral("Standard");

    for (const KnownTuning& known : kKnownTunings) {
        if (bass == known.offsets)
            return QString::fromLatin1(known.name);
    }

    QStringList vals;
    for (int v : bass)
        vals.append(v >= 0 ? QStringLiteral("+%1").arg(v) : QString::number(v));
    return QStringLiteral("Custom (%1)").arg(vals.join(QLatin1Char(',')));
}

QString TeachingNotes::tempoBand(double bpm)
{
    QString band;
    if (bpm < 90)
        band = QStringLiteral("Slow");
    else if (bpm < 140)
        band = QStringLiteral("Medium");
    else if (bpm < 180)
        band = QStringLiteral("Fast");
    else
        band = QStringLiteral("Very Fast");
    return QStringLiteral("%1 (%2 BPM)").arg(band, QString::number(bpm, 'f', 0));
}

QString TeachingNotes::noteDensity(int notes, double length)
{
    if (length <= 0)
        return QStringLiteral("Unknown");
    const double nps = notes / length;
    if (nps < 1.5) return QStringLiteral("Sparse");
    if (nps < 3.0) return QStringLiteral("Moderate");
    if (nps < 5.0) return QStringLiteral("Dense");
    return QStringLiteral("Very Dense");
}

QString TeachingNotes::difficultyCurve(double easy, double hard)
{
    const double spread = hard - easy;
    if (spread < 0.05) return QStringLiteral("Flat");
    if (spread < 0.15) return QStringLiteral("Gradual");
    if (spread < 0.30) return QStringLiteral("Moderate");
    return QStringLiteral("Steep");
}

QString TeachingNotes::templateLine(const SongEntry& song)
{
    QStringList parts = {
        skillFocus(song.techniques),
        tuningName(song.tuning),
        tempoBand(song.tempo),
        noteDensity(song.notesHard, song.songLength),
    };

    const QString curve = difficultyCurve(song.difficultyEasy, song.difficultyHard);
    if (curve != QLatin1String("Flat"))
        parts.append(curve + QStringLiteral(" progression"));

    for (const SectionInfo& s : song.sections) {
        if (s.isSolo) {
            parts.append(QStringLiteral("Features solo"));
            break;
        }
    }

    return parts.join(QStringLiteral(" | "));
}
