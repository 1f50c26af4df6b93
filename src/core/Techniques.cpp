#include "Techniques.h"

#include <QHash>

const QStringList& Techniques::manifestTechniques()
{
    static const QStringList s_names = {
        QStringLiteral("slides"),
        QStringLiteral("unpitchedSlides"),
        QStringLiteral("hopo"),
        QStringLiteral("slapPop"),
        QStringLiteral("fretHandMutes"),
        QStringLiteral("palmMutes"),
        QStringLiteral("harmonics"),
        QStringLiteral("pinchHarmonics"),
        QStringLiteral("tapping"),
        QStringLiteral("vibrato"),
        QStringLiteral("tremolo"),
        QStringLiteral("bends"),
        QStringLiteral("sustain"),
        QStringLiteral("syncopation"),
        QStringLiteral("twoFingerPicking"),
        QStringLiteral("bassPick"),
        QStringLiteral("fingerPicking"),
        QStringLiteral("fifthsAndOctaves"),
        QStringLiteral("doubleStops"),
        QStringLiteral("openChords"),
        QStringLiteral("pickDirection")
    };
    return s_names;
}

bool Techniques::isKnown(const QString& technique)
{
    return manifestTechniques().contains(technique);
}

QString Techniques::displayName(const QString& technique)
{
    static const QHash<QString, QString> s_display = {
        { QStringLiteral("slides"),           QStringLiteral("Slides") },
        { QStringLiteral("unpitchedSlides"),  QStringLiteral("Unpitched Slides") },
        { QStringLiteral("hopo"),             QStringLiteral("Hammer-On / Pull-Off") },
        { QStringLiteral("slapPop"),          QStringLiteral("Slap & Pop") },
        { QStringLiteral("fretHandMutes"),    QStringLiteral("Fret-Hand Mutes") },
        { QStringLiteral("palmMutes"),        QStringLiteral("Palm Mutes") },
        { QStringLiteral("harmonics"),        QStringLiteral("Harmonics") },
        { QStringLiteral("pinchHarmonics"),   QStringLiteral("Pinch Harmonics") },
        { QStringLiteral("tapping"),          QStringLiteral("Tapping") },
        { QStringLiteral("vibrato"),          QStringLiteral("Vibrato") },
        { QStringLiteral("tremolo"),          QStringLiteral("Tremolo") },
        { QStringLiteral("bends"),            QStringLiteral("Bends") },
        { QStringLiteral("sustain"),          QStringLiteral("Sustain") },
        { QStringLiteral("syncopation"),      QStringLiteral("Syncopation") },
        { QStringLiteral("twoFingerPicking"), QStringLiteral("Two-Finger Picking") },
        { QStringLiteral("bassPick"),         QStringLiteral("Bass Pick") },
        { QStringLiteral("fingerPicking"),    QStringLiteral("Finger Picking") },
        { QStringLiteral("fifthsAndOctaves"), QStringLiteral("Fifths & Octaves") },
        { QStringLiteral("doubleStops"),      QStringLiteral("Double Stops") },
        { QStringLiteral("openChords"),       QStringLiteral("Open Chords") },
        { QStringLiteral("pickDirection"),    QStringLiteral("Pick Direction") }
    };
    return s_display.value(technique, technique);
}

// ── Skill groups ────────────────────────────────────────────────────
const QVector<SkillGroup>& Techniques::skillGroups()
{
    static const QVector<SkillGroup> s_groups = {
        { QStringLiteral("fundamentals"), QStringLiteral("Bass Fundamentals"), 1,
          QStringLiteral("beginner"),
          { QStringLiteral("sustain"), QStringLiteral("twoFingerPicking"),
            QStringLiteral("bassPick"), QStringLiteral("fingerPicking") } },
        { QStringLiteral("rhythm"), QStringLiteral("Rhythm & Muting"), 2,
          QStringLiteral("beginner-intermediate"),
          { QStringLiteral("syncopation"), QStringLiteral("fretHandMutes"),
            QStringLiteral("palmMutes") } },
        { QStringLiteral("articulation"), QStringLiteral("Articulation"), 3,
          QStringLiteral("intermediate"),
          { QStringLiteral("hopo"), QStringLiteral("slides"),
            QStringLiteral("unpitchedSlides"), QStringLiteral("bends"),
            QStringLiteral("vibrato") } },
        { QStringLiteral("advanced"), QStringLiteral("Advanced Techniques"), 4,
          QStringLiteral("advanced"),
          { QStringLiteral("slapPop"), QStringLiteral("tapping"),
            QStringLiteral("harmonics"), QStringLiteral("pinchHarmonics"),
            QStringLiteral("tremolo"), QStringLiteral("pickDirection") } },
        { QStringLiteral("patterns"), QStringLiteral("Patterns & Chords"), 5,
          QStringLiteral("intermediate-advanced"),
          { QStringLiteral("fifthsAndOctaves"), QStringLiteral("doubleStops"),
            QStringLiteral("openChords") } }
    };
    return s_groups;
}

QString Techniques::groupFor(const QString& technique)
{
    for (const SkillGroup& g : skillGroups()) {
        if (g.techniques.contains(technique))
            return g.id;
    }
    return QString();
}
