#pragma once

#include "../SongData.h"

#include <QMap>
#include <QString>

// Deterministic one-line practice notes built from catalog metadata only.
class TeachingNotes {
public:
    // "Articulation (slides) | Drop D | Medium (120 BPM) | Dense | Gradual progression"
    static QString templateLine(const SongEntry& song);

    static QString skillFocus(const QMap<QString, bool>& techniques);
    // Looks at the four bass strings only
    static QString tuningName(const QMap<QString, int>& tuning);
    static QString tempoBand(double bpm);
    static QString noteDensity(int notes, double length);
    static QString difficultyCurve(double easy, double hard);
};
