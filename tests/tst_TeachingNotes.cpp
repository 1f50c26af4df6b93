#include <QtTest/QtTest>
#include "recommend/TeachingNotes.h"

using Offsets = QMap<QString, int>;

static Offsets tuning(int a, int b, int c, int d)
{
    return { { QStringLiteral("0"), a }, { QStringLiteral("1"), b },
             { QStringLiteral("2"), c }, { QStringLiteral("3"), d } };
}

class tst_TeachingNotes : public QObject {
    Q_OBJECT

private slots:
    void tuningName_data()
    {
        QTest::addColumn<Offsets>("offsets");
        QTest::addColumn<QString>("name");

        QTest::newRow("standard") << tuning(0, 0, 0, 0) << QStringLiteral("Standard");
        QTest::newRow("empty") << Offsets() << QStringLiteral("Standard");
        QTest::newRow("drop d") << tuning(-2, 0, 0, 0) << QStringLiteral("Drop D");
        QTest::newRow("drop c") << tuning(-4, -2, -2, -2) << QStringLiteral("Drop C");
        QTest::newRow("drop c#") << tuning(-3, -1, -1, -1) << QStringLiteral("Drop C#");
        QTest::newRow("d standard") << tuning(-1, -1, -1, -1) << QStringLiteral("D Standard");
        QTest::newRow("eb standard") << tuning(1, 1, 1, 1) << QStringLiteral("Eb Standard");
        QTest::newRow("c standard") << tuning(-4, -4, -4, -4) << QStringLiteral("C Standard");
        QTest::newRow("custom") << tuning(2, 0, 0, -1) << QStringLiteral("Custom (+2,+0,+0,-1)");
    }

    void tuningName()
    {
        QFETCH(Offsets, offsets);
        QFETCH(QString, name);
        QCOMPARE(TeachingNotes::tuningName(offsets), name);
    }

    void tuningName_ignoresUpperStrings()
    {
        Offsets t = tuning(-2, 0, 0, 0);
        t.insert(QStringLiteral("4"), 5);
        t.insert(QStringLiteral("5"), 5);
        QCOMPARE(TeachingNotes::tuningName(t), QStringLiteral("Drop D"));
    }

    void tempoBand()
    {
        QCOMPARE(TeachingNotes::tempoBand(80), QStringLiteral("Slow (80 BPM)"));
        QCOMPARE(TeachingNotes::tempoBand(90), QStringLiteral("Medium (90 BPM)"));
        QCOMPARE(TeachingNotes::tempoBand(150.4), QStringLiteral("Fast (150 BPM)"));
        QCOMPARE(TeachingNotes::tempoBand(200), QStringLiteral("Very Fast (200 BPM)"));
    }

    void noteDensity()
    {
        QCOMPARE(TeachingNotes::noteDensity(100, 0), QStringLiteral("Unknown"));
        QCOMPARE(TeachingNotes::noteDensity(100, 100), QStringLiteral("Sparse"));
        QCOMPARE(TeachingNotes::noteDensity(200, 100), QStringLiteral("Moderate"));
        QCOMPARE(TeachingNotes::noteDensity(400, 100), QStringLiteral("Dense"));
        QCOMPARE(TeachingNotes::noteDensity(500, 100), QStringLiteral("Very Dense"));
    }

    void difficultyCurve()
    {
        QCOMPARE(TeachingNotes::difficultyCurve(0.50, 0.52), QStringLiteral("Flat"));
        QCOMPARE(TeachingNotes::difficultyCurve(0.40, 0.50), QStringLiteral("Gradual"));
        QCOMPARE(TeachingNotes::difficultyCurve(0.20, 0.40), QStringLiteral("Moderate"));
        QCOMPARE(TeachingNotes::difficultyCurve(0.10, 0.60), QStringLiteral("Steep"));
    }

    void skillFocus_groupsInCurriculumOrder()
    {
        QMap<QString, bool> techs{
            { QStringLiteral("slapPop"), true },
            { QStringLiteral("slides"), true },
            { QStringLiteral("hopo"), true },
            { QStringLiteral("palmMutes"), false },
        };
        QCOMPARE(TeachingNotes::skillFocus(techs),
                 QStringLiteral("Articulation (hopo, slides) | Advanced Techniques (slapPop)"));
        QCOMPARE(TeachingNotes::skillFocus({}), QStringLiteral("General"));
    }

    void templateLine_full()
    {
        SongEntry s;
        s.techniques = { { QStringLiteral("fingerPicking"), true } };
        s.tuning = tuning(-2, 0, 0, 0);
        s.tempo = 120;
        s.notesHard = 400;
        s.songLength = 200;
        s.difficultyEasy = 0.2;
        s.difficultyHard = 0.6;
        s.sections = { { QStringLiteral("verse"), 1, 0, 10, false },
                       { QStringLiteral("solo"), 1, 10, 20, true } };

        QCOMPARE(TeachingNotes::templateLine(s),
                 QStringLiteral("Bass Fundamentals (fingerPicking) | Drop D | Medium (120 BPM) | "
                                "Moderate | Steep progression | Features solo"));
    }

    void templateLine_flatCurveOmitted()
    {
        SongEntry s;
        s.tempo = 60;
        s.difficultyEasy = 0.3;
        s.difficultyHard = 0.3;
        QCOMPARE(TeachingNotes::templateLine(s),
                 QStringLiteral("General | Standard | Slow (60 BPM) | Unknown"));
    }
};

QTEST_MAIN(tst_TeachingNotes)
#include "tst_TeachingNotes.moc"
