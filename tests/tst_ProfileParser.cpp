#include <QtTest/QtTest>
#include <QJsonDocument>
#include "profile/ProfileParser.h"

static QJsonObject parseObject(const QByteArray& json)
{
    return QJsonDocument::fromJson(json).object();
}

class tst_ProfileParser : public QObject {
    Q_OBJECT

private slots:
    void parse_mergesSectionsWithMixedCase()
    {
        const QJsonObject root = parseObject(R"({
            "Songs": {
                "abcdef01": { "TimeStamp": 1700000000, "DynamicDifficulty": { "Avg": 0.62 } }
            },
            "SongsSA": {
                "ABCDEF01": {
                    "PlayCount": 7,
                    "Badges": { "Easy": 5, "Medium": 5, "Hard": 4, "Master": 1 },
                    "HighScores": { "Hard": 123456.5 }
                }
            }
        })");
        const IdentifierMap idMap{ { QStringLiteral("ABCDEF01"), QStringLiteral("song_bass") } };

        const PlayerProfile profile = ProfileParser::parse(root, idMap);
        QCOMPARE(profile.songs.size(), 1);

        const SongProgress sp = profile.songs.value(QStringLiteral("ABCDEF01"));
        QCOMPARE(sp.songId, QStringLiteral("song_bass"));
        QCOMPARE(sp.playCount, 7);
        QCOMPARE(sp.badgeEasy, 5);
        QCOMPARE(sp.badgeMedium, 5);
        QCOMPARE(sp.badgeHard, 4);
        QCOMPARE(sp.badgeMaster, 1);
        QCOMPARE(sp.highScoreHard, 123456.5);
        QCOMPARE(sp.dynamicDifficultyAvg, 0.62);
        QCOMPARE(sp.timestamp, 1700000000.0);
        QVERIFY(sp.isCompetent());
        QVERIFY(!sp.isMastered());
        QVERIFY(sp.isPlayed());
    }

    void parse_dropsUnknownIds()
    {
        const QJsonObject root = parseObject(R"({
            "Songs":   { "AAAA": {}, "bbbb": {} },
            "SongsSA": { "cccc": { "PlayCount": 2 } }
        })");
        const IdentifierMap idMap{ { QStringLiteral("BBBB"), QStringLiteral("b_bass") },
                                   { QStringLiteral("CCCC"), QStringLiteral("c_bass") } };

        const PlayerProfile profile = ProfileParser::parse(root, idMap);
        QCOMPARE(profile.songs.size(), 2);
        QVERIFY(!profile.songs.contains(QStringLiteral("AAAA")));
        QVERIFY(profile.songs.contains(QStringLiteral("BBBB")));
        QVERIFY(profile.songs.contains(QStringLiteral("CCCC")));
    }

    void parse_missingSectionGivesZeroes()
    {
        const QJsonObject root = parseObject(R"({
            "Songs": { "DD01": { "DynamicDifficulty": { "Avg": 0.3 } } }
        })");
        const IdentifierMap idMap{ { QStringLiteral("DD01"), QStringLiteral("dd_bass") } };

        const SongProgress sp = ProfileParser::parse(root, idMap).songs.value(QStringLiteral("DD01"));
        QCOMPARE(sp.playCount, 0);
        QCOMPARE(sp.badgeHard, 0);
        QCOMPARE(sp.highScoreHard, 0.0);
        QCOMPARE(sp.dynamicDifficultyAvg, 0.3);
        QVERIFY(!sp.isPlayed());
    }

    void parse_acceptsNumericStrings()
    {
        const QJsonObject root = parseObject(R"({
            "SongsSA": { "S1": { "PlayCount": "12", "Badges": { "Master": "5" } } }
        })");
        const IdentifierMap idMap{ { QStringLiteral("S1"), QStringLiteral("s_bass") } };

        const SongProgress sp = ProfileParser::parse(root, idMap).songs.value(QStringLiteral("S1"));
        QCOMPARE(sp.playCount, 12);
        QCOMPARE(sp.badgeMaster, 5);
        QVERIFY(sp.isMastered());
    }

    void parse_emptyDocument()
    {
        const PlayerProfile profile = ProfileParser::parse(QJsonObject(), IdentifierMap());
        QVERIFY(profile.songs.isEmpty());
        QVERIFY(profile.playedSongIds().isEmpty());
    }

    // ── PlayerProfile queries ────────────────────────────────────
    void profile_sets()
    {
        PlayerProfile profile;
        SongProgress a;
        a.persistentId = QStringLiteral("A");
        a.songId = QStringLiteral("a_bass");
        a.playCount = 3;
        a.badgeHard = 5;
        SongProgress b;
        b.persistentId = QStringLiteral("B");
        b.songId = QStringLiteral("b_bass");
        b.playCount = 1;
        b.badgeMaster = 4;
        SongProgress c;
        c.persistentId = QStringLiteral("C");
        c.songId = QStringLiteral("c_bass");
        c.badgeHard = 3;
        profile.songs.insert(a.persistentId, a);
        profile.songs.insert(b.persistentId, b);
        profile.songs.insert(c.persistentId, c);

        QCOMPARE(profile.competentSongIds(),
                 QSet<QString>({ QStringLiteral("a_bass"), QStringLiteral("b_bass") }));
        QCOMPARE(profile.masteredSongIds(), QSet<QString>({ QStringLiteral("a_bass") }));
        QCOMPARE(profile.playedSongIds(),
                 QSet<QString>({ QStringLiteral("a_bass"), QStringLiteral("b_bass") }));
    }

    void profile_progressForSongPrefersMostPlayed()
    {
        PlayerProfile profile;
        SongProgress older;
        older.persistentId = QStringLiteral("OLD");
        older.songId = QStringLiteral("x_bass");
        older.playCount = 2;
        SongProgress newer;
        newer.persistentId = QStringLiteral("NEW");
        newer.songId = QStringLiteral("x_bass");
        newer.playCount = 9;
        profile.songs.insert(older.persistentId, older);
        profile.songs.insert(newer.persistentId, newer);

        const SongProgress* sp = profile.progressForSong(QStringLiteral("x_bass"));
        QVERIFY(sp);
        QCOMPARE(sp->persistentId, QStringLiteral("NEW"));
        QVERIFY(!profile.progressForSong(QStringLiteral("y_bass")));
    }
};

QTEST_MAIN(tst_ProfileParser)
#include "tst_ProfileParser.moc"
