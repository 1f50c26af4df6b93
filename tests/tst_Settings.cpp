#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "Settings.h"

class tst_Settings : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        qunsetenv("BASSTUTOR_DATA_DIR");
    }

    void defaults()
    {
        QTemporaryDir dir;
        Settings s(dir.filePath(QStringLiteral("settings.ini")));

        QCOMPARE(s.archiveFolders(), Settings::defaultArchiveFolders());
        QVERIFY(s.archiveFolders().first().endsWith(QStringLiteral("Rocksmith2014/dlc")));
        QCOMPARE(s.userDataRoot(), Settings::defaultUserDataRoot());
        QCOMPARE(s.extractorCommand(), QStringLiteral("psarc-extract --output {output} {archive}"));
        QVERIFY(s.extractorDecrypt());
        QCOMPARE(s.extractorTimeoutMs(), 60000);
        QCOMPARE(s.recommendationCount(), 20);
        QVERIFY(s.catalogPath().endsWith(QStringLiteral("/catalog.json")));
        QVERIFY(s.idMapPath().endsWith(QStringLiteral("/id_map.json")));
    }

    void valuesPersist()
    {
        QTemporaryDir dir;
        const QString ini = dir.filePath(QStringLiteral("settings.ini"));
        {
            Settings s(ini);
            s.setArchiveFolders({ QStringLiteral("/music/dlc") });
            s.addArchiveFolder(QStringLiteral("/music/songs"));
            s.addArchiveFolder(QStringLiteral("/music/dlc"));
            s.setDataDir(dir.filePath(QStringLiteral("data")));
            s.setUserDataRoot(QStringLiteral("/steam/userdata"));
            s.setExtractorCommand(QStringLiteral("unpack {decrypt} -o {output} {archive}"));
            s.setExtractorDecrypt(false);
            s.setExtractorTimeoutMs(5000);
            s.setRecommendationCount(7);
            s.sync();
        }

        Settings s(ini);
        QCOMPARE(s.archiveFolders(),
                 (QStringList{ QStringLiteral("/music/dlc"), QStringLiteral("/music/songs") }));
        QCOMPARE(s.catalogPath(), dir.filePath(QStringLiteral("data/catalog.json")));
        QCOMPARE(s.userDataRoot(), QStringLiteral("/steam/userdata"));
        QCOMPARE(s.extractorCommand(), QStringLiteral("unpack {decrypt} -o {output} {archive}"));
        QVERIFY(!s.extractorDecrypt());
        QCOMPARE(s.extractorTimeoutMs(), 5000);
        QCOMPARE(s.recommendationCount(), 7);

        s.removeArchiveFolder(QStringLiteral("/music/dlc"));
        QCOMPARE(s.archiveFolders(), QStringList{ QStringLiteral("/music/songs") });
    }

    void environmentOverridesDataDir()
    {
        QTemporaryDir dir;
        Settings s(dir.filePath(QStringLiteral("settings.ini")));
        s.setDataDir(QStringLiteral("/stored/dir"));

        qputenv("BASSTUTOR_DATA_DIR", dir.filePath(QStringLiteral("env")).toLocal8Bit());
        QCOMPARE(s.dataDir(), dir.filePath(QStringLiteral("env")));
        QCOMPARE(s.idMapPath(), dir.filePath(QStringLiteral("env/id_map.json")));
        qunsetenv("BASSTUTOR_DATA_DIR");
        QCOMPARE(s.dataDir(), QStringLiteral("/stored/dir"));
    }

    void invalidCountFallsBack()
    {
        QTemporaryDir dir;
        Settings s(dir.filePath(QStringLiteral("settings.ini")));
        s.setRecommendationCount(0);
        QCOMPARE(s.recommendationCount(), 20);
    }
};

QTEST_MAIN(tst_Settings)
#include "tst_Settings.moc"
