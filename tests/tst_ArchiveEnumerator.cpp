#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "library/ArchiveEnumerator.h"
#include "TestFixtures.h"

using namespace fixtures;

class tst_ArchiveEnumerator : public QObject {
    Q_OBJECT

private slots:
    void findArchives_listsTopLevelArchivesSorted()
    {
        QTemporaryDir dir;
        writeArchive(dir.path(), QStringLiteral("b_p.psarc"));
        writeArchive(dir.path(), QStringLiteral("a_m.psarc"));
        writeArchive(dir.path(), QStringLiteral("readme.txt"));
        QDir(dir.path()).mkdir(QStringLiteral("sub"));
        writeArchive(dir.filePath(QStringLiteral("sub")), QStringLiteral("nested_p.psarc"));

        const QVector<ArchiveFile> archives = ArchiveEnumerator::findArchives({ dir.path() });
        QCOMPARE(archives.size(), 2);
        QCOMPARE(QFileInfo(archives.at(0).path).fileName(), QStringLiteral("a_m.psarc"));
        QCOMPARE(QFileInfo(archives.at(1).path).fileName(), QStringLiteral("b_p.psarc"));
        QVERIFY(QFileInfo(archives.at(0).path).isAbsolute());
    }

    void findArchives_keepsFolderOrderAndSkipsMissing()
    {
        QTemporaryDir first;
        QTemporaryDir second;
        writeArchive(first.path(), QStringLiteral("z_p.psarc"));
        writeArchive(second.path(), QStringLiteral("a_p.psarc"));

        const QVector<ArchiveFile> archives = ArchiveEnumerator::findArchives(
            { first.path(), QStringLiteral("/nonexistent/basstutor/dlc"), second.path() });
        QCOMPARE(archives.size(), 2);
        QCOMPARE(QFileInfo(archives.at(0).path).fileName(), QStringLiteral("z_p.psarc"));
        QCOMPARE(QFileInfo(archives.at(1).path).fileName(), QStringLiteral("a_p.psarc"));
    }

    void findArchives_reportsMtimeInMilliseconds()
    {
        QTemporaryDir dir;
        const QDateTime mtime = QDateTime::fromSecsSinceEpoch(1650000000);
        writeArchive(dir.path(), QStringLiteral("a_p.psarc"), mtime);

        const QVector<ArchiveFile> archives = ArchiveEnumerator::findArchives({ dir.path() });
        QCOMPARE(archives.size(), 1);
        QCOMPARE(archives.first().mtime, mtime.toMSecsSinceEpoch());
    }

    void findArchives_includesUnreadableArchives()
    {
        QTemporaryDir dir;
        const QString locked = writeArchive(dir.path(), QStringLiteral("locked_p.psarc"));
        if (!makeUnreadable(locked))
            QSKIP("File permissions are not enforced for this user");

        const QVector<ArchiveFile> archives = ArchiveEnumerator::findArchives({ dir.path() });
        QCOMPARE(archives.size(), 1);
        QCOMPARE(archives.first().path, locked);
    }

    void platformSuffixes()
    {
        QVERIFY(ArchiveEnumerator::isPrimaryPlatform(QStringLiteral("/dlc/song_p.psarc")));
        QVERIFY(!ArchiveEnumerator::isPrimaryPlatform(QStringLiteral("/dlc/song_m.psarc")));
        QVERIFY(ArchiveEnumerator::isSecondaryPlatform(QStringLiteral("/dlc/song_m.psarc")));
        QVERIFY(!ArchiveEnumerator::isPrimaryPlatform(QStringLiteral("/dlc_p.psarc/song.psarc")));
    }
};

QTEST_MAIN(tst_ArchiveEnumerator)
#include "tst_ArchiveEnumerator.moc"
