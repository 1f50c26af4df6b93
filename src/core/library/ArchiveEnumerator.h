#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

struct ArchiveFile {
    QString path;       // absolute
    qint64  mtime = 0;  // ms since epoch
};

class ArchiveEnumerator {
public:
    // Non-recursive listing of *.psarc per folder, sorted by name within
    // each folder. Missing folders contribute nothing.
    static QVector<ArchiveFile> findArchives(const QStringList& folders);

    static bool isPrimaryPlatform(const QString& path);    // *_p.psarc
    static bool isSecondaryPlatform(const QString& path);  // *_m.psarc

    static const QString s_archiveSuffix;
};
