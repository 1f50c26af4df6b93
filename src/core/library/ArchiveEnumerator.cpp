#include "ArchiveEnumerator.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

const QString ArchiveEnumerator::s_archiveSuffix = QStringLiteral(".psarc");

QVector<ArchiveFile> ArchiveEnumerator::findArchives(const QStringList& folders)
{
    QVector<ArchiveFile> archives;

    for (const QString& folder : folders) {
        QFileInfo folderInfo(folder);
        if (!folderInfo.isDir()) {
            qDebug() << "[Scan] Folder not accessible, skipping:" << folder;
            continue;
        }

        QDir dir(folder);
        const QFileInfoList entries = dir.entryInfoList(
            { QStringLiteral("*") + s_archiveSuffix },
            QDir::Files, QDir::Name);

        for (const QFileInfo& fi : entries) {
            archives.append({ fi.absoluteFilePath(),
                              fi.lastModified().toMSecsSinceEpoch() });
        }
    }

    return archives;
}

bool ArchiveEnumerator::isPrimaryPlatform(const QString& path)
{
    return QFileInfo(path).fileName().endsWith(QStringLiteral("_p.psarc"), Qt::CaseInsensitive);
}

bool ArchiveEnumerator::isSecondaryPlatform(const QString& path)
{
    return QFileInfo(path).fileName().endsWith(QStringLiteral("_m.psarc"), Qt::CaseInsensitive);
}
