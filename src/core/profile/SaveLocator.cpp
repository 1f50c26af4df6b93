#include "SaveLocator.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>

const QString SaveLocator::s_appId = QStringLiteral("221680");
const QString SaveLocator::s_saveSuffix = QStringLiteral("_PRFLDB");

std::optional<QString> SaveLocator::findLatest(const QString& userDataRoot)
{
    QDir root(userDataRoot);
    if (!root.exists()) {
        qDebug() << "[Profile] User data dir not found:" << userDataRoot;
        return std::nullopt;
    }

    std::optional<QFileInfo> best;
    const QStringList accounts = root.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString& account : accounts) {
        QDir remote(root.filePath(account + QLatin1Char('/') + s_appId + QStringLiteral("/remote")));
        if (!remote.exists())
            continue;

        const QFileInfoList saves = remote.entryInfoList(
            { QStringLiteral("*") + s_saveSuffix }, QDir::Files, QDir::Name);
        for (const QFileInfo& fi : saves) {
            if (!best || fi.lastModified() > best->lastModified())
                best = fi;
        }
    }

    if (!best) {
        qDebug() << "[Profile] No" << s_saveSuffix << "files under" << userDataRoot;
        return std::nullopt;
    }

    qDebug() << "[Profile] Auto-detected save:" << best->absoluteFilePath();
    return best->absoluteFilePath();
}
