#include "ProfileParser.h"

#include <QDebug>
#include <QSet>
#include <utility>

// Save values are numbers or numeric strings depending on game version
static double num(const QJsonObject& obj, const QString& key)
{
    return obj.value(key).toVariant().toDouble();
}

// Re-key a section by upper-cased id
static QHash<QString, QJsonObject> normalizeSection(const QJsonObject& section)
{
    QHash<QString, QJsonObject> out;
    for (auto it = section.constBegin(); it != section.constEnd(); ++it)
        out.insert(it.key().toUpper(), it.value().toObject());
    return out;
}

PlayerProfile ProfileParser::parse(const QJsonObject& root, const IdentifierMap& idMap)
{
    const auto songsDD = normalizeSection(root.value(QStringLiteral("Songs")).toObject());
    const auto songsSA = normalizeSection(root.value(QStringLiteral("SongsSA")).toObject());

    QSet<QString> allIds;
    for (auto it = songsDD.cbegin(); it != songsDD.cend(); ++it) allIds.insert(it.key());
    for (auto it = songsSA.cbegin(); it != songsSA.cend(); ++it) allIds.insert(it.key());

    PlayerProfile profile;
    int dropped = 0;

    for (const QString& pid : std::as_const(allIds)) {
        const QString songId = idMap.value(pid);
        if (songId.isEmpty()) {
            // Not a bass arrangement we know about
            ++dropped;
            continue;
        }

        SongProgress sp;
        sp.persistentId = pid;
        sp.songId = songId;

        const QJsonObject dd = songsDD.value(pid);
        sp.dynamicDifficultyAvg = num(dd.value(QStringLiteral("DynamicDifficulty")).toObject(),
                                      QStringLiteral("Avg"));
        sp.timestamp = num(dd, QStringLiteral("TimeStamp"));

        const QJsonObject sa = songsSA.value(pid);
        const QJsonObject badges = sa.value(QStringLiteral("Badges")).toObject();
        sp.badgeEasy = static_cast<int>(num(badges, QStringLiteral("Easy")));
        sp.badgeMedium = static_cast<int>(num(badges, QStringLiteral("Medium")));
        sp.badgeHard = static_cast<int>(num(badges, QStringLiteral("Hard")));
        sp.badgeMaster = static_cast<int>(num(badges, QStringLiteral("Master")));
        sp.playCount = static_cast<int>(num(sa, QStringLiteral("PlayCount")));
        sp.highScoreHard = num(sa.value(QStringLiteral("HighScores")).toObject(),
                               QStringLiteral("Hard"));

        profile.songs.insert(pid, sp);
    }

    qDebug() << "[Profile] Parsed" << profile.songs.size() << "songs,"
             << dropped << "ids not in the identifier map";
    return profile;
}
