#include "ManifestReader.h"
#include "../Techniques.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <algorithm>

// Manifest values are usually numbers but hand-made archives sometimes
// carry them as strings or booleans.
static double numberValue(const QJsonValue& v, double fallback = 0.0)
{
    if (v.isDouble()) return v.toDouble();
    if (v.isBool()) return v.toBool() ? 1.0 : 0.0;
    if (v.isString()) {
        bool ok = false;
        double d = v.toString().trimmed().toDouble(&ok);
        return ok ? d : fallback;
    }
    return fallback;
}

static int intValue(const QJsonValue& v, int fallback = 0)
{
    return static_cast<int>(numberValue(v, fallback));
}

static bool flagValue(const QJsonValue& v)
{
    return numberValue(v, 0.0) != 0.0;
}

static QString stringValue(const QJsonValue& v, const QString& fallback)
{
    if (v.isString()) return v.toString();
    return fallback;
}

bool ManifestReader::isBassManifest(const QString& entryPath)
{
    return entryPath.startsWith(QStringLiteral("manifests/"))
        && entryPath.endsWith(QStringLiteral("_bass.json"));
}

QStringList ManifestReader::sortedBassManifests(const ArchiveContent& content)
{
    QStringList keys;
    for (auto it = content.cbegin(); it != content.cend(); ++it) {
        if (isBassManifest(it.key()))
            keys.append(it.key());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// Returns the "Entries" object, or std::nullopt for malformed JSON
std::optional<QJsonObject> ManifestReader::parseEntries(const QByteArray& json)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return std::nullopt;
    return doc.object().value(QStringLiteral("Entries")).toObject();
}

// ── Bass manifest selection ─────────────────────────────────────────
std::optional<QJsonObject> ManifestReader::bassManifestAttributes(const ArchiveContent& content,
                                                                  QString* manifestPath)
{
    std::optional<QJsonObject> best;
    QString bestPath;
    int candidates = 0;

    for (const QString& key : sortedBassManifests(content)) {
        auto entries = parseEntries(content.value(key));
        if (!entries) {
            qDebug() << "[Manifest] Skipping malformed manifest" << key;
            continue;
        }

        for (auto it = entries->constBegin(); it != entries->constEnd(); ++it) {
            QJsonObject attrs = it.value().toObject()
                                    .value(QStringLiteral("Attributes")).toObject();
            if (attrs.isEmpty())
                continue;

            ++candidates;
            if (!best || attrs.size() > best->size()) {
                best = attrs;
                bestPath = key;
            }
        }
    }

    if (candidates > 1) {
        qWarning() << "[Manifest] Archive has" << candidates
                   << "bass attribute blocks, using" << bestPath;
    }
    if (best && manifestPath)
        *manifestPath = bestPath;
    return best;
}

QString ManifestReader::songIdFromAttributes(const QJsonObject& attrs)
{
    const QString dlcKey = stringValue(attrs.value(QStringLiteral("DLCKey")), QString());
    const QString fullName = stringValue(attrs.value(QStringLiteral("FullName")),
                                         dlcKey + QStringLiteral("_Bass"));
    return fullName.toLower();
}

// ── Attribute mapping ───────────────────────────────────────────────
SongEntry ManifestReader::songEntryFromAttributes(const QJsonObject& attrs,
                                                  const QString& archivePath,
                                                  qint64 archiveMtime)
{
    const QJsonObject props = attrs.value(QStringLiteral("ArrangementProperties")).toObject();

    SongEntry e;
    e.songId = songIdFromAttributes(attrs);
    e.dlcKey = stringValue(attrs.value(QStringLiteral("DLCKey")), QString());
    e.artist = stringValue(attrs.value(QStringLiteral("ArtistName")), QStringLiteral("Unknown"));
    e.title = stringValue(attrs.value(QStringLiteral("SongName")), QStringLiteral("Unknown"));
    e.album = stringValue(attrs.value(QStringLiteral("AlbumName")), QString());
    e.year = intValue(attrs.value(QStringLiteral("SongYear")));

    e.archivePath = archivePath;
    e.archiveMtime = archiveMtime;

    e.tempo = numberValue(attrs.value(QStringLiteral("SongAverageTempo")));
    e.songLength = numberValue(attrs.value(QStringLiteral("SongLength")));

    // "string0".."string5" → "0".."5"
    const QJsonObject tuning = attrs.value(QStringLiteral("Tuning")).toObject();
    for (auto it = tuning.constBegin(); it != tuning.constEnd(); ++it) {
        QString key = it.key();
        if (key.startsWith(QStringLiteral("string")))
            key = key.mid(6);
        e.tuning.insert(key, intValue(it.value()));
    }
    e.standardTuning = flagValue(props.value(QStringLiteral("standardTuning")));

    e.difficultyEasy = numberValue(attrs.value(QStringLiteral("SongDiffEasy")));
    e.difficultyMedium = numberValue(attrs.value(QStringLiteral("SongDiffMed")));
    e.difficultyHard = numberValue(attrs.value(QStringLiteral("SongDiffHard")));
    e.notesEasy = intValue(attrs.value(QStringLiteral("NotesEasy")));
    e.notesMedium = intValue(attrs.value(QStringLiteral("NotesMedium")));
    e.notesHard = intValue(attrs.value(QStringLiteral("NotesHard")));
    e.maxPhraseDifficulty = intValue(attrs.value(QStringLiteral("MaxPhraseDifficulty")));

    for (const QString& name : Techniques::manifestTechniques())
        e.techniques.insert(name, flagValue(props.value(name)));

    const QJsonArray sections = attrs.value(QStringLiteral("Sections")).toArray();
    e.sections.reserve(sections.size());
    for (const QJsonValue& v : sections) {
        const QJsonObject s = v.toObject();
        SectionInfo info;
        info.name = stringValue(s.value(QStringLiteral("Name")), QString());
        info.number = intValue(s.value(QStringLiteral("Number")));
        info.startTime = numberValue(s.value(QStringLiteral("StartTime")));
        info.endTime = numberValue(s.value(QStringLiteral("EndTime")));
        info.isSolo = flagValue(s.value(QStringLiteral("IsSolo")));
        e.sections.append(info);
    }

    return e;
}

// ── Identifier pairs ────────────────────────────────────────────────
QHash<QString, QString> ManifestReader::identifierPairs(const ArchiveContent& content)
{
    QHash<QString, QString> pairs;

    for (const QString& key : sortedBassManifests(content)) {
        auto entries = parseEntries(content.value(key));
        if (!entries)
            continue;

        for (auto it = entries->constBegin(); it != entries->constEnd(); ++it) {
            const QJsonObject attrs = it.value().toObject()
                                          .value(QStringLiteral("Attributes")).toObject();
            if (attrs.isEmpty())
                continue;

            const QString persistentId = stringValue(attrs.value(QStringLiteral("PersistentID")),
                                                     it.key()).toUpper();
            if (persistentId.isEmpty())
                continue;
            pairs.insert(persistentId, songIdFromAttributes(attrs));
        }
    }

    return pairs;
}
