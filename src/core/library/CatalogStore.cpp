#include "CatalogStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

bool writeJsonDocument(const QString& path, const QJsonObject& root, QString* errorMessage)
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) *errorMessage = file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (errorMessage) *errorMessage = file.errorString();
        return false;
    }
    return true;
}

// ── Entry (de)serialization ─────────────────────────────────────────
QJsonObject CatalogStore::toJson(const SongEntry& e)
{
    QJsonObject tuning;
    for (auto it = e.tuning.cbegin(); it != e.tuning.cend(); ++it)
        tuning.insert(it.key(), it.value());

    QJsonObject techniques;
    for (auto it = e.techniques.cbegin(); it != e.techniques.cend(); ++it)
        techniques.insert(it.key(), it.value());

    QJsonArray sections;
    for (const SectionInfo& s : e.sections) {
        sections.append(QJsonObject{
            { QStringLiteral("name"), s.name },
            { QStringLiteral("number"), s.number },
            { QStringLiteral("start_time"), s.startTime },
            { QStringLiteral("end_time"), s.endTime },
            { QStringLiteral("is_solo"), s.isSolo },
        });
    }

    return QJsonObject{
        { QStringLiteral("song_id"), e.songId },
        { QStringLiteral("artist"), e.artist },
        { QStringLiteral("song_name"), e.title },
        { QStringLiteral("album"), e.album },
        { QStringLiteral("year"), e.year },
        { QStringLiteral("archive_path"), e.archivePath },
        { QStringLiteral("archive_mtime_ms"), static_cast<double>(e.archiveMtime) },
        { QStringLiteral("tempo"), e.tempo },
        { QStringLiteral("song_length"), e.songLength },
        { QStringLiteral("tuning"), tuning },
        { QStringLiteral("standard_tuning"), e.standardTuning },
        { QStringLiteral("difficulty_easy"), e.difficultyEasy },
        { QStringLiteral("difficulty_med"), e.difficultyMedium },
        { QStringLiteral("difficulty_hard"), e.difficultyHard },
        { QStringLiteral("notes_easy"), e.notesEasy },
        { QStringLiteral("notes_med"), e.notesMedium },
        { QStringLiteral("notes_hard"), e.notesHard },
        { QStringLiteral("max_phrase_difficulty"), e.maxPhraseDifficulty },
        { QStringLiteral("techniques"), techniques },
        { QStringLiteral("sections"), sections },
        { QStringLiteral("dlc_key"), e.dlcKey },
    };
}

SongEntry CatalogStore::songFromJson(const QJsonObject& o)
{
    SongEntry e;
    e.songId = o.value(QStringLiteral("song_id")).toString();
    e.artist = o.value(QStringLiteral("artist")).toString();
    e.title = o.value(QStringLiteral("song_name")).toString();
    e.album = o.value(QStringLiteral("album")).toString();
    e.year = o.value(QStringLiteral("year")).toInt();
    e.archivePath = o.value(QStringLiteral("archive_path")).toString();
    e.archiveMtime = static_cast<qint64>(o.value(QStringLiteral("archive_mtime_ms")).toDouble());
    e.tempo = o.value(QStringLiteral("tempo")).toDouble();
    e.songLength = o.value(QStringLiteral("song_length")).toDouble();
    e.standardTuning = o.value(QStringLiteral("standard_tuning")).toBool();
    e.difficultyEasy = o.value(QStringLiteral("difficulty_easy")).toDouble();
    e.difficultyMedium = o.value(QStringLiteral("difficulty_med")).toDouble();
    e.difficultyHard = o.value(QStringLiteral("difficulty_hard")).toDouble();
    e.notesEasy = o.value(QStringLiteral("notes_easy")).toInt();
    e.notesMedium = o.value(QStringLiteral("notes_med")).toInt();
    e.notesHard = o.value(QStringLiteral("notes_hard")).toInt();
    e.maxPhraseDifficulty = o.value(QStringLiteral("max_phrase_difficulty")).toInt();
    e.dlcKey = o.value(QStringLiteral("dlc_key")).toString();

    const QJsonObject tuning = o.value(QStringLiteral("tuning")).toObject();
    for (auto it = tuning.constBegin(); it != tuning.constEnd(); ++it)
        e.tuning.insert(it.key(), it.value().toInt());

    const QJsonObject techniques = o.value(QStringLiteral("techniques")).toObject();
    for (auto it = techniques.constBegin(); it != techniques.constEnd(); ++it)
        e.techniques.insert(it.key(), it.value().toBool());

    const QJsonArray sections = o.value(QStringLiteral("sections")).toArray();
    for (const QJsonValue& v : sections) {
        const QJsonObject s = v.toObject();
        SectionInfo info;
        info.name = s.value(QStringLiteral("name")).toString();
        info.number = s.value(QStringLiteral("number")).toInt();
        info.startTime = s.value(QStringLiteral("start_time")).toDouble();
        info.endTime = s.value(QStringLiteral("end_time")).toDouble();
        info.isSolo = s.value(QStringLiteral("is_solo")).toBool();
        e.sections.append(info);
    }

    return e;
}

// ── load / save ─────────────────────────────────────────────────────
Catalog CatalogStore::load(const QString& path)
{
    Catalog catalog;

    QFile file(path);
    if (!file.exists())
        return catalog;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[Catalog] Cannot open" << path << ":" << file.errorString();
        return catalog;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[Catalog] Ignoring corrupt catalog" << path << ":" << err.errorString();
        return catalog;
    }

    const QJsonObject root = doc.object();
    catalog.version = root.value(QStringLiteral("version")).toInt(Catalog::kFormatVersion);
    catalog.scannedAt = root.value(QStringLiteral("scanned_at")).toString();

    const QJsonObject songs = root.value(QStringLiteral("songs")).toObject();
    for (auto it = songs.constBegin(); it != songs.constEnd(); ++it) {
        SongEntry e = songFromJson(it.value().toObject());
        if (e.songId.isEmpty())
            e.songId = it.key();
        catalog.songs.insert(it.key(), e);
    }

    qDebug() << "[Catalog] Loaded" << catalog.songs.size() << "songs from" << path;
    return catalog;
}

bool CatalogStore::save(const Catalog& catalog, const QString& path, QString* errorMessage)
{
    QJsonObject songs;
    for (auto it = catalog.songs.cbegin(); it != catalog.songs.cend(); ++it)
        songs.insert(it.key(), toJson(it.value()));

    QJsonObject root{
        { QStringLiteral("version"), catalog.version },
        { QStringLiteral("scanned_at"), catalog.scannedAt },
        { QStringLiteral("songs"), songs },
    };

    if (!writeJsonDocument(path, root, errorMessage))
        return false;

    qDebug() << "[Catalog] Saved" << catalog.songs.size() << "songs to" << path;
    return true;
}
