#include "Settings.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

static const char* kDataDirEnv = "BASSTUTOR_DATA_DIR";
static const QString kDefaultExtractorCommand =
    QStringLiteral("psarc-extract --output {output} {archive}");

static QString appDataLocation()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
           + QStringLiteral("/BassTutor");
}

// ── Settings INI path ───────────────────────────────────────────────
// <GenericDataLocation>/BassTutor/settings.ini
QString Settings::settingsPath()
{
    QDir dir(appDataLocation());
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

Settings::Settings()
    : m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

Settings::Settings(const QString& iniPath)
    : m_settings(iniPath, QSettings::IniFormat)
{
}

// ── Library folders ─────────────────────────────────────────────────
QStringList Settings::defaultArchiveFolders()
{
    const QString home = QDir::homePath();
#if defined(Q_OS_MACOS)
    return { home + QStringLiteral("/Library/Application Support/Steam/steamapps/common/Rocksmith2014/dlc") };
#elif defined(Q_OS_WIN)
    Q_UNUSED(home);
    return { QStringLiteral("C:/Program Files (x86)/Steam/steamapps/common/Rocksmith2014/dlc") };
#else
    return { home + QStringLiteral("/.steam/steam/steamapps/common/Rocksmith2014/dlc") };
#endif
}

QStringList Settings::archiveFolders() const
{
    if (!m_settings.contains(QStringLiteral("library/archiveFolders")))
        return defaultArchiveFolders();
    return m_settings.value(QStringLiteral("library/archiveFolders")).toStringList();
}

void Settings::setArchiveFolders(const QStringList& folders)
{
    m_settings.setValue(QStringLiteral("library/archiveFolders"), folders);
}

void Settings::addArchiveFolder(const QString& folder)
{
    QStringList folders = archiveFolders();
    if (!folders.contains(folder)) {
        folders.append(folder);
        setArchiveFolders(folders);
    }
}

void Settings::removeArchiveFolder(const QString& folder)
{
    QStringList folders = archiveFolders();
    folders.removeAll(folder);
    setArchiveFolders(folders);
}

// ── Storage ─────────────────────────────────────────────────────────
QString Settings::dataDir() const
{
    const QString env = qEnvironmentVariable(kDataDirEnv);
    if (!env.isEmpty())
        return env;
    return m_settings.value(QStringLiteral("storage/dataDir"), appDataLocation()).toString();
}

void Settings::setDataDir(const QString& dir)
{
    m_settings.setValue(QStringLiteral("storage/dataDir"), dir);
}

QString Settings::catalogPath() const
{
    return QDir(dataDir()).filePath(QStringLiteral("catalog.json"));
}

QString Settings::idMapPath() const
{
    return QDir(dataDir()).filePath(QStringLiteral("id_map.json"));
}

// ── Profile ─────────────────────────────────────────────────────────
QString Settings::defaultUserDataRoot()
{
#if defined(Q_OS_MACOS)
    return QDir::homePath() + QStringLiteral("/Library/Application Support/Steam/userdata");
#elif defined(Q_OS_WIN)
    return QStringLiteral("C:/Program Files (x86)/Steam/userdata");
#else
    return QDir::homePath() + QStringLiteral("/.steam/steam/userdata");
#endif
}

QString Settings::userDataRoot() const
{
    return m_settings.value(QStringLiteral("profile/userDataRoot"), defaultUserDataRoot()).toString();
}

void Settings::setUserDataRoot(const QString& root)
{
    m_settings.setValue(QStringLiteral("profile/userDataRoot"), root);
}

// ── Extractor ───────────────────────────────────────────────────────
QString Settings::extractorCommand() const
{
    QString val = m_settings.value(QStringLiteral("extractor/command")).toString();
    if (val.trimmed().isEmpty()) return kDefaultExtractorCommand;
    return val;
}

void Settings::setExtractorCommand(const QString& command)
{
    m_settings.setValue(QStringLiteral("extractor/command"), command);
}

bool Settings::extractorDecrypt() const
{
    return m_settings.value(QStringLiteral("extractor/decrypt"), true).toBool();
}

void Settings::setExtractorDecrypt(bool enabled)
{
    m_settings.setValue(QStringLiteral("extractor/decrypt"), enabled);
}

int Settings::extractorTimeoutMs() const
{
    return m_settings.value(QStringLiteral("extractor/timeoutMs"), 60000).toInt();
}

void Settings::setExtractorTimeoutMs(int ms)
{
    m_settings.setValue(QStringLiteral("extractor/timeoutMs"), ms);
}

// ── Recommendations ─────────────────────────────────────────────────
int Settings::recommendationCount() const
{
    int count = m_settings.value(QStringLiteral("recommend/count"), 20).toInt();
    return count > 0 ? count : 20;
}

void Settings::setRecommendationCount(int count)
{
    m_settings.setValue(QStringLiteral("recommend/count"), count);
}
