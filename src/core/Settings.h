#pragma once

#include <QSettings>
#include <QStringList>

class Settings {
public:
    static Settings* instance();
    explicit Settings(const QString& iniPath);

    static QString settingsPath();

    // ── Library ──────────────────────────────────────────────────────
    QStringList archiveFolders() const;
    void setArchiveFolders(const QStringList& folders);
    void addArchiveFolder(const QString& folder);
    void removeArchiveFolder(const QString& folder);

    static QStringList defaultArchiveFolders();

    // ── Storage ──────────────────────────────────────────────────────
    // BASSTUTOR_DATA_DIR overrides the stored value
    QString dataDir() const;
    void setDataDir(const QString& dir);

    QString catalogPath() const;
    QString idMapPath() const;

    // ── Profile ──────────────────────────────────────────────────────
    QString userDataRoot() const;
    void setUserDataRoot(const QString& root);

    static QString defaultUserDataRoot();

    // ── Extractor ────────────────────────────────────────────────────
    // Command template; {archive} and {output} are substituted per call
    QString extractorCommand() const;
    void setExtractorCommand(const QString& command);

    bool extractorDecrypt() const;
    void setExtractorDecrypt(bool enabled);

    int extractorTimeoutMs() const;
    void setExtractorTimeoutMs(int ms);

    // ── Recommendations ──────────────────────────────────────────────
    int recommendationCount() const;
    void setRecommendationCount(int count);

    QString fileName() const { return m_settings.fileName(); }
    void sync() { m_settings.sync(); }

private:
    Settings();

    QSettings m_settings;
};
