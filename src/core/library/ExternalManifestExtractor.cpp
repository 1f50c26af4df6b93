#include "ExternalManifestExtractor.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QProcess>
#include <QTemporaryDir>
#include <QTemporaryFile>

const QString ExternalManifestExtractor::s_manifestPrefix = QStringLiteral("manifests/");

ExternalManifestExtractor::ExternalManifestExtractor(const QString& commandTemplate, int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
    QStringList parts = QProcess::splitCommand(commandTemplate);
    if (!parts.isEmpty())
        m_program = parts.takeFirst();
    m_argTemplate = parts;
}

QStringList ExternalManifestExtractor::buildArguments(const QString& archivePath,
                                                      const QString& outputDir,
                                                      bool decrypt) const
{
    QStringList args;
    args.reserve(m_argTemplate.size());
    for (QString arg : m_argTemplate) {
        if (arg == QLatin1String("{decrypt}")) {
            if (decrypt) args.append(QStringLiteral("--decrypt"));
            continue;
        }
        arg.replace(QLatin1String("{archive}"), archivePath);
        arg.replace(QLatin1String("{output}"), outputDir);
        args.append(arg);
    }
    return args;
}

std::optional<ArchiveContent> ExternalManifestExtractor::extract(QIODevice& archive, bool decrypt)
{
    if (m_program.isEmpty()) {
        qWarning() << "[Extractor] No extractor command configured";
        return std::nullopt;
    }

    // The external tool needs a path; spool non-file streams to disk first
    QString archivePath;
    QTemporaryFile spool;
    auto* fileDevice = qobject_cast<QFileDevice*>(&archive);
    if (fileDevice && !fileDevice->fileName().isEmpty()) {
        archivePath = QFileInfo(fileDevice->fileName()).absoluteFilePath();
    } else {
        if (!spool.open()) {
            qDebug() << "[Extractor] Cannot create spool file:" << spool.errorString();
            return std::nullopt;
        }
        while (!archive.atEnd()) {
            QByteArray chunk = archive.read(1 << 20);
            if (chunk.isEmpty()) break;
            if (spool.write(chunk) != chunk.size()) {
                qDebug() << "[Extractor] Spool write failed:" << spool.errorString();
                return std::nullopt;
            }
        }
        spool.flush();
        archivePath = spool.fileName();
    }

    QTemporaryDir outDir;
    if (!outDir.isValid()) {
        qDebug() << "[Extractor] Cannot create temporary directory:" << outDir.errorString();
        return std::nullopt;
    }

    QProcess proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(m_program, buildArguments(archivePath, outDir.path(), decrypt));
    if (!proc.waitForStarted()) {
        qWarning() << "[Extractor] Failed to start" << m_program << ":" << proc.errorString();
        return std::nullopt;
    }
    if (!proc.waitForFinished(m_timeoutMs)) {
        proc.kill();
        proc.waitForFinished();
        qDebug() << "[Extractor] Timed out after" << m_timeoutMs << "ms:" << archivePath;
        return std::nullopt;
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        qDebug() << "[Extractor] Exit code" << proc.exitCode() << "for" << archivePath
                 << ":" << QString::fromLocal8Bit(proc.readAll()).trimmed();
        return std::nullopt;
    }

    ArchiveContent content;
    QDir root(outDir.path());
    QDirIterator it(outDir.path(), QDir::Files, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString filePath = it.next();
        const QString rel = QDir::fromNativeSeparators(root.relativeFilePath(filePath));
        if (!rel.startsWith(s_manifestPrefix, Qt::CaseInsensitive))
            continue;

        QFile f(filePath);
        if (!f.open(QIODevice::ReadOnly)) {
            qDebug() << "[Extractor] Cannot read extracted entry" << rel << ":" << f.errorString();
            return std::nullopt;
        }
        content.insert(rel, f.readAll());
    }

    return content;
}
