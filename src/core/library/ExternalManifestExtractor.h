#pragma once

#include "IManifestExtractor.h"

#include <QStringList>

// Runs an external archive unpacker into a temporary directory and reads
// back the manifests/ entries it produced.
//
// The command template is split like a shell command line. Placeholders:
//   {archive}  absolute path of the archive
//   {output}   temporary output directory
//   {decrypt}  replaced by "--decrypt" when decryption is requested,
//              dropped otherwise
//
// Stateless after construction, so one instance may serve several
// worker threads at once.
class ExternalManifestExtractor : public IManifestExtractor {
public:
    explicit ExternalManifestExtractor(const QString& commandTemplate, int timeoutMs = 60000);

    std::optional<ArchiveContent> extract(QIODevice& archive, bool decrypt) override;

    // Only entries under this prefix are read back
    static const QString s_manifestPrefix;

private:
    QStringList buildArguments(const QString& archivePath,
                               const QString& outputDir,
                               bool decrypt) const;

    QString     m_program;
    QStringList m_argTemplate;
    int         m_timeoutMs;
};
