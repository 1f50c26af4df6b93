#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QMutex>
#include <QTextStream>
#include <cstdio>

#include "cli/Commands.h"
#include "core/Settings.h"

static bool s_verbose = false;

static void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    if (type == QtDebugMsg && !s_verbose)
        return;

    static QMutex mtx;
    QMutexLocker lock(&mtx);
    QString line = QStringLiteral("[%1] %2\n")
        .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
    QByteArray utf8 = line.toUtf8();
    fprintf(stderr, "%s", utf8.constData());
    fflush(stderr);
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("BassTutor"));
    app.setApplicationName(QStringLiteral("basstutor"));
    app.setApplicationVersion(QStringLiteral(APP_VERSION));

    qInstallMessageHandler(messageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Bass practice tutor: catalogs your song archives and recommends what to play next.\n\n"
        "Commands:\n"
        "  scan       Scan archive folders and update the song catalog\n"
        "  catalog    Browse the song catalog\n"
        "  idmap      Build the save-file identifier map\n"
        "  profile    Show per-song progress from the save file\n"
        "  recommend  Recommend songs just above your comfort level"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption verboseOption(QStringList{ QStringLiteral("v"), QStringLiteral("verbose") },
                                     QStringLiteral("Enable debug logging."));
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."),
                                 QStringLiteral("<command> [options]"));
    // Everything after the command word belongs to the command
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    parser.process(app);

    s_verbose = parser.isSet(verboseOption);

    QStringList rest = parser.positionalArguments();
    if (rest.isEmpty()) {
        QTextStream(stderr) << parser.helpText();
        return ExitUsage;
    }

    const QString command = rest.takeFirst();
    if (rest.removeAll(QStringLiteral("--verbose")) + rest.removeAll(QStringLiteral("-v")) > 0)
        s_verbose = true;

    const QStringList commandArgs =
        QStringList{ app.applicationName() + QLatin1Char(' ') + command } + rest;

    Settings& settings = *Settings::instance();
    qDebug() << "[Settings]" << settings.fileName();

    int rc = ExitUsage;
    if (command == QLatin1String("scan"))
        rc = Commands::scan(commandArgs, settings);
    else if (command == QLatin1String("catalog"))
        rc = Commands::catalog(commandArgs, settings);
    else if (command == QLatin1String("idmap"))
        rc = Commands::idmap(commandArgs, settings);
    else if (command == QLatin1String("profile"))
        rc = Commands::profile(commandArgs, settings);
    else if (command == QLatin1String("recommend"))
        rc = Commands::recommend(commandArgs, settings);
    else
        QTextStream(stderr) << "Unknown command: " << command << "\n\n" << parser.helpText();

    settings.sync();
    return rc;
}
