#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QTextStream>
#include "directoryscanner.h"
#include "embedsession.h"
#include "exitcodes.h"
#include "logger.h"
#include "matcher.h"
#include "mergetoolrunner.h"
#include "reportwriter.h"
#include "resourceguard.h"
#include "settings.h"
#include "subtitlerenamer.h"

namespace {

QTextStream& console()
{
    static QTextStream out(stdout);
    return out;
}

QStringList configurationLines(const Settings& settings)
{
    return {
        QString("videos=%1").arg(settings.general().videoExtensions.join(' ')),
        QString("subtitles=%1").arg(settings.general().subtitleExtensions.join(' ')),
        QString("strict_movie_mode=%1").arg(settings.general().strictMovieMode ? QString("true") : QString("false")),
        QString("renaming_language_suffix=%1").arg(settings.renaming().languageSuffix),
        QString("embedding_language_code=%1").arg(settings.embedding().languageCode),
        QString("default_flag=%1").arg(settings.embedding().defaultTrack ? QString("true") : QString("false"))
    };
}

void writeReportFile(const QString& directory, const char *name, const QString& content)
{
    const QString path = QDir(directory).filePath(QLatin1String(name));
    QString error;
    if (ReportWriter::write(path, content, &error)) {
        console() << "Report: " << path << Qt::endl;
    } else {
        console() << "Warning: " << error << Qt::endl;
    }
}

int runRename(const MatchResult& match, const Settings& settings, bool forceReport,
              const QString& directory, const QElapsedTimer& timer)
{
    SubtitleRenamer renamer(settings.renaming().languageSuffix);
    const RenameReport report = renamer.run(match.matched);

    for (const RenameOutcome& outcome : report.outcomes) {
        if (outcome.succeeded()) {
            console() << "RENAMED: " << outcome.pair.subtitle.fileName() << " -> "
                      << QFileInfo(outcome.newPath).fileName()
                      << (outcome.pair.lowConfidence ? " (low confidence)" : "") << Qt::endl;
        } else {
            console() << "FAILED: " << outcome.errorMessage << Qt::endl;
        }
    }
    for (const UnmatchedFile& unmatched : match.unmatchedSubtitles) {
        console() << "NO MATCH: " << unmatched.file.fileName() << " (" << Matcher::reasonName(unmatched.reason)
                  << ")" << Qt::endl;
    }
    console() << "COMPLETED: " << report.renamedCount() << " renamed | " << report.failedCount() << " failed | "
              << match.unmatchedSubtitles.size() << " unmatched" << Qt::endl;

    if (settings.renaming().report || forceReport) {
        ReportWriter::RunInfo info;
        info.directory = directory;
        info.configuration = configurationLines(settings);
        info.elapsedMs = timer.elapsed();
        writeReportFile(directory, ReportWriter::RENAMING_REPORT_NAME,
                        ReportWriter::renderRenamingReport(match, report, info));
    }
    return report.exitCode();
}

int runEmbed(const MatchResult& match, const Settings& settings, bool forceReport,
             const QString& directory, const QElapsedTimer& timer)
{
    MergeOptions options;
    options.languageDetector = LanguageDetector(settings.embedding().languageCode);
    options.defaultTrack = settings.embedding().defaultTrack;

    ResourceGuard guard(settings.embedding().mergeToolPath);
    ProcessMergeToolRunner runner;
    EmbedSession session(options, guard, runner);
    const EmbedReport report = session.run(match.matched);

    if (report.fatal) {
        console() << "ERROR: " << report.fatalMessage << Qt::endl;
        console() << "Install MKVToolNix, place mkvmerge in bin/ beside submux, or set mkvmerge_path in config.ini"
                  << Qt::endl;
    }
    for (const TransactionResult& result : report.results) {
        if (result.succeeded()) {
            console() << "EMBEDDED: " << QFileInfo(result.subtitlePath).fileName() << " -> "
                      << QFileInfo(result.videoPath).fileName() << " [language: "
                      << (result.language.isResolved() ? result.language.code : QString("none")) << "]" << Qt::endl;
        } else {
            console() << "FAILED: " << QFileInfo(result.videoPath).fileName() << ": " << result.errorMessage
                      << Qt::endl;
        }
    }
    for (const SkippedPair& skipped : report.skipped) {
        console() << "SKIPPED: " << skipped.pair.video.fileName() << " (" << skipped.reason << ")" << Qt::endl;
    }
    console() << "COMPLETED: " << report.succeededCount() << " embedded | " << report.failedCount() << " failed | "
              << match.unmatchedSubtitles.size() << " unmatched" << Qt::endl;

    if (settings.embedding().report || forceReport) {
        ReportWriter::RunInfo info;
        info.directory = directory;
        info.configuration = configurationLines(settings);
        info.elapsedMs = timer.elapsed();
        writeReportFile(directory, ReportWriter::EMBEDDING_REPORT_NAME,
                        ReportWriter::renderEmbeddingReport(match, report, info));
    }
    return report.exitCode();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("submux");
    app.setApplicationVersion("1.0.0");

    QElapsedTimer timer;
    timer.start();

    QCommandLineParser parser;
    parser.setApplicationDescription("Match subtitles to videos, then rename them or embed them with mkvmerge.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "rename or embed");
    parser.addPositionalArgument("directory", "Directory to process (default: current directory)", "[directory]");

    QCommandLineOption configOption(QStringList() << "c" << "config", "Configuration file.", "path");
    QCommandLineOption strictOption("strict", "Reject movie matches below the similarity threshold.");
    QCommandLineOption reportOption("report", "Write a CSV report regardless of config.ini.");
    QCommandLineOption logFileOption("log-file", "Append log output to a file.", "path");
    QCommandLineOption testToolOption("test-merge-tool", "Check that mkvmerge can be found and run, then exit.");
    parser.addOption(configOption);
    parser.addOption(strictOption);
    parser.addOption(reportOption);
    parser.addOption(logFileOption);
    parser.addOption(testToolOption);
    parser.process(app);

    // Configuration; the default location gets a config.ini on first run
    Settings settings;
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption) : Settings::defaultConfigPath();
    if (!parser.isSet(configOption) && !QFileInfo::exists(configPath) && !settings.save(configPath)) {
        console() << "Warning: cannot create default configuration " << configPath << Qt::endl;
    }
    QString configError;
    if (!settings.load(configPath, &configError)) {
        console() << "Warning: " << configError << ", using defaults" << Qt::endl;
    }

    const QString logFile = parser.isSet(logFileOption) ? parser.value(logFileOption) : settings.logging().logFile;
    if (!logFile.isEmpty() && !Logger::instance()->setLogFile(logFile)) {
        console() << "Warning: cannot open log file " << logFile << Qt::endl;
    }

    LOG(QString("submux %1 starting").arg(app.applicationVersion()));

    if (parser.isSet(testToolOption)) {
        ResourceGuard guard(settings.embedding().mergeToolPath);
        const MergeToolInfo& tool = guard.probeMergeTool();
        if (tool.isAvailable) {
            console() << "[OK] mkvmerge found: " << tool.path << " (version " << tool.version << ")" << Qt::endl;
            return ExitCode::SUCCESS;
        }
        console() << "[ERROR] " << tool.unavailableReason << Qt::endl;
        return ExitCode::FATAL_ERROR;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty() || positional.size() > 2) {
        console() << parser.helpText();
        return ExitCode::FATAL_ERROR;
    }

    const QString command = positional.at(0).toLower();
    if (command != "rename" && command != "embed") {
        console() << "Unknown command: " << positional.at(0) << Qt::endl;
        return ExitCode::FATAL_ERROR;
    }

    const QString directory = QFileInfo(positional.size() > 1 ? positional.at(1) : QDir::currentPath())
                                  .absoluteFilePath();

    DirectoryScanner scanner(settings.general().videoExtensions, settings.general().subtitleExtensions);
    ScanResult scan;
    QString scanError;
    if (!scanner.scan(directory, &scan, &scanError)) {
        console() << "ERROR: " << scanError << Qt::endl;
        return ExitCode::FATAL_ERROR;
    }

    console() << "FILES FOUND: " << scan.videos.size() << " videos | " << scan.subtitles.size() << " subtitles"
              << Qt::endl;

    MatcherOptions matcherOptions;
    matcherOptions.strictMovieMode = parser.isSet(strictOption) || settings.general().strictMovieMode;
    Matcher matcher(matcherOptions);

    // Embedding only writes Matroska, so other containers never compete for a subtitle
    const MediaFileList videos = command == "embed" ? EmbedSession::embedCandidates(scan.videos) : scan.videos;
    if (command == "embed" && videos.size() != scan.videos.size()) {
        console() << "INFO: " << scan.videos.size() - videos.size() << " non-MKV videos ignored for embedding"
                  << Qt::endl;
    }
    const MatchResult match = matcher.match(videos, scan.subtitles);

    const bool forceReport = parser.isSet(reportOption);
    if (command == "rename") {
        return runRename(match, settings, forceReport, directory, timer);
    }
    return runEmbed(match, settings, forceReport, directory, timer);
}
