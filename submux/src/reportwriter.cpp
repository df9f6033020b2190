#include "reportwriter.h"
#include "embedsession.h"
#include "identifierextractor.h"
#include "subtitlerenamer.h"
#include "logger.h"
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

QString ReportWriter::csvField(const QString& value)
{
    if (value.contains(',') || value.contains('"') || value.contains('\n') || value.contains('\r')) {
        QString escaped = value;
        escaped.replace("\"", "\"\"");
        return '"' + escaped + '"';
    }
    return value;
}

QString ReportWriter::csvRow(const QStringList& fields)
{
    QStringList quoted;
    for (const QString& field : fields) {
        quoted.append(csvField(field));
    }
    return quoted.join(',') + '\n';
}

QString ReportWriter::formatElapsed(qint64 ms)
{
    return QString("%1 s").arg(ms / 1000.0, 0, 'f', 2);
}

QString ReportWriter::header(const QString& title, const RunInfo& info)
{
    QString text;
    text += QString("# %1\n").arg(title);
    text += QString("# Generated: %1\n").arg(QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss"));
    text += QString("# Directory: %1\n").arg(info.directory);
    for (const QString& line : info.configuration) {
        text += QString("# Config: %1\n").arg(line);
    }
    text += QString("# Execution Time: %1\n").arg(formatElapsed(info.elapsedMs));
    return text;
}

QString ReportWriter::conflictLines(const MatchResult& match)
{
    if (match.conflicts.isEmpty()) {
        return QString();
    }

    QString text = "#\n# CONFLICTS:\n";
    for (const MatchConflict& conflict : match.conflicts) {
        text += QString("# %1 %2: kept %3, left %4\n")
                    .arg(Matcher::conflictKindName(conflict.kind), conflict.identifier.toString(),
                         QFileInfo(conflict.winner).fileName(), QFileInfo(conflict.loser).fileName());
    }
    return text;
}

QString ReportWriter::episodeLabel(const MatchedPair& pair)
{
    if (pair.basis == MatchBasis::MovieTitle) {
        return "Movie";
    }
    return pair.identifier.toString();
}

QString ReportWriter::episodeLabel(const MediaFile& file)
{
    const EpisodeIdentifier id = IdentifierExtractor::shared().extract(file.fileName());
    return id.isValid() ? id.toString() : QString("--");
}

QString ReportWriter::renderRenamingReport(const MatchResult& match, const RenameReport& rename, const RunInfo& info)
{
    QString text = header("SubMux Renaming Report", info);

    int lowConfidence = 0;
    for (const MatchedPair& pair : match.matched) {
        if (pair.lowConfidence) {
            ++lowConfidence;
        }
    }

    text += "#\n# SUMMARY:\n";
    text += QString("# Pairs Matched: %1\n").arg(match.matched.size());
    text += QString("# Renamed: %1\n").arg(rename.renamedCount());
    text += QString("# Failed: %1\n").arg(rename.failedCount());
    text += QString("# Low Confidence: %1\n").arg(lowConfidence);
    text += QString("# Unmatched Videos: %1\n").arg(match.unmatchedVideos.size());
    text += QString("# Unmatched Subtitles: %1\n").arg(match.unmatchedSubtitles.size());
    text += "#\n";

    text += csvRow({"File", "Type", "Episode", "Basis", "Action", "New Name", "Detail"});

    for (const RenameOutcome& outcome : rename.outcomes) {
        const MatchedPair& pair = outcome.pair;
        QString action;
        switch (outcome.status) {
            case RenameStatus::Renamed: action = "Renamed"; break;
            case RenameStatus::RenamedUnique: action = "Renamed (unique name)"; break;
            case RenameStatus::AlreadyNamed: action = "Unchanged"; break;
            case RenameStatus::Failed: action = "Failed"; break;
        }

        QString detail = outcome.errorMessage;
        if (pair.basis == MatchBasis::MovieTitle) {
            detail = QString("similarity %1%2").arg(pair.similarity, 0, 'f', 2)
                         .arg(pair.lowConfidence ? QString(", low confidence") : QString());
        }

        text += csvRow({pair.video.fileName(), "video", episodeLabel(pair), Matcher::basisName(pair.basis),
                        "Matched", QString(), QString()});
        text += csvRow({pair.subtitle.fileName(), "subtitle", episodeLabel(pair), Matcher::basisName(pair.basis),
                        action, QFileInfo(outcome.newPath).fileName(), detail});
    }

    for (const UnmatchedFile& unmatched : match.unmatchedVideos) {
        text += csvRow({unmatched.file.fileName(), "video", episodeLabel(unmatched.file), QString(),
                        "No subtitle", QString(), Matcher::reasonName(unmatched.reason)});
    }
    for (const UnmatchedFile& unmatched : match.unmatchedSubtitles) {
        text += csvRow({unmatched.file.fileName(), "subtitle", episodeLabel(unmatched.file), QString(),
                        "No video", QString(), Matcher::reasonName(unmatched.reason)});
    }

    text += conflictLines(match);
    return text;
}

QString ReportWriter::renderEmbeddingReport(const MatchResult& match, const EmbedReport& embed, const RunInfo& info)
{
    QString text = header("SubMux Embedding Report", info);

    text += QString("# Merge Tool: %1 %2\n").arg(embed.mergeToolPath.isEmpty() ? QString("(not found)") : embed.mergeToolPath,
                                                 embed.mergeToolVersion);
    text += "#\n# SUMMARY:\n";
    if (embed.fatal) {
        text += QString("# Aborted: %1 (%2)\n")
                    .arg(MergeTransaction::errorKindName(embed.fatalKind), embed.fatalMessage);
    }
    text += QString("# Pairs Matched: %1\n").arg(match.matched.size());
    text += QString("# Embedded: %1\n").arg(embed.succeededCount());
    text += QString("# Failed: %1\n").arg(embed.failedCount());
    text += QString("# Skipped: %1\n").arg(embed.skipped.size());
    text += QString("# Unmatched Videos: %1\n").arg(match.unmatchedVideos.size());
    text += QString("# Unmatched Subtitles: %1\n").arg(match.unmatchedSubtitles.size());
    const int attempted = embed.results.size();
    if (attempted > 0) {
        text += QString("# Success Rate: %1%\n").arg(100.0 * embed.succeededCount() / attempted, 0, 'f', 1);
    }
    text += "#\n";

    text += csvRow({"Video", "Subtitle", "Episode", "Language", "Language Source", "Status", "Error",
                    "Elapsed (ms)", "Detail"});

    for (const TransactionResult& result : embed.results) {
        // Episode label comes from the pair that produced the result
        QString episode;
        for (const MatchedPair& pair : match.matched) {
            if (pair.video.path() == result.videoPath && pair.subtitle.path() == result.subtitlePath) {
                episode = episodeLabel(pair);
                break;
            }
        }
        text += csvRow({QFileInfo(result.videoPath).fileName(), QFileInfo(result.subtitlePath).fileName(), episode,
                        result.language.isResolved() ? result.language.code : QString("--"),
                        LanguageDetector::sourceName(result.language.source),
                        result.succeeded() ? QString("Embedded") : MergeTransaction::stateName(result.state),
                        result.errorKind == TransactionErrorKind::None
                            ? QString() : MergeTransaction::errorKindName(result.errorKind),
                        QString::number(result.elapsedMs), result.errorMessage});
    }

    for (const SkippedPair& skipped : embed.skipped) {
        text += csvRow({skipped.pair.video.fileName(), skipped.pair.subtitle.fileName(), episodeLabel(skipped.pair),
                        "--", "none", "Skipped", QString(), "0", skipped.reason});
    }

    for (const UnmatchedFile& unmatched : match.unmatchedVideos) {
        text += csvRow({unmatched.file.fileName(), QString(), episodeLabel(unmatched.file), "--", "none",
                        "No subtitle", Matcher::reasonName(unmatched.reason), "0", QString()});
    }
    for (const UnmatchedFile& unmatched : match.unmatchedSubtitles) {
        text += csvRow({QString(), unmatched.file.fileName(), episodeLabel(unmatched.file), "--", "none",
                        "No video", Matcher::reasonName(unmatched.reason), "0", QString()});
    }

    text += conflictLines(match);
    return text;
}

bool ReportWriter::write(const QString& path, const QString& content, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QString("Cannot write report %1: %2").arg(path, file.errorString());
        }
        LOG(QString("ReportWriter: cannot write %1: %2").arg(path, file.errorString()));
        return false;
    }

    QTextStream out(&file);
    out.setEncoding(QStringConverter::Utf8);
    out << content;
    out.flush();
    file.close();

    LOG(QString("ReportWriter: report written to %1").arg(path));
    return true;
}
