#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "../submux/src/reportwriter.h"
#include "../submux/src/embedsession.h"
#include "../submux/src/subtitlerenamer.h"

class TestReportWriter : public QObject
{
    Q_OBJECT

private:
    static MatchedPair pair(const QString& video, const QString& subtitle, int episode)
    {
        MatchedPair p;
        p.video = MediaFile("/media/" + video, MediaKind::Video, 1000);
        p.subtitle = MediaFile("/media/" + subtitle, MediaKind::Subtitle, 10);
        p.identifier = EpisodeIdentifier(1, episode);
        return p;
    }

    static MatchResult sampleMatch()
    {
        MatchResult match;
        match.matched << pair("Show.S01E01.mkv", "Show.S01E01.ar.srt", 1)
                      << pair("Show, Part 2.S01E02.mkv", "Show.S01E02.srt", 2);
        match.unmatchedVideos.append({MediaFile("/media/Show.S01E03.mkv", MediaKind::Video, 1000),
                                      UnmatchedReason::NoCounterpart});
        match.unmatchedSubtitles.append({MediaFile("/media/Notes.srt", MediaKind::Subtitle, 10),
                                         UnmatchedReason::Unidentified});

        MatchConflict conflict;
        conflict.kind = MatchConflict::Kind::VideoCollision;
        conflict.identifier = EpisodeIdentifier(1, 1);
        conflict.winner = "/media/Show.S01E01.mkv";
        conflict.loser = "/media/Show.S01E01.720p.mkv";
        match.conflicts << conflict;
        return match;
    }

    static ReportWriter::RunInfo runInfo()
    {
        ReportWriter::RunInfo info;
        info.directory = "/media";
        info.configuration = {"videos=mkv mp4", "subtitles=srt ass"};
        info.elapsedMs = 1500;
        return info;
    }

    static QStringList tableLines(const QString& report)
    {
        QStringList lines;
        for (const QString& line : report.split('\n', Qt::SkipEmptyParts)) {
            if (!line.startsWith('#')) {
                lines << line;
            }
        }
        return lines;
    }

private slots:
    void testCsvField()
    {
        QCOMPARE(ReportWriter::csvField("plain"), QString("plain"));
        QCOMPARE(ReportWriter::csvField("a,b"), QString("\"a,b\""));
        QCOMPARE(ReportWriter::csvField("say \"hi\""), QString("\"say \"\"hi\"\"\""));
        QCOMPARE(ReportWriter::csvField("two\nlines"), QString("\"two\nlines\""));
        QCOMPARE(ReportWriter::csvRow({"a", "b,c", ""}), QString("a,\"b,c\",\n"));
    }

    void testRenamingReport()
    {
        MatchResult match = sampleMatch();

        RenameReport rename;
        RenameOutcome renamed;
        renamed.pair = match.matched[0];
        renamed.newPath = "/media/Show.S01E01.srt";
        renamed.status = RenameStatus::Renamed;
        RenameOutcome failed;
        failed.pair = match.matched[1];
        failed.status = RenameStatus::Failed;
        failed.errorMessage = "Cannot rename Show.S01E02.srt";
        rename.outcomes << renamed << failed;

        const QString report = ReportWriter::renderRenamingReport(match, rename, runInfo());

        QVERIFY(report.startsWith("# SubMux Renaming Report\n"));
        QVERIFY(report.contains("# Directory: /media\n"));
        QVERIFY(report.contains("# Config: videos=mkv mp4\n"));
        QVERIFY(report.contains("# Execution Time: 1.50 s\n"));
        QVERIFY(report.contains("# Renamed: 1\n"));
        QVERIFY(report.contains("# Failed: 1\n"));
        QVERIFY(report.contains("# Unmatched Subtitles: 1\n"));

        const QStringList table = tableLines(report);
        QCOMPARE(table.first(), QString("File,Type,Episode,Basis,Action,New Name,Detail"));
        // Header, two rows per pair, one per unmatched file
        QCOMPARE(table.size(), 1 + 4 + 2);
        QVERIFY(table.contains("Show.S01E01.ar.srt,subtitle,S01E01,episode,Renamed,Show.S01E01.srt,"));
        // A comma in a filename is quoted
        QVERIFY(table.contains("\"Show, Part 2.S01E02.mkv\",video,S01E02,episode,Matched,,"));
        QVERIFY(table.contains("Notes.srt,subtitle,--,,No video,,unidentified"));
        QVERIFY(table.contains("Show.S01E03.mkv,video,S01E03,,No subtitle,,no-counterpart"));

        QVERIFY(report.contains("# CONFLICTS:\n"));
        QVERIFY(report.contains("# video-collision S01E01: kept Show.S01E01.mkv, left Show.S01E01.720p.mkv\n"));
    }

    void testMovieRowShowsSimilarity()
    {
        MatchResult match;
        MatchedPair movie;
        movie.video = MediaFile("/media/Alpha.mkv", MediaKind::Video, 1000);
        movie.subtitle = MediaFile("/media/Beta.srt", MediaKind::Subtitle, 10);
        movie.basis = MatchBasis::MovieTitle;
        movie.similarity = 0.25;
        movie.lowConfidence = true;
        match.matched << movie;

        RenameReport rename;
        RenameOutcome outcome;
        outcome.pair = movie;
        outcome.newPath = "/media/Alpha.srt";
        outcome.status = RenameStatus::Renamed;
        rename.outcomes << outcome;

        const QString report = ReportWriter::renderRenamingReport(match, rename, runInfo());
        QVERIFY(report.contains("# Low Confidence: 1\n"));
        QVERIFY(report.contains("Beta.srt,subtitle,Movie,movie-title,Renamed,Alpha.srt,\"similarity 0.25, low confidence\""));
    }

    void testEmbeddingReport()
    {
        MatchResult match = sampleMatch();

        EmbedReport embed;
        embed.mergeToolPath = "/usr/bin/mkvmerge";
        embed.mergeToolVersion = "81.0";

        TransactionResult ok;
        ok.videoPath = match.matched[0].video.path();
        ok.subtitlePath = match.matched[0].subtitle.path();
        ok.state = TransactionState::Committed;
        ok.language.code = "ara";
        ok.language.source = LanguageSource::Filename;
        ok.elapsedMs = 1234;
        embed.results << ok;

        SkippedPair skipped;
        skipped.pair = match.matched[1];
        skipped.reason = "Not a Matroska video (.mp4)";
        embed.skipped << skipped;

        const QString report = ReportWriter::renderEmbeddingReport(match, embed, runInfo());

        QVERIFY(report.startsWith("# SubMux Embedding Report\n"));
        QVERIFY(report.contains("# Merge Tool: /usr/bin/mkvmerge 81.0\n"));
        QVERIFY(report.contains("# Embedded: 1\n"));
        QVERIFY(report.contains("# Skipped: 1\n"));
        QVERIFY(report.contains("# Success Rate: 100.0%\n"));

        const QStringList table = tableLines(report);
        QCOMPARE(table.first(),
                 QString("Video,Subtitle,Episode,Language,Language Source,Status,Error,Elapsed (ms),Detail"));
        QVERIFY(table.contains("Show.S01E01.mkv,Show.S01E01.ar.srt,S01E01,ara,filename,Embedded,,1234,"));
        QVERIFY(table.contains(
            "\"Show, Part 2.S01E02.mkv\",Show.S01E02.srt,S01E02,--,none,Skipped,,0,Not a Matroska video (.mp4)"));
    }

    void testFatalEmbeddingReport()
    {
        MatchResult match = sampleMatch();
        EmbedReport embed;
        embed.fatal = true;
        embed.fatalKind = TransactionErrorKind::DependencyMissing;
        embed.fatalMessage = "mkvmerge not found";

        const QString report = ReportWriter::renderEmbeddingReport(match, embed, runInfo());
        QVERIFY(report.contains("# Merge Tool: (not found) \n"));
        QVERIFY(report.contains("# Aborted: DependencyMissing (mkvmerge not found)\n"));
        QVERIFY(!report.contains("# Success Rate"));
    }

    void testWrite()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(ReportWriter::RENAMING_REPORT_NAME);

        QString error;
        QVERIFY(ReportWriter::write(path, QString::fromUtf8("File\nحلقة.srt\n"), &error));
        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(QString::fromUtf8(file.readAll()).remove('\r'), QString::fromUtf8("File\nحلقة.srt\n"));

        // A directory path cannot be written
        QVERIFY(!ReportWriter::write(dir.path(), "x", &error));
        QVERIFY(!error.isEmpty());
    }
};

QTEST_MAIN(TestReportWriter)
#include "test_reportwriter.moc"
