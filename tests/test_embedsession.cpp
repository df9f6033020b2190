#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "../submux/src/embedsession.h"
#include "../submux/src/exitcodes.h"
#include "../submux/src/matcher.h"
#include "../submux/src/mergetoolrunner.h"
#include "../submux/src/resourceguard.h"

namespace {

class FakeGuard : public ResourceGuard
{
public:
    explicit FakeGuard(const QString& toolPath)
        : ResourceGuard(toolPath)
    {
    }

    bool toolWorks = true;
    mutable int probes = 0;

    qint64 availableBytes(const QString&) const override { return 1LL << 40; }

protected:
    MergeToolInfo runProbe(const QString& toolPath) const override
    {
        ++probes;
        MergeToolInfo info;
        info.path = toolPath;
        info.isAvailable = toolWorks;
        info.version = toolWorks ? "81.0" : QString();
        info.unavailableReason = toolWorks ? QString() : QString("mkvmerge not runnable");
        return info;
    }
};

// Fails every video whose name contains failMarker, merges the rest
class FakeRunner : public MergeToolRunner
{
public:
    QString failMarker;
    QStringList videosSeen;

    MergeRunOutcome run(const QString&, const QStringList& args, int) override
    {
        const QString output = args.value(1);
        const QString video = args.value(2);
        videosSeen << QFileInfo(video).fileName();

        MergeRunOutcome outcome;
        outcome.status = MergeRunStatus::Finished;
        if (!failMarker.isEmpty() && video.contains(failMarker)) {
            outcome.exitCode = 2;
            outcome.standardOutput = "Error: simulated failure";
            return outcome;
        }

        QFile out(output);
        if (out.open(QIODevice::WriteOnly)) {
            out.write("merged");
            out.close();
        }
        outcome.exitCode = 0;
        return outcome;
    }
};

} // namespace

class TestEmbedSession : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *m_dir = nullptr;
    QString m_tool;

    MediaFile createFile(const QString& name, MediaKind kind)
    {
        const QString path = m_dir->filePath(name);
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.write("data");
            file.close();
        }
        return MediaFile(QFileInfo(path), kind);
    }

    MatchedPair makePair(const QString& video, const QString& subtitle)
    {
        MatchedPair pair;
        pair.video = createFile(video, MediaKind::Video);
        pair.subtitle = createFile(subtitle, MediaKind::Subtitle);
        return pair;
    }

private slots:
    void init()
    {
        m_dir = new QTemporaryDir();
        QVERIFY(m_dir->isValid());
        QVERIFY(QDir().mkpath(m_dir->filePath("tools")));
        m_tool = m_dir->filePath("tools/mkvmerge");
        QFile tool(m_tool);
        QVERIFY(tool.open(QIODevice::WriteOnly));
        tool.close();
        QVERIFY(tool.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner));
    }

    void cleanup()
    {
        delete m_dir;
        m_dir = nullptr;
    }

    void testAllPairsEmbedded()
    {
        QList<MatchedPair> pairs = {makePair("Show.S01E01.mkv", "Show.S01E01.srt"),
                                    makePair("Show.S01E02.mkv", "Show.S01E02.srt")};
        FakeGuard guard(m_tool);
        FakeRunner runner;

        EmbedSession session(MergeOptions(), guard, runner);
        EmbedReport report = session.run(pairs);

        QVERIFY(!report.fatal);
        QCOMPARE(report.succeededCount(), 2);
        QCOMPARE(report.failedCount(), 0);
        QCOMPARE(report.exitCode(), ExitCode::SUCCESS);
        QCOMPARE(report.mergeToolVersion, QString("81.0"));
        // Probed once for the whole batch
        QCOMPARE(guard.probes, 1);
        QCOMPARE(runner.videosSeen, QStringList({"Show.S01E01.mkv", "Show.S01E02.mkv"}));
    }

    void testMissingToolIsFatal()
    {
        QList<MatchedPair> pairs = {makePair("Show.S01E01.mkv", "Show.S01E01.srt")};
        FakeGuard guard(m_tool);
        guard.toolWorks = false;
        FakeRunner runner;

        EmbedSession session(MergeOptions(), guard, runner);
        EmbedReport report = session.run(pairs);

        QVERIFY(report.fatal);
        QCOMPARE(report.fatalKind, TransactionErrorKind::DependencyMissing);
        QCOMPARE(report.fatalMessage, QString("mkvmerge not runnable"));
        QVERIFY(report.results.isEmpty());
        QVERIFY(runner.videosSeen.isEmpty());
        QCOMPARE(report.exitCode(), ExitCode::FATAL_ERROR);

        // Nothing was touched
        QVERIFY(QFileInfo::exists(pairs[0].video.path()));
        QVERIFY(!QFileInfo::exists(m_dir->filePath("backups")));
    }

    void testNonMatroskaVideosAreSkipped()
    {
        QList<MatchedPair> pairs = {makePair("Show.S01E01.mp4", "Show.S01E01.srt"),
                                    makePair("Show.S01E02.mkv", "Show.S01E02.srt")};
        FakeGuard guard(m_tool);
        FakeRunner runner;

        EmbedSession session(MergeOptions(), guard, runner);
        EmbedReport report = session.run(pairs);

        QCOMPARE(report.skipped.size(), 1);
        QCOMPARE(report.skipped[0].pair.video.fileName(), QString("Show.S01E01.mp4"));
        QVERIFY(report.skipped[0].reason.contains("mp4"));
        QCOMPARE(report.results.size(), 1);
        QCOMPARE(report.exitCode(), ExitCode::SUCCESS);
        QVERIFY(QFileInfo::exists(pairs[0].subtitle.path()));
    }

    void testEmbedCandidatesKeepMatroskaOnly()
    {
        MediaFileList videos = {createFile("A.S01E01.mp4", MediaKind::Video),
                                createFile("A.S01E02.MKV", MediaKind::Video),
                                createFile("A.S01E03.avi", MediaKind::Video)};
        MediaFileList candidates = EmbedSession::embedCandidates(videos);
        QCOMPARE(candidates.size(), 1);
        QCOMPARE(candidates[0].fileName(), QString("A.S01E02.MKV"));
        QVERIFY(EmbedSession::embedCandidates({}).isEmpty());
    }

    void testNonMatroskaDoesNotTakeEpisodeSubtitle()
    {
        // "Show - 01.mp4" sorts first and would win the S01E01 collision
        MediaFileList videos = {createFile("Show - 01.mp4", MediaKind::Video),
                                createFile("Show.S01E01.mkv", MediaKind::Video)};
        MediaFileList subtitles = {createFile("Show.S01E01.srt", MediaKind::Subtitle)};

        Matcher matcher;
        MatchResult match = matcher.match(EmbedSession::embedCandidates(videos), subtitles);
        QCOMPARE(match.matched.size(), 1);
        QCOMPARE(match.matched[0].video.fileName(), QString("Show.S01E01.mkv"));
        QVERIFY(match.conflicts.isEmpty());

        FakeGuard guard(m_tool);
        FakeRunner runner;
        EmbedSession session(MergeOptions(), guard, runner);
        EmbedReport report = session.run(match.matched);

        QVERIFY(report.skipped.isEmpty());
        QCOMPARE(report.succeededCount(), 1);
        QCOMPARE(runner.videosSeen, QStringList({"Show.S01E01.mkv"}));
        // The mp4 is untouched
        QVERIFY(QFileInfo::exists(m_dir->filePath("Show - 01.mp4")));
    }

    void testNonMatroskaDoesNotBlockMovieMode()
    {
        MediaFileList videos = {createFile("Movie.mkv", MediaKind::Video),
                                createFile("Movie.mp4", MediaKind::Video)};
        MediaFileList subtitles = {createFile("Movie.srt", MediaKind::Subtitle)};

        Matcher matcher;
        MatchResult match = matcher.match(EmbedSession::embedCandidates(videos), subtitles);
        QCOMPARE(match.matched.size(), 1);
        QCOMPARE(match.matched[0].basis, MatchBasis::MovieTitle);
        QCOMPARE(match.matched[0].video.fileName(), QString("Movie.mkv"));

        FakeGuard guard(m_tool);
        FakeRunner runner;
        EmbedSession session(MergeOptions(), guard, runner);
        QCOMPARE(session.run(match.matched).succeededCount(), 1);
    }

    void testPartialFailureContinuesBatch()
    {
        QList<MatchedPair> pairs = {makePair("Show.S01E01.mkv", "Show.S01E01.srt"),
                                    makePair("Show.S01E02.mkv", "Show.S01E02.srt"),
                                    makePair("Show.S01E03.mkv", "Show.S01E03.srt")};
        FakeGuard guard(m_tool);
        FakeRunner runner;
        runner.failMarker = "S01E02";

        EmbedSession session(MergeOptions(), guard, runner);
        EmbedReport report = session.run(pairs);

        QCOMPARE(report.results.size(), 3);
        QCOMPARE(report.succeededCount(), 2);
        QCOMPARE(report.failedCount(), 1);
        QCOMPARE(report.results[1].errorKind, TransactionErrorKind::MergeToolFailure);
        QCOMPARE(report.results[1].state, TransactionState::RolledBack);
        QCOMPARE(report.exitCode(), ExitCode::PARTIAL_FAILURE);

        // The failed pair keeps its originals in place
        QVERIFY(QFileInfo::exists(pairs[1].video.path()));
        QVERIFY(QFileInfo::exists(pairs[1].subtitle.path()));
    }

    void testCompleteFailure()
    {
        QList<MatchedPair> pairs = {makePair("Show.S01E01.mkv", "Show.S01E01.srt")};
        FakeGuard guard(m_tool);
        FakeRunner runner;
        runner.failMarker = "Show";

        EmbedSession session(MergeOptions(), guard, runner);
        QCOMPARE(session.run(pairs).exitCode(), ExitCode::COMPLETE_FAILURE);
    }

    void testEmptyBatch()
    {
        FakeGuard guard(m_tool);
        FakeRunner runner;
        EmbedSession session(MergeOptions(), guard, runner);
        EmbedReport report = session.run({});
        QVERIFY(!report.fatal);
        QCOMPARE(report.exitCode(), ExitCode::SUCCESS);
    }

    void testExitCodeFromCounts()
    {
        QCOMPARE(ExitCode::fromCounts(0, 0), ExitCode::SUCCESS);
        QCOMPARE(ExitCode::fromCounts(3, 0), ExitCode::SUCCESS);
        QCOMPARE(ExitCode::fromCounts(2, 1), ExitCode::PARTIAL_FAILURE);
        QCOMPARE(ExitCode::fromCounts(0, 2), ExitCode::COMPLETE_FAILURE);
    }
};

QTEST_MAIN(TestEmbedSession)
#include "test_embedsession.moc"
