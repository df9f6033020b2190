#include "embedsession.h"
#include "exitcodes.h"
#include "resourceguard.h"
#include "logger.h"

int EmbedReport::succeededCount() const
{
    int count = 0;
    for (const TransactionResult& result : results) {
        if (result.succeeded()) {
            ++count;
        }
    }
    return count;
}

int EmbedReport::failedCount() const
{
    return results.size() - succeededCount();
}

int EmbedReport::exitCode() const
{
    if (fatal) {
        return ExitCode::FATAL_ERROR;
    }
    return ExitCode::fromCounts(succeededCount(), failedCount());
}

EmbedSession::EmbedSession(const MergeOptions& options, ResourceGuard& guard, MergeToolRunner& runner)
    : m_options(options)
    , m_guard(guard)
    , m_runner(runner)
{
}

bool EmbedSession::isEmbedCandidate(const MediaFile& video)
{
    return video.extension() == QLatin1String("mkv");
}

MediaFileList EmbedSession::embedCandidates(const MediaFileList& videos)
{
    MediaFileList candidates;
    for (const MediaFile& video : videos) {
        if (isEmbedCandidate(video)) {
            candidates.append(video);
        }
    }
    if (candidates.size() != videos.size()) {
        LOG(QString("EmbedSession: %1 non-Matroska videos left out of matching")
                .arg(videos.size() - candidates.size()));
    }
    return candidates;
}

EmbedReport EmbedSession::run(const QList<MatchedPair>& pairs)
{
    EmbedReport report;

    const MergeToolInfo& tool = m_guard.probeMergeTool();
    report.mergeToolPath = tool.path;
    report.mergeToolVersion = tool.version;
    if (!tool.isAvailable) {
        report.fatal = true;
        report.fatalKind = TransactionErrorKind::DependencyMissing;
        report.fatalMessage = tool.unavailableReason;
        LOG(QString("EmbedSession: aborting, %1").arg(tool.unavailableReason));
        return report;
    }

    int index = 0;
    for (const MatchedPair& pair : pairs) {
        ++index;
        if (!isEmbedCandidate(pair.video)) {
            report.skipped.append({pair, QString("Not a Matroska video (.%1)").arg(pair.video.extension())});
            LOG(QString("EmbedSession: skipping %1, not a Matroska video").arg(pair.video.fileName()));
            continue;
        }

        LOG(QString("EmbedSession: [%1/%2] %3 <- %4")
                .arg(index).arg(pairs.size()).arg(pair.video.fileName(), pair.subtitle.fileName()));

        MergeTransaction transaction(pair, m_options, m_guard, m_runner);
        TransactionResult result = transaction.run();
        report.results.append(result);

        if (result.errorKind == TransactionErrorKind::DependencyMissing) {
            report.fatal = true;
            report.fatalKind = result.errorKind;
            report.fatalMessage = result.errorMessage;
            LOG("EmbedSession: merge tool became unavailable, stopping the batch");
            break;
        }
    }

    LOG(QString("EmbedSession: %1 embedded, %2 failed, %3 skipped")
            .arg(report.succeededCount()).arg(report.failedCount()).arg(report.skipped.size()));
    return report;
}
