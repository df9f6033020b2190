#ifndef EMBEDSESSION_H
#define EMBEDSESSION_H

#include <QList>
#include <QString>
#include "matcher.h"
#include "mergetransaction.h"

class ResourceGuard;
class MergeToolRunner;

struct SkippedPair {
    MatchedPair pair;
    QString reason;
};

struct EmbedReport {
    bool fatal = false;                  // Batch aborted before any pair was touched
    TransactionErrorKind fatalKind = TransactionErrorKind::None;
    QString fatalMessage;
    QString mergeToolPath;
    QString mergeToolVersion;
    QList<TransactionResult> results;    // One per attempted pair, in pair order
    QList<SkippedPair> skipped;          // Pairs that are not embed candidates

    int succeededCount() const;
    int failedCount() const;
    int exitCode() const;
};

/**
 * @brief Runs merge transactions for a batch of matched pairs
 *
 * The merge tool is located and probed once per session; a missing tool is a
 * fatal error reported before any file is touched. Pairs then run strictly one
 * after another, each transaction committing or rolling back before the next
 * starts. A failed pair never stops the batch.
 *
 * Only Matroska videos are embed candidates; mkvmerge writes Matroska, so other
 * containers would change format under their original name. Callers filter the
 * scanned videos with embedCandidates() before matching, so a non-Matroska video
 * never takes a subtitle away from a Matroska one; run() still skips any that
 * reach it.
 */
class EmbedSession
{
public:
    EmbedSession(const MergeOptions& options, ResourceGuard& guard, MergeToolRunner& runner);

    EmbedReport run(const QList<MatchedPair>& pairs);

    static bool isEmbedCandidate(const MediaFile& video);
    static MediaFileList embedCandidates(const MediaFileList& videos);

private:
    MergeOptions m_options;
    ResourceGuard& m_guard;
    MergeToolRunner& m_runner;
};

#endif // EMBEDSESSION_H
