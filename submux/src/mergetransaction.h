#ifndef MERGETRANSACTION_H
#define MERGETRANSACTION_H

#include <QString>
#include "matcher.h"
#include "languagedetector.h"

class ResourceGuard;
class MergeToolRunner;

/**
 * @brief Stages of a merge transaction
 *
 * Success: Init -> Validated -> Merged -> BackedUp -> Committed
 * Failure: any stage -> Failed -> RolledBack (temporary output removed)
 */
enum class TransactionState {
    Init,
    Validated,
    Merged,
    BackedUp,
    Committed,
    Failed,
    RolledBack
};

/**
 * @brief Error classification shared by matching and embedding reports
 */
enum class TransactionErrorKind {
    None,
    PatternMismatch,      // Informational: file could not be identified
    CollisionDetected,    // Informational: file lost an identifier collision
    DependencyMissing,    // Merge tool absent or broken, fatal for the batch
    InsufficientSpace,
    MergeToolFailure,     // Non-zero exit, crash, failure to start, or no output
    FileSystemError,
    MergeTimeout
};

struct MergeOptions {
    LanguageDetector languageDetector;            // Holds the configured fallback code
    bool defaultTrack = true;
    QString backupDirName = QStringLiteral("backups");
};

struct TransactionResult {
    QString videoPath;
    QString subtitlePath;
    QString finalPath;           // Video path after commit, empty otherwise
    QString backupDir;
    TransactionState state = TransactionState::Init;
    TransactionErrorKind errorKind = TransactionErrorKind::None;
    QString errorMessage;        // Includes merge tool diagnostics
    qint64 elapsedMs = 0;
    int timeoutSeconds = 0;
    LanguageResolution language;

    bool succeeded() const { return state == TransactionState::Committed; }
};

/**
 * @brief Staged, rollback-safe merge of one subtitle into one video
 *
 * The merge tool always writes "<stem>.embedded.mkv" beside the source video.
 * Only after it succeeded are the originals moved to the backup directory and
 * the temporary file renamed over the original video path. Any failure deletes
 * the temporary output and puts originals back where they were; originals are
 * never deleted or truncated.
 *
 * A transaction runs once. Calling run() again returns the first result.
 *
 * Usage:
 *   MergeTransaction transaction(pair, options, guard, runner);
 *   TransactionResult result = transaction.run();
 *   if (!result.succeeded()) {
 *       LOG(result.errorMessage);
 *   }
 */
class MergeTransaction
{
public:
    static constexpr int TIMEOUT_BASE_SECONDS = 300;
    static constexpr int TIMEOUT_PER_GIB_SECONDS = 120;
    static constexpr int TIMEOUT_MAX_SECONDS = 1800;
    static constexpr int MKVMERGE_WARNING_EXIT_CODE = 1;

    MergeTransaction(const MatchedPair& pair, const MergeOptions& options,
                     ResourceGuard& guard, MergeToolRunner& runner);
    virtual ~MergeTransaction() = default;

    TransactionResult run();

    TransactionState state() const { return m_result.state; }
    QString tempOutputPath() const { return m_tempOutputPath; }
    QString backupDir() const { return m_backupDir; }

    /// clamp(300 + 120 x sizeGiB, 300, 1800) seconds
    static int computeTimeoutSeconds(qint64 totalBytes);

    static QString stateName(TransactionState state);
    static QString errorKindName(TransactionErrorKind kind);

protected:
    /// Every move of a transaction goes through here; tests override it to simulate a failing volume
    virtual bool renameFile(const QString& from, const QString& to);

private:
    bool validate();
    bool merge();
    bool backUp();
    bool commit();

    void transition(TransactionState state);
    void fail(TransactionErrorKind kind, const QString& message);
    bool removeTempOutput();
    bool moveFile(const QString& from, const QString& to);

    MatchedPair m_pair;
    MergeOptions m_options;
    ResourceGuard& m_guard;
    MergeToolRunner& m_runner;

    QString m_tempOutputPath;
    QString m_backupDir;
    QString m_toolPath;
    bool m_started;
    TransactionResult m_result;
};

#endif // MERGETRANSACTION_H
