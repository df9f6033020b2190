#ifndef MERGETOOLRUNNER_H
#define MERGETOOLRUNNER_H

#include <QString>
#include <QStringList>

/**
 * @brief How a merge tool invocation ended
 */
enum class MergeRunStatus {
    Finished,        ///< Process exited normally, see exitCode
    FailedToStart,   ///< Executable missing or not runnable
    Crashed,         ///< Process died abnormally
    TimedOut         ///< Deadline passed, process was killed
};

struct MergeRunOutcome {
    MergeRunStatus status = MergeRunStatus::FailedToStart;
    int exitCode = -1;
    QString standardOutput;
    QString standardError;
    QString errorString;     // QProcess error text for non-Finished outcomes
    qint64 elapsedMs = 0;

    bool finishedWith(int code) const { return status == MergeRunStatus::Finished && exitCode == code; }

    /// Best diagnostic text: stderr, else the tail of stdout, else errorString
    QString diagnostics() const;
};

/**
 * @brief Seam between the merge transaction and the external process
 *
 * The production implementation runs a QProcess; tests substitute a fake that
 * writes (or does not write) the output file and returns a scripted outcome.
 */
class MergeToolRunner
{
public:
    virtual ~MergeToolRunner() = default;

    /**
     * @brief Run program with args and wait for it
     * @param timeoutMs Deadline; on expiry the process is terminated, then killed
     */
    virtual MergeRunOutcome run(const QString& program, const QStringList& args, int timeoutMs) = 0;
};

/**
 * @brief QProcess-backed runner, no shell involved
 */
class ProcessMergeToolRunner : public MergeToolRunner
{
public:
    static constexpr int START_TIMEOUT_MS = 10000;
    static constexpr int TERMINATE_GRACE_MS = 2000;

    MergeRunOutcome run(const QString& program, const QStringList& args, int timeoutMs) override;
};

#endif // MERGETOOLRUNNER_H
