#include "mergetransaction.h"
#include "mergecommandbuilder.h"
#include "mergetoolrunner.h"
#include "resourceguard.h"
#include "logger.h"
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <cmath>

namespace {
constexpr double BYTES_PER_GIB = 1024.0 * 1024.0 * 1024.0;
}

MergeTransaction::MergeTransaction(const MatchedPair& pair, const MergeOptions& options,
                                   ResourceGuard& guard, MergeToolRunner& runner)
    : m_pair(pair)
    , m_options(options)
    , m_guard(guard)
    , m_runner(runner)
    , m_started(false)
{
    m_tempOutputPath = MergeCommandBuilder::tempOutputPath(pair.video.path());
    m_backupDir = QDir(QFileInfo(pair.video.path()).absolutePath()).filePath(options.backupDirName);

    m_result.videoPath = pair.video.path();
    m_result.subtitlePath = pair.subtitle.path();
}

int MergeTransaction::computeTimeoutSeconds(qint64 totalBytes)
{
    const double gib = qMax<qint64>(0, totalBytes) / BYTES_PER_GIB;
    const int seconds = TIMEOUT_BASE_SECONDS + static_cast<int>(std::floor(gib * TIMEOUT_PER_GIB_SECONDS));
    return qBound(TIMEOUT_BASE_SECONDS, seconds, TIMEOUT_MAX_SECONDS);
}

TransactionResult MergeTransaction::run()
{
    if (m_started) {
        LOG(QString("MergeTransaction: %1 already ran, returning its result").arg(m_pair.video.fileName()));
        return m_result;
    }
    m_started = true;

    QElapsedTimer timer;
    timer.start();

    m_result.language = m_options.languageDetector.resolve(m_pair.subtitle.fileName());

    if (validate() && merge() && backUp()) {
        commit();
    }

    m_result.elapsedMs = timer.elapsed();
    LOG(QString("MergeTransaction: %1 -> %2 (%3 ms)")
            .arg(m_pair.video.fileName(), stateName(m_result.state)).arg(m_result.elapsedMs));
    return m_result;
}

bool MergeTransaction::validate()
{
    QFileInfo video(m_pair.video.path());
    QFileInfo subtitle(m_pair.subtitle.path());
    if (!video.isFile()) {
        fail(TransactionErrorKind::FileSystemError, QString("Video not found: %1").arg(video.filePath()));
        return false;
    }
    if (!subtitle.isFile()) {
        fail(TransactionErrorKind::FileSystemError, QString("Subtitle not found: %1").arg(subtitle.filePath()));
        return false;
    }

    const MergeToolInfo& tool = m_guard.probeMergeTool();
    if (!tool.isAvailable) {
        fail(TransactionErrorKind::DependencyMissing, tool.unavailableReason);
        return false;
    }
    m_toolPath = tool.path;

    qint64 available = -1;
    if (!m_guard.hasSpaceFor(video.absolutePath(), video.size(), subtitle.size(), &available)) {
        if (available < 0) {
            fail(TransactionErrorKind::FileSystemError,
                 QString("Cannot determine free space on the volume of %1").arg(video.absolutePath()));
        } else {
            fail(TransactionErrorKind::InsufficientSpace,
                 QString("Need %1 bytes, %2 available in %3")
                     .arg(ResourceGuard::requiredBytes(video.size(), subtitle.size()))
                     .arg(available).arg(video.absolutePath()));
        }
        return false;
    }

    // Leftover from an interrupted run; it is ours to replace
    if (QFileInfo::exists(m_tempOutputPath) && !QFile::remove(m_tempOutputPath)) {
        fail(TransactionErrorKind::FileSystemError,
             QString("Cannot remove stale temporary file %1").arg(m_tempOutputPath));
        return false;
    }

    m_result.timeoutSeconds = computeTimeoutSeconds(video.size() + subtitle.size());
    transition(TransactionState::Validated);
    return true;
}

bool MergeTransaction::merge()
{
    MergeRequest request;
    request.videoPath = m_pair.video.path();
    request.subtitlePath = m_pair.subtitle.path();
    request.outputPath = m_tempOutputPath;
    request.languageCode = m_result.language.code;
    request.defaultTrack = m_options.defaultTrack;

    QString buildError;
    const QStringList args = MergeCommandBuilder::buildArguments(request, &buildError);
    if (args.isEmpty()) {
        fail(TransactionErrorKind::MergeToolFailure, buildError);
        return false;
    }

    LOG(QString("MergeTransaction: running %1 %2 (timeout %3 s)")
            .arg(m_toolPath, args.join(' ')).arg(m_result.timeoutSeconds));

    const MergeRunOutcome outcome = m_runner.run(m_toolPath, args, m_result.timeoutSeconds * 1000);
    const bool outputExists = QFileInfo(m_tempOutputPath).isFile();

    switch (outcome.status) {
        case MergeRunStatus::TimedOut:
            fail(TransactionErrorKind::MergeTimeout,
                 QString("mkvmerge timed out after %1 s").arg(m_result.timeoutSeconds));
            return false;
        case MergeRunStatus::FailedToStart:
            fail(TransactionErrorKind::MergeToolFailure,
                 QString("mkvmerge failed to start: %1").arg(outcome.errorString));
            return false;
        case MergeRunStatus::Crashed:
            fail(TransactionErrorKind::MergeToolFailure,
                 QString("mkvmerge crashed: %1").arg(outcome.diagnostics()));
            return false;
        case MergeRunStatus::Finished:
            break;
    }

    if (outcome.exitCode == 0 || outcome.exitCode == MKVMERGE_WARNING_EXIT_CODE) {
        if (!outputExists) {
            fail(TransactionErrorKind::MergeToolFailure,
                 QString("mkvmerge exited with code %1 but wrote no output: %2")
                     .arg(outcome.exitCode).arg(outcome.diagnostics()));
            return false;
        }
        if (outcome.exitCode == MKVMERGE_WARNING_EXIT_CODE) {
            LOG(QString("MergeTransaction: mkvmerge finished with warnings: %1").arg(outcome.diagnostics()));
        }
        transition(TransactionState::Merged);
        return true;
    }

    fail(TransactionErrorKind::MergeToolFailure,
         QString("mkvmerge exited with code %1: %2").arg(outcome.exitCode).arg(outcome.diagnostics()));
    return false;
}

bool MergeTransaction::backUp()
{
    if (!QDir().mkpath(m_backupDir)) {
        fail(TransactionErrorKind::FileSystemError, QString("Cannot create backup directory %1").arg(m_backupDir));
        return false;
    }
    m_result.backupDir = m_backupDir;

    const QString videoBackup = QDir(m_backupDir).filePath(m_pair.video.fileName());
    const QString subtitleBackup = QDir(m_backupDir).filePath(m_pair.subtitle.fileName());

    if (!moveFile(m_pair.video.path(), videoBackup)) {
        fail(TransactionErrorKind::FileSystemError,
             QString("Cannot move %1 to %2").arg(m_pair.video.path(), m_backupDir));
        return false;
    }

    if (!moveFile(m_pair.subtitle.path(), subtitleBackup)) {
        QString message = QString("Cannot move %1 to %2").arg(m_pair.subtitle.path(), m_backupDir);
        if (!renameFile(videoBackup, m_pair.video.path())) {
            message += QString("; original video left in %1").arg(videoBackup);
        }
        fail(TransactionErrorKind::FileSystemError, message);
        return false;
    }

    transition(TransactionState::BackedUp);
    return true;
}

bool MergeTransaction::commit()
{
    if (!renameFile(m_tempOutputPath, m_pair.video.path())) {
        const QString videoBackup = QDir(m_backupDir).filePath(m_pair.video.fileName());
        const QString subtitleBackup = QDir(m_backupDir).filePath(m_pair.subtitle.fileName());

        QString message = QString("Cannot rename %1 to %2").arg(m_tempOutputPath, m_pair.video.path());
        if (!renameFile(videoBackup, m_pair.video.path())) {
            message += QString("; original video left in %1").arg(videoBackup);
        }
        if (!renameFile(subtitleBackup, m_pair.subtitle.path())) {
            message += QString("; original subtitle left in %1").arg(subtitleBackup);
        }
        fail(TransactionErrorKind::FileSystemError, message);
        return false;
    }

    m_result.finalPath = m_pair.video.path();
    transition(TransactionState::Committed);
    return true;
}

void MergeTransaction::transition(TransactionState state)
{
    m_result.state = state;
}

void MergeTransaction::fail(TransactionErrorKind kind, const QString& message)
{
    const TransactionState failedAt = m_result.state;
    m_result.errorKind = kind;
    m_result.errorMessage = message;
    transition(TransactionState::Failed);

    LOG(QString("MergeTransaction: %1 failed after %2 [%3]: %4")
            .arg(m_pair.video.fileName(), stateName(failedAt), errorKindName(kind), message));

    if (!removeTempOutput()) {
        m_result.errorMessage += QString("; temporary file left at %1").arg(m_tempOutputPath);
        return;
    }
    transition(TransactionState::RolledBack);
}

bool MergeTransaction::removeTempOutput()
{
    if (!QFileInfo::exists(m_tempOutputPath)) {
        return true;
    }
    if (!QFile::remove(m_tempOutputPath)) {
        LOG(QString("MergeTransaction: cannot remove temporary file %1").arg(m_tempOutputPath));
        return false;
    }
    return true;
}

bool MergeTransaction::renameFile(const QString& from, const QString& to)
{
    return QFile::rename(from, to);
}

bool MergeTransaction::moveFile(const QString& from, const QString& to)
{
    // A stale backup with the same name is replaced
    if (QFileInfo::exists(to) && !QFile::remove(to)) {
        LOG(QString("MergeTransaction: cannot replace stale backup %1").arg(to));
        return false;
    }
    return renameFile(from, to);
}

QString MergeTransaction::stateName(TransactionState state)
{
    switch (state) {
        case TransactionState::Init: return "Init";
        case TransactionState::Validated: return "Validated";
        case TransactionState::Merged: return "Merged";
        case TransactionState::BackedUp: return "BackedUp";
        case TransactionState::Committed: return "Committed";
        case TransactionState::Failed: return "Failed";
        case TransactionState::RolledBack: return "RolledBack";
    }
    return QString();
}

QString MergeTransaction::errorKindName(TransactionErrorKind kind)
{
    switch (kind) {
        case TransactionErrorKind::None: return "None";
        case TransactionErrorKind::PatternMismatch: return "PatternMismatch";
        case TransactionErrorKind::CollisionDetected: return "CollisionDetected";
        case TransactionErrorKind::DependencyMissing: return "DependencyMissing";
        case TransactionErrorKind::InsufficientSpace: return "InsufficientSpace";
        case TransactionErrorKind::MergeToolFailure: return "MergeToolFailure";
        case TransactionErrorKind::FileSystemError: return "FileSystemError";
        case TransactionErrorKind::MergeTimeout: return "MergeTimeout";
    }
    return QString();
}
