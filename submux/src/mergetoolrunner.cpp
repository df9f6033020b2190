#include "mergetoolrunner.h"
#include "logger.h"
#include <QElapsedTimer>
#include <QProcess>

namespace {
constexpr int DIAGNOSTIC_TAIL_CHARS = 2000;
}

QString MergeRunOutcome::diagnostics() const
{
    const QString err = standardError.trimmed();
    if (!err.isEmpty()) {
        return err;
    }
    // mkvmerge reports its errors on stdout
    const QString out = standardOutput.trimmed();
    if (!out.isEmpty()) {
        return out.right(DIAGNOSTIC_TAIL_CHARS);
    }
    return errorString;
}

MergeRunOutcome ProcessMergeToolRunner::run(const QString& program, const QStringList& args, int timeoutMs)
{
    MergeRunOutcome outcome;
    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(program, args);

    if (!process.waitForStarted(START_TIMEOUT_MS)) {
        outcome.status = MergeRunStatus::FailedToStart;
        outcome.errorString = process.errorString();
        outcome.elapsedMs = timer.elapsed();
        LOG(QString("MergeToolRunner: failed to start %1: %2").arg(program, outcome.errorString));
        return outcome;
    }

    if (!process.waitForFinished(timeoutMs) && process.state() != QProcess::NotRunning) {
        LOG(QString("MergeToolRunner: %1 exceeded %2 ms, terminating").arg(program).arg(timeoutMs));
        process.terminate();
        if (!process.waitForFinished(TERMINATE_GRACE_MS)) {
            process.kill();
            process.waitForFinished(1000);
        }
        outcome.status = MergeRunStatus::TimedOut;
        outcome.errorString = QString("Timed out after %1 s").arg(timeoutMs / 1000);
        outcome.standardOutput = QString::fromLocal8Bit(process.readAllStandardOutput());
        outcome.standardError = QString::fromLocal8Bit(process.readAllStandardError());
        outcome.elapsedMs = timer.elapsed();
        return outcome;
    }

    outcome.standardOutput = QString::fromLocal8Bit(process.readAllStandardOutput());
    outcome.standardError = QString::fromLocal8Bit(process.readAllStandardError());
    outcome.exitCode = process.exitCode();
    outcome.elapsedMs = timer.elapsed();

    if (process.exitStatus() == QProcess::CrashExit) {
        outcome.status = MergeRunStatus::Crashed;
        outcome.errorString = process.errorString();
        LOG(QString("MergeToolRunner: %1 crashed: %2").arg(program, outcome.errorString));
    } else {
        outcome.status = MergeRunStatus::Finished;
    }
    return outcome;
}
