#include "subtitlerenamer.h"
#include "exitcodes.h"
#include "logger.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

int RenameReport::renamedCount() const
{
    int count = 0;
    for (const RenameOutcome& outcome : outcomes) {
        if (outcome.status == RenameStatus::Renamed || outcome.status == RenameStatus::RenamedUnique) {
            ++count;
        }
    }
    return count;
}

int RenameReport::failedCount() const
{
    int count = 0;
    for (const RenameOutcome& outcome : outcomes) {
        if (outcome.status == RenameStatus::Failed) {
            ++count;
        }
    }
    return count;
}

int RenameReport::exitCode() const
{
    return ExitCode::fromCounts(outcomes.size() - failedCount(), failedCount());
}

SubtitleRenamer::SubtitleRenamer(const QString& languageSuffix)
    : m_languageSuffix(sanitizeFileName(languageSuffix.trimmed()))
{
}

RenameReport SubtitleRenamer::run(const QList<MatchedPair>& pairs) const
{
    RenameReport report;
    for (const MatchedPair& pair : pairs) {
        report.outcomes.append(renamePair(pair));
    }
    LOG(QString("SubtitleRenamer: %1 renamed, %2 failed").arg(report.renamedCount()).arg(report.failedCount()));
    return report;
}

RenameOutcome SubtitleRenamer::renamePair(const MatchedPair& pair) const
{
    RenameOutcome outcome;
    outcome.pair = pair;

    QFileInfo subtitle(pair.subtitle.path());
    const QDir directory = subtitle.absoluteDir();
    const QString target = targetFileName(pair.video.baseName(), subtitle.suffix(), m_languageSuffix);

    if (subtitle.fileName() == target) {
        outcome.newPath = subtitle.absoluteFilePath();
        outcome.status = RenameStatus::AlreadyNamed;
        return outcome;
    }

    QString newName = target;
    outcome.status = RenameStatus::Renamed;
    if (directory.exists(target)) {
        newName = uniqueFileName(directory.absolutePath(), pair.video.baseName(), subtitle.fileName(), m_languageSuffix);
        outcome.status = RenameStatus::RenamedUnique;
    }

    outcome.newPath = directory.filePath(newName);
    if (!QFile::rename(subtitle.absoluteFilePath(), outcome.newPath)) {
        outcome.status = RenameStatus::Failed;
        outcome.errorMessage = QString("Cannot rename %1 to %2").arg(subtitle.fileName(), newName);
        LOG(QString("SubtitleRenamer: %1").arg(outcome.errorMessage));
        return outcome;
    }

    if (outcome.status == RenameStatus::RenamedUnique) {
        LOG(QString("SubtitleRenamer: %1 is taken, renamed '%2' to '%3'")
                .arg(target, subtitle.fileName(), newName));
    } else {
        LOG(QString("SubtitleRenamer: renamed '%1' to '%2'").arg(subtitle.fileName(), newName));
    }
    return outcome;
}

QString SubtitleRenamer::targetFileName(const QString& videoBaseName, const QString& subtitleExtension,
                                        const QString& languageSuffix)
{
    QString name = videoBaseName;
    if (!languageSuffix.isEmpty()) {
        name += '.' + languageSuffix;
    }
    if (!subtitleExtension.isEmpty()) {
        name += '.' + subtitleExtension;
    }
    return name;
}

QString SubtitleRenamer::uniqueFileName(const QString& directory, const QString& videoBaseName,
                                        const QString& subtitleFileName, const QString& languageSuffix)
{
    // "sub", "subs", "subtitle" as a whole word carry no information in the unique name
    static const QRegularExpression subtitleWord("[._\\-\\s]*(?<![a-z])sub(?:title)?s?(?![a-z])",
                                                 QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression edgeSeparators("^[._\\-\\s]+|[._\\-\\s]+$");

    QFileInfo original(subtitleFileName);
    const QString extension = original.suffix();
    QString originalBase = original.completeBaseName();
    QString cleaned = originalBase;
    cleaned.remove(subtitleWord);
    cleaned.remove(edgeSeparators);
    if (cleaned.isEmpty()) {
        cleaned = originalBase;
    }

    const QString suffixPart = languageSuffix.isEmpty() ? QString() : languageSuffix + '_';
    const QString stem = sanitizeFileName(videoBaseName + '.' + suffixPart + cleaned);
    const QString dotExt = extension.isEmpty() ? QString() : '.' + extension;

    QDir dir(directory);
    QString candidate = stem + dotExt;
    int counter = 1;
    while (dir.exists(candidate)) {
        candidate = QString("%1_%2%3").arg(stem).arg(counter).arg(dotExt);
        ++counter;
    }
    return candidate;
}

QString SubtitleRenamer::sanitizeFileName(const QString& name)
{
    static const QRegularExpression invalid(R"([<>:"/\\|?*])");
    QString result = name;
    result.replace(invalid, "_");
    return result;
}
