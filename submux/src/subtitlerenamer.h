#ifndef SUBTITLERENAMER_H
#define SUBTITLERENAMER_H

#include <QString>
#include <QList>
#include "matcher.h"

enum class RenameStatus {
    Renamed,         // Subtitle now carries the video base name
    RenamedUnique,   // Target was taken, a unique variant was used
    AlreadyNamed,    // Subtitle already had the target name
    Failed
};

struct RenameOutcome {
    MatchedPair pair;
    QString newPath;
    RenameStatus status = RenameStatus::Failed;
    QString errorMessage;

    bool succeeded() const { return status != RenameStatus::Failed; }
};

struct RenameReport {
    QList<RenameOutcome> outcomes;   // Pair order

    int renamedCount() const;
    int failedCount() const;
    int exitCode() const;
};

/**
 * @brief Renames matched subtitles after their videos
 *
 * Target name: <videoBase>[.<suffix>].<subtitleExt>. When another file already
 * holds that name (typically a second subtitle for the same video), the
 * subtitle keeps a trace of its original name:
 *   <videoBase>.<suffix>_<originalBase>.<subtitleExt>
 * followed by _1, _2, ... until the name is free. Characters that are invalid
 * in filenames are replaced by '_'.
 */
class SubtitleRenamer
{
public:
    explicit SubtitleRenamer(const QString& languageSuffix = QString());

    RenameReport run(const QList<MatchedPair>& pairs) const;
    RenameOutcome renamePair(const MatchedPair& pair) const;

    QString languageSuffix() const { return m_languageSuffix; }

    /// "<videoBase>[.<suffix>].<ext>"; ext without the dot
    static QString targetFileName(const QString& videoBaseName, const QString& subtitleExtension,
                                  const QString& languageSuffix);

    /// First free unique variant inside directory
    static QString uniqueFileName(const QString& directory, const QString& videoBaseName,
                                  const QString& subtitleFileName, const QString& languageSuffix);

    static QString sanitizeFileName(const QString& name);

private:
    QString m_languageSuffix;
};

#endif // SUBTITLERENAMER_H
