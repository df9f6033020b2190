#ifndef REPORTWRITER_H
#define REPORTWRITER_H

#include <QString>
#include <QStringList>
#include "matcher.h"

struct RenameReport;
struct EmbedReport;

/**
 * @brief Renders CSV reports for rename and embed runs
 *
 * A report starts with '#' comment lines (title, timestamp, directory,
 * configuration and summary counters) followed by one CSV table covering
 * every matched, skipped and unmatched file, then the conflict list as
 * comment lines. Fields are quoted per RFC 4180 when needed.
 */
class ReportWriter
{
public:
    static constexpr const char *RENAMING_REPORT_NAME = "renaming_report.csv";
    static constexpr const char *EMBEDDING_REPORT_NAME = "embedding_report.csv";

    struct RunInfo {
        QString directory;
        QStringList configuration;   // "key=value" lines echoed in the header
        qint64 elapsedMs = 0;
    };

    static QString renderRenamingReport(const MatchResult& match, const RenameReport& rename, const RunInfo& info);
    static QString renderEmbeddingReport(const MatchResult& match, const EmbedReport& embed, const RunInfo& info);

    /**
     * @brief Write rendered content as UTF-8
     * @return false if the file could not be written
     */
    static bool write(const QString& path, const QString& content, QString *errorMessage = nullptr);

    /// Quote a field when it contains a comma, quote or line break
    static QString csvField(const QString& value);
    static QString csvRow(const QStringList& fields);

private:
    static QString header(const QString& title, const RunInfo& info);
    static QString conflictLines(const MatchResult& match);
    static QString episodeLabel(const MatchedPair& pair);
    static QString episodeLabel(const MediaFile& file);
    static QString formatElapsed(qint64 ms);
};

#endif // REPORTWRITER_H
