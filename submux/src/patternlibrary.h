#ifndef PATTERNLIBRARY_H
#define PATTERNLIBRARY_H

#include <QString>
#include <QList>
#include <QRegularExpression>
#include "episodeidentifier.h"

/**
 * @brief Guard flags a pattern rule can carry
 *
 * Guards are evaluated per regex occurrence after the numeric bounds check.
 * A rejected occurrence does not end the rule: the next occurrence in the
 * same filename is tried, then the next rule.
 */
namespace PatternGuard {
    constexpr int NONE                     = 0;
    constexpr int REJECT_YEAR              = 0x1;   ///< 1900-2099 is never an episode number
    constexpr int REJECT_TECHNICAL_NEIGHBOR = 0x2;  ///< Number touching a resolution, codec or year token
}

/**
 * @brief One filename-decoding rule of the pattern table
 *
 * seasonGroup == 0 means the rule has no season marker and yields the
 * default season 1 with EpisodeIdentifier::isSeasonExplicit() == false.
 */
struct EpisodePattern {
    int rank = -1;               ///< Position in the table, 0 = most specific
    QString name;                ///< Human-readable form, e.g. "S##E##"
    QRegularExpression regex;    ///< Case-insensitive
    int seasonGroup = 0;
    int episodeGroup = 1;
    int guards = PatternGuard::NONE;

    bool hasSeason() const { return seasonGroup > 0; }
};

/**
 * @brief Ordered table of episode patterns, most specific first
 *
 * The order is a correctness property: rules with unique markers (S01E05,
 * "2nd Season", "Episode") are evaluated before loose bare-number rules, so a
 * resolution such as 1080p, a release year or a codec tag like x264 can never
 * be read as an episode number while a real marker is present.
 *
 * The table is built once and exposed read-only so its order can be verified
 * independently of the extractor.
 *
 * Usage:
 *   const PatternLibrary& library = PatternLibrary::instance();
 *   for (const EpisodePattern& rule : library.rules()) {
 *       EpisodeIdentifier id = library.apply(rule, "Show.S01E05");
 *       if (id.isValid()) break;
 *   }
 */
class PatternLibrary
{
public:
    static const PatternLibrary& instance();

    const QList<EpisodePattern>& rules() const { return m_rules; }
    int ruleCount() const { return m_rules.size(); }

    /// Rank of the rule with the given name, -1 if absent
    int rankOf(const QString& name) const;

    /**
     * @brief Apply a single rule to a name (extension already stripped)
     * @return First occurrence that passes bounds and guards, or an invalid identifier
     */
    EpisodeIdentifier apply(const EpisodePattern& rule, const QString& name) const;

    /**
     * @brief Resolution, codec, bit depth or year token (case-insensitive)
     *
     * Examples: 1080p, 720i, 1920x1080, 4k, x264, h265, hevc, 10bit, 2019.
     */
    static bool isTechnicalToken(const QString& token);

    static bool isYear(int value) { return value >= 1900 && value <= 2099; }

    /// True if the name carries a "final season" marker (any separator between the words)
    static bool hasFinalSeasonMarker(const QString& name);

private:
    PatternLibrary();

    void addRule(const QString& name, const QString& pattern, int seasonGroup, int episodeGroup,
                 int guards = PatternGuard::NONE);

    static bool passesGuards(const EpisodePattern& rule, const QString& name,
                             const QRegularExpressionMatch& match, int episode);
    static QString neighborToken(const QString& name, int position, bool forward);

    QList<EpisodePattern> m_rules;
};

#endif // PATTERNLIBRARY_H
