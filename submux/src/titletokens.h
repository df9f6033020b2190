#ifndef TITLETOKENS_H
#define TITLETOKENS_H

#include <QString>
#include <QSet>

/**
 * Title word sets used by movie mode and by the contextual final-season rule
 */
namespace TitleTokens {

/**
 * Similarity a movie-mode pair needs to count as a confident match
 */
constexpr double MOVIE_MATCH_THRESHOLD = 0.3;

/**
 * Lowercase title words of a filename
 *
 * The extension is dropped, the name is split on dots, underscores, dashes,
 * whitespace and brackets, and the following are removed:
 * - filler words (articles, prepositions, conjunctions, pronouns, common verbs)
 * - technical markers (resolution, codec, source, audio, release and language tags)
 * - years 1900-2099 and other purely numeric words
 *
 * @param filename Filename or path
 * @return Set of remaining words, possibly empty
 */
QSet<QString> titleTokens(const QString& filename);

/**
 * Overlap ratio |A ∩ B| / min(|A|, |B|)
 *
 * @return Ratio in [0, 1]; 0 when either set is empty
 */
double overlapRatio(const QSet<QString>& a, const QSet<QString>& b);

/**
 * First standalone year 1900-2099 in a filename
 *
 * Digits glued to other characters ("1920x1080", "x2019") are not years.
 *
 * @return Four-digit year, or an empty string
 */
QString releaseYear(const QString& filename);

/**
 * True if the two sets share at least one word
 */
bool overlaps(const QSet<QString>& a, const QSet<QString>& b);

bool isFillerWord(const QString& word);
bool isTechnicalMarker(const QString& word);

} // namespace TitleTokens

#endif // TITLETOKENS_H
