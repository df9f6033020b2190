#ifndef MATCHER_H
#define MATCHER_H

#include <QString>
#include <QList>
#include "mediafile.h"
#include "episodeidentifier.h"

class IdentifierExtractor;

/**
 * @brief How a MatchedPair was established
 */
enum class MatchBasis {
    Episode,                 ///< Equal episode identifiers
    MovieTitle,              ///< Title token overlap (single video, single subtitle, no episode pair)
    ContextualFinalSeason    ///< Explicit season of one side adopted by the other
};

/**
 * @brief Why a file was left without a partner
 */
enum class UnmatchedReason {
    Unidentified,     ///< No pattern rule matched the filename
    NoCounterpart,    ///< Identified, but nothing on the other side shares the identifier
    Conflict,         ///< Lost a collision against a file earlier in filename order
    BelowThreshold    ///< Movie mode in strict mode with an overlap below the threshold and no shared year
};

struct MatchedPair {
    MediaFile video;
    MediaFile subtitle;
    MatchBasis basis = MatchBasis::Episode;
    EpisodeIdentifier identifier;   // Invalid for movie-title pairs
    double similarity = 0.0;        // Overlap ratio, movie-title pairs only
    bool lowConfidence = false;
};

/**
 * @brief Diagnostic record of two files competing for one identifier
 */
struct MatchConflict {
    enum class Kind {
        VideoCollision,      ///< Two videos decode to the same identifier
        SubtitleConflict     ///< Two subtitles decode to an identifier already paired
    };

    Kind kind = Kind::VideoCollision;
    EpisodeIdentifier identifier;
    QString winner;   // Path kept in play
    QString loser;    // Path left unmatched
};

struct UnmatchedFile {
    MediaFile file;
    UnmatchedReason reason = UnmatchedReason::NoCounterpart;
};

struct MatchResult {
    QList<MatchedPair> matched;              // Subtitle filename order
    QList<UnmatchedFile> unmatchedVideos;    // Video filename order
    QList<UnmatchedFile> unmatchedSubtitles; // Subtitle filename order
    QList<MatchConflict> conflicts;
};

struct MatcherOptions {
    bool strictMovieMode = false;   // Reject movie-mode pairs below the threshold
};

/**
 * @brief Pairs videos with subtitles
 *
 * Episode mode (identifier equality plus the contextual final-season pass)
 * always runs first. When the input is exactly one video and one subtitle and
 * episode mode paired nothing, movie mode (title token overlap) decides
 * instead. Both lists are sorted by filename before
 * processing, so the first file in that order wins every collision and the
 * result never depends on scan order.
 *
 * Matching works on in-memory lists only; nothing on disk is touched.
 *
 * Usage:
 *   Matcher matcher;
 *   MatchResult result = matcher.match(videos, subtitles);
 *   for (const MatchedPair& pair : result.matched) {
 *       // pair.video, pair.subtitle
 *   }
 */
class Matcher
{
public:
    explicit Matcher(const MatcherOptions& options = MatcherOptions(), IdentifierExtractor *extractor = nullptr);

    MatchResult match(MediaFileList videos, MediaFileList subtitles) const;

    const MatcherOptions& options() const { return m_options; }

    static QString basisName(MatchBasis basis);
    static QString reasonName(UnmatchedReason reason);
    static QString conflictKindName(MatchConflict::Kind kind);

private:
    MatchResult matchMovie(const MediaFile& video, const MediaFile& subtitle) const;
    MatchResult matchEpisodes(const MediaFileList& videos, const MediaFileList& subtitles) const;

    MatcherOptions m_options;
    IdentifierExtractor *m_extractor;
};

#endif // MATCHER_H
