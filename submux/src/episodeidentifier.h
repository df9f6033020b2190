#ifndef EPISODEIDENTIFIER_H
#define EPISODEIDENTIFIER_H

#include <QString>
#include <QHashFunctions>

/**
 * @brief Normalized (season, episode) pair decoded from a filename
 *
 * Leading zeros are stripped on construction, so "S02E008" and "S2E8" produce
 * equal identifiers. Equality and hashing only look at season and episode;
 * the rank of the pattern that produced the identifier and whether the season
 * was written in the filename are kept for diagnostics and for the
 * contextual final-season rule.
 *
 * Bounds: season 1-99, episode 1-9999. Anything outside is invalid.
 */
class EpisodeIdentifier
{
public:
    static constexpr int MIN_SEASON = 1;
    static constexpr int MAX_SEASON = 99;
    static constexpr int MIN_EPISODE = 1;
    static constexpr int MAX_EPISODE = 9999;

    // Constructors
    EpisodeIdentifier();
    EpisodeIdentifier(int season, int episode, int sourcePatternRank = -1, bool seasonExplicit = true);

    // Getters
    int season() const { return m_season; }
    int episode() const { return m_episode; }
    int sourcePatternRank() const { return m_sourcePatternRank; }
    bool isSeasonExplicit() const { return m_seasonExplicit; }

    bool isValid() const;

    /// Same identifier with another season, marked as explicit
    EpisodeIdentifier withSeason(int season) const;

    // Canonical text form, e.g. "S02E08"; empty for invalid identifiers
    QString toString() const;

    // Parse the canonical form ("S2E8", "s02e008"); returns an invalid identifier on failure
    static EpisodeIdentifier fromString(const QString& str);

    static bool isSeasonInRange(int season);
    static bool isEpisodeInRange(int episode);

    // Comparison operators (season first, then episode)
    bool operator<(const EpisodeIdentifier& other) const;
    bool operator==(const EpisodeIdentifier& other) const;
    bool operator!=(const EpisodeIdentifier& other) const;

private:
    int m_season;
    int m_episode;
    int m_sourcePatternRank;   // Index into PatternLibrary::rules(), -1 if unknown
    bool m_seasonExplicit;     // false when the pattern supplied the default season 1
};

inline size_t qHash(const EpisodeIdentifier& id, size_t seed = 0)
{
    return qHashMulti(seed, id.season(), id.episode());
}

#endif // EPISODEIDENTIFIER_H
