#ifndef IDENTIFIEREXTRACTOR_H
#define IDENTIFIEREXTRACTOR_H

#include <QString>
#include <QCache>
#include "episodeidentifier.h"

/**
 * @brief Decodes filenames into EpisodeIdentifiers through the PatternLibrary
 *
 * Rules are tried in table order and the first accepted hit wins. Results,
 * including "unidentified", are memoized per filename in a bounded LRU cache
 * (QCache), so repeated lookups during one run never rescan the rule table.
 * Extraction is a pure function of the filename: the cache only changes speed.
 *
 * Usage:
 *   bool ok = false;
 *   EpisodeIdentifier id = IdentifierExtractor::shared().extract("Show.S02E008.ar.srt", &ok);
 *   if (ok) {
 *       // id.season() == 2, id.episode() == 8
 *   }
 */
class IdentifierExtractor
{
public:
    static constexpr int DEFAULT_CACHE_CAPACITY = 1024;

    explicit IdentifierExtractor(int cacheCapacity = DEFAULT_CACHE_CAPACITY);

    /**
     * @brief Extract the episode identifier of a filename
     * @param filename Filename or path; the directory part and the extension are ignored
     * @param ok Set to false when no rule matched ("unidentified")
     * @return The identifier, invalid when unidentified
     */
    EpisodeIdentifier extract(const QString& filename, bool *ok = nullptr);

    /// Process-wide extractor used by the Matcher by default
    static IdentifierExtractor& shared();

    // Cache management and statistics
    void clearCache();
    int cacheSize() const { return m_cache.count(); }
    int cacheCapacity() const { return static_cast<int>(m_cache.maxCost()); }
    qint64 cacheHits() const { return m_hits; }
    qint64 cacheMisses() const { return m_misses; }

    /// Drop the directory part and a trailing file extension ("mkv", "srt", "mp4"...)
    static QString stripExtension(const QString& filename);

private:
    EpisodeIdentifier scan(const QString& name) const;

    QCache<QString, EpisodeIdentifier> m_cache;
    qint64 m_hits;
    qint64 m_misses;
};

#endif // IDENTIFIEREXTRACTOR_H
