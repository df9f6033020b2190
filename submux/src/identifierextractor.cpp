#include "identifierextractor.h"
#include "patternlibrary.h"
#include <QFileInfo>
#include <QRegularExpression>

IdentifierExtractor::IdentifierExtractor(int cacheCapacity)
    : m_cache(cacheCapacity > 0 ? cacheCapacity : DEFAULT_CACHE_CAPACITY)
    , m_hits(0)
    , m_misses(0)
{
}

IdentifierExtractor& IdentifierExtractor::shared()
{
    static IdentifierExtractor extractor;
    return extractor;
}

EpisodeIdentifier IdentifierExtractor::extract(const QString& filename, bool *ok)
{
    if (const EpisodeIdentifier *cached = m_cache.object(filename)) {
        ++m_hits;
        if (ok) {
            *ok = cached->isValid();
        }
        return *cached;
    }

    ++m_misses;
    EpisodeIdentifier result = scan(stripExtension(filename));

    // Unidentified results are cached too, each entry costs 1
    m_cache.insert(filename, new EpisodeIdentifier(result), 1);

    if (ok) {
        *ok = result.isValid();
    }
    return result;
}

void IdentifierExtractor::clearCache()
{
    m_cache.clear();
    m_hits = 0;
    m_misses = 0;
}

QString IdentifierExtractor::stripExtension(const QString& filename)
{
    QString name = QFileInfo(filename).fileName();

    // Extension shapes: mkv, webm, mp4, m4v, m2ts. "Show.S2E8" or "Show.05" keep their last component
    static const QRegularExpression extension("\\.(?:[a-z]{2,4}|[a-z]{2,3}\\d|[a-z]\\d[a-z]{1,2}|[a-z]\\d[a-z]{2}\\d?)$",
                                              QRegularExpression::CaseInsensitiveOption);
    QRegularExpressionMatch match = extension.match(name);
    if (match.hasMatch()) {
        name.truncate(match.capturedStart(0));
    }
    return name;
}

EpisodeIdentifier IdentifierExtractor::scan(const QString& name) const
{
    const PatternLibrary& library = PatternLibrary::instance();
    for (const EpisodePattern& rule : library.rules()) {
        EpisodeIdentifier id = library.apply(rule, name);
        if (id.isValid()) {
            return id;
        }
    }
    return EpisodeIdentifier();
}
