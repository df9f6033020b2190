#include "titletokens.h"
#include "identifierextractor.h"
#include "patternlibrary.h"
#include <QRegularExpression>
#include <algorithm>

namespace TitleTokens {

bool isFillerWord(const QString& word)
{
    static const QSet<QString> fillers = {
        // Articles
        "a", "an", "the",
        // Prepositions
        "of", "in", "on", "at", "to", "for", "with", "from", "by",
        "about", "as", "into", "through", "during", "before", "after",
        "above", "below", "between", "among", "under", "over",
        // Conjunctions
        "and", "or", "but", "nor", "yet", "so",
        // Pronouns
        "it", "its", "this", "that", "these", "those",
        // Common verb forms
        "is", "are", "was", "were", "be", "been", "being",
        "have", "has", "had", "do", "does", "did",
        // Quantifiers and adverbs
        "not", "all", "no", "some", "more", "most", "very",
        "can", "will", "just", "should", "than", "also", "only",
        // Number words
        "one", "two", "three", "four", "five", "six", "seven", "eight", "nine", "ten"
    };
    return fillers.contains(word.toLower());
}

bool isTechnicalMarker(const QString& word)
{
    static const QSet<QString> markers = {
        // Source and quality
        "bluray", "bdrip", "brrip", "web", "webrip", "webdl", "dl", "dvd", "dvdrip", "hdtv",
        "hd", "uhd", "remux", "hdrip",
        // Audio
        "aac", "ac3", "eac3", "dts", "ddp", "truehd", "atmos", "flac", "mp3",
        // Release tags
        "proper", "repack", "real", "extended", "theatrical", "unrated", "directors", "cut",
        "internal", "limited", "ntsc", "pal", "dc", "multi", "dub", "dubbed", "sub", "subbed",
        "sync", "syncopated", "cc", "sdh", "hc", "final", "post", "pre",
        // Language tags
        "eng", "en", "ara", "ar", "fre", "fr", "ger", "de", "ita", "it", "es", "spa",
        "kor", "jpn", "ch", "chs", "cht"
    };
    const QString lower = word.toLower();
    return markers.contains(lower) || PatternLibrary::isTechnicalToken(lower);
}

QSet<QString> titleTokens(const QString& filename)
{
    static const QRegularExpression splitter("[\\s._\\-\\[\\](){}+,]+");
    static const QRegularExpression numeric("^\\d+$");

    const QString name = IdentifierExtractor::stripExtension(filename).toLower();
    const QStringList words = name.split(splitter, Qt::SkipEmptyParts);

    QSet<QString> tokens;
    for (const QString& word : words) {
        if (numeric.match(word).hasMatch() || isFillerWord(word) || isTechnicalMarker(word)) {
            continue;
        }
        tokens.insert(word);
    }
    return tokens;
}

double overlapRatio(const QSet<QString>& a, const QSet<QString>& b)
{
    if (a.isEmpty() || b.isEmpty()) {
        return 0.0;
    }

    int common = 0;
    for (const QString& word : a) {
        if (b.contains(word)) {
            ++common;
        }
    }
    return static_cast<double>(common) / std::min(a.size(), b.size());
}

QString releaseYear(const QString& filename)
{
    static const QRegularExpression year("(?:^|[\\s._\\-\\[(])((?:19|20)\\d{2})(?=$|[\\s._\\-\\])])");

    const QRegularExpressionMatch match = year.match(IdentifierExtractor::stripExtension(filename));
    return match.hasMatch() ? match.captured(1) : QString();
}

bool overlaps(const QSet<QString>& a, const QSet<QString>& b)
{
    return a.intersects(b);
}

} // namespace TitleTokens
