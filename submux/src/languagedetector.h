#ifndef LANGUAGEDETECTOR_H
#define LANGUAGEDETECTOR_H

#include <QString>

/**
 * @brief Tier that supplied a subtitle track language
 */
enum class LanguageSource {
    Filename,     ///< Language tag found in the subtitle filename
    Configured,   ///< Embedding language code from config.ini
    None          ///< No language written to the track
};

struct LanguageResolution {
    QString code;    // ISO 639-2 three-letter code, empty when source is None
    LanguageSource source = LanguageSource::None;

    bool isResolved() const { return !code.isEmpty(); }
};

/**
 * @brief Resolves the language of a subtitle track
 *
 * Resolution order:
 * 1. A language tag among the last three dot-separated parts of the filename
 *    ("Show.S01E01.ar.srt", "Movie.en.forced.ass"); forced/sdh/cc/hi are skipped
 * 2. The configured embedding language code
 * 3. None
 *
 * Two-letter tags are normalized to their ISO 639-2 three-letter form
 * (ar -> ara, en -> eng) because that is what mkvmerge expects.
 */
class LanguageDetector
{
public:
    explicit LanguageDetector(const QString& configuredCode = QString());

    LanguageResolution resolve(const QString& subtitleFileName) const;

    /// Normalized configured code, empty when unset or not a known language
    QString configuredCode() const { return m_configuredCode; }

    /**
     * @brief Normalize a two- or three-letter code
     * @return Three-letter code, or an empty string for unknown codes
     */
    static QString normalize(const QString& code);

    /// Language tag of a filename, empty if none of the candidate parts is a language
    static QString detectFromFilename(const QString& fileName);

    /// English name of a three-letter code ("ara" -> "Arabic"), the code itself if unknown
    static QString languageName(const QString& code);

    static QString sourceName(LanguageSource source);

private:
    QString m_configuredCode;
};

#endif // LANGUAGEDETECTOR_H
