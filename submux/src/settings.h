#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QStringList>

/**
 * @brief SubMux configuration, read from config.ini
 *
 * Values are grouped the way the INI file is:
 *
 *   [General]
 *   detected_video_extensions = mkv, mp4
 *   detected_subtitle_extensions = srt, ass
 *   strict_movie_mode = false
 *
 *   [Renaming]
 *   renaming_report = false
 *   renaming_language_suffix =
 *
 *   [Embedding]
 *   mkvmerge_path =
 *   embedding_language_code =
 *   default_flag = true
 *   embedding_report = false
 *
 *   [Logging]
 *   log_file =
 *
 * Every key is optional. A missing file, missing key or invalid value falls
 * back to the default shown above; the reason is logged.
 */
class Settings
{
public:
    /**
     * @brief File discovery
     */
    struct GeneralSettings {
        QStringList videoExtensions;      // Lowercase, without dots
        QStringList subtitleExtensions;
        bool strictMovieMode;             // Reject movie matches below the similarity threshold

        GeneralSettings()
            : videoExtensions({"mkv", "mp4"})
            , subtitleExtensions({"srt", "ass"})
            , strictMovieMode(false) {}
    };

    /**
     * @brief "submux rename"
     */
    struct RenamingSettings {
        bool report;
        QString languageSuffix;   // e.g. "ar" gives Show.S01E01.ar.srt

        RenamingSettings() : report(false) {}
    };

    /**
     * @brief "submux embed"
     */
    struct EmbeddingSettings {
        QString mergeToolPath;    // Empty = search bin/ beside the application, then PATH
        QString languageCode;     // Fallback when the subtitle filename carries no language
        bool defaultTrack;
        bool report;

        EmbeddingSettings() : defaultTrack(true), report(false) {}
    };

    struct LoggingSettings {
        QString logFile;          // Empty = console only
    };

    Settings() = default;

    /**
     * @brief Load values from an INI file
     *
     * Relative paths inside the file (mkvmerge_path, log_file) are resolved
     * against the directory holding the file.
     *
     * @param errorMessage Receives the reason when the file exists but cannot be parsed
     * @return false only for an unreadable or malformed file; defaults stay in place
     */
    bool load(const QString& path, QString *errorMessage = nullptr);

    /**
     * @brief Write the current values to an INI file
     * @return false if the file could not be written
     */
    bool save(const QString& path) const;

    const GeneralSettings& general() const { return m_general; }
    GeneralSettings& general() { return m_general; }

    const RenamingSettings& renaming() const { return m_renaming; }
    RenamingSettings& renaming() { return m_renaming; }

    const EmbeddingSettings& embedding() const { return m_embedding; }
    EmbeddingSettings& embedding() { return m_embedding; }

    const LoggingSettings& logging() const { return m_logging; }
    LoggingSettings& logging() { return m_logging; }

    /// Path the settings were loaded from, empty when only defaults are in use
    QString sourcePath() const { return m_sourcePath; }

    /// config.ini beside the application executable
    static QString defaultConfigPath();

    /**
     * @brief Parse a comma-separated extension list
     *
     * Entries are trimmed, lowercased and stripped of leading dots; entries
     * that are not alphanumeric (underscores allowed) are dropped.
     */
    static QStringList parseExtensions(const QString& value);

    /// true/yes/1/on and false/no/0/off, anything else gives defaultValue
    static bool parseBoolean(const QString& value, bool defaultValue);

private:
    GeneralSettings m_general;
    RenamingSettings m_renaming;
    EmbeddingSettings m_embedding;
    LoggingSettings m_logging;
    QString m_sourcePath;
};

#endif // SETTINGS_H
