#ifndef MERGECOMMANDBUILDER_H
#define MERGECOMMANDBUILDER_H

#include <QString>
#include <QStringList>

/**
 * @brief Parameters of one mkvmerge invocation
 */
struct MergeRequest
{
    QString videoPath;
    QString subtitlePath;
    QString outputPath;
    QString languageCode;      // ISO 639-2, empty to leave the track language unset
    bool defaultTrack = true;
};

/**
 * @brief Builds mkvmerge argument lists
 *
 * The result is passed to QProcess as a list, never through a shell, so paths
 * with spaces or quotes need no escaping:
 *   -o <output> <video> [--language 0:<code>] --default-track 0:yes|no <subtitle>
 */
class MergeCommandBuilder
{
public:
    static constexpr const char *TEMP_SUFFIX = ".embedded.mkv";

    /**
     * @brief Build the arguments (without the program path)
     * @param errorMessage Receives the reason when the request is incomplete
     * @return Argument list, empty on error
     */
    static QStringList buildArguments(const MergeRequest &request, QString *errorMessage = nullptr);

    /// "<dir>/<videoStem>.embedded.mkv" beside the source video
    static QString tempOutputPath(const QString &videoPath);

    /// True for names produced by tempOutputPath()
    static bool isTempOutput(const QString &fileName);
};

#endif // MERGECOMMANDBUILDER_H
