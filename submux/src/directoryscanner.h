#ifndef DIRECTORYSCANNER_H
#define DIRECTORYSCANNER_H

#include <QString>
#include <QStringList>
#include "mediafile.h"

struct ScanResult {
    MediaFileList videos;      // Sorted by filename
    MediaFileList subtitles;   // Sorted by filename
    int ignoredCount = 0;      // Regular files with other extensions or temporary merge outputs
};

/**
 * @brief Lists the media files of one directory
 *
 * Non-recursive. Files are classified by extension (case-insensitive, lists
 * without dots), temporary merge outputs ("*.embedded.mkv") are dropped, and
 * both lists come back deduplicated and sorted by filename.
 */
class DirectoryScanner
{
public:
    DirectoryScanner(const QStringList& videoExtensions, const QStringList& subtitleExtensions);

    /**
     * @brief Scan a directory
     * @param result Receives the lists; untouched on failure
     * @param errorMessage Receives the reason when the directory is missing or unreadable
     * @return false if the directory cannot be listed
     */
    bool scan(const QString& directory, ScanResult *result, QString *errorMessage = nullptr) const;

    QStringList videoExtensions() const { return m_videoExtensions; }
    QStringList subtitleExtensions() const { return m_subtitleExtensions; }

private:
    QStringList m_videoExtensions;
    QStringList m_subtitleExtensions;
};

#endif // DIRECTORYSCANNER_H
