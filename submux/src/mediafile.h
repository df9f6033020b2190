#ifndef MEDIAFILE_H
#define MEDIAFILE_H

#include <QString>
#include <QFileInfo>
#include <QList>

/**
 * @brief Kind of media a scanned file holds
 */
enum class MediaKind {
    Video,
    Subtitle
};

/**
 * @brief MediaFile - Immutable description of one scanned file
 *
 * Created by the DirectoryScanner from a directory listing and consumed
 * read-only by the Matcher, Renamer and MergeTransaction. Nothing in the core
 * mutates a MediaFile after construction; a file that moves on disk gets a new
 * MediaFile.
 *
 * Usage:
 *   MediaFile video(QFileInfo("/shows/Show.S01E01.mkv"), MediaKind::Video);
 *   if (video.isValid()) {
 *       qint64 bytes = video.sizeBytes();
 *   }
 */
class MediaFile
{
public:
    /**
     * @brief Default constructor creates an invalid file
     */
    MediaFile();

    /**
     * @brief Construct from components
     * @param path Full path to the file
     * @param kind Video or subtitle
     * @param sizeBytes File size in bytes
     */
    MediaFile(const QString& path, MediaKind kind, qint64 sizeBytes);

    /**
     * @brief Construct from a QFileInfo, reading the size from it
     */
    MediaFile(const QFileInfo& fileInfo, MediaKind kind);

    QString path() const { return m_path; }
    QString fileName() const { return m_fileName; }
    QString extension() const { return m_extension; }
    MediaKind kind() const { return m_kind; }
    qint64 sizeBytes() const { return m_sizeBytes; }

    bool isVideo() const { return m_kind == MediaKind::Video; }
    bool isSubtitle() const { return m_kind == MediaKind::Subtitle; }
    bool isValid() const { return !m_path.isEmpty() && m_sizeBytes >= 0; }

    QString directory() const;
    QString baseName() const;  // Filename without the last extension

    // Equality is based on the absolute path
    bool operator==(const MediaFile& other) const;
    bool operator!=(const MediaFile& other) const;

    /// Lexicographic filename order used by the scanner and the matcher
    static bool lessByFileName(const MediaFile& a, const MediaFile& b);

private:
    QString m_path;
    QString m_fileName;
    QString m_extension;   // lowercase, without the dot
    MediaKind m_kind;
    qint64 m_sizeBytes;
};

using MediaFileList = QList<MediaFile>;

#endif // MEDIAFILE_H
