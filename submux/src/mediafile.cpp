#include "mediafile.h"

MediaFile::MediaFile()
    : m_kind(MediaKind::Video)
    , m_sizeBytes(-1)
{
}

MediaFile::MediaFile(const QString& path, MediaKind kind, qint64 sizeBytes)
    : m_path(path)
    , m_kind(kind)
    , m_sizeBytes(sizeBytes)
{
    QFileInfo info(path);
    m_fileName = info.fileName();
    m_extension = info.suffix().toLower();
}

MediaFile::MediaFile(const QFileInfo& fileInfo, MediaKind kind)
    : m_path(fileInfo.absoluteFilePath())
    , m_fileName(fileInfo.fileName())
    , m_extension(fileInfo.suffix().toLower())
    , m_kind(kind)
    , m_sizeBytes(fileInfo.size())
{
}

QString MediaFile::directory() const
{
    return QFileInfo(m_path).absolutePath();
}

QString MediaFile::baseName() const
{
    return QFileInfo(m_path).completeBaseName();
}

bool MediaFile::operator==(const MediaFile& other) const
{
    return QFileInfo(m_path).absoluteFilePath() == QFileInfo(other.m_path).absoluteFilePath();
}

bool MediaFile::operator!=(const MediaFile& other) const
{
    return !(*this == other);
}

bool MediaFile::lessByFileName(const MediaFile& a, const MediaFile& b)
{
    if (a.m_fileName != b.m_fileName) {
        return a.m_fileName < b.m_fileName;
    }
    return a.m_path < b.m_path;
}
