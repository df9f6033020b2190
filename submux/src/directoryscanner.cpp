#include "directoryscanner.h"
#include "mergecommandbuilder.h"
#include "logger.h"
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QSet>
#include <algorithm>

namespace {
QStringList lowercased(const QStringList& list)
{
    QStringList result;
    for (const QString& item : list) {
        QString ext = item.trimmed().toLower();
        while (ext.startsWith('.')) {
            ext.remove(0, 1);
        }
        if (!ext.isEmpty() && !result.contains(ext)) {
            result.append(ext);
        }
    }
    return result;
}
}

DirectoryScanner::DirectoryScanner(const QStringList& videoExtensions, const QStringList& subtitleExtensions)
    : m_videoExtensions(lowercased(videoExtensions))
    , m_subtitleExtensions(lowercased(subtitleExtensions))
{
}

bool DirectoryScanner::scan(const QString& directory, ScanResult *result, QString *errorMessage) const
{
    QFileInfo dirInfo(directory);
    if (!dirInfo.exists() || !dirInfo.isDir()) {
        if (errorMessage) {
            *errorMessage = QString("Directory not found: %1").arg(directory);
        }
        LOG(QString("DirectoryScanner: directory not found: %1").arg(directory));
        return false;
    }
    if (!dirInfo.isReadable()) {
        if (errorMessage) {
            *errorMessage = QString("Directory is not readable: %1").arg(directory);
        }
        LOG(QString("DirectoryScanner: directory not readable: %1").arg(directory));
        return false;
    }

    ScanResult scanned;
    QSet<QString> seen;

    QDirIterator it(dirInfo.absoluteFilePath(), QDir::Files | QDir::Hidden);
    while (it.hasNext()) {
        it.next();
        const QFileInfo fileInfo = it.fileInfo();

        const QString canonical = fileInfo.canonicalFilePath().isEmpty()
            ? fileInfo.absoluteFilePath() : fileInfo.canonicalFilePath();
        if (seen.contains(canonical)) {
            continue;
        }
        seen.insert(canonical);

        if (MergeCommandBuilder::isTempOutput(fileInfo.fileName())) {
            ++scanned.ignoredCount;
            continue;
        }

        const QString ext = fileInfo.suffix().toLower();
        if (m_videoExtensions.contains(ext)) {
            scanned.videos.append(MediaFile(fileInfo, MediaKind::Video));
        } else if (m_subtitleExtensions.contains(ext)) {
            scanned.subtitles.append(MediaFile(fileInfo, MediaKind::Subtitle));
        } else {
            ++scanned.ignoredCount;
        }
    }

    std::sort(scanned.videos.begin(), scanned.videos.end(), MediaFile::lessByFileName);
    std::sort(scanned.subtitles.begin(), scanned.subtitles.end(), MediaFile::lessByFileName);

    LOG(QString("DirectoryScanner: %1 videos, %2 subtitles, %3 ignored in %4")
            .arg(scanned.videos.size()).arg(scanned.subtitles.size())
            .arg(scanned.ignoredCount).arg(dirInfo.absoluteFilePath()));

    if (result) {
        *result = scanned;
    }
    return true;
}
