#include "mergecommandbuilder.h"

#include <QDir>
#include <QFileInfo>

QStringList MergeCommandBuilder::buildArguments(const MergeRequest &request, QString *errorMessage)
{
    if (request.videoPath.trimmed().isEmpty() || request.subtitlePath.trimmed().isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Merge request needs both a video and a subtitle path");
        }
        return QStringList();
    }

    if (request.outputPath.trimmed().isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Merge request has no output path");
        }
        return QStringList();
    }

    if (QFileInfo(request.outputPath).absoluteFilePath() == QFileInfo(request.videoPath).absoluteFilePath()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Refusing to merge in place: output equals the source video");
        }
        return QStringList();
    }

    QStringList args;
    args << "-o" << request.outputPath
         << request.videoPath;

    // Track options apply to the file that follows them
    if (!request.languageCode.isEmpty()) {
        args << "--language" << QStringLiteral("0:%1").arg(request.languageCode);
    }
    args << "--default-track" << (request.defaultTrack ? QStringLiteral("0:yes") : QStringLiteral("0:no"));

    args << request.subtitlePath;
    return args;
}

QString MergeCommandBuilder::tempOutputPath(const QString &videoPath)
{
    QFileInfo video(videoPath);
    return QDir(video.absolutePath()).filePath(video.completeBaseName() + QLatin1String(TEMP_SUFFIX));
}

bool MergeCommandBuilder::isTempOutput(const QString &fileName)
{
    return fileName.endsWith(QLatin1String(TEMP_SUFFIX), Qt::CaseInsensitive);
}
