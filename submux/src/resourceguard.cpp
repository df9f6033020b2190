#include "resourceguard.h"
#include "logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QStorageInfo>

ResourceGuard::ResourceGuard(const QString& configuredToolPath)
    : m_configuredToolPath(configuredToolPath.trimmed())
    , m_probed(false)
{
}

QString ResourceGuard::mergeToolExecutableName()
{
#ifdef Q_OS_WIN
    return QStringLiteral("mkvmerge.exe");
#else
    return QStringLiteral("mkvmerge");
#endif
}

QString ResourceGuard::locateMergeTool() const
{
    // 1. Configured path
    if (!m_configuredToolPath.isEmpty()) {
        QFileInfo configured(m_configuredToolPath);
        if (configured.isFile() && configured.isExecutable()) {
            return configured.absoluteFilePath();
        }
        LOG(QString("ResourceGuard: configured merge tool not usable: %1").arg(m_configuredToolPath));
    }

    // 2. bin/ beside the application
    if (QCoreApplication::instance()) {
        QFileInfo bundled(QDir(QCoreApplication::applicationDirPath()).filePath("bin/" + mergeToolExecutableName()));
        if (bundled.isFile() && bundled.isExecutable()) {
            return bundled.absoluteFilePath();
        }
    }

    // 3. PATH
    return QStandardPaths::findExecutable(QStringLiteral("mkvmerge"));
}

const MergeToolInfo& ResourceGuard::probeMergeTool()
{
    if (m_probed) {
        return m_info;
    }

    const QString path = locateMergeTool();
    if (path.isEmpty()) {
        m_info = MergeToolInfo();
        m_info.unavailableReason = "mkvmerge not found (checked config, bin/ and PATH)";
    } else {
        m_info = runProbe(path);
        m_info.path = path;
    }
    m_probed = true;

    if (m_info.isAvailable) {
        LOG(QString("ResourceGuard: using mkvmerge %1 at %2")
                .arg(m_info.version.isEmpty() ? QString("(unknown version)") : m_info.version, m_info.path));
    } else {
        LOG(QString("ResourceGuard: merge tool unavailable: %1").arg(m_info.unavailableReason));
    }
    return m_info;
}

void ResourceGuard::resetProbe()
{
    m_info = MergeToolInfo();
    m_probed = false;
}

MergeToolInfo ResourceGuard::runProbe(const QString& toolPath) const
{
    MergeToolInfo info;
    info.path = toolPath;

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(toolPath, QStringList() << "--version");

    if (!process.waitForStarted(PROBE_TIMEOUT_MS)) {
        info.unavailableReason = QString("Cannot start %1: %2").arg(toolPath, process.errorString());
        return info;
    }

    if (!process.waitForFinished(PROBE_TIMEOUT_MS)) {
        process.kill();
        process.waitForFinished(1000);
        info.unavailableReason = QString("%1 --version timed out").arg(toolPath);
        return info;
    }

    const QString output = QString::fromLocal8Bit(process.readAll());
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        info.unavailableReason = QString("%1 --version failed with exit code %2")
                                     .arg(toolPath).arg(process.exitCode());
        return info;
    }

    info.isAvailable = true;
    info.version = extractVersion(output);
    return info;
}

QString ResourceGuard::extractVersion(const QString& output)
{
    // "mkvmerge v81.0 ('Milliontown') 64-bit"
    static const QRegularExpression versionRx(R"(v?(\d+\.\d+(?:\.\d+)?))");
    QRegularExpressionMatch match = versionRx.match(output);
    return match.hasMatch() ? match.captured(1) : QString();
}

qint64 ResourceGuard::availableBytes(const QString& path) const
{
    QFileInfo info(path);
    const QString volumePath = info.isDir() ? info.absoluteFilePath() : info.absolutePath();

    QStorageInfo storage(volumePath);
    if (!storage.isValid() || !storage.isReady()) {
        LOG(QString("ResourceGuard: cannot query free space for %1").arg(volumePath));
        return -1;
    }
    return storage.bytesAvailable();
}

qint64 ResourceGuard::requiredBytes(qint64 videoBytes, qint64 subtitleBytes)
{
    const qint64 total = qMax<qint64>(0, videoBytes) + qMax<qint64>(0, subtitleBytes);
    return (total * SPACE_FACTOR_PERCENT + 99) / 100;
}

bool ResourceGuard::hasSpaceFor(const QString& path, qint64 videoBytes, qint64 subtitleBytes,
                                qint64 *available) const
{
    const qint64 free = availableBytes(path);
    if (available) {
        *available = free;
    }
    return free >= 0 && free >= requiredBytes(videoBytes, subtitleBytes);
}
