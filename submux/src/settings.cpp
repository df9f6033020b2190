#include "settings.h"
#include "logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QSettings>

namespace {

// INI values with unquoted commas come back from QSettings as a QStringList
QString readString(const QSettings& settings, const QString& key, const QString& defaultValue = QString())
{
    const QVariant value = settings.value(key);
    if (!value.isValid()) {
        return defaultValue;
    }
    if (value.userType() == QMetaType::QStringList) {
        return value.toStringList().join(", ");
    }
    return value.toString();
}

bool readBoolean(const QSettings& settings, const QString& key, bool defaultValue)
{
    if (!settings.contains(key)) {
        return defaultValue;
    }
    const QString raw = readString(settings, key);
    const bool parsed = Settings::parseBoolean(raw, defaultValue);
    if (!raw.trimmed().isEmpty() && Settings::parseBoolean(raw, !defaultValue) != parsed) {
        LOG(QString("[Settings] Invalid boolean '%1' for %2, using %3")
                .arg(raw, key, defaultValue ? QString("true") : QString("false")));
    }
    return parsed;
}

QString resolveRelative(const QString& path, const QString& baseDir)
{
    if (path.isEmpty() || QDir::isAbsolutePath(path)) {
        return path;
    }
    return QDir(baseDir).absoluteFilePath(path);
}

} // namespace

bool Settings::load(const QString& path, QString *errorMessage)
{
    QFileInfo fileInfo(path);
    if (!fileInfo.exists()) {
        LOG(QString("[Settings] %1 not found, using defaults").arg(path));
        return true;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        const QString reason = settings.status() == QSettings::FormatError
            ? QString("Malformed configuration file: %1").arg(path)
            : QString("Cannot read configuration file: %1").arg(path);
        if (errorMessage) {
            *errorMessage = reason;
        }
        LOG(QString("[Settings] %1, using defaults").arg(reason));
        return false;
    }

    const QString baseDir = fileInfo.absolutePath();
    const GeneralSettings generalDefaults;

    // [General] keys live in the root group of a QSettings INI file
    if (settings.contains("detected_video_extensions")) {
        QStringList exts = parseExtensions(readString(settings, "detected_video_extensions"));
        m_general.videoExtensions = exts.isEmpty() ? generalDefaults.videoExtensions : exts;
    }
    if (settings.contains("detected_subtitle_extensions")) {
        QStringList exts = parseExtensions(readString(settings, "detected_subtitle_extensions"));
        m_general.subtitleExtensions = exts.isEmpty() ? generalDefaults.subtitleExtensions : exts;
    }
    m_general.strictMovieMode = readBoolean(settings, "strict_movie_mode", m_general.strictMovieMode);

    // Renaming
    m_renaming.report = readBoolean(settings, "Renaming/renaming_report", m_renaming.report);
    m_renaming.languageSuffix = readString(settings, "Renaming/renaming_language_suffix",
                                           m_renaming.languageSuffix).trimmed();

    // Embedding
    m_embedding.mergeToolPath = resolveRelative(
        readString(settings, "Embedding/mkvmerge_path", m_embedding.mergeToolPath).trimmed(), baseDir);
    m_embedding.languageCode = readString(settings, "Embedding/embedding_language_code",
                                          m_embedding.languageCode).trimmed();
    m_embedding.defaultTrack = readBoolean(settings, "Embedding/default_flag", m_embedding.defaultTrack);
    m_embedding.report = readBoolean(settings, "Embedding/embedding_report", m_embedding.report);

    // Logging
    m_logging.logFile = resolveRelative(readString(settings, "Logging/log_file", m_logging.logFile).trimmed(),
                                        baseDir);

    m_sourcePath = fileInfo.absoluteFilePath();
    LOG(QString("[Settings] Loaded %1").arg(m_sourcePath));
    return true;
}

bool Settings::save(const QString& path) const
{
    QSettings settings(path, QSettings::IniFormat);

    // Written to the root group, which QSettings saves as [General]
    settings.setValue("detected_video_extensions", m_general.videoExtensions);
    settings.setValue("detected_subtitle_extensions", m_general.subtitleExtensions);
    settings.setValue("strict_movie_mode", m_general.strictMovieMode);

    settings.beginGroup("Renaming");
    settings.setValue("renaming_report", m_renaming.report);
    settings.setValue("renaming_language_suffix", m_renaming.languageSuffix);
    settings.endGroup();

    settings.beginGroup("Embedding");
    settings.setValue("mkvmerge_path", m_embedding.mergeToolPath);
    settings.setValue("embedding_language_code", m_embedding.languageCode);
    settings.setValue("default_flag", m_embedding.defaultTrack);
    settings.setValue("embedding_report", m_embedding.report);
    settings.endGroup();

    settings.beginGroup("Logging");
    settings.setValue("log_file", m_logging.logFile);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        LOG(QString("[Settings] Cannot write %1").arg(path));
        return false;
    }
    LOG(QString("[Settings] Saved %1").arg(path));
    return true;
}

QString Settings::defaultConfigPath()
{
    const QString dir = QCoreApplication::instance() ? QCoreApplication::applicationDirPath() : QDir::currentPath();
    return QDir(dir).filePath("config.ini");
}

QStringList Settings::parseExtensions(const QString& value)
{
    static const QRegularExpression valid("^[a-z0-9_]+$");

    QStringList extensions;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        QString ext = part.trimmed().toLower();
        while (ext.startsWith('.')) {
            ext.remove(0, 1);
        }
        if (ext.isEmpty()) {
            continue;
        }
        if (!valid.match(ext).hasMatch()) {
            LOG(QString("[Settings] Ignoring invalid extension '%1'").arg(part.trimmed()));
            continue;
        }
        if (!extensions.contains(ext)) {
            extensions.append(ext);
        }
    }
    return extensions;
}

bool Settings::parseBoolean(const QString& value, bool defaultValue)
{
    const QString lower = value.trimmed().toLower();
    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        return false;
    }
    return defaultValue;
}
