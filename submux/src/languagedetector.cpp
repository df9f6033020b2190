#include "languagedetector.h"
#include "logger.h"
#include <QFileInfo>
#include <QHash>
#include <QSet>
#include <QStringList>

namespace {

// ISO 639-2 codes accepted by mkvmerge, bibliographic and terminology forms
const QHash<QString, QString>& threeLetterCodes()
{
    static const QHash<QString, QString> codes = {
        {"ara", "Arabic"}, {"eng", "English"}, {"fre", "French"}, {"fra", "French"},
        {"ger", "German"}, {"deu", "German"}, {"spa", "Spanish"}, {"ita", "Italian"},
        {"por", "Portuguese"}, {"rus", "Russian"}, {"jpn", "Japanese"}, {"kor", "Korean"},
        {"chi", "Chinese"}, {"zho", "Chinese"}, {"dut", "Dutch"}, {"nld", "Dutch"},
        {"swe", "Swedish"}, {"nor", "Norwegian"}, {"dan", "Danish"}, {"fin", "Finnish"},
        {"pol", "Polish"}, {"cze", "Czech"}, {"ces", "Czech"}, {"slo", "Slovak"},
        {"slk", "Slovak"}, {"hun", "Hungarian"}, {"rum", "Romanian"}, {"ron", "Romanian"},
        {"bul", "Bulgarian"}, {"gre", "Greek"}, {"ell", "Greek"}, {"tur", "Turkish"},
        {"heb", "Hebrew"}, {"per", "Persian"}, {"fas", "Persian"}, {"urd", "Urdu"},
        {"hin", "Hindi"}, {"ben", "Bengali"}, {"tha", "Thai"}, {"vie", "Vietnamese"},
        {"ind", "Indonesian"}, {"may", "Malay"}, {"msa", "Malay"}, {"fil", "Filipino"},
        {"ukr", "Ukrainian"}, {"hrv", "Croatian"}, {"srp", "Serbian"}, {"slv", "Slovenian"},
        {"est", "Estonian"}, {"lav", "Latvian"}, {"lit", "Lithuanian"}, {"ice", "Icelandic"},
        {"isl", "Icelandic"}, {"cat", "Catalan"}, {"baq", "Basque"}, {"eus", "Basque"},
        {"glg", "Galician"}, {"tam", "Tamil"}, {"tel", "Telugu"}, {"kur", "Kurdish"},
        {"und", "Undetermined"}
    };
    return codes;
}

const QHash<QString, QString>& twoLetterCodes()
{
    static const QHash<QString, QString> codes = {
        {"ar", "ara"}, {"en", "eng"}, {"fr", "fre"}, {"de", "ger"}, {"es", "spa"},
        {"it", "ita"}, {"pt", "por"}, {"ru", "rus"}, {"ja", "jpn"}, {"ko", "kor"},
        {"zh", "chi"}, {"nl", "dut"}, {"sv", "swe"}, {"no", "nor"}, {"da", "dan"},
        {"fi", "fin"}, {"pl", "pol"}, {"cs", "cze"}, {"sk", "slo"}, {"hu", "hun"},
        {"ro", "rum"}, {"bg", "bul"}, {"el", "gre"}, {"tr", "tur"}, {"he", "heb"},
        {"fa", "per"}, {"ur", "urd"}, {"hi", "hin"}, {"bn", "ben"}, {"th", "tha"},
        {"vi", "vie"}, {"id", "ind"}, {"ms", "may"}, {"uk", "ukr"}, {"hr", "hrv"},
        {"sr", "srp"}, {"sl", "slv"}, {"et", "est"}, {"lv", "lav"}, {"lt", "lit"},
        {"is", "ice"}, {"ca", "cat"}, {"eu", "baq"}, {"gl", "glg"}, {"ta", "tam"},
        {"te", "tel"}, {"ku", "kur"}
    };
    return codes;
}

// Filename parts that describe the track flavour, not its language
bool isTrackFlavourTag(const QString& part)
{
    static const QSet<QString> tags = {"forced", "sdh", "cc", "hi"};
    return tags.contains(part);
}

} // namespace

LanguageDetector::LanguageDetector(const QString& configuredCode)
{
    const QString trimmed = configuredCode.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    m_configuredCode = normalize(trimmed);
    if (m_configuredCode.isEmpty()) {
        LOG(QString("LanguageDetector: invalid language code in config: '%1'").arg(trimmed));
    }
}

LanguageResolution LanguageDetector::resolve(const QString& subtitleFileName) const
{
    LanguageResolution resolution;

    const QString fromName = detectFromFilename(subtitleFileName);
    if (!fromName.isEmpty()) {
        resolution.code = fromName;
        resolution.source = LanguageSource::Filename;
    } else if (!m_configuredCode.isEmpty()) {
        resolution.code = m_configuredCode;
        resolution.source = LanguageSource::Configured;
    }
    return resolution;
}

QString LanguageDetector::normalize(const QString& code)
{
    const QString lower = code.trimmed().toLower();
    if (lower.isEmpty()) {
        return QString();
    }
    if (threeLetterCodes().contains(lower)) {
        return lower;
    }
    return twoLetterCodes().value(lower);
}

QString LanguageDetector::detectFromFilename(const QString& fileName)
{
    QString name = QFileInfo(fileName).fileName();
    const int lastDot = name.lastIndexOf('.');
    if (lastDot > 0) {
        name.truncate(lastDot);
    }

    const QStringList parts = name.split('.');
    const int first = qMax(1, parts.size() - 3);   // The leading part is the title, never a tag
    for (int i = parts.size() - 1; i >= first; --i) {
        const QString part = parts.at(i).trimmed().toLower();
        if (isTrackFlavourTag(part)) {
            continue;
        }
        const QString normalized = normalize(part);
        if (!normalized.isEmpty()) {
            return normalized;
        }
    }
    return QString();
}

QString LanguageDetector::languageName(const QString& code)
{
    return threeLetterCodes().value(code.toLower(), code);
}

QString LanguageDetector::sourceName(LanguageSource source)
{
    switch (source) {
        case LanguageSource::Filename: return "filename";
        case LanguageSource::Configured: return "config";
        case LanguageSource::None: return "none";
    }
    return QString();
}
