#include "patternlibrary.h"
#include "logger.h"
#include <QSet>

// Static flag to log the table size only once
static bool s_tableLogged = false;

namespace {
// Separator class shared by the rules: space, dot, dash, underscore
const QString SEP = QStringLiteral("[\\s._-]");
}

PatternLibrary::PatternLibrary()
{
    // Explicit season and episode markers
    addRule("S##E##",                 "(?<![a-z])s(\\d+)\\s?e(\\d+)", 1, 2);
    addRule("S## Episode ##",         "(?<![a-z])s(\\d+)" + SEP + "+episode" + SEP + "*(\\d+)", 1, 2);
    addRule("##x##",                  "(?:^|[._\\s-])(\\d{1,2})x(\\d+)(?=[._\\s-]|$)", 1, 2);
    addRule("S## - E##",              "(?<![a-z])s(\\d{1,2})\\s*-\\s*e(\\d+)", 1, 2);
    addRule("S## - EP##",             "(?<![a-z])s(\\d{1,2})\\s*-\\s*ep(\\d+)", 1, 2);
    addRule("S## - ##",               "(?<![a-z])s(\\d{1,2})\\s*-\\s*(\\d+)(?!\\d)", 1, 2);
    addRule("S##.E##",                "(?<![a-z])s(\\d{1,2})\\.e(\\d+)", 1, 2);
    addRule("S##_E##",                "(?<![a-z])s(\\d{1,2})_e(\\d+)", 1, 2);
    addRule("S## EP##",               "(?<![a-z])s(\\d{1,2})" + SEP + "+ep\\s*(\\d+)", 1, 2);
    addRule("S##.EP##",               "(?<![a-z])s(\\d{1,2})\\.ep(\\d+)", 1, 2);

    // Ordinal seasons ("2nd Season")
    addRule("1st Season - ##",        "(\\d{1,2})(?:st|nd|rd|th)" + SEP + "+season\\s*-\\s*(\\d+)", 1, 2);
    addRule("1st Season Episode ##",  "(\\d{1,2})(?:st|nd|rd|th)" + SEP + "+season" + SEP + "+episode" + SEP + "*(\\d+)", 1, 2);
    addRule("1st Season E##",         "(\\d{1,2})(?:st|nd|rd|th)" + SEP + "+season" + SEP + "+e\\s*(\\d+)", 1, 2);
    addRule("1st Season EP##",        "(\\d{1,2})(?:st|nd|rd|th)" + SEP + "+season" + SEP + "+ep\\s*(\\d+)", 1, 2);

    // Spelled-out "Season"
    addRule("Season ## - ##",         "(?<![a-z])season\\s*(\\d{1,2})\\s*-\\s*(\\d+)(?!\\d)", 1, 2);
    addRule("Season # Episode #",     "(?<![a-z])season" + SEP + "*(\\d+)" + SEP + "*episode" + SEP + "*(\\d+)", 1, 2);
    addRule("S#.Ep.#",                "(?<![a-z])s(\\d+)" + SEP + "*ep(?:isode)?\\.(\\d+)", 1, 2);
    addRule("S#Ep#",                  "(?<![a-z])s(\\d+)ep(?:isode)?(\\d+)", 1, 2);
    addRule("Season # Ep #",          "(?<![a-z])season" + SEP + "*(\\d+)" + SEP + "*ep" + SEP + "*(\\d+)", 1, 2);
    addRule("Season## e##",           "(?<![a-z])season" + SEP + "*(\\d+)" + SEP + "+e(\\d+)", 1, 2);

    // Episode marker without season: default season 1
    addRule("Ep##",                   "(?:^|[._\\s-])ep(?:isode)?" + SEP + "*(\\d+)(?=[._\\s-]|$)", 0, 1);
    addRule("E##",                    "(?:^|[._\\s-])e(\\d+)(?=[._\\s-]|$)", 0, 1);

    // Bare numbers: least specific, guarded against years and technical tokens
    addRule("## - ##",                "(?<![0-9])(\\d{1,2})\\s*-\\s*(\\d{1,2})(?![a-z0-9])", 1, 2,
            PatternGuard::REJECT_TECHNICAL_NEIGHBOR);
    addRule("- ##",                   "-\\s*(\\d{1,4})(?![a-z0-9])", 0, 1,
            PatternGuard::REJECT_YEAR | PatternGuard::REJECT_TECHNICAL_NEIGHBOR);
    addRule("[##]",                   "\\[(\\d{1,3})\\](?![a-z0-9])", 0, 1,
            PatternGuard::REJECT_YEAR);
    addRule("_##",                    "_(\\d{1,4})(?![a-z0-9])", 0, 1,
            PatternGuard::REJECT_YEAR | PatternGuard::REJECT_TECHNICAL_NEIGHBOR);

    if (!s_tableLogged) {
        LOG(QString("PatternLibrary: %1 episode rules loaded").arg(m_rules.size()));
        s_tableLogged = true;
    }
}

const PatternLibrary& PatternLibrary::instance()
{
    static const PatternLibrary library;
    return library;
}

void PatternLibrary::addRule(const QString& name, const QString& pattern, int seasonGroup, int episodeGroup,
                             int guards)
{
    EpisodePattern rule;
    rule.rank = m_rules.size();
    rule.name = name;
    rule.regex = QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
    rule.seasonGroup = seasonGroup;
    rule.episodeGroup = episodeGroup;
    rule.guards = guards;

    if (!rule.regex.isValid()) {
        LOG(QString("PatternLibrary: invalid regex for rule '%1': %2").arg(name, rule.regex.errorString()));
        return;
    }

    rule.regex.optimize();
    m_rules.append(rule);
}

int PatternLibrary::rankOf(const QString& name) const
{
    for (const EpisodePattern& rule : m_rules) {
        if (rule.name == name) {
            return rule.rank;
        }
    }
    return -1;
}

EpisodeIdentifier PatternLibrary::apply(const EpisodePattern& rule, const QString& name) const
{
    QRegularExpressionMatchIterator it = rule.regex.globalMatch(name);
    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();

        bool ok = false;
        int episode = match.captured(rule.episodeGroup).toInt(&ok);
        if (!ok || !EpisodeIdentifier::isEpisodeInRange(episode)) {
            continue;
        }

        int season = 1;
        if (rule.hasSeason()) {
            season = match.captured(rule.seasonGroup).toInt(&ok);
            if (!ok || !EpisodeIdentifier::isSeasonInRange(season)) {
                continue;
            }
        }

        if (!passesGuards(rule, name, match, episode)) {
            continue;
        }

        return EpisodeIdentifier(season, episode, rule.rank, rule.hasSeason());
    }

    return EpisodeIdentifier();
}

bool PatternLibrary::passesGuards(const EpisodePattern& rule, const QString& name,
                                  const QRegularExpressionMatch& match, int episode)
{
    if ((rule.guards & PatternGuard::REJECT_YEAR)
        && match.captured(rule.episodeGroup).length() == 4 && isYear(episode)) {
        return false;
    }

    if (rule.guards & PatternGuard::REJECT_TECHNICAL_NEIGHBOR) {
        const QString before = neighborToken(name, match.capturedStart(0), false);
        const QString after = neighborToken(name, match.capturedEnd(0), true);
        if (isTechnicalToken(before) || isTechnicalToken(after)) {
            return false;
        }
    }

    return true;
}

QString PatternLibrary::neighborToken(const QString& name, int position, bool forward)
{
    // Walk over plain separators; a bracket ends the neighbourhood
    static const QString separators = QStringLiteral(" ._-");
    const int step = forward ? 1 : -1;
    int i = forward ? position : position - 1;

    while (i >= 0 && i < name.size() && separators.contains(name.at(i))) {
        i += step;
    }

    QString token;
    while (i >= 0 && i < name.size() && name.at(i).isLetterOrNumber()) {
        if (forward) {
            token.append(name.at(i));
        } else {
            token.prepend(name.at(i));
        }
        i += step;
    }
    return token;
}

bool PatternLibrary::isTechnicalToken(const QString& token)
{
    if (token.isEmpty()) {
        return false;
    }

    static const QSet<QString> codecs = {
        "x264", "x265", "h264", "h265", "hevc", "avc", "av1", "vp9",
        "xvid", "divx", "10bit", "8bit", "hdr", "hdr10"
    };
    static const QRegularExpression resolution("^(?:\\d{3,4}[pi]|\\d{3,4}x\\d{3,4}|[248]k)$",
                                               QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression fourDigits("^\\d{4}$");

    const QString lower = token.toLower();
    if (codecs.contains(lower)) {
        return true;
    }
    if (resolution.match(lower).hasMatch()) {
        return true;
    }
    if (fourDigits.match(lower).hasMatch() && isYear(lower.toInt())) {
        return true;
    }
    return false;
}

bool PatternLibrary::hasFinalSeasonMarker(const QString& name)
{
    static const QRegularExpression marker("(?<![a-z])final[\\s._-]*season(?![a-z])",
                                           QRegularExpression::CaseInsensitiveOption);
    return marker.match(name).hasMatch();
}
