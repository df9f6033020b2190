#include "episodeidentifier.h"
#include <QRegularExpression>

EpisodeIdentifier::EpisodeIdentifier()
    : m_season(0)
    , m_episode(0)
    , m_sourcePatternRank(-1)
    , m_seasonExplicit(false)
{
}

EpisodeIdentifier::EpisodeIdentifier(int season, int episode, int sourcePatternRank, bool seasonExplicit)
    : m_season(season)
    , m_episode(episode)
    , m_sourcePatternRank(sourcePatternRank)
    , m_seasonExplicit(seasonExplicit)
{
}

bool EpisodeIdentifier::isValid() const
{
    return isSeasonInRange(m_season) && isEpisodeInRange(m_episode);
}

EpisodeIdentifier EpisodeIdentifier::withSeason(int season) const
{
    return EpisodeIdentifier(season, m_episode, m_sourcePatternRank, true);
}

QString EpisodeIdentifier::toString() const
{
    if (!isValid())
        return QString();

    return QString("S%1E%2")
        .arg(m_season, 2, 10, QChar('0'))
        .arg(m_episode, 2, 10, QChar('0'));
}

EpisodeIdentifier EpisodeIdentifier::fromString(const QString& str)
{
    static const QRegularExpression canonical("^S(\\d+)E(\\d+)$", QRegularExpression::CaseInsensitiveOption);
    QRegularExpressionMatch match = canonical.match(str.trimmed());
    if (!match.hasMatch())
        return EpisodeIdentifier();

    // toInt() drops the zero padding
    bool seasonOk = false;
    bool episodeOk = false;
    int season = match.captured(1).toInt(&seasonOk);
    int episode = match.captured(2).toInt(&episodeOk);
    if (!seasonOk || !episodeOk)
        return EpisodeIdentifier();

    EpisodeIdentifier id(season, episode);
    return id.isValid() ? id : EpisodeIdentifier();
}

bool EpisodeIdentifier::isSeasonInRange(int season)
{
    return season >= MIN_SEASON && season <= MAX_SEASON;
}

bool EpisodeIdentifier::isEpisodeInRange(int episode)
{
    return episode >= MIN_EPISODE && episode <= MAX_EPISODE;
}

bool EpisodeIdentifier::operator<(const EpisodeIdentifier& other) const
{
    if (m_season != other.m_season)
        return m_season < other.m_season;
    return m_episode < other.m_episode;
}

bool EpisodeIdentifier::operator==(const EpisodeIdentifier& other) const
{
    return m_season == other.m_season && m_episode == other.m_episode;
}

bool EpisodeIdentifier::operator!=(const EpisodeIdentifier& other) const
{
    return !(*this == other);
}
