#include "matcher.h"
#include "identifierextractor.h"
#include "patternlibrary.h"
#include "titletokens.h"
#include "logger.h"
#include <QHash>
#include <QSet>
#include <QVector>
#include <algorithm>

Matcher::Matcher(const MatcherOptions& options, IdentifierExtractor *extractor)
    : m_options(options)
    , m_extractor(extractor ? extractor : &IdentifierExtractor::shared())
{
}

MatchResult Matcher::match(MediaFileList videos, MediaFileList subtitles) const
{
    std::sort(videos.begin(), videos.end(), MediaFile::lessByFileName);
    std::sort(subtitles.begin(), subtitles.end(), MediaFile::lessByFileName);

    MatchResult result = matchEpisodes(videos, subtitles);

    // Movie mode only when a single video and a single subtitle could not be paired by episode
    if (videos.size() == 1 && subtitles.size() == 1 && result.matched.isEmpty()) {
        return matchMovie(videos.first(), subtitles.first());
    }
    return result;
}

MatchResult Matcher::matchMovie(const MediaFile& video, const MediaFile& subtitle) const
{
    MatchResult result;

    const QSet<QString> videoTokens = TitleTokens::titleTokens(video.fileName());
    const QSet<QString> subtitleTokens = TitleTokens::titleTokens(subtitle.fileName());
    const double ratio = TitleTokens::overlapRatio(videoTokens, subtitleTokens);

    // The same release year plus one shared word is as good as the ratio
    const QString videoYear = TitleTokens::releaseYear(video.fileName());
    const bool sameYear = !videoYear.isEmpty() && videoYear == TitleTokens::releaseYear(subtitle.fileName())
                          && TitleTokens::overlaps(videoTokens, subtitleTokens);
    const bool confident = ratio >= TitleTokens::MOVIE_MATCH_THRESHOLD || sameYear;

    if (!confident && m_options.strictMovieMode) {
        LOG(QString("Matcher: movie mode rejected %1 / %2 (similarity %3, strict mode)")
                .arg(video.fileName(), subtitle.fileName()).arg(ratio, 0, 'f', 2));
        result.unmatchedVideos.append({video, UnmatchedReason::BelowThreshold});
        result.unmatchedSubtitles.append({subtitle, UnmatchedReason::BelowThreshold});
        return result;
    }

    MatchedPair pair;
    pair.video = video;
    pair.subtitle = subtitle;
    pair.basis = MatchBasis::MovieTitle;
    pair.similarity = ratio;
    pair.lowConfidence = !confident;
    result.matched.append(pair);

    if (!confident) {
        LOG(QString("Matcher: low-confidence movie match %1 / %2 (similarity %3)")
                .arg(video.fileName(), subtitle.fileName()).arg(ratio, 0, 'f', 2));
    }
    return result;
}

MatchResult Matcher::matchEpisodes(const MediaFileList& videos, const MediaFileList& subtitles) const
{
    MatchResult result;

    // Per-video state, indexed like the sorted input
    QVector<EpisodeIdentifier> videoIds(videos.size());
    QVector<bool> videoPaired(videos.size(), false);
    QVector<bool> videoLostCollision(videos.size(), false);
    QHash<EpisodeIdentifier, int> videoById;

    for (int i = 0; i < videos.size(); ++i) {
        videoIds[i] = m_extractor->extract(videos[i].fileName());
        if (!videoIds[i].isValid()) {
            continue;
        }

        auto existing = videoById.constFind(videoIds[i]);
        if (existing != videoById.constEnd()) {
            MatchConflict conflict;
            conflict.kind = MatchConflict::Kind::VideoCollision;
            conflict.identifier = videoIds[i];
            conflict.winner = videos[existing.value()].path();
            conflict.loser = videos[i].path();
            result.conflicts.append(conflict);
            videoLostCollision[i] = true;
            LOG(QString("Matcher: video collision on %1, keeping %2 over %3")
                    .arg(videoIds[i].toString(), videos[existing.value()].fileName(), videos[i].fileName()));
            continue;
        }
        videoById.insert(videoIds[i], i);
    }

    // One slot per subtitle keeps the output in subtitle order across both passes
    QVector<EpisodeIdentifier> subtitleIds(subtitles.size());
    QVector<int> pairedVideo(subtitles.size(), -1);
    QVector<MatchBasis> pairBasis(subtitles.size(), MatchBasis::Episode);
    QVector<EpisodeIdentifier> pairIdentifier(subtitles.size());
    QVector<bool> subtitleLostConflict(subtitles.size(), false);

    for (int s = 0; s < subtitles.size(); ++s) {
        subtitleIds[s] = m_extractor->extract(subtitles[s].fileName());
        if (!subtitleIds[s].isValid()) {
            continue;
        }

        auto hit = videoById.constFind(subtitleIds[s]);
        if (hit == videoById.constEnd()) {
            continue;
        }

        const int v = hit.value();
        if (videoPaired[v]) {
            int winner = pairedVideo.indexOf(v);
            MatchConflict conflict;
            conflict.kind = MatchConflict::Kind::SubtitleConflict;
            conflict.identifier = subtitleIds[s];
            conflict.winner = winner >= 0 ? subtitles[winner].path() : QString();
            conflict.loser = subtitles[s].path();
            result.conflicts.append(conflict);
            subtitleLostConflict[s] = true;
            LOG(QString("Matcher: subtitle conflict on %1, %2 left unmatched")
                    .arg(subtitleIds[s].toString(), subtitles[s].fileName()));
            continue;
        }

        videoPaired[v] = true;
        pairedVideo[s] = v;
        pairIdentifier[s] = subtitleIds[s];
    }

    // Contextual final-season pass: one side names the season, the other defaulted to 1
    for (int s = 0; s < subtitles.size(); ++s) {
        if (pairedVideo[s] >= 0 || subtitleLostConflict[s] || !subtitleIds[s].isValid()) {
            continue;
        }

        const EpisodeIdentifier& subId = subtitleIds[s];
        QSet<QString> subTokens;
        bool subTokensReady = false;
        int candidate = -1;
        int candidateCount = 0;

        for (int v = 0; v < videos.size(); ++v) {
            if (videoPaired[v] || videoLostCollision[v] || !videoIds[v].isValid()) {
                continue;
            }
            const EpisodeIdentifier& vidId = videoIds[v];
            if (vidId.episode() != subId.episode()
                || vidId.isSeasonExplicit() == subId.isSeasonExplicit()) {
                continue;
            }
            // The defaulted side must still read season 1
            const EpisodeIdentifier& defaulted = vidId.isSeasonExplicit() ? subId : vidId;
            if (defaulted.season() != 1) {
                continue;
            }

            if (!subTokensReady) {
                subTokens = TitleTokens::titleTokens(subtitles[s].fileName());
                subTokensReady = true;
            }
            if (!TitleTokens::overlaps(subTokens, TitleTokens::titleTokens(videos[v].fileName()))) {
                continue;
            }

            candidate = v;
            ++candidateCount;
        }

        if (candidateCount != 1) {
            if (candidateCount > 1) {
                LOG(QString("Matcher: %1 has %2 final-season candidates, leaving it unmatched")
                        .arg(subtitles[s].fileName()).arg(candidateCount));
            }
            continue;
        }

        const EpisodeIdentifier adopted = videoIds[candidate].isSeasonExplicit() ? videoIds[candidate] : subId;

        const bool marker = PatternLibrary::hasFinalSeasonMarker(subtitles[s].fileName())
                            || PatternLibrary::hasFinalSeasonMarker(videos[candidate].fileName());
        LOG(QString("Matcher: contextual season %1 for %2 / %3%4")
                .arg(adopted.toString(), videos[candidate].fileName(), subtitles[s].fileName(),
                     marker ? QString(" (FINAL SEASON marker)") : QString()));

        videoPaired[candidate] = true;
        pairedVideo[s] = candidate;
        pairBasis[s] = MatchBasis::ContextualFinalSeason;
        pairIdentifier[s] = adopted;
    }

    for (int s = 0; s < subtitles.size(); ++s) {
        if (pairedVideo[s] >= 0) {
            MatchedPair pair;
            pair.video = videos[pairedVideo[s]];
            pair.subtitle = subtitles[s];
            pair.basis = pairBasis[s];
            pair.identifier = pairIdentifier[s];
            pair.similarity = 1.0;
            result.matched.append(pair);
            continue;
        }

        UnmatchedReason reason = UnmatchedReason::NoCounterpart;
        if (!subtitleIds[s].isValid()) {
            reason = UnmatchedReason::Unidentified;
        } else if (subtitleLostConflict[s]) {
            reason = UnmatchedReason::Conflict;
        }
        result.unmatchedSubtitles.append({subtitles[s], reason});
    }

    for (int v = 0; v < videos.size(); ++v) {
        if (videoPaired[v]) {
            continue;
        }
        UnmatchedReason reason = UnmatchedReason::NoCounterpart;
        if (!videoIds[v].isValid()) {
            reason = UnmatchedReason::Unidentified;
        } else if (videoLostCollision[v]) {
            reason = UnmatchedReason::Conflict;
        }
        result.unmatchedVideos.append({videos[v], reason});
    }

    LOG(QString("Matcher: %1 pairs, %2 unmatched videos, %3 unmatched subtitles, %4 conflicts")
            .arg(result.matched.size()).arg(result.unmatchedVideos.size())
            .arg(result.unmatchedSubtitles.size()).arg(result.conflicts.size()));
    return result;
}

QString Matcher::basisName(MatchBasis basis)
{
    switch (basis) {
        case MatchBasis::Episode: return "episode";
        case MatchBasis::MovieTitle: return "movie-title";
        case MatchBasis::ContextualFinalSeason: return "contextual-final-season";
    }
    return QString();
}

QString Matcher::reasonName(UnmatchedReason reason)
{
    switch (reason) {
        case UnmatchedReason::Unidentified: return "unidentified";
        case UnmatchedReason::NoCounterpart: return "no-counterpart";
        case UnmatchedReason::Conflict: return "conflict";
        case UnmatchedReason::BelowThreshold: return "below-threshold";
    }
    return QString();
}

QString Matcher::conflictKindName(MatchConflict::Kind kind)
{
    switch (kind) {
        case MatchConflict::Kind::VideoCollision: return "video-collision";
        case MatchConflict::Kind::SubtitleConflict: return "subtitle-conflict";
    }
    return QString();
}
