/// @file feature_assembler.cpp
/// @brief FeatureAssembler implementation.

#include "tfe/features/feature_assembler.hpp"

#include <utility>

namespace tfe::features {

FeatureAssembler::FeatureAssembler(const rating::EloRatingTracker& elo,
                                   const rating::PlayerFormTracker& form,
                                   const rating::HeadToHeadTracker& h2h,
                                   const rating::RankingLookup& rankings,
                                   const PlayerRegistry& players)
    : elo_(elo), form_(form), h2h_(h2h), rankings_(rankings), players_(players) {}

PlayerFeatures FeatureAssembler::side(PlayerId self, PlayerId other, Surface surface,
                                      Timestamp date) const {
    const auto& cfg = form_.config();
    PlayerFeatures f;
    f.rank = rankings_.mostRecentRank(self, date);
    f.elo = elo_.rating(self, surface);
    f.eloMomentum = elo_.momentum(self, surface);
    f.winPerc = form_.winPerc(self);
    f.surfaceWinPerc = form_.surfaceWinPerc(self, surface);
    f.formLast10 = form_.formLastN(self, cfg.formWindow);
    f.rollingWinPerc20 = form_.rollingWinPerc(self, cfg.rollingShortWindow);
    f.rollingWinPerc50 = form_.rollingWinPerc(self, cfg.rollingLongWindow);
    f.matchesLast7Days = form_.matchesInWindow(self, date, cfg.shortFatigueDays);
    f.matchesLast14Days = form_.matchesInWindow(self, date, cfg.longFatigueDays);
    f.setsLast7Days = form_.setsInWindow(self, date, cfg.shortFatigueDays);
    f.setsLast14Days = form_.setsInWindow(self, date, cfg.longFatigueDays);
    f.restDays = form_.restDays(self, date);
    f.avgOpponentRankLast10 = form_.avgOpponentRank(
        self, cfg.opponentRankWindow, static_cast<double>(rankings_.defaultRank()));
    f.h2hWins = h2h_.get(self, other).winsOfA;
    f.h2hSurfaceWins = h2h_.getOnSurface(self, other, surface).winsOfA;
    f.hand = players_.handedness(self);
    return f;
}

FeatureVector FeatureAssembler::build(PlayerId p1Id, PlayerId p2Id, Surface surface,
                                      Timestamp date, std::string matchId) const {
    FeatureVector fv;
    fv.matchId = std::move(matchId);
    fv.p1Id = p1Id;
    fv.p2Id = p2Id;
    fv.surface = surface;
    fv.date = date;
    fv.p1 = side(p1Id, p2Id, surface, date);
    fv.p2 = side(p2Id, p1Id, surface, date);

    fv.rankDiff = fv.p1.rank - fv.p2.rank;
    fv.eloDiff = fv.p1.elo - fv.p2.elo;
    fv.eloMomentumDiff = fv.p1.eloMomentum - fv.p2.eloMomentum;
    fv.fatigueDiff7Days = fv.p1.matchesLast7Days - fv.p2.matchesLast7Days;
    fv.fatigueDiff14Days = fv.p1.matchesLast14Days - fv.p2.matchesLast14Days;
    fv.setsDiff7Days = fv.p1.setsLast7Days - fv.p2.setsLast7Days;
    fv.setsDiff14Days = fv.p1.setsLast14Days - fv.p2.setsLast14Days;
    fv.restDiff = fv.p1.restDays - fv.p2.restDays;
    return fv;
}

} // namespace tfe::features
