/// @file elo_rating_tracker.cpp
/// @brief EloRatingTracker implementation.

#include "tfe/rating/elo_rating_tracker.hpp"

#include <cmath>
#include <string>

namespace tfe::rating {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

EloRatingTracker::EloRatingTracker(EloConfig config) : config_(config) {}

double EloRatingTracker::rating(PlayerId player, Surface surface) const {
    auto it = entries_.find(Key{player, surface});
    return it != entries_.end() ? it->second.rating : config_.initialRating;
}

double EloRatingTracker::momentum(PlayerId player, Surface surface) const {
    auto it = entries_.find(Key{player, surface});
    if (it == entries_.end() || it->second.history.empty()) {
        return 0.0;
    }
    return it->second.rating - it->second.history.front();
}

double EloRatingTracker::expectedScore(double ratingA, double ratingB) const {
    return 1.0 / (1.0 + std::pow(10.0, (ratingB - ratingA) / config_.ratingDiffFactor));
}

EngineResult<void> EloRatingTracker::update(PlayerId winner, PlayerId loser, Surface surface) {
    if (winner == loser) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::SelfMatch,
            "player " + std::to_string(winner.value()) + " cannot play itself"));
    }

    double winnerBefore = rating(winner, surface);
    double loserBefore = rating(loser, surface);
    double delta = config_.kFactor * (1.0 - expectedScore(winnerBefore, loserBefore));
    double winnerAfter = winnerBefore + delta;
    double loserAfter = loserBefore - delta;

    if (!std::isfinite(winnerAfter) || !std::isfinite(loserAfter)) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::NonFiniteRating,
            "non-finite Elo update for players " + std::to_string(winner.value()) + " and " +
                std::to_string(loser.value())));
    }

    auto& winnerEntry = entryFor(winner, surface);
    pushHistory(winnerEntry, winnerBefore);
    winnerEntry.rating = winnerAfter;

    auto& loserEntry = entryFor(loser, surface);
    pushHistory(loserEntry, loserBefore);
    loserEntry.rating = loserAfter;

    return EngineResult<void>::ok();
}

EloRatingTracker::RatingEntry& EloRatingTracker::entryFor(PlayerId player, Surface surface) {
    auto [it, inserted] = entries_.try_emplace(Key{player, surface});
    if (inserted) {
        it->second.rating = config_.initialRating;
    }
    return it->second;
}

void EloRatingTracker::pushHistory(RatingEntry& entry, double preMatch) const {
    if (config_.momentumWindow == 0) {
        return;
    }
    entry.history.push_back(preMatch);
    while (entry.history.size() > config_.momentumWindow) {
        entry.history.pop_front();
    }
}

} // namespace tfe::rating
