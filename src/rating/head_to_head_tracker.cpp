/// @file head_to_head_tracker.cpp
/// @brief HeadToHeadTracker implementation.

#include "tfe/rating/head_to_head_tracker.hpp"

#include <string>

namespace tfe::rating {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

HeadToHeadRecord HeadToHeadTracker::orient(const Tally& tally, PlayerId a, PlayerId b) noexcept {
    if (a <= b) {
        return {tally.winsLow, tally.winsHigh};
    }
    return {tally.winsHigh, tally.winsLow};
}

void HeadToHeadTracker::countWin(Tally& tally, PlayerId winner, const PairKey& key) noexcept {
    if (winner == key.low) {
        ++tally.winsLow;
    } else {
        ++tally.winsHigh;
    }
}

HeadToHeadRecord HeadToHeadTracker::get(PlayerId a, PlayerId b) const {
    auto it = overall_.find(makeKey(a, b));
    if (it == overall_.end()) {
        return {};
    }
    return orient(it->second, a, b);
}

HeadToHeadRecord HeadToHeadTracker::getOnSurface(PlayerId a, PlayerId b, Surface surface) const {
    auto it = bySurface_.find(SurfaceKey{makeKey(a, b), surface});
    if (it == bySurface_.end()) {
        return {};
    }
    return orient(it->second, a, b);
}

EngineResult<void> HeadToHeadTracker::update(PlayerId winner, PlayerId loser,
                                             std::optional<Surface> surface) {
    if (winner == loser) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::SelfMatch,
            "player " + std::to_string(winner.value()) + " cannot play itself"));
    }

    auto key = makeKey(winner, loser);
    countWin(overall_[key], winner, key);
    if (surface) {
        countWin(bySurface_[SurfaceKey{key, *surface}], winner, key);
    }
    return EngineResult<void>::ok();
}

} // namespace tfe::rating
