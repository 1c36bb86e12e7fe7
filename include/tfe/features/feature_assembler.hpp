#pragma once

/// @file feature_assembler.hpp
/// @brief Builds a FeatureVector from the current tracker state.

#include <string>

#include "tfe/features/feature_vector.hpp"
#include "tfe/features/player_registry.hpp"
#include "tfe/rating/elo_rating_tracker.hpp"
#include "tfe/rating/head_to_head_tracker.hpp"
#include "tfe/rating/player_form_tracker.hpp"
#include "tfe/rating/ranking_lookup.hpp"

namespace tfe::features {

/// Read-only view over the trackers that turns them into features.
///
/// The batch replay and the live query path both go through build(), so
/// identical tracker state always yields identical vectors. build() only
/// calls const query methods.
///
/// Usage:
/// @code
///   FeatureAssembler assembler(elo, form, h2h, rankings, players);
///   auto fv = assembler.build(p1, p2, Surface::Grass, date, "2019-540-101");
/// @endcode
class FeatureAssembler {
public:
    FeatureAssembler(const rating::EloRatingTracker& elo,
                     const rating::PlayerFormTracker& form,
                     const rating::HeadToHeadTracker& h2h,
                     const rating::RankingLookup& rankings,
                     const PlayerRegistry& players);

    /// Features of @p p1Id vs @p p2Id for a match on @p surface at @p date.
    /// Swapping the ids yields FeatureVector::mirrored().
    [[nodiscard]] FeatureVector build(PlayerId p1Id, PlayerId p2Id, Surface surface,
                                      Timestamp date, std::string matchId = {}) const;

private:
    [[nodiscard]] PlayerFeatures side(PlayerId self, PlayerId other, Surface surface,
                                      Timestamp date) const;

    const rating::EloRatingTracker& elo_;
    const rating::PlayerFormTracker& form_;
    const rating::HeadToHeadTracker& h2h_;
    const rating::RankingLookup& rankings_;
    const PlayerRegistry& players_;
};

} // namespace tfe::features
