#pragma once

/// @file tracker_snapshot.hpp
/// @brief Complete tracker state at the end of a replay.

#include <cstddef>
#include <memory>
#include <optional>

#include "tfe/features/feature_assembler.hpp"
#include "tfe/features/player_registry.hpp"
#include "tfe/rating/elo_rating_tracker.hpp"
#include "tfe/rating/head_to_head_tracker.hpp"
#include "tfe/rating/player_form_tracker.hpp"
#include "tfe/rating/ranking_lookup.hpp"

namespace tfe::replay {

/// Tracker state plus the static lookups it was built against.
///
/// Published as `shared_ptr<const TrackerSnapshot>` and never mutated
/// afterwards; a later replay copies it instead.
struct TrackerSnapshot {
    rating::EloRatingTracker elo;
    rating::PlayerFormTracker form;
    rating::HeadToHeadTracker h2h;
    std::shared_ptr<const rating::RankingLookup> rankings;
    std::shared_ptr<const features::PlayerRegistry> players;

    /// Date of the latest match applied; nullopt for an empty replay.
    std::optional<foundation::Timestamp> watermark;
    std::size_t matchesApplied = 0;

    /// Assembler reading this snapshot. Must not outlive it.
    [[nodiscard]] features::FeatureAssembler assembler() const {
        return features::FeatureAssembler(elo, form, h2h, *rankings, *players);
    }
};

} // namespace tfe::replay
