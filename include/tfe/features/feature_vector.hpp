#pragma once

/// @file feature_vector.hpp
/// @brief Point-in-time features of one player pair before a match.

#include <cstdint>
#include <string>

#include "tfe/features/player_registry.hpp"
#include "tfe/rating/rating_types.hpp"

namespace tfe::features {

using rating::Surface;
using foundation::Timestamp;

/// Features of one side of the pair.
struct PlayerFeatures {
    int rank = 0;
    double elo = 0.0;
    double eloMomentum = 0.0;
    double winPerc = 0.0;
    double surfaceWinPerc = 0.0;
    double formLast10 = 0.0;
    double rollingWinPerc20 = 0.0;
    double rollingWinPerc50 = 0.0;
    int matchesLast7Days = 0;
    int matchesLast14Days = 0;
    int setsLast7Days = 0;
    int setsLast14Days = 0;
    int64_t restDays = 0;
    double avgOpponentRankLast10 = 0.0;
    uint32_t h2hWins = 0;        ///< Wins against the other side.
    uint32_t h2hSurfaceWins = 0; ///< Same, on this match's surface.
    Handedness hand = Handedness::Unknown;

    bool operator==(const PlayerFeatures&) const = default;
};

/// Symmetric feature vector. Every *Diff field is p1 minus p2.
struct FeatureVector {
    std::string matchId;
    PlayerId p1Id;
    PlayerId p2Id;
    Surface surface = Surface::Hard;
    Timestamp date{};

    PlayerFeatures p1;
    PlayerFeatures p2;

    int rankDiff = 0;
    double eloDiff = 0.0;
    double eloMomentumDiff = 0.0;
    int fatigueDiff7Days = 0;
    int fatigueDiff14Days = 0;
    int setsDiff7Days = 0;
    int setsDiff14Days = 0;
    int64_t restDiff = 0;

    bool operator==(const FeatureVector&) const = default;

    /// Same match seen from the other side: players swapped, diffs negated.
    [[nodiscard]] FeatureVector mirrored() const;
};

/// One row of the training table.
struct FeatureRow {
    FeatureVector features;
    int winner = 0; ///< 1 if p1 won.

    bool operator==(const FeatureRow&) const = default;
};

} // namespace tfe::features
