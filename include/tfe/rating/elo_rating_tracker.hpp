#pragma once

/// @file elo_rating_tracker.hpp
/// @brief Per-surface Elo ratings with a short pre-match history for momentum.

#include <cstddef>
#include <deque>
#include <functional>
#include <unordered_map>

#include "tfe/foundation/engine_result.hpp"
#include "tfe/rating/rating_types.hpp"

namespace tfe::rating {

/// Elo rating store keyed by (player, surface).
///
/// Uses the logistic expected-score formula:
///   E(W) = 1 / (1 + 10^((R_L - R_W) / D))
///
/// and moves both ratings by K * (1 - E(W)). Surfaces never share a
/// rating. Reads never create entries.
///
/// Usage:
/// @code
///   EloRatingTracker elo;
///   auto updated = elo.update(PlayerId{1}, PlayerId{2}, Surface::Clay);
///   double r = elo.rating(PlayerId{1}, Surface::Clay); // 1516.0
/// @endcode
class EloRatingTracker {
public:
    explicit EloRatingTracker(EloConfig config = {});

    /// Current rating, or the initial rating for an unseen (player, surface).
    [[nodiscard]] double rating(PlayerId player, Surface surface) const;

    /// Current rating minus the oldest retained pre-match rating.
    /// Zero before the player's first match on @p surface.
    [[nodiscard]] double momentum(PlayerId player, Surface surface) const;

    /// Apply one decided match.
    ///
    /// @return SelfMatch if winner == loser, NonFiniteRating if the update
    ///         would produce NaN or infinity. On error nothing is written.
    [[nodiscard]] foundation::EngineResult<void> update(PlayerId winner, PlayerId loser,
                                                        Surface surface);

    /// Expected score of a player rated @p ratingA against @p ratingB.
    [[nodiscard]] double expectedScore(double ratingA, double ratingB) const;

    /// Number of (player, surface) entries created so far.
    [[nodiscard]] std::size_t entryCount() const noexcept { return entries_.size(); }

    [[nodiscard]] const EloConfig& config() const noexcept { return config_; }

private:
    struct Key {
        PlayerId player;
        Surface surface = Surface::Hard;

        bool operator==(const Key&) const = default;
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            return std::hash<int64_t>{}(key.player.value()) * kSurfaceCount +
                   static_cast<std::size_t>(key.surface);
        }
    };

    struct RatingEntry {
        double rating = 0.0;
        std::deque<double> history; ///< Pre-match ratings, oldest first.
    };

    RatingEntry& entryFor(PlayerId player, Surface surface);
    void pushHistory(RatingEntry& entry, double preMatch) const;

    EloConfig config_;
    std::unordered_map<Key, RatingEntry, KeyHash> entries_;
};

} // namespace tfe::rating
