#pragma once

/// @file rating_types.hpp
/// @brief Core types shared by the rating and statistics trackers.
///
/// Defines court surfaces, the strongly-typed Match record, ranking rows
/// and the tracker configuration structs.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tfe/foundation/types.hpp"

namespace tfe::rating {

using foundation::PlayerId;
using foundation::Timestamp;

/// Court surface. Every value, Unknown included, is an independent
/// partition for ratings and form statistics.
enum class Surface : uint8_t {
    Hard = 0,
    Clay = 1,
    Grass = 2,
    Unknown = 3
};

inline constexpr std::size_t kSurfaceCount = 4;

inline constexpr std::array<Surface, kSurfaceCount> kAllSurfaces = {
    Surface::Hard, Surface::Clay, Surface::Grass, Surface::Unknown};

constexpr std::string_view surfaceName(Surface surface) {
    switch (surface) {
        case Surface::Hard:    return "Hard";
        case Surface::Clay:    return "Clay";
        case Surface::Grass:   return "Grass";
        case Surface::Unknown: return "Unknown";
    }
    return "Unknown";
}

/// Parse an explicit surface tag ("Clay", "grass", ...).
///
/// @return nullopt for an empty tag (no tag given); Surface::Unknown for a
///         non-empty tag that names no known surface.
[[nodiscard]] std::optional<Surface> parseSurfaceTag(std::string_view tag);

/// Derive the surface of a match.
///
/// An explicit tag wins. Otherwise the tournament name decides: a missing
/// name gives Unknown, a "(clay)"/"(grass)"/"(hard)" marker wins, then
/// grass and clay venue keywords, and anything else is Hard.
[[nodiscard]] Surface deriveSurface(std::optional<std::string_view> explicitTag,
                                    std::optional<std::string_view> tourneyName);

/// A validated match, built once at ingestion.
struct Match {
    std::string matchId;
    Timestamp date{};
    Surface surface = Surface::Hard;
    PlayerId winnerId;
    PlayerId loserId;
    int setsPlayed = 0;
    std::string tourneyName;

    /// Lower id of the pair.
    [[nodiscard]] PlayerId p1() const noexcept { return winnerId < loserId ? winnerId : loserId; }

    /// Higher id of the pair.
    [[nodiscard]] PlayerId p2() const noexcept { return winnerId < loserId ? loserId : winnerId; }

    /// 1 if p1 won, 0 otherwise.
    [[nodiscard]] int label() const noexcept { return winnerId == p1() ? 1 : 0; }
};

/// One published ranking entry.
struct RankingRow {
    Timestamp date{};
    PlayerId playerId;
    int rank = 0;
};

/// Elo parameters.
struct EloConfig {
    double kFactor = 32.0;            ///< Maximum rating change per match.
    double ratingDiffFactor = 400.0;  ///< D in 1 / (1 + 10^(diff / D)).
    double initialRating = 1500.0;    ///< Rating of an unseen (player, surface).
    std::size_t momentumWindow = 5;   ///< Pre-match ratings kept for momentum.
};

/// Form and fatigue window parameters.
struct FormConfig {
    std::size_t formWindow = 10;          ///< Matches in form_last_10.
    std::size_t rollingShortWindow = 20;  ///< Matches in rolling_win_perc_20.
    std::size_t rollingLongWindow = 50;   ///< Matches in rolling_win_perc_50.
    std::size_t opponentRankWindow = 10;  ///< Matches in avg_opponent_rank_last_10.
    int shortFatigueDays = 7;
    int longFatigueDays = 14;
    int64_t defaultRestDays = 30;         ///< Rest days reported before a first match.
};

/// Default rank for a player without a ranking row before the match date.
inline constexpr int kDefaultRank = 500;

} // namespace tfe::rating
