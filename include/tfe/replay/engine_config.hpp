#pragma once

/// @file engine_config.hpp
/// @brief Engine parameters assembled from the YAML configuration.

#include <filesystem>

#include "tfe/foundation/config_manager.hpp"
#include "tfe/foundation/engine_result.hpp"
#include "tfe/rating/rating_types.hpp"

namespace tfe::replay {

/// Input and output locations (`paths.*`).
struct PathConfig {
    std::filesystem::path matches;
    std::filesystem::path rankings;
    std::filesystem::path players;      ///< Optional; empty means no attributes.
    std::filesystem::path featureTable;
    std::filesystem::path eloReference; ///< Optional external Elo table to cross-check.
};

/// Everything a replay needs besides its input data.
struct EngineConfig {
    rating::EloConfig elo;
    rating::FormConfig form;
    int defaultRank = rating::kDefaultRank;
    PathConfig paths;
};

/// Build an EngineConfig from flattened config keys.
///
/// Missing keys keep their defaults. Recognized keys:
///   - elo.k_factor, elo.rating_diff_factor, elo.initial_rating,
///     elo.momentum_window
///   - ranking.default_rank
///   - form.form_window, form.rolling_windows ([short, long]),
///     form.fatigue_windows_days ([short, long]),
///     form.opponent_rank_window, form.default_rest_days
///   - paths.matches, paths.rankings, paths.players, paths.feature_table,
///     paths.elo_reference
///
/// @return ConfigTypeMismatch for a value of the wrong type,
///         ConfigValueInvalid for an out-of-range value.
[[nodiscard]] foundation::EngineResult<EngineConfig> buildEngineConfig(
    const foundation::ConfigManager& config);

} // namespace tfe::replay
