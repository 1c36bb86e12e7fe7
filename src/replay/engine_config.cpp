/// @file engine_config.cpp
/// @brief buildEngineConfig implementation.

#include "tfe/replay/engine_config.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace tfe::replay {

using foundation::ConfigManager;
using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;

namespace {

/// Read @p key into @p out if present. A present key of the wrong type is
/// an error; an absent key leaves @p out unchanged.
template <typename T>
EngineResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return EngineResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return EngineResult<void>::err(value.error());
    }
    out = value.value();
    return EngineResult<void>::ok();
}

EngineResult<void> invalid(std::string_view key, const std::string& why) {
    return EngineResult<void>::err(EngineError(
        ErrorCode::ConfigValueInvalid, "invalid value for " + std::string(key) + ": " + why));
}

EngineResult<void> readWindowPair(const ConfigManager& config, std::string_view key,
                                  int& first, int& second) {
    std::vector<int> pair{first, second};
    auto read = readOptional(config, key, pair);
    if (!read) {
        return read;
    }
    if (pair.size() != 2) {
        return invalid(key, "expected two values");
    }
    if (pair[0] <= 0 || pair[1] <= 0) {
        return invalid(key, "windows must be positive");
    }
    first = pair[0];
    second = pair[1];
    return EngineResult<void>::ok();
}

EngineResult<void> readPath(const ConfigManager& config, std::string_view key,
                            std::filesystem::path& out) {
    std::string text = out.string();
    auto read = readOptional(config, key, text);
    if (read) {
        out = text;
    }
    return read;
}

EngineResult<EngineConfig> fail(const EngineResult<void>& result) {
    return EngineResult<EngineConfig>::err(result.error());
}

} // namespace

EngineResult<EngineConfig> buildEngineConfig(const ConfigManager& config) {
    EngineConfig cfg;

    // -- Elo -----------------------------------------------------------------
    if (auto r = readOptional(config, "elo.k_factor", cfg.elo.kFactor); !r) return fail(r);
    if (!std::isfinite(cfg.elo.kFactor) || cfg.elo.kFactor <= 0.0) {
        return fail(invalid("elo.k_factor", "must be a positive number"));
    }
    if (auto r = readOptional(config, "elo.rating_diff_factor", cfg.elo.ratingDiffFactor); !r) {
        return fail(r);
    }
    if (!std::isfinite(cfg.elo.ratingDiffFactor) || cfg.elo.ratingDiffFactor <= 0.0) {
        return fail(invalid("elo.rating_diff_factor", "must be a positive number"));
    }
    if (auto r = readOptional(config, "elo.initial_rating", cfg.elo.initialRating); !r) {
        return fail(r);
    }
    if (!std::isfinite(cfg.elo.initialRating)) {
        return fail(invalid("elo.initial_rating", "must be finite"));
    }
    int momentumWindow = static_cast<int>(cfg.elo.momentumWindow);
    if (auto r = readOptional(config, "elo.momentum_window", momentumWindow); !r) return fail(r);
    if (momentumWindow < 0) {
        return fail(invalid("elo.momentum_window", "must not be negative"));
    }
    cfg.elo.momentumWindow = static_cast<std::size_t>(momentumWindow);

    // -- Ranking -------------------------------------------------------------
    if (auto r = readOptional(config, "ranking.default_rank", cfg.defaultRank); !r) return fail(r);
    if (cfg.defaultRank <= 0) {
        return fail(invalid("ranking.default_rank", "must be positive"));
    }

    // -- Form ----------------------------------------------------------------
    int formWindow = static_cast<int>(cfg.form.formWindow);
    if (auto r = readOptional(config, "form.form_window", formWindow); !r) return fail(r);
    if (formWindow <= 0) {
        return fail(invalid("form.form_window", "must be positive"));
    }
    cfg.form.formWindow = static_cast<std::size_t>(formWindow);

    int opponentWindow = static_cast<int>(cfg.form.opponentRankWindow);
    if (auto r = readOptional(config, "form.opponent_rank_window", opponentWindow); !r) {
        return fail(r);
    }
    if (opponentWindow <= 0) {
        return fail(invalid("form.opponent_rank_window", "must be positive"));
    }
    cfg.form.opponentRankWindow = static_cast<std::size_t>(opponentWindow);

    int rollingShort = static_cast<int>(cfg.form.rollingShortWindow);
    int rollingLong = static_cast<int>(cfg.form.rollingLongWindow);
    if (auto r = readWindowPair(config, "form.rolling_windows", rollingShort, rollingLong); !r) {
        return fail(r);
    }
    cfg.form.rollingShortWindow = static_cast<std::size_t>(rollingShort);
    cfg.form.rollingLongWindow = static_cast<std::size_t>(rollingLong);

    if (auto r = readWindowPair(config, "form.fatigue_windows_days", cfg.form.shortFatigueDays,
                                cfg.form.longFatigueDays);
        !r) {
        return fail(r);
    }

    if (auto r = readOptional(config, "form.default_rest_days", cfg.form.defaultRestDays); !r) {
        return fail(r);
    }
    if (cfg.form.defaultRestDays < 0) {
        return fail(invalid("form.default_rest_days", "must not be negative"));
    }

    // -- Paths ---------------------------------------------------------------
    if (auto r = readPath(config, "paths.matches", cfg.paths.matches); !r) return fail(r);
    if (auto r = readPath(config, "paths.rankings", cfg.paths.rankings); !r) return fail(r);
    if (auto r = readPath(config, "paths.players", cfg.paths.players); !r) return fail(r);
    if (auto r = readPath(config, "paths.feature_table", cfg.paths.featureTable); !r) {
        return fail(r);
    }
    if (auto r = readPath(config, "paths.elo_reference", cfg.paths.eloReference); !r) {
        return fail(r);
    }

    return EngineResult<EngineConfig>::ok(std::move(cfg));
}

} // namespace tfe::replay
