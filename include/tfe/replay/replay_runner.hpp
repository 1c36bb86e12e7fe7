#pragma once

/// @file replay_runner.hpp
/// @brief Shared utilities for the feature-building entry point.
///
/// Provides CLI argument parsing, configuration loading and the full
/// load-replay-persist pipeline.

#include <filesystem>
#include <optional>
#include <string>

#include "tfe/foundation/config_manager.hpp"
#include "tfe/foundation/engine_result.hpp"
#include "tfe/persistence/elo_table_validator.hpp"
#include "tfe/replay/chronological_orchestrator.hpp"
#include "tfe/replay/engine_config.hpp"

namespace tfe::replay {

/// A live query given on the command line.
struct QueryArgs {
    foundation::PlayerId p1;
    foundation::PlayerId p2;
    rating::Surface surface = rating::Surface::Unknown;
    foundation::Timestamp date{};
};

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// True if `--version` appears anywhere in the arguments.
[[nodiscard]] bool hasVersionFlag(int argc, char* argv[]);

/// One-line description of the engine and its feature table layout,
/// e.g. `tfe_build_features 0.1.0 (feature schema 1, 48 columns)`.
[[nodiscard]] std::string versionBanner();

/// Parse `--query <p1>,<p2>,<surface>,<date>` from command-line arguments.
///
/// @return nullopt if absent; InvalidArgument if present but malformed.
[[nodiscard]] foundation::EngineResult<std::optional<QueryArgs>> parseQueryArg(int argc,
                                                                              char* argv[]);

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. TFE_CONFIG_PATH environment variable (if set)
///   2. @p defaultPath parameter
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::EngineResult<void> loadConfig(foundation::ConfigManager& config,
                                                        const std::filesystem::path& defaultPath);

/// Apply `logging.level` to every category, then any
/// `logging.categories.<Category>` override.
///
/// @return ConfigValueInvalid for an unknown level name.
[[nodiscard]] foundation::EngineResult<void> applyLoggingConfig(
    const foundation::ConfigManager& config);

/// Result of runFullReplay().
struct RunOutcome {
    ReplayResult replay;
    std::optional<persistence::ValidationReport> validation; ///< Set when an Elo reference is configured.
};

/// Load the configured tables, replay them chronologically and write the
/// feature table (when `paths.feature_table` is set). If the replay fails
/// nothing is written.
[[nodiscard]] foundation::EngineResult<RunOutcome> runFullReplay(const EngineConfig& config);

} // namespace tfe::replay
