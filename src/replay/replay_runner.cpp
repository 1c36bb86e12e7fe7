/// @file replay_runner.cpp
/// @brief Replay runner utilities implementation.

#include "tfe/replay/replay_runner.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tfe/features/player_registry.hpp"
#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"
#include "tfe/ingest/csv_source.hpp"
#include "tfe/persistence/feature_table_writer.hpp"
#include "tfe/rating/ranking_lookup.hpp"
#include "tfe/version.hpp"

namespace tfe::replay {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

bool hasVersionFlag(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--version") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return true;
        }
    }
    return false;
}

std::string versionBanner() {
    return std::string("tfe_build_features ") + Version::string + " (feature schema " +
           std::to_string(Version::featureSchema) + ", " +
           std::to_string(persistence::FeatureTableWriter::columnCount()) + " columns)";
}

EngineResult<std::optional<QueryArgs>> parseQueryArg(int argc, char* argv[]) {
    using Out = EngineResult<std::optional<QueryArgs>>;

    std::string_view value;
    bool found = false;
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--query") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            if (i + 1 >= argc) {
                return Out::err(EngineError(ErrorCode::InvalidArgument, "--query needs a value"));
            }
            value = argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            found = true;
            break;
        }
    }
    if (!found) {
        return Out::ok(std::nullopt);
    }

    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto comma = value.find(',', start);
        parts.push_back(value.substr(start, comma == std::string_view::npos ? value.npos
                                                                           : comma - start));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    if (parts.size() != 4) {
        return Out::err(EngineError(ErrorCode::InvalidArgument,
                                    "--query expects <p1>,<p2>,<surface>,<date>"));
    }

    auto p1 = ingest::MatchStream::parsePlayerId(parts[0]);
    auto p2 = ingest::MatchStream::parsePlayerId(parts[1]);
    auto surface = rating::parseSurfaceTag(parts[2]);
    auto date = foundation::parseTimestamp(parts[3]);
    if (!p1 || !p2 || !surface || !date) {
        return Out::err(EngineError(ErrorCode::InvalidArgument,
                                    "malformed --query value: " + std::string(value)));
    }

    return Out::ok(QueryArgs{p1.value(), p2.value(), *surface, date.value()});
}

// -- Configuration -----------------------------------------------------------

EngineResult<void> loadConfig(foundation::ConfigManager& config,
                              const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("TFE_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

EngineResult<void> applyLoggingConfig(const foundation::ConfigManager& config) {
    auto& logger = foundation::EngineLogger::instance();

    if (auto level = config.get<std::string>("logging.level")) {
        auto parsed = foundation::parseLogLevel(level.value());
        if (!parsed) {
            return EngineResult<void>::err(EngineError(
                ErrorCode::ConfigValueInvalid, "unknown log level: " + level.value()));
        }
        for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
            logger.setCategoryLevel(static_cast<LogCategory>(i), *parsed);
        }
    }

    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        auto key = "logging.categories." + std::string(foundation::logCategoryName(cat));
        auto level = config.get<std::string>(key);
        if (!level) {
            continue;
        }
        auto parsed = foundation::parseLogLevel(level.value());
        if (!parsed) {
            return EngineResult<void>::err(EngineError(
                ErrorCode::ConfigValueInvalid, "unknown log level for " + key + ": " + level.value()));
        }
        logger.setCategoryLevel(cat, *parsed);
    }
    return EngineResult<void>::ok();
}

// -- Full pipeline -----------------------------------------------------------

EngineResult<RunOutcome> runFullReplay(const EngineConfig& config) {
    using Out = EngineResult<RunOutcome>;

    if (config.paths.matches.empty()) {
        return Out::err(EngineError(ErrorCode::ConfigKeyNotFound, "paths.matches is not set"));
    }

    std::vector<rating::RankingRow> rankingRows;
    if (!config.paths.rankings.empty()) {
        auto loaded = ingest::loadRankingRows(config.paths.rankings);
        if (!loaded) {
            return Out::err(loaded.error());
        }
        rankingRows = std::move(loaded.value().rows);
    } else {
        TFE_LOG_WARN(LogCategory::Ranking, "No ranking history configured; every rank defaults");
    }
    auto rankings = std::make_shared<const rating::RankingLookup>(rankingRows, config.defaultRank);

    std::vector<features::PlayerAttributes> attributes;
    if (!config.paths.players.empty()) {
        auto loaded = ingest::loadPlayerAttributes(config.paths.players);
        if (!loaded) {
            return Out::err(loaded.error());
        }
        attributes = std::move(loaded.value());
    }
    auto players = std::make_shared<const features::PlayerRegistry>(attributes);

    auto records = ingest::loadMatchRecords(config.paths.matches);
    if (!records) {
        return Out::err(records.error());
    }

    ChronologicalOrchestrator orchestrator(config, rankings, players);
    auto replayed = orchestrator.replayRecords(records.value());
    if (!replayed) {
        return Out::err(replayed.error());
    }

    RunOutcome outcome;
    outcome.replay = std::move(replayed.value());

    if (!config.paths.featureTable.empty()) {
        auto written =
            persistence::FeatureTableWriter::write(config.paths.featureTable, outcome.replay.rows);
        if (!written) {
            return Out::err(written.error());
        }
    }

    if (!config.paths.eloReference.empty()) {
        auto reference = persistence::loadEloTable(config.paths.eloReference);
        if (!reference) {
            return Out::err(reference.error());
        }
        outcome.validation =
            persistence::EloTableValidator().validate(outcome.replay.rows, reference.value());
    }

    return Out::ok(std::move(outcome));
}

} // namespace tfe::replay
