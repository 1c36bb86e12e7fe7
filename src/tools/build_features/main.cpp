/// @file main.cpp
/// @brief Feature table builder entry point.
///
/// Replays the configured match history chronologically, writes the
/// point-in-time feature table and optionally answers one live query
/// against the resulting snapshot.

#include <cstdlib>
#include <iostream>

#include "tfe/foundation/config_manager.hpp"
#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"
#include "tfe/replay/live_query_adapter.hpp"
#include "tfe/replay/replay_runner.hpp"

namespace {

void printQuery(const tfe::features::FeatureVector& fv) {
    std::cout << "query " << fv.p1Id.value() << " vs " << fv.p2Id.value() << " on "
              << tfe::rating::surfaceName(fv.surface) << " at "
              << tfe::foundation::formatTimestamp(fv.date) << "\n"
              << "  rank: " << fv.p1.rank << " / " << fv.p2.rank << "\n"
              << "  elo: " << fv.p1.elo << " / " << fv.p2.elo << " (diff " << fv.eloDiff << ")\n"
              << "  form_last_10: " << fv.p1.formLast10 << " / " << fv.p2.formLast10 << "\n"
              << "  matches_last_14_days: " << fv.p1.matchesLast14Days << " / "
              << fv.p2.matchesLast14Days << "\n"
              << "  h2h_wins: " << fv.p1.h2hWins << " / " << fv.p2.h2hWins << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (tfe::replay::hasVersionFlag(argc, argv)) {
        std::cout << tfe::replay::versionBanner() << "\n";
        return EXIT_SUCCESS;
    }

    auto configPath = tfe::replay::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/engine.yaml";
    }

    auto query = tfe::replay::parseQueryArg(argc, argv);
    if (!query) {
        std::cerr << query.error().message() << "\n";
        return EXIT_FAILURE;
    }

    tfe::foundation::ConfigManager config;
    auto loadResult = tfe::replay::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto logResult = tfe::replay::applyLoggingConfig(config);
    if (!logResult) {
        std::cerr << "Invalid logging config: " << logResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto engineCfg = tfe::replay::buildEngineConfig(config);
    if (!engineCfg) {
        std::cerr << "Invalid engine config: " << engineCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto outcome = tfe::replay::runFullReplay(engineCfg.value());
    if (!outcome) {
        std::cerr << "Replay failed [" << outcome.error().subsystem()
                  << "]: " << outcome.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto& stats = outcome.value().replay.stats;
    std::cout << "Replayed " << stats.matchesApplied << " matches over " << stats.dateGroups
              << " dates (" << stats.recordsDropped << " records dropped)\n";

    if (const auto& report = outcome.value().validation) {
        std::cout << "Elo cross-check: " << report->compared << " compared, "
                  << report->mismatched.size() << " mismatched, " << report->missing.size()
                  << " missing\n";
    }

    int status = EXIT_SUCCESS;
    if (query.value()) {
        const auto& q = *query.value();
        tfe::replay::LiveQueryAdapter live;
        auto published = live.publish(outcome.value().replay.snapshot);
        auto fv = published ? live.query(q.p1, q.p2, q.surface, q.date)
                            : tfe::foundation::EngineResult<tfe::features::FeatureVector>::err(
                                  published.error());
        if (fv) {
            printQuery(fv.value());
        } else {
            std::cerr << "Query failed: " << fv.error().message() << "\n";
            status = EXIT_FAILURE;
        }
    }

    auto flushed = tfe::foundation::EngineLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    return status;
}
