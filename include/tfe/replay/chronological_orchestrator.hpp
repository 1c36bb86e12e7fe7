#pragma once

/// @file chronological_orchestrator.hpp
/// @brief Lookahead-free chronological replay of the match stream.
///
/// For every match, in date order: assemble features from the current
/// tracker state, emit the labelled row, then update the trackers. Updates
/// of matches sharing a date are held back until the stream moves past
/// that date, so every match sees only strictly earlier matches.

#include <cstddef>
#include <memory>
#include <vector>

#include "tfe/features/feature_vector.hpp"
#include "tfe/features/player_registry.hpp"
#include "tfe/foundation/engine_result.hpp"
#include "tfe/ingest/match_stream.hpp"
#include "tfe/rating/ranking_lookup.hpp"
#include "tfe/replay/engine_config.hpp"
#include "tfe/replay/tracker_snapshot.hpp"

namespace tfe::replay {

struct ReplayStats {
    std::size_t rowsEmitted = 0;
    std::size_t matchesApplied = 0;
    std::size_t dateGroups = 0;     ///< Distinct match dates processed.
    std::size_t recordsDropped = 0; ///< Malformed records removed before the pass.
};

struct ReplayResult {
    std::vector<features::FeatureRow> rows; ///< Chronological order.
    std::shared_ptr<const TrackerSnapshot> snapshot;
    std::vector<ingest::DroppedRecord> dropped;
    ReplayStats stats;
};

/// Drives a full or incremental replay. Each call works on private
/// trackers, so independent replays may run concurrently on one instance.
///
/// Usage:
/// @code
///   ChronologicalOrchestrator orchestrator(config, rankings, players);
///   auto result = orchestrator.replayRecords(records);
///   if (!result) { ... }  // whole run aborted; nothing to persist
///   writer.write(path, result.value().rows);
///   live.publish(result.value().snapshot);
/// @endcode
class ChronologicalOrchestrator {
public:
    /// Null lookups are replaced by empty ones.
    ChronologicalOrchestrator(EngineConfig config,
                              std::shared_ptr<const rating::RankingLookup> rankings,
                              std::shared_ptr<const features::PlayerRegistry> players);

    /// Replay validated matches from empty trackers.
    ///
    /// @return OutOfOrderMatch if a date goes backwards; any tracker error
    ///         (NonFiniteRating, SelfMatch) aborts the run.
    [[nodiscard]] foundation::EngineResult<ReplayResult> replay(
        const std::vector<rating::Match>& matches) const;

    /// Validate, order and replay raw records. Malformed records are
    /// dropped and reported in ReplayResult::dropped.
    [[nodiscard]] foundation::EngineResult<ReplayResult> replayRecords(
        const std::vector<ingest::MatchRecord>& records) const;

    /// Continue from @p base with newer matches. @p base is copied, never
    /// modified.
    ///
    /// @return OutOfOrderMatch if any match is dated at or before the
    ///         snapshot's watermark.
    [[nodiscard]] foundation::EngineResult<ReplayResult> extend(
        const TrackerSnapshot& base, const std::vector<rating::Match>& matches) const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::shared_ptr<TrackerSnapshot> emptySnapshot() const;

    [[nodiscard]] foundation::EngineResult<ReplayResult> run(
        std::shared_ptr<TrackerSnapshot> state, const std::vector<rating::Match>& matches) const;

    EngineConfig config_;
    std::shared_ptr<const rating::RankingLookup> rankings_;
    std::shared_ptr<const features::PlayerRegistry> players_;
};

} // namespace tfe::replay
