/// @file chronological_orchestrator.cpp
/// @brief ChronologicalOrchestrator implementation.

#include "tfe/replay/chronological_orchestrator.hpp"

#include <string>
#include <utility>

#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"

namespace tfe::replay {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::Timestamp;

namespace {

EngineResult<ReplayResult> abortRun(const rating::Match& match, const EngineError& cause) {
    auto& logger = foundation::EngineLogger::instance();
    if (logger.isEnabled(LogLevel::Error, LogCategory::Replay)) {
        LogContext ctx;
        ctx.matchId = match.matchId;
        ctx.extra["date"] = foundation::formatTimestamp(match.date);
        ctx.extra["error"] = std::string(cause.message());
        logger.logWithContext(LogLevel::Error, LogCategory::Replay, "Replay aborted", ctx);
    }
    return EngineResult<ReplayResult>::err(
        EngineError(cause.code(), std::string(cause.message()), match.matchId));
}

EngineResult<ReplayResult> outOfOrder(const rating::Match& match, Timestamp reference) {
    return abortRun(match, EngineError(ErrorCode::OutOfOrderMatch,
                                       "match " + match.matchId + " dated " +
                                           foundation::formatTimestamp(match.date) +
                                           " is not after " +
                                           foundation::formatTimestamp(reference)));
}

/// Apply the held-back updates of one date to every tracker.
EngineResult<void> applyGroup(TrackerSnapshot& state,
                              const std::vector<const rating::Match*>& group,
                              const rating::Match*& failed) {
    for (const auto* match : group) {
        rating::OutcomeDetail detail;
        detail.setsPlayed = match->setsPlayed;
        detail.winnerRank = state.rankings->mostRecentRank(match->winnerId, match->date);
        detail.loserRank = state.rankings->mostRecentRank(match->loserId, match->date);

        failed = match;
        if (auto r = state.elo.update(match->winnerId, match->loserId, match->surface); !r) {
            return r;
        }
        if (auto r = state.form.update(match->winnerId, match->loserId, match->surface,
                                       match->date, detail);
            !r) {
            return r;
        }
        if (auto r = state.h2h.update(match->winnerId, match->loserId, match->surface); !r) {
            return r;
        }
        ++state.matchesApplied;
    }
    if (!group.empty()) {
        state.watermark = group.back()->date;
    }
    failed = nullptr;
    return EngineResult<void>::ok();
}

} // namespace

ChronologicalOrchestrator::ChronologicalOrchestrator(
    EngineConfig config,
    std::shared_ptr<const rating::RankingLookup> rankings,
    std::shared_ptr<const features::PlayerRegistry> players)
    : config_(std::move(config)),
      rankings_(rankings ? std::move(rankings)
                         : std::make_shared<const rating::RankingLookup>(
                               std::vector<rating::RankingRow>{}, config_.defaultRank)),
      players_(players ? std::move(players)
                       : std::make_shared<const features::PlayerRegistry>()) {}

std::shared_ptr<TrackerSnapshot> ChronologicalOrchestrator::emptySnapshot() const {
    auto state = std::make_shared<TrackerSnapshot>(TrackerSnapshot{
        .elo = rating::EloRatingTracker(config_.elo),
        .form = rating::PlayerFormTracker(config_.form),
        .h2h = rating::HeadToHeadTracker(),
        .rankings = rankings_,
        .players = players_,
    });
    return state;
}

EngineResult<ReplayResult> ChronologicalOrchestrator::replay(
    const std::vector<rating::Match>& matches) const {
    TFE_LOG_INFO(LogCategory::Replay,
                 "Starting full replay of " + std::to_string(matches.size()) + " matches");
    return run(emptySnapshot(), matches);
}

EngineResult<ReplayResult> ChronologicalOrchestrator::replayRecords(
    const std::vector<ingest::MatchRecord>& records) const {
    auto prepared = ingest::MatchStream::prepare(records);
    auto result = replay(prepared.matches);
    if (!result) {
        return result;
    }
    result.value().stats.recordsDropped = prepared.dropped.size();
    result.value().dropped = std::move(prepared.dropped);
    return result;
}

EngineResult<ReplayResult> ChronologicalOrchestrator::extend(
    const TrackerSnapshot& base, const std::vector<rating::Match>& matches) const {
    TFE_LOG_INFO(LogCategory::Replay,
                 "Extending snapshot with " + std::to_string(matches.size()) + " matches");
    return run(std::make_shared<TrackerSnapshot>(base), matches);
}

EngineResult<ReplayResult> ChronologicalOrchestrator::run(
    std::shared_ptr<TrackerSnapshot> state, const std::vector<rating::Match>& matches) const {
    ReplayResult result;
    result.rows.reserve(matches.size());

    std::vector<const rating::Match*> pending;
    const rating::Match* failed = nullptr;
    const auto appliedBefore = state->matchesApplied;
    const auto assembler = state->assembler();

    for (const auto& match : matches) {
        if (state->watermark && match.date <= *state->watermark) {
            return outOfOrder(match, *state->watermark);
        }
        if (!pending.empty() && match.date < pending.front()->date) {
            return outOfOrder(match, pending.front()->date);
        }

        if (!pending.empty() && match.date > pending.front()->date) {
            if (auto applied = applyGroup(*state, pending, failed); !applied) {
                return abortRun(*failed, applied.error());
            }
            ++result.stats.dateGroups;
            pending.clear();
        }

        // Features first, from state that holds only strictly earlier dates.
        result.rows.push_back(features::FeatureRow{
            assembler.build(match.p1(), match.p2(), match.surface, match.date, match.matchId),
            match.label()});
        pending.push_back(&match);
    }

    if (!pending.empty()) {
        if (auto applied = applyGroup(*state, pending, failed); !applied) {
            return abortRun(*failed, applied.error());
        }
        ++result.stats.dateGroups;
    }

    result.stats.rowsEmitted = result.rows.size();
    result.stats.matchesApplied = state->matchesApplied - appliedBefore;
    result.snapshot = std::move(state);

    TFE_LOG_INFO(LogCategory::Replay,
                 "Replay finished: " + std::to_string(result.stats.rowsEmitted) + " rows, " +
                     std::to_string(result.stats.dateGroups) + " dates");
    return EngineResult<ReplayResult>::ok(std::move(result));
}

} // namespace tfe::replay
