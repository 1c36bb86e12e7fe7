#pragma once

/// @file player_form_tracker.hpp
/// @brief Per-player win rates, recent form, fatigue windows and rest.

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>

#include "tfe/foundation/engine_result.hpp"
#include "tfe/rating/rating_types.hpp"

namespace tfe::rating {

/// Extra facts about a match that the form statistics need.
struct OutcomeDetail {
    int setsPlayed = 0;
    int winnerRank = 0; ///< Winner's rank before the match (0 = unknown).
    int loserRank = 0;  ///< Loser's rank before the match (0 = unknown).
};

/// Accumulates each player's match outcomes.
///
/// All queries default to zero (rest days and opponent rank to their
/// configured fallbacks) for a player with no recorded matches, and
/// never create entries. Time-window queries only count outcomes dated
/// strictly before the query date.
class PlayerFormTracker {
public:
    explicit PlayerFormTracker(FormConfig config = {});

    /// Career win fraction.
    [[nodiscard]] double winPerc(PlayerId player) const;

    /// Win fraction on @p surface.
    [[nodiscard]] double surfaceWinPerc(PlayerId player, Surface surface) const;

    /// Win fraction over the player's last @p n matches (fewer if the
    /// player has played fewer).
    [[nodiscard]] double formLastN(PlayerId player, std::size_t n) const;

    /// Same as formLastN(); named for the 20/50-match rolling features.
    [[nodiscard]] double rollingWinPerc(PlayerId player, std::size_t n) const {
        return formLastN(player, n);
    }

    /// Matches played with floor_days(asOf - date) <= @p days.
    [[nodiscard]] int matchesInWindow(PlayerId player, Timestamp asOf, int days) const;

    /// Sets played in matches counted by matchesInWindow().
    [[nodiscard]] int setsInWindow(PlayerId player, Timestamp asOf, int days) const;

    /// Whole days since the player's last match, or the configured default.
    [[nodiscard]] int64_t restDays(PlayerId player, Timestamp asOf) const;

    /// Mean known opponent rank over the last @p n matches, or @p fallback.
    [[nodiscard]] double avgOpponentRank(PlayerId player, std::size_t n, double fallback) const;

    [[nodiscard]] uint32_t matchesPlayed(PlayerId player) const;

    /// Record one decided match for both players.
    ///
    /// @return SelfMatch if winner == loser; OutOfOrderMatch if @p date is
    ///         earlier than a match already recorded for either player.
    [[nodiscard]] foundation::EngineResult<void> update(PlayerId winner, PlayerId loser,
                                                        Surface surface, Timestamp date,
                                                        const OutcomeDetail& detail = {});

    [[nodiscard]] std::size_t playerCount() const noexcept { return entries_.size(); }

    [[nodiscard]] const FormConfig& config() const noexcept { return config_; }

private:
    struct Outcome {
        Timestamp date{};
        bool won = false;
        int setsPlayed = 0;
        int opponentRank = 0;
    };

    struct FormEntry {
        uint32_t matchesPlayed = 0;
        uint32_t wins = 0;
        std::array<uint32_t, kSurfaceCount> surfaceMatches{};
        std::array<uint32_t, kSurfaceCount> surfaceWins{};
        std::deque<Outcome> history; ///< Oldest first.
    };

    [[nodiscard]] const FormEntry* find(PlayerId player) const;
    void record(FormEntry& entry, Surface surface, const Outcome& outcome);
    void prune(FormEntry& entry) const;

    FormConfig config_;
    std::size_t retainCount_ = 0;
    std::unordered_map<PlayerId, FormEntry> entries_;
};

} // namespace tfe::rating
