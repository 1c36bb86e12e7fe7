/// @file player_form_tracker.cpp
/// @brief PlayerFormTracker implementation.

#include "tfe/rating/player_form_tracker.hpp"

#include <algorithm>
#include <string>

namespace tfe::rating {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::wholeDaysBetween;

namespace {

double ratio(uint32_t num, uint32_t den) {
    return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
}

} // namespace

PlayerFormTracker::PlayerFormTracker(FormConfig config)
    : config_(config),
      retainCount_(std::max({config.formWindow, config.rollingShortWindow,
                             config.rollingLongWindow, config.opponentRankWindow})) {}

const PlayerFormTracker::FormEntry* PlayerFormTracker::find(PlayerId player) const {
    auto it = entries_.find(player);
    return it != entries_.end() ? &it->second : nullptr;
}

double PlayerFormTracker::winPerc(PlayerId player) const {
    const auto* entry = find(player);
    return entry ? ratio(entry->wins, entry->matchesPlayed) : 0.0;
}

double PlayerFormTracker::surfaceWinPerc(PlayerId player, Surface surface) const {
    const auto* entry = find(player);
    if (!entry) {
        return 0.0;
    }
    auto idx = static_cast<std::size_t>(surface);
    return ratio(entry->surfaceWins[idx], entry->surfaceMatches[idx]);
}

double PlayerFormTracker::formLastN(PlayerId player, std::size_t n) const {
    const auto* entry = find(player);
    if (!entry || entry->history.empty() || n == 0) {
        return 0.0;
    }
    auto count = std::min(n, entry->history.size());
    uint32_t wins = 0;
    for (auto it = entry->history.end() - static_cast<std::ptrdiff_t>(count);
         it != entry->history.end(); ++it) {
        if (it->won) {
            ++wins;
        }
    }
    return ratio(wins, static_cast<uint32_t>(count));
}

int PlayerFormTracker::matchesInWindow(PlayerId player, Timestamp asOf, int days) const {
    const auto* entry = find(player);
    if (!entry) {
        return 0;
    }
    int count = 0;
    for (auto it = entry->history.rbegin(); it != entry->history.rend(); ++it) {
        if (it->date >= asOf) {
            continue;
        }
        if (wholeDaysBetween(it->date, asOf) > days) {
            break;
        }
        ++count;
    }
    return count;
}

int PlayerFormTracker::setsInWindow(PlayerId player, Timestamp asOf, int days) const {
    const auto* entry = find(player);
    if (!entry) {
        return 0;
    }
    int sets = 0;
    for (auto it = entry->history.rbegin(); it != entry->history.rend(); ++it) {
        if (it->date >= asOf) {
            continue;
        }
        if (wholeDaysBetween(it->date, asOf) > days) {
            break;
        }
        sets += it->setsPlayed;
    }
    return sets;
}

int64_t PlayerFormTracker::restDays(PlayerId player, Timestamp asOf) const {
    const auto* entry = find(player);
    if (!entry) {
        return config_.defaultRestDays;
    }
    for (auto it = entry->history.rbegin(); it != entry->history.rend(); ++it) {
        if (it->date < asOf) {
            return wholeDaysBetween(it->date, asOf);
        }
    }
    return config_.defaultRestDays;
}

double PlayerFormTracker::avgOpponentRank(PlayerId player, std::size_t n, double fallback) const {
    const auto* entry = find(player);
    if (!entry || n == 0) {
        return fallback;
    }
    auto count = std::min(n, entry->history.size());
    double sum = 0.0;
    int known = 0;
    for (auto it = entry->history.end() - static_cast<std::ptrdiff_t>(count);
         it != entry->history.end(); ++it) {
        if (it->opponentRank > 0) {
            sum += it->opponentRank;
            ++known;
        }
    }
    return known == 0 ? fallback : sum / known;
}

uint32_t PlayerFormTracker::matchesPlayed(PlayerId player) const {
    const auto* entry = find(player);
    return entry ? entry->matchesPlayed : 0;
}

EngineResult<void> PlayerFormTracker::update(PlayerId winner, PlayerId loser, Surface surface,
                                             Timestamp date, const OutcomeDetail& detail) {
    if (winner == loser) {
        return EngineResult<void>::err(EngineError(
            ErrorCode::SelfMatch,
            "player " + std::to_string(winner.value()) + " cannot play itself"));
    }
    for (auto id : {winner, loser}) {
        const auto* entry = find(id);
        if (entry && !entry->history.empty() && entry->history.back().date > date) {
            return EngineResult<void>::err(EngineError(
                ErrorCode::OutOfOrderMatch,
                "form update for player " + std::to_string(id.value()) +
                    " is older than its last recorded match"));
        }
    }

    record(entries_[winner], surface,
           Outcome{.date = date, .won = true, .setsPlayed = detail.setsPlayed,
                   .opponentRank = detail.loserRank});
    record(entries_[loser], surface,
           Outcome{.date = date, .won = false, .setsPlayed = detail.setsPlayed,
                   .opponentRank = detail.winnerRank});
    return EngineResult<void>::ok();
}

void PlayerFormTracker::record(FormEntry& entry, Surface surface, const Outcome& outcome) {
    auto idx = static_cast<std::size_t>(surface);
    ++entry.matchesPlayed;
    ++entry.surfaceMatches[idx];
    if (outcome.won) {
        ++entry.wins;
        ++entry.surfaceWins[idx];
    }
    entry.history.push_back(outcome);
    prune(entry);
}

void PlayerFormTracker::prune(FormEntry& entry) const {
    // Keep enough for every count window and everything inside the longest
    // day window measured from the newest outcome.
    int maxDays = std::max(config_.shortFatigueDays, config_.longFatigueDays);
    const auto newest = entry.history.back().date;
    while (entry.history.size() > retainCount_ &&
           wholeDaysBetween(entry.history.front().date, newest) > maxDays) {
        entry.history.pop_front();
    }
}

} // namespace tfe::rating
