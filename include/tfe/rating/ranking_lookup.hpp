#pragma once

/// @file ranking_lookup.hpp
/// @brief Point-in-time ranking lookup over a published ranking history.

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "tfe/rating/rating_types.hpp"

namespace tfe::rating {

/// Immutable per-player ranking history.
///
/// Rows are grouped by player and sorted by date once at construction.
/// Safe to share between threads after construction.
///
/// Usage:
/// @code
///   RankingLookup rankings(rows);
///   int rank = rankings.mostRecentRank(PlayerId{104925}, matchDate);
/// @endcode
class RankingLookup {
public:
    /// @param rows        Ranking rows in any order. Rows with an unset
    ///                    player id or a non-positive rank are skipped.
    /// @param defaultRank Rank returned when no earlier row exists.
    explicit RankingLookup(const std::vector<RankingRow>& rows = {},
                           int defaultRank = kDefaultRank);

    /// Rank from the latest row dated strictly before @p date, or the
    /// default rank. For rows sharing a date the last one loaded wins.
    [[nodiscard]] int mostRecentRank(PlayerId player, Timestamp date) const;

    [[nodiscard]] int defaultRank() const noexcept { return defaultRank_; }
    [[nodiscard]] std::size_t playerCount() const noexcept { return byPlayer_.size(); }
    [[nodiscard]] std::size_t rowCount() const noexcept { return rowCount_; }

private:
    struct DatedRank {
        Timestamp date{};
        int rank = 0;
    };

    int defaultRank_;
    std::size_t rowCount_ = 0;
    std::unordered_map<PlayerId, std::vector<DatedRank>> byPlayer_;
};

} // namespace tfe::rating
