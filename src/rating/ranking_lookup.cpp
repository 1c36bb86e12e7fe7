/// @file ranking_lookup.cpp
/// @brief RankingLookup implementation.

#include "tfe/rating/ranking_lookup.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "tfe/foundation/engine_logger.hpp"

namespace tfe::rating {

using foundation::LogCategory;

RankingLookup::RankingLookup(const std::vector<RankingRow>& rows, int defaultRank)
    : defaultRank_(defaultRank) {
    std::size_t skipped = 0;
    for (const auto& row : rows) {
        if (!row.playerId.isValid() || row.rank <= 0) {
            ++skipped;
            continue;
        }
        byPlayer_[row.playerId].push_back(DatedRank{row.date, row.rank});
        ++rowCount_;
    }

    // Stable sort keeps load order among equal dates.
    for (auto& [player, history] : byPlayer_) {
        std::stable_sort(history.begin(), history.end(),
                         [](const DatedRank& a, const DatedRank& b) { return a.date < b.date; });
    }

    if (skipped > 0) {
        TFE_LOG_WARN(LogCategory::Ranking,
                     "Skipped " + std::to_string(skipped) + " invalid ranking rows");
    }
    TFE_LOG_DEBUG(LogCategory::Ranking,
                  "Loaded " + std::to_string(rowCount_) + " ranking rows for " +
                      std::to_string(byPlayer_.size()) + " players");
}

int RankingLookup::mostRecentRank(PlayerId player, Timestamp date) const {
    auto it = byPlayer_.find(player);
    if (it == byPlayer_.end()) {
        return defaultRank_;
    }
    const auto& history = it->second;

    // First row dated at or after the query; the one before it is the answer.
    auto pos = std::lower_bound(history.begin(), history.end(), date,
                                [](const DatedRank& row, Timestamp d) { return row.date < d; });
    if (pos == history.begin()) {
        return defaultRank_;
    }
    return std::prev(pos)->rank;
}

} // namespace tfe::rating
