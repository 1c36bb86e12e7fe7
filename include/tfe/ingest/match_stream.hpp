#pragma once

/// @file match_stream.hpp
/// @brief Validation and ordering of raw match records.
///
/// Raw records arrive as strings straight from the source table. Each is
/// parsed once into a strongly-typed rating::Match; malformed records are
/// dropped and logged, never fatal.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "tfe/foundation/engine_result.hpp"
#include "tfe/rating/rating_types.hpp"

namespace tfe::ingest {

/// One match as read from the source, before validation.
struct MatchRecord {
    std::string matchId;
    std::string date;
    std::string tourneyName;
    std::string surface; ///< Explicit surface tag; empty if absent.
    std::string winnerId;
    std::string loserId;
    std::string score;
};

/// A record removed before the chronological pass.
struct DroppedRecord {
    std::size_t index = 0; ///< Position in the input.
    std::string matchId;
    std::string reason;
};

/// Valid matches in non-decreasing date order plus what was dropped.
struct PreparedStream {
    std::vector<rating::Match> matches;
    std::vector<DroppedRecord> dropped;
};

/// Stateless record validation.
class MatchStream {
public:
    MatchStream() = delete;

    /// Parse one record.
    ///
    /// @return The match, or MalformedRecord / DateParseFailed describing
    ///         the first problem found.
    [[nodiscard]] static foundation::EngineResult<rating::Match> parse(const MatchRecord& record);

    /// Parse all records, drop and log the malformed ones, and stable-sort
    /// the rest by date so same-date matches keep their input order.
    [[nodiscard]] static PreparedStream prepare(const std::vector<MatchRecord>& records);

    /// Number of whitespace-separated set scores in @p score
    /// ("6-4 3-6 7-6(5)" is 3).
    [[nodiscard]] static int countSets(std::string_view score);

    /// Parse a positive integer player id.
    [[nodiscard]] static foundation::EngineResult<foundation::PlayerId> parsePlayerId(
        std::string_view text);
};

} // namespace tfe::ingest
