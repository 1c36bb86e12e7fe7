#pragma once

/// @file time_utils.hpp
/// @brief Parsing and formatting of UTC match and ranking dates.

#include <string>
#include <string_view>

#include "tfe/foundation/engine_result.hpp"
#include "tfe/foundation/types.hpp"

namespace tfe::foundation {

/// Parse a UTC date or date-time.
///
/// Accepted forms:
///   - `YYYYMMDD` (tournament/ranking dates as published)
///   - `YYYY-MM-DD`
///   - `YYYY-MM-DD HH:MM:SS` and `YYYY-MM-DDTHH:MM:SS`, optionally with `Z`
///
/// Surrounding whitespace is ignored. Calendar-invalid dates (2023-02-30)
/// are rejected.
///
/// @return The timestamp, or DateParseFailed.
[[nodiscard]] EngineResult<Timestamp> parseTimestamp(std::string_view text);

/// Format as `YYYY-MM-DD`, or `YYYY-MM-DDTHH:MM:SSZ` when the time of day
/// is not midnight.
[[nodiscard]] std::string formatTimestamp(Timestamp ts);

/// Midnight UTC of the given calendar day.
[[nodiscard]] constexpr Timestamp makeDate(int year, unsigned month, unsigned day) {
    return std::chrono::sys_days{std::chrono::year{year} / std::chrono::month{month} /
                                 std::chrono::day{day}};
}

} // namespace tfe::foundation
