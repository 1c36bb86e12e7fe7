#pragma once

/// @file csv_source.hpp
/// @brief CSV readers for match, ranking and player tables.
///
/// Columns are located by header name, so extra columns and any column
/// order are accepted. Quoted fields may contain commas and doubled quotes.

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tfe/features/player_registry.hpp"
#include "tfe/foundation/engine_result.hpp"
#include "tfe/ingest/match_stream.hpp"
#include "tfe/rating/rating_types.hpp"

namespace tfe::ingest {

/// Split one CSV line into fields, honouring double quotes.
[[nodiscard]] std::vector<std::string> splitCsvLine(std::string_view line);

/// Header name -> column index. Names are trimmed of surrounding blanks.
class CsvHeader {
public:
    explicit CsvHeader(const std::vector<std::string>& names);

    [[nodiscard]] std::optional<std::size_t> find(const std::string& name) const;

private:
    std::unordered_map<std::string, std::size_t> columns_;
};

/// Read and parse the header line, dropping a leading UTF-8 BOM.
/// Fails with MalformedRecord when the stream has no line at all.
[[nodiscard]] foundation::EngineResult<CsvHeader> readCsvHeader(std::istream& in);

/// Ranking rows plus the count of rows dropped for a bad date, id or rank.
struct RankingLoad {
    std::vector<rating::RankingRow> rows;
    std::size_t dropped = 0;
};

/// Read match records (`match_id`, `tourney_date`, `tourney_name`,
/// `surface`, `winner_id`, `loser_id`, `score`). Only the two player id
/// columns and the date are required; the others default to empty. Without
/// a `match_id` column the id is `<tourney_id>-<match_num>` when both exist.
[[nodiscard]] foundation::EngineResult<std::vector<MatchRecord>> readMatchRecords(std::istream& in);

[[nodiscard]] foundation::EngineResult<std::vector<MatchRecord>> loadMatchRecords(
    const std::filesystem::path& path);

/// Read ranking rows (`ranking_date`, `player`, `rank`).
[[nodiscard]] foundation::EngineResult<RankingLoad> readRankingRows(std::istream& in);

[[nodiscard]] foundation::EngineResult<RankingLoad> loadRankingRows(
    const std::filesystem::path& path);

/// Read player attributes (`player_id`, `hand`). Rows with a bad id are skipped.
[[nodiscard]] foundation::EngineResult<std::vector<features::PlayerAttributes>>
readPlayerAttributes(std::istream& in);

[[nodiscard]] foundation::EngineResult<std::vector<features::PlayerAttributes>>
loadPlayerAttributes(const std::filesystem::path& path);

} // namespace tfe::ingest
