/// @file csv_source.cpp
/// @brief CSV table readers.

#include "tfe/ingest/csv_source.hpp"

#include <charconv>
#include <fstream>
#include <utility>

#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"

namespace tfe::ingest {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

std::string trimCopy(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return std::string(text);
}

std::string field(const std::vector<std::string>& fields, std::optional<std::size_t> column) {
    if (!column || *column >= fields.size()) {
        return {};
    }
    return trimCopy(fields[*column]);
}

template <typename T>
EngineResult<T> missingColumn(const std::string& name) {
    return EngineResult<T>::err(
        EngineError(ErrorCode::MissingColumn, "missing required column '" + name + "'"));
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

template <typename T>
EngineResult<T> openAndRead(const std::filesystem::path& path,
                            EngineResult<T> (*reader)(std::istream&)) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::FileOpenFailed, "failed to open " + path.string()));
    }
    return reader(in);
}

} // namespace

CsvHeader::CsvHeader(const std::vector<std::string>& names) {
    for (std::size_t i = 0; i < names.size(); ++i) {
        columns_.emplace(trimCopy(names[i]), i);
    }
}

std::optional<std::size_t> CsvHeader::find(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

EngineResult<CsvHeader> readCsvHeader(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        return EngineResult<CsvHeader>::err(
            EngineError(ErrorCode::MalformedRecord, "empty table: no header line"));
    }
    // UTF-8 BOM
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }
    return EngineResult<CsvHeader>::ok(CsvHeader(splitCsvLine(line)));
}

std::vector<std::string> splitCsvLine(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

EngineResult<std::vector<MatchRecord>> readMatchRecords(std::istream& in) {
    using Out = std::vector<MatchRecord>;
    auto header = readCsvHeader(in);
    if (!header) {
        return EngineResult<Out>::err(header.error());
    }
    const auto& cols = header.value();

    auto date = cols.find("tourney_date");
    auto winner = cols.find("winner_id");
    auto loser = cols.find("loser_id");
    if (!date) return missingColumn<Out>("tourney_date");
    if (!winner) return missingColumn<Out>("winner_id");
    if (!loser) return missingColumn<Out>("loser_id");
    auto matchId = cols.find("match_id");
    auto tourneyId = cols.find("tourney_id");
    auto matchNum = cols.find("match_num");
    auto tourney = cols.find("tourney_name");
    auto surface = cols.find("surface");
    auto score = cols.find("score");

    Out records;
    std::string line;
    while (std::getline(in, line)) {
        if (isBlank(line)) {
            continue;
        }
        auto fields = splitCsvLine(line);
        auto id = field(fields, matchId);
        if (!matchId && tourneyId && matchNum) {
            auto tid = field(fields, tourneyId);
            auto num = field(fields, matchNum);
            // Left empty otherwise, so the record is dropped as malformed.
            if (!tid.empty() && !num.empty()) {
                id = tid + "-" + num;
            }
        }
        records.push_back(MatchRecord{
            .matchId = std::move(id),
            .date = field(fields, date),
            .tourneyName = field(fields, tourney),
            .surface = field(fields, surface),
            .winnerId = field(fields, winner),
            .loserId = field(fields, loser),
            .score = field(fields, score),
        });
    }

    TFE_LOG_INFO(LogCategory::Ingest,
                 "Read " + std::to_string(records.size()) + " match records");
    return EngineResult<Out>::ok(std::move(records));
}

EngineResult<std::vector<MatchRecord>> loadMatchRecords(const std::filesystem::path& path) {
    return openAndRead<std::vector<MatchRecord>>(path, &readMatchRecords);
}

EngineResult<RankingLoad> readRankingRows(std::istream& in) {
    auto header = readCsvHeader(in);
    if (!header) {
        return EngineResult<RankingLoad>::err(header.error());
    }
    const auto& cols = header.value();

    auto dateCol = cols.find("ranking_date");
    auto playerCol = cols.find("player");
    auto rankCol = cols.find("rank");
    if (!dateCol) return missingColumn<RankingLoad>("ranking_date");
    if (!playerCol) return missingColumn<RankingLoad>("player");
    if (!rankCol) return missingColumn<RankingLoad>("rank");

    RankingLoad out;
    std::string line;
    while (std::getline(in, line)) {
        if (isBlank(line)) {
            continue;
        }
        auto fields = splitCsvLine(line);
        auto date = foundation::parseTimestamp(field(fields, dateCol));
        auto player = MatchStream::parsePlayerId(field(fields, playerCol));
        auto rankText = field(fields, rankCol);
        int rank = 0;
        auto [ptr, ec] = std::from_chars(rankText.data(), rankText.data() + rankText.size(), rank);
        bool rankOk = !rankText.empty() && ec == std::errc{} &&
                      ptr == rankText.data() + rankText.size() && rank > 0;

        if (!date || !player || !rankOk) {
            ++out.dropped;
            continue;
        }
        out.rows.push_back(rating::RankingRow{date.value(), player.value(), rank});
    }

    if (out.dropped > 0) {
        TFE_LOG_WARN(LogCategory::Ranking,
                     "Dropped " + std::to_string(out.dropped) + " malformed ranking rows");
    }
    return EngineResult<RankingLoad>::ok(std::move(out));
}

EngineResult<RankingLoad> loadRankingRows(const std::filesystem::path& path) {
    return openAndRead<RankingLoad>(path, &readRankingRows);
}

EngineResult<std::vector<features::PlayerAttributes>> readPlayerAttributes(std::istream& in) {
    using Out = std::vector<features::PlayerAttributes>;
    auto header = readCsvHeader(in);
    if (!header) {
        return EngineResult<Out>::err(header.error());
    }
    const auto& cols = header.value();

    auto idCol = cols.find("player_id");
    if (!idCol) return missingColumn<Out>("player_id");
    auto handCol = cols.find("hand");

    Out players;
    std::size_t skipped = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (isBlank(line)) {
            continue;
        }
        auto fields = splitCsvLine(line);
        auto id = MatchStream::parsePlayerId(field(fields, idCol));
        if (!id) {
            ++skipped;
            continue;
        }
        players.push_back(features::PlayerAttributes{
            id.value(), features::parseHandedness(field(fields, handCol))});
    }

    if (skipped > 0) {
        TFE_LOG_WARN(LogCategory::Ingest,
                     "Skipped " + std::to_string(skipped) + " player rows with a bad id");
    }
    return EngineResult<Out>::ok(std::move(players));
}

EngineResult<std::vector<features::PlayerAttributes>> loadPlayerAttributes(
    const std::filesystem::path& path) {
    return openAndRead<std::vector<features::PlayerAttributes>>(path, &readPlayerAttributes);
}

} // namespace tfe::ingest
