/// @file feature_table_writer.cpp
/// @brief FeatureTableWriter implementation.

#include "tfe/persistence/feature_table_writer.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <functional>
#include <string_view>
#include <system_error>

#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"

namespace tfe::persistence {

using features::FeatureRow;
using features::PlayerFeatures;
using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

void appendDouble(std::string& out, double value) {
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    out.append(buf.data(), ec == std::errc{} ? ptr : buf.data());
}

template <typename Int>
void appendInt(std::string& out, Int value) {
    std::array<char, 24> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    out.append(buf.data(), ec == std::errc{} ? ptr : buf.data());
}

/// Quote a free-text field if it needs it.
void appendText(std::string& out, std::string_view text) {
    if (text.find_first_of(",\"\n\r") == std::string_view::npos) {
        out.append(text);
        return;
    }
    out.push_back('"');
    for (char c : text) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
}

struct Column {
    std::string name;
    std::function<void(std::string&, const FeatureRow&)> append;
};

/// Per-player column emitted once for p1 and once for p2.
struct SideColumn {
    std::string_view suffix;
    std::function<void(std::string&, const PlayerFeatures&)> append;
};

const std::vector<Column>& columns() {
    static const std::vector<Column> table = [] {
        const std::vector<SideColumn> sides = {
            {"rank", [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.rank); }},
            {"elo", [](std::string& o, const PlayerFeatures& f) { appendDouble(o, f.elo); }},
            {"elo_momentum",
             [](std::string& o, const PlayerFeatures& f) { appendDouble(o, f.eloMomentum); }},
            {"win_perc",
             [](std::string& o, const PlayerFeatures& f) { appendDouble(o, f.winPerc); }},
            {"surface_win_perc",
             [](std::string& o, const PlayerFeatures& f) { appendDouble(o, f.surfaceWinPerc); }},
            {"form_last_10",
             [](std::string& o, const PlayerFeatures& f) { appendDouble(o, f.formLast10); }},
            {"rolling_win_perc_20",
             [](std::string& o, const PlayerFeatures& f) { appendDouble(o, f.rollingWinPerc20); }},
            {"rolling_win_perc_50",
             [](std::string& o, const PlayerFeatures& f) { appendDouble(o, f.rollingWinPerc50); }},
            {"matches_last_7_days",
             [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.matchesLast7Days); }},
            {"matches_last_14_days",
             [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.matchesLast14Days); }},
            {"sets_played_last_7_days",
             [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.setsLast7Days); }},
            {"sets_played_last_14_days",
             [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.setsLast14Days); }},
            {"rest_days",
             [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.restDays); }},
            {"avg_opponent_rank_last_10",
             [](std::string& o, const PlayerFeatures& f) {
                 appendDouble(o, f.avgOpponentRankLast10);
             }},
            {"h2h_wins", [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.h2hWins); }},
            {"h2h_surface_wins",
             [](std::string& o, const PlayerFeatures& f) { appendInt(o, f.h2hSurfaceWins); }},
            {"hand",
             [](std::string& o, const PlayerFeatures& f) {
                 o.push_back(features::handednessCode(f.hand));
             }},
        };

        std::vector<Column> cols;
        cols.push_back({"match_id",
                        [](std::string& o, const FeatureRow& r) { appendText(o, r.features.matchId); }});
        cols.push_back({"date", [](std::string& o, const FeatureRow& r) {
                            o.append(foundation::formatTimestamp(r.features.date));
                        }});
        cols.push_back({"surface", [](std::string& o, const FeatureRow& r) {
                            o.append(rating::surfaceName(r.features.surface));
                        }});
        cols.push_back({"p1_id", [](std::string& o, const FeatureRow& r) {
                            appendInt(o, r.features.p1Id.value());
                        }});
        cols.push_back({"p2_id", [](std::string& o, const FeatureRow& r) {
                            appendInt(o, r.features.p2Id.value());
                        }});

        for (const auto& side : sides) {
            auto fn = side.append;
            cols.push_back({"p1_" + std::string(side.suffix),
                            [fn](std::string& o, const FeatureRow& r) { fn(o, r.features.p1); }});
            cols.push_back({"p2_" + std::string(side.suffix),
                            [fn](std::string& o, const FeatureRow& r) { fn(o, r.features.p2); }});
        }

        cols.push_back({"rank_diff", [](std::string& o, const FeatureRow& r) {
            appendInt(o, r.features.rankDiff);
        }});
        cols.push_back({"elo_diff", [](std::string& o, const FeatureRow& r) {
            appendDouble(o, r.features.eloDiff);
        }});
        cols.push_back({"elo_momentum_diff", [](std::string& o, const FeatureRow& r) {
            appendDouble(o, r.features.eloMomentumDiff);
        }});
        cols.push_back({"fatigue_diff_7_days", [](std::string& o, const FeatureRow& r) {
            appendInt(o, r.features.fatigueDiff7Days);
        }});
        cols.push_back({"fatigue_diff_14_days", [](std::string& o, const FeatureRow& r) {
            appendInt(o, r.features.fatigueDiff14Days);
        }});
        cols.push_back({"sets_played_diff_7_days", [](std::string& o, const FeatureRow& r) {
            appendInt(o, r.features.setsDiff7Days);
        }});
        cols.push_back({"sets_played_diff_14_days", [](std::string& o, const FeatureRow& r) {
            appendInt(o, r.features.setsDiff14Days);
        }});
        cols.push_back({"rest_diff", [](std::string& o, const FeatureRow& r) {
            appendInt(o, r.features.restDiff);
        }});
        cols.push_back({"winner", [](std::string& o, const FeatureRow& r) {
            appendInt(o, r.winner);
        }});
        return cols;
    }();
    return table;
}

} // namespace

std::string FeatureTableWriter::header() {
    std::string out;
    for (const auto& col : columns()) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out.append(col.name);
    }
    return out;
}

std::size_t FeatureTableWriter::columnCount() {
    return columns().size();
}

std::string FeatureTableWriter::formatRow(const FeatureRow& row) {
    std::string out;
    out.reserve(512);
    bool first = true;
    for (const auto& col : columns()) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        col.append(out, row);
    }
    return out;
}

EngineResult<void> FeatureTableWriter::write(std::ostream& out,
                                             const std::vector<FeatureRow>& rows) {
    out << header() << '\n';
    for (const auto& row : rows) {
        out << formatRow(row) << '\n';
    }
    out.flush();
    if (!out) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::TableWriteFailed, "failed to write feature table"));
    }
    return EngineResult<void>::ok();
}

EngineResult<void> FeatureTableWriter::write(const std::filesystem::path& path,
                                             const std::vector<FeatureRow>& rows) {
    auto tmpPath = path;
    tmpPath += ".tmp";

    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            return EngineResult<void>::err(EngineError(
                ErrorCode::TableWriteFailed, "cannot open " + tmpPath.string() + " for writing"));
        }
        auto written = write(file, rows);
        if (!written) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(tmpPath, ignored);
            return written;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        return EngineResult<void>::err(EngineError(
            ErrorCode::TableCommitFailed,
            "cannot rename " + tmpPath.string() + " to " + path.string() + ": " + ec.message()));
    }

    TFE_LOG_INFO(LogCategory::Persistence,
                 "Wrote " + std::to_string(rows.size()) + " feature rows to " + path.string());
    return EngineResult<void>::ok();
}

} // namespace tfe::persistence
