/// @file elo_table_validator.cpp
/// @brief EloTableValidator implementation.

#include "tfe/persistence/elo_table_validator.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "tfe/foundation/engine_logger.hpp"
#include "tfe/ingest/csv_source.hpp"
#include "tfe/ingest/match_stream.hpp"

namespace tfe::persistence {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

EloTableValidator::EloTableValidator(double tolerance) : tolerance_(tolerance) {}

ValidationReport EloTableValidator::validate(const std::vector<features::FeatureRow>& rows,
                                             const std::vector<ExternalEloRecord>& external) const {
    std::unordered_map<std::string, const features::FeatureVector*> byId;
    byId.reserve(rows.size());
    for (const auto& row : rows) {
        byId.emplace(row.features.matchId, &row.features);
    }

    auto& logger = foundation::EngineLogger::instance();
    ValidationReport report;
    std::unordered_set<std::string> seen;

    for (const auto& record : external) {
        if (!seen.insert(record.matchId).second) {
            report.duplicates.push_back(record.matchId);
            if (logger.isEnabled(LogLevel::Warning, LogCategory::Persistence)) {
                LogContext ctx;
                ctx.matchId = record.matchId;
                logger.logWithContext(LogLevel::Warning, LogCategory::Persistence,
                                      "Duplicate external Elo row ignored", ctx);
            }
            continue;
        }

        auto it = byId.find(record.matchId);
        if (it == byId.end()) {
            report.missing.push_back(record.matchId);
            continue;
        }
        const auto& fv = *it->second;
        ++report.compared;

        double p1Elo = 0.0;
        double p2Elo = 0.0;
        if (record.p1Id == fv.p1Id && record.p2Id == fv.p2Id) {
            p1Elo = record.p1Elo;
            p2Elo = record.p2Elo;
        } else if (record.p1Id == fv.p2Id && record.p2Id == fv.p1Id) {
            p1Elo = record.p2Elo;
            p2Elo = record.p1Elo;
        } else {
            report.mismatchedIds.push_back(record.matchId);
            continue;
        }

        if (std::abs(p1Elo - fv.p1.elo) > tolerance_ || std::abs(p2Elo - fv.p2.elo) > tolerance_) {
            report.mismatched.push_back(record.matchId);
        }
    }

    if (!report.consistent()) {
        TFE_LOG_WARN(LogCategory::Persistence,
                     "Elo cross-check: " + std::to_string(report.mismatched.size()) +
                         " mismatched, " + std::to_string(report.missing.size()) + " missing, " +
                         std::to_string(report.mismatchedIds.size()) + " with other players");
    }
    return report;
}

namespace {

std::optional<double> parseElo(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
        !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

EngineResult<std::vector<ExternalEloRecord>> readEloTable(std::istream& in) {
    using Out = std::vector<ExternalEloRecord>;

    auto header = ingest::readCsvHeader(in);
    if (!header) {
        return EngineResult<Out>::err(header.error());
    }
    const auto& cols = header.value();

    std::unordered_map<std::string, std::size_t> index;
    for (const char* required : {"match_id", "p1_id", "p2_id", "p1_elo", "p2_elo"}) {
        auto column = cols.find(required);
        if (!column) {
            return EngineResult<Out>::err(EngineError(
                ErrorCode::MissingColumn, std::string("missing required column '") + required + "'"));
        }
        index.emplace(required, *column);
    }

    Out records;
    std::string line;
    std::size_t lineNo = 1;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto fields = ingest::splitCsvLine(line);
        auto at = [&](const char* name) -> std::string {
            auto idx = index.at(name);
            return idx < fields.size() ? fields[idx] : std::string{};
        };

        auto p1 = ingest::MatchStream::parsePlayerId(at("p1_id"));
        auto p2 = ingest::MatchStream::parsePlayerId(at("p2_id"));
        auto elo1 = parseElo(at("p1_elo"));
        auto elo2 = parseElo(at("p2_elo"));
        if (!p1 || !p2 || !elo1 || !elo2) {
            return EngineResult<Out>::err(EngineError(
                ErrorCode::MalformedRecord, "bad Elo table row at line " + std::to_string(lineNo)));
        }
        records.push_back(ExternalEloRecord{at("match_id"), p1.value(), p2.value(), *elo1, *elo2});
    }
    return EngineResult<Out>::ok(std::move(records));
}

EngineResult<std::vector<ExternalEloRecord>> loadEloTable(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return EngineResult<std::vector<ExternalEloRecord>>::err(
            EngineError(ErrorCode::FileOpenFailed, "failed to open " + path.string()));
    }
    return readEloTable(in);
}

} // namespace tfe::persistence
