/// @file match_stream.cpp
/// @brief MatchStream implementation.

#include "tfe/ingest/match_stream.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"

namespace tfe::ingest {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::PlayerId;

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

EngineResult<rating::Match> malformed(std::string message) {
    return EngineResult<rating::Match>::err(
        EngineError(ErrorCode::MalformedRecord, std::move(message)));
}

} // namespace

EngineResult<PlayerId> MatchStream::parsePlayerId(std::string_view text) {
    auto trimmed = trim(text);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (trimmed.empty() || ec != std::errc{} || ptr != trimmed.data() + trimmed.size() ||
        value <= 0) {
        return EngineResult<PlayerId>::err(EngineError(
            ErrorCode::MalformedRecord, "invalid player id: '" + std::string(text) + "'"));
    }
    return EngineResult<PlayerId>::ok(PlayerId{value});
}

int MatchStream::countSets(std::string_view score) {
    int sets = 0;
    bool inToken = false;
    for (char c : score) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            inToken = false;
        } else if (!inToken) {
            inToken = true;
            ++sets;
        }
    }
    return sets;
}

EngineResult<rating::Match> MatchStream::parse(const MatchRecord& record) {
    auto matchId = trim(record.matchId);
    if (matchId.empty()) {
        return malformed("missing match id");
    }
    if (trim(record.date).empty()) {
        return malformed("missing date");
    }

    auto date = foundation::parseTimestamp(record.date);
    if (!date) {
        return EngineResult<rating::Match>::err(date.error());
    }

    auto winner = parsePlayerId(record.winnerId);
    if (!winner) {
        return malformed("winner: " + std::string(winner.error().message()));
    }
    auto loser = parsePlayerId(record.loserId);
    if (!loser) {
        return malformed("loser: " + std::string(loser.error().message()));
    }
    if (winner.value() == loser.value()) {
        return malformed("winner and loser are the same player");
    }

    auto tourney = trim(record.tourneyName);
    auto surface = rating::deriveSurface(
        std::optional<std::string_view>(record.surface),
        tourney.empty() ? std::nullopt : std::optional<std::string_view>(tourney));

    rating::Match match;
    match.matchId = std::string(matchId);
    match.date = date.value();
    match.surface = surface;
    match.winnerId = winner.value();
    match.loserId = loser.value();
    match.setsPlayed = countSets(record.score);
    match.tourneyName = std::string(tourney);
    return EngineResult<rating::Match>::ok(std::move(match));
}

PreparedStream MatchStream::prepare(const std::vector<MatchRecord>& records) {
    PreparedStream out;
    out.matches.reserve(records.size());

    auto& logger = foundation::EngineLogger::instance();
    for (std::size_t i = 0; i < records.size(); ++i) {
        auto parsed = parse(records[i]);
        if (parsed) {
            out.matches.push_back(std::move(parsed).value());
            continue;
        }

        DroppedRecord dropped{i, records[i].matchId, std::string(parsed.error().message())};
        if (logger.isEnabled(LogLevel::Warning, LogCategory::Ingest)) {
            LogContext ctx;
            ctx.matchId = dropped.matchId;
            ctx.extra["index"] = std::to_string(i);
            ctx.extra["reason"] = dropped.reason;
            logger.logWithContext(LogLevel::Warning, LogCategory::Ingest,
                                  "Dropped malformed match record", ctx);
        }
        out.dropped.push_back(std::move(dropped));
    }

    std::stable_sort(out.matches.begin(), out.matches.end(),
                     [](const rating::Match& a, const rating::Match& b) { return a.date < b.date; });

    TFE_LOG_INFO(LogCategory::Ingest,
                 "Prepared " + std::to_string(out.matches.size()) + " matches, dropped " +
                     std::to_string(out.dropped.size()));
    return out;
}

} // namespace tfe::ingest
