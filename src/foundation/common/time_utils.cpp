/// @file time_utils.cpp
/// @brief Date parsing/formatting for the ingest boundary.

#include "tfe/foundation/time_utils.hpp"

#include <charconv>
#include <cstdio>

namespace tfe::foundation {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() &&
           (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

/// Parse exactly @p width decimal digits starting at @p pos.
bool readDigits(std::string_view text, std::size_t pos, std::size_t width, int& out) {
    if (pos + width > text.size()) {
        return false;
    }
    for (std::size_t i = pos; i < pos + width; ++i) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + width, out);
    return ec == std::errc{} && ptr == text.data() + pos + width;
}

EngineResult<Timestamp> fail(std::string_view text) {
    return EngineResult<Timestamp>::err(EngineError(
        ErrorCode::DateParseFailed, "unparseable date: '" + std::string(text) + "'"));
}

} // namespace

EngineResult<Timestamp> parseTimestamp(std::string_view raw) {
    auto text = trim(raw);
    int year = 0;
    int month = 0;
    int day = 0;
    std::size_t timePos = 0;

    if (text.size() == 8) {
        if (!readDigits(text, 0, 4, year) || !readDigits(text, 4, 2, month) ||
            !readDigits(text, 6, 2, day)) {
            return fail(raw);
        }
    } else if (text.size() >= 10 && text[4] == '-' && text[7] == '-') {
        if (!readDigits(text, 0, 4, year) || !readDigits(text, 5, 2, month) ||
            !readDigits(text, 8, 2, day)) {
            return fail(raw);
        }
        timePos = 10;
    } else {
        return fail(raw);
    }

    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return fail(raw);
    }
    Timestamp ts = std::chrono::sys_days{ymd};

    if (timePos == 0 || timePos == text.size()) {
        return EngineResult<Timestamp>::ok(ts);
    }

    // "[ T]HH:MM:SS[Z]"
    auto rest = text.substr(timePos);
    if (rest.size() < 9 || (rest[0] != ' ' && rest[0] != 'T') || rest[3] != ':' ||
        rest[6] != ':') {
        return fail(raw);
    }
    int hh = 0;
    int mm = 0;
    int ss = 0;
    if (!readDigits(rest, 1, 2, hh) || !readDigits(rest, 4, 2, mm) ||
        !readDigits(rest, 7, 2, ss)) {
        return fail(raw);
    }
    auto tail = rest.substr(9);
    if (!(tail.empty() || tail == "Z")) {
        return fail(raw);
    }
    if (hh > 23 || mm > 59 || ss > 59) {
        return fail(raw);
    }

    ts += std::chrono::hours{hh} + std::chrono::minutes{mm} + std::chrono::seconds{ss};
    return EngineResult<Timestamp>::ok(ts);
}

std::string formatTimestamp(Timestamp ts) {
    auto dayPoint = std::chrono::floor<std::chrono::days>(ts);
    std::chrono::year_month_day ymd{dayPoint};
    std::chrono::hh_mm_ss tod{ts - dayPoint};

    char buf[32];
    if (tod.to_duration().count() == 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                      static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                      static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                      static_cast<int>(tod.minutes().count()),
                      static_cast<int>(tod.seconds().count()));
    }
    return buf;
}

} // namespace tfe::foundation
