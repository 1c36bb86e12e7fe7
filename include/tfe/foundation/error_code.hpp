#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the feature engine.

#include <cstdint>
#include <string_view>

namespace tfe::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Ingest (0x0100 - 0x01FF)
    IngestError = 0x0100,
    FileOpenFailed = 0x0101,
    MissingColumn = 0x0102,
    MalformedRecord = 0x0103,
    DateParseFailed = 0x0104,

    // Ranking (0x0200 - 0x02FF)
    RankingError = 0x0200,
    InvalidRank = 0x0201,

    // Rating (0x0300 - 0x03FF)
    RatingError = 0x0300,
    NonFiniteRating = 0x0301,
    SelfMatch = 0x0302,

    // Replay (0x0400 - 0x04FF)
    ReplayError = 0x0400,
    OutOfOrderMatch = 0x0401,
    ReplayAborted = 0x0402,

    // Live (0x0500 - 0x05FF)
    LiveError = 0x0500,
    SnapshotNotReady = 0x0501,
    LookaheadViolation = 0x0502,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueInvalid = 0x0603,

    // Persistence (0x0700 - 0x07FF)
    PersistenceError = 0x0700,
    TableWriteFailed = 0x0701,
    TableCommitFailed = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerNotInitialized = 0x0801,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Ingest";
        case 0x0200: return "Ranking";
        case 0x0300: return "Rating";
        case 0x0400: return "Replay";
        case 0x0500: return "Live";
        case 0x0600: return "Config";
        case 0x0700: return "Persistence";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace tfe::foundation
