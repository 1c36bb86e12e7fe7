/// @file engine_logger.cpp
/// @brief EngineLogger implementation on the kcenon logger registry.

#include "tfe/foundation/engine_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace tfe::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.matchId && !ctx.matchId->empty()) {
        append("match_id", *ctx.matchId);
    }
    if (ctx.playerId && ctx.playerId->isValid()) {
        append("player_id", std::to_string(ctx.playerId->value()));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

struct EngineLogger::Impl {
    // Atomic so the replay loop can check levels without locking.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(LogLevel::Info, std::memory_order_relaxed);
            loggerNames[i] = std::string("tfe.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // A category without its own logger resolves to the NullLogger;
        // route it to the default logger when one is installed.
        if (!logger->is_enabled(kci::log_level::off)) {
            auto defaultLogger = registry.get_default_logger();
            if (defaultLogger->is_enabled(kci::log_level::off)
                || defaultLogger != kci::GlobalLoggerRegistry::null_logger()) {
                return defaultLogger;
            }
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctxStr) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        getLogger(cat)->log(mapLevel(level), formatted);
    }
};

EngineLogger::EngineLogger() : impl_(std::make_unique<Impl>()) {}

EngineLogger::~EngineLogger() = default;

EngineLogger::EngineLogger(EngineLogger&&) noexcept = default;
EngineLogger& EngineLogger::operator=(EngineLogger&&) noexcept = default;

void EngineLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void EngineLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void EngineLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel EngineLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool EngineLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

EngineResult<void> EngineLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return EngineResult<void>::ok();
}

EngineLogger& EngineLogger::instance() {
    static EngineLogger inst;
    return inst;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

} // namespace tfe::foundation
