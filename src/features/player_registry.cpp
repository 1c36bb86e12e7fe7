/// @file player_registry.cpp
/// @brief PlayerRegistry implementation.

#include "tfe/features/player_registry.hpp"

#include <cctype>
#include <string>

#include "tfe/foundation/engine_logger.hpp"

namespace tfe::features {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

Handedness parseHandedness(std::string_view code) {
    while (!code.empty() && std::isspace(static_cast<unsigned char>(code.front()))) {
        code.remove_prefix(1);
    }
    while (!code.empty() && std::isspace(static_cast<unsigned char>(code.back()))) {
        code.remove_suffix(1);
    }
    if (code.size() != 1) {
        return Handedness::Unknown;
    }
    switch (std::toupper(static_cast<unsigned char>(code.front()))) {
        case 'R': return Handedness::Right;
        case 'L': return Handedness::Left;
        case 'A': return Handedness::Ambidextrous;
        default:  return Handedness::Unknown;
    }
}

PlayerRegistry::PlayerRegistry(const std::vector<PlayerAttributes>& players) {
    auto& logger = foundation::EngineLogger::instance();
    for (const auto& attrs : players) {
        auto [it, inserted] = players_.try_emplace(attrs.playerId, attrs);
        if (!inserted) {
            ++duplicates_;
            if (logger.isEnabled(LogLevel::Warning, LogCategory::Ingest)) {
                LogContext ctx;
                ctx.playerId = attrs.playerId;
                logger.logWithContext(LogLevel::Warning, LogCategory::Ingest,
                                      "Duplicate player attributes ignored", ctx);
            }
        }
    }
}

Handedness PlayerRegistry::handedness(PlayerId player) const {
    auto it = players_.find(player);
    return it != players_.end() ? it->second.hand : Handedness::Unknown;
}

} // namespace tfe::features
