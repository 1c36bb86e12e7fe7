#pragma once

/// @file player_registry.hpp
/// @brief Static player attributes (handedness) keyed by player id.

#include <cstddef>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tfe/foundation/types.hpp"

namespace tfe::features {

using foundation::PlayerId;

/// Playing hand as published in player files.
enum class Handedness : uint8_t {
    Right = 0,
    Left = 1,
    Ambidextrous = 2,
    Unknown = 3
};

/// Single-letter code: R, L, A or U.
constexpr char handednessCode(Handedness hand) {
    switch (hand) {
        case Handedness::Right:        return 'R';
        case Handedness::Left:         return 'L';
        case Handedness::Ambidextrous: return 'A';
        case Handedness::Unknown:      return 'U';
    }
    return 'U';
}

/// Parse "R"/"L"/"A"/"U" (case-insensitive, surrounding blanks ignored).
/// Anything else is Unknown.
[[nodiscard]] Handedness parseHandedness(std::string_view code);

struct PlayerAttributes {
    PlayerId playerId;
    Handedness hand = Handedness::Unknown;
};

/// Read-only attribute lookup. The first entry for a duplicated id wins.
class PlayerRegistry {
public:
    explicit PlayerRegistry(const std::vector<PlayerAttributes>& players = {});

    /// Hand of @p player, Unknown if absent.
    [[nodiscard]] Handedness handedness(PlayerId player) const;

    [[nodiscard]] bool contains(PlayerId player) const { return players_.count(player) > 0; }

    [[nodiscard]] std::size_t size() const noexcept { return players_.size(); }

    /// Number of rows ignored because their id was already present.
    [[nodiscard]] std::size_t duplicateCount() const noexcept { return duplicates_; }

private:
    std::unordered_map<PlayerId, PlayerAttributes> players_;
    std::size_t duplicates_ = 0;
};

} // namespace tfe::features
