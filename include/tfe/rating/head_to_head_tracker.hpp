#pragma once

/// @file head_to_head_tracker.hpp
/// @brief Head-to-head win tallies per unordered player pair.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>

#include "tfe/foundation/engine_result.hpp"
#include "tfe/rating/rating_types.hpp"

namespace tfe::rating {

/// Wins of each side, relative to the ids passed to the query.
struct HeadToHeadRecord {
    uint32_t winsOfA = 0;
    uint32_t winsOfB = 0;

    bool operator==(const HeadToHeadRecord&) const = default;
};

/// Head-to-head tallies stored once per (min_id, max_id) pair, overall and
/// per surface.
class HeadToHeadTracker {
public:
    /// Overall record of @p a against @p b; (0, 0) if they never met.
    [[nodiscard]] HeadToHeadRecord get(PlayerId a, PlayerId b) const;

    /// Record of @p a against @p b on @p surface only.
    [[nodiscard]] HeadToHeadRecord getOnSurface(PlayerId a, PlayerId b, Surface surface) const;

    /// Count one win for @p winner. The per-surface tally is updated only
    /// when @p surface is given.
    [[nodiscard]] foundation::EngineResult<void> update(PlayerId winner, PlayerId loser,
                                                        std::optional<Surface> surface = std::nullopt);

    [[nodiscard]] std::size_t pairCount() const noexcept { return overall_.size(); }

private:
    struct PairKey {
        PlayerId low;
        PlayerId high;

        bool operator==(const PairKey&) const = default;
    };

    struct SurfaceKey {
        PairKey pair;
        Surface surface = Surface::Hard;

        bool operator==(const SurfaceKey&) const = default;
    };

    struct PairHash {
        std::size_t operator()(const PairKey& key) const noexcept {
            auto h1 = std::hash<int64_t>{}(key.low.value());
            auto h2 = std::hash<int64_t>{}(key.high.value());
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    struct SurfaceHash {
        std::size_t operator()(const SurfaceKey& key) const noexcept {
            return PairHash{}(key.pair) * kSurfaceCount + static_cast<std::size_t>(key.surface);
        }
    };

    /// Wins of the lower and the higher id.
    struct Tally {
        uint32_t winsLow = 0;
        uint32_t winsHigh = 0;
    };

    static PairKey makeKey(PlayerId a, PlayerId b) noexcept {
        return a < b ? PairKey{a, b} : PairKey{b, a};
    }

    static HeadToHeadRecord orient(const Tally& tally, PlayerId a, PlayerId b) noexcept;
    static void countWin(Tally& tally, PlayerId winner, const PairKey& key) noexcept;

    std::unordered_map<PairKey, Tally, PairHash> overall_;
    std::unordered_map<SurfaceKey, Tally, SurfaceHash> bySurface_;
};

} // namespace tfe::rating
