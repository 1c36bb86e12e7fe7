#pragma once

/// @file types.hpp
/// @brief Strong ID types and time aliases shared across the engine.

#include <chrono>
#include <cstdint>
#include <functional>

namespace tfe::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = int64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};

/// Stable player identifier resolved upstream (0 means "unset").
using PlayerId = StrongId<PlayerIdTag>;

/// UTC point in time at second resolution.
using Timestamp = std::chrono::sys_seconds;

/// Whole days elapsed from @p earlier to @p later, floored.
///
/// A match at 23:00 and another at 01:00 the next day are 0 days apart.
[[nodiscard]] constexpr int64_t wholeDaysBetween(Timestamp earlier, Timestamp later) noexcept {
    return std::chrono::floor<std::chrono::days>(later - earlier).count();
}

} // namespace tfe::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<tfe::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const tfe::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
