#pragma once

/// @file live_query_adapter.hpp
/// @brief Serves feature queries for upcoming matches from a published snapshot.

#include <memory>
#include <mutex>
#include <string>

#include "tfe/features/feature_vector.hpp"
#include "tfe/foundation/engine_result.hpp"
#include "tfe/replay/tracker_snapshot.hpp"

namespace tfe::replay {

/// Thread-safe read path over an immutable TrackerSnapshot.
///
/// Queries share the batch replay's FeatureAssembler and never mutate the
/// snapshot. publish() swaps the pointer under a mutex; a query already in
/// progress keeps the snapshot it started with.
class LiveQueryAdapter {
public:
    LiveQueryAdapter() = default;
    explicit LiveQueryAdapter(std::shared_ptr<const TrackerSnapshot> snapshot);

    LiveQueryAdapter(const LiveQueryAdapter&) = delete;
    LiveQueryAdapter& operator=(const LiveQueryAdapter&) = delete;

    /// Replace the served snapshot.
    /// @return InvalidArgument for a null snapshot.
    foundation::EngineResult<void> publish(std::shared_ptr<const TrackerSnapshot> snapshot);

    /// Currently served snapshot (may be null before the first publish).
    [[nodiscard]] std::shared_ptr<const TrackerSnapshot> snapshot() const;

    /// Features for a prospective match.
    ///
    /// @return SnapshotNotReady before the first publish; InvalidArgument
    ///         for unset or identical ids; LookaheadViolation when @p date is
    ///         at or before the snapshot's watermark.
    [[nodiscard]] foundation::EngineResult<features::FeatureVector> query(
        foundation::PlayerId p1, foundation::PlayerId p2, rating::Surface surface,
        foundation::Timestamp date, std::string matchId = {}) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const TrackerSnapshot> snapshot_;
};

} // namespace tfe::replay
