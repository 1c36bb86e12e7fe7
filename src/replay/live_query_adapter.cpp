/// @file live_query_adapter.cpp
/// @brief LiveQueryAdapter implementation.

#include "tfe/replay/live_query_adapter.hpp"

#include <utility>

#include "tfe/foundation/engine_logger.hpp"
#include "tfe/foundation/time_utils.hpp"

namespace tfe::replay {

using foundation::EngineError;
using foundation::EngineResult;
using foundation::ErrorCode;
using foundation::LogCategory;

LiveQueryAdapter::LiveQueryAdapter(std::shared_ptr<const TrackerSnapshot> snapshot)
    : snapshot_(std::move(snapshot)) {}

EngineResult<void> LiveQueryAdapter::publish(std::shared_ptr<const TrackerSnapshot> snapshot) {
    if (!snapshot) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::InvalidArgument, "cannot publish a null snapshot"));
    }
    std::string watermark =
        snapshot->watermark ? foundation::formatTimestamp(*snapshot->watermark) : "none";
    {
        std::lock_guard lock(mutex_);
        snapshot_ = std::move(snapshot);
    }
    TFE_LOG_INFO(LogCategory::Live, "Published snapshot, watermark " + watermark);
    return EngineResult<void>::ok();
}

std::shared_ptr<const TrackerSnapshot> LiveQueryAdapter::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_;
}

EngineResult<features::FeatureVector> LiveQueryAdapter::query(
    foundation::PlayerId p1, foundation::PlayerId p2, rating::Surface surface,
    foundation::Timestamp date, std::string matchId) const {
    using Out = EngineResult<features::FeatureVector>;

    auto current = snapshot();
    if (!current) {
        return Out::err(EngineError(ErrorCode::SnapshotNotReady, "no snapshot published yet"));
    }
    if (!p1.isValid() || !p2.isValid() || p1 == p2) {
        return Out::err(EngineError(ErrorCode::InvalidArgument,
                                    "query needs two distinct player ids"));
    }
    if (current->watermark && date <= *current->watermark) {
        return Out::err(EngineError(
            ErrorCode::LookaheadViolation,
            "query date " + foundation::formatTimestamp(date) +
                " is not after snapshot watermark " +
                foundation::formatTimestamp(*current->watermark)));
    }

    return Out::ok(current->assembler().build(p1, p2, surface, date, std::move(matchId)));
}

} // namespace tfe::replay
