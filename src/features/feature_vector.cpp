/// @file feature_vector.cpp
/// @brief FeatureVector helpers.

#include "tfe/features/feature_vector.hpp"

#include <utility>

namespace tfe::features {

FeatureVector FeatureVector::mirrored() const {
    FeatureVector out = *this;
    std::swap(out.p1Id, out.p2Id);
    std::swap(out.p1, out.p2);
    out.rankDiff = -rankDiff;
    out.eloDiff = -eloDiff;
    out.eloMomentumDiff = -eloMomentumDiff;
    out.fatigueDiff7Days = -fatigueDiff7Days;
    out.fatigueDiff14Days = -fatigueDiff14Days;
    out.setsDiff7Days = -setsDiff7Days;
    out.setsDiff14Days = -setsDiff14Days;
    out.restDiff = -restDiff;
    return out;
}

} // namespace tfe::features
