#pragma once

/// @file elo_table_validator.hpp
/// @brief Cross-checks an externally computed Elo table against replay output.
///
/// The chronological replay is the reference. A bulk or vectorized Elo
/// computation can be loaded as an ExternalEloRecord table and compared
/// row by row.

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "tfe/features/feature_vector.hpp"
#include "tfe/foundation/engine_result.hpp"

namespace tfe::persistence {

/// Pre-match Elo of both players as computed elsewhere.
struct ExternalEloRecord {
    std::string matchId;
    foundation::PlayerId p1Id;
    foundation::PlayerId p2Id;
    double p1Elo = 0.0;
    double p2Elo = 0.0;
};

struct ValidationReport {
    std::size_t compared = 0;
    std::vector<std::string> mismatched;    ///< Elo differs by more than the tolerance.
    std::vector<std::string> missing;       ///< External match id absent from the replay.
    std::vector<std::string> duplicates;    ///< External ids seen more than once.
    std::vector<std::string> mismatchedIds; ///< Same match id, different players.

    /// True when every external row matched.
    [[nodiscard]] bool consistent() const noexcept {
        return mismatched.empty() && missing.empty() && mismatchedIds.empty();
    }
};

class EloTableValidator {
public:
    explicit EloTableValidator(double tolerance = 1e-6);

    /// Compare @p external against the replay @p rows.
    ///
    /// For a duplicated external match id the first entry is used and the
    /// duplicate is logged as a warning. External rows may list the pair in
    /// either order.
    [[nodiscard]] ValidationReport validate(const std::vector<features::FeatureRow>& rows,
                                            const std::vector<ExternalEloRecord>& external) const;

    [[nodiscard]] double tolerance() const noexcept { return tolerance_; }

private:
    double tolerance_;
};

/// Read an external Elo table (`match_id`, `p1_id`, `p2_id`, `p1_elo`, `p2_elo`).
[[nodiscard]] foundation::EngineResult<std::vector<ExternalEloRecord>> readEloTable(
    std::istream& in);

[[nodiscard]] foundation::EngineResult<std::vector<ExternalEloRecord>> loadEloTable(
    const std::filesystem::path& path);

} // namespace tfe::persistence
