#pragma once

/// @file feature_table_writer.hpp
/// @brief Writes the derived feature table as CSV.

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "tfe/features/feature_vector.hpp"
#include "tfe/foundation/engine_result.hpp"

namespace tfe::persistence {

/// CSV serialization of FeatureRow.
///
/// Doubles are written in shortest round-trip form, so two replays over the
/// same input produce byte-identical files.
class FeatureTableWriter {
public:
    FeatureTableWriter() = delete;

    /// Comma-separated column names, no trailing newline.
    [[nodiscard]] static std::string header();

    /// Number of columns in header() and every row.
    [[nodiscard]] static std::size_t columnCount();

    /// One row in header() order, no trailing newline.
    [[nodiscard]] static std::string formatRow(const features::FeatureRow& row);

    /// Write header and rows to @p out.
    /// @return TableWriteFailed if the stream goes bad.
    [[nodiscard]] static foundation::EngineResult<void> write(
        std::ostream& out, const std::vector<features::FeatureRow>& rows);

    /// Write to `<path>.tmp`, then rename over @p path. On failure the
    /// temporary file is removed and @p path is left untouched.
    /// @return TableWriteFailed or TableCommitFailed.
    [[nodiscard]] static foundation::EngineResult<void> write(
        const std::filesystem::path& path, const std::vector<features::FeatureRow>& rows);
};

} // namespace tfe::persistence
