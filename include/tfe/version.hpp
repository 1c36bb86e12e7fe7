#pragma once

/// @file version.hpp
/// @brief Engine version and feature table schema version.
///
/// The schema version changes whenever a column is added, removed,
/// renamed or reordered in the feature table, so downstream consumers can
/// reject tables built by an incompatible engine.

#define TFE_VERSION_MAJOR 0
#define TFE_VERSION_MINOR 1
#define TFE_VERSION_PATCH 0
#define TFE_VERSION_STRING "0.1.0"

#define TFE_FEATURE_SCHEMA_VERSION 1

namespace tfe {

struct Version {
    static constexpr int major = TFE_VERSION_MAJOR;
    static constexpr int minor = TFE_VERSION_MINOR;
    static constexpr int patch = TFE_VERSION_PATCH;
    static constexpr const char* string = TFE_VERSION_STRING;

    /// Layout revision of FeatureTableWriter::header().
    static constexpr int featureSchema = TFE_FEATURE_SCHEMA_VERSION;
};

} // namespace tfe
