#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "tfe/foundation/engine_result.hpp"

namespace tfe::foundation {

/// YAML configuration store.
///
/// The YAML tree is flattened into a key-value map on load ("elo.k_factor",
/// "paths.matches", ...) to avoid yaml-cpp reference-semantic pitfalls.
/// Sequences stay whole under their key and can be read as std::vector<T>.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed error.
    EngineResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    EngineResult<void> loadFromString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    EngineResult<T> get(std::string_view key) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All flattened keys, sorted.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
EngineResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return EngineResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return EngineResult<T>::err(
            EngineError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace tfe::foundation
