#include "tfe/foundation/config_manager.hpp"

#include <algorithm>

namespace tfe::foundation {

EngineResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return EngineResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

EngineResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return EngineResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return EngineResult<void>::err(
            EngineError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keys() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, node] : entries_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        // Scalars, sequences and nulls are stored whole under their dotted key.
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace tfe::foundation
