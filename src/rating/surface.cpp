/// @file surface.cpp
/// @brief Surface tag parsing and tournament-name heuristics.

#include "tfe/rating/rating_types.hpp"

#include <algorithm>
#include <cctype>

namespace tfe::rating {

namespace {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

constexpr std::array<std::string_view, 5> kGrassKeywords = {
    "wimbledon", "queens club", "halle", "'s-hertogenbosch", "newport"};

constexpr std::array<std::string_view, 5> kClayKeywords = {
    "roland garros", "french open", "monte carlo", "madrid", "rome"};

bool containsAny(const std::string& haystack, const auto& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

} // namespace

std::optional<Surface> parseSurfaceTag(std::string_view tag) {
    auto trimmed = trim(tag);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    auto lower = toLower(trimmed);
    if (lower == "hard") return Surface::Hard;
    if (lower == "clay") return Surface::Clay;
    if (lower == "grass") return Surface::Grass;
    return Surface::Unknown;
}

Surface deriveSurface(std::optional<std::string_view> explicitTag,
                      std::optional<std::string_view> tourneyName) {
    if (explicitTag) {
        if (auto parsed = parseSurfaceTag(*explicitTag)) {
            return *parsed;
        }
    }

    if (!tourneyName || trim(*tourneyName).empty()) {
        return Surface::Unknown;
    }

    auto name = toLower(*tourneyName);

    if (name.find("(clay)") != std::string::npos) return Surface::Clay;
    if (name.find("(grass)") != std::string::npos) return Surface::Grass;
    if (name.find("(hard)") != std::string::npos) return Surface::Hard;

    if (containsAny(name, kGrassKeywords)) return Surface::Grass;
    if (containsAny(name, kClayKeywords)) return Surface::Clay;

    return Surface::Hard;
}

} // namespace tfe::rating
