#pragma once

/// @file object_types.hpp
/// @brief Object tags shared by the gameplay systems.

#include <cstdint>
#include <optional>
#include <string_view>

namespace gpk::game {

/// Classification tag used by triggers and detection to pick targets.
enum class ObjectTag : uint8_t {
    Untagged,
    Player,
    Enemy
};

constexpr std::string_view objectTagName(ObjectTag tag) {
    switch (tag) {
        case ObjectTag::Untagged: return "Untagged";
        case ObjectTag::Player:   return "Player";
        case ObjectTag::Enemy:    return "Enemy";
    }
    return "Untagged";
}

/// Exact, case-sensitive match on the tag name.
constexpr std::optional<ObjectTag> parseObjectTag(std::string_view name) {
    for (auto tag : {ObjectTag::Untagged, ObjectTag::Player, ObjectTag::Enemy}) {
        if (objectTagName(tag) == name) {
            return tag;
        }
    }
    return std::nullopt;
}

}  // namespace gpk::game
