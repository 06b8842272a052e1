#pragma once

/// @file entity.hpp
/// @brief Entity handle for the ECS layer.
///
/// A 32-bit value: the low 24 bits index into component storages, the high
/// 8 bits are a generation counter so a recycled index does not resurrect
/// stale handles held by deferred actions or components.

#include <cstdint>
#include <functional>
#include <limits>

namespace gpk::ecs {

/// Compact entity handle (24-bit index, 8-bit version).
struct Entity {
    uint32_t raw = kInvalidRaw;

    static constexpr uint32_t kIdBits = 24;
    static constexpr uint32_t kIdMask = (1u << kIdBits) - 1;
    static constexpr uint32_t kVersionShift = kIdBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxId = kIdMask - 1;

    constexpr Entity() = default;

    constexpr Entity(uint32_t id, uint8_t version)
        : raw((static_cast<uint32_t>(version) << kVersionShift) | (id & kIdMask)) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return raw & kIdMask; }

    [[nodiscard]] constexpr uint8_t version() const noexcept {
        return static_cast<uint8_t>(raw >> kVersionShift);
    }

    /// False for the default-constructed sentinel.  A valid handle may
    /// still refer to a destroyed entity; ask the EntityManager.
    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace gpk::ecs

template <>
struct std::hash<gpk::ecs::Entity> {
    std::size_t operator()(const gpk::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
