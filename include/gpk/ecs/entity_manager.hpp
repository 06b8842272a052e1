#pragma once

/// @file entity_manager.hpp
/// @brief Entity creation, recycling and liveness.

#include "gpk/ecs/component_storage.hpp"
#include "gpk/ecs/entity.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace gpk::ecs {

/// Owns entity lifetimes.
///
/// Destroyed indices go to a FIFO free list and come back with a bumped
/// version.  Registered storages are cleaned up on Destroy(), so a dead
/// entity never leaves components behind.
class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Create a new entity, recycling the oldest free index if any.
    [[nodiscard]] Entity Create();

    /// Destroy @p entity and drop its components.  No-op when dead.
    void Destroy(Entity entity);

    /// Destroy every live entity.
    void Clear();

    // ── Queries ──────────────────────────────────────────────────────

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    /// Live entities in index order.
    [[nodiscard]] std::vector<Entity> AliveEntities() const;

    // ── Component storage registration ───────────────────────────────

    /// The manager does not own @p storage; it must outlive the manager.
    void RegisterStorage(IComponentStorage* storage);

private:
    std::vector<uint8_t> versions_;
    std::vector<bool> alive_;
    std::deque<uint32_t> freeList_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

}  // namespace gpk::ecs
