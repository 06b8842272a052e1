#pragma once

/// @file world_state.hpp
/// @brief Component storages and shared services for one scene.

#include "gpk/ecs/component_storage.hpp"
#include "gpk/ecs/entity.hpp"
#include "gpk/ecs/entity_manager.hpp"
#include "gpk/foundation/deferred_scheduler.hpp"
#include "gpk/game/components.hpp"
#include "gpk/game/enemy_components.hpp"
#include "gpk/game/light_components.hpp"
#include "gpk/game/teleport_components.hpp"
#include "gpk/game/world_events.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gpk::game {

constexpr uint32_t kDefaultRandomSeed = 5489u;

/// Everything the gameplay systems read and write.
///
/// Systems hold a reference to the WorldState rather than to each other;
/// entities refer to one another by handle or by name, never by pointer.
/// The storages register themselves with @c entities, so destroying an
/// entity drops all of its components.
struct WorldState {
    explicit WorldState(uint32_t randomSeed = kDefaultRandomSeed);

    WorldState(const WorldState&) = delete;
    WorldState& operator=(const WorldState&) = delete;
    WorldState(WorldState&&) = delete;
    WorldState& operator=(WorldState&&) = delete;

    // ── Entities ────────────────────────────────────────────────────

    /// Create an entity with Identity and Transform.  The first entity
    /// created under a name owns that name for FindByName().
    ecs::Entity CreateEntity(std::string name, ObjectTag tag = ObjectTag::Untagged);

    void DestroyEntity(ecs::Entity entity);

    [[nodiscard]] bool IsAlive(ecs::Entity entity) const noexcept {
        return entities.IsAlive(entity);
    }

    /// @return The live entity registered under @p name, or invalid.
    [[nodiscard]] ecs::Entity FindByName(std::string_view name) const;

    /// @return The first live entity (by index) carrying @p tag, or invalid.
    [[nodiscard]] ecs::Entity FindFirstWithTag(ObjectTag tag) const;

    /// Name for logs; "<unnamed>" when the entity has no Identity.
    [[nodiscard]] std::string NameOf(ecs::Entity entity) const;

    [[nodiscard]] ObjectTag TagOf(ecs::Entity entity) const;

    /// Walk @p entity then its Parent chain and return the first entity
    /// with a component in @p storage.
    template <typename T>
    [[nodiscard]] ecs::Entity FindInSelfOrParents(ecs::Entity entity,
                                                  const ecs::ComponentStorage<T>& storage) const;

    // ── Randomness ──────────────────────────────────────────────────

    /// Uniform float in [lo, hi]; bounds are swapped when reversed.
    float RandomRange(float lo, float hi);

    // ── Data ────────────────────────────────────────────────────────

    ecs::EntityManager entities;

    ecs::ComponentStorage<Transform> transforms;
    ecs::ComponentStorage<Identity> identities;
    ecs::ComponentStorage<Collider> colliders;
    ecs::ComponentStorage<RigidBody> rigidBodies;
    ecs::ComponentStorage<PlayerControl> playerControls;
    ecs::ComponentStorage<Parent> parents;
    ecs::ComponentStorage<Activation> activations;
    ecs::ComponentStorage<AnimatorParams> animators;
    ecs::ComponentStorage<PointLight> pointLights;
    ecs::ComponentStorage<LightDecay> lightDecays;
    ecs::ComponentStorage<Teleporter> teleporters;
    ecs::ComponentStorage<EnemyController> enemies;

    foundation::DeferredScheduler deferred;
    WorldEvents events;
    std::mt19937 rng;

    /// Name passed along with scene reload requests.
    std::string sceneName;

private:
    std::unordered_map<std::string, ecs::Entity> names_;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T>
ecs::Entity WorldState::FindInSelfOrParents(ecs::Entity entity,
                                            const ecs::ComponentStorage<T>& storage) const {
    // Depth cap guards against a malformed Parent cycle.
    constexpr int kMaxDepth = 64;
    auto current = entity;
    for (int depth = 0; depth < kMaxDepth && IsAlive(current); ++depth) {
        if (storage.Has(current)) {
            return current;
        }
        const auto* parent = parents.TryGet(current);
        if (!parent) {
            break;
        }
        current = parent->entity;
    }
    return ecs::Entity::invalid();
}

}  // namespace gpk::game
