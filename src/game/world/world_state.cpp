/// @file world_state.cpp
/// @brief WorldState: storage registration, naming and random sampling.

#include "gpk/game/world_state.hpp"

#include <algorithm>
#include <utility>

namespace gpk::game {

WorldState::WorldState(uint32_t randomSeed) : rng(randomSeed) {
    entities.RegisterStorage(&transforms);
    entities.RegisterStorage(&identities);
    entities.RegisterStorage(&colliders);
    entities.RegisterStorage(&rigidBodies);
    entities.RegisterStorage(&playerControls);
    entities.RegisterStorage(&parents);
    entities.RegisterStorage(&activations);
    entities.RegisterStorage(&animators);
    entities.RegisterStorage(&pointLights);
    entities.RegisterStorage(&lightDecays);
    entities.RegisterStorage(&teleporters);
    entities.RegisterStorage(&enemies);
}

// ── Entities ────────────────────────────────────────────────────────────

ecs::Entity WorldState::CreateEntity(std::string name, ObjectTag tag) {
    auto entity = entities.Create();
    transforms.Add(entity);

    if (!name.empty()) {
        auto it = names_.find(name);
        if (it == names_.end() || !IsAlive(it->second)) {
            names_[name] = entity;
        }
    }
    identities.Add(entity, Identity{std::move(name), tag});
    return entity;
}

void WorldState::DestroyEntity(ecs::Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    if (const auto* id = identities.TryGet(entity)) {
        auto it = names_.find(id->name);
        if (it != names_.end() && it->second == entity) {
            names_.erase(it);
        }
    }
    entities.Destroy(entity);
}

ecs::Entity WorldState::FindByName(std::string_view name) const {
    auto it = names_.find(std::string(name));
    if (it == names_.end() || !IsAlive(it->second)) {
        return ecs::Entity::invalid();
    }
    return it->second;
}

ecs::Entity WorldState::FindFirstWithTag(ObjectTag tag) const {
    auto best = ecs::Entity::invalid();
    for (auto entity : identities.Entities()) {
        if (identities.Get(entity).tag != tag || !IsAlive(entity)) {
            continue;
        }
        if (!best.isValid() || entity.id() < best.id()) {
            best = entity;
        }
    }
    return best;
}

std::string WorldState::NameOf(ecs::Entity entity) const {
    const auto* id = identities.TryGet(entity);
    if (!id || id->name.empty()) {
        return "<unnamed>";
    }
    return id->name;
}

ObjectTag WorldState::TagOf(ecs::Entity entity) const {
    const auto* id = identities.TryGet(entity);
    return id ? id->tag : ObjectTag::Untagged;
}

// ── Randomness ──────────────────────────────────────────────────────────

float WorldState::RandomRange(float lo, float hi) {
    if (hi < lo) {
        std::swap(lo, hi);
    }
    if (hi == lo) {
        return lo;
    }
    std::uniform_real_distribution<float> dist(lo, hi);
    return std::min(dist(rng), hi);
}

}  // namespace gpk::game
