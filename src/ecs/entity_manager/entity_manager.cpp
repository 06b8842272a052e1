/// @file entity_manager.cpp
/// @brief EntityManager implementation.

#include "gpk/ecs/entity_manager.hpp"

#include <cassert>

namespace gpk::ecs {

// ── Entity lifecycle ─────────────────────────────────────────────────

Entity EntityManager::Create() {
    uint32_t index = 0;

    if (!freeList_.empty()) {
        index = freeList_.front();
        freeList_.pop_front();
        alive_[index] = true;
    } else {
        index = static_cast<uint32_t>(versions_.size());
        assert(index <= Entity::kMaxId && "Entity index space exhausted");
        versions_.push_back(0);
        alive_.push_back(true);
    }

    ++count_;
    return Entity(index, versions_[index]);
}

void EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }

    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    const auto idx = entity.id();
    alive_[idx] = false;
    // Wraps at 255; combined with kMaxId the sentinel is never produced.
    versions_[idx] = static_cast<uint8_t>(versions_[idx] + 1);
    freeList_.push_back(idx);
    --count_;
}

void EntityManager::Clear() {
    for (const auto& entity : AliveEntities()) {
        Destroy(entity);
    }
}

// ── Queries ──────────────────────────────────────────────────────────

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }
    const auto idx = entity.id();
    return idx < versions_.size() && alive_[idx] && versions_[idx] == entity.version();
}

std::vector<Entity> EntityManager::AliveEntities() const {
    std::vector<Entity> result;
    result.reserve(count_);
    for (uint32_t idx = 0; idx < versions_.size(); ++idx) {
        if (alive_[idx]) {
            result.emplace_back(idx, versions_[idx]);
        }
    }
    return result;
}

// ── Component storage registration ───────────────────────────────────

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    storages_.push_back(storage);
}

} // namespace gpk::ecs
