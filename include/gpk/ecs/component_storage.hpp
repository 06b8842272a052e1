#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set component pool.
///
/// ComponentStorage<T> gives O(1) add / get / has / remove and packed
/// iteration.  The pool remembers the full handle of each owner, so a
/// stale handle whose index was recycled never sees the new owner's data.

#include "gpk/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace gpk::ecs {

/// Type-erased view so the EntityManager can drop components on destroy.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;
};

/// Sparse-set storage for one component type.
///
/// @code
///   sparse_[entity.id()] -> dense index (or kInvalidIndex)
///   dense_[index]        -> component
///   owners_[index]       -> owning Entity handle
/// @endcode
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;

    // ── Capacity ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Add (or overwrite) the component for @p entity.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");

        if (Has(entity)) {
            auto& slot = dense_[sparse_[entity.id()]];
            slot = T(std::forward<Args>(args)...);
            return slot;
        }

        ensureSparseSize(entity.id());
        sparse_[entity.id()] = static_cast<uint32_t>(dense_.size());
        dense_.emplace_back(std::forward<Args>(args)...);
        owners_.push_back(entity);
        return dense_.back();
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// Component for @p entity, or nullptr when absent.
    [[nodiscard]] T* TryGet(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* TryGet(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        if (!entity.isValid()) {
            return false;
        }
        auto eid = entity.id();
        return eid < sparse_.size() && sparse_[eid] != kInvalidIndex &&
               owners_[sparse_[eid]] == entity;
    }

    /// Swap-and-pop removal.  No-op when the entity has no component.
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            dense_[idx] = std::move(dense_[lastIdx]);
            owners_[idx] = owners_[lastIdx];
            sparse_[owners_[idx].id()] = idx;
        }

        dense_.pop_back();
        owners_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;
    }

    void Clear() override {
        dense_.clear();
        owners_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    // ── Iteration ───────────────────────────────────────────────────────

    /// Owners in dense order.  Callers that may add or remove components
    /// while iterating should copy this first.
    [[nodiscard]] const std::vector<Entity>& Entities() const noexcept { return owners_; }

    auto begin() noexcept { return dense_.begin(); }
    auto end() noexcept { return dense_.end(); }
    [[nodiscard]] auto begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] auto end() const noexcept { return dense_.end(); }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;
    std::vector<Entity> owners_;
    std::vector<uint32_t> sparse_;
};

}  // namespace gpk::ecs
