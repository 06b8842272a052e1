#pragma once

/// @file query.hpp
/// @brief Multi-component iteration over ComponentStorage pools.

#include <tuple>
#include <vector>

#include "gpk/ecs/component_storage.hpp"
#include "gpk/ecs/entity.hpp"

namespace gpk::ecs {

/// Iterates entities that own every component in Includes...
///
/// The first storage drives iteration.  Its owner list is snapshotted
/// before the callback runs, so callbacks may add or remove components
/// (including on the entity being visited); entities that lose a required
/// component mid-iteration are skipped.
///
/// @code
///   Query<Transform, EnemyController> q(transforms, enemies);
///   q.ForEach([](Entity e, Transform& t, EnemyController& ctl) {
///       ...
///   });
/// @endcode
template <typename... Includes>
class Query {
    static_assert(sizeof...(Includes) > 0, "Query must have at least one component type");

public:
    explicit Query(ComponentStorage<Includes>&... storages)
        : storages_{&storages...} {}

    /// Invoke @p func(entity, components&...) for every match.
    template <typename Func>
    void ForEach(Func&& func) {
        const auto candidates = std::get<0>(storages_)->Entities();
        for (Entity e : candidates) {
            if (!Matches(e)) {
                continue;
            }
            func(e, std::get<ComponentStorage<Includes>*>(storages_)->Get(e)...);
        }
    }

    /// Matching entities at the time of the call.
    [[nodiscard]] std::vector<Entity> Collect() const {
        std::vector<Entity> result;
        for (Entity e : std::get<0>(storages_)->Entities()) {
            if (Matches(e)) {
                result.push_back(e);
            }
        }
        return result;
    }

    [[nodiscard]] bool Matches(Entity e) const {
        return (std::get<ComponentStorage<Includes>*>(storages_)->Has(e) && ...);
    }

private:
    std::tuple<ComponentStorage<Includes>*...> storages_;
};

}  // namespace gpk::ecs
