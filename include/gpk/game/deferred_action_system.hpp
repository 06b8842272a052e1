#pragma once

/// @file deferred_action_system.hpp
/// @brief DeferredActionSystem: advances the world's DeferredScheduler.

#include "gpk/ecs/system_scheduler.hpp"
#include "gpk/foundation/deferred_scheduler.hpp"

#include <string_view>

namespace gpk::game {

/// Runs last in every tick so continuations observe this tick's movement.
class DeferredActionSystem final : public ecs::ISystem {
public:
    explicit DeferredActionSystem(foundation::DeferredScheduler& scheduler)
        : scheduler_(scheduler) {}

    void Execute(float deltaTime) override { scheduler_.advance(deltaTime); }

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PostUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "DeferredActionSystem"; }

private:
    foundation::DeferredScheduler& scheduler_;
};

}  // namespace gpk::game
