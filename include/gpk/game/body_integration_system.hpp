#pragma once

/// @file body_integration_system.hpp
/// @brief BodyIntegrationSystem: moves RigidBody owners by their velocity.

#include "gpk/ecs/component_storage.hpp"
#include "gpk/ecs/system_scheduler.hpp"
#include "gpk/game/components.hpp"

#include <string_view>

namespace gpk::game {

/// Integrates position += velocity * dt for every entity with both a
/// Transform and a RigidBody.  No gravity and no collision response; the
/// host physics layer owns those.
///
/// Registered after EnemySystem so velocities chosen this tick apply
/// this tick.
class BodyIntegrationSystem final : public ecs::ISystem {
public:
    /// The storages must outlive this system.
    BodyIntegrationSystem(ecs::ComponentStorage<Transform>& transforms,
                          ecs::ComponentStorage<RigidBody>& bodies);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override { return ecs::SystemStage::Update; }

    [[nodiscard]] std::string_view GetName() const override { return "BodyIntegrationSystem"; }

private:
    ecs::ComponentStorage<Transform>& transforms_;
    ecs::ComponentStorage<RigidBody>& bodies_;
};

}  // namespace gpk::game
