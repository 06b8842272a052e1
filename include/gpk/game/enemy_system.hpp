#pragma once

/// @file enemy_system.hpp
/// @brief EnemySystem: movement modes, player detection and game over.

#include "gpk/ecs/system_scheduler.hpp"
#include "gpk/game/contact_events.hpp"
#include "gpk/game/debug_draw.hpp"
#include "gpk/game/world_state.hpp"

#include <string_view>

namespace gpk::game {

/// Per-tick update of every EnemyController.
///
/// Tick order for one agent:
///   1. Detection: target within detectionRange toggles playerDetected
///      and the indicator.
///   2. Pause countdown.  A paused agent does nothing else this tick.
///   3. Movement: chase the target when chasePlayer and detected,
///      otherwise the active EnemyMode.
///   4. AnimatorParams, if present.
///
/// Agents with a RigidBody only get a velocity here; BodyIntegrationSystem
/// moves them afterwards.  Once game over fires the agent is frozen.
class EnemySystem final : public ecs::ISystem, public IContactHandler {
public:
    explicit EnemySystem(WorldState& world);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override { return ecs::SystemStage::Update; }

    [[nodiscard]] std::string_view GetName() const override { return "EnemySystem"; }

    /// TriggerEnter / CollisionEnter between an enemy and anything else,
    /// reported from either side.
    void OnContact(const ContactEvent& event) override;

    /// Fire game over if @p other is a Player and the agent is armed.
    /// @return true if this call fired it.
    bool HandlePlayerContact(ecs::Entity enemy, ecs::Entity other);

    void DrawGizmos(IDebugDraw& draw) const;

private:
    void ensureStarted(ecs::Entity enemy);
    void initLineOscillate(ecs::Entity enemy, EnemyController& ctl);
    void initAreaPatrol(ecs::Entity enemy, EnemyController& ctl);
    void fallBackToIdle(ecs::Entity enemy, EnemyController& ctl);

    void tick(ecs::Entity enemy, float deltaTime);
    void detectPlayer(ecs::Entity enemy, EnemyController& ctl);
    void runMode(ecs::Entity enemy, EnemyController& ctl, float deltaTime);
    void moveTowards(ecs::Entity enemy, const Vector3& target, float deltaTime);
    void startPause(ecs::Entity enemy, EnemyController& ctl);
    void chooseNewPatrolTarget(ecs::Entity enemy, EnemyController& ctl);
    void updateAnimator(ecs::Entity enemy, const EnemyController& ctl);
    void setIndicator(const EnemyController& ctl, bool active);
    void triggerGameOver(ecs::Entity enemy, ecs::Entity contact);

    WorldState& world_;
};

}  // namespace gpk::game
