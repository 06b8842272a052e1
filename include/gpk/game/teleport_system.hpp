#pragma once

/// @file teleport_system.hpp
/// @brief TeleportSystem: trigger-driven relocation with arrival handshake.

#include "gpk/ecs/system_scheduler.hpp"
#include "gpk/foundation/game_result.hpp"
#include "gpk/game/contact_events.hpp"
#include "gpk/game/debug_draw.hpp"
#include "gpk/game/world_state.hpp"

#include <string_view>

namespace gpk::game {

/// Drives every Teleporter in the world.
///
/// Trigger contacts arrive through OnContact() (from ContactDispatchSystem).
/// Execute() only validates teleporters the first time it sees them; all
/// delayed work (delayed teleport, flag reset, arrival polling) runs as
/// DeferredScheduler actions that re-check liveness when they fire.
///
/// Busy flags per teleporter:
///   - isTeleporting blocks new teleports from this trigger
///   - entityInTrigger keeps isTeleporting set past the reset delay
class TeleportSystem final : public ecs::ISystem, public IContactHandler {
public:
    explicit TeleportSystem(WorldState& world);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override { return ecs::SystemStage::Update; }

    [[nodiscard]] std::string_view GetName() const override { return "TeleportSystem"; }

    /// Routes TriggerEnter / TriggerExit reported by a teleporter volume.
    void OnContact(const ContactEvent& event) override;

    /// @p entity entered @p teleporter's volume.
    void OnEntityEnter(ecs::Entity teleporter, ecs::Entity entity);

    /// @p entity left @p teleporter's volume.
    void OnEntityExit(ecs::Entity teleporter, ecs::Entity entity);

    /// Mark @p teleporter busy because @p entity was just delivered to it.
    /// The flags clear once the entity's bounds stop overlapping the
    /// trigger, checked every kArrivalPollInterval seconds.
    /// @return NotATeleporter if @p teleporter has no Teleporter component.
    foundation::GameResult<void> NotifyArrival(ecs::Entity teleporter, ecs::Entity entity);

    void DrawGizmos(IDebugDraw& draw) const;

private:
    void ensureStarted(ecs::Entity teleporter);
    [[nodiscard]] bool accepts(const Teleporter& tp, ecs::Entity entity) const;
    void beginTeleport(ecs::Entity teleporter, ecs::Entity entity);
    void teleport(ecs::Entity teleporter, ecs::Entity entity);
    void scheduleReset(ecs::Entity teleporter);
    void scheduleArrivalPoll(ecs::Entity teleporter, ecs::Entity entity);
    void pollArrival(ecs::Entity teleporter, ecs::Entity entity);

    WorldState& world_;
};

}  // namespace gpk::game
