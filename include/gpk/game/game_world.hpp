#pragma once

/// @file game_world.hpp
/// @brief GameWorld: one scene's entities, systems and tick driver.
///
/// GameWorld owns the WorldState, wires the gameplay systems into a
/// SystemScheduler and exposes an explicit Tick().  The host feeds
/// contacts through PushContact() and listens on Events().

#include "gpk/ecs/entity.hpp"
#include "gpk/foundation/game_result.hpp"
#include "gpk/game/contact_events.hpp"
#include "gpk/game/debug_draw.hpp"
#include "gpk/game/object_types.hpp"
#include "gpk/game/world_events.hpp"
#include "gpk/game/world_state.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace gpk::game {

class TeleportSystem;
class LightDecaySystem;
class EnemySystem;

// -- Configuration -----------------------------------------------------------

struct GameWorldConfig {
    /// Passed along with scene reload requests.
    std::string sceneName = "main";

    /// Seed for duration and patrol-point sampling.
    uint32_t randomSeed = kDefaultRandomSeed;
};

// -- Game World --------------------------------------------------------------

/// Usage:
/// @code
///   GameWorld world(GameWorldConfig{"level01", 42});
///   auto player = world.CreateEntity("Player", ObjectTag::Player);
///   ...
///   world.PushContact({ContactKind::TriggerEnter, door, player});
///   auto r = world.Tick(1.0f / 60.0f);
/// @endcode
///
/// Each tick runs:
///   PreUpdate : ContactDispatchSystem
///   Update    : TeleportSystem, LightDecaySystem, EnemySystem,
///               BodyIntegrationSystem
///   PostUpdate: DeferredActionSystem
class GameWorld {
public:
    explicit GameWorld(GameWorldConfig config = {});
    ~GameWorld();

    GameWorld(const GameWorld&) = delete;
    GameWorld& operator=(const GameWorld&) = delete;
    GameWorld(GameWorld&&) noexcept;
    GameWorld& operator=(GameWorld&&) noexcept;

    // -- Entities -------------------------------------------------------------

    ecs::Entity CreateEntity(std::string name, ObjectTag tag = ObjectTag::Untagged);
    void DestroyEntity(ecs::Entity entity);
    [[nodiscard]] ecs::Entity FindByName(std::string_view name) const;
    [[nodiscard]] bool IsAlive(ecs::Entity entity) const;

    /// Storages and shared services.
    [[nodiscard]] WorldState& State() noexcept;
    [[nodiscard]] const WorldState& State() const noexcept;

    [[nodiscard]] WorldEvents& Events() noexcept;

    // -- Simulation -----------------------------------------------------------

    /// Queue a contact for the next tick's dispatch.
    void PushContact(const ContactEvent& event);

    /// Run every stage once with @p deltaTime simulated seconds.
    /// @return CircularDependency if the system graph cannot be ordered.
    foundation::GameResult<void> Tick(float deltaTime);

    [[nodiscard]] double ElapsedTime() const noexcept;
    [[nodiscard]] uint64_t TickCount() const noexcept;

    /// Forward gizmo drawing to the teleport and enemy systems.
    void DrawGizmos(IDebugDraw& draw) const;

    // -- Systems --------------------------------------------------------------

    [[nodiscard]] TeleportSystem& Teleports() noexcept;
    [[nodiscard]] LightDecaySystem& Lights() noexcept;
    [[nodiscard]] EnemySystem& Enemies() noexcept;

    [[nodiscard]] const GameWorldConfig& Config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gpk::game
