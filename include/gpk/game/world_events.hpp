#pragma once

/// @file world_events.hpp
/// @brief Outbound requests the gameplay systems make to the host.

#include "gpk/ecs/entity.hpp"
#include "gpk/foundation/signal.hpp"
#include "gpk/game/math_types.hpp"

#include <string>

namespace gpk::game {

/// Signals for effects the library does not perform itself: audio,
/// particle spawns, scene reloads.  Connected by the host or by tests.
struct WorldEvents {
    /// (entity, destination) after a teleport completes.
    foundation::Signal<ecs::Entity, ecs::Entity> teleported;

    /// (source entity, clip name).
    foundation::Signal<ecs::Entity, const std::string&> soundRequested;

    /// (effect name, position, rotation).
    foundation::Signal<const std::string&, const Vector3&, const Quaternion&> effectRequested;

    /// (enemy, message) the moment game over fires.
    foundation::Signal<ecs::Entity, const std::string&> gameOver;

    /// (scene name) once the game-over delay has elapsed.
    foundation::Signal<const std::string&> sceneReloadRequested;
};

}  // namespace gpk::game
