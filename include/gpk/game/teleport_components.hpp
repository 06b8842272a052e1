#pragma once

/// @file teleport_components.hpp
/// @brief Teleporter component and timing constants.

#include "gpk/ecs/entity.hpp"
#include "gpk/foundation/deferred_scheduler.hpp"
#include "gpk/game/object_types.hpp"

#include <string>

namespace gpk::game {

/// Interval between overlap checks after an arrival notification.
constexpr float kArrivalPollInterval = 1.5f;

/// Delay before a teleporter that just fired may fire again.
constexpr float kTeleportResetDelay = 1.0f;

constexpr float kDestinationMarkerRadius = 0.5f;
constexpr float kDestinationRayLength = 2.0f;

/// Trigger volume that relocates entities entering it.
///
/// The owner needs a trigger Collider.  The destination is any entity
/// with a Transform; if it (or an ancestor) is itself a teleporter, that
/// teleporter is told about the arrival so it does not bounce the entity
/// straight back.
struct Teleporter {
    // ── Authoring ───────────────────────────────────────────────────
    ecs::Entity destination;
    float delay = 0.0f;
    bool matchRotation = false;
    std::string sound;   ///< Clip requested on teleport start; empty for none.
    std::string effect;  ///< Effect spawned at the destination; empty for none.
    ObjectTag acceptTag = ObjectTag::Player;

    // ── Runtime ─────────────────────────────────────────────────────
    bool isTeleporting = false;
    bool entityInTrigger = false;
    bool started = false;
    foundation::DeferredScheduler::ActionId arrivalPoll = 0;  ///< 0 when idle.
};

}  // namespace gpk::game
