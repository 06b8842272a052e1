/// @file teleport_system.cpp
/// @brief TeleportSystem implementation.

#include "gpk/game/teleport_system.hpp"

#include "gpk/foundation/game_logger.hpp"

#include <string>

namespace gpk::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

TeleportSystem::TeleportSystem(WorldState& world) : world_(world) {}

void TeleportSystem::Execute(float /*deltaTime*/) {
    const auto owners = world_.teleporters.Entities();
    for (auto teleporter : owners) {
        ensureStarted(teleporter);
    }
}

// ── Contacts ────────────────────────────────────────────────────────────

void TeleportSystem::OnContact(const ContactEvent& event) {
    if (!world_.teleporters.Has(event.self)) {
        return;
    }
    switch (event.kind) {
        case ContactKind::TriggerEnter:
            OnEntityEnter(event.self, event.other);
            break;
        case ContactKind::TriggerExit:
            OnEntityExit(event.self, event.other);
            break;
        case ContactKind::CollisionEnter:
            break;
    }
}

void TeleportSystem::OnEntityEnter(ecs::Entity teleporter, ecs::Entity entity) {
    if (!world_.IsAlive(entity) || !world_.teleporters.Has(teleporter)) {
        return;
    }
    ensureStarted(teleporter);

    auto& tp = world_.teleporters.Get(teleporter);
    if (!accepts(tp, entity)) {
        return;
    }

    tp.entityInTrigger = true;
    if (!tp.isTeleporting) {
        beginTeleport(teleporter, entity);
    }
}

void TeleportSystem::OnEntityExit(ecs::Entity teleporter, ecs::Entity entity) {
    auto* tp = world_.teleporters.TryGet(teleporter);
    if (!tp || !accepts(*tp, entity)) {
        return;
    }
    tp->entityInTrigger = false;
    tp->isTeleporting = false;
}

GameResult<void> TeleportSystem::NotifyArrival(ecs::Entity teleporter, ecs::Entity entity) {
    auto* tp = world_.teleporters.TryGet(teleporter);
    if (!tp) {
        return GameResult<void>::err(GameError(
            ErrorCode::NotATeleporter, "has no Teleporter", world_.NameOf(teleporter)));
    }

    tp->isTeleporting = true;
    tp->entityInTrigger = true;

    if (tp->arrivalPoll != 0) {
        auto cancelled = world_.deferred.cancel(tp->arrivalPoll);
        if (!cancelled) {
            GPK_LOG_DEBUG(LogCategory::Teleport, std::string(cancelled.error().message()));
        }
        tp->arrivalPoll = 0;
    }
    scheduleArrivalPoll(teleporter, entity);
    return GameResult<void>::ok();
}

// ── Gizmos ──────────────────────────────────────────────────────────────

void TeleportSystem::DrawGizmos(IDebugDraw& draw) const {
    for (auto teleporter : world_.teleporters.Entities()) {
        const auto* transform = world_.transforms.TryGet(teleporter);
        if (!transform) {
            continue;
        }
        const auto& tp = world_.teleporters.Get(teleporter);

        const auto* dest = world_.IsAlive(tp.destination)
                               ? world_.transforms.TryGet(tp.destination)
                               : nullptr;
        if (dest) {
            draw.DrawLine(transform->position, dest->position, GizmoColor::Cyan);
            draw.DrawWireSphere(dest->position, kDestinationMarkerRadius, GizmoColor::Green);
            draw.DrawRay(dest->position, Vector3::Up() * kDestinationRayLength, GizmoColor::Green);
        }

        if (const auto* collider = world_.colliders.TryGet(teleporter)) {
            const auto bounds = WorldBounds(*transform, *collider);
            draw.DrawWireCube(bounds.center, bounds.Size(), GizmoColor::Yellow);
        }
    }
}

// ── Private ─────────────────────────────────────────────────────────────

void TeleportSystem::ensureStarted(ecs::Entity teleporter) {
    auto& tp = world_.teleporters.Get(teleporter);
    if (tp.started) {
        return;
    }
    tp.started = true;

    const auto name = world_.NameOf(teleporter);
    const auto* collider = world_.colliders.TryGet(teleporter);
    if (!collider) {
        GPK_LOG_ERROR(LogCategory::Teleport,
                      "Teleporter '" + name + "' requires a Collider set as trigger");
    } else if (!collider->isTrigger) {
        GPK_LOG_WARN(LogCategory::Teleport,
                     "Teleporter '" + name + "' collider should be a trigger");
    }

    if (!world_.IsAlive(tp.destination)) {
        GPK_LOG_ERROR(LogCategory::Teleport,
                      "Teleporter '" + name + "' has no teleport destination assigned");
    }
}

bool TeleportSystem::accepts(const Teleporter& tp, ecs::Entity entity) const {
    return world_.TagOf(entity) == tp.acceptTag;
}

void TeleportSystem::beginTeleport(ecs::Entity teleporter, ecs::Entity entity) {
    auto& tp = world_.teleporters.Get(teleporter);
    if (!world_.IsAlive(tp.destination)) {
        GPK_LOG_ERROR(LogCategory::Teleport, "Cannot teleport: no destination assigned to '" +
                                                 world_.NameOf(teleporter) + "'");
        return;
    }

    tp.isTeleporting = true;
    const float delay = tp.delay;
    const std::string sound = tp.sound;

    if (!sound.empty()) {
        world_.events.soundRequested.emit(teleporter, sound);
    }

    if (delay <= 0.0f) {
        teleport(teleporter, entity);
        return;
    }

    auto scheduled = world_.deferred.schedule(delay, [this, teleporter, entity] {
        if (!world_.teleporters.Has(teleporter) || !world_.IsAlive(entity)) {
            return;
        }
        teleport(teleporter, entity);
    });
    if (!scheduled) {
        GPK_LOG_ERROR(LogCategory::Teleport, std::string(scheduled.error().message()));
    }
}

void TeleportSystem::teleport(ecs::Entity teleporter, ecs::Entity entity) {
    const auto destination = world_.teleporters.Get(teleporter).destination;
    const auto* dest = world_.IsAlive(destination) ? world_.transforms.TryGet(destination)
                                                   : nullptr;
    if (!dest) {
        GPK_LOG_ERROR(LogCategory::Teleport, "Cannot teleport: destination of '" +
                                                 world_.NameOf(teleporter) + "' is gone");
        return;
    }

    auto* body = world_.transforms.TryGet(entity);
    if (!body) {
        GPK_LOG_WARN(LogCategory::Teleport,
                     "Cannot teleport '" + world_.NameOf(entity) + "': no Transform");
        return;
    }

    const Vector3 destPosition = dest->position;
    const Quaternion destRotation = dest->rotation;
    const auto& tp = world_.teleporters.Get(teleporter);

    body->position = destPosition;
    if (tp.matchRotation) {
        body->rotation = destRotation;
    }

    // Copy out before emitting; slots may touch the storages.
    const std::string effect = tp.effect;
    if (!effect.empty()) {
        world_.events.effectRequested.emit(effect, destPosition, destRotation);
    }

    auto partner = world_.FindInSelfOrParents(destination, world_.teleporters);
    if (partner.isValid() && partner != teleporter) {
        auto notified = NotifyArrival(partner, entity);
        if (!notified) {
            GPK_LOG_WARN(LogCategory::Teleport, notified.error().describe());
        }
    }

    scheduleReset(teleporter);

    world_.events.teleported.emit(entity, destination);
    GPK_LOG_INFO(LogCategory::Teleport, world_.NameOf(entity) + " teleported to: " +
                                            world_.NameOf(destination));
}

void TeleportSystem::scheduleReset(ecs::Entity teleporter) {
    auto scheduled = world_.deferred.schedule(kTeleportResetDelay, [this, teleporter] {
        auto* tp = world_.teleporters.TryGet(teleporter);
        if (tp && !tp->entityInTrigger) {
            tp->isTeleporting = false;
        }
    });
    if (!scheduled) {
        GPK_LOG_ERROR(LogCategory::Teleport, std::string(scheduled.error().message()));
    }
}

void TeleportSystem::scheduleArrivalPoll(ecs::Entity teleporter, ecs::Entity entity) {
    auto scheduled = world_.deferred.schedule(kArrivalPollInterval, [this, teleporter, entity] {
        pollArrival(teleporter, entity);
    });
    if (!scheduled) {
        GPK_LOG_ERROR(LogCategory::Teleport, std::string(scheduled.error().message()));
        return;
    }
    world_.teleporters.Get(teleporter).arrivalPoll = scheduled.value();
}

void TeleportSystem::pollArrival(ecs::Entity teleporter, ecs::Entity entity) {
    auto* tp = world_.teleporters.TryGet(teleporter);
    if (!tp) {
        return;
    }
    tp->arrivalPoll = 0;

    const auto* trigger = world_.colliders.TryGet(teleporter);
    const auto* triggerTransform = world_.transforms.TryGet(teleporter);
    const auto* arrived = world_.IsAlive(entity) ? world_.colliders.TryGet(entity) : nullptr;
    const auto* arrivedTransform = world_.transforms.TryGet(entity);

    if (!trigger || !triggerTransform || !arrived || !arrivedTransform) {
        tp->entityInTrigger = false;
        tp->isTeleporting = false;
        return;
    }

    const auto triggerBounds = WorldBounds(*triggerTransform, *trigger);
    const auto arrivedBounds = WorldBounds(*arrivedTransform, *arrived);
    if (!triggerBounds.Intersects(arrivedBounds)) {
        tp->entityInTrigger = false;
        tp->isTeleporting = false;
        return;
    }

    scheduleArrivalPoll(teleporter, entity);
}

}  // namespace gpk::game
