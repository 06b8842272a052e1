/// @file enemy_system.cpp
/// @brief EnemySystem implementation.

#include "gpk/game/enemy_system.hpp"

#include "gpk/foundation/game_logger.hpp"

#include <algorithm>
#include <string>
#include <type_traits>

namespace gpk::game {

using foundation::LogCategory;

EnemySystem::EnemySystem(WorldState& world) : world_(world) {}

void EnemySystem::Execute(float deltaTime) {
    const auto owners = world_.enemies.Entities();
    for (auto enemy : owners) {
        if (!world_.enemies.Has(enemy)) {
            continue;
        }
        ensureStarted(enemy);
        if (world_.enemies.Get(enemy).gameOverTriggered) {
            continue;
        }
        tick(enemy, deltaTime);
    }
}

// ── Contacts ────────────────────────────────────────────────────────────

void EnemySystem::OnContact(const ContactEvent& event) {
    if (event.kind == ContactKind::TriggerExit) {
        return;
    }
    if (world_.enemies.Has(event.self)) {
        HandlePlayerContact(event.self, event.other);
    } else if (world_.enemies.Has(event.other)) {
        HandlePlayerContact(event.other, event.self);
    }
}

bool EnemySystem::HandlePlayerContact(ecs::Entity enemy, ecs::Entity other) {
    if (!world_.enemies.Has(enemy) || !world_.IsAlive(other)) {
        return false;
    }
    ensureStarted(enemy);

    const auto& ctl = world_.enemies.Get(enemy);
    if (world_.TagOf(other) != ObjectTag::Player || !ctl.config.causesGameOver ||
        ctl.gameOverTriggered) {
        return false;
    }
    triggerGameOver(enemy, other);
    return true;
}

// ── Gizmos ──────────────────────────────────────────────────────────────

void EnemySystem::DrawGizmos(IDebugDraw& draw) const {
    for (auto enemy : world_.enemies.Entities()) {
        const auto* transform = world_.transforms.TryGet(enemy);
        if (!transform) {
            continue;
        }
        const auto& ctl = world_.enemies.Get(enemy);
        draw.DrawWireSphere(transform->position, ctl.config.detectionRange, GizmoColor::Red);

        if (const auto* line = std::get_if<LineOscillateMode>(&ctl.mode)) {
            draw.DrawLine(line->start, line->end, GizmoColor::Blue);
            draw.DrawWireSphere(ctl.targetPosition, kEnemyTargetMarkerRadius, GizmoColor::Green);
        } else if (!ctl.started && ctl.config.type == EnemyType::LineOscillate) {
            // Preview of the segment before the first tick.
            const auto dir = ctl.config.lineDirection.Normalized();
            const auto half = dir * (ctl.config.lineDistance * 0.5f);
            draw.DrawLine(transform->position - half, transform->position + half,
                          GizmoColor::Cyan);
        }

        if (std::holds_alternative<AreaPatrolMode>(ctl.mode)) {
            draw.DrawWireSphere(ctl.targetPosition, kEnemyTargetMarkerRadius, GizmoColor::Green);
        }
        if (ctl.config.type == EnemyType::AreaPatrol) {
            const auto area = ctl.config.patrolArea.isValid() ? ctl.config.patrolArea : enemy;
            const auto* areaCollider = world_.colliders.TryGet(area);
            const auto* areaTransform = world_.transforms.TryGet(area);
            if (areaCollider && areaTransform) {
                const auto bounds = WorldBounds(*areaTransform, *areaCollider);
                draw.DrawWireCube(bounds.center, bounds.Size(), GizmoColor::Yellow);
            }
        }
    }
}

// ── Start ───────────────────────────────────────────────────────────────

void EnemySystem::ensureStarted(ecs::Entity enemy) {
    auto& ctl = world_.enemies.Get(enemy);
    if (ctl.started) {
        return;
    }
    ctl.started = true;

    if (const auto* transform = world_.transforms.TryGet(enemy)) {
        ctl.spawnPosition = transform->position;
        ctl.targetPosition = transform->position;
    }
    ctl.target = world_.FindFirstWithTag(ObjectTag::Player);

    switch (ctl.config.type) {
        case EnemyType::Idle:
            ctl.mode = IdleMode{};
            break;
        case EnemyType::LineOscillate:
            initLineOscillate(enemy, ctl);
            break;
        case EnemyType::AreaPatrol:
            initAreaPatrol(enemy, ctl);
            break;
    }

    setIndicator(ctl, false);
}

void EnemySystem::initLineOscillate(ecs::Entity enemy, EnemyController& ctl) {
    const auto dir = ctl.config.lineDirection.Normalized();
    if (dir.LengthSquared() == 0.0f) {
        GPK_LOG_WARN(LogCategory::AI, "Enemy '" + world_.NameOf(enemy) +
                                          "': line direction is zero, staying idle");
        fallBackToIdle(enemy, ctl);
        return;
    }
    ctl.config.lineDirection = dir;

    const auto half = dir * (ctl.config.lineDistance * 0.5f);
    LineOscillateMode line;
    line.start = ctl.spawnPosition - half;
    line.end = ctl.spawnPosition + half;
    line.towardEnd = true;

    ctl.targetPosition = line.end;
    ctl.mode = line;
}

void EnemySystem::initAreaPatrol(ecs::Entity enemy, EnemyController& ctl) {
    const auto area = ctl.config.patrolArea.isValid() ? ctl.config.patrolArea : enemy;
    const auto* collider = world_.IsAlive(area) ? world_.colliders.TryGet(area) : nullptr;

    if (!collider || !collider->isTrigger || !world_.transforms.Has(area)) {
        GPK_LOG_WARN(LogCategory::AI,
                     "Enemy '" + world_.NameOf(enemy) +
                         "': No valid patrol area found. Make sure the patrol area has a "
                         "trigger collider.");
        fallBackToIdle(enemy, ctl);
        return;
    }

    ctl.mode = AreaPatrolMode{area};
    chooseNewPatrolTarget(enemy, ctl);
}

void EnemySystem::fallBackToIdle(ecs::Entity /*enemy*/, EnemyController& ctl) {
    ctl.config.type = EnemyType::Idle;
    ctl.mode = IdleMode{};
}

// ── Tick ────────────────────────────────────────────────────────────────

void EnemySystem::tick(ecs::Entity enemy, float deltaTime) {
    if (!world_.transforms.Has(enemy)) {
        return;
    }
    auto& ctl = world_.enemies.Get(enemy);

    detectPlayer(enemy, ctl);

    if (ctl.isPaused) {
        ctl.pauseTimer -= deltaTime;
        if (ctl.pauseTimer <= 0.0f) {
            ctl.isPaused = false;
        }
        return;
    }

    if (ctl.config.chasePlayer && ctl.playerDetected) {
        const auto* target = world_.IsAlive(ctl.target) ? world_.transforms.TryGet(ctl.target)
                                                        : nullptr;
        moveTowards(enemy, target ? target->position : ctl.lastKnownPlayerPosition, deltaTime);
    } else {
        runMode(enemy, ctl, deltaTime);
    }

    updateAnimator(enemy, world_.enemies.Get(enemy));
}

void EnemySystem::detectPlayer(ecs::Entity enemy, EnemyController& ctl) {
    const auto* target = world_.IsAlive(ctl.target) ? world_.transforms.TryGet(ctl.target)
                                                    : nullptr;
    if (!target) {
        return;
    }

    const auto& position = world_.transforms.Get(enemy).position;
    if (Distance(position, target->position) <= ctl.config.detectionRange) {
        ctl.lastKnownPlayerPosition = target->position;
        if (!ctl.playerDetected) {
            ctl.playerDetected = true;
            setIndicator(ctl, true);
            GPK_LOG_INFO(LogCategory::AI,
                         "Enemy '" + world_.NameOf(enemy) + "' detected player!");
        }
    } else if (ctl.playerDetected) {
        ctl.playerDetected = false;
        setIndicator(ctl, false);
    }
}

void EnemySystem::runMode(ecs::Entity enemy, EnemyController& ctl, float deltaTime) {
    std::visit(
        [&](auto& mode) {
            using Mode = std::decay_t<decltype(mode)>;
            if constexpr (std::is_same_v<Mode, IdleMode>) {
                // Stands still.
            } else if constexpr (std::is_same_v<Mode, LineOscillateMode>) {
                moveTowards(enemy, ctl.targetPosition, deltaTime);
                const auto& position = world_.transforms.Get(enemy).position;
                if (Distance(position, ctl.targetPosition) <= ctl.config.arrivalDistance) {
                    mode.towardEnd = !mode.towardEnd;
                    ctl.targetPosition = mode.towardEnd ? mode.end : mode.start;
                    startPause(enemy, ctl);
                }
            } else if constexpr (std::is_same_v<Mode, AreaPatrolMode>) {
                moveTowards(enemy, ctl.targetPosition, deltaTime);
                const auto& position = world_.transforms.Get(enemy).position;
                if (Distance(position, ctl.targetPosition) <= ctl.config.arrivalDistance) {
                    chooseNewPatrolTarget(enemy, ctl);
                    startPause(enemy, ctl);
                }
            }
        },
        ctl.mode);
}

void EnemySystem::moveTowards(ecs::Entity enemy, const Vector3& target, float deltaTime) {
    auto& transform = world_.transforms.Get(enemy);
    const auto& ctl = world_.enemies.Get(enemy);
    const auto offset = target - transform.position;
    const auto direction = offset.Normalized();

    if (auto* body = world_.rigidBodies.TryGet(enemy)) {
        // Integration applies velocity * dt after this system runs; a step
        // that would pass the target is shortened to land on it.
        auto velocity = direction * ctl.config.moveSpeed;
        const float remaining = offset.HorizontalLength();
        if (deltaTime > 0.0f && ctl.config.moveSpeed * deltaTime >= remaining) {
            velocity = offset / deltaTime;
        }
        velocity.y = body->velocity.y;
        body->velocity = velocity;
    } else {
        // Capped so the agent lands on the target instead of overshooting.
        const float step = ctl.config.moveSpeed * deltaTime;
        const float remaining = offset.Length();
        if (step >= remaining) {
            transform.position = target;
        } else {
            transform.position += direction * step;
        }
    }

    if (direction.LengthSquared() > 0.0f) {
        transform.rotation = Quaternion::Slerp(
            transform.rotation, Quaternion::LookRotation(direction), kEnemyTurnRate * deltaTime);
    }
}

void EnemySystem::startPause(ecs::Entity enemy, EnemyController& ctl) {
    ctl.isPaused = true;
    ctl.pauseTimer = ctl.config.pauseTime;
    if (auto* body = world_.rigidBodies.TryGet(enemy)) {
        body->velocity = Vector3{0.0f, body->velocity.y, 0.0f};
    }
}

void EnemySystem::chooseNewPatrolTarget(ecs::Entity enemy, EnemyController& ctl) {
    const auto* patrol = std::get_if<AreaPatrolMode>(&ctl.mode);
    if (!patrol) {
        return;
    }
    const auto* collider = world_.IsAlive(patrol->area) ? world_.colliders.TryGet(patrol->area)
                                                        : nullptr;
    const auto* areaTransform = world_.transforms.TryGet(patrol->area);
    if (!collider || !areaTransform) {
        GPK_LOG_WARN(LogCategory::AI, "Enemy '" + world_.NameOf(enemy) +
                                          "': patrol area is gone, staying idle");
        fallBackToIdle(enemy, ctl);
        return;
    }

    const auto bounds = WorldBounds(*areaTransform, *collider);
    const auto lo = bounds.Min();
    const auto hi = bounds.Max();
    const auto* self = world_.transforms.TryGet(enemy);
    const float y = self ? self->position.y : ctl.spawnPosition.y;

    Vector3 point;
    int attempts = 0;
    do {
        point = Vector3{world_.RandomRange(lo.x, hi.x), y, world_.RandomRange(lo.z, hi.z)};
        ++attempts;
    } while (!bounds.Contains(point) && attempts < kPatrolSampleAttempts);

    ctl.targetPosition = point;
}

void EnemySystem::updateAnimator(ecs::Entity enemy, const EnemyController& ctl) {
    auto* animator = world_.animators.TryGet(enemy);
    if (!animator) {
        return;
    }
    // Only a body reports speed; transform-driven agents read as standing.
    const auto* body = world_.rigidBodies.TryGet(enemy);
    const float speed = body ? body->velocity.HorizontalLength() : 0.0f;

    animator->speed = speed;
    animator->isMoving = speed > kEnemyMovingThreshold && !ctl.isPaused;
    animator->playerDetected = ctl.playerDetected;
}

void EnemySystem::setIndicator(const EnemyController& ctl, bool active) {
    if (!world_.IsAlive(ctl.config.detectionIndicator)) {
        return;
    }
    // Indicators declared without an Activation get one on first use.
    if (auto* activation = world_.activations.TryGet(ctl.config.detectionIndicator)) {
        activation->active = active;
    } else {
        world_.activations.Add(ctl.config.detectionIndicator, Activation{active});
    }
}

// ── Game over ───────────────────────────────────────────────────────────

void EnemySystem::triggerGameOver(ecs::Entity enemy, ecs::Entity contact) {
    auto& ctl = world_.enemies.Get(enemy);
    ctl.gameOverTriggered = true;

    const std::string message = ctl.config.gameOverMessage;
    const float delay = std::max(0.0f, ctl.config.gameOverDelay);
    GPK_LOG_INFO(LogCategory::AI, message);

    if (auto* body = world_.rigidBodies.TryGet(enemy)) {
        body->velocity = Vector3::Zero();
    }
    // Controls belong to the tracked player; the contacting entity only
    // stands in when nothing is tracked.
    const auto player = world_.IsAlive(ctl.target) ? ctl.target : contact;
    if (auto* control = world_.playerControls.TryGet(player)) {
        control->enabled = false;
    }

    world_.events.gameOver.emit(enemy, message);

    auto scheduled = world_.deferred.schedule(delay, [this] {
        world_.events.sceneReloadRequested.emit(world_.sceneName);
    });
    if (!scheduled) {
        GPK_LOG_ERROR(LogCategory::AI, std::string(scheduled.error().message()));
    }
}

}  // namespace gpk::game
