#pragma once

/// @file components.hpp
/// @brief Shared ECS components: Transform, Identity, Collider and friends.
///
/// Plain data structs stored in ComponentStorage<T>.  Gameplay-specific
/// components live next to their systems (teleport_components.hpp, ...).

#include "gpk/ecs/entity.hpp"
#include "gpk/game/math_types.hpp"
#include "gpk/game/object_types.hpp"

#include <cmath>
#include <string>

namespace gpk::game {

// ── Transform ───────────────────────────────────────────────────────────

/// World-space pose.
struct Transform {
    Vector3 position;
    Quaternion rotation;
    Vector3 scale{1.0f, 1.0f, 1.0f};
};

// ── Identity ────────────────────────────────────────────────────────────

struct Identity {
    std::string name;
    ObjectTag tag = ObjectTag::Untagged;
};

// ── Collider ────────────────────────────────────────────────────────────

/// Axis-aligned box volume relative to the owner's Transform.
/// Rotation is ignored; scale stretches both center and size.
struct Collider {
    Vector3 center;
    Vector3 size{1.0f, 1.0f, 1.0f};
    bool isTrigger = false;
};

/// World-space bounds of @p collider placed by @p transform.
[[nodiscard]] inline Bounds WorldBounds(const Transform& transform, const Collider& collider) {
    const Vector3 absScale{std::fabs(transform.scale.x), std::fabs(transform.scale.y),
                           std::fabs(transform.scale.z)};
    return Bounds(transform.position + collider.center.Scaled(transform.scale),
                  collider.size.Scaled(absScale));
}

// ── RigidBody ───────────────────────────────────────────────────────────

/// Kinematic body; BodyIntegrationSystem moves the Transform by velocity.
struct RigidBody {
    Vector3 velocity;
};

// ── PlayerControl ───────────────────────────────────────────────────────

/// Gate for player movement input.  Cleared on game over.
struct PlayerControl {
    bool enabled = true;
};

// ── Parent ──────────────────────────────────────────────────────────────

struct Parent {
    ecs::Entity entity;
};

// ── Activation ──────────────────────────────────────────────────────────

/// Visibility flag for indicator objects.
struct Activation {
    bool active = true;
};

// ── AnimatorParams ──────────────────────────────────────────────────────

/// Parameters published for an external animation controller.
struct AnimatorParams {
    float speed = 0.0f;
    bool isMoving = false;
    bool playerDetected = false;
};

}  // namespace gpk::game
