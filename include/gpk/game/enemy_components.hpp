#pragma once

/// @file enemy_components.hpp
/// @brief EnemyController component: authoring config and movement modes.

#include "gpk/ecs/entity.hpp"
#include "gpk/game/math_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace gpk::game {

// ── Constants ───────────────────────────────────────────────────────────

/// Slerp factor per second when turning toward the movement direction.
constexpr float kEnemyTurnRate = 5.0f;

/// Horizontal speed above which the animator treats the agent as moving.
constexpr float kEnemyMovingThreshold = 0.1f;

/// Resample budget for finding a patrol point inside the area.
constexpr int kPatrolSampleAttempts = 10;

constexpr float kEnemyTargetMarkerRadius = 0.3f;

// ── Types ───────────────────────────────────────────────────────────────

enum class EnemyType : uint8_t {
    Idle,           ///< Stands still.
    LineOscillate,  ///< Walks back and forth along a segment.
    AreaPatrol      ///< Walks to random points inside an area.
};

constexpr std::string_view enemyTypeName(EnemyType type) {
    switch (type) {
        case EnemyType::Idle:          return "idle";
        case EnemyType::LineOscillate: return "line_oscillate";
        case EnemyType::AreaPatrol:    return "area_patrol";
    }
    return "idle";
}

/// Accepts the canonical names and the older authoring aliases
/// ("static", "straight_line", "patrol_area").
constexpr std::optional<EnemyType> parseEnemyType(std::string_view name) {
    if (name == "idle" || name == "static") {
        return EnemyType::Idle;
    }
    if (name == "line_oscillate" || name == "straight_line") {
        return EnemyType::LineOscillate;
    }
    if (name == "area_patrol" || name == "patrol_area") {
        return EnemyType::AreaPatrol;
    }
    return std::nullopt;
}

/// Authoring-time settings.
struct EnemyConfig {
    EnemyType type = EnemyType::Idle;
    float moveSpeed = 2.0f;
    float pauseTime = 1.0f;

    float lineDistance = 5.0f;
    Vector3 lineDirection = Vector3::Forward();

    /// Entity whose trigger Collider bounds the patrol; invalid means self.
    ecs::Entity patrolArea;
    float arrivalDistance = 0.5f;

    float detectionRange = 3.0f;
    bool chasePlayer = false;
    ecs::Entity detectionIndicator;

    bool causesGameOver = true;
    std::string gameOverMessage = "Game Over! You were caught by an enemy!";
    float gameOverDelay = 1.0f;
};

// ── Movement modes ──────────────────────────────────────────────────────

struct IdleMode {};

struct LineOscillateMode {
    Vector3 start;
    Vector3 end;
    bool towardEnd = true;
};

struct AreaPatrolMode {
    ecs::Entity area;
};

using EnemyMode = std::variant<IdleMode, LineOscillateMode, AreaPatrolMode>;

// ── Component ───────────────────────────────────────────────────────────

struct EnemyController {
    EnemyConfig config;

    /// Active movement mode; resolved from config.type on the first tick.
    EnemyMode mode;

    Vector3 spawnPosition;
    Vector3 targetPosition;

    bool isPaused = false;
    float pauseTimer = 0.0f;

    bool playerDetected = false;
    Vector3 lastKnownPlayerPosition;
    ecs::Entity target;

    bool gameOverTriggered = false;
    bool started = false;
};

}  // namespace gpk::game
