#pragma once

/// @file debug_draw.hpp
/// @brief Sink for editor-style gizmo drawing.

#include "gpk/game/math_types.hpp"

#include <cstdint>

namespace gpk::game {

enum class GizmoColor : uint8_t {
    Red,
    Green,
    Blue,
    Yellow,
    Cyan
};

/// Implemented by whatever renders debug overlays.  All coordinates are
/// world space.
class IDebugDraw {
public:
    virtual ~IDebugDraw() = default;

    virtual void DrawLine(const Vector3& from, const Vector3& to, GizmoColor color) = 0;
    virtual void DrawRay(const Vector3& origin, const Vector3& direction, GizmoColor color) = 0;
    virtual void DrawWireSphere(const Vector3& center, float radius, GizmoColor color) = 0;
    virtual void DrawWireCube(const Vector3& center, const Vector3& size, GizmoColor color) = 0;
};

}  // namespace gpk::game
