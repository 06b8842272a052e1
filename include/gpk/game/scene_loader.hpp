#pragma once

/// @file scene_loader.hpp
/// @brief Build a scene's entities from a YAML document.
///
/// Document shape:
/// @code
///   scene:
///     name: level01
///   entities:
///     - name: Player
///       tag: Player
///       transform: { position: [0, 0, 0], rotation: [0, 90, 0] }
///       collider:  { size: [1, 2, 1] }
///       player_control: true
///     - name: DoorA
///       collider:   { size: [2, 3, 1], trigger: true }
///       teleporter: { destination: DoorB, delay: 0.5, match_rotation: true }
/// @endcode
///
/// Rotations are Euler degrees [x, y, z] or a quaternion [w, x, y, z].
/// References (destination, patrol_area, parent, ...) are entity names.

#include "gpk/foundation/game_result.hpp"
#include "gpk/game/world_state.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace gpk::game {

/// Outcome of a successful load.
struct SceneLoadReport {
    std::string sceneName;
    std::size_t entityCount = 0;

    /// Names that matched no entity.  Each one left an invalid handle and
    /// was logged as a warning.
    std::size_t unresolvedReferences = 0;
};

/// Parse @p doc and create its entities in @p world.
///
/// The whole document is validated before any entity is created, so a
/// failed load leaves @p world untouched.  On success world.sceneName is
/// set when the document names the scene.
///
/// @return SceneLoadFailed for malformed documents or unknown enum values.
foundation::GameResult<SceneLoadReport> LoadScene(const YAML::Node& doc, WorldState& world);

foundation::GameResult<SceneLoadReport> LoadSceneFromString(std::string_view yaml,
                                                            WorldState& world);

foundation::GameResult<SceneLoadReport> LoadSceneFile(const std::filesystem::path& path,
                                                      WorldState& world);

}  // namespace gpk::game
