/// @file scene_loader.cpp
/// @brief Two-pass YAML scene loading: parse and validate, then create
///        entities and resolve name references.

#include "gpk/game/scene_loader.hpp"

#include "gpk/foundation/game_logger.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace gpk::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

// ── Parsed specs ────────────────────────────────────────────────────────

struct TeleporterSpec {
    Teleporter component;
    std::string destination;
};

struct EnemySpec {
    EnemyController component;
    std::string patrolArea;
    std::string detectionIndicator;
};

struct EntitySpec {
    std::string name;
    ObjectTag tag = ObjectTag::Untagged;
    std::string parent;
    Transform transform;
    std::optional<Collider> collider;
    std::optional<RigidBody> rigidBody;
    std::optional<PlayerControl> playerControl;
    std::optional<Activation> activation;
    bool animator = false;
    std::optional<PointLight> light;
    std::optional<LightDecay> lightDecay;
    std::optional<TeleporterSpec> teleporter;
    std::optional<EnemySpec> enemy;
};

GameError sceneError(const std::string& where, const std::string& what) {
    return GameError(ErrorCode::SceneLoadFailed, what, where);
}

// ── Field readers (throw YAML exceptions on bad shapes) ─────────────────

Vector3 readVector3(const YAML::Node& node) {
    if (!node.IsSequence() || node.size() != 3) {
        throw YAML::RepresentationException(node.Mark(), "expected [x, y, z]");
    }
    return {node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
}

Quaternion readRotation(const YAML::Node& node) {
    if (node.IsSequence() && node.size() == 3) {
        return Quaternion::FromEulerDegrees(node[0].as<float>(), node[1].as<float>(),
                                            node[2].as<float>());
    }
    if (node.IsSequence() && node.size() == 4) {
        return Quaternion{node[0].as<float>(), node[1].as<float>(), node[2].as<float>(),
                          node[3].as<float>()}
            .Normalized();
    }
    throw YAML::RepresentationException(node.Mark(),
                                        "expected euler [x, y, z] or quaternion [w, x, y, z]");
}

template <typename T>
void readInto(const YAML::Node& parent, const char* key, T& out) {
    if (const auto node = parent[key]) {
        out = node.template as<T>();
    }
}

void readVectorInto(const YAML::Node& parent, const char* key, Vector3& out) {
    if (const auto node = parent[key]) {
        out = readVector3(node);
    }
}

/// A block may be written as `key: true` or `key: { ... }`.
bool blockEnabled(const YAML::Node& node) {
    return node && (!node.IsScalar() || node.as<bool>());
}

// ── Component parsers ───────────────────────────────────────────────────

GameResult<ObjectTag> parseTag(const YAML::Node& node, const std::string& where) {
    const auto text = node.as<std::string>();
    auto tag = parseObjectTag(text);
    if (!tag) {
        return GameResult<ObjectTag>::err(sceneError(where, "unknown tag '" + text + "'"));
    }
    return GameResult<ObjectTag>::ok(*tag);
}

GameResult<TeleporterSpec> parseTeleporter(const YAML::Node& node, const std::string& where) {
    TeleporterSpec spec;
    auto& tp = spec.component;
    readInto(node, "destination", spec.destination);
    readInto(node, "delay", tp.delay);
    readInto(node, "match_rotation", tp.matchRotation);
    readInto(node, "sound", tp.sound);
    readInto(node, "effect", tp.effect);
    if (const auto accept = node["accept_tag"]) {
        auto tag = parseTag(accept, where + ".teleporter.accept_tag");
        if (!tag) {
            return GameResult<TeleporterSpec>::err(tag.error());
        }
        tp.acceptTag = tag.value();
    }
    return GameResult<TeleporterSpec>::ok(std::move(spec));
}

GameResult<EnemySpec> parseEnemy(const YAML::Node& node, const std::string& where) {
    EnemySpec spec;
    auto& cfg = spec.component.config;

    if (const auto type = node["type"]) {
        const auto text = type.as<std::string>();
        auto parsed = parseEnemyType(text);
        if (!parsed) {
            return GameResult<EnemySpec>::err(
                sceneError(where + ".enemy.type", "unknown enemy type '" + text + "'"));
        }
        cfg.type = *parsed;
    }

    readInto(node, "move_speed", cfg.moveSpeed);
    readInto(node, "pause_time", cfg.pauseTime);
    readInto(node, "line_distance", cfg.lineDistance);
    readVectorInto(node, "line_direction", cfg.lineDirection);
    readInto(node, "patrol_area", spec.patrolArea);
    readInto(node, "arrival_distance", cfg.arrivalDistance);
    readInto(node, "detection_range", cfg.detectionRange);
    readInto(node, "chase_player", cfg.chasePlayer);
    readInto(node, "detection_indicator", spec.detectionIndicator);
    readInto(node, "causes_game_over", cfg.causesGameOver);
    readInto(node, "game_over_message", cfg.gameOverMessage);
    readInto(node, "game_over_delay", cfg.gameOverDelay);
    return GameResult<EnemySpec>::ok(std::move(spec));
}

GameResult<EntitySpec> parseEntity(const YAML::Node& node, std::size_t index) {
    const std::string where = "entities[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return GameResult<EntitySpec>::err(sceneError(where, "expected a map"));
    }

    EntitySpec spec;
    readInto(node, "name", spec.name);
    readInto(node, "parent", spec.parent);

    if (const auto tag = node["tag"]) {
        auto parsed = parseTag(tag, where + ".tag");
        if (!parsed) {
            return GameResult<EntitySpec>::err(parsed.error());
        }
        spec.tag = parsed.value();
    }

    if (const auto t = node["transform"]) {
        readVectorInto(t, "position", spec.transform.position);
        if (const auto rot = t["rotation"]) {
            spec.transform.rotation = readRotation(rot);
        }
        readVectorInto(t, "scale", spec.transform.scale);
    }

    if (const auto c = node["collider"]) {
        Collider collider;
        readVectorInto(c, "center", collider.center);
        readVectorInto(c, "size", collider.size);
        readInto(c, "trigger", collider.isTrigger);
        spec.collider = collider;
    }

    if (const auto rb = node["rigidbody"]; blockEnabled(rb)) {
        RigidBody body;
        if (rb.IsMap()) {
            readVectorInto(rb, "velocity", body.velocity);
        }
        spec.rigidBody = body;
    }

    if (const auto pc = node["player_control"]) {
        spec.playerControl = PlayerControl{pc.as<bool>()};
    }

    if (const auto active = node["active"]) {
        spec.activation = Activation{active.as<bool>()};
    }

    spec.animator = blockEnabled(node["animator"]);

    if (const auto light = node["light"]) {
        PointLight pl;
        readInto(light, "intensity", pl.intensity);
        spec.light = pl;
    }

    if (const auto decay = node["light_decay"]; blockEnabled(decay)) {
        LightDecay ld;
        if (decay.IsMap()) {
            readInto(decay, "min_time", ld.minTime);
            readInto(decay, "max_time", ld.maxTime);
        }
        spec.lightDecay = ld;
    }

    if (const auto tp = node["teleporter"]) {
        auto parsed = parseTeleporter(tp, where);
        if (!parsed) {
            return GameResult<EntitySpec>::err(parsed.error());
        }
        spec.teleporter = std::move(parsed).value();
    }

    if (const auto enemy = node["enemy"]) {
        auto parsed = parseEnemy(enemy, where);
        if (!parsed) {
            return GameResult<EntitySpec>::err(parsed.error());
        }
        spec.enemy = std::move(parsed).value();
    }

    return GameResult<EntitySpec>::ok(std::move(spec));
}

// ── Reference resolution ────────────────────────────────────────────────

class ReferenceResolver {
public:
    explicit ReferenceResolver(const WorldState& world) : world_(world) {}

    /// Empty names are "not set" and resolve silently to invalid.
    ecs::Entity resolve(const std::string& name, const std::string& owner, const char* field) {
        if (name.empty()) {
            return ecs::Entity::invalid();
        }
        auto entity = world_.FindByName(name);
        if (!entity.isValid()) {
            ++unresolved_;
            GPK_LOG_WARN(LogCategory::Scene, "Entity '" + owner + "': " + field +
                                                 " references unknown entity '" + name + "'");
        }
        return entity;
    }

    [[nodiscard]] std::size_t unresolved() const noexcept { return unresolved_; }

private:
    const WorldState& world_;
    std::size_t unresolved_ = 0;
};

} // namespace

// ── Public API ──────────────────────────────────────────────────────────

GameResult<SceneLoadReport> LoadScene(const YAML::Node& doc, WorldState& world) {
    std::vector<EntitySpec> specs;
    SceneLoadReport report;

    // Pass 1: parse and validate without touching the world.
    try {
        if (!doc.IsMap()) {
            return GameResult<SceneLoadReport>::err(
                sceneError("document", "expected a map with 'scene' and 'entities'"));
        }
        if (const auto scene = doc["scene"]) {
            readInto(scene, "name", report.sceneName);
        }
        if (const auto entities = doc["entities"]) {
            if (!entities.IsSequence()) {
                return GameResult<SceneLoadReport>::err(
                    sceneError("entities", "expected a sequence"));
            }
            for (std::size_t i = 0; i < entities.size(); ++i) {
                auto spec = parseEntity(entities[i], i);
                if (!spec) {
                    return GameResult<SceneLoadReport>::err(spec.error());
                }
                specs.push_back(std::move(spec).value());
            }
        }
    } catch (const YAML::Exception& e) {
        return GameResult<SceneLoadReport>::err(
            GameError(ErrorCode::SceneLoadFailed, std::string("invalid scene: ") + e.what()));
    }

    // Pass 2: create entities so every name is registered.
    std::vector<ecs::Entity> created;
    created.reserve(specs.size());
    for (auto& spec : specs) {
        if (!spec.name.empty() && world.FindByName(spec.name).isValid()) {
            GPK_LOG_WARN(LogCategory::Scene,
                         "Duplicate entity name '" + spec.name + "'; references use the first");
        }
        auto entity = world.CreateEntity(spec.name, spec.tag);
        world.transforms.Get(entity) = spec.transform;

        if (spec.collider) world.colliders.Add(entity, *spec.collider);
        if (spec.rigidBody) world.rigidBodies.Add(entity, *spec.rigidBody);
        if (spec.playerControl) world.playerControls.Add(entity, *spec.playerControl);
        if (spec.activation) world.activations.Add(entity, *spec.activation);
        if (spec.animator) world.animators.Add(entity);
        if (spec.light) world.pointLights.Add(entity, *spec.light);
        if (spec.lightDecay) world.lightDecays.Add(entity, *spec.lightDecay);
        created.push_back(entity);
    }

    // Pass 3: resolve references and attach the components that hold them.
    ReferenceResolver resolver(world);
    for (std::size_t i = 0; i < specs.size(); ++i) {
        auto& spec = specs[i];
        const auto entity = created[i];

        if (!spec.parent.empty()) {
            auto parent = resolver.resolve(spec.parent, spec.name, "parent");
            if (parent.isValid()) {
                world.parents.Add(entity, Parent{parent});
            }
        }

        if (spec.teleporter) {
            auto tp = spec.teleporter->component;
            tp.destination = resolver.resolve(spec.teleporter->destination, spec.name,
                                              "teleporter.destination");
            world.teleporters.Add(entity, std::move(tp));
        }

        if (spec.enemy) {
            auto ctl = spec.enemy->component;
            ctl.config.patrolArea =
                resolver.resolve(spec.enemy->patrolArea, spec.name, "enemy.patrol_area");
            ctl.config.detectionIndicator = resolver.resolve(
                spec.enemy->detectionIndicator, spec.name, "enemy.detection_indicator");
            world.enemies.Add(entity, std::move(ctl));
        }
    }

    if (!report.sceneName.empty()) {
        world.sceneName = report.sceneName;
    }
    report.entityCount = created.size();
    report.unresolvedReferences = resolver.unresolved();

    GPK_LOG_INFO(LogCategory::Scene, "Loaded scene '" + world.sceneName + "' with " +
                                         std::to_string(report.entityCount) + " entities");
    return GameResult<SceneLoadReport>::ok(std::move(report));
}

GameResult<SceneLoadReport> LoadSceneFromString(std::string_view yaml, WorldState& world) {
    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return GameResult<SceneLoadReport>::err(
            GameError(ErrorCode::SceneLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return LoadScene(doc, world);
}

GameResult<SceneLoadReport> LoadSceneFile(const std::filesystem::path& path, WorldState& world) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<SceneLoadReport>::err(
            GameError(ErrorCode::SceneLoadFailed, "failed to open scene file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<SceneLoadReport>::err(
            GameError(ErrorCode::SceneLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return LoadScene(doc, world);
}

}  // namespace gpk::game
