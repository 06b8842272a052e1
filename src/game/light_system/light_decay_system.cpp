/// @file light_decay_system.cpp
/// @brief LightDecaySystem implementation.

#include "gpk/game/light_decay_system.hpp"

#include "gpk/foundation/game_logger.hpp"

#include <iomanip>
#include <sstream>

namespace gpk::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameResult<void> missingDecay(const WorldState& world, ecs::Entity entity) {
    return GameResult<void>::err(GameError(ErrorCode::ComponentNotFound,
                                           "has no LightDecay", world.NameOf(entity)));
}

} // namespace

LightDecaySystem::LightDecaySystem(WorldState& world) : world_(world) {}

void LightDecaySystem::Execute(float deltaTime) {
    const auto owners = world_.lightDecays.Entities();
    for (auto entity : owners) {
        auto* decay = world_.lightDecays.TryGet(entity);
        if (!decay) {
            continue;
        }
        if (!decay->started && !initialize(entity, *decay)) {
            continue;
        }
        auto* light = world_.pointLights.TryGet(entity);
        if (decay->active && light) {
            advance(*decay, *light, deltaTime);
        }
    }
}

GameResult<void> LightDecaySystem::StartDecay(ecs::Entity entity) {
    auto* decay = world_.lightDecays.TryGet(entity);
    if (!decay) {
        return missingDecay(world_, entity);
    }
    if (!decay->started) {
        initialize(entity, *decay);
        return world_.pointLights.Has(entity)
                   ? GameResult<void>::ok()
                   : GameResult<void>::err(GameError(ErrorCode::MissingLight, "no PointLight"));
    }
    return beginDecay(entity, *decay);
}

GameResult<void> LightDecaySystem::ResetAndDecay(ecs::Entity entity) {
    auto* decay = world_.lightDecays.TryGet(entity);
    if (!decay) {
        return missingDecay(world_, entity);
    }
    if (!decay->started) {
        return StartDecay(entity);
    }
    auto* light = world_.pointLights.TryGet(entity);
    if (!light) {
        return beginDecay(entity, *decay);
    }
    light->intensity = decay->initialIntensity;
    return beginDecay(entity, *decay);
}

GameResult<void> LightDecaySystem::StopDecay(ecs::Entity entity) {
    auto* decay = world_.lightDecays.TryGet(entity);
    if (!decay) {
        return missingDecay(world_, entity);
    }
    decay->active = false;
    return GameResult<void>::ok();
}

// ── Private ─────────────────────────────────────────────────────────────

bool LightDecaySystem::initialize(ecs::Entity entity, LightDecay& decay) {
    decay.started = true;

    const auto* light = world_.pointLights.TryGet(entity);
    if (!light) {
        GPK_LOG_ERROR(LogCategory::Lighting, "LightDecay on '" + world_.NameOf(entity) +
                                                 "' requires a PointLight component");
        return false;
    }

    decay.initialIntensity = light->intensity;
    return beginDecay(entity, decay).hasValue();
}

GameResult<void> LightDecaySystem::beginDecay(ecs::Entity entity, LightDecay& decay) {
    if (!world_.pointLights.Has(entity)) {
        GPK_LOG_WARN(LogCategory::Lighting,
                     "Cannot start light decay on '" + world_.NameOf(entity) + "': no PointLight");
        return GameResult<void>::err(
            GameError(ErrorCode::MissingLight, world_.NameOf(entity) + " has no PointLight"));
    }

    decay.elapsed = 0.0;
    decay.duration = world_.RandomRange(decay.minTime, decay.maxTime);
    decay.active = true;

    std::ostringstream oss;
    oss << "Light decay started. Duration: " << std::fixed << std::setprecision(2)
        << decay.duration << " seconds";
    GPK_LOG_INFO(LogCategory::Lighting, oss.str());
    return GameResult<void>::ok();
}

void LightDecaySystem::advance(LightDecay& decay, PointLight& light, float deltaTime) {
    decay.elapsed += deltaTime;

    // A zero-length fade completes on its first tick.
    const bool finished =
        decay.duration <= 0.0f || decay.elapsed >= decay.duration - kDecayCompletionEpsilon;
    const float progress =
        finished ? 1.0f : Clamp01(static_cast<float>(decay.elapsed / decay.duration));
    light.intensity = Lerp(decay.initialIntensity, 0.0f, progress);

    if (finished) {
        light.intensity = 0.0f;
        decay.active = false;
    }
}

}  // namespace gpk::game
