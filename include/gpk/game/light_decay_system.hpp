#pragma once

/// @file light_decay_system.hpp
/// @brief LightDecaySystem: linear fade of PointLight intensity.

#include "gpk/ecs/system_scheduler.hpp"
#include "gpk/foundation/game_result.hpp"
#include "gpk/game/world_state.hpp"

#include <string_view>

namespace gpk::game {

/// Fades lights that carry LightDecay.
///
/// The first tick a LightDecay is seen it captures the light's intensity
/// and starts decaying in that same tick.  While active:
/// @code
///   elapsed  += dt   // double
///   intensity = lerp(initial, 0, clamp01(elapsed / duration))
/// @endcode
/// and the decay ends, with intensity pinned to exactly 0, once elapsed
/// is within kDecayCompletionEpsilon of duration.
class LightDecaySystem final : public ecs::ISystem {
public:
    explicit LightDecaySystem(WorldState& world);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override { return ecs::SystemStage::Update; }

    [[nodiscard]] std::string_view GetName() const override { return "LightDecaySystem"; }

    /// Draw a fresh duration and restart from the current intensity.
    /// @return ComponentNotFound without LightDecay, MissingLight without PointLight.
    foundation::GameResult<void> StartDecay(ecs::Entity entity);

    /// Restore the captured intensity, then StartDecay().
    foundation::GameResult<void> ResetAndDecay(ecs::Entity entity);

    /// Freeze the fade at the current intensity.
    foundation::GameResult<void> StopDecay(ecs::Entity entity);

private:
    /// @return false if the entity has no PointLight (decay stays inert).
    bool initialize(ecs::Entity entity, LightDecay& decay);
    foundation::GameResult<void> beginDecay(ecs::Entity entity, LightDecay& decay);
    void advance(LightDecay& decay, PointLight& light, float deltaTime);

    WorldState& world_;
};

}  // namespace gpk::game
