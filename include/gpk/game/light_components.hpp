#pragma once

/// @file light_components.hpp
/// @brief PointLight and LightDecay components.

namespace gpk::game {

/// Slack on the end of a fade so summed frame deltas still finish it.
constexpr double kDecayCompletionEpsilon = 1e-5;

struct PointLight {
    float intensity = 1.0f;
};

/// Fades the sibling PointLight to zero over a random duration drawn
/// from [minTime, maxTime].
struct LightDecay {
    float minTime = 1.0f;
    float maxTime = 5.0f;

    float initialIntensity = 0.0f;
    float duration = 0.0f;
    double elapsed = 0.0;  ///< Summed in double; float drifts short of duration.
    bool active = false;
    bool started = false;
};

}  // namespace gpk::game
