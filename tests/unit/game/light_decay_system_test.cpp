#include <gtest/gtest.h>

#include <cmath>

#include "gpk/game/light_decay_system.hpp"
#include "gpk/game/world_state.hpp"

#include "capture_logger.hpp"

using namespace gpk::game;
using gpk::ecs::Entity;
using gpk::foundation::ErrorCode;
using gpk::test::ScopedCaptureLogger;
using kcenon::common::interfaces::log_level;

class LightDecaySystemTest : public ::testing::Test {
protected:
    Entity MakeLamp(float intensity, float minTime, float maxTime) {
        auto lamp = world.CreateEntity("Lamp");
        world.pointLights.Add(lamp, PointLight{intensity});
        LightDecay decay;
        decay.minTime = minTime;
        decay.maxTime = maxTime;
        world.lightDecays.Add(lamp, decay);
        return lamp;
    }

    void RunFor(float seconds, float dt = 0.05f) {
        for (float t = 0.0f; t < seconds; t += dt) {
            system.Execute(dt);
        }
    }

    ScopedCaptureLogger log;
    WorldState world{1234};
    LightDecaySystem system{world};
};

// ===========================================================================
// Start
// ===========================================================================

TEST_F(LightDecaySystemTest, FirstTickCapturesIntensityAndStarts) {
    auto lamp = MakeLamp(2.0f, 1.0f, 5.0f);
    system.Execute(0.0f);

    const auto& decay = world.lightDecays.Get(lamp);
    EXPECT_TRUE(decay.started);
    EXPECT_TRUE(decay.active);
    EXPECT_FLOAT_EQ(decay.initialIntensity, 2.0f);
    EXPECT_GE(decay.duration, 1.0f);
    EXPECT_LE(decay.duration, 5.0f);
    EXPECT_EQ(log->count(log_level::info, "Light decay started. Duration: "), 1u);
}

TEST_F(LightDecaySystemTest, MissingLightLogsErrorAndStaysInert) {
    auto bare = world.CreateEntity("NoLight");
    world.lightDecays.Add(bare);

    system.Execute(0.1f);
    system.Execute(0.1f);

    EXPECT_FALSE(world.lightDecays.Get(bare).active);
    EXPECT_EQ(log->count(log_level::error, "requires a PointLight"), 1u);

    auto result = system.StartDecay(bare);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::MissingLight);
}

// ===========================================================================
// Fading
// ===========================================================================

TEST_F(LightDecaySystemTest, IntensityFallsLinearly) {
    auto lamp = MakeLamp(4.0f, 2.0f, 2.0f);
    system.Execute(0.5f);  // start + first 0.5 s
    EXPECT_NEAR(world.pointLights.Get(lamp).intensity, 3.0f, 1e-4f);
    system.Execute(0.5f);
    EXPECT_NEAR(world.pointLights.Get(lamp).intensity, 2.0f, 1e-4f);
}

TEST_F(LightDecaySystemTest, ReachesZeroAfterSampledDuration) {
    // Several seeds so the sampled duration varies.
    for (int i = 0; i < 8; ++i) {
        auto lamp = MakeLamp(1.5f, 0.5f, 3.0f);
        system.Execute(0.0f);
        const float duration = world.lightDecays.Get(lamp).duration;
        ASSERT_GE(duration, 0.5f);
        ASSERT_LE(duration, 3.0f);

        RunFor(duration + 0.1f);

        EXPECT_FLOAT_EQ(world.pointLights.Get(lamp).intensity, 0.0f);
        EXPECT_FALSE(world.lightDecays.Get(lamp).active);
        world.DestroyEntity(lamp);
    }
}

TEST_F(LightDecaySystemTest, FixedFrameTicksFinishExactlyAtDuration) {
    constexpr float kFrame = 1.0f / 60.0f;
    for (float seconds : {1.0f, 2.0f, 3.0f}) {
        auto lamp = MakeLamp(2.0f, seconds, seconds);
        system.Execute(0.0f);
        ASSERT_FLOAT_EQ(world.lightDecays.Get(lamp).duration, seconds);

        const int frames = static_cast<int>(std::lround(seconds * 60.0f));
        for (int i = 0; i < frames - 1; ++i) {
            system.Execute(kFrame);
        }
        EXPECT_TRUE(world.lightDecays.Get(lamp).active) << seconds;
        EXPECT_GT(world.pointLights.Get(lamp).intensity, 0.0f) << seconds;

        system.Execute(kFrame);
        EXPECT_EQ(world.pointLights.Get(lamp).intensity, 0.0f) << seconds;
        EXPECT_FALSE(world.lightDecays.Get(lamp).active) << seconds;
        world.DestroyEntity(lamp);
    }
}

TEST_F(LightDecaySystemTest, ReversedBoundsAreSwapped) {
    auto lamp = MakeLamp(1.0f, 4.0f, 2.0f);
    system.Execute(0.0f);
    const float duration = world.lightDecays.Get(lamp).duration;
    EXPECT_GE(duration, 2.0f);
    EXPECT_LE(duration, 4.0f);
}

TEST_F(LightDecaySystemTest, ZeroDurationCompletesAtOnce) {
    auto lamp = MakeLamp(3.0f, 0.0f, 0.0f);
    system.Execute(0.016f);
    EXPECT_FLOAT_EQ(world.pointLights.Get(lamp).intensity, 0.0f);
    EXPECT_FALSE(world.lightDecays.Get(lamp).active);
}

// ===========================================================================
// Control operations
// ===========================================================================

TEST_F(LightDecaySystemTest, StopDecayFreezesIntensity) {
    auto lamp = MakeLamp(2.0f, 2.0f, 2.0f);
    system.Execute(1.0f);
    ASSERT_TRUE(system.StopDecay(lamp));
    const float frozen = world.pointLights.Get(lamp).intensity;

    RunFor(3.0f);
    EXPECT_FLOAT_EQ(world.pointLights.Get(lamp).intensity, frozen);
    EXPECT_FALSE(world.lightDecays.Get(lamp).active);
}

TEST_F(LightDecaySystemTest, ResetAndDecayRestoresInitialIntensity) {
    auto lamp = MakeLamp(2.0f, 1.0f, 1.0f);
    RunFor(1.5f);
    ASSERT_FLOAT_EQ(world.pointLights.Get(lamp).intensity, 0.0f);

    ASSERT_TRUE(system.ResetAndDecay(lamp));
    EXPECT_FLOAT_EQ(world.pointLights.Get(lamp).intensity, 2.0f);
    EXPECT_TRUE(world.lightDecays.Get(lamp).active);
    EXPECT_DOUBLE_EQ(world.lightDecays.Get(lamp).elapsed, 0.0);

    RunFor(1.2f);
    EXPECT_FLOAT_EQ(world.pointLights.Get(lamp).intensity, 0.0f);
}

TEST_F(LightDecaySystemTest, StartDecayRestartsClockWithoutRestoringIntensity) {
    auto lamp = MakeLamp(2.0f, 2.0f, 2.0f);
    system.Execute(1.0f);
    ASSERT_TRUE(system.StartDecay(lamp));
    EXPECT_DOUBLE_EQ(world.lightDecays.Get(lamp).elapsed, 0.0);
    EXPECT_NEAR(world.pointLights.Get(lamp).intensity, 1.0f, 1e-4f);
}

TEST_F(LightDecaySystemTest, OperationsOnEntityWithoutDecayFail) {
    auto other = world.CreateEntity("Other");
    EXPECT_EQ(system.StartDecay(other).error().code(), ErrorCode::ComponentNotFound);
    EXPECT_EQ(system.ResetAndDecay(other).error().code(), ErrorCode::ComponentNotFound);
    EXPECT_EQ(system.StopDecay(other).error().code(), ErrorCode::ComponentNotFound);
}
