#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gpk/game/teleport_system.hpp"
#include "gpk/game/world_state.hpp"

#include "capture_logger.hpp"
#include "recording_draw.hpp"

using namespace gpk::game;
using gpk::ecs::Entity;
using gpk::foundation::ErrorCode;
using gpk::test::DrawShape;
using gpk::test::RecordingDraw;
using gpk::test::ScopedCaptureLogger;
using kcenon::common::interfaces::log_level;

// ── Fixture ─────────────────────────────────────────────────────────────────

class TeleportSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        player = world.CreateEntity("Player", ObjectTag::Player);
        world.colliders.Add(player, Collider{{}, Vector3{1, 2, 1}, false});

        padA = MakePad("PadA", Vector3{-10, 0, 0});
        padB = MakePad("PadB", Vector3{10, 0, 0});

        spawnB = world.CreateEntity("PadB_Spawn");
        world.transforms.Get(spawnB).position = Vector3{10, 0, 0};
        world.transforms.Get(spawnB).rotation = Quaternion::FromEulerDegrees(0, 180, 0);
        world.parents.Add(spawnB, Parent{padB});

        world.teleporters.Get(padA).destination = spawnB;
    }

    Entity MakePad(const std::string& name, const Vector3& position) {
        auto pad = world.CreateEntity(name);
        world.transforms.Get(pad).position = position;
        world.colliders.Add(pad, Collider{{}, Vector3{2, 1, 2}, true});
        world.teleporters.Add(pad);
        return pad;
    }

    /// Run the system and the deferred clock as one world tick would.
    void Step(float dt) {
        system.Execute(dt);
        world.deferred.advance(dt);
    }

    void StepFor(float seconds, float dt = 0.1f) {
        for (float t = 0.0f; t < seconds; t += dt) {
            Step(dt);
        }
    }

    ScopedCaptureLogger log;
    WorldState world;
    TeleportSystem system{world};
    Entity player;
    Entity padA;
    Entity padB;
    Entity spawnB;
};

// ===========================================================================
// Teleporting
// ===========================================================================

TEST_F(TeleportSystemTest, ImmediateTeleportSetsExactPosition) {
    world.transforms.Get(player).position = Vector3{-10, 0, 0};
    const auto rotationBefore = world.transforms.Get(player).rotation;

    system.OnEntityEnter(padA, player);

    EXPECT_EQ(world.transforms.Get(player).position, world.transforms.Get(spawnB).position);
    EXPECT_EQ(world.transforms.Get(player).rotation, rotationBefore);
    EXPECT_TRUE(world.teleporters.Get(padA).isTeleporting);
    EXPECT_EQ(log->count(log_level::info, "Player teleported to: PadB_Spawn"), 1u);
}

TEST_F(TeleportSystemTest, MatchRotationCopiesDestinationRotation) {
    world.teleporters.Get(padA).matchRotation = true;
    system.OnEntityEnter(padA, player);
    EXPECT_EQ(world.transforms.Get(player).rotation, world.transforms.Get(spawnB).rotation);
}

TEST_F(TeleportSystemTest, DelayedTeleportWaitsForDelay) {
    world.teleporters.Get(padA).delay = 0.5f;
    world.transforms.Get(player).position = Vector3{-10, 0, 0};

    system.OnEntityEnter(padA, player);
    EXPECT_TRUE(world.teleporters.Get(padA).isTeleporting);
    Step(0.3f);
    EXPECT_EQ(world.transforms.Get(player).position, (Vector3{-10, 0, 0}));
    Step(0.3f);
    EXPECT_EQ(world.transforms.Get(player).position, (Vector3{10, 0, 0}));
}

TEST_F(TeleportSystemTest, DelayedTeleportDroppedWhenEntityDestroyed) {
    world.teleporters.Get(padA).delay = 0.5f;
    int teleports = 0;
    world.events.teleported.connect([&](Entity, Entity) { ++teleports; });

    system.OnEntityEnter(padA, player);
    world.DestroyEntity(player);
    StepFor(1.0f);
    EXPECT_EQ(teleports, 0);
}

TEST_F(TeleportSystemTest, IgnoresEntitiesWithOtherTags) {
    auto crate = world.CreateEntity("Crate");
    world.transforms.Get(crate).position = Vector3{-10, 0, 0};

    system.OnEntityEnter(padA, crate);

    EXPECT_EQ(world.transforms.Get(crate).position, (Vector3{-10, 0, 0}));
    EXPECT_FALSE(world.teleporters.Get(padA).entityInTrigger);
    EXPECT_FALSE(world.teleporters.Get(padA).isTeleporting);
}

TEST_F(TeleportSystemTest, AcceptTagIsConfigurable) {
    auto crate = world.CreateEntity("Crate", ObjectTag::Enemy);
    world.teleporters.Get(padA).acceptTag = ObjectTag::Enemy;
    system.OnEntityEnter(padA, crate);
    EXPECT_EQ(world.transforms.Get(crate).position, (Vector3{10, 0, 0}));
}

TEST_F(TeleportSystemTest, MissingDestinationLogsAndDoesNothing) {
    world.teleporters.Get(padA).destination = Entity::invalid();
    world.transforms.Get(player).position = Vector3{1, 2, 3};

    system.OnEntityEnter(padA, player);

    EXPECT_EQ(world.transforms.Get(player).position, (Vector3{1, 2, 3}));
    EXPECT_FALSE(world.teleporters.Get(padA).isTeleporting);
    EXPECT_GE(log->count(log_level::error, "no destination"), 1u);
}

TEST_F(TeleportSystemTest, EmitsSoundEffectAndTeleportedSignals) {
    auto& tp = world.teleporters.Get(padA);
    tp.sound = "whoosh";
    tp.effect = "sparks";

    std::vector<std::string> sounds;
    std::vector<std::string> effects;
    Entity teleportedTo;
    world.events.soundRequested.connect(
        [&](Entity source, const std::string& clip) {
            EXPECT_EQ(source, padA);
            sounds.push_back(clip);
        });
    world.events.effectRequested.connect(
        [&](const std::string& effect, const Vector3& at, const Quaternion&) {
            EXPECT_EQ(at, (Vector3{10, 0, 0}));
            effects.push_back(effect);
        });
    world.events.teleported.connect([&](Entity, Entity dest) { teleportedTo = dest; });

    system.OnEntityEnter(padA, player);

    EXPECT_EQ(sounds, (std::vector<std::string>{"whoosh"}));
    EXPECT_EQ(effects, (std::vector<std::string>{"sparks"}));
    EXPECT_EQ(teleportedTo, spawnB);
}

TEST_F(TeleportSystemTest, SecondEnterWhileTeleportingIsIgnored) {
    int teleports = 0;
    world.events.teleported.connect([&](Entity, Entity) { ++teleports; });

    system.OnEntityEnter(padA, player);
    world.transforms.Get(player).position = Vector3{-10, 0, 0};
    system.OnEntityEnter(padA, player);
    EXPECT_EQ(teleports, 1);
}

// ===========================================================================
// Reset and exit
// ===========================================================================

TEST_F(TeleportSystemTest, ResetClearsTeleportingOnlyAfterExit) {
    system.OnEntityEnter(padA, player);
    StepFor(1.2f);
    // Still flagged as inside: no exit event yet.
    EXPECT_TRUE(world.teleporters.Get(padA).isTeleporting);

    system.OnEntityExit(padA, player);
    EXPECT_FALSE(world.teleporters.Get(padA).isTeleporting);
    EXPECT_FALSE(world.teleporters.Get(padA).entityInTrigger);
}

TEST_F(TeleportSystemTest, ResetFiresAfterOneSecondWhenOutside) {
    system.OnEntityEnter(padA, player);
    world.teleporters.Get(padA).entityInTrigger = false;
    StepFor(0.8f);
    EXPECT_TRUE(world.teleporters.Get(padA).isTeleporting);
    StepFor(0.4f);
    EXPECT_FALSE(world.teleporters.Get(padA).isTeleporting);
}

// ===========================================================================
// Arrival at a linked teleporter
// ===========================================================================

TEST_F(TeleportSystemTest, ArrivalBlocksBounceBack) {
    world.teleporters.Get(padB).destination = world.CreateEntity("PadA_Spawn");
    world.transforms.Get(world.teleporters.Get(padB).destination).position = Vector3{-10, 0, 2};

    system.OnEntityEnter(padA, player);
    ASSERT_EQ(world.transforms.Get(player).position, (Vector3{10, 0, 0}));
    EXPECT_TRUE(world.teleporters.Get(padB).isTeleporting);
    EXPECT_TRUE(world.teleporters.Get(padB).entityInTrigger);

    // The host reports the arrival overlap; padB must not send the player back.
    system.OnEntityEnter(padB, player);
    EXPECT_EQ(world.transforms.Get(player).position, (Vector3{10, 0, 0}));

    // Still inside after several polls.
    StepFor(4.0f);
    EXPECT_TRUE(world.teleporters.Get(padB).isTeleporting);
    EXPECT_EQ(world.transforms.Get(player).position, (Vector3{10, 0, 0}));
}

TEST_F(TeleportSystemTest, ArrivalPollClearsFlagsOnceEntityLeaves) {
    system.OnEntityEnter(padA, player);
    ASSERT_TRUE(world.teleporters.Get(padB).isTeleporting);

    world.transforms.Get(player).position = Vector3{30, 0, 0};
    StepFor(1.6f);

    EXPECT_FALSE(world.teleporters.Get(padB).isTeleporting);
    EXPECT_FALSE(world.teleporters.Get(padB).entityInTrigger);
    EXPECT_EQ(world.teleporters.Get(padB).arrivalPoll, 0u);
}

TEST_F(TeleportSystemTest, ArrivalPollClearsFlagsWhenEntityGone) {
    system.OnEntityEnter(padA, player);
    world.DestroyEntity(player);
    StepFor(1.6f);
    EXPECT_FALSE(world.teleporters.Get(padB).isTeleporting);
}

TEST_F(TeleportSystemTest, RepeatedArrivalKeepsSinglePoll) {
    ASSERT_TRUE(system.NotifyArrival(padB, player));
    const auto pendingAfterFirst = world.deferred.pending();
    ASSERT_TRUE(system.NotifyArrival(padB, player));
    EXPECT_EQ(world.deferred.pending(), pendingAfterFirst);
}

TEST_F(TeleportSystemTest, NotifyArrivalOnNonTeleporterFails) {
    auto result = system.NotifyArrival(spawnB, player);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::NotATeleporter);
}

// ===========================================================================
// Start validation
// ===========================================================================

TEST_F(TeleportSystemTest, StartReportsConfigurationProblems) {
    auto bare = world.CreateEntity("Bare");
    world.teleporters.Add(bare);
    auto solid = world.CreateEntity("Solid");
    world.colliders.Add(solid, Collider{});
    world.teleporters.Add(solid, Teleporter{spawnB});

    Step(0.016f);

    EXPECT_EQ(log->count(log_level::error, "Teleporter 'Bare' requires a Collider"), 1u);
    EXPECT_EQ(log->count(log_level::error, "Teleporter 'Bare' has no teleport destination"), 1u);
    EXPECT_EQ(log->count(log_level::warning, "Teleporter 'Solid' collider should be a trigger"),
              1u);

    // Validation runs once.
    Step(0.016f);
    EXPECT_EQ(log->count(log_level::error, "Teleporter 'Bare' requires a Collider"), 1u);
}

TEST_F(TeleportSystemTest, ContactEventsRouteToEnterAndExit) {
    system.OnContact({ContactKind::TriggerEnter, padA, player});
    EXPECT_EQ(world.transforms.Get(player).position, (Vector3{10, 0, 0}));
    system.OnContact({ContactKind::TriggerExit, padA, player});
    EXPECT_FALSE(world.teleporters.Get(padA).isTeleporting);
}

// ===========================================================================
// Gizmos
// ===========================================================================

TEST_F(TeleportSystemTest, GizmosDrawDestinationAndTrigger) {
    RecordingDraw draw;
    system.DrawGizmos(draw);

    // padA has a destination; padB does not.
    EXPECT_EQ(draw.Count(DrawShape::Line, GizmoColor::Cyan), 1u);
    EXPECT_EQ(draw.Count(DrawShape::WireSphere, GizmoColor::Green), 1u);
    EXPECT_EQ(draw.Count(DrawShape::Ray, GizmoColor::Green), 1u);
    EXPECT_EQ(draw.Count(DrawShape::WireCube, GizmoColor::Yellow), 2u);

    for (const auto& call : draw.calls) {
        if (call.shape == DrawShape::WireSphere) {
            EXPECT_FLOAT_EQ(call.radius, kDestinationMarkerRadius);
        }
        if (call.shape == DrawShape::Ray) {
            EXPECT_EQ(call.b, (Vector3{0, kDestinationRayLength, 0}));
        }
    }
}
