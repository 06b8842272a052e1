#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gpk/game/enemy_system.hpp"
#include "gpk/game/game_world.hpp"
#include "gpk/game/light_decay_system.hpp"
#include "gpk/game/scene_loader.hpp"
#include "gpk/game/teleport_system.hpp"

#include "capture_logger.hpp"
#include "recording_draw.hpp"

using namespace gpk::game;
using gpk::ecs::Entity;
using gpk::test::DrawShape;
using gpk::test::RecordingDraw;
using gpk::test::ScopedCaptureLogger;

// ── Fixture ─────────────────────────────────────────────────────────────────

class GameWorldTest : public ::testing::Test {
protected:
    Entity MakePlayer() {
        auto player = world.CreateEntity("Player", ObjectTag::Player);
        world.State().colliders.Add(player, Collider{{}, Vector3{1, 2, 1}, false});
        world.State().playerControls.Add(player);
        return player;
    }

    ScopedCaptureLogger log;
    GameWorld world{GameWorldConfig{"level01", 7}};
};

// ===========================================================================
// Bookkeeping
// ===========================================================================

TEST_F(GameWorldTest, ConfigIsKept) {
    EXPECT_EQ(world.Config().sceneName, "level01");
    EXPECT_EQ(world.Config().randomSeed, 7u);
    EXPECT_EQ(world.State().sceneName, "level01");
}

TEST_F(GameWorldTest, TickCountsAndAccumulatesTime) {
    EXPECT_EQ(world.TickCount(), 0u);
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(world.Tick(0.25f).hasValue());
    }
    EXPECT_EQ(world.TickCount(), 4u);
    EXPECT_DOUBLE_EQ(world.ElapsedTime(), 1.0);
}

TEST_F(GameWorldTest, EntityLifecycleGoesThroughState) {
    auto box = world.CreateEntity("Box");
    EXPECT_TRUE(world.IsAlive(box));
    EXPECT_EQ(world.FindByName("Box"), box);
    EXPECT_TRUE(world.State().transforms.Has(box));

    world.DestroyEntity(box);
    EXPECT_FALSE(world.IsAlive(box));
    EXPECT_FALSE(world.FindByName("Box").isValid());
}

TEST_F(GameWorldTest, MoveKeepsSystemsWired) {
    auto player = MakePlayer();
    auto dest = world.CreateEntity("Dest");
    world.State().transforms.Get(dest).position = Vector3{4, 0, 4};
    auto pad = world.CreateEntity("Pad");
    world.State().teleporters.Add(pad).destination = dest;

    GameWorld moved(std::move(world));
    moved.PushContact({ContactKind::TriggerEnter, pad, player});
    ASSERT_TRUE(moved.Tick(0.1f).hasValue());
    EXPECT_EQ(moved.State().transforms.Get(player).position, (Vector3{4, 0, 4}));
}

// ===========================================================================
// Systems through Tick
// ===========================================================================

TEST_F(GameWorldTest, ContactIsDispatchedOnNextTick) {
    auto player = MakePlayer();
    auto dest = world.CreateEntity("Dest");
    world.State().transforms.Get(dest).position = Vector3{5, 0, -5};
    auto pad = world.CreateEntity("Pad");
    world.State().teleporters.Add(pad).destination = dest;

    std::vector<Entity> teleported;
    world.Events().teleported.connect(
        [&](Entity entity, Entity destination) {
            teleported.push_back(entity);
            EXPECT_EQ(destination, dest);
        });

    world.PushContact({ContactKind::TriggerEnter, pad, player});
    EXPECT_EQ(world.State().transforms.Get(player).position, Vector3::Zero());

    ASSERT_TRUE(world.Tick(0.1f).hasValue());
    EXPECT_EQ(world.State().transforms.Get(player).position, (Vector3{5, 0, -5}));
    EXPECT_EQ(teleported, std::vector<Entity>{player});
}

TEST_F(GameWorldTest, DelayedTeleportCompletesThroughDeferredActions) {
    auto player = MakePlayer();
    auto dest = world.CreateEntity("Dest");
    world.State().transforms.Get(dest).position = Vector3{0, 0, 9};
    auto pad = world.CreateEntity("Pad");
    auto& tp = world.State().teleporters.Add(pad);
    tp.destination = dest;
    tp.delay = 0.5f;

    world.PushContact({ContactKind::TriggerEnter, pad, player});
    ASSERT_TRUE(world.Tick(0.25f).hasValue());
    EXPECT_EQ(world.State().transforms.Get(player).position, Vector3::Zero());

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(world.Tick(0.25f).hasValue());
    }
    EXPECT_EQ(world.State().transforms.Get(player).position, (Vector3{0, 0, 9}));
}

TEST_F(GameWorldTest, LightFadesOutThroughTick) {
    auto lamp = world.CreateEntity("Lamp");
    world.State().pointLights.Add(lamp, PointLight{2.0f});
    auto& decay = world.State().lightDecays.Add(lamp);
    decay.minTime = 1.0f;
    decay.maxTime = 1.0f;

    ASSERT_TRUE(world.Tick(0.5f).hasValue());
    EXPECT_NEAR(world.State().pointLights.Get(lamp).intensity, 1.0f, 1e-4f);

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(world.Tick(0.5f).hasValue());
    }
    EXPECT_FLOAT_EQ(world.State().pointLights.Get(lamp).intensity, 0.0f);
    EXPECT_FALSE(world.State().lightDecays.Get(lamp).active);
}

TEST_F(GameWorldTest, GameOverLeadsToSceneReloadAfterDelay) {
    auto player = MakePlayer();
    auto guard = world.CreateEntity("Guard", ObjectTag::Enemy);
    auto& ctl = world.State().enemies.Add(guard);
    ctl.config.gameOverDelay = 0.5f;
    ctl.config.gameOverMessage = "Caught";

    std::vector<std::string> messages;
    std::vector<std::string> reloads;
    world.Events().gameOver.connect(
        [&](Entity, const std::string& message) { messages.push_back(message); });
    world.Events().sceneReloadRequested.connect(
        [&](const std::string& scene) { reloads.push_back(scene); });

    world.PushContact({ContactKind::CollisionEnter, guard, player});
    ASSERT_TRUE(world.Tick(0.25f).hasValue());
    EXPECT_EQ(messages, std::vector<std::string>{"Caught"});
    EXPECT_FALSE(world.State().playerControls.Get(player).enabled);
    EXPECT_TRUE(reloads.empty());

    // A second contact does not fire again.
    world.PushContact({ContactKind::CollisionEnter, player, guard});
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(world.Tick(0.25f).hasValue());
    }
    EXPECT_EQ(messages.size(), 1u);
    EXPECT_EQ(reloads, std::vector<std::string>{"level01"});
}

TEST_F(GameWorldTest, SystemAccessorsShareWorldState) {
    auto lamp = world.CreateEntity("Lamp");
    world.State().pointLights.Add(lamp, PointLight{1.0f});
    world.State().lightDecays.Add(lamp);

    EXPECT_TRUE(world.Lights().StartDecay(lamp).hasValue());
    EXPECT_TRUE(world.State().lightDecays.Get(lamp).started);

    auto pad = world.CreateEntity("Pad");
    world.State().teleporters.Add(pad);
    EXPECT_TRUE(world.Teleports().NotifyArrival(pad, world.CreateEntity("Other")).hasValue());
    EXPECT_FALSE(world.Teleports().NotifyArrival(lamp, pad).hasValue());
}

// ===========================================================================
// Gizmos
// ===========================================================================

TEST_F(GameWorldTest, DrawGizmosForwardsToTeleportsAndEnemies) {
    auto dest = world.CreateEntity("Dest");
    auto pad = world.CreateEntity("Pad");
    world.State().colliders.Add(pad, Collider{{}, Vector3{2, 1, 2}, true});
    world.State().teleporters.Add(pad).destination = dest;

    auto walker = world.CreateEntity("Walker", ObjectTag::Enemy);
    world.State().enemies.Add(walker).config.type = EnemyType::LineOscillate;
    ASSERT_TRUE(world.Tick(0.0f).hasValue());

    RecordingDraw draw;
    world.DrawGizmos(draw);
    EXPECT_EQ(draw.Count(DrawShape::WireCube, GizmoColor::Yellow), 1u);
    EXPECT_EQ(draw.Count(DrawShape::Line, GizmoColor::Cyan), 1u);
    EXPECT_EQ(draw.Count(DrawShape::Line, GizmoColor::Blue), 1u);
    EXPECT_EQ(draw.Count(DrawShape::WireSphere, GizmoColor::Red), 1u);
}

// ===========================================================================
// Scenes
// ===========================================================================

TEST_F(GameWorldTest, LoadedSceneRunsEndToEnd) {
    auto loaded = LoadSceneFromString(R"(
entities:
  - name: Player
    tag: Player
    player_control: true
  - name: PadA
    collider: { size: [2, 1, 2], trigger: true }
    teleporter: { destination: PadB_Spawn }
  - name: PadB
    transform: { position: [20, 0, 0] }
    collider: { size: [2, 1, 2], trigger: true }
    teleporter: { destination: PadA }
  - name: PadB_Spawn
    parent: PadB
    transform: { position: [20, 0, 0] }
)", world.State());
    ASSERT_TRUE(loaded.hasValue());

    auto player = world.FindByName("Player");
    auto padA = world.FindByName("PadA");
    auto padB = world.FindByName("PadB");
    world.PushContact({ContactKind::TriggerEnter, padA, player});
    ASSERT_TRUE(world.Tick(0.1f).hasValue());
    EXPECT_EQ(world.State().transforms.Get(player).position, (Vector3{20, 0, 0}));

    // Arriving on PadB must not bounce the player straight back.
    world.PushContact({ContactKind::TriggerEnter, padB, player});
    ASSERT_TRUE(world.Tick(0.1f).hasValue());
    EXPECT_EQ(world.State().transforms.Get(player).position, (Vector3{20, 0, 0}));
}
