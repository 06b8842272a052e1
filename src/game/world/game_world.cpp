/// @file game_world.cpp
/// @brief GameWorld implementation: system wiring and tick bookkeeping.

#include "gpk/game/game_world.hpp"

#include "gpk/ecs/system_scheduler.hpp"
#include "gpk/foundation/game_logger.hpp"
#include "gpk/game/body_integration_system.hpp"
#include "gpk/game/contact_dispatch_system.hpp"
#include "gpk/game/deferred_action_system.hpp"
#include "gpk/game/enemy_system.hpp"
#include "gpk/game/light_decay_system.hpp"
#include "gpk/game/teleport_system.hpp"

#include <utility>

namespace gpk::game {

using foundation::GameResult;
using foundation::LogCategory;

// -- Impl --------------------------------------------------------------------

struct GameWorld::Impl {
    GameWorldConfig config;
    WorldState state;
    ContactQueue contacts;
    ecs::SystemScheduler scheduler;

    TeleportSystem* teleports = nullptr;
    LightDecaySystem* lights = nullptr;
    EnemySystem* enemies = nullptr;

    bool built = false;
    double elapsed = 0.0;
    uint64_t ticks = 0;

    explicit Impl(GameWorldConfig cfg)
        : config(std::move(cfg)), state(config.randomSeed) {
        state.sceneName = config.sceneName;

        auto& dispatch = scheduler.Register<ContactDispatchSystem>(contacts);
        teleports = &scheduler.Register<TeleportSystem>(state);
        lights = &scheduler.Register<LightDecaySystem>(state);
        enemies = &scheduler.Register<EnemySystem>(state);
        scheduler.Register<BodyIntegrationSystem>(state.transforms, state.rigidBodies);
        scheduler.Register<DeferredActionSystem>(state.deferred);

        scheduler.AddDependency<EnemySystem, BodyIntegrationSystem>();

        dispatch.AddHandler(teleports);
        dispatch.AddHandler(enemies);
    }
};

// -- Construction ------------------------------------------------------------

GameWorld::GameWorld(GameWorldConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

GameWorld::~GameWorld() = default;

GameWorld::GameWorld(GameWorld&&) noexcept = default;
GameWorld& GameWorld::operator=(GameWorld&&) noexcept = default;

// -- Entities ----------------------------------------------------------------

ecs::Entity GameWorld::CreateEntity(std::string name, ObjectTag tag) {
    return impl_->state.CreateEntity(std::move(name), tag);
}

void GameWorld::DestroyEntity(ecs::Entity entity) {
    impl_->state.DestroyEntity(entity);
}

ecs::Entity GameWorld::FindByName(std::string_view name) const {
    return impl_->state.FindByName(name);
}

bool GameWorld::IsAlive(ecs::Entity entity) const {
    return impl_->state.IsAlive(entity);
}

WorldState& GameWorld::State() noexcept { return impl_->state; }

const WorldState& GameWorld::State() const noexcept { return impl_->state; }

WorldEvents& GameWorld::Events() noexcept { return impl_->state.events; }

// -- Simulation --------------------------------------------------------------

void GameWorld::PushContact(const ContactEvent& event) {
    impl_->contacts.Push(event);
}

GameResult<void> GameWorld::Tick(float deltaTime) {
    if (!impl_->built) {
        auto built = impl_->scheduler.Build();
        if (!built) {
            GPK_LOG_ERROR(LogCategory::Core, std::string(built.error().message()));
            return built;
        }
        impl_->built = true;
    }

    impl_->scheduler.Execute(deltaTime);
    impl_->elapsed += deltaTime;
    ++impl_->ticks;
    return GameResult<void>::ok();
}

double GameWorld::ElapsedTime() const noexcept { return impl_->elapsed; }

uint64_t GameWorld::TickCount() const noexcept { return impl_->ticks; }

void GameWorld::DrawGizmos(IDebugDraw& draw) const {
    impl_->teleports->DrawGizmos(draw);
    impl_->enemies->DrawGizmos(draw);
}

// -- Systems -----------------------------------------------------------------

TeleportSystem& GameWorld::Teleports() noexcept { return *impl_->teleports; }

LightDecaySystem& GameWorld::Lights() noexcept { return *impl_->lights; }

EnemySystem& GameWorld::Enemies() noexcept { return *impl_->enemies; }

const GameWorldConfig& GameWorld::Config() const noexcept { return impl_->config; }

}  // namespace gpk::game
