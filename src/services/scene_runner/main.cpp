/// @file main.cpp
/// @brief Scene runner entry point.
///
/// Loads a scene document into a GameWorld and ticks it at a fixed rate
/// until SIGINT/SIGTERM or until the configured tick limit is reached.
///
///   gpk_scene_runner --config <path> [--scene <path>] [--ticks N]

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <kcenon/common/interfaces/global_logger_registry.h>

#include "gpk/foundation/config_manager.hpp"
#include "gpk/foundation/game_logger.hpp"
#include "gpk/game/game_world.hpp"
#include "gpk/game/scene_loader.hpp"
#include "gpk/service/console_logger.hpp"
#include "gpk/service/game_loop.hpp"
#include "gpk/service/service_runner.hpp"
#include "gpk/version.hpp"

namespace {

using gpk::foundation::LogCategory;

struct RunnerConfig {
    uint32_t tickRate = 60;
    uint32_t randomSeed = gpk::game::kDefaultRandomSeed;
    std::string scenePath;
    uint64_t maxTicks = 0;
};

RunnerConfig buildRunnerConfig(const gpk::foundation::ConfigManager& config) {
    RunnerConfig cfg;
    cfg.tickRate = config.getOr<uint32_t>("world.tick_rate", cfg.tickRate);
    cfg.randomSeed = config.getOr<uint32_t>("world.random_seed", cfg.randomSeed);
    cfg.scenePath = config.getOr<std::string>("world.scene", cfg.scenePath);
    cfg.maxTicks = config.getOr<uint64_t>("world.max_ticks", cfg.maxTicks);
    return cfg;
}

/// One loaded scene plus the flag its reload request sets.
class SceneSession {
public:
    SceneSession(std::string scenePath, uint32_t seed)
        : scenePath_(std::move(scenePath)), seed_(seed) {}

    gpk::foundation::GameResult<void> load() {
        world_ = std::make_unique<gpk::game::GameWorld>(
            gpk::game::GameWorldConfig{"main", seed_});
        reloadPending_ = false;

        auto report = gpk::game::LoadSceneFile(scenePath_, world_->State());
        if (!report) {
            return gpk::foundation::GameResult<void>::err(report.error());
        }
        connectEvents();
        return gpk::foundation::GameResult<void>::ok();
    }

    gpk::foundation::GameResult<void> tick(float dt) {
        if (reloadPending_) {
            GPK_LOG_INFO(LogCategory::Core, "Reloading scene " + scenePath_);
            auto reloaded = load();
            if (!reloaded) {
                return reloaded;
            }
        }
        return world_->Tick(dt);
    }

private:
    void connectEvents() {
        auto& state = world_->State();
        auto& events = world_->Events();
        events.soundRequested.connect([&state](gpk::ecs::Entity source, const std::string& clip) {
            GPK_LOG_DEBUG(LogCategory::Core, "Play sound '" + clip + "' at " + state.NameOf(source));
        });
        events.effectRequested.connect(
            [](const std::string& effect, const gpk::game::Vector3& at, const gpk::game::Quaternion&) {
                GPK_LOG_DEBUG(LogCategory::Core,
                              "Spawn effect '" + effect + "' at (" + std::to_string(at.x) + ", " +
                                  std::to_string(at.y) + ", " + std::to_string(at.z) + ")");
            });
        events.gameOver.connect([](gpk::ecs::Entity, const std::string& message) {
            std::cout << message << std::endl;
        });
        events.sceneReloadRequested.connect([this](const std::string&) { reloadPending_ = true; });
    }

    std::string scenePath_;
    uint32_t seed_;
    std::unique_ptr<gpk::game::GameWorld> world_;
    bool reloadPending_ = false;
};

} // namespace

int main(int argc, char* argv[]) {
    gpk::service::SignalHandler signals;

    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    registry.set_default_logger(std::make_shared<gpk::service::ConsoleLogger>());

    auto configPath = gpk::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "config/runner.yaml";
    }

    gpk::foundation::ConfigManager config;
    auto loadResult = gpk::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    gpk::service::applyLoggingConfig(config);

    auto runnerCfg = buildRunnerConfig(config);
    if (auto scene = gpk::service::parseArg(argc, argv, "--scene")) {
        runnerCfg.scenePath = *scene;
    }
    auto ticks = gpk::service::parseTicksArg(argc, argv);
    if (!ticks) {
        std::cerr << ticks.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (ticks.value()) {
        runnerCfg.maxTicks = *ticks.value();
    }
    if (runnerCfg.scenePath.empty()) {
        std::cerr << "No scene given (world.scene or --scene)\n";
        return EXIT_FAILURE;
    }

    SceneSession session(runnerCfg.scenePath, runnerCfg.randomSeed);
    auto sceneResult = session.load();
    if (!sceneResult) {
        std::cerr << "Failed to load scene: " << sceneResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    gpk::service::GameLoop loop(runnerCfg.tickRate);
    loop.setMaxTicks(runnerCfg.maxTicks);

    bool failed = false;
    loop.setTickCallback([&](float dt) {
        auto result = session.tick(dt);
        if (!result) {
            GPK_LOG_ERROR(LogCategory::Core, "Tick failed: " + result.error().describe());
            failed = true;
            loop.requestStop();
        }
    });
    loop.setMetricsCallback([](const gpk::service::TickMetrics& metrics) {
        if (metrics.overrun) {
            GPK_LOG_WARN(LogCategory::Core,
                         "Tick " + std::to_string(metrics.tickNumber) + " overran its budget");
        }
    });

    std::cout << "gpk_scene_runner " << gpk::Version::string << " running "
              << runnerCfg.scenePath << " at " << loop.tickRate() << " Hz\n";

    if (!loop.start()) {
        std::cerr << "Failed to start game loop\n";
        return EXIT_FAILURE;
    }

    using namespace std::chrono_literals;
    while (loop.isRunning() && !signals.shutdownRequested()) {
        std::this_thread::sleep_for(50ms);
    }
    loop.stop();

    std::cout << "Stopped after " << loop.tickCount() << " ticks\n";
    (void)gpk::foundation::GameLogger::instance().flush();
    registry.clear();
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
