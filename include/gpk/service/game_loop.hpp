#pragma once

/// @file game_loop.hpp
/// @brief Fixed-rate driver for GameWorld ticks.
///
/// GameLoop calls a tick callback at a fixed rate on its own thread, or
/// once per tick() call when driven by hand.  Every tick receives the same
/// fixed delta, so simulated time never depends on wall-clock jitter.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace gpk::service {

/// Per-tick timing.
struct TickMetrics {
    /// Wall time spent in the tick callback.
    std::chrono::microseconds updateTime{0};

    /// updateTime relative to the frame budget (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Zero-based tick index.
    uint64_t tickNumber = 0;

    /// True when the callback took longer than one frame.
    bool overrun = false;
};

/// Usage:
/// @code
///   GameLoop loop(60);
///   loop.setTickCallback([&](float dt) { (void)world.Tick(dt); });
///   loop.setMaxTicks(600);          // stop on its own after 10 s
///   if (loop.start()) loop.wait();
/// @endcode
class GameLoop {
public:
    using TickCallback = std::function<void(float deltaTime)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// @param tickRate  Ticks per second; 0 falls back to 60.
    explicit GameLoop(uint32_t tickRate = 60);

    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    void setTickCallback(TickCallback callback);

    void setMetricsCallback(MetricsCallback callback);

    /// Stop by itself after @p maxTicks ticks in total; 0 means unbounded.
    void setMaxTicks(uint64_t maxTicks) noexcept;

    /// Start ticking on a dedicated thread.
    /// @return false if already running.
    [[nodiscard]] bool start();

    /// Ask the loop to finish after the current tick.  Safe from any
    /// thread, including from inside the tick callback.
    void requestStop() noexcept;

    /// requestStop() and join.  Must not be called from the tick callback.
    void stop();

    /// Block until the loop thread exits (max ticks or requestStop()).
    void wait();

    /// Run one tick on the calling thread.
    /// @pre The loop is not running on its own thread.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] uint32_t tickRate() const noexcept { return tickRate_; }

    /// Fixed delta passed to every tick, in seconds.
    [[nodiscard]] float deltaSeconds() const noexcept;

    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept {
        return targetFrameTime_;
    }

    [[nodiscard]] uint64_t tickCount() const noexcept;

    [[nodiscard]] TickMetrics lastMetrics() const;

private:
    void run();
    TickMetrics executeTick();

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::atomic<uint64_t> maxTicks_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    TickMetrics lastMetrics_;

    mutable std::mutex callbackMutex_;
};

}  // namespace gpk::service
