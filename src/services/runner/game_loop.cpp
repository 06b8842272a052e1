/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "gpk/service/game_loop.hpp"

namespace gpk::service {

namespace {

constexpr uint32_t kFallbackTickRate = 60;

} // namespace

GameLoop::GameLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : kFallbackTickRate),
      targetFrameTime_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::setTickCallback(TickCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

void GameLoop::setMaxTicks(uint64_t maxTicks) noexcept {
    maxTicks_.store(maxTicks);
}

bool GameLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();  // previous run already finished on its own
    }
    thread_ = std::thread([this] { run(); });
    return true;
}

void GameLoop::requestStop() noexcept {
    running_.store(false);
}

void GameLoop::stop() {
    requestStop();
    wait();
}

void GameLoop::wait() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

TickMetrics GameLoop::tick() {
    auto metrics = executeTick();
    std::lock_guard<std::mutex> lock(metricsMutex_);
    lastMetrics_ = metrics;
    return metrics;
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

float GameLoop::deltaSeconds() const noexcept {
    return static_cast<float>(targetFrameTime_.count()) / 1'000'000.0f;
}

uint64_t GameLoop::tickCount() const noexcept {
    return tickCount_.load();
}

TickMetrics GameLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void GameLoop::run() {
    auto nextTick = std::chrono::steady_clock::now();

    while (running_.load()) {
        const auto limit = maxTicks_.load();
        if (limit != 0 && tickCount_.load() >= limit) {
            break;
        }

        nextTick += targetFrameTime_;
        auto metrics = executeTick();

        {
            std::lock_guard<std::mutex> lock(metricsMutex_);
            lastMetrics_ = metrics;
        }
        {
            std::lock_guard<std::mutex> lock(callbackMutex_);
            if (metricsCallback_) {
                metricsCallback_(metrics);
            }
        }

        auto now = std::chrono::steady_clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
        } else {
            // Overran: do not try to catch up.
            nextTick = now;
        }
    }

    running_.store(false);
}

TickMetrics GameLoop::executeTick() {
    const auto frameStart = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (tickCallback_) {
            tickCallback_(deltaSeconds());
        }
    }
    const auto updateTime = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - frameStart);

    TickMetrics metrics;
    metrics.updateTime = updateTime;
    metrics.budgetUtilization =
        targetFrameTime_.count() > 0
            ? static_cast<float>(updateTime.count()) / static_cast<float>(targetFrameTime_.count())
            : 0.0f;
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = updateTime > targetFrameTime_;
    return metrics;
}

} // namespace gpk::service
