#pragma once

/// @file system_scheduler.hpp
/// @brief Staged, dependency-ordered system execution.
///
/// Systems are grouped into stages that always run in order
/// PreUpdate -> Update -> PostUpdate.  Inside a stage the order follows
/// declared dependencies (topological sort), falling back to registration
/// order for unrelated systems so a tick is fully deterministic.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gpk/foundation/game_result.hpp"

namespace gpk::ecs {

// ── System type identification ──────────────────────────────────────────

using SystemTypeId = uint32_t;

constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Stable per-process id for system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

// ── Execution stages ────────────────────────────────────────────────────

enum class SystemStage : uint8_t {
    PreUpdate,   ///< Event intake (contact dispatch)
    Update,      ///< Gameplay logic
    PostUpdate   ///< Timers and deferred continuations
};

inline constexpr std::size_t kSystemStageCount = 3;

// ── System interface ────────────────────────────────────────────────────

/// Base class for ECS systems.  The scheduler owns registered systems.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Run one tick.
    /// @param deltaTime  Simulated seconds since the previous tick.
    virtual void Execute(float deltaTime) = 0;

    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

// ── System scheduler ────────────────────────────────────────────────────

class SystemScheduler {
public:
    SystemScheduler() = default;

    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    // ── Registration ────────────────────────────────────────────────

    /// Construct and register a system of type `T`.
    /// Registering a type twice returns the existing instance.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    [[nodiscard]] std::size_t SystemCount() const noexcept { return systems_.size(); }

    // ── Dependencies ────────────────────────────────────────────────

    /// Declare that `before` runs before `after`.
    /// @return false if either is unregistered or they live in different stages.
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    template <typename Before, typename After>
    bool AddDependency() {
        return AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
    }

    // ── Enable / disable ────────────────────────────────────────────

    void SetEnabled(SystemTypeId system, bool enabled);

    template <typename T>
    void SetEnabled(bool enabled) {
        SetEnabled(SystemType<T>::Id(), enabled);
    }

    [[nodiscard]] bool IsEnabled(SystemTypeId system) const;

    // ── Execution ───────────────────────────────────────────────────

    /// Compute the per-stage execution order.
    /// @return CircularDependency naming the systems left in the cycle.
    foundation::GameResult<void> Build();

    /// Run all enabled systems in stage order.
    /// @pre Build() succeeded.
    void Execute(float deltaTime);

    // ── Queries ─────────────────────────────────────────────────────

    /// @return nullptr if `T` is not registered.
    template <typename T>
    [[nodiscard]] T* GetSystem();

    [[nodiscard]] const std::vector<SystemTypeId>& GetExecutionOrder(SystemStage stage) const {
        return order_[static_cast<std::size_t>(stage)];
    }

private:
    struct SystemEntry {
        std::unique_ptr<ISystem> instance;
        SystemStage stage = SystemStage::Update;
        std::size_t registrationIndex = 0;
        bool enabled = true;
    };

    std::unordered_map<SystemTypeId, SystemEntry> systems_;
    std::unordered_map<SystemTypeId, std::vector<SystemTypeId>> edges_;
    std::vector<SystemTypeId> order_[kSystemStageCount];
    bool built_ = false;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T, typename... Args>
T& SystemScheduler::Register(Args&&... args) {
    static_assert(std::is_base_of_v<ISystem, T>, "T must derive from ISystem");

    const auto id = SystemType<T>::Id();
    auto it = systems_.find(id);
    if (it != systems_.end()) {
        return static_cast<T&>(*it->second.instance);
    }

    auto system = std::make_unique<T>(std::forward<Args>(args)...);
    auto& ref = *system;

    SystemEntry entry;
    entry.stage = system->GetStage();
    entry.registrationIndex = systems_.size();
    entry.instance = std::move(system);
    systems_.emplace(id, std::move(entry));
    built_ = false;
    return ref;
}

template <typename T>
T* SystemScheduler::GetSystem() {
    auto it = systems_.find(SystemType<T>::Id());
    if (it == systems_.end()) {
        return nullptr;
    }
    return static_cast<T*>(it->second.instance.get());
}

} // namespace gpk::ecs
