#pragma once

/// @file deferred_scheduler.hpp
/// @brief Simulated-time timer queue for delayed gameplay continuations.

#include "gpk/foundation/game_result.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace gpk::foundation {

/// Runs actions after a delay measured in simulated seconds.
///
/// Time only moves when advance() is called, normally once per world tick,
/// so delayed teleports, flag resets and reload requests are reproducible.
/// An action sees the world as it is when it fires and must re-check any
/// entity it captured.
///
/// Example:
/// @code
///   DeferredScheduler timers;
///   auto id = timers.schedule(1.0, [&] { resetFlag(); });
///   timers.advance(0.5);   // nothing fires
///   timers.advance(0.5);   // resetFlag() runs
/// @endcode
class DeferredScheduler {
public:
    using ActionId = uint64_t;
    using Action = std::function<void()>;

    DeferredScheduler() = default;

    DeferredScheduler(const DeferredScheduler&) = delete;
    DeferredScheduler& operator=(const DeferredScheduler&) = delete;

    /// Arm @p action to fire @p delaySeconds from now.
    /// @return The action id, or InvalidArgument for a negative delay or an
    ///         empty action.
    GameResult<ActionId> schedule(double delaySeconds, Action action);

    /// Disarm a pending action.
    /// @return JobNotFound if @p id is unknown or already fired.
    GameResult<void> cancel(ActionId id);

    /// Move the clock forward by @p deltaSeconds and fire every due action,
    /// earliest first (ties in scheduling order).  Actions armed while
    /// firing wait for the next advance() even if their delay is zero.
    void advance(double deltaSeconds);

    /// Drop all pending actions without firing them.
    void clear();

    [[nodiscard]] std::size_t pending() const noexcept { return actions_.size(); }

    /// Simulated seconds accumulated by advance().
    [[nodiscard]] double now() const noexcept { return now_; }

private:
    // (fire time, scheduling sequence) -> action
    using Key = std::pair<double, ActionId>;

    std::map<Key, Action> actions_;
    std::map<ActionId, double> fireTimes_;
    double now_ = 0.0;
    ActionId nextId_ = 1;
};

}  // namespace gpk::foundation
