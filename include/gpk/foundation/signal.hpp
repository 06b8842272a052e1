#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> publish/subscribe for world events.
///
/// Slots run synchronously inside emit(), in connection order.  The world
/// is ticked from a single thread, so no locking is done here.

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace gpk::foundation {

/// Observer list that invokes every connected slot on emit().
///
/// Example:
/// @code
///   Signal<ecs::Entity, std::string> onGameOver;
///   auto id = onGameOver.connect([](ecs::Entity e, const std::string& msg) {
///       showBanner(msg);
///   });
///   onGameOver.emit(enemy, "caught");
///   onGameOver.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a callback.  Returns an id for disconnect().
    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) { slots_.erase(id); }

    void disconnectAll() { slots_.clear(); }

    /// Invoke every slot.  Slots connected or disconnected from inside a
    /// slot take effect on the next emit().
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        snapshot.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            snapshot.push_back(slot);
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
};

} // namespace gpk::foundation
