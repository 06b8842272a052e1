#pragma once

/// @file contact_dispatch_system.hpp
/// @brief ContactDispatchSystem: hands queued contacts to gameplay systems.

#include "gpk/ecs/system_scheduler.hpp"
#include "gpk/game/contact_events.hpp"

#include <string_view>
#include <vector>

namespace gpk::game {

/// Drains the ContactQueue at the start of every tick and forwards each
/// event to every handler, in registration order.
///
/// Handlers added while dispatching see events from the next tick on.
class ContactDispatchSystem final : public ecs::ISystem {
public:
    /// @p queue must outlive this system.
    explicit ContactDispatchSystem(ContactQueue& queue);

    void Execute(float deltaTime) override;

    [[nodiscard]] ecs::SystemStage GetStage() const override {
        return ecs::SystemStage::PreUpdate;
    }

    [[nodiscard]] std::string_view GetName() const override { return "ContactDispatchSystem"; }

    /// Handlers are not owned.
    void AddHandler(IContactHandler* handler);

    [[nodiscard]] std::size_t HandlerCount() const noexcept { return handlers_.size(); }

    /// Events forwarded during the last Execute().
    [[nodiscard]] std::size_t LastDispatchCount() const noexcept { return lastDispatchCount_; }

private:
    ContactQueue& queue_;
    std::vector<IContactHandler*> handlers_;
    std::size_t lastDispatchCount_ = 0;
};

}  // namespace gpk::game
