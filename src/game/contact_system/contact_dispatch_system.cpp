/// @file contact_dispatch_system.cpp
/// @brief ContactDispatchSystem implementation.

#include "gpk/game/contact_dispatch_system.hpp"

#include "gpk/foundation/game_logger.hpp"

#include <cassert>
#include <string>

namespace gpk::game {

using foundation::LogCategory;
using foundation::LogLevel;

ContactDispatchSystem::ContactDispatchSystem(ContactQueue& queue) : queue_(queue) {}

void ContactDispatchSystem::AddHandler(IContactHandler* handler) {
    assert(handler != nullptr && "Cannot register null contact handler");
    handlers_.push_back(handler);
}

void ContactDispatchSystem::Execute(float /*deltaTime*/) {
    const auto events = queue_.Drain();
    const auto handlers = handlers_;

    for (const auto& event : events) {
        GPK_LOG(LogLevel::Trace, LogCategory::ECS,
                std::string(contactKindName(event.kind)) + " " +
                    std::to_string(event.self.id()) + " <- " + std::to_string(event.other.id()));
        for (auto* handler : handlers) {
            handler->OnContact(event);
        }
    }
    lastDispatchCount_ = events.size();
}

}  // namespace gpk::game
