#pragma once

/// @file contact_events.hpp
/// @brief Trigger and collision events fed in by the host physics layer.

#include "gpk/ecs/entity.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace gpk::game {

enum class ContactKind : uint8_t {
    TriggerEnter,
    TriggerExit,
    CollisionEnter
};

constexpr std::string_view contactKindName(ContactKind kind) {
    switch (kind) {
        case ContactKind::TriggerEnter:   return "TriggerEnter";
        case ContactKind::TriggerExit:    return "TriggerExit";
        case ContactKind::CollisionEnter: return "CollisionEnter";
    }
    return "Unknown";
}

/// One contact as seen from @c self (the volume or body that reports it).
struct ContactEvent {
    ContactKind kind = ContactKind::TriggerEnter;
    ecs::Entity self;
    ecs::Entity other;
};

/// FIFO queue of contacts waiting for the next dispatch.
class ContactQueue {
public:
    void Push(const ContactEvent& event) { events_.push_back(event); }

    /// Take all queued events in arrival order, leaving the queue empty.
    [[nodiscard]] std::vector<ContactEvent> Drain() {
        std::vector<ContactEvent> out;
        out.swap(events_);
        return out;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return events_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return events_.empty(); }

private:
    std::vector<ContactEvent> events_;
};

/// Receiver for dispatched contacts.
class IContactHandler {
public:
    virtual ~IContactHandler() = default;

    virtual void OnContact(const ContactEvent& event) = 0;
};

}  // namespace gpk::game
