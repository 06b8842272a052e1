#include <gtest/gtest.h>

#include <vector>

#include "gpk/game/contact_dispatch_system.hpp"
#include "gpk/game/contact_events.hpp"
#include "gpk/game/deferred_action_system.hpp"

using namespace gpk::game;
using gpk::ecs::Entity;

namespace {

class RecordingHandler : public IContactHandler {
public:
    RecordingHandler(std::vector<int>& order, int tag) : order_(order), tag_(tag) {}

    void OnContact(const ContactEvent& event) override {
        order_.push_back(tag_);
        events.push_back(event);
    }

    std::vector<ContactEvent> events;

private:
    std::vector<int>& order_;
    int tag_;
};

} // namespace

// ===========================================================================
// ContactQueue
// ===========================================================================

TEST(ContactQueueTest, DrainIsFifoAndEmpties) {
    ContactQueue queue;
    queue.Push({ContactKind::TriggerEnter, Entity(1, 0), Entity(2, 0)});
    queue.Push({ContactKind::TriggerExit, Entity(1, 0), Entity(2, 0)});
    EXPECT_EQ(queue.Size(), 2u);

    auto events = queue.Drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, ContactKind::TriggerEnter);
    EXPECT_EQ(events[1].kind, ContactKind::TriggerExit);
    EXPECT_TRUE(queue.Empty());
}

TEST(ContactQueueTest, KindNames) {
    EXPECT_EQ(contactKindName(ContactKind::TriggerEnter), "TriggerEnter");
    EXPECT_EQ(contactKindName(ContactKind::TriggerExit), "TriggerExit");
    EXPECT_EQ(contactKindName(ContactKind::CollisionEnter), "CollisionEnter");
}

// ===========================================================================
// ContactDispatchSystem
// ===========================================================================

TEST(ContactDispatchSystemTest, EveryHandlerSeesEveryEventInOrder) {
    ContactQueue queue;
    ContactDispatchSystem dispatch(queue);
    std::vector<int> order;
    RecordingHandler first(order, 1);
    RecordingHandler second(order, 2);
    dispatch.AddHandler(&first);
    dispatch.AddHandler(&second);
    EXPECT_EQ(dispatch.HandlerCount(), 2u);

    queue.Push({ContactKind::TriggerEnter, Entity(1, 0), Entity(2, 0)});
    queue.Push({ContactKind::CollisionEnter, Entity(3, 0), Entity(4, 0)});
    dispatch.Execute(0.016f);

    EXPECT_EQ(order, (std::vector<int>{1, 2, 1, 2}));
    ASSERT_EQ(first.events.size(), 2u);
    EXPECT_EQ(first.events[1].self, Entity(3, 0));
    EXPECT_EQ(dispatch.LastDispatchCount(), 2u);
    EXPECT_TRUE(queue.Empty());
}

TEST(ContactDispatchSystemTest, EmptyQueueDispatchesNothing) {
    ContactQueue queue;
    ContactDispatchSystem dispatch(queue);
    std::vector<int> order;
    RecordingHandler handler(order, 1);
    dispatch.AddHandler(&handler);

    dispatch.Execute(0.016f);
    EXPECT_TRUE(order.empty());
    EXPECT_EQ(dispatch.LastDispatchCount(), 0u);
}

TEST(ContactDispatchSystemTest, RunsInPreUpdate) {
    ContactQueue queue;
    ContactDispatchSystem dispatch(queue);
    EXPECT_EQ(dispatch.GetStage(), gpk::ecs::SystemStage::PreUpdate);
}

// ===========================================================================
// DeferredActionSystem
// ===========================================================================

TEST(DeferredActionSystemTest, AdvancesSchedulerInPostUpdate) {
    gpk::foundation::DeferredScheduler scheduler;
    DeferredActionSystem system(scheduler);
    EXPECT_EQ(system.GetStage(), gpk::ecs::SystemStage::PostUpdate);

    int fired = 0;
    ASSERT_TRUE(scheduler.schedule(0.5, [&] { ++fired; }));
    system.Execute(0.25f);
    EXPECT_EQ(fired, 0);
    system.Execute(0.3f);
    EXPECT_EQ(fired, 1);
}
