#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "gpk/ecs/system_scheduler.hpp"

using namespace gpk::ecs;
using gpk::foundation::ErrorCode;

// ── Test systems ────────────────────────────────────────────────────────────

namespace {

using Trace = std::vector<std::string>;

template <int N, SystemStage Stage = SystemStage::Update>
class RecordingSystem : public ISystem {
public:
    explicit RecordingSystem(Trace& trace) : trace_(trace) {}

    void Execute(float /*deltaTime*/) override { trace_.push_back(name_); }

    [[nodiscard]] SystemStage GetStage() const override { return Stage; }

    [[nodiscard]] std::string_view GetName() const override { return name_; }

private:
    Trace& trace_;
    std::string name_ = "S" + std::to_string(N);
};

using SysA = RecordingSystem<1>;
using SysB = RecordingSystem<2>;
using SysC = RecordingSystem<3>;
using SysPre = RecordingSystem<4, SystemStage::PreUpdate>;
using SysPost = RecordingSystem<5, SystemStage::PostUpdate>;

class DeltaSystem : public ISystem {
public:
    void Execute(float deltaTime) override { total += deltaTime; }
    [[nodiscard]] std::string_view GetName() const override { return "Delta"; }
    float total = 0.0f;
};

} // namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST(SystemSchedulerTest, RegisterReturnsSameInstanceForSameType) {
    Trace trace;
    SystemScheduler scheduler;
    auto& first = scheduler.Register<SysA>(trace);
    auto& second = scheduler.Register<SysA>(trace);
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(scheduler.SystemCount(), 1u);
    EXPECT_EQ(scheduler.GetSystem<SysA>(), &first);
    EXPECT_EQ(scheduler.GetSystem<SysB>(), nullptr);
}

// ===========================================================================
// Ordering
// ===========================================================================

TEST(SystemSchedulerTest, RunsInRegistrationOrderWithoutDependencies) {
    Trace trace;
    SystemScheduler scheduler;
    scheduler.Register<SysB>(trace);
    scheduler.Register<SysA>(trace);
    scheduler.Register<SysC>(trace);
    ASSERT_TRUE(scheduler.Build());

    scheduler.Execute(0.016f);
    EXPECT_EQ(trace, (Trace{"S2", "S1", "S3"}));
}

TEST(SystemSchedulerTest, DependencyOverridesRegistrationOrder) {
    Trace trace;
    SystemScheduler scheduler;
    scheduler.Register<SysA>(trace);
    scheduler.Register<SysB>(trace);
    scheduler.Register<SysC>(trace);
    EXPECT_TRUE((scheduler.AddDependency<SysC, SysA>()));
    ASSERT_TRUE(scheduler.Build());

    scheduler.Execute(0.016f);
    EXPECT_EQ(trace, (Trace{"S2", "S3", "S1"}));
}

TEST(SystemSchedulerTest, StagesRunPreUpdateUpdatePostUpdate) {
    Trace trace;
    SystemScheduler scheduler;
    scheduler.Register<SysPost>(trace);
    scheduler.Register<SysA>(trace);
    scheduler.Register<SysPre>(trace);
    ASSERT_TRUE(scheduler.Build());

    scheduler.Execute(0.016f);
    EXPECT_EQ(trace, (Trace{"S4", "S1", "S5"}));
    EXPECT_EQ(scheduler.GetExecutionOrder(SystemStage::PreUpdate).size(), 1u);
}

TEST(SystemSchedulerTest, CrossStageDependencyIsRejected) {
    Trace trace;
    SystemScheduler scheduler;
    scheduler.Register<SysPre>(trace);
    scheduler.Register<SysA>(trace);
    EXPECT_FALSE((scheduler.AddDependency<SysA, SysPre>()));
}

TEST(SystemSchedulerTest, DependencyOnUnregisteredSystemIsRejected) {
    Trace trace;
    SystemScheduler scheduler;
    scheduler.Register<SysA>(trace);
    EXPECT_FALSE((scheduler.AddDependency<SysA, SysB>()));
}

TEST(SystemSchedulerTest, CycleFailsBuild) {
    Trace trace;
    SystemScheduler scheduler;
    scheduler.Register<SysA>(trace);
    scheduler.Register<SysB>(trace);
    scheduler.AddDependency<SysA, SysB>();
    scheduler.AddDependency<SysB, SysA>();

    auto result = scheduler.Build();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::CircularDependency);
}

// ===========================================================================
// Enable / disable
// ===========================================================================

TEST(SystemSchedulerTest, DisabledSystemIsSkipped) {
    Trace trace;
    SystemScheduler scheduler;
    scheduler.Register<SysA>(trace);
    scheduler.Register<SysB>(trace);
    ASSERT_TRUE(scheduler.Build());

    scheduler.SetEnabled<SysA>(false);
    EXPECT_FALSE(scheduler.IsEnabled(SystemType<SysA>::Id()));
    scheduler.Execute(0.016f);
    EXPECT_EQ(trace, (Trace{"S2"}));

    scheduler.SetEnabled<SysA>(true);
    scheduler.Execute(0.016f);
    EXPECT_EQ(trace, (Trace{"S2", "S1", "S2"}));
}

TEST(SystemSchedulerTest, ExecutePassesDeltaTime) {
    SystemScheduler scheduler;
    auto& delta = scheduler.Register<DeltaSystem>();
    ASSERT_TRUE(scheduler.Build());
    scheduler.Execute(0.25f);
    scheduler.Execute(0.5f);
    EXPECT_FLOAT_EQ(delta.total, 0.75f);
}
