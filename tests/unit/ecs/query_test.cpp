#include <gtest/gtest.h>

#include <vector>

#include "gpk/ecs/component_storage.hpp"
#include "gpk/ecs/entity_manager.hpp"
#include "gpk/ecs/query.hpp"

using namespace gpk::ecs;

struct Pos {
    float x = 0.0f;
};

struct Vel {
    float dx = 0.0f;
};

class QueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        mgr.RegisterStorage(&positions);
        mgr.RegisterStorage(&velocities);
    }

    EntityManager mgr;
    ComponentStorage<Pos> positions;
    ComponentStorage<Vel> velocities;
};

// ===========================================================================
// Query: matching
// ===========================================================================

TEST_F(QueryTest, VisitsOnlyEntitiesWithAllComponents) {
    Entity both = mgr.Create();
    Entity posOnly = mgr.Create();
    Entity velOnly = mgr.Create();
    positions.Add(both, Pos{1.0f});
    velocities.Add(both, Vel{2.0f});
    positions.Add(posOnly);
    velocities.Add(velOnly);

    Query<Pos, Vel> query(positions, velocities);
    std::vector<Entity> visited;
    query.ForEach([&](Entity e, Pos&, Vel&) { visited.push_back(e); });

    ASSERT_EQ(visited.size(), 1u);
    EXPECT_EQ(visited[0], both);
    EXPECT_TRUE(query.Matches(both));
    EXPECT_FALSE(query.Matches(posOnly));
    EXPECT_FALSE(query.Matches(velOnly));
}

TEST_F(QueryTest, ForEachCanMutateComponents) {
    Entity e = mgr.Create();
    positions.Add(e, Pos{1.0f});
    velocities.Add(e, Vel{3.0f});

    Query<Pos, Vel> query(positions, velocities);
    query.ForEach([](Entity, Pos& p, Vel& v) { p.x += v.dx; });

    EXPECT_FLOAT_EQ(positions.Get(e).x, 4.0f);
}

TEST_F(QueryTest, DestroyDuringIterationIsSafe) {
    std::vector<Entity> entities;
    for (int i = 0; i < 4; ++i) {
        Entity e = mgr.Create();
        positions.Add(e, Pos{static_cast<float>(i)});
        entities.push_back(e);
    }

    Query<Pos> query(positions);
    int visited = 0;
    query.ForEach([&](Entity e, Pos&) {
        ++visited;
        if (e == entities[0]) {
            mgr.Destroy(entities[1]);
        }
    });

    // The destroyed entity is skipped; the others are each seen once.
    EXPECT_EQ(visited, 3);
    EXPECT_EQ(positions.Size(), 3u);
}

TEST_F(QueryTest, CollectReturnsMatches) {
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    positions.Add(a);
    positions.Add(b);
    velocities.Add(b);

    Query<Pos, Vel> query(positions, velocities);
    auto result = query.Collect();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], b);
}
