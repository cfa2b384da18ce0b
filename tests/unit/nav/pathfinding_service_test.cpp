#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "dai/nav/pathfinding_service.hpp"
#include "support/test_world.hpp"

using namespace dai::nav;
using dai::Vector3;
using dai::test::MakeStripGraph;
using dai::test::MakeStripGraphWithLinks;
using dai::test::StripCenter;

namespace {

/// Three strip cells where the one-hop link 0->2 costs @p shortcutCost
/// and the two-hop route 0->1->2 costs @p hopCost per hop.
std::shared_ptr<const NavigationGraph> makeShortcutGraph(uint16_t hopCost,
                                                         uint16_t shortcutCost) {
    std::vector<PathLink> links = {
        {0, 1, hopCost, movement::kWalk},
        {1, 0, hopCost, movement::kWalk},
        {1, 2, hopCost, movement::kWalk},
        {2, 1, hopCost, movement::kWalk},
        {0, 2, shortcutCost, movement::kWalk},
        {2, 0, shortcutCost, movement::kWalk},
    };
    return MakeStripGraphWithLinks(3, std::move(links));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// FindPath
// ═══════════════════════════════════════════════════════════════════════════

TEST(PathfindingServiceTest, StripWalkPathVisitsEveryCenter) {
    PathfindingService paths(MakeStripGraph(5));

    auto waypoints = paths.FindPath(StripCenter(0), StripCenter(4), movement::kWalk);
    ASSERT_TRUE(waypoints.has_value());
    ASSERT_EQ(waypoints->size(), 5u);
    for (CellId i = 0; i < 5; ++i) {
        EXPECT_EQ((*waypoints)[i], StripCenter(i)) << "waypoint " << i;
    }
}

TEST(PathfindingServiceTest, StripFlyPathHasNoRoute) {
    PathfindingService paths(MakeStripGraph(5));
    EXPECT_FALSE(paths.FindPath(StripCenter(0), StripCenter(4), movement::kFly).has_value());
}

TEST(PathfindingServiceTest, SameCellYieldsSingleWaypoint) {
    PathfindingService paths(MakeStripGraph(3));
    auto waypoints = paths.FindPath({1.2f, 0.0f, 0.5f}, {1.8f, 0.0f, 1.5f}, movement::kWalk);
    ASSERT_TRUE(waypoints.has_value());
    ASSERT_EQ(waypoints->size(), 1u);
    EXPECT_EQ(waypoints->front(), StripCenter(1));
}

TEST(PathfindingServiceTest, AdjacentCellsYieldTwoWaypoints) {
    PathfindingService paths(MakeStripGraph(3));
    auto waypoints = paths.FindPath(StripCenter(1), StripCenter(2), movement::kWalk);
    ASSERT_TRUE(waypoints.has_value());
    ASSERT_EQ(waypoints->size(), 2u);
    EXPECT_EQ(waypoints->front(), StripCenter(1));
    EXPECT_EQ(waypoints->back(), StripCenter(2));
}

TEST(PathfindingServiceTest, EndpointOffMeshHasNoPath) {
    PathfindingService paths(MakeStripGraph(3));
    EXPECT_FALSE(paths.FindPath({-4.0f, 0.0f, 1.0f}, StripCenter(2), movement::kWalk).has_value());
    EXPECT_FALSE(paths.FindPath(StripCenter(0), {9.0f, 0.0f, 1.0f}, movement::kWalk).has_value());
}

TEST(PathfindingServiceTest, IsolatedGoalHasNoPath) {
    PathfindingService paths(MakeStripGraph(5, {4}));
    EXPECT_FALSE(paths.FindPath(StripCenter(0), StripCenter(4), movement::kWalk).has_value());
}

TEST(PathfindingServiceTest, RepeatedQueriesAreIdentical) {
    PathfindingService paths(MakeStripGraph(8));
    auto first = paths.FindPath(StripCenter(7), StripCenter(1), movement::kWalk);
    auto second = paths.FindPath(StripCenter(7), StripCenter(1), movement::kWalk);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

// ═══════════════════════════════════════════════════════════════════════════
// FindCellPath
// ═══════════════════════════════════════════════════════════════════════════

TEST(PathfindingServiceTest, CheaperTwoHopRouteWins) {
    PathfindingService paths(makeShortcutGraph(1, 10));
    auto path = paths.FindCellPath(0, 2, movement::kWalk);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->cells, (std::vector<CellId>{0, 1, 2}));
    EXPECT_EQ(path->totalCost, 2u);
}

TEST(PathfindingServiceTest, CheaperShortcutWins) {
    PathfindingService paths(makeShortcutGraph(5, 3));
    auto path = paths.FindCellPath(0, 2, movement::kWalk);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->cells, (std::vector<CellId>{0, 2}));
    EXPECT_EQ(path->totalCost, 3u);
}

TEST(PathfindingServiceTest, CostMatchesDijkstraDistance) {
    PathfindingService paths(makeShortcutGraph(2, 3));
    for (CellId start = 0; start < 3; ++start) {
        const auto reachable = paths.ReachableCells(start, movement::kWalk);
        ASSERT_EQ(reachable.size(), 3u);
        for (const auto& entry : reachable) {
            auto path = paths.FindCellPath(start, entry.cell, movement::kWalk);
            ASSERT_TRUE(path.has_value());
            EXPECT_EQ(path->totalCost, entry.distance)
                << "from " << start << " to " << entry.cell;
            EXPECT_EQ(path->cells.front(), start);
            EXPECT_EQ(path->cells.back(), entry.cell);
        }
    }
}

TEST(PathfindingServiceTest, ExpansionBudgetLimitsSearch) {
    PathfindingService paths(MakeStripGraph(10));
    EXPECT_FALSE(paths.FindCellPath(0, 9, movement::kWalk, 3).has_value());

    auto unlimited = paths.FindCellPath(0, 9, movement::kWalk);
    ASSERT_TRUE(unlimited.has_value());
    EXPECT_EQ(unlimited->cells.size(), 10u);

    auto generous = paths.FindCellPath(0, 9, movement::kWalk, 100);
    ASSERT_TRUE(generous.has_value());
    EXPECT_EQ(generous->cells, unlimited->cells);
}

TEST(PathfindingServiceTest, UnusableEndpointsRejected) {
    PathfindingService paths(MakeStripGraph(3));
    EXPECT_FALSE(paths.FindCellPath(0, 17, movement::kWalk).has_value());
    EXPECT_FALSE(paths.FindCellPath(17, 0, movement::kWalk).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Reachability
// ═══════════════════════════════════════════════════════════════════════════

TEST(PathfindingServiceTest, ReachableCellsOrderedById) {
    PathfindingService paths(MakeStripGraph(4));
    auto reachable = paths.ReachableCells(1, movement::kWalk);

    const std::vector<ReachableCell> expected = {{0, 1}, {1, 0}, {2, 1}, {3, 2}};
    EXPECT_EQ(reachable, expected);
}

TEST(PathfindingServiceTest, ReachableCellsRespectsBits) {
    PathfindingService paths(MakeStripGraph(4));
    auto reachable = paths.ReachableCells(2, movement::kFly);
    ASSERT_EQ(reachable.size(), 1u);
    EXPECT_EQ(reachable[0].cell, 2u);
    EXPECT_EQ(reachable[0].distance, 0u);

    EXPECT_TRUE(paths.ReachableCells(40, movement::kWalk).empty());
}

TEST(PathfindingServiceTest, ClosestReachableStopsBeforeIsolatedCell) {
    PathfindingService paths(MakeStripGraph(5, {4}));
    auto closest = paths.FindClosestReachableCell(StripCenter(0), StripCenter(4), movement::kWalk);
    ASSERT_TRUE(closest.has_value());
    EXPECT_EQ(*closest, 3u);
}

TEST(PathfindingServiceTest, ClosestReachableIsGoalWhenReachable) {
    PathfindingService paths(MakeStripGraph(5));
    auto closest = paths.FindClosestReachableCell(StripCenter(0), StripCenter(3), movement::kWalk);
    ASSERT_TRUE(closest.has_value());
    EXPECT_EQ(*closest, 3u);
}

TEST(PathfindingServiceTest, ClosestReachableNeverFartherThanStart) {
    auto graph = MakeStripGraph(6, {3});
    PathfindingService paths(graph);
    const Vector3 goal{5.5f, 0.0f, 1.0f};

    for (CellId start = 0; start < 3; ++start) {
        auto closest = paths.FindClosestReachableCell(StripCenter(start), goal, movement::kWalk);
        ASSERT_TRUE(closest.has_value());
        const float startDistance = StripCenter(start).DistanceTo(goal);
        const float bestDistance = graph->CellCenter(*closest)->DistanceTo(goal);
        EXPECT_LE(bestDistance, startDistance);
        EXPECT_EQ(*closest, 2u);
    }
}

TEST(PathfindingServiceTest, ClosestReachableOffMeshStart) {
    PathfindingService paths(MakeStripGraph(3));
    EXPECT_FALSE(paths.FindClosestReachableCell({-3.0f, 0.0f, 1.0f}, StripCenter(2),
                                                movement::kWalk)
                     .has_value());
}

TEST(PathfindingServiceTest, NullGraphBehavesAsEmpty) {
    PathfindingService paths(nullptr);
    EXPECT_EQ(paths.Graph().CellCount(), 0u);
    EXPECT_FALSE(paths.FindPath({}, {}, movement::kWalk).has_value());
    EXPECT_FALSE(paths.FindClosestReachableCell({}, {}, movement::kWalk).has_value());
    EXPECT_TRUE(paths.ReachableCells(0, movement::kWalk).empty());
}
