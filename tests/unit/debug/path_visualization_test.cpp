#include <gtest/gtest.h>

#include <vector>

#include "dai/debug/path_visualization.hpp"

using namespace dai::debug;
using dai::Vector3;

namespace {

ComputedPath straightPath(std::size_t waypointCount) {
    ComputedPath path;
    path.name = "ai_path";
    path.color = path_colors::kAIPath;
    for (std::size_t i = 0; i < waypointCount; ++i) {
        path.waypoints.push_back({static_cast<float>(i), 0.0f, 0.0f});
    }
    return path;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Path store
// ═══════════════════════════════════════════════════════════════════════════

TEST(PathVisualizationTest, StartsEmpty) {
    PathVisualizationSystem paths;
    EXPECT_TRUE(paths.Empty());
    EXPECT_EQ(paths.Size(), 0u);
    EXPECT_EQ(paths.Find("test_path"), nullptr);
    EXPECT_TRUE(paths.BuildDebugLines().IsNone());
}

TEST(PathVisualizationTest, SetReplacesByName) {
    PathVisualizationSystem paths;
    paths.SetPath("ai_path", straightPath(2));
    paths.SetPath("ai_path", straightPath(5));

    EXPECT_EQ(paths.Size(), 1u);
    ASSERT_TRUE(paths.HasPath("ai_path"));
    EXPECT_EQ(paths.Find("ai_path")->waypoints.size(), 5u);
}

TEST(PathVisualizationTest, RemoveAndClear) {
    PathVisualizationSystem paths;
    paths.SetPath("a", straightPath(2));
    paths.SetPath("b", straightPath(2));

    EXPECT_TRUE(paths.RemovePath("a"));
    EXPECT_FALSE(paths.RemovePath("a"));
    EXPECT_FALSE(paths.HasPath("a"));
    EXPECT_TRUE(paths.HasPath("b"));

    paths.ClearAll();
    EXPECT_TRUE(paths.Empty());
}

TEST(ComputedPathTest, TestPathCarriesStartAndGoalMarkers) {
    const Vector3 start{1.0f, 0.0f, 1.0f};
    const Vector3 goal{4.0f, 0.0f, 1.0f};
    ComputedPath path = ComputedPath::TestPath(start, goal, {start, goal});

    EXPECT_EQ(path.name, "test_path");
    EXPECT_EQ(path.color, path_colors::kTestPath);
    ASSERT_EQ(path.markers.size(), 2u);
    EXPECT_EQ(path.markers[0].type, MarkerType::Start);
    EXPECT_FLOAT_EQ(path.markers[0].position.x, 1.0f);
    EXPECT_EQ(path.markers[1].type, MarkerType::Goal);
    EXPECT_EQ(path.markers[1].color, path_colors::kGoalMarker);
}

// ═══════════════════════════════════════════════════════════════════════════
// Rendering
// ═══════════════════════════════════════════════════════════════════════════

TEST(PathVisualizationTest, LinesPerSegmentAndMarker) {
    PathVisualizationSystem paths;
    ComputedPath path = ComputedPath::TestPath({0.0f, 0.0f, 0.0f}, {3.0f, 0.0f, 0.0f},
                                               straightPath(4).waypoints);
    path.AddMarker({{1.5f, 0.0f, 0.0f}, MarkerType::Waypoint, path_colors::kWaypointMarker});
    paths.SetPath("test_path", std::move(path));

    dai::ai::Effect effect = paths.BuildDebugLines();
    const auto* draw = effect.As<dai::ai::DrawDebugLines>();
    ASSERT_NE(draw, nullptr);
    // 3 segments + 3 per start/goal cross + 1 for the waypoint marker.
    EXPECT_EQ(draw->lines.size(), 3u + 3u + 3u + 1u);
}

TEST(PathVisualizationTest, LinesAreLiftedToNodeHeight) {
    PathVisualizationSystem paths;
    paths.SetPath("ai_path", straightPath(2));

    dai::ai::Effect effect = paths.BuildDebugLines();
    const auto* draw = effect.As<dai::ai::DrawDebugLines>();
    ASSERT_NE(draw, nullptr);
    ASSERT_EQ(draw->lines.size(), 1u);
    EXPECT_FLOAT_EQ(draw->lines[0].from.y, kPathNodeHeight);
    EXPECT_FLOAT_EQ(draw->lines[0].to.y, kPathNodeHeight);
    EXPECT_FLOAT_EQ(draw->lines[0].to.x, 1.0f);
    EXPECT_EQ(draw->lines[0].color, path_colors::kAIPath);
}

TEST(PathVisualizationTest, SingleWaypointPathDrawsNothing) {
    PathVisualizationSystem paths;
    paths.SetPath("ai_path", straightPath(1));
    EXPECT_TRUE(paths.BuildDebugLines().IsNone());
}

TEST(PathVisualizationTest, PathsRenderInNameOrder) {
    PathVisualizationSystem paths;
    ComputedPath later = straightPath(2);
    later.color = path_colors::kPatrolPath;
    paths.SetPath("zeta", later);
    paths.SetPath("alpha", straightPath(2));

    dai::ai::Effect effect = paths.BuildDebugLines();
    const auto* draw = effect.As<dai::ai::DrawDebugLines>();
    ASSERT_NE(draw, nullptr);
    ASSERT_EQ(draw->lines.size(), 2u);
    EXPECT_EQ(draw->lines[0].color, path_colors::kAIPath);
    EXPECT_EQ(draw->lines[1].color, path_colors::kPatrolPath);
}
