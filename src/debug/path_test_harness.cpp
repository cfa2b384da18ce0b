/// @file path_test_harness.cpp
/// @brief PathTestHarness implementation.

#include "dai/debug/path_test_harness.hpp"

#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include "dai/foundation/game_logger.hpp"

namespace dai::debug {

using foundation::LogCategory;

namespace {

/// Human-sized movers probe the walkable graph.
constexpr nav::MovementBits kProbeMovement = nav::movement::kWalk;

std::string formatPosition(const Vector3& p) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << '(' << p.x << ", " << p.y << ", " << p.z
        << ')';
    return oss.str();
}

}  // namespace

std::string PathTestHarness::HandleAction(std::string_view action,
                                          const Vector3& playerPosition,
                                          const nav::PathfindingService* pathfinding,
                                          PathVisualizationSystem& visualization) {
    std::string status;
    if (action == "reset") {
        status = reset(visualization);
    } else if (action != "cycle" && action != "set_start" && action != "set_goal") {
        status = "Unknown pathfinding test action: " + std::string(action);
    } else if (pathfinding == nullptr) {
        status = "Pathfinding service not available (no AIPATH data)";
    } else if (action == "set_start") {
        status = setStart(playerPosition, visualization);
    } else if (action == "set_goal") {
        status = setGoal(playerPosition, *pathfinding, visualization);
    } else if (std::holds_alternative<WaitingForStart>(state_)) {
        status = setStart(playerPosition, visualization);
    } else if (std::holds_alternative<WaitingForGoal>(state_)) {
        status = setGoal(playerPosition, *pathfinding, visualization);
    } else {
        status = reset(visualization);
    }

    DAI_LOG_INFO(LogCategory::Harness, status);
    return status;
}

std::string PathTestHarness::setStart(const Vector3& position,
                                      PathVisualizationSystem& visualization) {
    visualization.RemovePath(kTestPathKey);

    ComputedPath marker;
    marker.name = std::string(kTestStartKey);
    marker.color = path_colors::kTestPath;
    marker.AddMarker({position, MarkerType::Start, path_colors::kStartMarker});
    visualization.SetPath(std::string(kTestStartKey), std::move(marker));

    state_ = WaitingForGoal{position};
    return "Set pathfinding test start at " + formatPosition(position) +
           ". Press P again to set goal.";
}

std::string PathTestHarness::setGoal(const Vector3& position,
                                     const nav::PathfindingService& pathfinding,
                                     PathVisualizationSystem& visualization) {
    const auto* waiting = std::get_if<WaitingForGoal>(&state_);
    if (waiting == nullptr) {
        return "No start position set. Press P once to set start first.";
    }
    const Vector3 start = waiting->start;

    auto waypoints = pathfinding.FindPath(start, position, kProbeMovement);
    if (!waypoints) {
        return fallback(start, position, pathfinding, visualization);
    }

    const std::size_t count = waypoints->size();
    showPath(start, position, std::move(*waypoints), visualization);
    return "Computed path with " + std::to_string(count) + " waypoints from " +
           formatPosition(start) + " to " + formatPosition(position) +
           ". Press P again to reset.";
}

std::string PathTestHarness::fallback(const Vector3& start, const Vector3& goal,
                                      const nav::PathfindingService& pathfinding,
                                      PathVisualizationSystem& visualization) {
    const auto closest = pathfinding.FindClosestReachableCell(start, goal, kProbeMovement);
    if (!closest) {
        return "No path possible - start position may be unreachable";
    }
    const auto center = pathfinding.Graph().CellCenter(*closest);
    if (!center) {
        return "Error: Could not compute path to closest reachable cell";
    }
    auto waypoints = pathfinding.FindPath(start, *center, kProbeMovement);
    if (!waypoints) {
        return "Error: Could not compute path to closest reachable cell";
    }

    const std::size_t count = waypoints->size();
    showPath(start, *center, std::move(*waypoints), visualization);
    return "No direct path found. Computed fallback path with " + std::to_string(count) +
           " waypoints to closest reachable position " + formatPosition(*center) +
           ". Press P again to reset.";
}

void PathTestHarness::showPath(const Vector3& start, const Vector3& goal,
                               std::vector<Vector3> waypoints,
                               PathVisualizationSystem& visualization) {
    // Keep the drawn path non-degenerate when start and goal share a cell.
    if (waypoints.size() < 2) {
        const Vector3 mid = start + (goal - start) * 0.5f;
        waypoints = {start, mid, goal};
    }

    visualization.RemovePath(kTestStartKey);
    visualization.SetPath(std::string(kTestPathKey),
                          ComputedPath::TestPath(start, goal, std::move(waypoints)));
    state_ = ShowingPath{};
}

std::string PathTestHarness::reset(PathVisualizationSystem& visualization) {
    visualization.RemovePath(kTestStartKey);
    visualization.RemovePath(kTestPathKey);
    state_ = WaitingForStart{};
    return "Cleared pathfinding test data. Press P to set start position.";
}

}  // namespace dai::debug
