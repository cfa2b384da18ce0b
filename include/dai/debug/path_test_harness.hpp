#pragma once

/// @file path_test_harness.hpp
/// @brief Interactive pathfinding probe driven by a single debug key.
///
/// Each press ("cycle") advances
///   WaitingForStart -> WaitingForGoal{start} -> ShowingPath -> WaitingForStart
/// placing a start marker, computing and showing a walk path to the
/// player's position, then clearing. "set_start", "set_goal" and "reset"
/// jump straight to the corresponding step. Every action answers with a
/// status line; nothing aborts the harness.

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "dai/core/math_types.hpp"
#include "dai/debug/path_visualization.hpp"
#include "dai/nav/pathfinding_service.hpp"

namespace dai::debug {

/// Visualization key of the pending start marker.
inline constexpr std::string_view kTestStartKey = "test_start";
/// Visualization key of the computed test path.
inline constexpr std::string_view kTestPathKey = "test_path";

struct WaitingForStart {};
struct WaitingForGoal {
    Vector3 start;
};
struct ShowingPath {};

using PathTestState = std::variant<WaitingForStart, WaitingForGoal, ShowingPath>;

class PathTestHarness {
public:
    /// Apply @p action at @p playerPosition.
    /// @param pathfinding May be null when the level carries no navigation
    ///        data; every action except "reset" then reports it and leaves
    ///        the state untouched.
    std::string HandleAction(std::string_view action, const Vector3& playerPosition,
                             const nav::PathfindingService* pathfinding,
                             PathVisualizationSystem& visualization);

    [[nodiscard]] const PathTestState& GetState() const noexcept { return state_; }

private:
    std::string setStart(const Vector3& position, PathVisualizationSystem& visualization);
    std::string setGoal(const Vector3& position, const nav::PathfindingService& pathfinding,
                        PathVisualizationSystem& visualization);
    std::string fallback(const Vector3& start, const Vector3& goal,
                         const nav::PathfindingService& pathfinding,
                         PathVisualizationSystem& visualization);
    std::string reset(PathVisualizationSystem& visualization);
    void showPath(const Vector3& start, const Vector3& goal, std::vector<Vector3> waypoints,
                  PathVisualizationSystem& visualization);

    PathTestState state_ = WaitingForStart{};
};

}  // namespace dai::debug
