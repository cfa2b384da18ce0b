#pragma once

/// @file path_visualization.hpp
/// @brief Named debug paths with start/goal/waypoint markers, rendered as a
///        single DrawDebugLines effect.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "dai/ai/effect.hpp"
#include "dai/core/math_types.hpp"

namespace dai::debug {

/// Height above the floor at which path nodes are drawn (half a human).
inline constexpr float kPathNodeHeight = 1.0f;

/// Half extent of the cross drawn for start and goal markers.
inline constexpr float kMarkerCrossSize = 0.2f;

namespace path_colors {
inline constexpr Color kTestPath{0.0f, 1.0f, 0.0f, 1.0f};
inline constexpr Color kPlayerPath{0.0f, 0.5f, 1.0f, 1.0f};
inline constexpr Color kAIPath{1.0f, 0.5f, 0.0f, 1.0f};
inline constexpr Color kPatrolPath{0.8f, 0.0f, 1.0f, 1.0f};
inline constexpr Color kStartMarker{0.0f, 1.0f, 0.0f, 1.0f};
inline constexpr Color kGoalMarker{1.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color kWaypointMarker{1.0f, 1.0f, 0.0f, 1.0f};
}  // namespace path_colors

enum class MarkerType : uint8_t {
    Start,
    Goal,
    Waypoint,
};

struct PathMarker {
    Vector3 position;
    MarkerType type = MarkerType::Waypoint;
    Color color = path_colors::kWaypointMarker;
};

/// A path plus the markers drawn along with it.
struct ComputedPath {
    std::string name;
    std::vector<Vector3> waypoints;
    Color color = path_colors::kTestPath;
    std::vector<PathMarker> markers;

    void AddMarker(PathMarker marker) { markers.push_back(marker); }

    /// Test path named "test_path" with a Start marker at @p start and a
    /// Goal marker at @p goal.
    [[nodiscard]] static ComputedPath TestPath(const Vector3& start, const Vector3& goal,
                                               std::vector<Vector3> waypoints);
};

/// Store of the paths currently shown in the world.
class PathVisualizationSystem {
public:
    /// Add or replace the path stored under @p name.
    void SetPath(std::string name, ComputedPath path);

    /// @return true if a path was removed.
    bool RemovePath(std::string_view name);

    void ClearAll() { paths_.clear(); }

    [[nodiscard]] bool HasPath(std::string_view name) const;
    [[nodiscard]] const ComputedPath* Find(std::string_view name) const;
    [[nodiscard]] std::size_t Size() const noexcept { return paths_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return paths_.empty(); }

    /// Lines for every stored path in name order: one segment per
    /// consecutive waypoint pair, a three-axis cross per start/goal marker
    /// and a zero-length segment per waypoint marker. All lines are lifted
    /// by kPathNodeHeight.
    [[nodiscard]] ai::Effect BuildDebugLines() const;

private:
    std::map<std::string, ComputedPath, std::less<>> paths_;
};

}  // namespace dai::debug
