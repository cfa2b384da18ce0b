/// @file path_visualization.cpp
/// @brief PathVisualizationSystem implementation.

#include "dai/debug/path_visualization.hpp"

#include <utility>

namespace dai::debug {

using ai::DebugLine;
using ai::DrawDebugLines;

namespace {

const Vector3 kNodeLift{0.0f, kPathNodeHeight, 0.0f};

void appendMarker(const PathMarker& marker, std::vector<DebugLine>& out) {
    const Vector3 center = marker.position + kNodeLift;
    if (marker.type == MarkerType::Waypoint) {
        out.push_back({center, center, marker.color});
        return;
    }
    const float s = kMarkerCrossSize;
    out.push_back({center + Vector3{-s, 0.0f, 0.0f}, center + Vector3{s, 0.0f, 0.0f},
                   marker.color});
    out.push_back({center + Vector3{0.0f, -s, 0.0f}, center + Vector3{0.0f, s, 0.0f},
                   marker.color});
    out.push_back({center + Vector3{0.0f, 0.0f, -s}, center + Vector3{0.0f, 0.0f, s},
                   marker.color});
}

}  // namespace

ComputedPath ComputedPath::TestPath(const Vector3& start, const Vector3& goal,
                                    std::vector<Vector3> waypoints) {
    ComputedPath path;
    path.name = "test_path";
    path.waypoints = std::move(waypoints);
    path.color = path_colors::kTestPath;
    path.AddMarker({start, MarkerType::Start, path_colors::kStartMarker});
    path.AddMarker({goal, MarkerType::Goal, path_colors::kGoalMarker});
    return path;
}

void PathVisualizationSystem::SetPath(std::string name, ComputedPath path) {
    paths_.insert_or_assign(std::move(name), std::move(path));
}

bool PathVisualizationSystem::RemovePath(std::string_view name) {
    auto it = paths_.find(name);
    if (it == paths_.end()) {
        return false;
    }
    paths_.erase(it);
    return true;
}

bool PathVisualizationSystem::HasPath(std::string_view name) const {
    return paths_.find(name) != paths_.end();
}

const ComputedPath* PathVisualizationSystem::Find(std::string_view name) const {
    auto it = paths_.find(name);
    return it == paths_.end() ? nullptr : &it->second;
}

ai::Effect PathVisualizationSystem::BuildDebugLines() const {
    DrawDebugLines draw;
    for (const auto& [name, path] : paths_) {
        for (std::size_t i = 1; i < path.waypoints.size(); ++i) {
            draw.lines.push_back(
                {path.waypoints[i - 1] + kNodeLift, path.waypoints[i] + kNodeLift, path.color});
        }
        for (const auto& marker : path.markers) {
            appendMarker(marker, draw.lines);
        }
    }
    if (draw.lines.empty()) {
        return ai::Effect::None();
    }
    return draw;
}

}  // namespace dai::debug
