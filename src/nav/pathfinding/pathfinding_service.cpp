/// @file pathfinding_service.cpp
/// @brief PathfindingService implementation (A*, Dijkstra-all).

#include "dai/nav/pathfinding_service.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <string>
#include <tuple>

#include "dai/foundation/game_logger.hpp"

namespace dai::nav {

using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr uint32_t kUnreached = std::numeric_limits<uint32_t>::max();

/// Open-set entry ordered by (priority, cell) so ties expand the lowest id.
struct OpenEntry {
    uint32_t priority = 0;
    CellId cell = 0;
    uint32_t cost = 0;

    bool operator>(const OpenEntry& rhs) const {
        return std::tie(priority, cell) > std::tie(rhs.priority, rhs.cell);
    }
};

using OpenSet = std::priority_queue<OpenEntry, std::vector<OpenEntry>, std::greater<>>;

void logNoPath(std::string_view reason, std::optional<CellId> start, std::optional<CellId> goal) {
    auto& logger = foundation::GameLogger::instance();
    if (!logger.isEnabled(LogLevel::Debug, LogCategory::Pathfinding)) {
        return;
    }
    LogContext ctx;
    ctx.cellId = start;
    if (goal) {
        ctx.extra["goal_cell"] = std::to_string(*goal);
    }
    logger.logWithContext(LogLevel::Debug, LogCategory::Pathfinding,
                          std::string("no path: ") + std::string(reason), ctx);
}

}  // namespace

PathfindingService::PathfindingService(std::shared_ptr<const NavigationGraph> graph)
    : graph_(graph ? std::move(graph) : std::make_shared<const NavigationGraph>()) {}

uint32_t PathfindingService::heuristic(CellId from, CellId goal) const {
    const auto a = graph_->CellCenter(from);
    const auto b = graph_->CellCenter(goal);
    if (!a || !b) {
        return 0;
    }
    return static_cast<uint32_t>(a->DistanceTo(*b));
}

// ═══════════════════════════════════════════════════════════════════════════
// A*
// ═══════════════════════════════════════════════════════════════════════════

std::optional<std::vector<Vector3>> PathfindingService::FindPath(
    const Vector3& from, const Vector3& to, MovementBits bits,
    std::optional<std::size_t> expansionBudget) const {
    const auto start = graph_->CellFromPosition(from);
    const auto goal = graph_->CellFromPosition(to);
    if (!start || !goal) {
        logNoPath(!start ? "start outside navigation mesh" : "goal outside navigation mesh",
                  start, goal);
        return std::nullopt;
    }

    auto cellPath = FindCellPath(*start, *goal, bits, expansionBudget);
    if (!cellPath) {
        return std::nullopt;
    }

    std::vector<Vector3> waypoints;
    waypoints.reserve(cellPath->cells.size());
    for (CellId cell : cellPath->cells) {
        waypoints.push_back(*graph_->CellCenter(cell));
    }
    return waypoints;
}

std::optional<CellPath> PathfindingService::FindCellPath(
    CellId start, CellId goal, MovementBits bits,
    std::optional<std::size_t> expansionBudget) const {
    if (!graph_->IsUsable(start) || !graph_->IsUsable(goal)) {
        logNoPath("unusable endpoint cell", start, goal);
        return std::nullopt;
    }

    const std::size_t cellCount = graph_->CellCount();
    std::vector<uint32_t> bestCost(cellCount, kUnreached);
    std::vector<CellId> parent(cellCount, start);

    OpenSet open;
    bestCost[start] = 0;
    open.push({heuristic(start, goal), start, 0});

    std::size_t expansions = 0;
    while (!open.empty()) {
        const OpenEntry current = open.top();
        open.pop();

        // Stale entry: a cheaper route to this cell was queued later.
        if (current.cost > bestCost[current.cell]) {
            continue;
        }

        if (current.cell == goal) {
            CellPath result;
            result.totalCost = current.cost;
            for (CellId cell = goal; cell != start; cell = parent[cell]) {
                result.cells.push_back(cell);
            }
            result.cells.push_back(start);
            std::reverse(result.cells.begin(), result.cells.end());
            return result;
        }

        if (expansionBudget && expansions >= *expansionBudget) {
            logNoPath("expansion budget exhausted", start, goal);
            return std::nullopt;
        }
        ++expansions;

        graph_->ForEachNeighbour(current.cell, bits, [&](const Neighbour& next) {
            const uint32_t cost = current.cost + next.cost;
            if (cost < bestCost[next.cell]) {
                bestCost[next.cell] = cost;
                parent[next.cell] = current.cell;
                open.push({cost + heuristic(next.cell, goal), next.cell, cost});
            }
        });
    }

    logNoPath("goal unreachable", start, goal);
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Dijkstra-all / closest reachable
// ═══════════════════════════════════════════════════════════════════════════

std::vector<ReachableCell> PathfindingService::ReachableCells(CellId start,
                                                              MovementBits bits) const {
    std::vector<ReachableCell> reachable;
    if (!graph_->IsUsable(start)) {
        return reachable;
    }

    std::vector<uint32_t> distance(graph_->CellCount(), kUnreached);
    OpenSet open;
    distance[start] = 0;
    open.push({0, start, 0});

    while (!open.empty()) {
        const OpenEntry current = open.top();
        open.pop();
        if (current.cost > distance[current.cell]) {
            continue;
        }
        graph_->ForEachNeighbour(current.cell, bits, [&](const Neighbour& next) {
            const uint32_t cost = current.cost + next.cost;
            if (cost < distance[next.cell]) {
                distance[next.cell] = cost;
                open.push({cost, next.cell, cost});
            }
        });
    }

    for (std::size_t i = 0; i < distance.size(); ++i) {
        if (distance[i] != kUnreached) {
            reachable.push_back({static_cast<CellId>(i), distance[i]});
        }
    }
    return reachable;
}

std::optional<CellId> PathfindingService::FindClosestReachableCell(const Vector3& from,
                                                                   const Vector3& goal,
                                                                   MovementBits bits) const {
    const auto start = graph_->CellFromPosition(from);
    if (!start) {
        logNoPath("start outside navigation mesh", start, std::nullopt);
        return std::nullopt;
    }

    std::optional<CellId> closest;
    float closestDistanceSq = std::numeric_limits<float>::max();

    // Ascending id order plus a strict comparison keeps the lowest id on ties.
    for (const auto& entry : ReachableCells(*start, bits)) {
        const Vector3 center = *graph_->CellCenter(entry.cell);
        const float distanceSq = (center - goal).LengthSquared();
        if (!closest || distanceSq < closestDistanceSq) {
            closest = entry.cell;
            closestDistanceSq = distanceSq;
        }
    }
    return closest;
}

}  // namespace dai::nav
