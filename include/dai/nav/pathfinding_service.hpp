#pragma once

/// @file pathfinding_service.hpp
/// @brief A* and Dijkstra searches over a NavigationGraph.
///
/// find-path runs A* from the cell containing the start position to the
/// cell containing the goal, using link costs as edge weights and the
/// truncated Euclidean distance between cell centers as heuristic. The
/// closest-reachable query runs Dijkstra over everything reachable from
/// the start cell and picks the cell nearest the goal. Every "no path"
/// outcome is an empty optional.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "dai/core/math_types.hpp"
#include "dai/nav/navigation_graph.hpp"

namespace dai::nav {

/// Ordered cells of a search result plus the summed link cost.
struct CellPath {
    std::vector<CellId> cells;
    uint32_t totalCost = 0;
};

/// A cell reachable from a search origin and its shortest link-cost distance.
struct ReachableCell {
    CellId cell = 0;
    uint32_t distance = 0;

    constexpr auto operator<=>(const ReachableCell&) const = default;
};

/// Stateless search service sharing an immutable graph.
///
/// Determinism: among equally promising open cells the lowest cell id is
/// expanded first, and the closest-reachable query breaks distance ties by
/// lowest cell id.
///
/// Example:
/// @code
///   auto graph = std::make_shared<const NavigationGraph>(verts, cells, links);
///   PathfindingService paths(graph);
///   if (auto waypoints = paths.FindPath(from, to, movement::kWalk)) {
///       locomotion.SetPath(std::move(*waypoints));
///   }
/// @endcode
class PathfindingService {
public:
    explicit PathfindingService(std::shared_ptr<const NavigationGraph> graph);

    /// Waypoints (cell centers) from the cell containing @p from to the
    /// cell containing @p to.
    /// @param expansionBudget Maximum number of cells A* may expand; the
    ///        search yields no path once it is exhausted.
    [[nodiscard]] std::optional<std::vector<Vector3>> FindPath(
        const Vector3& from, const Vector3& to, MovementBits bits,
        std::optional<std::size_t> expansionBudget = std::nullopt) const;

    /// A* between two cell ids.
    [[nodiscard]] std::optional<CellPath> FindCellPath(
        CellId start, CellId goal, MovementBits bits,
        std::optional<std::size_t> expansionBudget = std::nullopt) const;

    /// Reachable cell (start included) nearest to @p goal.
    [[nodiscard]] std::optional<CellId> FindClosestReachableCell(const Vector3& from,
                                                                 const Vector3& goal,
                                                                 MovementBits bits) const;

    /// Dijkstra-all from @p start, ordered by cell id. Empty when @p start
    /// is not a usable cell.
    [[nodiscard]] std::vector<ReachableCell> ReachableCells(CellId start,
                                                            MovementBits bits) const;

    [[nodiscard]] const NavigationGraph& Graph() const noexcept { return *graph_; }

    [[nodiscard]] std::shared_ptr<const NavigationGraph> SharedGraph() const noexcept {
        return graph_;
    }

private:
    [[nodiscard]] uint32_t heuristic(CellId from, CellId goal) const;

    std::shared_ptr<const NavigationGraph> graph_;
};

}  // namespace dai::nav
