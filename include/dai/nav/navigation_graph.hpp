#pragma once

/// @file navigation_graph.hpp
/// @brief In-memory navigation mesh: convex cells joined by directed,
///        capability-gated links.
///
/// The host translates its level data into three plain arrays (vertices,
/// cells, links). Construction validates them once; the graph is immutable
/// afterwards and may be shared read-only by every controller.

#include <cstdint>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "dai/core/math_types.hpp"
#include "dai/foundation/game_error.hpp"

namespace dai::nav {

/// Index of a cell in the cell table.
using CellId = uint32_t;

/// Opaque movement-capability bitset. A link is traversable when its
/// okBits share at least one bit with the mover's bits.
using MovementBits = uint32_t;

/// Default encoding of the movement bits; hosts may define their own.
namespace movement {
inline constexpr MovementBits kWalk = 0x01;
inline constexpr MovementBits kFly = 0x02;
inline constexpr MovementBits kSwim = 0x04;
inline constexpr MovementBits kSmallCreature = 0x08;
}  // namespace movement

/// Cell flag bits carried through from level data.
namespace cell_flags {
inline constexpr uint32_t kUnpathable = 0x01;
inline constexpr uint32_t kBelowDoor = 0x02;
inline constexpr uint32_t kBlockingObb = 0x04;
inline constexpr uint32_t kMovingTerrain = 0x08;
}  // namespace cell_flags

/// Points closer than this (world units) to an edge line count as on the edge.
inline constexpr float kPointInCellTolerance = 1e-4f;

/// Marker for a link without shared-edge vertex data.
inline constexpr uint32_t kNoVertex = std::numeric_limits<uint32_t>::max();

/// Convex polygon (in the XZ plane) of the walkable surface.
struct PathCell {
    Vector3 center;
    std::vector<uint32_t> vertexIndices;  ///< Ordered polygon, vertex table ids.
    uint32_t flags = 0;
};

/// Directed edge between two cells.
struct PathLink {
    CellId fromCell = 0;
    CellId toCell = 0;
    uint16_t cost = 1;
    MovementBits okBits = 0;
    uint32_t edgeVertexA = kNoVertex;  ///< Shared edge endpoints, if known.
    uint32_t edgeVertexB = kNoVertex;
};

/// One traversable step out of a cell.
struct Neighbour {
    CellId cell = 0;
    uint32_t cost = 0;
    std::size_t linkIndex = 0;

    constexpr auto operator<=>(const Neighbour&) const = default;
};

/// Immutable navigation mesh with point location and neighbour expansion.
///
/// Malformed input never aborts construction: a cell with fewer than three
/// distinct resolvable vertices is dropped (its id stays reserved but it
/// contains no points and has no links), a link that is a self-loop or
/// references an absent or dropped cell is dropped, and a zero-cost link is
/// promoted to cost 1. Each fix-up records a diagnostic.
class NavigationGraph {
public:
    NavigationGraph() = default;

    NavigationGraph(std::vector<Vector3> vertices,
                    std::vector<PathCell> cells,
                    std::vector<PathLink> links);

    /// First usable cell (lowest id) whose XZ polygon contains @p position.
    [[nodiscard]] std::optional<CellId> CellFromPosition(const Vector3& position) const;

    /// XZ point-in-convex-polygon test against one cell.
    [[nodiscard]] bool PointInCell(const Vector3& position, CellId cell) const;

    /// Visit each traversable link out of @p cell in link-table order.
    /// @p visit receives a Neighbour.
    template <typename Visitor>
    void ForEachNeighbour(CellId cell, MovementBits bits, Visitor&& visit) const {
        if (cell >= outgoing_.size()) {
            return;
        }
        for (std::size_t linkIndex : outgoing_[cell]) {
            const PathLink& link = links_[linkIndex];
            if ((link.okBits & bits) != 0) {
                visit(Neighbour{link.toCell, static_cast<uint32_t>(link.cost), linkIndex});
            }
        }
    }

    /// Traversable neighbours of @p cell under @p bits.
    [[nodiscard]] std::vector<Neighbour> Neighbours(CellId cell, MovementBits bits) const;

    [[nodiscard]] std::optional<Vector3> CellCenter(CellId cell) const;

    /// Cell record, or nullptr for an out-of-range id.
    [[nodiscard]] const PathCell* Cell(CellId cell) const;

    /// False for out-of-range and dropped cells.
    [[nodiscard]] bool IsUsable(CellId cell) const;

    [[nodiscard]] std::size_t CellCount() const noexcept { return cells_.size(); }
    [[nodiscard]] std::size_t UsableCellCount() const noexcept { return usableCount_; }
    [[nodiscard]] std::size_t VertexCount() const noexcept { return vertices_.size(); }
    [[nodiscard]] std::size_t LinkCount() const noexcept { return links_.size(); }

    /// Links that survived validation.
    [[nodiscard]] const std::vector<PathLink>& Links() const noexcept { return links_; }

    /// One entry per dropped or repaired input item; the offending input
    /// index is carried as std::size_t context.
    [[nodiscard]] const std::vector<foundation::GameError>& Diagnostics() const noexcept {
        return diagnostics_;
    }

private:
    void validateCells();
    void validateLinks(std::vector<PathLink> links);
    void addDiagnostic(foundation::ErrorCode code, std::string message, std::size_t index);

    std::vector<Vector3> vertices_;
    std::vector<PathCell> cells_;
    std::vector<bool> usable_;
    std::size_t usableCount_ = 0;
    std::vector<PathLink> links_;
    std::vector<std::vector<std::size_t>> outgoing_;
    std::vector<foundation::GameError> diagnostics_;
};

}  // namespace dai::nav
