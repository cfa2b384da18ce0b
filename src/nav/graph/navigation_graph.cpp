/// @file navigation_graph.cpp
/// @brief NavigationGraph construction, validation and point location.

#include "dai/nav/navigation_graph.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "dai/foundation/game_logger.hpp"

namespace dai::nav {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

std::size_t countDistinct(std::vector<uint32_t> indices) {
    std::sort(indices.begin(), indices.end());
    return static_cast<std::size_t>(
        std::unique(indices.begin(), indices.end()) - indices.begin());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

NavigationGraph::NavigationGraph(std::vector<Vector3> vertices,
                                 std::vector<PathCell> cells,
                                 std::vector<PathLink> links)
    : vertices_(std::move(vertices)), cells_(std::move(cells)) {
    validateCells();
    validateLinks(std::move(links));

    auto& logger = foundation::GameLogger::instance();
    if (logger.isEnabled(LogLevel::Info, LogCategory::Navigation)) {
        LogContext ctx;
        ctx.extra["cells"] = std::to_string(usableCount_) + "/" + std::to_string(cells_.size());
        ctx.extra["links"] = std::to_string(links_.size());
        ctx.extra["vertices"] = std::to_string(vertices_.size());
        ctx.extra["diagnostics"] = std::to_string(diagnostics_.size());
        logger.logWithContext(LogLevel::Info, LogCategory::Navigation,
                              "navigation graph built", ctx);
    }
}

void NavigationGraph::validateCells() {
    usable_.assign(cells_.size(), false);
    usableCount_ = 0;

    for (std::size_t i = 0; i < cells_.size(); ++i) {
        auto& indices = cells_[i].vertexIndices;

        const auto originalSize = indices.size();
        indices.erase(std::remove_if(indices.begin(), indices.end(),
                                     [this](uint32_t v) { return v >= vertices_.size(); }),
                      indices.end());
        if (indices.size() != originalSize) {
            addDiagnostic(ErrorCode::InvalidCell,
                          "cell " + std::to_string(i) + " references " +
                              std::to_string(originalSize - indices.size()) +
                              " missing vertices",
                          i);
        }

        if (countDistinct(indices) < 3) {
            addDiagnostic(ErrorCode::InvalidCell,
                          "cell " + std::to_string(i) +
                              " dropped: fewer than 3 resolvable vertices",
                          i);
            continue;
        }

        usable_[i] = true;
        ++usableCount_;
    }
}

void NavigationGraph::validateLinks(std::vector<PathLink> links) {
    outgoing_.assign(cells_.size(), {});
    links_.reserve(links.size());

    for (std::size_t i = 0; i < links.size(); ++i) {
        PathLink link = links[i];

        if (link.fromCell >= cells_.size() || link.toCell >= cells_.size()) {
            addDiagnostic(ErrorCode::InvalidLink,
                          "link " + std::to_string(i) + " dropped: references absent cell",
                          i);
            continue;
        }
        if (link.fromCell == link.toCell) {
            addDiagnostic(ErrorCode::InvalidLink,
                          "link " + std::to_string(i) + " dropped: self-loop on cell " +
                              std::to_string(link.fromCell),
                          i);
            continue;
        }
        if (!usable_[link.fromCell] || !usable_[link.toCell]) {
            addDiagnostic(ErrorCode::InvalidLink,
                          "link " + std::to_string(i) + " dropped: references dropped cell",
                          i);
            continue;
        }
        if (link.cost == 0) {
            addDiagnostic(ErrorCode::InvalidLink,
                          "link " + std::to_string(i) + " has zero cost; using 1",
                          i);
            link.cost = 1;
        }

        outgoing_[link.fromCell].push_back(links_.size());
        links_.push_back(link);
    }
}

void NavigationGraph::addDiagnostic(ErrorCode code, std::string message, std::size_t index) {
    DAI_LOG_WARN(LogCategory::Navigation, message);
    diagnostics_.emplace_back(code, std::move(message), index);
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

std::optional<CellId> NavigationGraph::CellFromPosition(const Vector3& position) const {
    for (std::size_t i = 0; i < cells_.size(); ++i) {
        const auto id = static_cast<CellId>(i);
        if (PointInCell(position, id)) {
            return id;
        }
    }
    return std::nullopt;
}

bool NavigationGraph::PointInCell(const Vector3& position, CellId cell) const {
    if (!IsUsable(cell)) {
        return false;
    }

    const auto& indices = cells_[cell].vertexIndices;
    const std::size_t count = indices.size();
    int sign = 0;

    for (std::size_t i = 0; i < count; ++i) {
        const Vector3& a = vertices_[indices[i]];
        const Vector3& b = vertices_[indices[(i + 1) % count]];

        // 2D cross of (b - a) x (p - a) in the XZ plane. |cross| is the
        // distance from the edge line scaled by the edge length.
        const float ex = b.x - a.x;
        const float ez = b.z - a.z;
        const float cross = ex * (position.z - a.z) - ez * (position.x - a.x);
        const float edgeLength = std::sqrt(ex * ex + ez * ez);
        if (std::fabs(cross) <= kPointInCellTolerance * edgeLength) {
            continue;
        }

        const int edgeSign = cross > 0.0f ? 1 : -1;
        if (sign == 0) {
            sign = edgeSign;
        } else if (edgeSign != sign) {
            return false;
        }
    }
    return true;
}

std::vector<Neighbour> NavigationGraph::Neighbours(CellId cell, MovementBits bits) const {
    std::vector<Neighbour> out;
    ForEachNeighbour(cell, bits, [&out](const Neighbour& n) { out.push_back(n); });
    return out;
}

std::optional<Vector3> NavigationGraph::CellCenter(CellId cell) const {
    if (cell >= cells_.size()) {
        return std::nullopt;
    }
    return cells_[cell].center;
}

const PathCell* NavigationGraph::Cell(CellId cell) const {
    return cell < cells_.size() ? &cells_[cell] : nullptr;
}

bool NavigationGraph::IsUsable(CellId cell) const {
    return cell < usable_.size() && usable_[cell];
}

}  // namespace dai::nav
