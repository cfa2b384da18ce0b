#pragma once

/// @file physics_query.hpp
/// @brief Physics collaborator interface consumed by the AI core.

#include <optional>

#include "dai/ai/ai_types.hpp"
#include "dai/core/math_types.hpp"

namespace dai::ai {

/// First object struck by a ray.
struct RaycastHit {
    EntityId entity;  ///< Invalid when the ray hit static geometry.
    float distance = 0.0f;
    Vector3 point;
    Vector3 normal;
};

/// Raycast service supplied by the host's physics backend.
class IPhysicsQuery {
public:
    virtual ~IPhysicsQuery() = default;

    /// Cast a ray from @p origin along unit @p direction.
    /// @return The first hit within @p maxDistance, or std::nullopt.
    [[nodiscard]] virtual std::optional<RaycastHit> Raycast(const Vector3& origin,
                                                            const Vector3& direction,
                                                            float maxDistance) const = 0;
};

}  // namespace dai::ai
