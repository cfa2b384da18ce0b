#pragma once

/// @file ai_sensing.hpp
/// @brief Heading helpers and the player line-of-sight / field-of-view test.
///
/// Headings are absolute world yaw in degrees: 0 faces +Z, 90 faces +X.

#include "dai/ai/ai_types.hpp"
#include "dai/ai/physics_query.hpp"
#include "dai/ai/world_view.hpp"
#include "dai/core/math_types.hpp"

namespace dai::ai {

/// Heading of the horizontal direction from @p from to @p to.
[[nodiscard]] float YawBetween(const Vector3& from, const Vector3& to);

/// Unit forward vector in the XZ plane for a heading.
[[nodiscard]] Vector3 ForwardFromYaw(float headingDegrees);

/// Heading of an orientation's forward (+Z) axis.
[[nodiscard]] float YawFromRotation(const Quaternion& rotation);

/// Turn from @p current toward @p target by at most @p maxDelta degrees
/// along the shorter arc. Result is normalized to (-180, 180].
[[nodiscard]] float StepTowardsHeading(float current, float target, float maxDelta);

/// True when @p target lies within @p halfAngle degrees of the heading, as
/// seen from @p eye in the XZ plane. A target straight above or below
/// passes (the angle is undefined there).
[[nodiscard]] bool IsWithinFov(const Vector3& eye, float headingDegrees,
                               const Vector3& target, float halfAngle);

/// Line-of-sight test: a ray from the entity's eye toward the player whose
/// first hit is the player entity.
[[nodiscard]] bool IsPlayerVisible(EntityId entity, const IWorldView& world,
                                   const IPhysicsQuery& physics,
                                   float eyeHeight = 0.0f,
                                   float maxDistance = kMaxSightDistance);

/// FOV gate followed by the line-of-sight test. False when either the
/// entity or the player has no pose.
[[nodiscard]] bool IsPlayerVisibleInFov(EntityId entity, const IWorldView& world,
                                        const IPhysicsQuery& physics,
                                        float headingDegrees, float fovHalfAngle,
                                        float eyeHeight = 0.0f,
                                        float maxDistance = kMaxSightDistance);

}  // namespace dai::ai
