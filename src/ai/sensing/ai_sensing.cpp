/// @file ai_sensing.cpp
/// @brief Heading math and player visibility queries.

#include "dai/ai/ai_sensing.hpp"

#include <algorithm>
#include <cmath>

namespace dai::ai {

namespace {

constexpr float kDirectionEpsilon = 1e-6f;

}  // namespace

float YawBetween(const Vector3& from, const Vector3& to) {
    const Vector3 d = to - from;
    return ToDegrees(std::atan2(d.x, d.z));
}

Vector3 ForwardFromYaw(float headingDegrees) {
    const float radians = ToRadians(headingDegrees);
    return {std::sin(radians), 0.0f, std::cos(radians)};
}

float YawFromRotation(const Quaternion& rotation) {
    const Vector3 forward = rotation.Rotate({0.0f, 0.0f, 1.0f});
    return ToDegrees(std::atan2(forward.x, forward.z));
}

float StepTowardsHeading(float current, float target, float maxDelta) {
    const float delta = NormalizeDegrees(target - current);
    const float limit = std::max(maxDelta, 0.0f);
    return NormalizeDegrees(current + std::clamp(delta, -limit, limit));
}

bool IsWithinFov(const Vector3& eye, float headingDegrees, const Vector3& target,
                 float halfAngle) {
    const Vector3 toTarget = (target - eye).Flattened();
    if (toTarget.LengthSquared() < kDirectionEpsilon) {
        return true;
    }
    const Vector3 forward = ForwardFromYaw(headingDegrees);
    const float cosAngle = std::clamp(toTarget.Normalized().Dot(forward), -1.0f, 1.0f);
    return ToDegrees(std::acos(cosAngle)) <= halfAngle;
}

bool IsPlayerVisible(EntityId entity, const IWorldView& world, const IPhysicsQuery& physics,
                     float eyeHeight, float maxDistance) {
    const auto pose = world.PositionOf(entity);
    const auto player = world.PlayerPosition();
    if (!pose || !player) {
        return false;
    }

    const Vector3 eye = pose->position + Vector3{0.0f, eyeHeight, 0.0f};
    const Vector3 direction = (*player - eye).Normalized();
    if (direction.LengthSquared() < kDirectionEpsilon) {
        return false;
    }

    const auto hit = physics.Raycast(eye, direction, maxDistance);
    return hit.has_value() && hit->entity == world.PlayerEntity();
}

bool IsPlayerVisibleInFov(EntityId entity, const IWorldView& world,
                          const IPhysicsQuery& physics, float headingDegrees,
                          float fovHalfAngle, float eyeHeight, float maxDistance) {
    const auto pose = world.PositionOf(entity);
    const auto player = world.PlayerPosition();
    if (!pose || !player) {
        return false;
    }

    const Vector3 eye = pose->position + Vector3{0.0f, eyeHeight, 0.0f};
    if (!IsWithinFov(eye, headingDegrees, *player, fovHalfAngle)) {
        return false;
    }
    return IsPlayerVisible(entity, world, physics, eyeHeight, maxDistance);
}

}  // namespace dai::ai
