#pragma once

/// @file monster_controller.hpp
/// @brief Monster AI: idles, searches the last sighting, chases the player
///        along navigation paths and attacks once fully alert.
///
/// Behavior follows the alert level:
///   Lowest -> Idle, Low -> Searching, Moderate -> Chasing, High -> Attacking.
/// A monster without a ranged weapon keeps chasing at High.

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "dai/ai/ai_controller.hpp"
#include "dai/ai/ai_tuning.hpp"
#include "dai/nav/pathfinding_service.hpp"

namespace dai::ai {

/// Behavior a monster adopts at @p level.
[[nodiscard]] MonsterBehavior BehaviorForLevel(AlertLevel level);

/// Result of one locomotion step.
struct LocomotionStep {
    float heading = 0.0f;
    Vector3 velocity;
    bool arrived = false;
};

/// Follows a waypoint list with a bounded turn rate.
///
/// Waypoints within the arrival distance (measured on the XZ plane) are
/// consumed. The mover turns toward the current waypoint and only walks
/// once it faces within 90 degrees of it.
class LocomotionController {
public:
    LocomotionController(float speed, float turnRate, float arrivalDistance);

    void SetPath(std::vector<Vector3> waypoints);
    void Clear();

    [[nodiscard]] bool HasPath() const noexcept { return !waypoints_.empty(); }
    [[nodiscard]] bool IsFinished() const noexcept { return current_ >= waypoints_.size(); }
    [[nodiscard]] std::size_t CurrentIndex() const noexcept { return current_; }
    [[nodiscard]] const std::vector<Vector3>& Waypoints() const noexcept { return waypoints_; }

    LocomotionStep Step(const Vector3& position, float heading, float deltaTime);

private:
    float speed_;
    float turnRate_;
    float arrivalDistance_;
    std::vector<Vector3> waypoints_;
    std::size_t current_ = 0;
};

class MonsterController final : public IAIController {
public:
    /// @param paths Shared pathfinding service; without one the monster
    ///        heads straight for its goal.
    explicit MonsterController(EntityId entity, MonsterTuning tuning = {},
                               std::shared_ptr<const nav::PathfindingService> paths = nullptr,
                               float sightDistance = kMaxSightDistance);

    Effect Initialize(const IWorldView& world) override;
    Effect Update(const AITickContext& context) override;

    [[nodiscard]] EntityId GetEntity() const noexcept override { return entity_; }
    [[nodiscard]] std::string_view GetName() const noexcept override { return "MonsterController"; }
    [[nodiscard]] const AlertnessState& GetAlertness() const noexcept override { return alertness_; }

    [[nodiscard]] MonsterBehavior GetBehavior() const noexcept { return behavior_; }
    [[nodiscard]] float GetHeading() const noexcept { return heading_; }
    [[nodiscard]] nav::MovementBits GetMovementBits() const noexcept { return movementBits_; }
    [[nodiscard]] const std::optional<Vector3>& GetLastSeenPosition() const noexcept {
        return lastSeen_;
    }
    [[nodiscard]] const LocomotionController& GetLocomotion() const noexcept { return locomotion_; }
    [[nodiscard]] float GetNextFireTime() const noexcept { return nextFireTime_; }

private:
    Effect chase(const Pose& pose, const AITickContext& context);
    Effect attack(const Pose& pose, const AITickContext& context, bool visible);
    Effect search(const Pose& pose, const AITickContext& context);
    Effect turnTo(float heading);
    Effect stop();
    void replan(const Vector3& from, const Vector3& goal);
    [[nodiscard]] Effect drawPath(const Vector3& position) const;

    EntityId entity_;
    MonsterTuning tuning_;
    std::shared_ptr<const nav::PathfindingService> paths_;
    float sightDistance_;

    MonsterBehavior behavior_ = MonsterBehavior::Idle;
    float heading_ = 0.0f;
    nav::MovementBits movementBits_ = 0;
    std::optional<Vector3> lastSeen_;
    std::optional<Vector3> plannedGoal_;
    LocomotionController locomotion_;
    bool moving_ = false;
    float nextFireTime_ = 0.0f;
    AlertnessState alertness_;
    AlertCap cap_ = kDefaultAlertCap;
    AlertnessTimings timings_;
};

}  // namespace dai::ai
