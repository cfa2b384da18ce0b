/// @file monster_controller.cpp
/// @brief MonsterController and LocomotionController implementation.

#include "dai/ai/monster_controller.hpp"

#include <cmath>
#include <utility>

#include "controller_support.hpp"
#include "dai/ai/ai_debug_draw.hpp"
#include "dai/ai/ai_sensing.hpp"

namespace dai::ai {

namespace {

constexpr float kHeadingEpsilon = 1e-4f;
constexpr float kWalkFacingLimit = 90.0f;

float flatDistance(const Vector3& a, const Vector3& b) {
    return (b - a).Flattened().Length();
}

}  // namespace

MonsterBehavior BehaviorForLevel(AlertLevel level) {
    switch (level) {
        case AlertLevel::Lowest:   return MonsterBehavior::Idle;
        case AlertLevel::Low:      return MonsterBehavior::Searching;
        case AlertLevel::Moderate: return MonsterBehavior::Chasing;
        case AlertLevel::High:     return MonsterBehavior::Attacking;
    }
    return MonsterBehavior::Idle;
}

// ═══════════════════════════════════════════════════════════════════════════
// LocomotionController
// ═══════════════════════════════════════════════════════════════════════════

LocomotionController::LocomotionController(float speed, float turnRate, float arrivalDistance)
    : speed_(speed), turnRate_(turnRate), arrivalDistance_(arrivalDistance) {}

void LocomotionController::SetPath(std::vector<Vector3> waypoints) {
    waypoints_ = std::move(waypoints);
    current_ = 0;
}

void LocomotionController::Clear() {
    waypoints_.clear();
    current_ = 0;
}

LocomotionStep LocomotionController::Step(const Vector3& position, float heading,
                                          float deltaTime) {
    while (current_ < waypoints_.size() &&
           flatDistance(position, waypoints_[current_]) <= arrivalDistance_) {
        ++current_;
    }
    if (IsFinished()) {
        return {heading, Vector3::Zero(), true};
    }

    const float target = YawBetween(position, waypoints_[current_]);
    LocomotionStep step;
    step.heading = StepTowardsHeading(heading, target, turnRate_ * deltaTime);
    // Turn in place while the waypoint is behind.
    if (std::abs(NormalizeDegrees(target - step.heading)) <= kWalkFacingLimit) {
        step.velocity = ForwardFromYaw(step.heading) * speed_;
    }
    return step;
}

// ═══════════════════════════════════════════════════════════════════════════
// MonsterController
// ═══════════════════════════════════════════════════════════════════════════

MonsterController::MonsterController(EntityId entity, MonsterTuning tuning,
                                     std::shared_ptr<const nav::PathfindingService> paths,
                                     float sightDistance)
    : entity_(entity),
      tuning_(tuning),
      paths_(std::move(paths)),
      sightDistance_(sightDistance),
      movementBits_(tuning.movementBits),
      locomotion_(tuning.walkSpeed, tuning.turnRate, tuning.arrivalDistance) {}

Effect MonsterController::Initialize(const IWorldView& world) {
    if (auto pose = world.PositionOf(entity_)) {
        heading_ = YawFromRotation(pose->rotation);
    }
    if (const auto* capability = world.Property<MovementCapability>(entity_)) {
        movementBits_ = capability->bits;
    }
    cap_ = detail::ResolveCap(entity_, world);
    timings_ = detail::ResolveTimings(entity_, world, tuning_.escalateSeconds,
                                      tuning_.decaySeconds);
    alertness_.SetLevel(cap_.minLevel, cap_);
    behavior_ = BehaviorForLevel(alertness_.CurrentLevel());
    return SyncAlertnessEffect(entity_, alertness_);
}

Effect MonsterController::Update(const AITickContext& context) {
    const auto pose = context.world.PositionOf(entity_);
    if (!pose) {
        return Effect::None();
    }

    const bool visible = IsPlayerVisibleInFov(entity_, context.world, context.physics, heading_,
                                              tuning_.fov.halfAngle, tuning_.fov.eyeHeight,
                                              sightDistance_);
    if (visible) {
        lastSeen_ = context.world.PlayerPosition();
    }

    std::vector<Effect> effects;

    if (alertness_.Update(visible, context.deltaTime, timings_, cap_)) {
        effects.push_back(SyncAlertnessEffect(entity_, alertness_));
    }

    const MonsterBehavior next = BehaviorForLevel(alertness_.CurrentLevel());
    if (next != behavior_) {
        behavior_ = next;
        locomotion_.Clear();
        plannedGoal_.reset();
        detail::LogControllerEvent(entity_, GetName(), monsterBehaviorName(behavior_));
    }

    switch (behavior_) {
        case MonsterBehavior::Idle:
            effects.push_back(stop());
            break;
        case MonsterBehavior::Searching:
            effects.push_back(search(*pose, context));
            break;
        case MonsterBehavior::Chasing:
            effects.push_back(chase(*pose, context));
            break;
        case MonsterBehavior::Attacking:
            effects.push_back(attack(*pose, context, visible));
            break;
    }

    if (context.world.DebugAIEnabled()) {
        effects.push_back(DrawAlertnessDebug(pose->position, alertness_.CurrentLevel(), visible,
                                             AlertnessDebugConfig::Monster()));
        effects.push_back(DrawFovDebug(pose->position, heading_, visible, tuning_.fov));
        effects.push_back(drawPath(pose->position));
    }

    return Effect::Combine(std::move(effects));
}

Effect MonsterController::turnTo(float heading) {
    if (std::abs(NormalizeDegrees(heading - heading_)) < kHeadingEpsilon) {
        return Effect::None();
    }
    heading_ = heading;
    return SetRotation{entity_, Quaternion::FromAngleY(heading_)};
}

Effect MonsterController::stop() {
    if (!moving_) {
        return Effect::None();
    }
    moving_ = false;
    return SetVelocity{entity_, Vector3::Zero()};
}

Effect MonsterController::search(const Pose& pose, const AITickContext& context) {
    std::vector<Effect> effects;
    effects.push_back(stop());
    if (lastSeen_) {
        const float target = YawBetween(pose.position, *lastSeen_);
        effects.push_back(turnTo(
            StepTowardsHeading(heading_, target, tuning_.turnRate * context.deltaTime)));
    }
    return Effect::Combine(std::move(effects));
}

void MonsterController::replan(const Vector3& from, const Vector3& goal) {
    plannedGoal_ = goal;

    if (!paths_) {
        locomotion_.SetPath({goal});
        return;
    }

    if (auto waypoints = paths_->FindPath(from, goal, movementBits_)) {
        waypoints->push_back(goal);
        locomotion_.SetPath(std::move(*waypoints));
        return;
    }

    // Goal unreachable: close in on the nearest reachable cell instead.
    if (auto closest = paths_->FindClosestReachableCell(from, goal, movementBits_)) {
        if (auto center = paths_->Graph().CellCenter(*closest)) {
            if (auto waypoints = paths_->FindPath(from, *center, movementBits_)) {
                locomotion_.SetPath(std::move(*waypoints));
                return;
            }
        }
    }

    detail::LogControllerEvent(entity_, GetName(), "no path to goal; heading straight for it");
    locomotion_.SetPath({goal});
}

Effect MonsterController::chase(const Pose& pose, const AITickContext& context) {
    // lastSeen_ tracks the player while visible.
    const auto goal = lastSeen_;
    if (!goal) {
        return stop();
    }

    if (!plannedGoal_ || !locomotion_.HasPath() ||
        plannedGoal_->DistanceTo(*goal) > tuning_.replanDistance) {
        replan(pose.position, *goal);
    }

    std::vector<Effect> effects;
    const LocomotionStep step = locomotion_.Step(pose.position, heading_, context.deltaTime);
    effects.push_back(turnTo(step.heading));

    if (step.arrived) {
        effects.push_back(stop());
    } else {
        moving_ = true;
        effects.push_back(SetVelocity{entity_, step.velocity});
    }
    return Effect::Combine(std::move(effects));
}

Effect MonsterController::attack(const Pose& pose, const AITickContext& context, bool visible) {
    if (context.world.Property<RangedWeaponLink>(entity_) == nullptr) {
        return chase(pose, context);
    }

    std::vector<Effect> effects;
    effects.push_back(stop());

    // A hidden player is tracked only as far as the last sighting.
    const auto aimPoint = visible ? context.world.PlayerPosition() : lastSeen_;
    if (!aimPoint) {
        return Effect::Combine(std::move(effects));
    }

    const float target = YawBetween(pose.position, *aimPoint);
    effects.push_back(
        turnTo(StepTowardsHeading(heading_, target, tuning_.turnRate * context.deltaTime)));

    if (visible && context.now >= nextFireTime_) {
        effects.push_back(
            FireRangedWeapon{entity_, Quaternion::FromAngleY(NormalizeDegrees(target - heading_))});
        nextFireTime_ = context.now + tuning_.fireInterval;
    }
    return Effect::Combine(std::move(effects));
}

Effect MonsterController::drawPath(const Vector3& position) const {
    const auto& waypoints = locomotion_.Waypoints();
    if (locomotion_.IsFinished()) {
        return Effect::None();
    }
    DrawDebugLines draw;
    Vector3 from = position;
    for (std::size_t i = locomotion_.CurrentIndex(); i < waypoints.size(); ++i) {
        draw.lines.push_back({from, waypoints[i], debug_colors::kChasePath});
        from = waypoints[i];
    }
    return draw;
}

}  // namespace dai::ai
