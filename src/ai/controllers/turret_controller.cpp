/// @file turret_controller.cpp
/// @brief TurretController implementation.

#include "dai/ai/turret_controller.hpp"

#include <vector>

#include "controller_support.hpp"
#include "dai/ai/ai_debug_draw.hpp"
#include "dai/ai/ai_sensing.hpp"

namespace dai::ai {

namespace {

constexpr float kProgressEpsilon = 1e-5f;

bool progressComplete(float progress) {
    return progress + kProgressEpsilon >= 1.0f;
}

}  // namespace

TurretPhase PhaseOf(const TurretState& state) {
    switch (state.index()) {
        case 0: return TurretPhase::Closed;
        case 1: return TurretPhase::Opening;
        case 2: return TurretPhase::Open;
        default: return TurretPhase::Closing;
    }
}

float OpenAmount(const TurretState& state) {
    if (const auto* opening = std::get_if<TurretOpening>(&state)) {
        return opening->progress;
    }
    if (const auto* closing = std::get_if<TurretClosing>(&state)) {
        return 1.0f - closing->progress;
    }
    return std::holds_alternative<TurretOpen>(state) ? 1.0f : 0.0f;
}

TurretController::TurretController(EntityId entity, TurretTuning tuning, float sightDistance,
                                   std::unique_ptr<ISteeringStrategy> steering)
    : entity_(entity),
      tuning_(tuning),
      sightDistance_(sightDistance),
      steering_(steering ? std::move(steering)
                         : std::make_unique<ChasePlayerSteeringStrategy>(tuning.turnRate)) {}

Effect TurretController::Initialize(const IWorldView& world) {
    if (auto pose = world.PositionOf(entity_)) {
        initialYaw_ = YawFromRotation(pose->rotation);
    }
    heading_ = initialYaw_;
    cap_ = detail::ResolveCap(entity_, world);
    timings_ = detail::ResolveTimings(entity_, world, tuning_.escalateSeconds,
                                      tuning_.decaySeconds);
    alertness_.SetLevel(cap_.minLevel, cap_);
    return SyncAlertnessEffect(entity_, alertness_);
}

Effect TurretController::Update(const AITickContext& context) {
    const auto pose = context.world.PositionOf(entity_);
    if (!pose) {
        return Effect::None();
    }

    const bool visible = IsPlayerVisibleInFov(entity_, context.world, context.physics, heading_,
                                              tuning_.fov.halfAngle, tuning_.fov.eyeHeight,
                                              sightDistance_);

    std::vector<Effect> effects;

    if (alertness_.Update(visible, context.deltaTime, timings_, cap_)) {
        effects.push_back(SyncAlertnessEffect(entity_, alertness_));
    }

    effects.push_back(stepStateMachine(visible, context.deltaTime, pose->position, context.world));

    // Written every tick, including while closed.
    effects.push_back(SetJointTransform{
        entity_, kCapJoint, Matrix4::TranslateX(-tuning_.capTravel * OpenAmount(state_))});

    if (std::holds_alternative<TurretOpen>(state_)) {
        effects.push_back(aimAndFire(context));
    }

    if (context.world.DebugAIEnabled()) {
        effects.push_back(DrawAlertnessDebug(pose->position, alertness_.CurrentLevel(), visible,
                                             AlertnessDebugConfig::Turret()));
        effects.push_back(DrawFovDebug(pose->position, heading_, visible, tuning_.fov));
    }

    return Effect::Combine(std::move(effects));
}

Effect TurretController::stepStateMachine(bool visible, float deltaTime,
                                          const Vector3& position, const IWorldView& world) {
    const float step = deltaTime / tuning_.openTime;

    if (std::holds_alternative<TurretClosed>(state_)) {
        if (!visible) {
            return Effect::None();
        }
        state_ = TurretOpening{step};
        detail::LogControllerEvent(entity_, GetName(), "opening");
        return detail::EventSound(entity_, position, "activate", world);
    }

    if (auto* opening = std::get_if<TurretOpening>(&state_)) {
        opening->progress += step;
        if (progressComplete(opening->progress)) {
            state_ = TurretOpen{};
            detail::LogControllerEvent(entity_, GetName(), "open");
        }
        return Effect::None();
    }

    if (std::holds_alternative<TurretOpen>(state_)) {
        if (visible) {
            return Effect::None();
        }
        state_ = TurretClosing{step};
        detail::LogControllerEvent(entity_, GetName(), "closing");
        return detail::EventSound(entity_, position, "deactivate", world);
    }

    auto& closing = std::get<TurretClosing>(state_);
    closing.progress += step;
    if (progressComplete(closing.progress)) {
        state_ = TurretClosed{};
        detail::LogControllerEvent(entity_, GetName(), "closed");
    }
    return Effect::None();
}

Effect TurretController::aimAndFire(const AITickContext& context) {
    std::vector<Effect> effects;

    if (auto steered = steering_->Steer(heading_, context, entity_)) {
        heading_ = steered->first.desiredHeading;
        effects.push_back(std::move(steered->second));
    }

    effects.push_back(SetJointTransform{entity_, kAimJoint,
                                        Matrix4::RotateX(initialYaw_ - heading_ - 90.0f)});

    if (context.now >= nextFireTime_) {
        effects.push_back(
            FireRangedWeapon{entity_, Quaternion::FromAngleY(heading_ - initialYaw_)});
        nextFireTime_ = context.now + tuning_.fireInterval;
    }

    return Effect::Combine(std::move(effects));
}

}  // namespace dai::ai
