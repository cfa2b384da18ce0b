/// @file camera_controller.cpp
/// @brief CameraController implementation.

#include "dai/ai/camera_controller.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "controller_support.hpp"
#include "dai/ai/ai_debug_draw.hpp"
#include "dai/ai/ai_sensing.hpp"

namespace dai::ai {

namespace {

constexpr std::string_view kGreenMarker = "grn";
constexpr std::string_view kDefaultCameraModel = "camgrn";
constexpr std::string_view kAlarmMessage = "Alarm";
constexpr float kScanMillisecondsPerSecond = 1000.0f;

}  // namespace

std::string CameraModelForLevel(std::string_view baseModel, AlertLevel level) {
    std::string model(baseModel);
    const auto marker = model.find(kGreenMarker);
    if (marker == std::string::npos) {
        return model;
    }
    if (level == AlertLevel::Moderate) {
        model.replace(marker, kGreenMarker.size(), "yel");
    } else if (level == AlertLevel::High) {
        model.replace(marker, kGreenMarker.size(), "red");
    }
    return model;
}

std::string_view CameraTransitionConcept(const AlertTransition& transition) {
    if (transition.IsEscalation()) {
        switch (transition.to) {
            case AlertLevel::Low:      return "tolevelone";
            case AlertLevel::Moderate: return "toleveltwo";
            case AlertLevel::High:     return "tolevelthree";
            case AlertLevel::Lowest:   break;
        }
        return {};
    }
    return transition.to == AlertLevel::Lowest ? "backtozero" : "lostcontact";
}

CameraController::CameraController(EntityId entity, CameraTuning tuning, float sightDistance)
    : entity_(entity), tuning_(tuning), sightDistance_(sightDistance) {}

float CameraController::GetHeading() const noexcept {
    return NormalizeDegrees(baseYaw_ + viewAngle_);
}

Effect CameraController::Initialize(const IWorldView& world) {
    if (auto pose = world.PositionOf(entity_)) {
        baseYaw_ = YawFromRotation(pose->rotation);
    }
    if (const auto* scan = world.Property<CameraScan>(entity_)) {
        scan_ = *scan;
    }
    if (scan_.scanAngle1 > scan_.scanAngle2) {
        std::swap(scan_.scanAngle1, scan_.scanAngle2);
    }
    viewAngle_ = 0.5f * (scan_.scanAngle1 + scan_.scanAngle2);

    const auto* model = world.Property<ModelName>(entity_);
    baseModel_ = model ? model->name : std::string(kDefaultCameraModel);
    currentModel_ = baseModel_;

    cap_ = detail::ResolveCap(entity_, world);
    timings_ = detail::ResolveTimings(entity_, world, tuning_.escalateSeconds,
                                      tuning_.decaySeconds);
    alertness_.SetLevel(cap_.minLevel, cap_);
    return SyncAlertnessEffect(entity_, alertness_);
}

float CameraController::scanSpeed() const {
    return std::max(scan_.scanSpeed * kScanMillisecondsPerSecond, tuning_.minScanSpeed);
}

float CameraController::scanTarget(float now) const {
    const float center = 0.5f * (scan_.scanAngle1 + scan_.scanAngle2);
    const float halfRange = 0.5f * (scan_.scanAngle2 - scan_.scanAngle1);
    return center + halfRange * std::sin(now);
}

Effect CameraController::Update(const AITickContext& context) {
    const auto pose = context.world.PositionOf(entity_);
    if (!pose) {
        return Effect::None();
    }

    const bool visible = IsPlayerVisibleInFov(entity_, context.world, context.physics,
                                              GetHeading(), tuning_.fov.halfAngle,
                                              tuning_.fov.eyeHeight, sightDistance_);

    std::vector<Effect> effects;

    if (auto transition = alertness_.Update(visible, context.deltaTime, timings_, cap_)) {
        effects.push_back(onTransition(*transition, context.world));
    } else {
        effects.push_back(sustainSpeech(context.world));
    }

    // Track the player while visible, otherwise sweep.
    float target = scanTarget(context.now);
    if (visible) {
        if (auto player = context.world.PlayerPosition()) {
            target = NormalizeDegrees(YawBetween(pose->position, *player) - baseYaw_);
        }
    }
    viewAngle_ = StepTowardsHeading(viewAngle_, target, scanSpeed() * context.deltaTime);

    const CameraMode previous = mode_;
    if (alertness_.CurrentLevel() == AlertLevel::High) {
        mode_ = CameraMode::Alarmed;
    } else {
        mode_ = visible ? CameraMode::Tracking : CameraMode::Scanning;
    }
    if (mode_ != previous) {
        detail::LogControllerEvent(entity_, GetName(),
                                   mode_ == CameraMode::Alarmed    ? "alarmed"
                                   : mode_ == CameraMode::Tracking ? "tracking"
                                                                   : "scanning");
    }

    effects.push_back(
        SetJointTransform{entity_, kAimJoint, Matrix4::RotateX(-viewAngle_ - 90.0f)});

    if (context.world.DebugAIEnabled()) {
        effects.push_back(DrawAlertnessDebug(pose->position, alertness_.CurrentLevel(), visible,
                                             AlertnessDebugConfig::Camera()));
        effects.push_back(DrawFovDebug(pose->position, GetHeading(), visible, tuning_.fov));
    }

    return Effect::Combine(std::move(effects));
}

Effect CameraController::onTransition(const AlertTransition& transition,
                                      const IWorldView& world) {
    std::vector<Effect> effects;
    sustainSpoken_ = false;

    effects.push_back(SyncAlertnessEffect(entity_, alertness_));

    std::string model = CameraModelForLevel(baseModel_, transition.to);
    if (model != currentModel_) {
        currentModel_ = model;
        effects.push_back(ChangeModel{entity_, std::move(model)});
    }

    if (world.Property<SpeechVoice>(entity_) != nullptr) {
        const auto concept_ = CameraTransitionConcept(transition);
        if (!concept_.empty()) {
            effects.push_back(PlaySpeech{entity_, std::string(concept_)});
        }
    }

    if (transition.to == AlertLevel::High) {
        const auto* alarm = world.Property<AlarmTargets>(entity_);
        if (alarm == nullptr || alarm->targets.empty()) {
            effects.push_back(
                SendMessage{entity_, foundation::kNoEntity, std::string(kAlarmMessage)});
        } else {
            for (EntityId target : alarm->targets) {
                effects.push_back(SendMessage{entity_, target, std::string(kAlarmMessage)});
            }
        }
        detail::LogControllerEvent(entity_, GetName(), "alarm raised");
    }

    return Effect::Combine(std::move(effects));
}

Effect CameraController::sustainSpeech(const IWorldView& world) {
    const AlertLevel level = alertness_.CurrentLevel();
    if (sustainSpoken_ || level < AlertLevel::Moderate ||
        alertness_.TimeSinceLevelChange() < tuning_.sustainSpeechDelay ||
        world.Property<SpeechVoice>(entity_) == nullptr) {
        return Effect::None();
    }
    sustainSpoken_ = true;
    return PlaySpeech{entity_, level == AlertLevel::High ? "atlevelthree" : "atleveltwo"};
}

}  // namespace dai::ai
