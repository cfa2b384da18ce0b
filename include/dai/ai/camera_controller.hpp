#pragma once

/// @file camera_controller.hpp
/// @brief Security camera AI: sweeps between two scan angles, tracks the
///        player when seen, and raises the alarm at High alert.

#include <string>
#include <string_view>

#include "dai/ai/ai_controller.hpp"
#include "dai/ai/ai_tuning.hpp"

namespace dai::ai {

/// Model name for @p level derived from a green base name ("camgrn" ->
/// "camyel" at Moderate, "camred" at High). Returns @p baseModel unchanged
/// when it carries no "grn" marker.
[[nodiscard]] std::string CameraModelForLevel(std::string_view baseModel, AlertLevel level);

/// Speech concept announcing a transition, e.g. "toleveltwo" or "lostcontact".
[[nodiscard]] std::string_view CameraTransitionConcept(const AlertTransition& transition);

class CameraController final : public IAIController {
public:
    explicit CameraController(EntityId entity, CameraTuning tuning = {},
                              float sightDistance = kMaxSightDistance);

    Effect Initialize(const IWorldView& world) override;
    Effect Update(const AITickContext& context) override;

    [[nodiscard]] EntityId GetEntity() const noexcept override { return entity_; }
    [[nodiscard]] std::string_view GetName() const noexcept override { return "CameraController"; }
    [[nodiscard]] const AlertnessState& GetAlertness() const noexcept override { return alertness_; }

    [[nodiscard]] CameraMode GetMode() const noexcept { return mode_; }
    /// View angle relative to the spawn yaw (degrees).
    [[nodiscard]] float GetViewAngle() const noexcept { return viewAngle_; }
    /// Absolute heading of the lens.
    [[nodiscard]] float GetHeading() const noexcept;
    [[nodiscard]] const CameraScan& GetScan() const noexcept { return scan_; }
    [[nodiscard]] const std::string& GetCurrentModel() const noexcept { return currentModel_; }

private:
    Effect onTransition(const AlertTransition& transition, const IWorldView& world);
    Effect sustainSpeech(const IWorldView& world);
    [[nodiscard]] float scanTarget(float now) const;
    [[nodiscard]] float scanSpeed() const;

    EntityId entity_;
    CameraTuning tuning_;
    float sightDistance_;

    CameraMode mode_ = CameraMode::Scanning;
    CameraScan scan_;
    float baseYaw_ = 0.0f;
    float viewAngle_ = 0.0f;
    std::string baseModel_;
    std::string currentModel_;
    bool sustainSpoken_ = false;
    AlertnessState alertness_;
    AlertCap cap_ = kDefaultAlertCap;
    AlertnessTimings timings_;
};

}  // namespace dai::ai
