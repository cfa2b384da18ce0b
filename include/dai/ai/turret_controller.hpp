#pragma once

/// @file turret_controller.hpp
/// @brief Turret AI: a cap that opens when the player is seen, tracks and
///        fires while open, and closes when the player is lost.
///
/// State machine:
///   Closed  --player visible-->  Opening{p}  --p >= 1-->  Open
///   Open    --player hidden-->   Closing{p}  --p >= 1-->  Closed
///
/// Progress advances by dt / openTime per tick. Every tick writes the cap
/// joint (kCapJoint) as translate_x(-capTravel * openAmount); while Open
/// the turret also aims (kAimJoint) and fires once per fireInterval.

#include <memory>
#include <string_view>
#include <variant>

#include "dai/ai/ai_controller.hpp"
#include "dai/ai/ai_tuning.hpp"
#include "dai/ai/steering.hpp"

namespace dai::ai {

struct TurretClosed {};
struct TurretOpening {
    float progress = 0.0f;
};
struct TurretOpen {};
struct TurretClosing {
    float progress = 0.0f;
};

using TurretState = std::variant<TurretClosed, TurretOpening, TurretOpen, TurretClosing>;

[[nodiscard]] TurretPhase PhaseOf(const TurretState& state);

/// 0 when Closed, progress while Opening, 1 - progress while Closing, 1 when Open.
[[nodiscard]] float OpenAmount(const TurretState& state);

class TurretController final : public IAIController {
public:
    /// @param steering Aim policy; defaults to chasing the player at
    ///        tuning.turnRate.
    explicit TurretController(EntityId entity, TurretTuning tuning = {},
                              float sightDistance = kMaxSightDistance,
                              std::unique_ptr<ISteeringStrategy> steering = nullptr);

    Effect Initialize(const IWorldView& world) override;
    Effect Update(const AITickContext& context) override;

    [[nodiscard]] EntityId GetEntity() const noexcept override { return entity_; }
    [[nodiscard]] std::string_view GetName() const noexcept override { return "TurretController"; }
    [[nodiscard]] const AlertnessState& GetAlertness() const noexcept override { return alertness_; }

    [[nodiscard]] const TurretState& GetState() const noexcept { return state_; }
    [[nodiscard]] TurretPhase GetPhase() const { return PhaseOf(state_); }
    [[nodiscard]] float GetInitialYaw() const noexcept { return initialYaw_; }
    [[nodiscard]] float GetHeading() const noexcept { return heading_; }
    [[nodiscard]] float GetNextFireTime() const noexcept { return nextFireTime_; }
    [[nodiscard]] const AlertCap& GetCap() const noexcept { return cap_; }
    [[nodiscard]] const AlertnessTimings& GetTimings() const noexcept { return timings_; }

private:
    Effect stepStateMachine(bool visible, float deltaTime, const Vector3& position,
                            const IWorldView& world);
    Effect aimAndFire(const AITickContext& context);

    EntityId entity_;
    TurretTuning tuning_;
    float sightDistance_;
    std::unique_ptr<ISteeringStrategy> steering_;

    TurretState state_ = TurretClosed{};
    float initialYaw_ = 0.0f;
    float heading_ = 0.0f;
    float nextFireTime_ = 0.0f;
    AlertnessState alertness_;
    AlertCap cap_ = kDefaultAlertCap;
    AlertnessTimings timings_;
};

}  // namespace dai::ai
