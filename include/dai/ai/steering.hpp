#pragma once

/// @file steering.hpp
/// @brief Steering strategies producing a desired heading for an AI.

#include <optional>
#include <utility>

#include "dai/ai/ai_controller.hpp"
#include "dai/ai/effect.hpp"

namespace dai::ai {

/// Result of one steering step.
struct SteeringOutput {
    float desiredHeading = 0.0f;  ///< Absolute heading after this tick's turn.
    float turnDelta = 0.0f;       ///< Signed degrees turned this tick.
};

/// Pluggable heading policy used by turrets and monsters.
class ISteeringStrategy {
public:
    virtual ~ISteeringStrategy() = default;

    /// Steer @p entity from @p currentHeading.
    /// @return The new heading and any effect the strategy wants applied,
    ///         or std::nullopt when there is nothing to steer toward.
    [[nodiscard]] virtual std::optional<std::pair<SteeringOutput, Effect>> Steer(
        float currentHeading, const AITickContext& context, EntityId entity) const = 0;
};

/// Turns toward the player, at most turnRate * dt degrees per tick.
class ChasePlayerSteeringStrategy final : public ISteeringStrategy {
public:
    explicit ChasePlayerSteeringStrategy(float turnRateDegreesPerSecond = 90.0f)
        : turnRate_(turnRateDegreesPerSecond) {}

    [[nodiscard]] std::optional<std::pair<SteeringOutput, Effect>> Steer(
        float currentHeading, const AITickContext& context, EntityId entity) const override;

    [[nodiscard]] float GetTurnRate() const noexcept { return turnRate_; }

private:
    float turnRate_;
};

}  // namespace dai::ai
