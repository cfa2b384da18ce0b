/// @file steering.cpp
/// @brief ChasePlayerSteeringStrategy implementation.

#include "dai/ai/steering.hpp"

#include "dai/ai/ai_sensing.hpp"

namespace dai::ai {

std::optional<std::pair<SteeringOutput, Effect>> ChasePlayerSteeringStrategy::Steer(
    float currentHeading, const AITickContext& context, EntityId entity) const {
    const auto pose = context.world.PositionOf(entity);
    const auto player = context.world.PlayerPosition();
    if (!pose || !player) {
        return std::nullopt;
    }

    const float targetHeading = YawBetween(pose->position, *player);
    SteeringOutput output;
    output.desiredHeading =
        StepTowardsHeading(currentHeading, targetHeading, turnRate_ * context.deltaTime);
    output.turnDelta = NormalizeDegrees(output.desiredHeading - currentHeading);
    return std::make_pair(output, Effect::None());
}

}  // namespace dai::ai
