#pragma once

/// @file ai_controller.hpp
/// @brief Per-entity AI controller interface and the per-tick inputs.

#include <string_view>

#include "dai/ai/ai_types.hpp"
#include "dai/ai/alertness.hpp"
#include "dai/ai/effect.hpp"
#include "dai/ai/physics_query.hpp"
#include "dai/ai/world_view.hpp"

namespace dai::ai {

/// Everything a controller may read during one tick.
struct AITickContext {
    const IWorldView& world;
    const IPhysicsQuery& physics;
    float now = 0.0f;        ///< Simulation time in seconds.
    float deltaTime = 0.0f;  ///< Seconds since the previous tick.
};

/// State machine driving one AI entity.
///
/// Each tick the controller senses the player, feeds its alertness, steps
/// its archetype state machine and returns the resulting effects. It never
/// blocks and never mutates the world directly.
class IAIController {
public:
    virtual ~IAIController() = default;

    /// Read spawn-time properties (orientation, cap, timings).
    /// @return Effects to apply at spawn (e.g. the initial alertness sync).
    virtual Effect Initialize(const IWorldView& world) = 0;

    /// Advance by one tick.
    virtual Effect Update(const AITickContext& context) = 0;

    [[nodiscard]] virtual EntityId GetEntity() const noexcept = 0;

    [[nodiscard]] virtual std::string_view GetName() const noexcept = 0;

    [[nodiscard]] virtual const AlertnessState& GetAlertness() const noexcept = 0;
};

}  // namespace dai::ai
