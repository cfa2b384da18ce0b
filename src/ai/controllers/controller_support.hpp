#pragma once

/// @file controller_support.hpp
/// @brief Spawn-time property resolution and logging shared by the
///        archetype controllers.

#include <string>
#include <string_view>

#include "dai/ai/alertness.hpp"
#include "dai/ai/effect.hpp"
#include "dai/ai/world_view.hpp"
#include "dai/foundation/game_logger.hpp"

namespace dai::ai::detail {

/// The entity's AlertCap, or the default cap when absent or malformed.
inline AlertCap ResolveCap(EntityId entity, const IWorldView& world) {
    const auto* cap = world.Property<AlertCap>(entity);
    if (cap == nullptr || !cap->IsValid()) {
        return kDefaultAlertCap;
    }
    return *cap;
}

/// Timings from the entity's AwareDelay, or uniform archetype defaults.
inline AlertnessTimings ResolveTimings(EntityId entity, const IWorldView& world,
                                       float escalateSeconds, float decaySeconds) {
    if (const auto* delay = world.Property<AwareDelay>(entity)) {
        return AlertnessTimings::FromAwareDelay(*delay);
    }
    return AlertnessTimings::Uniform(escalateSeconds, decaySeconds);
}

/// Positional sound selected by {"event", @p event} plus the entity's class tags.
inline Effect EventSound(EntityId entity, const Vector3& position, std::string_view event,
                         const IWorldView& world) {
    PlayPositionalSound sound;
    sound.entity = entity;
    sound.position = position;
    sound.tags.emplace_back("event", std::string(event));
    if (const auto* classTags = world.Property<ClassTags>(entity)) {
        sound.tags.insert(sound.tags.end(), classTags->tags.begin(), classTags->tags.end());
    }
    return sound;
}

inline void LogControllerEvent(EntityId entity, std::string_view controller,
                               std::string_view event) {
    auto& logger = foundation::GameLogger::instance();
    if (!logger.isEnabled(foundation::LogLevel::Debug, foundation::LogCategory::AI)) {
        return;
    }
    foundation::LogContext ctx;
    ctx.entityId = entity;
    std::string msg(controller);
    msg += ": ";
    msg += event;
    logger.logWithContext(foundation::LogLevel::Debug, foundation::LogCategory::AI, msg, ctx);
}

}  // namespace dai::ai::detail
