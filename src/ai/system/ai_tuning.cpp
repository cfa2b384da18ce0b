/// @file ai_tuning.cpp
/// @brief Mapping of "ai.*" configuration keys onto AITuning.

#include "dai/ai/ai_tuning.hpp"

#include <cmath>
#include <string>
#include <string_view>

#include "dai/ai/alertness.hpp"
#include "dai/foundation/game_logger.hpp"

namespace dai::ai {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

template <typename T>
void overlay(const ConfigManager& config, std::string_view key, T& target) {
    auto value = config.get<T>(key);
    if (value.hasValue()) {
        target = value.value();
        return;
    }
    if (value.error().code() == ErrorCode::ConfigTypeMismatch) {
        DAI_LOG_WARN(LogCategory::Config,
                     value.error().describe() + "; keeping default");
    }
}

void overlayFov(const ConfigManager& config, const std::string& prefix, FovProfile& fov) {
    overlay(config, prefix + ".fov.half_angle", fov.halfAngle);
    overlay(config, prefix + ".fov.eye_height", fov.eyeHeight);
    overlay(config, prefix + ".fov.debug_height", fov.debugHeight);
    overlay(config, prefix + ".fov.debug_length", fov.debugLength);
}

/// Reset an escalation or decay span that is not a positive duration no
/// longer than kMaxAlertnessSpanSeconds.
void validateSpan(std::string_view key, float& seconds, float fallback) {
    if (std::isfinite(seconds) && seconds > 0.0f && seconds <= kMaxAlertnessSpanSeconds) {
        return;
    }
    DAI_LOG_WARN(LogCategory::Config,
                 std::string(key) + " must be in (0, " +
                     std::to_string(static_cast<int>(kMaxAlertnessSpanSeconds)) +
                     "] seconds; using default");
    seconds = fallback;
}

}  // namespace

AITuning LoadAITuning(const ConfigManager& config) {
    AITuning tuning;

    overlay(config, "ai.sight_distance", tuning.sightDistance);

    auto& turret = tuning.turret;
    overlay(config, "ai.turret.open_time", turret.openTime);
    overlay(config, "ai.turret.cap_travel", turret.capTravel);
    overlay(config, "ai.turret.fire_interval", turret.fireInterval);
    overlay(config, "ai.turret.turn_rate", turret.turnRate);
    overlay(config, "ai.turret.escalate_seconds", turret.escalateSeconds);
    overlay(config, "ai.turret.decay_seconds", turret.decaySeconds);
    overlayFov(config, "ai.turret", turret.fov);

    auto& camera = tuning.camera;
    overlay(config, "ai.camera.min_scan_speed", camera.minScanSpeed);
    overlay(config, "ai.camera.sustain_speech_delay", camera.sustainSpeechDelay);
    overlay(config, "ai.camera.escalate_seconds", camera.escalateSeconds);
    overlay(config, "ai.camera.decay_seconds", camera.decaySeconds);
    overlayFov(config, "ai.camera", camera.fov);

    auto& monster = tuning.monster;
    overlay(config, "ai.monster.walk_speed", monster.walkSpeed);
    overlay(config, "ai.monster.turn_rate", monster.turnRate);
    overlay(config, "ai.monster.fire_interval", monster.fireInterval);
    overlay(config, "ai.monster.replan_distance", monster.replanDistance);
    overlay(config, "ai.monster.arrival_distance", monster.arrivalDistance);
    overlay(config, "ai.monster.movement_bits", monster.movementBits);
    overlay(config, "ai.monster.escalate_seconds", monster.escalateSeconds);
    overlay(config, "ai.monster.decay_seconds", monster.decaySeconds);
    overlayFov(config, "ai.monster", monster.fov);

    const AITuning defaults;
    validateSpan("ai.turret.escalate_seconds", turret.escalateSeconds,
                 defaults.turret.escalateSeconds);
    validateSpan("ai.turret.decay_seconds", turret.decaySeconds, defaults.turret.decaySeconds);
    validateSpan("ai.camera.escalate_seconds", camera.escalateSeconds,
                 defaults.camera.escalateSeconds);
    validateSpan("ai.camera.decay_seconds", camera.decaySeconds, defaults.camera.decaySeconds);
    validateSpan("ai.monster.escalate_seconds", monster.escalateSeconds,
                 defaults.monster.escalateSeconds);
    validateSpan("ai.monster.decay_seconds", monster.decaySeconds,
                 defaults.monster.decaySeconds);

    if (!std::isfinite(turret.openTime) || turret.openTime <= 0.0f) {
        DAI_LOG_WARN(LogCategory::Config, "ai.turret.open_time must be positive; using default");
        turret.openTime = kTurretOpenTime;
    }

    return tuning;
}

}  // namespace dai::ai
