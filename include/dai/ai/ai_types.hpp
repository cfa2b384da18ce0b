#pragma once

/// @file ai_types.hpp
/// @brief Enumerations and design constants for the AI layer.

#include <cstdint>
#include <string_view>

#include "dai/foundation/types.hpp"

namespace dai::ai {

using foundation::EntityId;

/// Maximum distance a sight raycast travels (world units).
constexpr float kMaxSightDistance = 50.0f;

/// Seconds a turret takes to fully open or close its cap.
constexpr float kTurretOpenTime = 2.5f;

/// Distance the turret cap joint slides when fully open.
constexpr float kTurretCapTravel = 0.75f;

/// Seconds between turret shots while open.
constexpr float kTurretFireInterval = 1.0f;

/// Joint ids addressed by turret and camera effects.
constexpr uint32_t kAimJoint = 1;
constexpr uint32_t kCapJoint = 2;

/// Distance threshold for reaching a waypoint (world units, XZ).
constexpr float kMoveToArrivalDistance = 1.0f;

/// Tolerance used when comparing accumulated seconds against thresholds,
/// so that e.g. ten 0.1 s ticks reach a 1 s threshold.
constexpr float kAlertTimeEpsilon = 1e-4f;

/// Ordered alert level of an AI.
enum class AlertLevel : uint8_t {
    Lowest   = 0,
    Low      = 1,
    Moderate = 2,
    High     = 3
};

constexpr std::string_view alertLevelName(AlertLevel level) {
    switch (level) {
        case AlertLevel::Lowest:   return "Lowest";
        case AlertLevel::Low:      return "Low";
        case AlertLevel::Moderate: return "Moderate";
        case AlertLevel::High:     return "High";
    }
    return "Unknown";
}

/// One step up, saturating at High.
constexpr AlertLevel StepUp(AlertLevel level) {
    return level == AlertLevel::High
        ? AlertLevel::High
        : static_cast<AlertLevel>(static_cast<uint8_t>(level) + 1);
}

/// One step down, saturating at Lowest.
constexpr AlertLevel StepDown(AlertLevel level) {
    return level == AlertLevel::Lowest
        ? AlertLevel::Lowest
        : static_cast<AlertLevel>(static_cast<uint8_t>(level) - 1);
}

/// Turret cap animation state tag (payload lives in TurretState).
enum class TurretPhase : uint8_t {
    Closed,
    Opening,
    Open,
    Closing
};

/// High-level camera mode, derived every tick.
enum class CameraMode : uint8_t {
    Scanning,  ///< Sweeping between scan angles.
    Tracking,  ///< Following the visible player.
    Alarmed    ///< At High alert; alarm raised.
};

/// High-level monster behaviour selected from the alert level.
enum class MonsterBehavior : uint8_t {
    Idle,       ///< Lowest: stand still.
    Searching,  ///< Low: turn toward the last sighting.
    Chasing,    ///< Moderate: follow a waypoint path to the player.
    Attacking   ///< High: face the player and fire.
};

constexpr std::string_view monsterBehaviorName(MonsterBehavior behavior) {
    switch (behavior) {
        case MonsterBehavior::Idle:      return "Idle";
        case MonsterBehavior::Searching: return "Searching";
        case MonsterBehavior::Chasing:   return "Chasing";
        case MonsterBehavior::Attacking: return "Attacking";
    }
    return "Unknown";
}

}  // namespace dai::ai
