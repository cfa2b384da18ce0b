#pragma once

/// @file ai_tuning.hpp
/// @brief Archetype tuning constants and their YAML overrides.
///
/// Every controller takes its tuning by value at construction. Defaults
/// reproduce the shipped game's feel; LoadAITuning() overlays the "ai.*"
/// keys of a ConfigManager, e.g.
///
/// @code
///   ai:
///     sight_distance: 50.0
///     turret:
///       open_time: 2.5
///       fire_interval: 1.0
///       turn_rate: 90.0
///       fov:
///         half_angle: 60.0
///     monster:
///       walk_speed: 2.0
///       movement_bits: 1
/// @endcode

#include <cstdint>

#include "dai/ai/ai_types.hpp"
#include "dai/foundation/config_manager.hpp"

namespace dai::ai {

/// Field of view and its debug rendering for one archetype.
struct FovProfile {
    float halfAngle = 45.0f;    ///< Degrees either side of the heading.
    float eyeHeight = 0.0f;     ///< Raycast origin above the entity origin.
    float debugHeight = 0.5f;   ///< Height of the drawn FOV cone.
    float debugLength = 5.0f;   ///< Length of the drawn FOV lines.
};

struct TurretTuning {
    float openTime = kTurretOpenTime;
    float capTravel = kTurretCapTravel;
    float fireInterval = kTurretFireInterval;
    float turnRate = 90.0f;  ///< Degrees per second.
    FovProfile fov{60.0f, 0.0f, 0.3f, 8.0f};
    float escalateSeconds = 2.0f;
    float decaySeconds = 4.0f;
};

struct CameraTuning {
    FovProfile fov{45.0f, 0.0f, 0.5f, 5.0f};
    float minScanSpeed = 1.0f;           ///< Degrees per second floor for the sweep.
    float sustainSpeechDelay = 1.5f;     ///< Seconds at a level before "atlevel*" speech.
    float escalateSeconds = 2.0f;
    float decaySeconds = 4.0f;
};

struct MonsterTuning {
    FovProfile fov{75.0f, 1.2f, 1.2f, 6.0f};
    float walkSpeed = 2.0f;        ///< Units per second while chasing.
    float turnRate = 180.0f;       ///< Degrees per second.
    float fireInterval = 1.5f;     ///< Seconds between ranged attacks.
    float replanDistance = 2.0f;   ///< Goal drift that triggers a new path.
    float arrivalDistance = kMoveToArrivalDistance;
    uint32_t movementBits = 0x01;  ///< Used when the entity has no capability record.
    float escalateSeconds = 2.0f;
    float decaySeconds = 4.0f;
};

struct AITuning {
    float sightDistance = kMaxSightDistance;
    TurretTuning turret;
    CameraTuning camera;
    MonsterTuning monster;
};

/// Overlay the "ai.*" keys of @p config onto the defaults. Missing keys
/// keep their defaults; keys of the wrong type are logged and ignored.
[[nodiscard]] AITuning LoadAITuning(const foundation::ConfigManager& config);

}  // namespace dai::ai
