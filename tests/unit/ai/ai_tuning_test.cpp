#include <gtest/gtest.h>

#include "dai/ai/ai_tuning.hpp"
#include "dai/ai/alertness.hpp"
#include "dai/foundation/config_manager.hpp"

using namespace dai::ai;
using dai::foundation::ConfigManager;

TEST(AITuningTest, EmptyConfigKeepsDefaults) {
    ConfigManager config;
    AITuning tuning = LoadAITuning(config);

    EXPECT_FLOAT_EQ(tuning.sightDistance, kMaxSightDistance);
    EXPECT_FLOAT_EQ(tuning.turret.openTime, kTurretOpenTime);
    EXPECT_FLOAT_EQ(tuning.turret.fireInterval, kTurretFireInterval);
    EXPECT_FLOAT_EQ(tuning.turret.fov.halfAngle, 60.0f);
    EXPECT_FLOAT_EQ(tuning.camera.fov.halfAngle, 45.0f);
    EXPECT_FLOAT_EQ(tuning.monster.walkSpeed, 2.0f);
    EXPECT_EQ(tuning.monster.movementBits, 1u);
    EXPECT_FLOAT_EQ(tuning.monster.escalateSeconds, 2.0f);
    EXPECT_FLOAT_EQ(tuning.camera.decaySeconds, 4.0f);
}

TEST(AITuningTest, YamlOverridesSelectedKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
ai:
  sight_distance: 30.0
  turret:
    open_time: 1.25
    fov:
      half_angle: 90.0
  camera:
    fov:
      half_angle: 20.0
    sustain_speech_delay: 3.0
  monster:
    walk_speed: 4.5
    movement_bits: 3
)"));

    AITuning tuning = LoadAITuning(config);

    EXPECT_FLOAT_EQ(tuning.sightDistance, 30.0f);
    EXPECT_FLOAT_EQ(tuning.turret.openTime, 1.25f);
    EXPECT_FLOAT_EQ(tuning.turret.fov.halfAngle, 90.0f);
    EXPECT_FLOAT_EQ(tuning.camera.fov.halfAngle, 20.0f);
    EXPECT_FLOAT_EQ(tuning.camera.sustainSpeechDelay, 3.0f);
    EXPECT_FLOAT_EQ(tuning.monster.walkSpeed, 4.5f);
    EXPECT_EQ(tuning.monster.movementBits, 3u);

    // Untouched keys stay at their defaults.
    EXPECT_FLOAT_EQ(tuning.turret.fireInterval, kTurretFireInterval);
    EXPECT_FLOAT_EQ(tuning.monster.turnRate, 180.0f);
}

TEST(AITuningTest, TypeMismatchKeepsDefault) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
ai:
  monster:
    walk_speed: fast
    turn_rate: 90.0
)"));

    AITuning tuning = LoadAITuning(config);
    EXPECT_FLOAT_EQ(tuning.monster.walkSpeed, 2.0f);
    EXPECT_FLOAT_EQ(tuning.monster.turnRate, 90.0f);
}

TEST(AITuningTest, NonPositiveOpenTimeFallsBack) {
    ConfigManager config;
    config.set("ai.turret.open_time", 0.0f);

    AITuning tuning = LoadAITuning(config);
    EXPECT_FLOAT_EQ(tuning.turret.openTime, kTurretOpenTime);
}

TEST(AITuningTest, RuntimeOverrideIsPickedUp) {
    ConfigManager config;
    config.set("ai.camera.min_scan_speed", 5.0f);

    EXPECT_FLOAT_EQ(LoadAITuning(config).camera.minScanSpeed, 5.0f);
}

TEST(AITuningTest, OutOfRangeAlertSpansFallBack) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
ai:
  turret:
    escalate_seconds: -1.0
    decay_seconds: 0.0
  camera:
    escalate_seconds: 5000000.0
    decay_seconds: 6.0
  monster:
    escalate_seconds: 0.5
    decay_seconds: -3.0
)"));

    AITuning tuning = LoadAITuning(config);
    EXPECT_FLOAT_EQ(tuning.turret.escalateSeconds, 2.0f);
    EXPECT_FLOAT_EQ(tuning.turret.decaySeconds, 4.0f);
    EXPECT_FLOAT_EQ(tuning.camera.escalateSeconds, 2.0f);
    EXPECT_FLOAT_EQ(tuning.camera.decaySeconds, 6.0f);
    EXPECT_FLOAT_EQ(tuning.monster.escalateSeconds, 0.5f);
    EXPECT_FLOAT_EQ(tuning.monster.decaySeconds, 4.0f);
}

TEST(AITuningTest, RejectedEscalateSpanStillLetsTheLevelRise) {
    ConfigManager config;
    config.set("ai.turret.escalate_seconds", -1.0f);

    AITuning tuning = LoadAITuning(config);
    auto timings = AlertnessTimings::Uniform(tuning.turret.escalateSeconds,
                                             tuning.turret.decaySeconds);
    AlertnessState state;
    for (int i = 0; i < 100; ++i) {
        state.Update(true, 0.1f, timings, kDefaultAlertCap);
    }
    EXPECT_EQ(state.CurrentLevel(), AlertLevel::High);
}
