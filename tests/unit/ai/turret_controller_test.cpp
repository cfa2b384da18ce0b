#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "dai/ai/turret_controller.hpp"
#include "support/test_world.hpp"

using namespace dai::ai;
using dai::Quaternion;
using dai::Vector3;
using dai::test::FakePhysics;

namespace {

const EntityId kPlayer{1};
const EntityId kTurret{10};
constexpr float kDt = 0.1f;

class TurretControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        world_.SetPlayer(kPlayer, Vector3{0.0f, 0.0f, 10.0f});
        world_.SetPose(kTurret, Vector3{0.0f, 0.0f, 0.0f});
    }

    Effect tick(bool visible) {
        physics_.SetLineOfSight(visible);
        AITickContext context{world_, physics_, now_, kDt};
        now_ += kDt;
        return turret_.Update(context);
    }

    /// Tick with the player visible until the cap is fully open.
    void openFully() {
        for (int i = 0; i < 100 && turret_.GetPhase() != TurretPhase::Open; ++i) {
            (void)tick(true);
        }
        ASSERT_EQ(turret_.GetPhase(), TurretPhase::Open);
    }

    static float capOffset(const Effect& effect) {
        for (const auto& joint : effect.Collect<SetJointTransform>()) {
            if (joint.jointId == kCapJoint) {
                return joint.transform.Translation().x;
            }
        }
        ADD_FAILURE() << "no cap joint transform";
        return 0.0f;
    }

    static std::vector<std::string> soundEvents(const Effect& effect) {
        std::vector<std::string> events;
        for (const auto& sound : effect.Collect<PlayPositionalSound>()) {
            events.emplace_back(sound.Tag("event").value_or(""));
        }
        return events;
    }

    SnapshotWorldView world_;
    FakePhysics physics_{world_};
    TurretController turret_{kTurret};
    float now_ = 0.0f;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Spawn
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurretControllerTest, InitializeReadsYawAndCap) {
    world_.SetPose(kTurret, Vector3{0.0f, 0.0f, 0.0f}, Quaternion::FromAngleY(90.0f));
    world_.SetProperty(kTurret, AlertCap{AlertLevel::High, AlertLevel::Low, AlertLevel::Low});

    Effect spawn = turret_.Initialize(world_);
    const auto* sync = spawn.As<SyncAlertness>();
    ASSERT_NE(sync, nullptr);
    EXPECT_EQ(sync->entity, kTurret);
    EXPECT_EQ(sync->level, AlertLevel::Low);

    EXPECT_NEAR(turret_.GetInitialYaw(), 90.0f, 1e-3f);
    EXPECT_NEAR(turret_.GetHeading(), 90.0f, 1e-3f);
    EXPECT_EQ(turret_.GetAlertness().CurrentLevel(), AlertLevel::Low);
    EXPECT_EQ(turret_.GetPhase(), TurretPhase::Closed);
}

TEST_F(TurretControllerTest, MalformedCapFallsBackToDefault) {
    world_.SetProperty(kTurret, AlertCap{AlertLevel::Low, AlertLevel::High, AlertLevel::Low});
    (void)turret_.Initialize(world_);
    EXPECT_EQ(turret_.GetCap(), kDefaultAlertCap);
}

TEST_F(TurretControllerTest, AwareDelayOverridesTimings) {
    AwareDelay delay;
    delay.toTwo = 1000;
    delay.toThree = 500;
    world_.SetProperty(kTurret, delay);
    (void)turret_.Initialize(world_);
    EXPECT_FLOAT_EQ(turret_.GetTimings().toLow, 0.5f);
    EXPECT_FLOAT_EQ(turret_.GetTimings().toHigh, 0.5f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Cap state machine
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurretControllerTest, FirstSightingStartsOpening) {
    (void)turret_.Initialize(world_);

    Effect effect = tick(true);

    const auto* opening = std::get_if<TurretOpening>(&turret_.GetState());
    ASSERT_NE(opening, nullptr);
    EXPECT_NEAR(opening->progress, 0.04f, 1e-5f);
    EXPECT_NEAR(capOffset(effect), -0.75f * 0.04f, 1e-5f);
    EXPECT_EQ(soundEvents(effect), (std::vector<std::string>{"activate"}));
    EXPECT_TRUE(effect.Collect<FireRangedWeapon>().empty());
}

TEST_F(TurretControllerTest, HiddenPlayerKeepsTurretClosed) {
    (void)turret_.Initialize(world_);

    Effect effect = tick(false);
    EXPECT_EQ(turret_.GetPhase(), TurretPhase::Closed);
    EXPECT_NEAR(capOffset(effect), 0.0f, 1e-6f);
    EXPECT_TRUE(soundEvents(effect).empty());
}

TEST_F(TurretControllerTest, OpensAfterOpenTimeThenClosesWhenHidden) {
    (void)turret_.Initialize(world_);

    int ticks = 0;
    while (turret_.GetPhase() != TurretPhase::Open && ticks < 100) {
        (void)tick(true);
        ++ticks;
    }
    EXPECT_EQ(ticks, 25);
    ASSERT_EQ(turret_.GetPhase(), TurretPhase::Open);

    Effect hidden = tick(false);
    const auto* closing = std::get_if<TurretClosing>(&turret_.GetState());
    ASSERT_NE(closing, nullptr);
    EXPECT_NEAR(closing->progress, 0.04f, 1e-5f);
    EXPECT_NEAR(capOffset(hidden), -0.75f * 0.96f, 1e-4f);
    EXPECT_EQ(soundEvents(hidden), (std::vector<std::string>{"deactivate"}));
}

TEST_F(TurretControllerTest, ClosingRunsToClosed) {
    (void)turret_.Initialize(world_);
    openFully();

    int ticks = 0;
    while (turret_.GetPhase() != TurretPhase::Closed && ticks < 100) {
        (void)tick(false);
        ++ticks;
    }
    EXPECT_EQ(ticks, 25);
    EXPECT_NEAR(OpenAmount(turret_.GetState()), 0.0f, 1e-6f);
}

TEST_F(TurretControllerTest, SoundCarriesClassTags) {
    world_.SetProperty(kTurret, ClassTags{{{"class", "laserturret"}}});
    (void)turret_.Initialize(world_);

    Effect effect = tick(true);
    auto sounds = effect.Collect<PlayPositionalSound>();
    ASSERT_EQ(sounds.size(), 1u);
    EXPECT_EQ(sounds[0].Tag("class").value_or(""), "laserturret");
    EXPECT_EQ(sounds[0].tags.front().first, "event");
}

TEST(TurretStateTest, OpenAmountPerPhase) {
    EXPECT_FLOAT_EQ(OpenAmount(TurretClosed{}), 0.0f);
    EXPECT_FLOAT_EQ(OpenAmount(TurretOpening{0.3f}), 0.3f);
    EXPECT_FLOAT_EQ(OpenAmount(TurretOpen{}), 1.0f);
    EXPECT_FLOAT_EQ(OpenAmount(TurretClosing{0.3f}), 0.7f);
    EXPECT_EQ(PhaseOf(TurretClosing{}), TurretPhase::Closing);
}

// ═══════════════════════════════════════════════════════════════════════════
// Aim and fire
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TurretControllerTest, FiresAtMostOncePerInterval) {
    (void)turret_.Initialize(world_);
    openFully();

    std::vector<float> fireTimes;
    for (int i = 0; i < 40; ++i) {
        const float firedAt = now_;
        Effect effect = tick(true);
        if (!effect.Collect<FireRangedWeapon>().empty()) {
            fireTimes.push_back(firedAt);
        }
    }

    ASSERT_GE(fireTimes.size(), 3u);
    for (std::size_t i = 1; i < fireTimes.size(); ++i) {
        EXPECT_GE(fireTimes[i] - fireTimes[i - 1], kTurretFireInterval - 1e-3f);
    }
}

TEST_F(TurretControllerTest, AimsTowardPlayerWhileOpen) {
    world_.SetPlayer(kPlayer, Vector3{5.0f, 0.0f, 5.0f});
    (void)turret_.Initialize(world_);
    openFully();

    for (int i = 0; i < 20; ++i) {
        (void)tick(true);
    }
    EXPECT_NEAR(turret_.GetHeading(), 45.0f, 1e-2f);

    Effect effect = tick(true);
    bool sawAim = false;
    for (const auto& joint : effect.Collect<SetJointTransform>()) {
        sawAim = sawAim || joint.jointId == kAimJoint;
    }
    EXPECT_TRUE(sawAim);
}

TEST_F(TurretControllerTest, NoPoseProducesNothing) {
    (void)turret_.Initialize(world_);
    world_.RemoveEntity(kTurret);
    EXPECT_TRUE(tick(true).IsNone());
}

TEST_F(TurretControllerTest, DebugDrawsWhenEnabled) {
    (void)turret_.Initialize(world_);
    EXPECT_TRUE(tick(true).Collect<DrawDebugLines>().empty());

    world_.SetDebugAIEnabled(true);
    auto draws = tick(true).Collect<DrawDebugLines>();
    ASSERT_EQ(draws.size(), 2u);
    EXPECT_EQ(draws[0].lines.size(), 2u);
    EXPECT_EQ(draws[1].lines.size(), 3u);
}

TEST_F(TurretControllerTest, AlertnessSyncedOnEscalation) {
    (void)turret_.Initialize(world_);

    bool synced = false;
    for (int i = 0; i < 10; ++i) {
        Effect effect = tick(true);
        for (const auto& sync : effect.Collect<SyncAlertness>()) {
            EXPECT_EQ(sync.level, AlertLevel::Low);
            synced = true;
        }
    }
    EXPECT_TRUE(synced);
    EXPECT_EQ(turret_.GetAlertness().CurrentLevel(), AlertLevel::Low);
}
