/// @file alertness.cpp
/// @brief Alertness engine implementation.

#include "dai/ai/alertness.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "dai/foundation/game_logger.hpp"

namespace dai::ai {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr float kMillisecondsPerSecond = 1000.0f;

float toSeconds(uint32_t milliseconds) {
    return static_cast<float>(milliseconds) / kMillisecondsPerSecond;
}

uint32_t toMilliseconds(float seconds) {
    if (std::isnan(seconds)) {
        return 0;
    }
    const float clamped = std::clamp(seconds, 0.0f, kMaxAlertnessSpanSeconds);
    return static_cast<uint32_t>(clamped * kMillisecondsPerSecond);
}

bool thresholdReached(float accumulated, float threshold) {
    return accumulated + kAlertTimeEpsilon >= threshold;
}

void logTransition(const AlertTransition& transition) {
    auto& logger = foundation::GameLogger::instance();
    if (!logger.isEnabled(foundation::LogLevel::Trace, foundation::LogCategory::Alertness)) {
        return;
    }
    std::string msg = transition.IsEscalation() ? "level raised " : "level lowered ";
    msg += alertLevelName(transition.from);
    msg += " -> ";
    msg += alertLevelName(transition.to);
    logger.log(foundation::LogLevel::Trace, foundation::LogCategory::Alertness, msg);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// AlertCap / AlertnessTimings
// ═══════════════════════════════════════════════════════════════════════════

GameResult<AlertCap> AlertCap::Create(AlertLevel maxLevel, AlertLevel minLevel,
                                      AlertLevel minRelax) {
    AlertCap cap{maxLevel, minLevel, minRelax};
    if (!cap.IsValid()) {
        std::string msg = "alert cap must satisfy min <= relax <= max (max=";
        msg += alertLevelName(maxLevel);
        msg += ", min=";
        msg += alertLevelName(minLevel);
        msg += ", relax=";
        msg += alertLevelName(minRelax);
        msg += ')';
        return GameResult<AlertCap>::err(GameError(ErrorCode::InvalidAlertCap, std::move(msg)));
    }
    return GameResult<AlertCap>::ok(cap);
}

AlertnessTimings AlertnessTimings::FromAwareDelay(const AwareDelay& delay) {
    AlertnessTimings timings;
    timings.toLow = toSeconds(delay.toTwo) * 0.5f;
    timings.toModerate = toSeconds(delay.toTwo) * 0.5f;
    timings.toHigh = toSeconds(delay.toThree);
    timings.fromHigh = toSeconds(delay.threeReuse);
    timings.fromModerate = toSeconds(delay.twoReuse);
    timings.fromLow = toSeconds(delay.ignoreRange);
    return timings;
}

AlertnessTimings AlertnessTimings::Uniform(float escalateSeconds, float decaySeconds) {
    AwareDelay delay;
    delay.toTwo = toMilliseconds(escalateSeconds);
    delay.toThree = delay.toTwo;
    delay.twoReuse = toMilliseconds(decaySeconds);
    delay.threeReuse = delay.twoReuse;
    delay.ignoreRange = delay.twoReuse;
    return FromAwareDelay(delay);
}

float AlertnessTimings::EscalationThreshold(AlertLevel level) const {
    switch (level) {
        case AlertLevel::Lowest:   return toLow;
        case AlertLevel::Low:      return toModerate;
        case AlertLevel::Moderate: return toHigh;
        case AlertLevel::High:     break;
    }
    return 0.0f;
}

float AlertnessTimings::DecayThreshold(AlertLevel level) const {
    switch (level) {
        case AlertLevel::High:     return fromHigh;
        case AlertLevel::Moderate: return fromModerate;
        case AlertLevel::Low:      return fromLow;
        case AlertLevel::Lowest:   break;
    }
    return 0.0f;
}

AlertnessTimings DefaultAlertnessTimings() {
    return AlertnessTimings::Uniform(2.0f, 4.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// AlertnessState
// ═══════════════════════════════════════════════════════════════════════════

AlertnessState::AlertnessState(AlertLevel initial)
    : current_(initial), peak_(initial) {}

std::optional<AlertTransition> AlertnessState::Update(bool visible, float deltaTime,
                                                      const AlertnessTimings& timings,
                                                      const AlertCap& cap) {
    const AlertLevel entry = current_;
    const float dt = std::max(deltaTime, 0.0f);
    timeSinceLevelChange_ += dt;

    if (lastVisible_.has_value() && *lastVisible_ != visible) {
        accumulator_ = 0.0f;
    }
    lastVisible_ = visible;

    // A cap tightened since the last tick pulls the level back in without
    // also taking a timed step.
    const AlertLevel clamped = ClampLevel(current_, cap);
    if (clamped != current_) {
        SetLevel(clamped, cap);
        AlertTransition transition{entry, current_};
        logTransition(transition);
        return transition;
    }

    const AlertLevel target = visible ? cap.maxLevel : cap.minLevel;

    if (current_ < target) {
        accumulator_ += dt;
        if (thresholdReached(accumulator_, timings.EscalationThreshold(current_))) {
            SetLevel(StepUp(current_), cap);
        }
    } else if (current_ > target) {
        accumulator_ += dt;
        if (thresholdReached(accumulator_, timings.DecayThreshold(current_))) {
            SetLevel(StepDown(current_), cap);
        }
    } else {
        accumulator_ = 0.0f;
    }

    if (current_ == entry) {
        return std::nullopt;
    }
    AlertTransition transition{entry, current_};
    logTransition(transition);
    return transition;
}

bool AlertnessState::SetLevel(AlertLevel level, const AlertCap& cap) {
    const AlertLevel clamped = ClampLevel(level, cap);
    if (clamped == current_) {
        return false;
    }

    if (clamped > current_) {
        peak_ = std::max(peak_, clamped);
    } else {
        peak_ = std::max(clamped, cap.minRelax);
    }
    current_ = clamped;
    accumulator_ = 0.0f;
    timeSinceLevelChange_ = 0.0f;
    return true;
}

Effect SyncAlertnessEffect(EntityId entity, const AlertnessState& state) {
    return SyncAlertness{entity, state.CurrentLevel(), state.PeakLevel()};
}

}  // namespace dai::ai
