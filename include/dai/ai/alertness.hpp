#pragma once

/// @file alertness.hpp
/// @brief Alertness engine: time-based escalation and decay of an AI's
///        alert level, clamped by a per-entity cap.
///
/// While the player is visible the level climbs one step each time the
/// accumulated visible time crosses the threshold for the next level;
/// while hidden it falls back one step per decay threshold. The level
/// never moves more than one timed step per update and always stays inside
/// [cap.minLevel, cap.maxLevel]. A cap tightened between updates is the one
/// exception: the next update clamps straight into the new range.

#include <cstdint>
#include <optional>

#include "dai/ai/ai_types.hpp"
#include "dai/ai/effect.hpp"
#include "dai/foundation/game_result.hpp"

namespace dai::ai {

/// Per-entity bounds on the alert level.
///
/// Invariant: minLevel <= minRelax <= maxLevel. minRelax is the lowest
/// value the peak level relaxes to after the level drops.
struct AlertCap {
    AlertLevel maxLevel = AlertLevel::High;
    AlertLevel minLevel = AlertLevel::Lowest;
    AlertLevel minRelax = AlertLevel::Low;

    /// Build a cap, rejecting orderings that violate the invariant.
    [[nodiscard]] static foundation::GameResult<AlertCap> Create(AlertLevel maxLevel,
                                                                 AlertLevel minLevel,
                                                                 AlertLevel minRelax);

    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return minLevel <= minRelax && minRelax <= maxLevel;
    }

    constexpr auto operator<=>(const AlertCap&) const = default;
};

/// Cap used for entities that carry none.
inline constexpr AlertCap kDefaultAlertCap{};

/// Longest escalation or decay span accepted by AlertnessTimings::Uniform.
inline constexpr float kMaxAlertnessSpanSeconds = 3600.0f;

/// Raw awareness delay record as authored on archetypes (milliseconds).
struct AwareDelay {
    uint32_t toTwo = 0;        ///< Escalation time up to Moderate.
    uint32_t toThree = 0;      ///< Escalation time up to High.
    uint32_t twoReuse = 0;     ///< Decay time from Moderate.
    uint32_t threeReuse = 0;   ///< Decay time from High.
    uint32_t ignoreRange = 0;  ///< Decay time from Low back to rest.
};

/// Escalation and decay thresholds in seconds.
struct AlertnessTimings {
    float toLow = 1.0f;
    float toModerate = 1.0f;
    float toHigh = 2.0f;
    float fromHigh = 4.0f;
    float fromModerate = 4.0f;
    float fromLow = 4.0f;

    /// Convert an authored record. The escalation time up to Moderate is
    /// split evenly across the Lowest->Low and Low->Moderate steps.
    [[nodiscard]] static AlertnessTimings FromAwareDelay(const AwareDelay& delay);

    /// Uniform timings: @p escalateSeconds for each of the two escalation
    /// spans, @p decaySeconds for every decay step. Both are clamped to
    /// [0, kMaxAlertnessSpanSeconds]; a NaN span counts as zero.
    [[nodiscard]] static AlertnessTimings Uniform(float escalateSeconds, float decaySeconds);

    /// Seconds needed to leave @p level upward.
    [[nodiscard]] float EscalationThreshold(AlertLevel level) const;

    /// Seconds needed to leave @p level downward.
    [[nodiscard]] float DecayThreshold(AlertLevel level) const;
};

/// Timings used for entities that carry no AwareDelay (2 s up, 4 s down).
[[nodiscard]] AlertnessTimings DefaultAlertnessTimings();

/// Clamp @p level into [cap.minLevel, cap.maxLevel].
[[nodiscard]] constexpr AlertLevel ClampLevel(AlertLevel level, const AlertCap& cap) {
    if (level < cap.minLevel) {
        return cap.minLevel;
    }
    if (level > cap.maxLevel) {
        return cap.maxLevel;
    }
    return level;
}

/// A level change reported by AlertnessState::Update.
struct AlertTransition {
    AlertLevel from = AlertLevel::Lowest;
    AlertLevel to = AlertLevel::Lowest;

    [[nodiscard]] constexpr bool IsEscalation() const noexcept { return to > from; }

    constexpr auto operator<=>(const AlertTransition&) const = default;
};

/// Mutable alertness of one AI, owned by its controller.
class AlertnessState {
public:
    explicit AlertnessState(AlertLevel initial = AlertLevel::Lowest);

    /// Advance by @p deltaTime seconds with the current visibility.
    /// @return The transition when the clamped level differs from the level
    ///         at entry, std::nullopt otherwise.
    std::optional<AlertTransition> Update(bool visible, float deltaTime,
                                          const AlertnessTimings& timings,
                                          const AlertCap& cap);

    /// Force a level (clamped to @p cap) and update the peak.
    /// @return true if the level changed.
    bool SetLevel(AlertLevel level, const AlertCap& cap);

    [[nodiscard]] AlertLevel CurrentLevel() const noexcept { return current_; }
    [[nodiscard]] AlertLevel PeakLevel() const noexcept { return peak_; }
    [[nodiscard]] float Accumulator() const noexcept { return accumulator_; }
    [[nodiscard]] float TimeSinceLevelChange() const noexcept { return timeSinceLevelChange_; }
    [[nodiscard]] std::optional<bool> LastVisible() const noexcept { return lastVisible_; }

private:
    AlertLevel current_;
    AlertLevel peak_;
    float accumulator_ = 0.0f;
    float timeSinceLevelChange_ = 0.0f;
    std::optional<bool> lastVisible_;
};

/// Effect publishing @p state onto @p entity.
[[nodiscard]] Effect SyncAlertnessEffect(EntityId entity, const AlertnessState& state);

}  // namespace dai::ai
