#pragma once

/// @file ai_debug_draw.hpp
/// @brief Debug line rendering of alert level, visibility and field of view.

#include "dai/ai/ai_tuning.hpp"
#include "dai/ai/ai_types.hpp"
#include "dai/ai/effect.hpp"
#include "dai/core/math_types.hpp"

namespace dai::ai {

namespace debug_colors {
inline constexpr Color kVisible{0.0f, 1.0f, 0.0f, 1.0f};
inline constexpr Color kHidden{0.5f, 0.5f, 0.5f, 1.0f};
inline constexpr Color kFovBlocked{1.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color kFovEdge{0.0f, 0.5f, 1.0f, 1.0f};
inline constexpr Color kChasePath{1.0f, 0.5f, 0.0f, 1.0f};
}  // namespace debug_colors

/// Placement of the alert bar and visibility indicator relative to the
/// entity origin.
struct AlertnessDebugConfig {
    Vector3 barOffset{0.5f, 0.0f, 0.0f};
    Vector3 visibilityOffset{-0.5f, 0.5f, 0.0f};
    float visibilityLineLength = 0.5f;

    [[nodiscard]] static constexpr AlertnessDebugConfig Turret() { return {}; }
    [[nodiscard]] static constexpr AlertnessDebugConfig Camera() { return {}; }
    [[nodiscard]] static constexpr AlertnessDebugConfig Monster() {
        return {{0.0f, 1.5f, 0.0f}, {-0.25f, 1.5f, 0.0f}, 0.5f};
    }
};

/// Lowest green, Low yellow, Moderate orange, High red.
[[nodiscard]] Color AlertLevelColor(AlertLevel level);

/// 0.25 per level, starting at 0.25 for Lowest.
[[nodiscard]] float AlertBarHeight(AlertLevel level);

/// Vertical alert bar plus a visibility indicator line.
[[nodiscard]] Effect DrawAlertnessDebug(const Vector3& position, AlertLevel level,
                                        bool visible, const AlertnessDebugConfig& config);

/// Forward line (green when the player is visible, red otherwise) and the
/// two FOV edge lines.
[[nodiscard]] Effect DrawFovDebug(const Vector3& position, float headingDegrees,
                                  bool visible, const FovProfile& fov);

}  // namespace dai::ai
