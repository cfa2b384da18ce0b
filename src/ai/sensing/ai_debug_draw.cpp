/// @file ai_debug_draw.cpp
/// @brief Debug line effects for AI state.

#include "dai/ai/ai_debug_draw.hpp"

#include "dai/ai/ai_sensing.hpp"

namespace dai::ai {

Color AlertLevelColor(AlertLevel level) {
    switch (level) {
        case AlertLevel::Lowest:   return {0.0f, 0.5f, 0.0f, 1.0f};
        case AlertLevel::Low:      return {0.5f, 0.5f, 0.0f, 1.0f};
        case AlertLevel::Moderate: return {1.0f, 0.5f, 0.0f, 1.0f};
        case AlertLevel::High:     return {1.0f, 0.0f, 0.0f, 1.0f};
    }
    return {1.0f, 1.0f, 1.0f, 1.0f};
}

float AlertBarHeight(AlertLevel level) {
    return 0.25f * static_cast<float>(static_cast<uint8_t>(level) + 1);
}

Effect DrawAlertnessDebug(const Vector3& position, AlertLevel level, bool visible,
                          const AlertnessDebugConfig& config) {
    const Vector3 barBase = position + config.barOffset;
    const Vector3 visibilityBase = position + config.visibilityOffset;

    DrawDebugLines draw;
    draw.lines.push_back({barBase,
                          barBase + Vector3{0.0f, AlertBarHeight(level), 0.0f},
                          AlertLevelColor(level)});
    draw.lines.push_back({visibilityBase,
                          visibilityBase + Vector3{0.0f, config.visibilityLineLength, 0.0f},
                          visible ? debug_colors::kVisible : debug_colors::kHidden});
    return draw;
}

Effect DrawFovDebug(const Vector3& position, float headingDegrees, bool visible,
                    const FovProfile& fov) {
    const Vector3 origin = position + Vector3{0.0f, fov.debugHeight, 0.0f};

    DrawDebugLines draw;
    draw.lines.push_back({origin,
                          origin + ForwardFromYaw(headingDegrees) * fov.debugLength,
                          visible ? debug_colors::kVisible : debug_colors::kFovBlocked});
    draw.lines.push_back({origin,
                          origin + ForwardFromYaw(headingDegrees - fov.halfAngle) * fov.debugLength,
                          debug_colors::kFovEdge});
    draw.lines.push_back({origin,
                          origin + ForwardFromYaw(headingDegrees + fov.halfAngle) * fov.debugLength,
                          debug_colors::kFovEdge});
    return draw;
}

}  // namespace dai::ai
