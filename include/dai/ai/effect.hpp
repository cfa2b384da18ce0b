#pragma once

/// @file effect.hpp
/// @brief Effect: the tagged union of side effects the core asks the host
///        to apply after a tick.
///
/// Controllers never mutate the world. Every tick they return an Effect
/// tree (a variant with a Multiple node for composition) which the host
/// walks in order once all controllers have been stepped. Keeping effects
/// as plain values makes controller output deterministic and directly
/// assertable in tests.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "dai/ai/ai_types.hpp"
#include "dai/core/math_types.hpp"

namespace dai::ai {

class Effect;

// ── Effect variants ─────────────────────────────────────────────────────────

/// Explicit "nothing to do".
struct NoEffect {};

/// Ordered composition of child effects.
struct MultipleEffects {
    std::vector<Effect> effects;
};

/// Set the local transform of a numbered joint on an entity's model.
struct SetJointTransform {
    EntityId entity;
    uint32_t jointId = 0;
    Matrix4 transform;
};

/// Fire the entity's linked ranged weapon with a rotation relative to the
/// entity's spawn orientation.
struct FireRangedWeapon {
    EntityId entity;
    Quaternion rotation;
};

/// Key/value tags selecting a sound schema (e.g. {"event", "activate"}).
using SoundTags = std::vector<std::pair<std::string, std::string>>;

/// Play a schema-selected sound at a world position.
struct PlayPositionalSound {
    EntityId entity;
    Vector3 position;
    SoundTags tags;

    /// Value of the first tag named @p key, if present.
    [[nodiscard]] std::optional<std::string_view> Tag(std::string_view key) const {
        for (const auto& [k, v] : tags) {
            if (k == key) {
                return std::string_view(v);
            }
        }
        return std::nullopt;
    }
};

/// Publish an entity's alert level (and peak) back onto its properties.
struct SyncAlertness {
    EntityId entity;
    AlertLevel level = AlertLevel::Lowest;
    AlertLevel peak = AlertLevel::Lowest;
};

struct DebugLine {
    Vector3 from;
    Vector3 to;
    Color color;
};

/// Draw a batch of debug line segments for one frame.
struct DrawDebugLines {
    std::vector<DebugLine> lines;
};

/// Set an entity's world orientation.
struct SetRotation {
    EntityId entity;
    Quaternion rotation;
};

/// Set an entity's linear velocity (world units / second).
struct SetVelocity {
    EntityId entity;
    Vector3 velocity;
};

/// Deliver a named script message. An invalid recipient broadcasts.
struct SendMessage {
    EntityId sender;
    EntityId recipient;
    std::string message;
};

/// Swap the model an entity renders with.
struct ChangeModel {
    EntityId entity;
    std::string modelName;
};

/// Play a voice line selected by concept name (e.g. "tolevelthree").
struct PlaySpeech {
    EntityId entity;
    std::string conceptName;
};

// ── Effect ──────────────────────────────────────────────────────────────────

/// A single side-effect request or an ordered tree of them.
///
/// Example:
/// @code
///   std::vector<Effect> out;
///   out.push_back(SetJointTransform{entity, kCapJoint, Matrix4::TranslateX(-0.3f)});
///   out.push_back(Effect::None());
///   Effect tick = Effect::Combine(std::move(out));  // single SetJointTransform
/// @endcode
class Effect {
public:
    using Variant = std::variant<NoEffect,
                                 MultipleEffects,
                                 SetJointTransform,
                                 FireRangedWeapon,
                                 PlayPositionalSound,
                                 SyncAlertness,
                                 DrawDebugLines,
                                 SetRotation,
                                 SetVelocity,
                                 SendMessage,
                                 ChangeModel,
                                 PlaySpeech>;

    Effect() = default;

    /// Implicit construction from any variant alternative.
    template <typename T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, Effect> &&
                                          std::is_constructible_v<Variant, T&&>>>
    Effect(T&& value) : value_(std::forward<T>(value)) {}  // NOLINT(google-explicit-constructor)

    [[nodiscard]] static Effect None() { return {}; }

    /// Compose effects in order. NoEffect entries are dropped; an empty
    /// result is NoEffect and a single survivor is returned unwrapped.
    [[nodiscard]] static Effect Combine(std::vector<Effect> effects);

    [[nodiscard]] bool IsNone() const noexcept {
        return std::holds_alternative<NoEffect>(value_);
    }

    template <typename T>
    [[nodiscard]] bool Is() const noexcept {
        return std::holds_alternative<T>(value_);
    }

    /// The payload if this node holds a T, else nullptr.
    template <typename T>
    [[nodiscard]] const T* As() const noexcept {
        return std::get_if<T>(&value_);
    }

    [[nodiscard]] const Variant& Value() const noexcept { return value_; }

    /// Leaf effects in emission order (Multiple nodes expanded, NoEffect
    /// skipped).
    [[nodiscard]] std::vector<Effect> Flatten() const;

    /// Copies of every leaf payload of type T, in emission order.
    template <typename T>
    [[nodiscard]] std::vector<T> Collect() const {
        std::vector<T> out;
        collectInto(out);
        return out;
    }

    /// Number of leaf effects.
    [[nodiscard]] std::size_t LeafCount() const;

private:
    template <typename T>
    void collectInto(std::vector<T>& out) const {
        if (const auto* multiple = std::get_if<MultipleEffects>(&value_)) {
            for (const auto& child : multiple->effects) {
                child.collectInto(out);
            }
        } else if (const auto* leaf = std::get_if<T>(&value_)) {
            out.push_back(*leaf);
        }
    }

    void flattenInto(std::vector<Effect>& out) const;

    Variant value_;
};

}  // namespace dai::ai
