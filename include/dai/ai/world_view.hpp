#pragma once

/// @file world_view.hpp
/// @brief Read-only window onto the host's entity store, plus the property
///        records the AI core reads through it.
///
/// Controllers see the world only through IWorldView: poses, the player
/// entity, the debug toggle and a handful of typed property records.
/// Property lookup is keyed by record type, mirroring how the host stores
/// one component per type per entity.

#include <any>
#include <cstdint>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

#include "dai/ai/ai_types.hpp"
#include "dai/ai/effect.hpp"
#include "dai/core/math_types.hpp"

namespace dai::ai {

/// Position and orientation of an entity.
struct Pose {
    Vector3 position;
    Quaternion rotation;
};

// ── Property records ────────────────────────────────────────────────────────
// AlertCap and AwareDelay (alertness.hpp) are looked up the same way.

/// Archetype class tags appended to every sound schema request.
struct ClassTags {
    SoundTags tags;
};

/// Security camera sweep configuration.
struct CameraScan {
    float scanAngle1 = -45.0f;  ///< Sweep limit relative to spawn yaw (degrees).
    float scanAngle2 = 45.0f;
    float scanSpeed = 0.05f;    ///< Authored units; degrees per millisecond.
};

/// Name of the model an entity currently renders with.
struct ModelName {
    std::string name;
};

/// Voice an entity speaks with; absent means the entity is silent.
struct SpeechVoice {
    int32_t voiceIndex = 0;
};

/// Entities notified when a camera raises the alarm.
struct AlarmTargets {
    std::vector<EntityId> targets;
};

/// Movement bits the entity may traverse links with.
struct MovementCapability {
    uint32_t bits = 0;
};

/// Marks an entity as carrying a ranged weapon.
struct RangedWeaponLink {
    EntityId weapon;
};

// ── IWorldView ──────────────────────────────────────────────────────────────

/// Narrow read-only interface the core requires from the host.
///
/// A single world view must present a consistent snapshot for the whole
/// tick; effects produced during the tick are applied by the host later.
class IWorldView {
public:
    virtual ~IWorldView() = default;

    /// Pose of @p entity, or std::nullopt if it has none.
    [[nodiscard]] virtual std::optional<Pose> PositionOf(EntityId entity) const = 0;

    [[nodiscard]] virtual EntityId PlayerEntity() const = 0;

    /// Global debug-draw toggle for AI.
    [[nodiscard]] virtual bool DebugAIEnabled() const = 0;

    /// Typed property lookup.
    /// @return The record, or nullptr if @p entity carries no T.
    template <typename T>
    [[nodiscard]] const T* Property(EntityId entity) const {
        const std::any* value = FindProperty(entity, std::type_index(typeid(T)));
        return value ? std::any_cast<T>(value) : nullptr;
    }

    /// Position of the player, if it has one.
    ///
    /// Hosts publish the player's chest as its pose position. Visibility
    /// rays aim at this point and the core applies no further offset.
    [[nodiscard]] std::optional<Vector3> PlayerPosition() const {
        auto pose = PositionOf(PlayerEntity());
        if (!pose) {
            return std::nullopt;
        }
        return pose->position;
    }

protected:
    /// Type-erased property storage lookup backing Property<T>().
    [[nodiscard]] virtual const std::any* FindProperty(EntityId entity,
                                                       std::type_index type) const = 0;
};

// ── SnapshotWorldView ───────────────────────────────────────────────────────

/// In-memory world view. Hosts copy the handful of records the core reads
/// into it once per tick; tests build scenes with it directly.
///
/// Example:
/// @code
///   SnapshotWorldView world;
///   world.SetPlayer(EntityId(1), {5.0f, 0.0f, 0.0f});
///   world.SetPose(EntityId(7), {0.0f, 0.0f, 0.0f});
///   world.SetProperty(EntityId(7), AlertCap{});
/// @endcode
class SnapshotWorldView final : public IWorldView {
public:
    SnapshotWorldView() = default;

    void SetPose(EntityId entity, const Vector3& position,
                 const Quaternion& rotation = Quaternion::Identity());

    /// Register @p player as the player entity, optionally with a pose.
    void SetPlayer(EntityId player, std::optional<Vector3> position = std::nullopt);

    void SetDebugAIEnabled(bool enabled) noexcept { debugAI_ = enabled; }

    template <typename T>
    void SetProperty(EntityId entity, T value) {
        properties_[entity][std::type_index(typeid(T))] = std::move(value);
    }

    template <typename T>
    void RemoveProperty(EntityId entity) {
        auto it = properties_.find(entity);
        if (it != properties_.end()) {
            it->second.erase(std::type_index(typeid(T)));
        }
    }

    /// Drop the pose and every property of @p entity.
    void RemoveEntity(EntityId entity);

    [[nodiscard]] std::optional<Pose> PositionOf(EntityId entity) const override;
    [[nodiscard]] EntityId PlayerEntity() const override { return player_; }
    [[nodiscard]] bool DebugAIEnabled() const override { return debugAI_; }

protected:
    [[nodiscard]] const std::any* FindProperty(EntityId entity,
                                               std::type_index type) const override;

private:
    std::unordered_map<EntityId, Pose> poses_;
    std::unordered_map<EntityId, std::unordered_map<std::type_index, std::any>> properties_;
    EntityId player_;
    bool debugAI_ = false;
};

}  // namespace dai::ai
