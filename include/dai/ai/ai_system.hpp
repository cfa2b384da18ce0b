#pragma once

/// @file ai_system.hpp
/// @brief AISystem: owns the per-entity controllers and steps them once per
///        host tick.
///
/// Controllers are stepped in ascending entity id order so the combined
/// effect tree of a tick is reproducible. The host applies the returned
/// effects after Execute() returns.

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string_view>

#include "dai/ai/ai_controller.hpp"
#include "dai/ai/ai_tuning.hpp"
#include "dai/foundation/game_result.hpp"
#include "dai/nav/pathfinding_service.hpp"

namespace dai::ai {

class AISystem final {
public:
    /// @param paths Pathfinding handed to monster controllers; may be null
    ///        when the level has no navigation data.
    explicit AISystem(AITuning tuning = {},
                      std::shared_ptr<const nav::PathfindingService> paths = nullptr);

    /// Register @p controller and run its Initialize().
    /// A controller already registered for the same entity is replaced.
    /// @return The spawn effects, or InvalidArgument for a null controller
    ///         or an invalid entity.
    [[nodiscard]] foundation::GameResult<Effect> AddController(
        std::unique_ptr<IAIController> controller, const IWorldView& world);

    /// @return ControllerNotFound when @p entity has no controller.
    foundation::GameResult<void> RemoveController(EntityId entity);

    [[nodiscard]] IAIController* GetController(EntityId entity) const;
    [[nodiscard]] bool HasController(EntityId entity) const;
    [[nodiscard]] std::size_t Size() const noexcept { return controllers_.size(); }

    /// Step every controller once.
    [[nodiscard]] Effect Execute(const AITickContext& context);

    [[nodiscard]] std::string_view GetName() const { return "AISystem"; }

    // ── Controller factories ────────────────────────────────────────

    [[nodiscard]] std::unique_ptr<IAIController> CreateTurretController(EntityId entity) const;
    [[nodiscard]] std::unique_ptr<IAIController> CreateCameraController(EntityId entity) const;
    [[nodiscard]] std::unique_ptr<IAIController> CreateMonsterController(EntityId entity) const;

    // ── Configuration ────────────────────────────────────────────────

    [[nodiscard]] const AITuning& GetTuning() const noexcept { return tuning_; }

    /// Get the number of controllers updated on the last Execute call.
    [[nodiscard]] uint32_t GetLastTickUpdateCount() const noexcept {
        return lastTickUpdateCount_;
    }

private:
    AITuning tuning_;
    std::shared_ptr<const nav::PathfindingService> paths_;
    std::map<EntityId, std::unique_ptr<IAIController>> controllers_;
    uint32_t lastTickUpdateCount_ = 0;
};

}  // namespace dai::ai
