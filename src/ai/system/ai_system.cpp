/// @file ai_system.cpp
/// @brief AISystem implementation.
///
/// Steps every registered controller in entity id order and combines the
/// effects they return. Factories build archetype controllers from the
/// system's tuning.

#include "dai/ai/ai_system.hpp"

#include <string>
#include <utility>
#include <vector>

#include "dai/ai/camera_controller.hpp"
#include "dai/ai/monster_controller.hpp"
#include "dai/ai/turret_controller.hpp"
#include "dai/foundation/game_logger.hpp"

namespace dai::ai {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogLevel;

AISystem::AISystem(AITuning tuning, std::shared_ptr<const nav::PathfindingService> paths)
    : tuning_(std::move(tuning)), paths_(std::move(paths)) {}

GameResult<Effect> AISystem::AddController(std::unique_ptr<IAIController> controller,
                                           const IWorldView& world) {
    if (!controller) {
        return GameResult<Effect>::err(
            GameError(ErrorCode::InvalidArgument, "cannot register a null controller"));
    }
    const EntityId entity = controller->GetEntity();
    if (!entity.isValid()) {
        return GameResult<Effect>::err(GameError(
            ErrorCode::InvalidArgument,
            std::string(controller->GetName()) + " has no valid entity", entity));
    }

    Effect spawn = controller->Initialize(world);

    foundation::LogContext ctx;
    ctx.entityId = entity;
    foundation::GameLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::AI,
        "registered " + std::string(controller->GetName()), ctx);

    controllers_[entity] = std::move(controller);
    return GameResult<Effect>::ok(std::move(spawn));
}

GameResult<void> AISystem::RemoveController(EntityId entity) {
    if (controllers_.erase(entity) == 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::ControllerNotFound,
            "no controller for entity " + std::to_string(entity.value()), entity));
    }
    return GameResult<void>::ok();
}

IAIController* AISystem::GetController(EntityId entity) const {
    auto it = controllers_.find(entity);
    return it == controllers_.end() ? nullptr : it->second.get();
}

bool AISystem::HasController(EntityId entity) const {
    return controllers_.find(entity) != controllers_.end();
}

Effect AISystem::Execute(const AITickContext& context) {
    std::vector<Effect> effects;
    effects.reserve(controllers_.size());
    uint32_t updateCount = 0;

    for (auto& entry : controllers_) {
        effects.push_back(entry.second->Update(context));
        ++updateCount;
    }

    lastTickUpdateCount_ = updateCount;
    return Effect::Combine(std::move(effects));
}

// ── Controller factories ────────────────────────────────────────────

std::unique_ptr<IAIController> AISystem::CreateTurretController(EntityId entity) const {
    return std::make_unique<TurretController>(entity, tuning_.turret, tuning_.sightDistance);
}

std::unique_ptr<IAIController> AISystem::CreateCameraController(EntityId entity) const {
    return std::make_unique<CameraController>(entity, tuning_.camera, tuning_.sightDistance);
}

std::unique_ptr<IAIController> AISystem::CreateMonsterController(EntityId entity) const {
    return std::make_unique<MonsterController>(entity, tuning_.monster, paths_,
                                               tuning_.sightDistance);
}

}  // namespace dai::ai
