/// @file snapshot_world_view.cpp
/// @brief SnapshotWorldView implementation.

#include "dai/ai/world_view.hpp"

namespace dai::ai {

void SnapshotWorldView::SetPose(EntityId entity, const Vector3& position,
                                const Quaternion& rotation) {
    poses_[entity] = Pose{position, rotation};
}

void SnapshotWorldView::SetPlayer(EntityId player, std::optional<Vector3> position) {
    player_ = player;
    if (position) {
        SetPose(player, *position);
    }
}

void SnapshotWorldView::RemoveEntity(EntityId entity) {
    poses_.erase(entity);
    properties_.erase(entity);
}

std::optional<Pose> SnapshotWorldView::PositionOf(EntityId entity) const {
    auto it = poses_.find(entity);
    if (it == poses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::any* SnapshotWorldView::FindProperty(EntityId entity, std::type_index type) const {
    auto entityIt = properties_.find(entity);
    if (entityIt == properties_.end()) {
        return nullptr;
    }
    auto propIt = entityIt->second.find(type);
    if (propIt == entityIt->second.end()) {
        return nullptr;
    }
    return &propIt->second;
}

}  // namespace dai::ai
