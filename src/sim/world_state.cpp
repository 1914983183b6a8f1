/**
 * @file world_state.cpp
 * @brief Drone arena and world state implementation
 */

#include "hornet/sim/world_state.h"
#include "hornet/core/constants.h"
#include <algorithm>
#include <stdexcept>

namespace hornet::sim {

using physics::Drone;
using physics::Team;

// ============================================================================
// DroneArena
// ============================================================================

DroneArena::DroneArena(SizeT capacity)
    : capacity_(capacity) {
    drones_.reserve(capacity);
    index_.reserve(capacity);
}

EntityId DroneArena::spawn(const std::string& id,
                           Team team,
                           const Vec3& position,
                           const EulerAngles& orientation,
                           const physics::DroneLoadout& loadout) {
    if (drones_.size() >= capacity_) {
        throw std::length_error("DroneArena: capacity " + std::to_string(capacity_) +
                                " exceeded spawning '" + id + "'");
    }
    if (index_.count(id) != 0) {
        throw std::invalid_argument("DroneArena: duplicate drone id '" + id + "'");
    }

    const auto handle = static_cast<EntityId>(drones_.size());
    drones_.emplace_back(id, team, position, orientation, loadout);
    index_.emplace(id, handle);
    return handle;
}

void DroneArena::clear() noexcept {
    drones_.clear();
    index_.clear();
}

Drone& DroneArena::at(EntityId handle) {
    if (handle >= drones_.size()) {
        throw std::out_of_range("DroneArena: invalid handle " + std::to_string(handle));
    }
    return drones_[handle];
}

const Drone& DroneArena::at(EntityId handle) const {
    if (handle >= drones_.size()) {
        throw std::out_of_range("DroneArena: invalid handle " + std::to_string(handle));
    }
    return drones_[handle];
}

std::optional<EntityId> DroneArena::handle_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Drone* DroneArena::find(const std::string& id) {
    auto handle = handle_of(id);
    return handle ? &drones_[*handle] : nullptr;
}

const Drone* DroneArena::find(const std::string& id) const {
    auto handle = handle_of(id);
    return handle ? &drones_[*handle] : nullptr;
}

SizeT DroneArena::alive_count(Team team) const noexcept {
    return static_cast<SizeT>(std::count_if(drones_.begin(), drones_.end(),
        [team](const Drone& d) { return d.team() == team && d.is_alive(); }));
}

// ============================================================================
// WorldState
// ============================================================================

void WorldState::clear() noexcept {
    arena.clear();
    projectiles.clear();
    decoys.clear();
    wind = Vec3::Zero();
    step_count = 0;
    next_projectile_id = 0;
    next_decoy_id = 0;
}

// ============================================================================
// Team Layout
// ============================================================================

std::string agent_id(Team team, SizeT index) {
    return std::string(physics::team_to_string(team)) + "_" + std::to_string(index);
}

std::pair<Vec3, EulerAngles> spawn_pose(Team team, SizeT index, SizeT team_size) {
    const Real lateral = (static_cast<Real>(index) - static_cast<Real>(team_size) / 2.0) *
                         constants::SPAWN_SPACING;

    if (team == Team::Red) {
        return {Vec3{-constants::SPAWN_OFFSET, lateral, constants::SPAWN_ALTITUDE},
                EulerAngles{0.0, 0.0, 0.0}};
    }
    return {Vec3{constants::SPAWN_OFFSET, lateral, constants::SPAWN_ALTITUDE},
            EulerAngles{0.0, 0.0, constants::PI}};
}

void populate_teams(WorldState& world, SizeT team_size, const physics::DroneLoadout& loadout) {
    world.clear();
    if (world.arena.capacity() < team_size * 2) {
        world.arena = DroneArena(team_size * 2);
    }

    for (Team team : {Team::Red, Team::Blue}) {
        for (SizeT i = 0; i < team_size; ++i) {
            auto [position, orientation] = spawn_pose(team, i, team_size);
            world.arena.spawn(agent_id(team, i), team, position, orientation, loadout);
        }
    }
}

} // namespace hornet::sim
