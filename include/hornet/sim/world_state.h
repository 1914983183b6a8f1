#pragma once
/**
 * @file world_state.h
 * @brief Drone arena and the complete mutable world of one episode
 */

#include "hornet/core/types.h"
#include "hornet/physics/drone.h"
#include "hornet/physics/munitions.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hornet::sim {

// ============================================================================
// DroneArena
// ============================================================================

/**
 * @brief Fixed-capacity, insertion-ordered drone collection
 *
 * A drone's EntityId is its slot index and stays valid for the episode.
 * Dead drones are never removed so final state stays addressable.
 * Iteration order equals spawn order.
 */
class DroneArena {
public:
    explicit DroneArena(SizeT capacity = 0);

    /**
     * @brief Add a drone
     * @return Handle of the new drone
     * @throws std::length_error if the arena is full
     * @throws std::invalid_argument if the id is already present
     */
    EntityId spawn(const std::string& id,
                   physics::Team team,
                   const Vec3& position,
                   const EulerAngles& orientation,
                   const physics::DroneLoadout& loadout = physics::DroneLoadout{});

    /**
     * @brief Remove every drone (capacity unchanged)
     */
    void clear() noexcept;

    SizeT size() const noexcept { return drones_.size(); }
    SizeT capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return drones_.empty(); }

    /**
     * @brief Access a drone by handle
     * @throws std::out_of_range for an unknown handle
     */
    physics::Drone& at(EntityId handle);
    const physics::Drone& at(EntityId handle) const;

    /**
     * @brief Resolve an agent id to its handle
     */
    std::optional<EntityId> handle_of(const std::string& id) const;

    physics::Drone* find(const std::string& id);
    const physics::Drone* find(const std::string& id) const;

    /**
     * @brief Number of living drones of a team
     */
    SizeT alive_count(physics::Team team) const noexcept;

    auto begin() noexcept { return drones_.begin(); }
    auto end() noexcept { return drones_.end(); }
    auto begin() const noexcept { return drones_.begin(); }
    auto end() const noexcept { return drones_.end(); }

private:
    SizeT capacity_;
    std::vector<physics::Drone> drones_;
    std::unordered_map<std::string, EntityId> index_;
};

// ============================================================================
// WorldState
// ============================================================================

/**
 * @brief Everything one episode mutates between ticks
 */
struct WorldState {
    DroneArena arena;
    std::vector<physics::Projectile> projectiles;
    std::vector<physics::Decoy> decoys;
    Vec3 wind;
    UInt32 step_count{0};
    EntityId next_projectile_id{0};
    EntityId next_decoy_id{0};

    explicit WorldState(SizeT team_size = 0) : arena(team_size * 2) {}

    /**
     * @brief Drop every entity and zero the counters
     */
    void clear() noexcept;
};

/**
 * @brief Agent id of team member i ("red_0", "blue_2", ...)
 */
std::string agent_id(physics::Team team, SizeT index);

/**
 * @brief Spawn pose of team member i
 *
 * Red spawns at negative x facing +x, blue at positive x facing -x,
 * both laterally spaced along y and centered on team_size / 2.
 */
std::pair<Vec3, EulerAngles> spawn_pose(physics::Team team, SizeT index, SizeT team_size);

/**
 * @brief Clear the world and spawn both teams at their spawn poses
 *
 * Red members are spawned first, then blue, each in index order.
 */
void populate_teams(WorldState& world, SizeT team_size,
                    const physics::DroneLoadout& loadout = physics::DroneLoadout{});

} // namespace hornet::sim
