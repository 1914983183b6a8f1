#pragma once
/**
 * @file observation_encoder.h
 * @brief Fixed-length per-agent observation vectors
 *
 * Layout (all values normalized, Float32):
 *
 *   self   [13]  position, velocity, orientation, hp, shield, energy, ammo
 *   enemy  [10] x team_size
 *                relative position, relative velocity, distance, bearing,
 *                hp, 0
 *   ally   [8]  x (team_size - 1)
 *                relative position, relative velocity, hp, 1 (presence)
 *   env    [6]  wind, position within the arena bounds
 *
 * Enemy and ally slots hold living drones sorted by ascending distance
 * (ties in arena order); unused slots are all zero.
 */

#include "hornet/core/types.h"
#include "hornet/interface/config.h"
#include "hornet/sim/world_state.h"
#include <vector>

namespace hornet::sim {

constexpr SizeT SELF_BLOCK_SIZE = 13;
constexpr SizeT ENEMY_BLOCK_SIZE = 10;
constexpr SizeT ALLY_BLOCK_SIZE = 8;
constexpr SizeT ENV_BLOCK_SIZE = 6;

/**
 * @brief Observation length for a given team size
 */
constexpr SizeT observation_size(SizeT team_size) noexcept {
    return SELF_BLOCK_SIZE +
           team_size * ENEMY_BLOCK_SIZE +
           (team_size > 0 ? team_size - 1 : 0) * ALLY_BLOCK_SIZE +
           ENV_BLOCK_SIZE;
}

class ObservationEncoder {
public:
    explicit ObservationEncoder(const config::CombatConfig& config);

    /// Length of every encoded vector
    SizeT size() const noexcept { return observation_size(team_size_); }

    /**
     * @brief Encode the observation of one drone
     */
    std::vector<Float32> encode(const WorldState& world, EntityId handle) const;

    /**
     * @brief Encode every drone in the arena, dead ones included
     */
    AgentMap<std::vector<Float32>> encode_all(const WorldState& world) const;

private:
    SizeT team_size_;
    config::ArenaBounds bounds_;
    Real max_wind_;
};

} // namespace hornet::sim
