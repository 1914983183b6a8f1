/**
 * @file observation_encoder.cpp
 * @brief Observation encoding implementation
 */

#include "hornet/sim/observation_encoder.h"
#include "hornet/core/constants.h"
#include <algorithm>

namespace hornet::sim {

using physics::Drone;

namespace {

struct Neighbor {
    const Drone* drone;
    Real distance;
};

/**
 * @brief Living drones matching a predicate, nearest first, at most `limit`
 */
template <typename Pred>
std::vector<Neighbor> nearest(const WorldState& world, const Drone& self, SizeT limit, Pred pred) {
    std::vector<Neighbor> out;
    for (const Drone& other : world.arena) {
        if (&other == &self || !other.is_alive() || !pred(other)) {
            continue;
        }
        out.push_back({&other, self.distance_to(other)});
    }

    std::stable_sort(out.begin(), out.end(),
        [](const Neighbor& a, const Neighbor& b) { return a.distance < b.distance; });

    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

void push(std::vector<Float32>& obs, Real value) {
    obs.push_back(static_cast<Float32>(value));
}

void push(std::vector<Float32>& obs, const Vec3& v, Real scale) {
    push(obs, v.x / scale);
    push(obs, v.y / scale);
    push(obs, v.z / scale);
}

} // anonymous namespace

ObservationEncoder::ObservationEncoder(const config::CombatConfig& config)
    : team_size_(config.team_size)
    , bounds_(config.bounds)
    , max_wind_(config.max_wind) {
}

std::vector<Float32> ObservationEncoder::encode(const WorldState& world, EntityId handle) const {
    const Drone& self = world.arena.at(handle);

    const Real half_extent = bounds_.horizontal_extent() / 2.0;
    const Real full_extent = bounds_.horizontal_extent();
    const Real max_speed = constants::DRONE_MAX_SPEED;

    std::vector<Float32> obs;
    obs.reserve(size());

    // Self
    push(obs, self.position(), half_extent);
    push(obs, self.velocity(), max_speed);
    push(obs, self.orientation().roll / constants::PI);
    push(obs, self.orientation().pitch / constants::PI);
    push(obs, self.orientation().yaw / constants::PI);
    push(obs, self.hp() / constants::DRONE_MAX_HP);
    push(obs, self.shield() / constants::DRONE_MAX_SHIELD);
    push(obs, self.energy() / constants::DRONE_MAX_ENERGY);
    push(obs, static_cast<Real>(self.ammo()) / static_cast<Real>(constants::DRONE_MAX_AMMO));

    // Enemies
    const auto enemies = nearest(world, self, team_size_,
        [&self](const Drone& d) { return d.team() == physics::opposing_team(self.team()); });
    for (SizeT slot = 0; slot < team_size_; ++slot) {
        if (slot >= enemies.size()) {
            obs.insert(obs.end(), ENEMY_BLOCK_SIZE, 0.0f);
            continue;
        }
        const Drone& enemy = *enemies[slot].drone;
        push(obs, enemy.position() - self.position(), half_extent);
        push(obs, enemy.velocity() - self.velocity(), max_speed);
        push(obs, enemies[slot].distance / full_extent);
        push(obs, self.angle_to(enemy) / constants::PI);
        push(obs, enemy.hp() / constants::DRONE_MAX_HP);
        push(obs, 0.0);
    }

    // Allies
    const SizeT ally_slots = team_size_ > 0 ? team_size_ - 1 : 0;
    const auto allies = nearest(world, self, ally_slots,
        [&self](const Drone& d) { return d.team() == self.team(); });
    for (SizeT slot = 0; slot < ally_slots; ++slot) {
        if (slot >= allies.size()) {
            obs.insert(obs.end(), ALLY_BLOCK_SIZE, 0.0f);
            continue;
        }
        const Drone& ally = *allies[slot].drone;
        push(obs, ally.position() - self.position(), half_extent);
        push(obs, ally.velocity() - self.velocity(), max_speed);
        push(obs, ally.hp() / constants::DRONE_MAX_HP);
        push(obs, 1.0);
    }

    // Environment
    if (max_wind_ > 0.0) {
        push(obs, world.wind, 2.0 * max_wind_);
    } else {
        obs.insert(obs.end(), 3, 0.0f);
    }
    push(obs, (self.position().x - bounds_.min_xy) / full_extent);
    push(obs, (self.position().y - bounds_.min_xy) / full_extent);
    push(obs, (self.position().z - bounds_.min_z) / bounds_.height_extent());

    return obs;
}

AgentMap<std::vector<Float32>> ObservationEncoder::encode_all(const WorldState& world) const {
    AgentMap<std::vector<Float32>> observations;
    observations.reserve(world.arena.size());

    EntityId handle = 0;
    for (const Drone& drone : world.arena) {
        observations.emplace(drone.id(), encode(world, handle++));
    }
    return observations;
}

} // namespace hornet::sim
