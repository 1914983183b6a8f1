/**
 * @file tick_phases.cpp
 * @brief Tick phase implementation
 */

#include "hornet/sim/tick_phases.h"
#include "hornet/core/constants.h"
#include "hornet/core/logging.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace hornet::sim {

using physics::Drone;
using physics::DroneAction;
using physics::MunitionKind;
using physics::Projectile;
using physics::Team;

// ============================================================================
// Actions and Launches
// ============================================================================

std::vector<LaunchEvent> apply_actions(WorldState& world,
                                       const AgentMap<DroneAction>& actions,
                                       Real dt) {
    for (const auto& entry : actions) {
        if (!world.arena.handle_of(entry.first)) {
            log::get_logger()->debug("Ignoring action for unknown agent '{}'", entry.first);
        }
    }

    std::vector<LaunchEvent> launches;
    EntityId handle = 0;
    for (Drone& drone : world.arena) {
        const EntityId current = handle++;

        auto it = actions.find(drone.id());
        if (it == actions.end() || !drone.is_alive()) {
            continue;
        }

        physics::DroneEvents events = drone.apply_action(it->second, dt);
        if (events.any()) {
            launches.push_back({current, events});
        }
    }
    return launches;
}

void spawn_munitions(WorldState& world, const std::vector<LaunchEvent>& launches,
                     RandomStream& rng) {
    for (const LaunchEvent& launch : launches) {
        const Drone& shooter = world.arena.at(launch.shooter);

        if (launch.events.fired_gun) {
            world.projectiles.push_back(
                physics::make_round(world.next_projectile_id++, launch.shooter, shooter, rng));
        }
        if (launch.events.fired_missile) {
            world.projectiles.push_back(
                physics::make_homing(world.next_projectile_id++, launch.shooter, shooter,
                                     find_nearest_enemy(world.arena, launch.shooter)));
        }
        if (launch.events.deployed_decoy) {
            world.decoys.push_back(
                physics::make_decoy(world.next_decoy_id++, launch.shooter, shooter));
        }
    }
}

// ============================================================================
// Projectiles
// ============================================================================

void advance_projectiles(WorldState& world, Real dt) {
    auto& projectiles = world.projectiles;

    for (Projectile& proj : projectiles) {
        if (!proj.is_homing() || !proj.has_lock()) {
            continue;
        }

        const bool distracted = std::any_of(world.decoys.begin(), world.decoys.end(),
            [&proj](const physics::Decoy& decoy) { return decoy.contains(proj.position); });

        if (distracted) {
            proj.break_lock();
        } else if (*proj.target < world.arena.size()) {
            const Drone& target = world.arena.at(*proj.target);
            if (target.is_alive()) {
                proj.steer_toward(target.position(), dt);
            }
        }
    }

    std::vector<Projectile> active;
    active.reserve(projectiles.size());
    for (Projectile& proj : projectiles) {
        if (proj.update(dt)) {
            active.push_back(proj);
        }
    }
    projectiles = std::move(active);
}

std::vector<HitEvent> resolve_collisions(WorldState& world,
                                         Real round_hit_radius,
                                         Real homing_hit_radius) {
    std::vector<HitEvent> hits;
    std::vector<Projectile> remaining;
    remaining.reserve(world.projectiles.size());

    for (const Projectile& proj : world.projectiles) {
        const Real radius = proj.is_homing() ? homing_hit_radius : round_hit_radius;
        const Real radius_sq = radius * radius;

        bool hit = false;
        EntityId handle = 0;
        for (Drone& drone : world.arena) {
            const EntityId target = handle++;
            if (!drone.is_alive() || drone.team() == proj.owner_team) {
                continue;
            }
            if (math::distance_squared(proj.position, drone.position()) >= radius_sq) {
                continue;
            }

            const bool killed = drone.take_damage(proj.damage);
            Drone& attacker = world.arena.at(proj.owner);
            attacker.credit_hit(proj.damage, killed);

            if (killed) {
                log::get_logger()->debug("Step {}: {} destroyed {} ({})",
                                         world.step_count, attacker.id(), drone.id(),
                                         physics::munition_kind_to_string(proj.kind));
            }

            hits.push_back({proj.owner, target, proj.id, proj.kind, proj.damage, killed});
            hit = true;
            break;
        }

        if (!hit) {
            remaining.push_back(proj);
        }
    }

    world.projectiles = std::move(remaining);
    return hits;
}

// ============================================================================
// Decoys and Bounds
// ============================================================================

void expire_decoys(WorldState& world, Real dt) {
    std::vector<physics::Decoy> active;
    active.reserve(world.decoys.size());
    for (physics::Decoy& decoy : world.decoys) {
        if (decoy.update(dt)) {
            active.push_back(decoy);
        }
    }
    world.decoys = std::move(active);
}

void enforce_bounds(WorldState& world, const config::ArenaBounds& bounds) {
    for (Drone& drone : world.arena) {
        if (!drone.is_alive()) {
            continue;
        }

        Vec3 position = drone.position();
        Vec3 velocity = drone.velocity();

        for (SizeT axis = 0; axis < 2; ++axis) {
            if (position[axis] < bounds.min_xy) {
                position[axis] = bounds.min_xy;
                velocity[axis] = std::abs(velocity[axis]) * constants::BOUNDARY_DAMPING;
            } else if (position[axis] > bounds.max_xy) {
                position[axis] = bounds.max_xy;
                velocity[axis] = -std::abs(velocity[axis]) * constants::BOUNDARY_DAMPING;
            }
        }

        bool floor_contact = false;
        if (position.z < bounds.min_z) {
            position.z = bounds.min_z;
            velocity.z = std::abs(velocity.z) * constants::BOUNDARY_DAMPING;
            floor_contact = true;
        } else if (position.z > bounds.max_z) {
            position.z = bounds.max_z;
            velocity.z = -std::abs(velocity.z) * constants::BOUNDARY_DAMPING;
        }

        drone.set_kinematics(position, velocity);

        if (floor_contact) {
            drone.take_damage(constants::FLOOR_CONTACT_DAMAGE);
        }
    }
}

// ============================================================================
// Rewards and Termination
// ============================================================================

AgentMap<Real> compute_rewards(const WorldState& world,
                               const std::vector<HitEvent>& hits,
                               const config::RewardConfig& weights) {
    AgentMap<Real> rewards;
    rewards.reserve(world.arena.size());

    for (const Drone& drone : world.arena) {
        rewards[drone.id()] = drone.is_alive() ? weights.survival_reward : 0.0;
    }

    for (const HitEvent& hit : hits) {
        Real& attacker = rewards[world.arena.at(hit.attacker).id()];
        attacker += hit.damage * weights.damage_reward;
        if (hit.killed) {
            attacker += weights.kill_reward;
        }

        Real& target = rewards[world.arena.at(hit.target).id()];
        target -= hit.damage * weights.damage_penalty;
        if (hit.killed) {
            target -= weights.death_penalty;
        }
    }

    return rewards;
}

TerminationStatus check_termination(const WorldState& world, UInt32 max_steps) {
    TerminationStatus status;
    status.red_alive = world.arena.alive_count(Team::Red);
    status.blue_alive = world.arena.alive_count(Team::Blue);
    status.terminated = status.red_alive == 0 || status.blue_alive == 0;
    status.truncated = world.step_count >= max_steps;

    if (status.blue_alive == 0 && status.red_alive > 0) {
        status.winner = Team::Red;
    } else if (status.red_alive == 0 && status.blue_alive > 0) {
        status.winner = Team::Blue;
    }
    return status;
}

std::optional<EntityId> find_nearest_enemy(const DroneArena& arena, EntityId from) {
    const Drone& self = arena.at(from);

    std::optional<EntityId> nearest;
    Real best = std::numeric_limits<Real>::infinity();

    EntityId handle = 0;
    for (const Drone& drone : arena) {
        const EntityId candidate = handle++;
        if (!drone.is_alive() || drone.team() != physics::opposing_team(self.team())) {
            continue;
        }
        const Real dist = self.distance_to(drone);
        if (dist < best) {
            best = dist;
            nearest = candidate;
        }
    }
    return nearest;
}

// ============================================================================
// Tick
// ============================================================================

TickOutcome run_tick(WorldState& world,
                     const AgentMap<DroneAction>& actions,
                     const config::CombatConfig& config,
                     RandomStream& rng) {
    const Real dt = config.time_step;
    ++world.step_count;

    TickOutcome outcome;

    const auto launches = apply_actions(world, actions, dt);
    spawn_munitions(world, launches, rng);
    advance_projectiles(world, dt);
    outcome.hits = resolve_collisions(world, config.round_hit_radius, config.homing_hit_radius);
    expire_decoys(world, dt);
    enforce_bounds(world, config.bounds);
    outcome.rewards = compute_rewards(world, outcome.hits, config.rewards);
    outcome.status = check_termination(world, config.max_steps);

    return outcome;
}

} // namespace hornet::sim
