#pragma once
/**
 * @file tick_phases.h
 * @brief Phase functions composing one simulation tick
 *
 * Each phase takes the world explicitly and mutates only what its name
 * says. run_tick() composes them in the fixed order below; the order is
 * part of the determinism contract:
 *
 * 1. apply_actions        - drone state transitions, launch events
 * 2. spawn_munitions      - rounds, homing munitions, decoys
 * 3. advance_projectiles  - homing guidance and integration, expiry
 * 4. resolve_collisions   - first enemy in radius takes each projectile
 * 5. expire_decoys        - decoy descent and expiry
 * 6. enforce_bounds       - reflection and floor contact damage
 * 7. compute_rewards
 * 8. check_termination
 */

#include "hornet/core/types.h"
#include "hornet/core/random.h"
#include "hornet/interface/config.h"
#include "hornet/physics/drone.h"
#include "hornet/physics/munitions.h"
#include "hornet/sim/world_state.h"
#include <optional>
#include <vector>

namespace hornet::sim {

// ============================================================================
// Phase Records
// ============================================================================

/**
 * @brief Launch events emitted by one drone this tick
 */
struct LaunchEvent {
    EntityId shooter{INVALID_ENTITY_ID};
    physics::DroneEvents events;
};

/**
 * @brief A projectile that struck an enemy drone
 */
struct HitEvent {
    EntityId attacker{INVALID_ENTITY_ID};   ///< Arena handle of the shooter
    EntityId target{INVALID_ENTITY_ID};     ///< Arena handle of the drone hit
    EntityId projectile{INVALID_ENTITY_ID};
    physics::MunitionKind kind{physics::MunitionKind::Round};
    Real damage{0.0};
    bool killed{false};
};

/**
 * @brief Episode end conditions after a tick
 *
 * terminated and truncated apply identically to every agent.
 */
struct TerminationStatus {
    bool terminated{false};
    bool truncated{false};
    SizeT red_alive{0};
    SizeT blue_alive{0};
    std::optional<physics::Team> winner;
};

/**
 * @brief Everything a tick produces besides the mutated world
 */
struct TickOutcome {
    std::vector<HitEvent> hits;
    AgentMap<Real> rewards;
    TerminationStatus status;
};

// ============================================================================
// Phases
// ============================================================================

/**
 * @brief Apply each present, living drone's action
 *
 * Drones are visited in arena order. A drone with no entry in the map is
 * left entirely un-advanced. Entries naming unknown agents are ignored.
 *
 * @return Launch events in arena order (drones without launches omitted)
 */
std::vector<LaunchEvent> apply_actions(WorldState& world,
                                       const AgentMap<physics::DroneAction>& actions,
                                       Real dt);

/**
 * @brief Create the projectiles and decoys requested by launch events
 *
 * Per shooter the order is round, homing munition, decoy. Homing munitions
 * lock onto the shooter's nearest living enemy at launch time.
 */
void spawn_munitions(WorldState& world, const std::vector<LaunchEvent>& launches,
                     RandomStream& rng);

/**
 * @brief Guide homing munitions, integrate all projectiles, drop expired ones
 *
 * A homing munition inside any active decoy loses its lock for good;
 * otherwise it steers toward its target's current position while that
 * target is alive.
 */
void advance_projectiles(WorldState& world, Real dt);

/**
 * @brief Apply projectile hits to enemy drones
 *
 * Projectiles are visited in list order, drones in arena order. The first
 * living enemy strictly inside the hit radius takes the damage and the
 * projectile is consumed. Missed projectiles stay active.
 */
std::vector<HitEvent> resolve_collisions(WorldState& world,
                                         Real round_hit_radius,
                                         Real homing_hit_radius);

/**
 * @brief Advance decoys and drop expired ones
 */
void expire_decoys(WorldState& world, Real dt);

/**
 * @brief Clamp living drones into the arena
 *
 * The offending velocity component is reflected inward and halved. Floor
 * contact additionally costs FLOOR_CONTACT_DAMAGE (no attacker credited).
 */
void enforce_bounds(WorldState& world, const config::ArenaBounds& bounds);

/**
 * @brief Per-agent reward for the tick
 */
AgentMap<Real> compute_rewards(const WorldState& world,
                               const std::vector<HitEvent>& hits,
                               const config::RewardConfig& weights);

TerminationStatus check_termination(const WorldState& world, UInt32 max_steps);

/**
 * @brief Nearest living drone of the opposing team
 *
 * Ties resolve to the earliest drone in arena order.
 */
std::optional<EntityId> find_nearest_enemy(const DroneArena& arena, EntityId from);

/**
 * @brief Run one full tick and increment the step counter
 */
TickOutcome run_tick(WorldState& world,
                     const AgentMap<physics::DroneAction>& actions,
                     const config::CombatConfig& config,
                     RandomStream& rng);

} // namespace hornet::sim
