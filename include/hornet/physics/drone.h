#pragma once
/**
 * @file drone.h
 * @brief Drone entity model: kinematics, resources and damage
 *
 * A Drone owns its physical and resource state and the pure state
 * transition that advances it by one tick for a given action. It has no
 * knowledge of other entities beyond the read-only geometry queries;
 * munition spawning, collisions and bounds belong to the tick phases.
 */

#include "hornet/core/types.h"
#include "hornet/core/constants.h"
#include <array>
#include <string>

namespace hornet::physics {

// ============================================================================
// Team
// ============================================================================

/**
 * @brief One of the two opposing sides
 */
enum class Team : UInt8 {
    Red = 0,
    Blue
};

inline const char* team_to_string(Team team) {
    switch (team) {
        case Team::Red: return "red";
        case Team::Blue: return "blue";
        default: return "unknown";
    }
}

/**
 * @brief The team opposing the given one
 */
constexpr Team opposing_team(Team team) noexcept {
    return team == Team::Red ? Team::Blue : Team::Red;
}

// ============================================================================
// Actions and Events
// ============================================================================

/**
 * @brief Discrete action codes
 */
enum class DiscreteAction : Int32 {
    Idle = 0,
    FireGun = 1,
    FireMissile = 2,
    DeployDecoy = 3,
    Boost = 4
};

/// Number of discrete action codes
constexpr Int32 DISCRETE_ACTION_COUNT = 5;

/**
 * @brief Per-tick control input of one drone
 *
 * Unknown discrete codes behave as idle. Continuous components are
 * (throttle, pitch_rate, yaw_rate, roll_rate), each clamped to [-1, 1].
 */
struct DroneAction {
    Int32 discrete{0};
    std::array<Real, 4> continuous{0.0, 0.0, 0.0, 0.0};

    static DroneAction idle() noexcept { return DroneAction{}; }

    static DroneAction make(DiscreteAction code,
                            Real throttle = 0.0,
                            Real pitch_rate = 0.0,
                            Real yaw_rate = 0.0,
                            Real roll_rate = 0.0) noexcept {
        DroneAction action;
        action.discrete = static_cast<Int32>(code);
        action.continuous = {throttle, pitch_rate, yaw_rate, roll_rate};
        return action;
    }
};

/**
 * @brief Launch events emitted by apply_action
 */
struct DroneEvents {
    bool fired_gun{false};
    bool fired_missile{false};
    bool deployed_decoy{false};

    bool any() const noexcept {
        return fired_gun || fired_missile || deployed_decoy;
    }
};

// ============================================================================
// Resources and Status
// ============================================================================

/**
 * @brief Initial resource levels restored on reset
 */
struct DroneLoadout {
    Real hp{constants::DRONE_MAX_HP};
    Real shield{constants::DRONE_MAX_SHIELD};
    Real energy{constants::DRONE_MAX_ENERGY};
    UInt32 ammo{constants::DRONE_MAX_AMMO};
    UInt32 missiles{constants::DRONE_MAX_MISSILES};

    /**
     * @brief Copy with every value clamped into its valid range
     */
    DroneLoadout clamped() const noexcept;
};

/**
 * @brief Cumulative combat statistics of one drone
 */
struct DroneStats {
    Real damage_dealt{0.0};
    Real damage_taken{0.0};
    UInt32 kills{0};
};

/**
 * @brief Immutable snapshot of a drone's full state
 */
struct DroneStatus {
    std::string id;
    Team team{Team::Red};
    Vec3 position;
    Vec3 velocity;
    EulerAngles orientation;
    Real hp{0.0};
    Real shield{0.0};
    Real energy{0.0};
    UInt32 ammo{0};
    UInt32 missiles{0};
    bool alive{false};
    bool boosting{false};
    Real missile_cooldown{0.0};
    Real decoy_cooldown{0.0};
    DroneStats stats;
};

// ============================================================================
// Drone
// ============================================================================

/**
 * @brief One combat unit
 *
 * Invariants: hp in [0, MAX_HP], shield in [0, MAX_SHIELD], energy in
 * [0, MAX_ENERGY], alive iff hp > 0. Once dead a drone stays dead until
 * reset() and ignores every further action or damage.
 */
class Drone {
public:
    Drone(std::string id,
          Team team,
          const Vec3& position = Vec3::Zero(),
          const EulerAngles& orientation = EulerAngles{},
          const DroneLoadout& loadout = DroneLoadout{});

    /**
     * @brief Restore the loadout at a new pose
     *
     * Zeroes velocity, cooldowns and statistics.
     */
    void reset(const Vec3& position, const EulerAngles& orientation);

    // ========================================================================
    // State Transition
    // ========================================================================

    /**
     * @brief Advance this drone by one tick
     * @param action Discrete request and continuous control
     * @param dt Tick duration (seconds)
     * @return Launch events (empty when dead or when every gate failed)
     */
    DroneEvents apply_action(const DroneAction& action, Real dt);

    /**
     * @brief Apply damage, shield first
     * @param amount Damage amount; non-positive or non-finite amounts are ignored
     * @return True if this hit killed the drone
     */
    bool take_damage(Real amount);

    /**
     * @brief Record a hit this drone scored
     */
    void credit_hit(Real damage, bool killed) noexcept;

    /**
     * @brief Overwrite position and velocity (boundary handling, scenario setup)
     */
    void set_kinematics(const Vec3& position, const Vec3& velocity) noexcept;

    // ========================================================================
    // Geometry Queries
    // ========================================================================

    /// Unit heading derived from pitch and yaw
    Vec3 forward() const noexcept;

    Real distance_to(const Drone& other) const noexcept;

    /**
     * @brief Angle between the heading and the line of sight to another drone
     *
     * Returns 0 when the two drones are (nearly) co-located.
     */
    Real angle_to(const Drone& other) const noexcept;

    /**
     * @brief True if another drone lies within half the field of view
     */
    bool can_see(const Drone& other, Real fov = constants::DRONE_FIELD_OF_VIEW) const noexcept;

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::string& id() const noexcept { return id_; }
    Team team() const noexcept { return team_; }
    const Vec3& position() const noexcept { return position_; }
    const Vec3& velocity() const noexcept { return velocity_; }
    const EulerAngles& orientation() const noexcept { return orientation_; }
    Real hp() const noexcept { return hp_; }
    Real shield() const noexcept { return shield_; }
    Real energy() const noexcept { return energy_; }
    UInt32 ammo() const noexcept { return ammo_; }
    UInt32 missiles() const noexcept { return missiles_; }
    bool is_alive() const noexcept { return alive_; }
    bool is_boosting() const noexcept { return boosting_; }
    Real missile_cooldown() const noexcept { return missile_cooldown_; }
    Real decoy_cooldown() const noexcept { return decoy_cooldown_; }
    const DroneStats& stats() const noexcept { return stats_; }
    const DroneLoadout& loadout() const noexcept { return loadout_; }

    DroneStatus status() const;

private:
    void integrate_orientation(const std::array<Real, 4>& control, Real dt) noexcept;
    void integrate_motion(Real throttle, Real dt) noexcept;
    void regenerate(Real dt) noexcept;

    std::string id_;
    Team team_;
    DroneLoadout loadout_;

    Vec3 position_;
    Vec3 velocity_;
    EulerAngles orientation_;

    Real hp_{0.0};
    Real shield_{0.0};
    Real energy_{0.0};
    UInt32 ammo_{0};
    UInt32 missiles_{0};
    bool alive_{false};
    bool boosting_{false};

    Real missile_cooldown_{0.0};
    Real decoy_cooldown_{0.0};

    DroneStats stats_;
};

} // namespace hornet::physics
