#pragma once
/**
 * @file constants.h
 * @brief Combat simulation constants
 *
 * Centralizes the fixed drone, munition and arena constants. Values that a
 * scenario may tune (bounds, tick, reward weights, hit radii) live in
 * CombatConfig instead.
 */

#include "hornet/core/types.h"

namespace hornet::constants {

// ============================================================================
// Drone Kinematics
// ============================================================================

/// Maximum drone speed (m/s)
constexpr Real DRONE_MAX_SPEED = 200.0;

/// Maximum thrust acceleration at full throttle (m/s^2)
constexpr Real DRONE_MAX_ACCELERATION = 50.0;

/// Maximum roll/pitch/yaw rate at full stick (rad/s)
constexpr Real DRONE_MAX_TURN_RATE = 2.0;

/// Quadratic drag coefficient (accel term is -drag * |v| * v)
constexpr Real DRONE_DRAG = 0.02;

/// Thrust multiplier while boosting
constexpr Real DRONE_BOOST_MULTIPLIER = 1.5;

/// Field of view (full cone angle, radians)
constexpr Real DRONE_FIELD_OF_VIEW = PI / 3.0;

/// Distance below which geometry queries fall back to a zero angle
constexpr Real GEOMETRY_EPSILON = 1e-6;

// ============================================================================
// Drone Resources
// ============================================================================

constexpr Real DRONE_MAX_HP = 100.0;
constexpr Real DRONE_MAX_SHIELD = 50.0;
constexpr Real DRONE_MAX_ENERGY = 100.0;
constexpr UInt32 DRONE_MAX_AMMO = 500;
constexpr UInt32 DRONE_MAX_MISSILES = 4;

/// Shield regeneration (per second)
constexpr Real SHIELD_REGEN_RATE = 2.0;

/// Energy regeneration (per second)
constexpr Real ENERGY_REGEN_RATE = 5.0;

/// Energy regeneration multiplier below ENERGY_REGEN_SLOW_SPEED
constexpr Real ENERGY_REGEN_SLOW_BONUS = 1.5;

/// Speed below which energy regenerates faster (m/s)
constexpr Real ENERGY_REGEN_SLOW_SPEED = 60.0;

/// Boost energy cost (per second)
constexpr Real BOOST_ENERGY_COST = 20.0;

/// Energy cost of a homing launch
constexpr Real MISSILE_ENERGY_COST = 15.0;

/// Energy cost of a decoy deployment
constexpr Real DECOY_ENERGY_COST = 10.0;

/// Homing launch cooldown (seconds)
constexpr Real MISSILE_COOLDOWN = 5.0;

/// Decoy deployment cooldown (seconds)
constexpr Real DECOY_COOLDOWN = 8.0;

// ============================================================================
// Munitions
// ============================================================================

/// Per-component uniform spread applied to the round direction
constexpr Real ROUND_SPREAD = 0.08;

/// Distance ahead of the shooter at which munitions appear
constexpr Real MUZZLE_OFFSET = 5.0;

constexpr Real ROUND_SPEED = 600.0;
constexpr Real ROUND_DAMAGE = 8.0;
constexpr Real ROUND_LIFETIME = 1.2;

constexpr Real HOMING_SPEED = 150.0;
constexpr Real HOMING_DAMAGE = 40.0;
constexpr Real HOMING_LIFETIME = 3.5;

/// Heading blend coefficient per second toward the target
constexpr Real HOMING_TRACKING = 0.8;

constexpr Real DECOY_LIFETIME = 3.0;

/// Distraction radius (strict containment)
constexpr Real DECOY_RADIUS = 50.0;

/// Decoy descent rate (m/s)
constexpr Real DECOY_DESCENT_RATE = 5.0;

// ============================================================================
// Arena Layout
// ============================================================================

/// Spawn distance of each team from the arena center along x
constexpr Real SPAWN_OFFSET = 120.0;

/// Spawn altitude
constexpr Real SPAWN_ALTITUDE = 100.0;

/// Lateral spacing between team members
constexpr Real SPAWN_SPACING = 50.0;

/// Velocity damping applied when reflecting off a boundary
constexpr Real BOUNDARY_DAMPING = 0.5;

/// Damage applied on floor contact
constexpr Real FLOOR_CONTACT_DAMAGE = 5.0;

} // namespace hornet::constants
