/**
 * @file drone.cpp
 * @brief Drone entity model implementation
 */

#include "hornet/physics/drone.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace hornet::physics {

namespace {

Real sanitize_control(Real value) noexcept {
    if (!std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(value, -1.0, 1.0);
}

} // anonymous namespace

// ============================================================================
// DroneLoadout
// ============================================================================

DroneLoadout DroneLoadout::clamped() const noexcept {
    DroneLoadout out = *this;
    out.hp = std::isfinite(hp) ? std::clamp(hp, 0.0, constants::DRONE_MAX_HP) : constants::DRONE_MAX_HP;
    out.shield = std::isfinite(shield) ? std::clamp(shield, 0.0, constants::DRONE_MAX_SHIELD)
                                       : constants::DRONE_MAX_SHIELD;
    out.energy = std::isfinite(energy) ? std::clamp(energy, 0.0, constants::DRONE_MAX_ENERGY)
                                       : constants::DRONE_MAX_ENERGY;
    out.ammo = std::min(ammo, constants::DRONE_MAX_AMMO);
    out.missiles = std::min(missiles, constants::DRONE_MAX_MISSILES);
    return out;
}

// ============================================================================
// Construction / Reset
// ============================================================================

Drone::Drone(std::string id,
             Team team,
             const Vec3& position,
             const EulerAngles& orientation,
             const DroneLoadout& loadout)
    : id_(std::move(id))
    , team_(team)
    , loadout_(loadout.clamped()) {
    reset(position, orientation);
}

void Drone::reset(const Vec3& position, const EulerAngles& orientation) {
    position_ = position;
    velocity_ = Vec3::Zero();
    orientation_ = {
        math::wrap_angle(orientation.roll),
        math::wrap_angle(orientation.pitch),
        math::wrap_angle(orientation.yaw)
    };

    hp_ = loadout_.hp;
    shield_ = loadout_.shield;
    energy_ = loadout_.energy;
    ammo_ = loadout_.ammo;
    missiles_ = loadout_.missiles;
    alive_ = hp_ > 0.0;
    boosting_ = false;

    missile_cooldown_ = 0.0;
    decoy_cooldown_ = 0.0;
    stats_ = DroneStats{};
}

// ============================================================================
// State Transition
// ============================================================================

DroneEvents Drone::apply_action(const DroneAction& action, Real dt) {
    DroneEvents events;
    if (!alive_) {
        return events;
    }

    missile_cooldown_ = std::max(0.0, missile_cooldown_ - dt);
    decoy_cooldown_ = std::max(0.0, decoy_cooldown_ - dt);

    // A successful gun, homing or decoy action keeps the previous boost state
    bool applied = false;

    switch (static_cast<DiscreteAction>(action.discrete)) {
        case DiscreteAction::FireGun:
            if (ammo_ > 0) {
                --ammo_;
                events.fired_gun = true;
                applied = true;
            }
            break;

        case DiscreteAction::FireMissile:
            if (missiles_ > 0 && missile_cooldown_ <= 0.0 &&
                energy_ >= constants::MISSILE_ENERGY_COST) {
                --missiles_;
                energy_ -= constants::MISSILE_ENERGY_COST;
                missile_cooldown_ = constants::MISSILE_COOLDOWN;
                events.fired_missile = true;
                applied = true;
            }
            break;

        case DiscreteAction::DeployDecoy:
            if (decoy_cooldown_ <= 0.0 && energy_ >= constants::DECOY_ENERGY_COST) {
                energy_ -= constants::DECOY_ENERGY_COST;
                decoy_cooldown_ = constants::DECOY_COOLDOWN;
                events.deployed_decoy = true;
                applied = true;
            }
            break;

        case DiscreteAction::Boost: {
            const Real cost = constants::BOOST_ENERGY_COST * dt;
            if (energy_ >= cost) {
                energy_ -= cost;
                boosting_ = true;
                applied = true;
            }
            break;
        }

        case DiscreteAction::Idle:
        default:
            break;
    }
    if (!applied) {
        boosting_ = false;
    }

    std::array<Real, 4> control;
    for (SizeT i = 0; i < control.size(); ++i) {
        control[i] = sanitize_control(action.continuous[i]);
    }

    integrate_orientation(control, dt);
    integrate_motion(control[0], dt);
    regenerate(dt);

    return events;
}

void Drone::integrate_orientation(const std::array<Real, 4>& control, Real dt) noexcept {
    // control = (throttle, pitch_rate, yaw_rate, roll_rate)
    const Real rate = constants::DRONE_MAX_TURN_RATE * dt;
    orientation_.roll = math::wrap_angle(orientation_.roll + control[3] * rate);
    orientation_.pitch = math::wrap_angle(orientation_.pitch + control[1] * rate);
    orientation_.yaw = math::wrap_angle(orientation_.yaw + control[2] * rate);
}

void Drone::integrate_motion(Real throttle, Real dt) noexcept {
    Real thrust = throttle * constants::DRONE_MAX_ACCELERATION;
    if (boosting_) {
        thrust *= constants::DRONE_BOOST_MULTIPLIER;
    }

    Vec3 acceleration = forward() * thrust;

    Real speed = velocity_.length();
    if (speed > 0.0) {
        acceleration -= velocity_ * (constants::DRONE_DRAG * speed);
    }

    velocity_ += acceleration * dt;

    // Rescale, never clip per component, so the heading is preserved
    speed = velocity_.length();
    if (speed > constants::DRONE_MAX_SPEED) {
        velocity_ *= constants::DRONE_MAX_SPEED / speed;
    }

    position_ += velocity_ * dt;
}

void Drone::regenerate(Real dt) noexcept {
    shield_ = std::min(constants::DRONE_MAX_SHIELD,
                       shield_ + constants::SHIELD_REGEN_RATE * dt);

    Real energy_rate = constants::ENERGY_REGEN_RATE;
    if (velocity_.length() < constants::ENERGY_REGEN_SLOW_SPEED) {
        energy_rate *= constants::ENERGY_REGEN_SLOW_BONUS;
    }
    energy_ = std::min(constants::DRONE_MAX_ENERGY, energy_ + energy_rate * dt);
}

// ============================================================================
// Damage
// ============================================================================

bool Drone::take_damage(Real amount) {
    if (!alive_ || !std::isfinite(amount) || amount <= 0.0) {
        return false;
    }

    stats_.damage_taken += amount;

    const Real absorbed = std::min(shield_, amount);
    shield_ -= absorbed;
    hp_ -= amount - absorbed;

    if (hp_ <= 0.0) {
        hp_ = 0.0;
        alive_ = false;
        return true;
    }
    return false;
}

void Drone::credit_hit(Real damage, bool killed) noexcept {
    stats_.damage_dealt += damage;
    if (killed) {
        ++stats_.kills;
    }
}

void Drone::set_kinematics(const Vec3& position, const Vec3& velocity) noexcept {
    position_ = position;
    velocity_ = velocity;
}

// ============================================================================
// Geometry Queries
// ============================================================================

Vec3 Drone::forward() const noexcept {
    return math::heading_from(orientation_.pitch, orientation_.yaw);
}

Real Drone::distance_to(const Drone& other) const noexcept {
    return math::distance(position_, other.position_);
}

Real Drone::angle_to(const Drone& other) const noexcept {
    const Vec3 to_other = other.position_ - position_;
    const Real dist = to_other.length();
    if (dist < constants::GEOMETRY_EPSILON) {
        return 0.0;
    }
    const Real cos_angle = std::clamp(forward().dot(to_other / dist), -1.0, 1.0);
    return std::acos(cos_angle);
}

bool Drone::can_see(const Drone& other, Real fov) const noexcept {
    return angle_to(other) <= fov / 2.0;
}

DroneStatus Drone::status() const {
    DroneStatus s;
    s.id = id_;
    s.team = team_;
    s.position = position_;
    s.velocity = velocity_;
    s.orientation = orientation_;
    s.hp = hp_;
    s.shield = shield_;
    s.energy = energy_;
    s.ammo = ammo_;
    s.missiles = missiles_;
    s.alive = alive_;
    s.boosting = boosting_;
    s.missile_cooldown = missile_cooldown_;
    s.decoy_cooldown = decoy_cooldown_;
    s.stats = stats_;
    return s;
}

} // namespace hornet::physics
