/**
 * @file munitions.cpp
 * @brief Projectile and decoy implementation
 */

#include "hornet/physics/munitions.h"
#include "hornet/core/constants.h"

namespace hornet::physics {

// ============================================================================
// Projectile
// ============================================================================

bool Projectile::update(Real dt) noexcept {
    position += velocity * dt;
    lifetime -= dt;
    return lifetime > 0.0;
}

void Projectile::steer_toward(const Vec3& target_position, Real dt) noexcept {
    const Vec3 to_target = target_position - position;
    const Real dist = to_target.length();
    if (dist < constants::GEOMETRY_EPSILON) {
        return;
    }

    const Real speed = velocity.length();
    if (speed < constants::GEOMETRY_EPSILON) {
        return;
    }

    const Vec3 desired = to_target / dist;
    const Vec3 current = velocity / speed;
    const Real blend = tracking * dt;

    const Vec3 heading = current * (1.0 - blend) + desired * blend;
    const Real heading_len = heading.length();
    if (heading_len < constants::GEOMETRY_EPSILON) {
        return;
    }
    velocity = heading * (speed / heading_len);
}

// ============================================================================
// Decoy
// ============================================================================

bool Decoy::update(Real dt) noexcept {
    lifetime -= dt;
    position.z -= constants::DECOY_DESCENT_RATE * dt;
    return lifetime > 0.0;
}

bool Decoy::contains(const Vec3& point) const noexcept {
    return math::distance_squared(point, position) < radius * radius;
}

// ============================================================================
// Factories
// ============================================================================

Projectile make_round(EntityId id, EntityId owner, const Drone& shooter, RandomStream& rng) {
    const Vec3 spread = rng.uniform_vec3(-constants::ROUND_SPREAD, constants::ROUND_SPREAD);
    const Vec3 direction = (shooter.forward() + spread).normalized();

    Projectile round;
    round.id = id;
    round.kind = MunitionKind::Round;
    round.owner = owner;
    round.owner_team = shooter.team();
    round.position = shooter.position() + direction * constants::MUZZLE_OFFSET;
    round.velocity = direction * constants::ROUND_SPEED + shooter.velocity();
    round.damage = constants::ROUND_DAMAGE;
    round.lifetime = constants::ROUND_LIFETIME;
    return round;
}

Projectile make_homing(EntityId id, EntityId owner, const Drone& shooter,
                       std::optional<EntityId> target) {
    const Vec3 direction = shooter.forward();

    Projectile missile;
    missile.id = id;
    missile.kind = MunitionKind::Homing;
    missile.owner = owner;
    missile.owner_team = shooter.team();
    missile.position = shooter.position() + direction * constants::MUZZLE_OFFSET;
    missile.velocity = direction * constants::HOMING_SPEED;
    missile.damage = constants::HOMING_DAMAGE;
    missile.lifetime = constants::HOMING_LIFETIME;
    missile.target = target;
    missile.tracking = constants::HOMING_TRACKING;
    return missile;
}

Decoy make_decoy(EntityId id, EntityId owner, const Drone& deployer) {
    Decoy decoy;
    decoy.id = id;
    decoy.owner = owner;
    decoy.position = deployer.position();
    return decoy;
}

} // namespace hornet::physics
