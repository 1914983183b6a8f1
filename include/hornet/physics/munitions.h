#pragma once
/**
 * @file munitions.h
 * @brief Projectiles (direct-fire rounds, homing munitions) and decoys
 */

#include "hornet/core/types.h"
#include "hornet/core/random.h"
#include "hornet/physics/drone.h"
#include <optional>

namespace hornet::physics {

/**
 * @brief Projectile flavor
 */
enum class MunitionKind : UInt8 {
    Round = 0,   ///< Unguided direct-fire round
    Homing       ///< Guided munition with an optional target lock
};

inline const char* munition_kind_to_string(MunitionKind kind) {
    switch (kind) {
        case MunitionKind::Round: return "round";
        case MunitionKind::Homing: return "homing";
        default: return "unknown";
    }
}

// ============================================================================
// Projectile
// ============================================================================

/**
 * @brief Ballistic entity owned by the drone that launched it
 */
struct Projectile {
    EntityId id{INVALID_ENTITY_ID};
    MunitionKind kind{MunitionKind::Round};
    EntityId owner{INVALID_ENTITY_ID};   ///< Arena handle of the shooter
    Team owner_team{Team::Red};          ///< Friendly-fire exclusion tag
    Vec3 position;
    Vec3 velocity;
    Real damage{0.0};
    Real lifetime{0.0};                  ///< Remaining seconds

    /// Locked target (homing only); once cleared it is never restored
    std::optional<EntityId> target;

    /// Heading blend coefficient per second (homing only)
    Real tracking{0.0};

    /**
     * @brief Integrate position and consume lifetime
     * @return True while lifetime remains positive
     */
    bool update(Real dt) noexcept;

    /**
     * @brief Blend the heading toward a target position, keeping speed
     *
     * No change when the target is (nearly) reached or the munition is
     * (nearly) at rest.
     */
    void steer_toward(const Vec3& target_position, Real dt) noexcept;

    /// Permanently drop the target lock
    void break_lock() noexcept { target.reset(); }

    bool is_homing() const noexcept { return kind == MunitionKind::Homing; }
    bool has_lock() const noexcept { return target.has_value(); }
};

// ============================================================================
// Decoy
// ============================================================================

/**
 * @brief Countermeasure that breaks homing locks inside its radius
 */
struct Decoy {
    EntityId id{INVALID_ENTITY_ID};
    EntityId owner{INVALID_ENTITY_ID};
    Vec3 position;
    Real lifetime{constants::DECOY_LIFETIME};
    Real radius{constants::DECOY_RADIUS};

    /**
     * @brief Descend and consume lifetime
     * @return True while lifetime remains positive
     */
    bool update(Real dt) noexcept;

    /// Strict containment test against the distraction radius
    bool contains(const Vec3& point) const noexcept;
};

// ============================================================================
// Factories
// ============================================================================

/**
 * @brief Launch a direct-fire round from a drone
 *
 * Draws three spread components from the stream (x, y, z order).
 */
Projectile make_round(EntityId id, EntityId owner, const Drone& shooter, RandomStream& rng);

/**
 * @brief Launch a homing munition from a drone
 * @param target Initial lock (nullopt launches unguided)
 */
Projectile make_homing(EntityId id, EntityId owner, const Drone& shooter,
                       std::optional<EntityId> target);

/**
 * @brief Drop a decoy at a drone's current position
 */
Decoy make_decoy(EntityId id, EntityId owner, const Drone& deployer);

} // namespace hornet::physics
