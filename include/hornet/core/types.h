#pragma once
/**
 * @file types.h
 * @brief Core type definitions for HornetArena
 *
 * This file defines fundamental types used throughout the engine,
 * including numeric types, entity handles, and the vector math structures.
 */

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>

namespace hornet {

// ============================================================================
// Numeric Types
// ============================================================================

/**
 * @brief Primary floating-point type for simulation state
 *
 * All drone, projectile and decoy state is kept in double precision.
 */
using Real = double;

/**
 * @brief Single precision floating-point (observations, rendering)
 */
using Float32 = float;

// Integer types
using Int32  = std::int32_t;
using Int64  = std::int64_t;
using UInt8  = std::uint8_t;
using UInt32 = std::uint32_t;
using UInt64 = std::uint64_t;
using SizeT  = std::size_t;

// ============================================================================
// Entity Identifiers
// ============================================================================

/**
 * @brief Stable handle of a simulation entity (arena slot, projectile, decoy)
 */
using EntityId = UInt32;

/**
 * @brief Invalid entity ID constant
 */
constexpr EntityId INVALID_ENTITY_ID = std::numeric_limits<EntityId>::max();

/**
 * @brief Per-agent dictionary keyed by the agent's string id ("red_0", ...)
 */
template <typename T>
using AgentMap = std::unordered_map<std::string, T>;

// ============================================================================
// Math Structures
// ============================================================================

/**
 * @brief 3D vector (position, velocity, acceleration, etc.)
 */
struct Vec3 {
    Real x{0.0};
    Real y{0.0};
    Real z{0.0};

    constexpr Vec3() noexcept = default;
    constexpr Vec3(Real x_, Real y_, Real z_) noexcept : x(x_), y(y_), z(z_) {}

    static constexpr Vec3 Zero() noexcept { return {0.0, 0.0, 0.0}; }

    // Arithmetic
    constexpr Vec3 operator+(const Vec3& other) const noexcept {
        return {x + other.x, y + other.y, z + other.z};
    }
    constexpr Vec3 operator-(const Vec3& other) const noexcept {
        return {x - other.x, y - other.y, z - other.z};
    }
    constexpr Vec3 operator-() const noexcept {
        return {-x, -y, -z};
    }
    constexpr Vec3 operator*(Real s) const noexcept {
        return {x * s, y * s, z * s};
    }
    constexpr Vec3 operator/(Real s) const noexcept {
        return {x / s, y / s, z / s};
    }
    friend constexpr Vec3 operator*(Real s, const Vec3& v) noexcept {
        return v * s;
    }

    constexpr Vec3& operator+=(const Vec3& other) noexcept {
        return *this = *this + other;
    }
    constexpr Vec3& operator-=(const Vec3& other) noexcept {
        return *this = *this - other;
    }
    constexpr Vec3& operator*=(Real s) noexcept {
        return *this = *this * s;
    }
    constexpr Vec3& operator/=(Real s) noexcept {
        return *this = *this / s;
    }

    constexpr bool operator==(const Vec3& other) const noexcept = default;

    /// Component by axis index (0 = x, 1 = y, 2 = z)
    constexpr Real& operator[](SizeT axis) noexcept {
        return axis == 0 ? x : (axis == 1 ? y : z);
    }
    constexpr Real operator[](SizeT axis) const noexcept {
        return axis == 0 ? x : (axis == 1 ? y : z);
    }

    constexpr Real dot(const Vec3& o) const noexcept {
        return x * o.x + y * o.y + z * o.z;
    }

    constexpr Real length_squared() const noexcept { return dot(*this); }

    /// Euclidean length (defined in vector.cpp)
    Real length() const noexcept;

    /// Unit vector in the same direction; near-zero vectors are returned unchanged
    Vec3 normalized() const noexcept;
};

/**
 * @brief Orientation as roll / pitch / yaw in radians, each in (-pi, pi]
 */
struct EulerAngles {
    Real roll{0.0};
    Real pitch{0.0};
    Real yaw{0.0};

    constexpr bool operator==(const EulerAngles& other) const noexcept = default;
};

// ============================================================================
// Vector Helpers (defined in src/core/math/vector.cpp)
// ============================================================================

namespace math {

Real distance(const Vec3& a, const Vec3& b);
Real distance_squared(const Vec3& a, const Vec3& b);

/**
 * @brief Wrap an angle into the half-open interval (-pi, pi]
 */
Real wrap_angle(Real angle) noexcept;

/**
 * @brief Unit heading for the given pitch and yaw (x forward at yaw 0, z up)
 */
Vec3 heading_from(Real pitch, Real yaw) noexcept;

} // namespace math

// ============================================================================
// Mathematical Constants
// ============================================================================

namespace constants {

/// Pi
constexpr Real PI = 3.14159265358979323846;

/// Two pi
constexpr Real TWO_PI = 2.0 * PI;

/// Feet to meters conversion
constexpr Real FT_TO_M = 0.3048;

/// Nautical miles to meters conversion
constexpr Real NMI_TO_M = 1852.0;

} // namespace constants

} // namespace hornet
