/**
 * @file vector.cpp
 * @brief Vector math implementation
 */

#include "hornet/core/types.h"
#include <cmath>

namespace hornet {

// ============================================================================
// Vec3 Member Function Implementations
// ============================================================================

Real Vec3::length() const noexcept {
    return std::sqrt(length_squared());
}

Vec3 Vec3::normalized() const noexcept {
    const Real len = length();
    return len > 1e-10 ? *this / len : *this;
}

// ============================================================================
// Free Function Utilities
// ============================================================================

namespace math {

Real distance(const Vec3& a, const Vec3& b) {
    return (a - b).length();
}

Real distance_squared(const Vec3& a, const Vec3& b) {
    return (a - b).length_squared();
}

Real wrap_angle(Real angle) noexcept {
    Real wrapped = std::fmod(angle + constants::PI, constants::TWO_PI);
    if (wrapped < 0.0) {
        wrapped += constants::TWO_PI;
    }
    wrapped -= constants::PI;

    // fmod lands on the closed lower end; fold it onto +pi
    return (wrapped <= -constants::PI) ? constants::PI : wrapped;
}

Vec3 heading_from(Real pitch, Real yaw) noexcept {
    const Real cos_pitch = std::cos(pitch);
    return {
        cos_pitch * std::cos(yaw),
        cos_pitch * std::sin(yaw),
        std::sin(pitch)
    };
}

} // namespace math

} // namespace hornet
