#pragma once
/**
 * @file random.h
 * @brief Seedable random stream shared by all stochastic simulation steps
 */

#include "hornet/core/types.h"
#include <random>

namespace hornet {

/**
 * @brief Episode-owned random stream
 *
 * Wraps a 64-bit Mersenne Twister. Real-valued draws use an explicit
 * 53-bit mantissa conversion rather than std::uniform_real_distribution;
 * a seed yields the same sequence on every standard library.
 */
class RandomStream {
public:
    RandomStream() = default;
    explicit RandomStream(UInt64 seed) : engine_(seed), seed_(seed) {}

    /**
     * @brief Restart the stream from a seed
     */
    void seed(UInt64 value) {
        engine_.seed(value);
        seed_ = value;
    }

    /// Seed the stream was last restarted from
    UInt64 current_seed() const noexcept { return seed_; }

    /**
     * @brief Uniform double in [0, 1)
     */
    Real next_unit() {
        return static_cast<Real>(engine_() >> 11) * 0x1.0p-53;
    }

    /**
     * @brief Uniform double in [lo, hi)
     */
    Real uniform(Real lo, Real hi) {
        return lo + (hi - lo) * next_unit();
    }

    /**
     * @brief Vector with each component drawn uniformly from [lo, hi)
     *
     * Components are drawn in x, y, z order.
     */
    Vec3 uniform_vec3(Real lo, Real hi) {
        Vec3 v;
        v.x = uniform(lo, hi);
        v.y = uniform(lo, hi);
        v.z = uniform(lo, hi);
        return v;
    }

private:
    std::mt19937_64 engine_{0};
    UInt64 seed_{0};
};

} // namespace hornet
