#ifndef GLNT_CORE_SAMPLING_H_
#define GLNT_CORE_SAMPLING_H_

#include <cmath>
#include <cstdint>

#include "core/constants.h"
#include "core/rng.h"
#include "core/vec3.h"

namespace glnt {

// Barycentric weights for a uniform point on a triangle (sqrt trick).
// Returned as (b0, b1, b2) with b0 + b1 + b2 == 1.
inline Vec3 UniformTriangleBarycentrics(const Vec2& u) {
    Float a = std::sqrt(u.x());
    Float b0 = 1.0f - a;
    Float b1 = a * u.y();
    return Vec3(b0, b1, 1.0f - b0 - b1);
}

// 64-bit mixing function for RNG seeding
inline uint64_t SplitMix64(uint64_t z) {
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30u)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27u)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31u);
}

// Fully deterministic per-pixel RNG, thread-order independent
inline RNG MakeDeterministicPixelRNG(uint32_t x, uint32_t y, int width, uint32_t sample_index) {
    uint64_t pixel_id = (uint64_t)y * width + x;

    // Scramble the pixel ID to pick a distinct PCG sequence
    uint64_t seq = SplitMix64(pixel_id);
    uint64_t seed = SplitMix64(pixel_id ^ SplitMix64(sample_index));

    return RNG(seq, seed);
}

}  // namespace glnt

#endif  // GLNT_CORE_SAMPLING_H_
