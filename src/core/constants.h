#ifndef GLNT_CORE_CONSTANTS_H_
#define GLNT_CORE_CONSTANTS_H_

#include <cstdint>
#include <limits>

namespace glnt {

using Float = float;  // Global precision switch (can change to double)

constexpr Float kInfinity = std::numeric_limits<Float>::infinity();
constexpr Float kPi = 3.1415926535897932385F;
constexpr Float kInvFourPi = 1.0F / (4.0F * kPi);
static constexpr Float kStraightAngle = 180.0F;

constexpr uint64_t kRNGStateSeed = 0x853c49e6748fea9bULL;
constexpr uint64_t kRNGIncSeed = 0xda3e39cb94b95bdbULL;

// Largest float strictly below 1, so [0,1) samples never reach 1.0f
constexpr Float kOneMinusEpsilon = 0x1.fffffep-1;

// Squared distance below which a light and a shading point are treated as coincident,
// also the floor for the inverse-square falloff of the attribute evaluator
constexpr Float kMinDistanceSquared = 1e-3F;

// Floor for the distance used to normalize the direction toward a sampled light point
constexpr Float kMinDistance = 1e-3F;

inline Float DegreesToRadians(Float degrees) { return degrees * kPi / kStraightAngle; }

}  // namespace glnt

#endif  // GLNT_CORE_CONSTANTS_H_
