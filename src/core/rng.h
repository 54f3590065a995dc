#ifndef GLNT_CORE_RNG_H_
#define GLNT_CORE_RNG_H_

#include <algorithm>
#include <cstdint>

#include "core/constants.h"
#include "core/vec3.h"

namespace glnt {

// PCG32. Supplies the uniform samples the light samplers consume; the
// samplers themselves never own a generator.
class RNG {
  public:
    RNG() : state_(kRNGStateSeed), inc_(kRNGIncSeed) {}

    // sequence_index selects the stream, offset advances the start state
    RNG(uint64_t sequence_index, uint64_t offset) : state_(0U), inc_((sequence_index << 1U) | 1U) {
        UniformUInt32();
        state_ += offset;
        UniformUInt32();
    }

    uint32_t UniformUInt32() {
        uint64_t oldstate = state_;
        state_ = oldstate * kPCGMultiplier + inc_;
        auto xorshifted =
            static_cast<uint32_t>(((oldstate >> kPCGShift1) ^ oldstate) >> kPCGShift2);
        auto rot = static_cast<uint32_t>(oldstate >> kPCGShift3);
        return (xorshifted >> rot) | (xorshifted << ((~rot + 1U) & kPCGRotationMask));
    }

    // Returns float in [0, 1)
    Float UniformFloat() {
        return std::min(static_cast<Float>(UniformUInt32()) * kInv2Pow32, kOneMinusEpsilon);
    }

    Vec2 UniformVec2() {
        Float a = UniformFloat();
        Float b = UniformFloat();
        return Vec2(a, b);
    }

    Vec3 UniformVec3() {
        Float a = UniformFloat();
        Float b = UniformFloat();
        Float c = UniformFloat();
        return Vec3(a, b, c);
    }

  private:
    static constexpr uint64_t kPCGMultiplier = 6364136223846793005ULL;
    static constexpr uint32_t kPCGShift1 = 18U;
    static constexpr uint32_t kPCGShift2 = 27U;
    static constexpr uint32_t kPCGShift3 = 59U;
    static constexpr uint32_t kPCGRotationMask = 31U;
    static constexpr Float kInv2Pow32 = 0x1p-32F;

    uint64_t state_;
    uint64_t inc_;
};

}  // namespace glnt

#endif  // GLNT_CORE_RNG_H_
