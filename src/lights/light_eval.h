#ifndef GLNT_LIGHTS_LIGHT_EVAL_H_
#define GLNT_LIGHTS_LIGHT_EVAL_H_

#include "core/spectrum.h"
#include "core/vec3.h"
#include "lights/light.h"
#include "lights/light_attributes.h"

/**
 * Deterministic light queries
 * - LightPosition: where the light effectively sits as seen from a shading point
 * - LightRadiance: intensity/(4 pi d^2) for point and area lights, raw for directional
 * - EvalLightAttributes: full record for non-stochastic direct shading
 *
 * All three are pure and keep no state, so they can be called from any
 * number of threads at once.
 */

namespace glnt {

// Directional lights have no finite position; a stand-in is synthesized
// behind the shading point along the light direction at the distance to the
// stored position so direction math downstream stays well scaled.
Point3 LightPosition(const Light& light, const Point3& shading_point);

// No distance guard: the caller keeps the shading point off the light.
Spectrum LightRadiance(const Light& light, const Point3& shading_point);

// World-space orientation axis. Area lights carry it in object space.
Vec3 LightAxis(const Light& light);

// `shadow` is stored verbatim. Attenuation:
//   directional: none
//   point:       cone cutoff, linear penumbra falloff, inverse square (floored)
//   area:        max(0, cos) * surface_area, inverse square (floored)
LightAttributes EvalLightAttributes(const Light& light, const Point3& shading_point,
                                    Float shadow);

}  // namespace glnt

#endif  // GLNT_LIGHTS_LIGHT_EVAL_H_
