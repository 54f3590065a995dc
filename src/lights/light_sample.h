#ifndef GLNT_LIGHTS_LIGHT_SAMPLE_H_
#define GLNT_LIGHTS_LIGHT_SAMPLE_H_

#include <optional>

#include "core/vec3.h"
#include "lights/light.h"
#include "lights/light_attributes.h"

namespace glnt {

// Draws one point on the light for Monte Carlo integration.
// Point and directional lights are point masses: pdf is 1, the normal is the
// sample direction. Area lights need a geometry collaborator (see
// SampleMeshLight / SampleRectLight) and yield std::nullopt here.
// `u` is a uniform sample in [0,1)^3.
std::optional<LightAttributes> SampleLight(const Point3& shading_point, const Light& light,
                                           const Vec3& u);

// Stratified sample on a rectangular area light. `u` jitters inside the cell
// `stratum` of a `grid` laid over the light's extent.
// intensity is the stored intensity divided by the area-measure pdf, or zero
// when the sample faces away from the shading point or the pdf vanishes.
// Non-area lights yield std::nullopt whatever the grid. For area lights, throws
// std::invalid_argument for a grid with a non-positive dimension.
std::optional<LightAttributes> SampleRectLight(const Point3& shading_point, const Light& light,
                                               const Vec2& u, StratumIndex stratum,
                                               StrataGrid grid);

// Converts a sample on an emitter with unit normal `n` into its area-measure
// pdf and fills L, pdf and intensity of `attrs` accordingly. Shared by the
// rectangle and mesh samplers.
void ResolveAreaSample(const Point3& shading_point, const Light& light, const Point3& sample_point,
                       const Vec3& n, LightAttributes* attrs);

}  // namespace glnt

#endif  // GLNT_LIGHTS_LIGHT_SAMPLE_H_
