#ifndef GLNT_LIGHTS_LIGHT_H_
#define GLNT_LIGHTS_LIGHT_H_

#include <cstdint>

#include "core/constants.h"
#include "core/spectrum.h"
#include "core/transform.h"
#include "core/vec3.h"
#include "geometry/mesh.h"

namespace glnt {

enum class LightType : uint32_t {
    Point,        // Point or spot light
    Directional,  // Infinitely distant, defined by orientation only
    Area,         // Emissive surface (rectangle or mesh)
};

const char* LightTypeName(LightType type);

// Cone of a point light. An opening angle of pi makes it isotropic.
struct SpotCone {
    Float opening_angle = kPi;        // Radians, half-angle of the cone
    Float cos_opening_angle = -1.0f;  // cos(opening_angle), cached for the in-cone test
    Float penumbra_angle = 0.0f;      // Radians, width of the soft edge inside the cone
};

// Extent of a rectangular area light in object space. The world-space
// lengths of these vectors are the side lengths the stratified sampler
// spreads its samples over.
struct RectExtent {
    Vec3 tangent;
    Vec3 bitangent;
};

/**
 * Light descriptor
 * - Shared fields are meaningful for every type, payloads only for their own
 * - Area lights store position/direction/extent in object space and place
 *   them through `transform`. Point and directional lights are world space.
 * - Nothing here is validated by the evaluation routines; use the factories
 *   below to build well-formed descriptors.
 */
struct Light {
    LightType type = LightType::Point;

    Point3 position;
    Vec3 direction = Vec3(0.0f, 0.0f, -1.0f);
    Transform transform;  // Object to world
    Spectrum intensity;
    Float surface_area = 0.0f;

    SpotCone spot;
    RectExtent rect;
};

// Isotropic point light
Light MakePointLight(const Point3& position, const Spectrum& intensity);

// Angles in radians. Throws std::invalid_argument for a zero-length direction
// or a non-finite angle.
Light MakeSpotLight(const Point3& position, const Vec3& direction, const Spectrum& intensity,
                    Float opening_angle, Float penumbra_angle);

// Throws std::invalid_argument for a zero-length direction
Light MakeDirectionalLight(const Vec3& direction, const Spectrum& intensity);

// Unit quad [-1,1]^2 in the local XY plane emitting along local +Z, placed by `transform`.
// surface_area is |T_w x B_w|. Throws std::invalid_argument when `transform` maps
// the local +Z axis to zero (e.g. a zero z scale).
Light MakeRectLight(const Transform& transform, const Spectrum& intensity);

// Area light whose surface is `mesh` (object space) placed by `transform`.
// surface_area is the summed world-space triangle area. Throws if the mesh is malformed.
Light MakeMeshLight(const Transform& transform, const Spectrum& intensity, const Mesh& mesh);

}  // namespace glnt

#endif  // GLNT_LIGHTS_LIGHT_H_
