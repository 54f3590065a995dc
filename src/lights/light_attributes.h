#ifndef GLNT_LIGHTS_LIGHT_ATTRIBUTES_H_
#define GLNT_LIGHTS_LIGHT_ATTRIBUTES_H_

#include "core/constants.h"
#include "core/spectrum.h"
#include "core/vec3.h"

namespace glnt {

// Everything a shading routine needs from one light at one shading point
struct LightAttributes {
    Vec3 L;              // Normalized direction from the shading point toward the light
    Float shadow = 1.0f; // Visibility factor, passed through from the caller
    Spectrum intensity;  // Light arriving at the shading point after attenuation
    Point3 p;            // Point on the light
    Vec3 n;              // Normal at that point
    Float pdf = 0.0f;    // Solid angle or area measure depending on the routine

    // Reserved for area-light geometry; always zero
    Point3 corners[4];
};

// Cell of a stratification grid
struct StratumIndex {
    int x = 0;
    int y = 0;
};

// Number of cells along each axis
struct StrataGrid {
    int nx = 1;
    int ny = 1;
};

}  // namespace glnt

#endif  // GLNT_LIGHTS_LIGHT_ATTRIBUTES_H_
