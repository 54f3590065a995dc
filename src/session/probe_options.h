#ifndef GLNT_SESSION_PROBE_OPTIONS_H_
#define GLNT_SESSION_PROBE_OPTIONS_H_

#include <string>

#include "core/vec3.h"
#include "lights/light_attributes.h"

namespace glnt {

enum class ProbeMode {
    Direct,      // EvalLightAttributes at pixel centers
    MonteCarlo,  // Samplers, jittered and stratified
};

// Receiver rectangle: origin + s*u + t*v for s,t in [0,1]
struct ProbePlane {
    Point3 origin = Point3(-0.5f, 0.0f, -0.5f);
    Vec3 u = Vec3(1.0f, 0.0f, 0.0f);
    Vec3 v = Vec3(0.0f, 0.0f, 1.0f);
    Vec3 normal = Vec3(0.0f, 1.0f, 0.0f);
};

struct ProbeOptions {
    ProbePlane plane;
    int width = 64;
    int height = 64;
    ProbeMode mode = ProbeMode::Direct;
    int samples = 16;               // Per pixel, MonteCarlo only
    StrataGrid strata = {4, 4};     // Rect light stratification
    int num_threads = 0;            // 0 = auto-detect (hardware_concurrency)
    std::string outfile = "probe.ppm";
};

}  // namespace glnt

#endif  // GLNT_SESSION_PROBE_OPTIONS_H_
