#ifndef GLNT_IO_RIG_LOADER_H_
#define GLNT_IO_RIG_LOADER_H_

#include <string>
#include <vector>

#include "geometry/mesh.h"
#include "lights/light.h"
#include "session/probe_options.h"

/**
 * JSON light rigs
 * {
 *   "lights": [ {"type": "point" | "spot" | "directional" | "rect" | "mesh", ...} ],
 *   "probe":  { "origin", "u", "v", "normal", "width", "height", "mode",
 *               "samples", "strata", "threads", "output" }
 * }
 * Angles are in degrees. Errors throw std::runtime_error naming the light index.
 */

namespace glnt {

struct RigLight {
    std::string name;
    Light light;
    int mesh_id = -1;  // Index into LightRig::meshes for mesh lights, -1 otherwise
};

struct LightRig {
    std::vector<RigLight> lights;
    std::vector<Mesh> meshes;
    ProbeOptions probe;
};

LightRig LoadRigFromFile(const std::string& path);

// Same as LoadRigFromFile on in-memory JSON text
LightRig LoadRigFromString(const std::string& text);

}  // namespace glnt

#endif  // GLNT_IO_RIG_LOADER_H_
