#ifndef GLNT_GEOMETRY_MESH_H_
#define GLNT_GEOMETRY_MESH_H_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/vec3.h"

namespace glnt {

// Indexed triangle mesh backing an emissive surface. Positions are in the
// light's object space.
struct Mesh {
    std::vector<Point3> p;          // Positions
    std::vector<uint32_t> indices;  // Three per triangle

    size_t TriangleCount() const { return indices.size() / 3; }

    // Throws if the index buffer is not a whole number of triangles or
    // references a vertex that does not exist
    void Validate() const {
        if (indices.size() % 3 != 0) {
            throw std::invalid_argument("Mesh index count " + std::to_string(indices.size()) +
                                        " is not a multiple of 3");
        }
        for (uint32_t idx : indices) {
            if (idx >= p.size()) {
                throw std::invalid_argument("Mesh index " + std::to_string(idx) +
                                            " out of range (" + std::to_string(p.size()) +
                                            " vertices)");
            }
        }
    }
};

// Flat quad as two triangles sharing the p0-p2 diagonal.
// p0 (bottom-left), p1 (bottom-right), p2 (top-right), p3 (top-left), CCW winding
inline Mesh CreateQuad(const Point3& p0, const Point3& p1, const Point3& p2, const Point3& p3) {
    Mesh mesh;
    mesh.p = {p0, p1, p2, p3};
    mesh.indices = {0, 1, 2, 0, 2, 3};
    return mesh;
}

}  // namespace glnt

#endif  // GLNT_GEOMETRY_MESH_H_
