#ifndef GLNT_LIGHTS_MESH_LIGHT_H_
#define GLNT_LIGHTS_MESH_LIGHT_H_

#include <cstdint>
#include <optional>

#include "core/vec3.h"
#include "geometry/mesh.h"
#include "lights/light.h"
#include "lights/light_attributes.h"

namespace glnt {

// Read-only access to the triangles behind an area light. Vertices are in
// the light's object space; the sampler applies the light transform.
class LightGeometry {
  public:
    virtual ~LightGeometry() = default;

    virtual uint32_t IndexCount() const = 0;
    virtual uint32_t Index(uint32_t i) const = 0;
    virtual Point3 Vertex(uint32_t i) const = 0;
};

// LightGeometry over an in-memory Mesh. Holds a reference; the mesh must outlive it.
class MeshLightGeometry : public LightGeometry {
  public:
    explicit MeshLightGeometry(const Mesh& mesh) : mesh_(mesh) {}

    uint32_t IndexCount() const override { return static_cast<uint32_t>(mesh_.indices.size()); }
    uint32_t Index(uint32_t i) const override { return mesh_.indices[i]; }
    Point3 Vertex(uint32_t i) const override { return mesh_.p[i]; }

  private:
    const Mesh& mesh_;
};

// Samples a triangle of `geometry` (picked with u.z, every triangle equally
// likely regardless of its area) and a uniform point on it (u.x, u.y).
// The pdf/facing contract matches SampleRectLight and uses the descriptor's
// surface_area. std::nullopt for non-area lights or geometry without triangles.
std::optional<LightAttributes> SampleMeshLight(const Point3& shading_point, const Light& light,
                                               const LightGeometry& geometry, const Vec3& u);

}  // namespace glnt

#endif  // GLNT_LIGHTS_MESH_LIGHT_H_
