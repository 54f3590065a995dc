#include "lights/mesh_light.h"

#include <algorithm>

#include "core/sampling.h"
#include "lights/light_sample.h"

namespace glnt {

std::optional<LightAttributes> SampleMeshLight(const Point3& shading_point, const Light& light,
                                               const LightGeometry& geometry, const Vec3& u) {
    if (light.type != LightType::Area) {
        return std::nullopt;
    }
    uint32_t triangle_count = geometry.IndexCount() / 3;
    if (triangle_count == 0) {
        return std::nullopt;
    }

    uint32_t tri = std::min(static_cast<uint32_t>(u.z() * triangle_count), triangle_count - 1);
    uint32_t base = tri * 3;

    const Transform& xf = light.transform;
    Point3 p0 = xf.ApplyPoint(geometry.Vertex(geometry.Index(base)));
    Point3 p1 = xf.ApplyPoint(geometry.Vertex(geometry.Index(base + 1)));
    Point3 p2 = xf.ApplyPoint(geometry.Vertex(geometry.Index(base + 2)));

    Vec3 b = UniformTriangleBarycentrics(Vec2(u.x(), u.y()));
    Point3 sample_point = b.x() * p0 + b.y() * p1 + b.z() * p2;

    // Geometric normal; degenerate triangles keep a zero normal and therefore a zero pdf
    Vec3 c = Cross(p1 - p0, p2 - p0);
    Float len = c.Length();
    Vec3 n = len > 0.0f ? c / len : Vec3();

    LightAttributes attrs;
    ResolveAreaSample(shading_point, light, sample_point, n, &attrs);
    return attrs;
}

}  // namespace glnt
