#include "lights/light.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace glnt {

const char* LightTypeName(LightType type) {
    switch (type) {
        case LightType::Point:
            return "point";
        case LightType::Directional:
            return "directional";
        case LightType::Area:
            return "area";
    }
    return "unknown";
}

static Vec3 CheckedDirection(const Vec3& dir, const char* what) {
    Float len = dir.Length();
    if (!(len > 0.0f) || !std::isfinite(len)) {  // NaNs fail the first test
        throw std::invalid_argument(std::string(what) + ": direction must be a non-zero vector");
    }
    return dir / len;
}

Light MakePointLight(const Point3& position, const Spectrum& intensity) {
    Light light;
    light.type = LightType::Point;
    light.position = position;
    light.intensity = intensity;
    return light;
}

Light MakeSpotLight(const Point3& position, const Vec3& direction, const Spectrum& intensity,
                    Float opening_angle, Float penumbra_angle) {
    Light light = MakePointLight(position, intensity);
    light.direction = CheckedDirection(direction, "MakeSpotLight");
    if (!std::isfinite(opening_angle) || !std::isfinite(penumbra_angle)) {
        throw std::invalid_argument("MakeSpotLight: cone angles must be finite");
    }

    light.spot.opening_angle = std::clamp(opening_angle, 0.0f, kPi);
    light.spot.cos_opening_angle = std::cos(light.spot.opening_angle);
    // The soft edge lives inside the cone
    light.spot.penumbra_angle = std::clamp(penumbra_angle, 0.0f, light.spot.opening_angle);
    return light;
}

Light MakeDirectionalLight(const Vec3& direction, const Spectrum& intensity) {
    Light light;
    light.type = LightType::Directional;
    light.direction = CheckedDirection(direction, "MakeDirectionalLight");
    light.intensity = intensity;
    return light;
}

Light MakeRectLight(const Transform& transform, const Spectrum& intensity) {
    Light light;
    light.type = LightType::Area;
    light.transform = transform;
    light.intensity = intensity;
    light.position = Point3(0.0f, 0.0f, 0.0f);
    light.direction = Vec3(0.0f, 0.0f, 1.0f);

    // Full side lengths of the [-1,1] quad
    light.rect.tangent = Vec3(2.0f, 0.0f, 0.0f);
    light.rect.bitangent = Vec3(0.0f, 2.0f, 0.0f);

    // Under shear the sides are no longer perpendicular; the parallelogram area is |T x B|
    Vec3 tangent = transform.ApplyVector(light.rect.tangent);
    Vec3 bitangent = transform.ApplyVector(light.rect.bitangent);
    light.surface_area = Cross(tangent, bitangent).Length();

    // A transform that flattens the emission axis would leave the light dark everywhere
    Float axis_len = transform.ApplyVector(light.direction).Length();
    if (!(axis_len > 0.0f) || !std::isfinite(axis_len) || !std::isfinite(light.surface_area)) {
        throw std::invalid_argument("MakeRectLight: transform collapses the light's normal axis");
    }
    return light;
}

Light MakeMeshLight(const Transform& transform, const Spectrum& intensity, const Mesh& mesh) {
    mesh.Validate();

    Light light;
    light.type = LightType::Area;
    light.transform = transform;
    light.intensity = intensity;

    Float area = 0.0f;
    for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
        Point3 p0 = transform.ApplyPoint(mesh.p[mesh.indices[i]]);
        Point3 p1 = transform.ApplyPoint(mesh.p[mesh.indices[i + 1]]);
        Point3 p2 = transform.ApplyPoint(mesh.p[mesh.indices[i + 2]]);
        area += 0.5f * Cross(p1 - p0, p2 - p0).Length();
    }
    light.surface_area = area;

    // Object-space centroid and average orientation, used by the deterministic evaluator
    Point3 centroid;
    for (const Point3& v : mesh.p) {
        centroid += v;
    }
    if (!mesh.p.empty()) {
        centroid /= static_cast<Float>(mesh.p.size());
    }
    light.position = centroid;

    Vec3 object_normal;
    for (size_t i = 0; i + 2 < mesh.indices.size(); i += 3) {
        const Point3& p0 = mesh.p[mesh.indices[i]];
        object_normal +=
            Cross(mesh.p[mesh.indices[i + 1]] - p0, mesh.p[mesh.indices[i + 2]] - p0);
    }
    light.direction = object_normal.LengthSquared() > 0.0f ? Normalize(object_normal)
                                                           : Vec3(0.0f, 0.0f, 1.0f);
    return light;
}

}  // namespace glnt
