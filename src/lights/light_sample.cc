#include "lights/light_sample.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "core/constants.h"
#include "lights/light_eval.h"

namespace glnt {

std::optional<LightAttributes> SampleLight(const Point3& shading_point, const Light& light,
                                           const Vec3& u) {
    (void)u;  // point masses consume no randomness

    LightAttributes attrs;
    switch (light.type) {
        case LightType::Point: {
            attrs.p = LightPosition(light, shading_point);
            Vec3 to_light = attrs.p - shading_point;
            attrs.L = to_light / std::max(kMinDistance, to_light.Length());
            attrs.n = attrs.L;
            attrs.intensity = LightRadiance(light, shading_point);
            attrs.pdf = 1.0f;
            return attrs;
        }
        case LightType::Directional:
            attrs.p = LightPosition(light, shading_point);
            attrs.L = -light.direction;
            attrs.n = attrs.L;
            attrs.intensity = light.intensity;
            attrs.pdf = 1.0f;
            return attrs;
        case LightType::Area:
            break;
    }
    return std::nullopt;
}

void ResolveAreaSample(const Point3& shading_point, const Light& light, const Point3& sample_point,
                       const Vec3& n, LightAttributes* attrs) {
    attrs->p = sample_point;
    attrs->n = n;

    Vec3 to_light = sample_point - shading_point;
    Float dist_sq = to_light.LengthSquared();
    attrs->L = to_light / std::max(kMinDistance, std::sqrt(dist_sq));

    // Solid angle -> area: pdf_A = d^2 / (|cos| * A)
    Float cos_light = Dot(n, attrs->L);
    Float denom = std::abs(cos_light) * light.surface_area;
    attrs->pdf = denom > 0.0f ? dist_sq / denom : 0.0f;
    if (!std::isfinite(attrs->pdf)) {
        attrs->pdf = 0.0f;
    }

    // Only the emitting side contributes
    if (attrs->pdf > 0.0f && cos_light < 0.0f) {
        attrs->intensity = light.intensity / attrs->pdf;
    } else {
        attrs->intensity = Spectrum(0.0f);
    }
}

std::optional<LightAttributes> SampleRectLight(const Point3& shading_point, const Light& light,
                                               const Vec2& u, StratumIndex stratum,
                                               StrataGrid grid) {
    if (light.type != LightType::Area) {
        return std::nullopt;
    }
    if (grid.nx <= 0 || grid.ny <= 0) {
        throw std::invalid_argument("SampleRectLight: strata grid must be positive, got " +
                                    std::to_string(grid.nx) + "x" + std::to_string(grid.ny));
    }

    Point3 center = light.transform.ApplyPoint(light.position);
    Vec3 n = LightAxis(light);

    Vec3 tangent = light.transform.ApplyVector(light.rect.tangent);
    Vec3 bitangent = light.transform.ApplyVector(light.rect.bitangent);
    Float extent_x = tangent.Length();
    Float extent_y = bitangent.Length();

    // Map the unit cell (stratum + u) / grid onto the light, centered on it
    Float offset_x = ((stratum.x + u.x()) / grid.nx - 0.5f) * extent_x;
    Float offset_y = ((stratum.y + u.y()) / grid.ny - 0.5f) * extent_y;

    Point3 sample_point = center;
    if (extent_x > 0.0f) sample_point += tangent * (offset_x / extent_x);
    if (extent_y > 0.0f) sample_point += bitangent * (offset_y / extent_y);

    LightAttributes attrs;
    ResolveAreaSample(shading_point, light, sample_point, n, &attrs);
    return attrs;
}

}  // namespace glnt
