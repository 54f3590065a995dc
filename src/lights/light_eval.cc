#include "lights/light_eval.h"

#include <algorithm>
#include <cmath>

#include "core/constants.h"

namespace glnt {

Point3 LightPosition(const Light& light, const Point3& shading_point) {
    switch (light.type) {
        case LightType::Area:
            return light.transform.ApplyPoint(light.position);
        case LightType::Directional:
            return shading_point -
                   light.direction * Distance(shading_point, light.position);
        case LightType::Point:
            break;
    }
    return light.position;
}

Spectrum LightRadiance(const Light& light, const Point3& shading_point) {
    if (light.type == LightType::Directional) {
        return light.intensity;
    }
    Vec3 d = shading_point - LightPosition(light, shading_point);
    return light.intensity * kInvFourPi / d.LengthSquared();
}

Vec3 LightAxis(const Light& light) {
    if (light.type != LightType::Area) {
        return light.direction;
    }
    Vec3 axis = light.transform.ApplyVector(light.direction);
    Float len = axis.Length();
    return len > 0.0f ? axis / len : Vec3();
}

// Spot cone with a linear soft edge. 1 inside the inner cone
// (opening - penumbra), 0 outside the opening angle.
static Float SpotFalloff(const SpotCone& cone, Float cos_theta) {
    if (cos_theta < cone.cos_opening_angle) {
        return 0.0f;
    }
    Float falloff = 1.0f;
    if (cone.penumbra_angle > 0.0f) {
        Float theta = std::acos(std::clamp(cos_theta, -1.0f, 1.0f));
        falloff *= std::clamp((cone.opening_angle - theta) / cone.penumbra_angle, 0.0f, 1.0f);
    }
    return falloff;
}

LightAttributes EvalLightAttributes(const Light& light, const Point3& shading_point,
                                    Float shadow) {
    LightAttributes attrs;  // pdf, normal and corners start at zero
    attrs.p = LightPosition(light, shading_point);
    attrs.shadow = shadow;

    Vec3 to_light = attrs.p - shading_point;
    Float dist_sq = to_light.LengthSquared();
    // Coincident points get no direction rather than a NaN one
    attrs.L = dist_sq > kMinDistanceSquared ? to_light / std::sqrt(dist_sq) : Vec3();

    attrs.intensity = light.intensity;

    if (light.type == LightType::Directional) {
        attrs.L = -light.direction;
        return attrs;
    }

    Float cos_theta = -Dot(attrs.L, LightAxis(light));
    Float attenuation;
    if (light.type == LightType::Area) {
        attenuation = std::max(0.0f, cos_theta) * light.surface_area;
    } else {
        attenuation = SpotFalloff(light.spot, cos_theta);
    }
    attenuation /= std::max(kMinDistanceSquared, dist_sq);

    attrs.intensity *= attenuation;
    return attrs;
}

}  // namespace glnt
