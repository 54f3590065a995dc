#ifndef GLNT_CORE_VEC3_H_
#define GLNT_CORE_VEC3_H_

#include <cmath>
#include <iostream>

#include "core/constants.h"

namespace glnt {

struct Vec3 {
  public:
    Float e[3];

    Vec3() : e{0, 0, 0} {}
    Vec3(Float e0, Float e1, Float e2) : e{e0, e1, e2} {}

    Float x() const { return e[0]; }
    Float y() const { return e[1]; }
    Float z() const { return e[2]; }

    Vec3 operator-() const { return Vec3(-e[0], -e[1], -e[2]); }
    Float operator[](int i) const { return e[i]; }
    Float& operator[](int i) { return e[i]; }

    Vec3& operator+=(const Vec3& v) {
        e[0] += v.e[0];
        e[1] += v.e[1];
        e[2] += v.e[2];
        return *this;
    }

    Vec3& operator-=(const Vec3& v) {
        e[0] -= v.e[0];
        e[1] -= v.e[1];
        e[2] -= v.e[2];
        return *this;
    }

    Vec3& operator*=(Float t) {
        e[0] *= t;
        e[1] *= t;
        e[2] *= t;
        return *this;
    }

    Vec3& operator/=(Float t) { return *this *= 1 / t; }

    Float Length() const { return std::sqrt(LengthSquared()); }
    Float LengthSquared() const { return e[0] * e[0] + e[1] * e[1] + e[2] * e[2]; }

    bool IsZero() const { return e[0] == 0 && e[1] == 0 && e[2] == 0; }
    bool IsFinite() const {
        return std::isfinite(e[0]) && std::isfinite(e[1]) && std::isfinite(e[2]);
    }
};

// point alias for Vec3
using Point3 = Vec3;

// 2D sample / coordinate pair
struct Vec2 {
    Float e[2];

    Vec2() : e{0, 0} {}
    Vec2(Float e0, Float e1) : e{e0, e1} {}

    Float x() const { return e[0]; }
    Float y() const { return e[1]; }

    Float operator[](int i) const { return e[i]; }
    Float& operator[](int i) { return e[i]; }
};

inline std::ostream& operator<<(std::ostream& out, const Vec3& v) {
    return out << v.e[0] << ' ' << v.e[1] << ' ' << v.e[2];
}

inline Vec3 operator+(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[0] + v.e[0], u.e[1] + v.e[1], u.e[2] + v.e[2]);
}

inline Vec3 operator-(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[0] - v.e[0], u.e[1] - v.e[1], u.e[2] - v.e[2]);
}

inline Vec3 operator*(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[0] * v.e[0], u.e[1] * v.e[1], u.e[2] * v.e[2]);
}

inline Vec3 operator*(Float t, const Vec3& v) { return Vec3(t * v.e[0], t * v.e[1], t * v.e[2]); }

inline Vec3 operator*(const Vec3& v, Float t) { return t * v; }

inline Vec3 operator/(const Vec3& v, Float t) { return (1 / t) * v; }

inline Float Dot(const Vec3& u, const Vec3& v) {
    return u.e[0] * v.e[0] + u.e[1] * v.e[1] + u.e[2] * v.e[2];
}

inline Vec3 Cross(const Vec3& u, const Vec3& v) {
    return Vec3(u.e[1] * v.e[2] - u.e[2] * v.e[1], u.e[2] * v.e[0] - u.e[0] * v.e[2],
                u.e[0] * v.e[1] - u.e[1] * v.e[0]);
}

inline Vec3 Normalize(const Vec3& v) { return v / v.Length(); }

inline Float Distance(const Point3& a, const Point3& b) { return (a - b).Length(); }

inline Float DistanceSquared(const Point3& a, const Point3& b) { return (a - b).LengthSquared(); }

}  // namespace glnt

#endif  // GLNT_CORE_VEC3_H_
