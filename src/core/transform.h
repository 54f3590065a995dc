#ifndef GLNT_CORE_TRANSFORM_H_
#define GLNT_CORE_TRANSFORM_H_

#include <cmath>

#include "core/constants.h"
#include "core/vec3.h"

namespace glnt {

// Affine object-to-world matrix, row-major, acting on column vectors.
// The bottom row is kept for completeness but is expected to be (0, 0, 0, 1).
class Transform {
  public:
    Transform() : m{{1, 0, 0, 0}, {0, 1, 0, 0}, {0, 0, 1, 0}, {0, 0, 0, 1}} {}

    explicit Transform(const Float rows[4][4]) {
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                m[i][j] = rows[i][j];
            }
        }
    }

    static Transform Identity() { return Transform(); }

    static Transform Translate(const Vec3& t) {
        Transform r;
        r.m[0][3] = t.x();
        r.m[1][3] = t.y();
        r.m[2][3] = t.z();
        return r;
    }

    static Transform Scale(const Vec3& s) {
        Transform r;
        r.m[0][0] = s.x();
        r.m[1][1] = s.y();
        r.m[2][2] = s.z();
        return r;
    }

    // Rotations take radians
    static Transform RotateX(Float theta) {
        Float c = std::cos(theta), s = std::sin(theta);
        Transform r;
        r.m[1][1] = c;
        r.m[1][2] = -s;
        r.m[2][1] = s;
        r.m[2][2] = c;
        return r;
    }

    static Transform RotateY(Float theta) {
        Float c = std::cos(theta), s = std::sin(theta);
        Transform r;
        r.m[0][0] = c;
        r.m[0][2] = s;
        r.m[2][0] = -s;
        r.m[2][2] = c;
        return r;
    }

    static Transform RotateZ(Float theta) {
        Float c = std::cos(theta), s = std::sin(theta);
        Transform r;
        r.m[0][0] = c;
        r.m[0][1] = -s;
        r.m[1][0] = s;
        r.m[1][1] = c;
        return r;
    }

    // Scale -> Rotate -> Translate. Rotation angles are in degrees and are
    // applied in Y-X-Z order (yaw, pitch, roll).
    static Transform FromTRS(const Vec3& translate, const Vec3& rotate_deg, const Vec3& scale) {
        Transform rotation = RotateZ(DegreesToRadians(rotate_deg.z())) *
                             RotateX(DegreesToRadians(rotate_deg.x())) *
                             RotateY(DegreesToRadians(rotate_deg.y()));
        return Translate(translate) * rotation * Scale(scale);
    }

    Transform operator*(const Transform& o) const {
        Transform r;
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                r.m[i][j] = m[i][0] * o.m[0][j] + m[i][1] * o.m[1][j] + m[i][2] * o.m[2][j] +
                            m[i][3] * o.m[3][j];
            }
        }
        return r;
    }

    // Points pick up the translation column
    Point3 ApplyPoint(const Point3& p) const {
        return Point3(m[0][0] * p.x() + m[0][1] * p.y() + m[0][2] * p.z() + m[0][3],
                      m[1][0] * p.x() + m[1][1] * p.y() + m[1][2] * p.z() + m[1][3],
                      m[2][0] * p.x() + m[2][1] * p.y() + m[2][2] * p.z() + m[2][3]);
    }

    // Vectors ignore it
    Vec3 ApplyVector(const Vec3& v) const {
        return Vec3(m[0][0] * v.x() + m[0][1] * v.y() + m[0][2] * v.z(),
                    m[1][0] * v.x() + m[1][1] * v.y() + m[1][2] * v.z(),
                    m[2][0] * v.x() + m[2][1] * v.y() + m[2][2] * v.z());
    }

    Float operator()(int row, int col) const { return m[row][col]; }

  private:
    Float m[4][4];
};

}  // namespace glnt

#endif  // GLNT_CORE_TRANSFORM_H_
