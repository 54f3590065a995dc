#ifndef GLNT_CORE_SPECTRUM_H_
#define GLNT_CORE_SPECTRUM_H_

#include <algorithm>
#include <cmath>
#include <iostream>

#include "core/constants.h"

namespace glnt {

// Three-channel radiometric quantity (intensity, radiance, irradiance)
class Spectrum {
  public:
    Spectrum() : c{0, 0, 0} {}
    explicit Spectrum(Float r, Float g, Float b) : c{r, g, b} {}
    explicit Spectrum(Float v) : c{v, v, v} {}

    Float r() const { return c[0]; }
    Float g() const { return c[1]; }
    Float b() const { return c[2]; }

    Float operator[](int i) const { return c[i]; }
    Float& operator[](int i) { return c[i]; }

    Spectrum& operator+=(const Spectrum& v) {
        c[0] += v.c[0];
        c[1] += v.c[1];
        c[2] += v.c[2];
        return *this;
    }

    Spectrum& operator*=(const Spectrum& v) {
        c[0] *= v.c[0];
        c[1] *= v.c[1];
        c[2] *= v.c[2];
        return *this;
    }

    Spectrum& operator*=(Float t) {
        c[0] *= t;
        c[1] *= t;
        c[2] *= t;
        return *this;
    }

    Spectrum& operator/=(Float t) {
        Float k = 1.0f / t;
        c[0] *= k;
        c[1] *= k;
        c[2] *= k;
        return *this;
    }

    bool IsBlack() const { return c[0] == 0 && c[1] == 0 && c[2] == 0; }
    bool HasNaNs() const { return std::isnan(c[0]) || std::isnan(c[1]) || std::isnan(c[2]); }
    bool IsFinite() const {
        return std::isfinite(c[0]) && std::isfinite(c[1]) && std::isfinite(c[2]);
    }

    Float MaxComponent() const { return std::max({c[0], c[1], c[2]}); }
    Float MinComponent() const { return std::min({c[0], c[1], c[2]}); }

    // Rec.709
    Float Luminance() const { return 0.2126f * c[0] + 0.7152f * c[1] + 0.0722f * c[2]; }

  private:
    Float c[3];
};

inline std::ostream& operator<<(std::ostream& out, const Spectrum& s) {
    return out << s.r() << ' ' << s.g() << ' ' << s.b();
}

inline Spectrum operator+(const Spectrum& a, const Spectrum& b) {
    return Spectrum(a.r() + b.r(), a.g() + b.g(), a.b() + b.b());
}

inline Spectrum operator*(const Spectrum& a, const Spectrum& b) {
    return Spectrum(a.r() * b.r(), a.g() * b.g(), a.b() * b.b());
}

inline Spectrum operator*(Float t, const Spectrum& s) {
    return Spectrum(t * s.r(), t * s.g(), t * s.b());
}

inline Spectrum operator*(const Spectrum& s, Float t) { return t * s; }

inline Spectrum operator/(const Spectrum& s, Float t) {
    return Spectrum(s.r() / t, s.g() / t, s.b() / t);
}

}  // namespace glnt

#endif  // GLNT_CORE_SPECTRUM_H_
