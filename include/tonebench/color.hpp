#pragma once
#include "tonebench/vec3.hpp"
#include <cstdint>
#include <array>
#include <algorithm>
#include <cmath>

namespace tb {

// Linear RGB. Unless a function says otherwise the working space is ACEScg (AP1 primaries, D60).
using color = Vec3;

// --- Helpers ---
inline color lerp(const color& a, const color& b, double t) { return a*(1.0 - t) + b*t; }

// a + t*(b - a), per channel, in linear space.
inline color blend(const color& a, const color& b, double t) { return a + (b - a)*t; }

inline double saturate(double x) { return std::min(1.0, std::max(0.0, x)); }
inline color  saturate(const color& c) { return color(saturate(c.x), saturate(c.y), saturate(c.z)); }

// --- Primaries of the working space ---
namespace acescg {
inline color red()   { return color(1.0, 0.0, 0.0); }
inline color green() { return color(0.0, 1.0, 0.0); }
inline color blue()  { return color(0.0, 0.0, 1.0); }
} // namespace acescg

// --- AP1 <-> Rec.709 (D60 <-> D65, Bradford) ---
struct Mat3 {
    double m[3][3];
    color operator*(const color& c) const {
        return color(m[0][0]*c.x + m[0][1]*c.y + m[0][2]*c.z,
                     m[1][0]*c.x + m[1][1]*c.y + m[1][2]*c.z,
                     m[2][0]*c.x + m[2][1]*c.y + m[2][2]*c.z);
    }
};

inline const Mat3& acescg_to_rec709() {
    static const Mat3 M = {{
        { 1.70505, -0.62179, -0.08326},
        {-0.13026,  1.14080, -0.01055},
        {-0.02400, -0.12897,  1.15297}
    }};
    return M;
}
inline const Mat3& rec709_to_acescg() {
    static const Mat3 M = {{
        {0.61319, 0.33951, 0.04737},
        {0.07021, 0.91634, 0.01345},
        {0.02062, 0.10957, 0.86961}
    }};
    return M;
}

inline color linear_srgb_from_acescg(const color& c) { return acescg_to_rec709() * c; }
inline color acescg_from_linear_srgb(const color& c) { return rec709_to_acescg() * c; }

// Linear <-> sRGB (piecewise IEC 61966-2-1 curve). Input to srgb_from_linear is expected in [0,1].
inline double srgb_from_linear_1(double x) {
    return (x <= 0.0031308) ? 12.92*x : 1.055*std::pow(x, 1.0/2.4) - 0.055;
}
inline double linear_from_srgb_1(double x) {
    return (x <= 0.04045) ? x/12.92 : std::pow((x + 0.055)/1.055, 2.4);
}
inline color srgb_from_linear(const color& c) {
    return color(srgb_from_linear_1(c.x), srgb_from_linear_1(c.y), srgb_from_linear_1(c.z));
}

// Pack to 8-bit, rounding to nearest (assumes input is already tonemapped/encoded).
inline uint8_t to_u8_round(double v) { return uint8_t(std::lround(255.0*saturate(v))); }

// Alpha is truncated, not rounded: 255*a dropped toward zero.
inline uint8_t to_u8_trunc(double v) { return uint8_t(255.0*saturate(v)); }

inline std::array<uint8_t,3> to_rgb8(const color& c) {
    return { to_u8_round(c.x), to_u8_round(c.y), to_u8_round(c.z) };
}

} // namespace tb
