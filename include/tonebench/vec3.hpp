#pragma once
#include <cmath>

struct Vec3 {
    double x=0, y=0, z=0;

    Vec3() = default;
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3& operator+=(const Vec3& o){ x+=o.x; y+=o.y; z+=o.z; return *this; }
    Vec3& operator-=(const Vec3& o){ x-=o.x; y-=o.y; z-=o.z; return *this; }
    Vec3& operator*=(double s)     { x*=s;   y*=s;   z*=s;   return *this; }
};

inline Vec3 operator+(const Vec3& a, const Vec3& b){ return Vec3(a.x+b.x, a.y+b.y, a.z+b.z); }
inline Vec3 operator-(const Vec3& a, const Vec3& b){ return Vec3(a.x-b.x, a.y-b.y, a.z-b.z); }
inline Vec3 operator*(const Vec3& a, double s)     { return Vec3(a.x*s, a.y*s, a.z*s); }
inline Vec3 operator*(double s, const Vec3& a)     { return a*s; }

inline double max_component(const Vec3& a){ return std::fmax(a.x, std::fmax(a.y, a.z)); }
