#pragma once

#include "core/types.hpp"

#include <cmath>

namespace salvo::sim {

constexpr f32 PI = 3.14159265358979f;
constexpr f32 DEG_TO_RAD = PI / 180.0f;

struct Vector2 {
    f32 x = 0, y = 0;

    Vector2 operator+(const Vector2& o) const { return {x + o.x, y + o.y}; }
    Vector2 operator-(const Vector2& o) const { return {x - o.x, y - o.y}; }
    Vector2 operator*(f32 s) const { return {x * s, y * s}; }
    Vector2& operator+=(const Vector2& o) {
        x += o.x;
        y += o.y;
        return *this;
    }

    f32 length() const { return std::sqrt(x * x + y * y); }
    f32 length_sq() const { return x * x + y * y; }

    /// Unit vector, or (1, 0) for a zero vector.
    Vector2 normalized() const {
        f32 len = length();
        if (len < 0.0001f) return {1, 0};
        return {x / len, y / len};
    }

    f32 angle() const { return std::atan2(y, x); }

    static Vector2 from_angle(f32 radians) {
        return {std::cos(radians), std::sin(radians)};
    }
};

inline f32 distance(const Vector2& a, const Vector2& b) {
    return (a - b).length();
}

} // namespace salvo::sim
