// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace royale::game {

using PlayerId = uint64_t;

// World position; y is the vertical axis, x/z span the ground plane.
struct Vec3
{
    float x{0.f};
    float y{0.f};
    float z{0.f};
};

inline bool operator==(const Vec3 &a, const Vec3 &b)
{
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline float planar_distance(const Vec3 &a, const Vec3 &b)
{
    float dx = a.x - b.x;
    float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

inline Vec3 lerp(const Vec3 &from, const Vec3 &to, float alpha)
{
    return Vec3{
        from.x + (to.x - from.x) * alpha, from.y + (to.y - from.y) * alpha, from.z + (to.z - from.z) * alpha};
}

inline float lerp(float from, float to, float alpha)
{
    return from + (to - from) * alpha;
}

} // namespace royale::game
