#pragma once

struct Vec3 {
    float x, y, z;
};

inline bool operator==(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vec3& a, const Vec3& b) {
    return !(a == b);
}

enum class Axis { X, Y, Z };
