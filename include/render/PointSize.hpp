#pragma once

#include <algorithm>

namespace render {

// Perspective point sizes, in pixels. Depth can approach the near plane, so the
// raw size is clamped in float before the int conversion.
constexpr float PARTICLE_SIZE_SCALE = 400.0f;
constexpr float STAR_SIZE_SCALE = 300.0f;
constexpr int MAX_POINT_RADIUS = 24;

inline int pointRadius(float size, float scale, float depth, int minRadius) {
    if (!(depth > 0.0f)) return minRadius;
    float radius = size * scale / depth * 0.5f;
    radius = std::min(radius, static_cast<float>(MAX_POINT_RADIUS));
    return std::max(minRadius, static_cast<int>(radius));
}

inline int particleRadius(float size, float depth) {
    return pointRadius(size, PARTICLE_SIZE_SCALE, depth, 1);
}

// Stars may vanish (radius 0) when far away
inline int starRadius(float size, float depth) {
    return pointRadius(size, STAR_SIZE_SCALE, depth, 0);
}

} // namespace render
