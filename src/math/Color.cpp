#include "math/Color.hpp"
#include <algorithm>
#include <cmath>

namespace math {

namespace {

float hueToChannel(float p, float q, float t) {
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 1.0f / 2.0f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * 6.0f * (2.0f / 3.0f - t);
    return p;
}

} // namespace

float wrapUnit(float value) {
    float wrapped = value - std::floor(value);
    // floor() of a tiny negative value can round the result up to exactly 1
    return wrapped >= 1.0f ? 0.0f : wrapped;
}

Rgb hslToRgb(float h, float s, float l) {
    h = wrapUnit(h);
    s = std::clamp(s, 0.0f, 1.0f);
    l = std::clamp(l, 0.0f, 1.0f);

    if (s == 0.0f) {
        return {l, l, l};
    }

    float q = (l <= 0.5f) ? l * (1.0f + s) : l + s - l * s;
    float p = 2.0f * l - q;

    return {
        hueToChannel(p, q, h + 1.0f / 3.0f),
        hueToChannel(p, q, h),
        hueToChannel(p, q, h - 1.0f / 3.0f)
    };
}

} // namespace math
