#pragma once

namespace math {

struct Rgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
};

/**
 * HSL -> RGB, all channels in [0, 1].
 * Hue wraps (euclidean modulo 1), saturation and lightness are clamped.
 */
Rgb hslToRgb(float h, float s, float l);

// Wrap into [0, 1)
float wrapUnit(float value);

} // namespace math
