#include "core/ShapeFieldEngine.hpp"
#include "core/Logger.hpp"
#include "math/Color.hpp"
#include <algorithm>
#include <cmath>

namespace core {

ShapeFieldEngine::ShapeFieldEngine(size_t count, uint64_t seed)
    : rng_(seed) {
    particles_.regenerate(count, rng_);
}

bool ShapeFieldEngine::resize(size_t count) {
    if (count == 0) {
        Logger::warn("ShapeFieldEngine: ignoring resize to 0 particles");
        return false;
    }
    particles_.regenerate(count, rng_);
    Logger::info("ShapeFieldEngine: particle set regenerated (count=", count,
                 ", generation=", particles_.generation(), ")");
    return true;
}

void ShapeFieldEngine::step(const SimulationContext& ctx) {
    updatePositions(ctx);
    updateColors(ctx.gesture);
}

size_t ShapeFieldEngine::colorStride(size_t count) {
    return std::max<size_t>(1, count / COLOR_REFRESH_TARGET);
}

Point3D ShapeFieldEngine::turbulence(float t, float r0) {
    float phase = r0 * 10.0f;
    return {
        std::sin(t + phase) * TURBULENCE_AMPLITUDE,
        std::cos(t + phase) * TURBULENCE_AMPLITUDE,
        std::sin(t * 0.5f + phase) * TURBULENCE_AMPLITUDE
    };
}

void ShapeFieldEngine::updatePositions(const SimulationContext& ctx) {
    const ShapeDefinition& shape = shapeFor(ctx.gesture);

    ShapeInput input;
    input.hand = ctx.handInScene();
    input.t = ctx.shapeTime();

    const float alpha = shape.blend * BLEND_SCALE;
    const size_t count = particles_.size();

    for (size_t i = 0; i < count; ++i) {
        ShapeParticle particle{particles_.basePosition(i), particles_.randoms(i)};
        Point3D target = shape.target(input, particle);

        Point3D pos = particles_.position(i);
        pos.x += (target.x - pos.x) * alpha;
        pos.y += (target.y - pos.y) * alpha;
        pos.z += (target.z - pos.z) * alpha;
        particles_.setPosition(i, pos);

        Point3D offset = turbulence(input.t, particle.randoms.r0);
        particles_.setRenderPosition(i, {pos.x + offset.x, pos.y + offset.y, pos.z + offset.z});
    }
}

void ShapeFieldEngine::updateColors(Gesture gesture) {
    const HuePalette& palette = shapeFor(gesture).palette;
    const size_t count = particles_.size();
    const size_t stride = colorStride(count);

    for (size_t i = 0; i < count; i += stride) {
        float hue = palette.base + (rng_.uniform() - 0.5f) * palette.range;
        math::Rgb rgb = math::hslToRgb(hue, 1.0f, 0.5f);
        particles_.setColor(i, rgb.r, rgb.g, rgb.b);
    }
}

} // namespace core
