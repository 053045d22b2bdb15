#include "core/ParticleSet.hpp"
#include "math/Color.hpp"

namespace core {

size_t particleCountForViewport(int viewportWidth) {
    return viewportWidth < NARROW_VIEWPORT_WIDTH ? PARTICLE_COUNT_NARROW : PARTICLE_COUNT_WIDE;
}

ParticleSet::ParticleSet(size_t count, math::Random& rng) {
    regenerate(count, rng);
}

void ParticleSet::regenerate(size_t count, math::Random& rng) {
    // Fresh buffers: nothing from the previous set survives
    std::vector<float> basePositions(count * 3);
    std::vector<float> baseColors(count * 3);
    std::vector<float> sizes(count);
    std::vector<float> randoms(count * 4);

    for (size_t i = 0; i < count; ++i) {
        basePositions[i * 3] = (rng.uniform() - 0.5f) * BASE_POSITION_EXTENT;
        basePositions[i * 3 + 1] = (rng.uniform() - 0.5f) * BASE_POSITION_EXTENT;
        basePositions[i * 3 + 2] = (rng.uniform() - 0.5f) * BASE_POSITION_EXTENT;

        // Cyan default, same hue band as the idle palette
        math::Rgb rgb = math::hslToRgb(0.5f + rng.uniform() * 0.1f, 1.0f, 0.5f);
        baseColors[i * 3] = rgb.r;
        baseColors[i * 3 + 1] = rgb.g;
        baseColors[i * 3 + 2] = rgb.b;

        sizes[i] = rng.uniform() * 3.0f + 1.0f;

        randoms[i * 4] = rng.uniform();     // offset
        randoms[i * 4 + 1] = rng.uniform(); // speed
        randoms[i * 4 + 2] = rng.uniform(); // phase
        randoms[i * 4 + 3] = rng.uniform(); // type selector
    }

    count_ = count;
    basePositions_ = std::move(basePositions);
    baseColors_ = std::move(baseColors);
    sizes_ = std::move(sizes);
    randoms_ = std::move(randoms);

    positions_ = basePositions_;
    renderPositions_ = basePositions_;
    colors_ = baseColors_;

    ++generation_;
}

} // namespace core
