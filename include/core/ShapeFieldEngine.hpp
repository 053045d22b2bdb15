#pragma once

#include "ParticleSet.hpp"
#include "ShapeField.hpp"
#include "SimulationContext.hpp"
#include "math/Random.hpp"

namespace core {

/**
 * ShapeFieldEngine: moves every particle toward the active gesture's shape
 *
 * Per frame:
 * 1. target = shape(gesture)(hand, t, particle)
 * 2. position = mix(position, target, blend * BLEND_SCALE)
 * 3. render position = position + turbulence (not fed back)
 * 4. every colorStride()-th particle gets a new hue from the gesture palette
 */
class ShapeFieldEngine {
public:
    ShapeFieldEngine(size_t count, uint64_t seed);

    /**
     * Discard the particle set and draw a new one of the given size.
     * @return false if count is zero (set unchanged)
     */
    bool resize(size_t count);

    void step(const SimulationContext& ctx);

    void updatePositions(const SimulationContext& ctx);
    void updateColors(Gesture gesture);

    [[nodiscard]] const ParticleSet& particles() const { return particles_; }

    /**
     * max(1, floor(count / COLOR_REFRESH_TARGET))
     */
    [[nodiscard]] static size_t colorStride(size_t count);

    /**
     * Shared turbulence offset added after blending
     */
    [[nodiscard]] static Point3D turbulence(float t, float r0);

private:
    ParticleSet particles_;
    math::Random rng_;
};

} // namespace core
