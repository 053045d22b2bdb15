#pragma once

#include "Types.hpp"
#include "math/Random.hpp"
#include <vector>

namespace core {

/**
 * Static per-particle random scalars, all in [0, 1)
 * r0 offset / decorrelation seed, r1 speed, r2 phase, r3 type selector
 */
struct ParticleRandoms {
    float r0 = 0.0f;
    float r1 = 0.0f;
    float r2 = 0.0f;
    float r3 = 0.0f;
};

/**
 * Particle count for a viewport width (narrow screens get fewer particles)
 */
[[nodiscard]] size_t particleCountForViewport(int viewportWidth);

/**
 * ParticleSet: flat per-particle buffers (structure of arrays)
 *
 * Layout: 3 floats per particle for positions and colors, 4 for randoms,
 * 1 for sizes. The render buffers are what the renderer uploads every frame.
 *
 * A set is never resized in place: regenerate() discards every buffer and
 * draws fresh base positions, colors, sizes and randoms.
 */
class ParticleSet {
public:
    ParticleSet() = default;
    ParticleSet(size_t count, math::Random& rng);

    void regenerate(size_t count, math::Random& rng);

    [[nodiscard]] size_t size() const { return count_; }
    [[nodiscard]] bool empty() const { return count_ == 0; }

    /**
     * Incremented by every regenerate()
     */
    [[nodiscard]] uint64_t generation() const { return generation_; }

    [[nodiscard]] ParticleRandoms randoms(size_t i) const {
        return {randoms_[i * 4], randoms_[i * 4 + 1], randoms_[i * 4 + 2], randoms_[i * 4 + 3]};
    }

    [[nodiscard]] Point3D basePosition(size_t i) const { return readPoint(basePositions_, i); }
    [[nodiscard]] Point3D position(size_t i) const { return readPoint(positions_, i); }
    [[nodiscard]] Point3D renderPosition(size_t i) const { return readPoint(renderPositions_, i); }
    [[nodiscard]] Point3D color(size_t i) const { return readPoint(colors_, i); }
    [[nodiscard]] Point3D baseColor(size_t i) const { return readPoint(baseColors_, i); }
    [[nodiscard]] float particleSize(size_t i) const { return sizes_[i]; }

    void setPosition(size_t i, const Point3D& p) { writePoint(positions_, i, p); }
    void setRenderPosition(size_t i, const Point3D& p) { writePoint(renderPositions_, i, p); }
    void setColor(size_t i, float r, float g, float b) {
        colors_[i * 3] = r;
        colors_[i * 3 + 1] = g;
        colors_[i * 3 + 2] = b;
    }

    // Flat buffers for the rendering collaborator
    [[nodiscard]] const std::vector<float>& renderPositions() const { return renderPositions_; }
    [[nodiscard]] const std::vector<float>& colors() const { return colors_; }
    [[nodiscard]] const std::vector<float>& sizes() const { return sizes_; }
    [[nodiscard]] const std::vector<float>& randomsBuffer() const { return randoms_; }

private:
    size_t count_ = 0;
    uint64_t generation_ = 0;

    // Immutable for the lifetime of the set
    std::vector<float> basePositions_;
    std::vector<float> baseColors_;
    std::vector<float> sizes_;
    std::vector<float> randoms_;

    // Mutated every frame
    std::vector<float> positions_;       // Blended state, feeds the next frame
    std::vector<float> renderPositions_; // State + turbulence, handed to the renderer
    std::vector<float> colors_;

    static Point3D readPoint(const std::vector<float>& buffer, size_t i) {
        return {buffer[i * 3], buffer[i * 3 + 1], buffer[i * 3 + 2]};
    }

    static void writePoint(std::vector<float>& buffer, size_t i, const Point3D& p) {
        buffer[i * 3] = p.x;
        buffer[i * 3 + 1] = p.y;
        buffer[i * 3 + 2] = p.z;
    }
};

} // namespace core
