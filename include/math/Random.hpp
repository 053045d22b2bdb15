#pragma once

#include <cmath>
#include <cstdint>
#include <random>

namespace math {

/**
 * Seedable uniform random source.
 * Every stochastic step (particle creation, color refresh) draws from one of
 * these so a fixed seed reproduces a run exactly.
 */
class Random {
public:
    explicit Random(uint64_t seed = std::random_device{}()) : engine_(seed) {}

    // Uniform in [0, 1). Some standard libraries can round a float draw up to 1.
    float uniform() {
        float value = dist_(engine_);
        return value < 1.0f ? value : std::nextafter(1.0f, 0.0f);
    }

    // Uniform in [lo, hi)
    float uniform(float lo, float hi) { return lo + (hi - lo) * uniform(); }

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<float> dist_{0.0f, 1.0f};
};

} // namespace math
