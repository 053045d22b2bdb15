#pragma once

#include "Types.hpp"
#include <string>

namespace core {

/**
 * Per-frame simulation state, passed by reference into each frame step.
 * One writer (the frame loop), no globals.
 */
struct SimulationContext {
    Gesture gesture = Gesture::None;
    Point3D anchor;             // [-1, 1] per axis
    float elapsed = 0.0f;       // Seconds of animation time
    uint64_t frame = 0;

    // Display only; the text layout keeps its fixed slot count
    std::string customText = "I LOVE U";

    [[nodiscard]] float shapeTime() const { return elapsed * TIME_SCALE; }

    [[nodiscard]] Point3D handInScene() const {
        return {anchor.x * SCENE_SCALE, anchor.y * SCENE_SCALE, anchor.z * SCENE_SCALE};
    }
};

} // namespace core
