#pragma once

#include "core/GestureClassifier.hpp"
#include "core/Types.hpp"

namespace input {

/**
 * Builds plausible 21-point hands for a requested finger state.
 * Used by the scripted source and by tests; no camera needed.
 */
class SyntheticHand {
public:
    struct Placement {
        float x = 0.5f;     // Palm center, normalized camera space
        float y = 0.55f;
        float z = 0.0f;     // Landmark depth (negative = closer)
        float scale = 1.0f; // 1.0 ~ a hand filling half the frame height
    };

    /**
     * @param fingers Which fingers are raised (thumb spreads sideways)
     * @param placement Where the palm sits in the camera frame
     */
    [[nodiscard]] static core::LandmarkList makePose(const core::GestureClassifier::FingerState& fingers,
                                                     const Placement& placement);

    [[nodiscard]] static core::LandmarkList makePose(const core::GestureClassifier::FingerState& fingers) {
        return makePose(fingers, Placement{});
    }

    /**
     * Canonical finger state for a gesture (None -> index only, an ambiguous pose)
     */
    [[nodiscard]] static core::GestureClassifier::FingerState fingersFor(core::Gesture gesture);
};

} // namespace input
