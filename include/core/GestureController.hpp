#pragma once

#include "Types.hpp"
#include "GestureClassifier.hpp"
#include "GestureOverride.hpp"
#include <functional>

namespace core {

/**
 * GestureController: owns the active gesture and the hand anchor
 *
 * Combines live classification with the forced override:
 * - Override active: live classification is suppressed, anchor still follows the hand
 * - Override expiry: gesture reverts to None on that update, live classification
 *   resumes on the next one
 * - No hand / malformed hand: None (or the forced gesture), anchor unchanged
 */
class GestureController {
public:
    using Clock = std::chrono::steady_clock;
    using TransitionCallback = std::function<void(Gesture from, Gesture to)>;

    GestureController();

    /**
     * Feed one tracker observation.
     * @param landmarks Landmarks of the first detected hand, empty if no hand
     * @param now Current time (used for the override expiry)
     */
    GestureResult update(const LandmarkList& landmarks, Clock::time_point now);

    /**
     * Frame without a new tracker observation: only checks the override expiry.
     */
    GestureResult tick(Clock::time_point now);

    /**
     * Force a gesture for FORCED_GESTURE_DURATION, replacing any pending override.
     */
    void forceGesture(Gesture gesture, Clock::time_point now);

    [[nodiscard]] GestureResult current() const { return state_; }
    [[nodiscard]] Gesture getGesture() const { return state_.gesture; }
    [[nodiscard]] Point3D getAnchor() const { return state_.anchor; }

    [[nodiscard]] const GestureOverride& getOverride() const { return override_; }
    [[nodiscard]] bool isForced() const { return override_.isActive(); }

    /**
     * Finger state of the last valid observation (diagnostics only)
     */
    [[nodiscard]] const GestureClassifier::FingerState& getLastFingers() const { return lastFingers_; }

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

    /**
     * Back to None, anchor at origin, no override
     */
    void reset();

private:
    GestureResult state_;
    GestureOverride override_;
    GestureClassifier::FingerState lastFingers_;
    uint64_t malformedCount_ = 0;

    TransitionCallback transitionCallback_;

    void transitionTo(Gesture newState);
};

} // namespace core
