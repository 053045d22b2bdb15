#include "core/GestureController.hpp"
#include "core/Logger.hpp"

namespace core {

GestureController::GestureController() {
    reset();
}

void GestureController::reset() {
    state_ = GestureResult{};
    override_.clear();
    lastFingers_ = GestureClassifier::FingerState{};
    malformedCount_ = 0;
}

GestureResult GestureController::update(const LandmarkList& landmarks, Clock::time_point now) {
    const bool expired = override_.expire(now);

    std::optional<GestureClassifier::Classification> classification;
    if (!landmarks.empty()) {
        classification = GestureClassifier::classify(landmarks, state_.gesture);
        if (!classification) {
            // Malformed input is not expected from the tracker; log sparsely
            if (malformedCount_++ % 100 == 0) {
                Logger::warn("GestureController: malformed landmarks (count=", landmarks.size(),
                             "), falling back to none");
            }
        }
    }

    if (classification) {
        state_.anchor = classification->anchor;
        lastFingers_ = classification->fingers;
    }

    if (expired) {
        // Expiry reverts to None regardless of what the hand is doing
        Logger::info("GestureController: forced gesture expired");
        transitionTo(Gesture::None);
        return state_;
    }

    if (override_.isActive()) {
        return state_;
    }

    transitionTo(classification ? classification->gesture : Gesture::None);
    return state_;
}

GestureResult GestureController::tick(Clock::time_point now) {
    if (override_.expire(now)) {
        Logger::info("GestureController: forced gesture expired");
        transitionTo(Gesture::None);
    }
    return state_;
}

void GestureController::forceGesture(Gesture gesture, Clock::time_point now) {
    const bool replaced = override_.isActive();
    override_.force(gesture, now);

    auto seconds = std::chrono::duration_cast<std::chrono::milliseconds>(FORCED_GESTURE_DURATION).count() / 1000.0;
    Logger::info("GestureController: forcing ", getGestureName(gesture), " for ", seconds, "s",
                 replaced ? " (replaces pending override)" : "");

    transitionTo(gesture);
}

void GestureController::transitionTo(Gesture newState) {
    if (newState == state_.gesture) return;

    Gesture oldState = state_.gesture;
    state_.gesture = newState;

    Logger::debug("GestureController: ", getGestureName(oldState), " -> ", getGestureName(newState));

    if (transitionCallback_) {
        transitionCallback_(oldState, newState);
    }
}

} // namespace core
