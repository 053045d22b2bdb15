#include "core/GestureClassifier.hpp"
#include <algorithm>
#include <cmath>

namespace core {

bool GestureClassifier::isValid(const LandmarkList& landmarks) {
    if (landmarks.size() < LANDMARK_COUNT) return false;

    return std::all_of(landmarks.begin(), landmarks.begin() + LANDMARK_COUNT,
                       [](const Landmark& p) {
                           return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
                       });
}

std::optional<GestureClassifier::Classification> GestureClassifier::classify(const LandmarkList& landmarks,
                                                                             Gesture previous) {
    if (!isValid(landmarks)) {
        return std::nullopt;
    }

    Classification result;
    result.anchor = computeAnchor(landmarks);
    result.fingers = computeFingers(landmarks);
    result.gesture = fromFingers(result.fingers, previous);
    return result;
}

Gesture GestureClassifier::fromFingers(const FingerState& f, Gesture previous) {
    // METAL: Index + Pinky up
    if (f.index && !f.middle && !f.ring && f.pinky) {
        return Gesture::Metal;
    }

    // PEACE: Index + Middle up
    if (f.index && f.middle && !f.ring && !f.pinky) {
        return Gesture::Peace;
    }

    // FIST: All fingers down
    if (!f.index && !f.middle && !f.ring && !f.pinky) {
        return Gesture::Fist;
    }

    // OPEN: All fingers up
    if (f.index && f.middle && f.ring && f.pinky) {
        return Gesture::Open;
    }

    // Ambiguous - keep current gesture to avoid flicker
    return previous;
}

Point3D GestureClassifier::computeAnchor(const LandmarkList& landmarks) {
    using LI = LandmarkIndices;
    const auto& wrist = landmarks[LI::WRIST];
    const auto& middleBase = landmarks[LI::MIDDLE_MCP];

    float avgX = (wrist.x + middleBase.x) / 2.0f;
    float avgY = (wrist.y + middleBase.y) / 2.0f;
    float avgZ = (wrist.z + middleBase.z) / 2.0f;

    Point3D anchor;
    // Mirror X so movement matches an un-mirrored preview
    anchor.x = (1.0f - avgX) * 2.0f - 1.0f;
    // Camera Y grows downward, scene Y grows upward
    anchor.y = -(avgY * 2.0f - 1.0f);
    // Landmark Z is negative when closer to the camera
    anchor.z = std::clamp(-avgZ, -1.0f, 1.0f);
    return anchor;
}

GestureClassifier::FingerState GestureClassifier::computeFingers(const LandmarkList& landmarks) {
    using LI = LandmarkIndices;

    FingerState fingers;
    fingers.thumb = isThumbExtended(landmarks);
    fingers.index = isFingerExtended(landmarks, LI::INDEX_TIP, LI::INDEX_MCP);
    fingers.middle = isFingerExtended(landmarks, LI::MIDDLE_TIP, LI::MIDDLE_MCP);
    fingers.ring = isFingerExtended(landmarks, LI::RING_TIP, LI::RING_MCP);
    fingers.pinky = isFingerExtended(landmarks, LI::PINKY_TIP, LI::PINKY_MCP);
    return fingers;
}

bool GestureClassifier::isFingerExtended(const LandmarkList& landmarks, int tipIdx, int baseIdx) {
    // In image coordinates, Y=0 is top, so smaller Y = higher
    return landmarks[tipIdx].y < landmarks[baseIdx].y - FINGER_EXTENSION_MARGIN;
}

bool GestureClassifier::isThumbExtended(const LandmarkList& landmarks) {
    using LI = LandmarkIndices;
    return std::abs(landmarks[LI::THUMB_TIP].x - landmarks[LI::THUMB_MCP].x) > THUMB_EXTENSION_MARGIN;
}

const char* getGestureName(Gesture gesture) {
    switch (gesture) {
        case Gesture::None:  return "none";
        case Gesture::Fist:  return "fist";
        case Gesture::Open:  return "open";
        case Gesture::Peace: return "peace";
        case Gesture::Metal: return "metal";
        default: return "none";
    }
}

const char* getGestureDisplayName(Gesture gesture) {
    switch (gesture) {
        case Gesture::None:  return "Idle";
        case Gesture::Fist:  return "Saturn";
        case Gesture::Open:  return "Open";
        case Gesture::Peace: return "Text";
        case Gesture::Metal: return "Heart";
        default: return "Idle";
    }
}

std::optional<Gesture> parseGesture(const std::string& name) {
    if (name == "none")  return Gesture::None;
    if (name == "fist")  return Gesture::Fist;
    if (name == "open")  return Gesture::Open;
    if (name == "peace") return Gesture::Peace;
    if (name == "metal") return Gesture::Metal;
    return std::nullopt;
}

Gesture gestureFromCode(int32_t code) {
    if (code < 0 || code >= static_cast<int32_t>(GESTURE_COUNT)) {
        return Gesture::None;
    }
    return static_cast<Gesture>(code);
}

} // namespace core
