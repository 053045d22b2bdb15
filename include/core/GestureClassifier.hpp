#pragma once

#include "Types.hpp"
#include <optional>
#include <string>

namespace core {

/**
 * GestureClassifier: maps one hand's landmarks to a discrete Gesture
 *
 * Rules (first match wins):
 *   METAL  index + pinky up, middle + ring down
 *   PEACE  index + middle up, ring + pinky down
 *   FIST   all four fingers down
 *   OPEN   all four fingers up
 *   otherwise the previous gesture is kept (no flicker on ambiguous poses)
 *
 * Stateless: every call is a pure function of its arguments.
 */
class GestureClassifier {
public:
    /**
     * Landmark indices used for classification
     * Based on MediaPipe Hand Landmark model
     */
    struct LandmarkIndices {
        static constexpr int WRIST = 0;

        static constexpr int THUMB_MCP = 2;
        static constexpr int THUMB_TIP = 4;

        static constexpr int INDEX_MCP = 5;
        static constexpr int INDEX_TIP = 8;

        static constexpr int MIDDLE_MCP = 9;
        static constexpr int MIDDLE_TIP = 12;

        static constexpr int RING_MCP = 13;
        static constexpr int RING_TIP = 16;

        static constexpr int PINKY_MCP = 17;
        static constexpr int PINKY_TIP = 20;
    };

    struct FingerState {
        bool thumb = false;
        bool index = false;
        bool middle = false;
        bool ring = false;
        bool pinky = false;
    };

    struct Classification {
        Gesture gesture = Gesture::None;
        Point3D anchor;
        FingerState fingers;
    };

    /**
     * Classify one hand.
     * @param landmarks 21 normalized landmarks
     * @param previous Gesture active before this observation
     * @return std::nullopt if the landmarks are malformed (wrong count or non-finite)
     */
    [[nodiscard]] static std::optional<Classification> classify(const LandmarkList& landmarks,
                                                                Gesture previous);

    /**
     * Apply the priority rule set to a finger state.
     * Thumb is ignored.
     */
    [[nodiscard]] static Gesture fromFingers(const FingerState& fingers, Gesture previous);

    /**
     * Hand position in [-1, 1]: X mirrored, Y up, Z towards camera
     */
    [[nodiscard]] static Point3D computeAnchor(const LandmarkList& landmarks);

    [[nodiscard]] static FingerState computeFingers(const LandmarkList& landmarks);

    [[nodiscard]] static bool isValid(const LandmarkList& landmarks);

private:
    // Tip higher (smaller Y) than base by the extension margin
    [[nodiscard]] static bool isFingerExtended(const LandmarkList& landmarks, int tipIdx, int baseIdx);

    // Thumb moves sideways, so compare X
    [[nodiscard]] static bool isThumbExtended(const LandmarkList& landmarks);
};

/**
 * Gesture names ("none", "fist", "open", "peace", "metal")
 */
[[nodiscard]] const char* getGestureName(Gesture gesture);

/**
 * Human readable shape name for status display
 */
[[nodiscard]] const char* getGestureDisplayName(Gesture gesture);

[[nodiscard]] std::optional<Gesture> parseGesture(const std::string& name);

/**
 * Decode a wire / shader code. Unknown codes decode to Gesture::None.
 */
[[nodiscard]] Gesture gestureFromCode(int32_t code);

} // namespace core
