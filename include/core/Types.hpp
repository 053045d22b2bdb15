#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "SpscQueue.hpp"

namespace core {

// ============================================================
// Constants - Gesture Morph Configuration
// ============================================================

// Hand landmarks (MediaPipe hand model)
constexpr size_t LANDMARK_COUNT = 21;

// Particle set sizing (device dependent)
constexpr size_t PARTICLE_COUNT_WIDE = 4000;
constexpr size_t PARTICLE_COUNT_NARROW = 2000;
constexpr int NARROW_VIEWPORT_WIDTH = 768;      // Viewports below this use the narrow count

// Scene space
constexpr float SCENE_SCALE = 500.0f;           // Anchor [-1, 1] -> scene units
constexpr float BASE_POSITION_EXTENT = 1000.0f; // Base positions span [-500, 500)

// Animation clock
constexpr float FRAME_TIME_STEP = 0.016f;       // Elapsed time added per frame
constexpr float TIME_SCALE = 2.0f;              // t = elapsed * TIME_SCALE
constexpr float TARGET_FPS = 60.0f;

// Gesture Configuration
constexpr float FINGER_EXTENSION_MARGIN = 0.05f; // Tip must be this far above its base
constexpr float THUMB_EXTENSION_MARGIN = 0.05f;  // Horizontal tip/base distance
constexpr std::chrono::milliseconds FORCED_GESTURE_DURATION{5000};
constexpr std::chrono::milliseconds HAND_LOST_TIMEOUT{250};  // No tracker result for this long -> no hand

// Shape field
constexpr float BLEND_SCALE = 0.1f;             // Fraction of blend applied per frame
constexpr float TURBULENCE_AMPLITUDE = 2.0f;
constexpr float MEMBERSHIP_THRESHOLD = 0.3f;    // r3 >= threshold selects ring / core
constexpr int TEXT_SLOT_COUNT = 7;
constexpr float TEXT_SLOT_SPACING = 40.0f;

// Color refresh
constexpr size_t COLOR_REFRESH_TARGET = 300;    // Particles touched per frame

// Queue sizing
constexpr size_t QUEUE_SIZE = 16;

// OSC Configuration
constexpr int OSC_RATE_HZ = 30;
constexpr int OSC_IN_PORT = 9000;
constexpr int OSC_OUT_PORT = 9001;

// ============================================================
// Data Structures
// ============================================================

// Gesture codes match the order used by the particle shader
enum class Gesture : int32_t {
    None = 0,
    Fist = 1,   // Ringed planet
    Open = 2,   // Core + halo
    Peace = 3,  // Text placeholder
    Metal = 4   // Heart
};

constexpr size_t GESTURE_COUNT = 5;

struct Point3D {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Landmark {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

using LandmarkList = std::vector<Landmark>;

/**
 * One tracker result. An empty landmark list means no hand was detected.
 * Only the first hand is ever delivered.
 */
struct HandFrame {
    LandmarkList landmarks;
    uint64_t sequence = 0;
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] bool hasHand() const { return !landmarks.empty(); }
};

struct GestureResult {
    Gesture gesture = Gesture::None;
    Point3D anchor;
};

// Hue palette per gesture (HSL, full saturation, 50% lightness)
struct HuePalette {
    float base = 0.5f;
    float range = 0.1f;
};

/**
 * Snapshot of the morph state published to outside listeners (OSC)
 */
struct MorphState {
    Gesture gesture = Gesture::None;
    Point3D anchor;
    uint32_t particleCount = 0;
    bool forced = false;
    float overrideRemaining = 0.0f; // Seconds
    std::string customText;
    std::chrono::steady_clock::time_point timestamp;
};

// Type Aliases
using LandmarkQueue = SpscQueue<HandFrame, QUEUE_SIZE>;
using StateQueue = SpscQueue<MorphState, QUEUE_SIZE>;

} // namespace core
