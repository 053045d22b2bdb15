#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "Types.hpp"
#include "GestureController.hpp"
#include "ShapeFieldEngine.hpp"
#include "SimulationContext.hpp"

namespace core {

/**
 * MorphLoop - one synchronous pass per display refresh
 *
 * 1. Drain tracker results (keep the newest, older ones are stale)
 * 2. GestureController: new observation -> update(), none -> tick().
 *    A hand not re-confirmed within HAND_LOST_TIMEOUT counts as gone: trackers
 *    that only publish while a hand is visible never send an explicit "lost".
 * 3. Advance animation time, ShapeFieldEngine::step()
 * 4. Publish a MorphState snapshot at the OSC rate (if a state queue is attached)
 *
 * Rendering happens outside, from engine().particles().
 */
class MorphLoop {
public:
    using Clock = std::chrono::steady_clock;

    struct Settings {
        size_t particleCount = PARTICLE_COUNT_WIDE;
        uint64_t seed = 0;
        int stateRateHz = OSC_RATE_HZ;
        float timeStep = FRAME_TIME_STEP;
        std::string customText = "I LOVE U";
    };

    MorphLoop(std::shared_ptr<LandmarkQueue> inputQueue,
              std::shared_ptr<StateQueue> stateQueue,
              const Settings& settings);

    /**
     * Run one frame.
     * @param now Current time, drives the forced-gesture expiry
     */
    const SimulationContext& step(Clock::time_point now);

    /**
     * Force a gesture for FORCED_GESTURE_DURATION (replaces any pending override)
     */
    void forceGesture(Gesture gesture, Clock::time_point now);

    /**
     * Viewport resize: the particle set is always recreated.
     */
    bool resizeForViewport(int viewportWidth);
    bool resize(size_t particleCount);

    /**
     * @return false if the text is empty after trimming (text unchanged)
     */
    bool setCustomText(const std::string& text);

    [[nodiscard]] const SimulationContext& context() const { return context_; }
    [[nodiscard]] const ShapeFieldEngine& engine() const { return engine_; }
    [[nodiscard]] const GestureController& controller() const { return controller_; }
    [[nodiscard]] float getFps() const { return currentFps_; }
    [[nodiscard]] uint64_t getObservationCount() const { return observationCount_; }

private:
    void consumeObservations(Clock::time_point now);
    void publishState(Clock::time_point now);
    void updateFps(Clock::time_point now);

    std::shared_ptr<LandmarkQueue> inputQueue_;
    std::shared_ptr<StateQueue> stateQueue_;

    GestureController controller_;
    ShapeFieldEngine engine_;
    SimulationContext context_;

    float timeStep_;
    Clock::duration statePeriod_;
    Clock::time_point lastStatePublish_{};

    HandFrame latestFrame_;
    Clock::time_point lastObservation_{};
    uint64_t observationCount_ = 0;
    uint64_t handTimeouts_ = 0;
    uint64_t droppedStates_ = 0;

    // FPS Counting
    Clock::time_point lastFpsTime_{};
    int frameCount_ = 0;
    float currentFps_ = 0.0f;
};

} // namespace core
