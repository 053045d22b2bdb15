#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "core/Types.hpp"
#include "input/LandmarkSource.hpp"

namespace input {

/**
 * Dedicated thread replaying a scripted sequence of hand poses.
 * Stands in for the camera tracker: the palm drifts on a slow Lissajous path
 * while the pose steps through the script, including hand-lost gaps.
 */
class ScriptedSource : public LandmarkSource {
public:
    struct Step {
        core::Gesture gesture;      // Pose to show (None shows an ambiguous pose)
        bool handVisible = true;
        float holdSeconds = 4.0f;
    };

    ScriptedSource(std::shared_ptr<core::LandmarkQueue> outputQueue, float rateHz = 30.0f);
    ScriptedSource(std::shared_ptr<core::LandmarkQueue> outputQueue, std::vector<Step> script,
                   float rateHz = 30.0f);
    ~ScriptedSource() override;

    bool start() override;
    void stop() override;

    [[nodiscard]] const char* name() const override { return "synthetic"; }

    /**
     * Open, fist, peace, metal, an ambiguous pose, then no hand
     */
    [[nodiscard]] static std::vector<Step> defaultScript();

    /**
     * Tracker result at a given script time (seconds since start)
     */
    [[nodiscard]] core::HandFrame frameAt(double seconds, uint64_t sequence) const;

private:
    void loop();

    std::shared_ptr<core::LandmarkQueue> outputQueue_;
    std::vector<Step> script_;
    double scriptLength_ = 0.0;
    float rateHz_;

    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace input
